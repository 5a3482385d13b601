//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2025 The ledbetter authors
//
//  This file is part of ledbetter.
//
//  ledbetter is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  ledbetter is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with ledbetter. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __ledbetter__renderlink__
#define __ledbetter__renderlink__

#include "ledbetter_common.hpp"
#include "wasmengine.hpp"
#include "ledconfig.hpp"

#include <atomic>

using namespace std;

namespace lb {

  /// Single slot, latest-wins hand-over of an object from one thread to another.
  /// The slot owns one reference. As LBObj refcounts are not atomic, a published object
  /// must not be referenced anywhere else, the publishing side gives up all access.
  template<class T> class HandoffCell
  {
    std::atomic<T*> mSlot;

    HandoffCell(const HandoffCell&); ///< no copying
    HandoffCell& operator=(const HandoffCell&); ///< no assignment

  public:

    HandoffCell() : mSlot(NULL) {};

    ~HandoffCell()
    {
      T* p = mSlot.exchange(NULL);
      if (p) intrusive_ptr_release(p);
    }

    /// publish an item, replacing a not yet taken one
    /// @param aItem the item, must be the only reference to it. Is reset to NULL.
    /// @return true if an unconsumed item was replaced (and released)
    bool publish(boost::intrusive_ptr<T> &aItem)
    {
      T* old = mSlot.exchange(aItem.detach());
      if (old) {
        // never reached the other side, so it is still ours to release
        intrusive_ptr_release(old);
        return true;
      }
      return false;
    }

    /// take the pending item, never blocks
    /// @return the item or NULL if none is pending
    boost::intrusive_ptr<T> take()
    {
      return boost::intrusive_ptr<T>(mSlot.exchange(NULL), false);
    }

    /// @return true if an item is waiting to be taken
    bool pending() const { return mSlot.load()!=NULL; }

  };


  typedef enum {
    scheduler_idle,
    scheduler_running,
    scheduler_draining,
    scheduler_stopped
  } SchedulerState;

  const char *schedulerStateName(SchedulerState aState);


  /// status published by the render thread
  class RenderStatus
  {
  public:
    std::atomic<uint64_t> frames;
    std::atomic<uint64_t> overruns;
    std::atomic<uint64_t> faults;
    std::atomic<uint64_t> generation;
    std::atomic<int> state; ///< SchedulerState
    std::atomic<bool> programActive;
    std::atomic<bool> paused;
    std::atomic<bool> displayDegraded;

    RenderStatus() :
      frames(0), overruns(0), faults(0), generation(0),
      state(scheduler_idle), programActive(false), paused(false), displayDegraded(false)
    {};

    /// @return "Playing", "Paused" or "NotPlaying"
    const char *playStatus() const;
  };


  /// everything the control and render threads share
  class RenderLink
  {
  public:

    HandoffCell<WasmModule> program;
    HandoffCell<ConfigUpdate> config;
    std::atomic<bool> drainRequested;
    std::atomic<bool> pauseRequested;
    RenderStatus status;

    RenderLink() : drainRequested(false), pauseRequested(false) {};

  };

} // namespace lb

#endif /* defined(__ledbetter__renderlink__) */
