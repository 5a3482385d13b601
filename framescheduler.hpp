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

#ifndef __ledbetter__framescheduler__
#define __ledbetter__framescheduler__

#include "ledbetter_common.hpp"
#include "renderlink.hpp"
#include "programsandbox.hpp"
#include "colorpipeline.hpp"
#include "display.hpp"

using namespace std;

namespace lb {

  /// display independent part of the frame scheduler
  class FrameSchedulerCore : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

  protected:

    RenderLink &mLink;
    ProgramSandbox mSandbox;
    ColorPipeline mPipeline;
    LedConfig mConfig;
    uint64_t mConfigSerial;

    SchedulerState mState;
    uint64_t mFrameIndex; ///< index of the next frame to render
    MLMicroSeconds mPeriod;
    MLMicroSeconds mEpoch; ///< deadline of frame mEpochIndex
    uint64_t mEpochIndex;
    MLMicroSeconds mStartTime; ///< program time base
    MLTicket mTickTicket;

    uint64_t mOverruns;
    uint64_t mFaults;
    uint64_t mRebases;

    RawFrame mRaw;
    RawFrame mLastGoodRaw;
    FrameBuffer mOutput;

    SimpleCB mStoppedCB;

    FrameSchedulerCore(RenderLink &aLink, const LedConfig &aInitialConfig, const SandboxParams &aSandboxParams);

    /// take and apply a pending config update
    /// @return true if the pixel count changed
    bool consumeConfig(MLMicroSeconds aNow);

    /// take and load a pending program
    void consumeProgram();

    /// run the program (or substitute) for the current frame into mRaw
    void produceFrame();

    /// frame index bookkeeping, overrun and lag detection after a frame
    void finishFrame(MLMicroSeconds aNow);

    /// move the time grid so that aNow is the deadline of the current frame index
    void rebase(MLMicroSeconds aNow, const char *aReason);

    void publishStatus(bool aDisplayDegraded);

  public:

    virtual string logContextPrefix() LB_OVERRIDE { return "scheduler"; }

    /// @return absolute deadline for frame aIndex on the current time grid
    MLMicroSeconds deadline(uint64_t aIndex) const { return mEpoch+(MLMicroSeconds)(aIndex-mEpochIndex)*mPeriod; }

    /// set a handler called once the scheduler has stopped after draining
    void setStoppedHandler(SimpleCB aStoppedCB) { mStoppedCB = aStoppedCB; }

    SchedulerState state() const { return mState; }
    uint64_t frameIndex() const { return mFrameIndex; }
    uint64_t overruns() const { return mOverruns; }
    uint64_t faults() const { return mFaults; }
    uint64_t rebases() const { return mRebases; }
    MLMicroSeconds period() const { return mPeriod; }
    const LedConfig &config() const { return mConfig; }
    ProgramSandbox &sandbox() { return mSandbox; }
    ColorPipeline &pipeline() { return mPipeline; }

  };


  /// Renders frames on an absolute time grid and sends them to a display.
  /// DisplayT is one of the display backends (see display.hpp), selected once at startup.
  template<class DisplayT> class FrameScheduler : public FrameSchedulerCore
  {
    typedef FrameSchedulerCore inherited;

    DisplayT &mDisplay;

  public:

    FrameScheduler(RenderLink &aLink, DisplayT &aDisplay, const LedConfig &aInitialConfig, const SandboxParams &aSandboxParams = SandboxParams()) :
      inherited(aLink, aInitialConfig, aSandboxParams),
      mDisplay(aDisplay)
    {
    }

    /// open the display and start ticking in the current thread's mainloop
    /// @return error from opening the display (ticking starts anyway, the display handles its faults)
    ErrorPtr start()
    {
      ErrorPtr err = mDisplay.begin();
      if (Error::notOK(err)) {
        OLOG(LOG_ERR, "display did not start: %s", err->text());
      }
      MLMicroSeconds now = MainLoop::now();
      mStartTime = now;
      mEpoch = now;
      mEpochIndex = mFrameIndex;
      mState = scheduler_running;
      publishStatus(mDisplay.isDegraded());
      OLOG(LOG_NOTICE, "started at %d fps, %zu pixels", mConfig.frameRateHz, mDisplay.pixelCount());
      scheduleNext();
      return err;
    }

    /// render one frame now
    /// @note normally called from the tick timer, tests may call it directly
    void tick()
    {
      if (mState==scheduler_stopped) return;
      MLMicroSeconds now = MainLoop::now();
      if (mState==scheduler_idle) {
        mStartTime = now;
        mEpoch = now;
        mEpochIndex = mFrameIndex;
        mState = scheduler_running;
      }
      if (consumeConfig(now)) {
        ErrorPtr err = mDisplay.setPixelCount(mConfig.pixelCount);
        if (Error::notOK(err)) OLOG(LOG_ERR, "display resize to %d pixels failed: %s", mConfig.pixelCount, err->text());
      }
      consumeProgram();
      if (mLink.drainRequested) {
        drain();
        return;
      }
      if (!mLink.pauseRequested) {
        produceFrame();
        mPipeline.process(mRaw, mOutput);
        ErrorPtr err = mDisplay.render(mOutput);
        if (Error::notOK(err)) {
          FOCUSOLOG("frame %llu not displayed: %s", (unsigned long long)mFrameIndex, err->text());
        }
      }
      finishFrame(MainLoop::now());
      publishStatus(mDisplay.isDegraded());
      scheduleNext();
    }

    /// finish: write one all-off frame and stop
    void drain()
    {
      mTickTicket.cancel();
      if (mState==scheduler_stopped) return;
      mState = scheduler_draining;
      publishStatus(mDisplay.isDegraded());
      ErrorPtr err = mDisplay.render(solidFrame(mDisplay.pixelCount(), black));
      if (Error::notOK(err)) {
        OLOG(LOG_WARNING, "final all-off frame failed: %s", err->text());
      }
      mDisplay.end();
      mState = scheduler_stopped;
      publishStatus(mDisplay.isDegraded());
      OLOG(LOG_NOTICE, "stopped after %llu frames, %llu overruns, %llu faults",
        (unsigned long long)mFrameIndex, (unsigned long long)mOverruns, (unsigned long long)mFaults
      );
      if (mStoppedCB) {
        SimpleCB cb = mStoppedCB;
        mStoppedCB = NoOP;
        cb();
      }
    }

  private:

    void scheduleNext()
    {
      // a deadline in the past fires immediately
      mTickTicket.executeOnceAt(boost::bind(&FrameScheduler::tickTimer, this), deadline(mFrameIndex));
    }

    void tickTimer()
    {
      tick();
    }

  };

} // namespace lb

#endif /* defined(__ledbetter__framescheduler__) */
