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

#ifndef __ledbetter__display__
#define __ledbetter__display__

#include "ledbetter_common.hpp"
#include "colorpipeline.hpp"

using namespace std;

// Display backends do not share a virtual base class. Every backend provides:
// - ErrorPtr begin()
// - ErrorPtr render(const FrameBuffer &aFrame)
// - size_t pixelCount() const
// - ErrorPtr setPixelCount(size_t aPixelCount)
// - bool isDegraded() const
// - void end()
// and the frame scheduler is instantiated for the backend selected at startup.

namespace lb {

  class DisplayError : public Error
  {
  public:
    typedef enum {
      OK,
      HardwareFault, ///< writing to the LED hardware failed
      Disconnected, ///< the output surface went away
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "Display"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return DisplayError::domain(); };
    DisplayError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const LB_OVERRIDE
    {
      switch (getErrorCode()) {
        case HardwareFault: return "HardwareFault";
        case Disconnected: return "Disconnected";
      }
      return NULL;
    };
    #endif // ENABLE_NAMED_ERRORS
  };

} // namespace lb

#endif /* defined(__ledbetter__display__) */
