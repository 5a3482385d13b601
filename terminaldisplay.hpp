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

#ifndef __ledbetter__terminaldisplay__
#define __ledbetter__terminaldisplay__

#include "display.hpp"

using namespace std;

namespace lb {

  /// LED preview on a truecolor terminal, one line per frame
  class TerminalDisplay : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

    int mFd; ///< output file descriptor, not owned
    size_t mNumPixels;
    bool mDisconnected;
    long mDroppedFrames;
    string mLine; ///< reused line buffer

  public:

    /// @param aFd file descriptor to write to, usually STDOUT_FILENO
    /// @param aNumPixels number of pixels per line
    TerminalDisplay(int aFd, size_t aNumPixels);

    virtual string logContextPrefix() LB_OVERRIDE { return "terminal"; }

    /// nothing to open, the descriptor is owned by the caller
    ErrorPtr begin();

    void end() {};

    /// write one frame as a line of colored 'O' characters
    /// @return OK or DisplayError::Disconnected when the surface has gone away (now or earlier)
    ErrorPtr render(const FrameBuffer &aFrame);

    size_t pixelCount() const { return mNumPixels; }

    ErrorPtr setPixelCount(size_t aPixelCount);

    bool isDegraded() const { return mDisconnected; }

    long droppedFrames() const { return mDroppedFrames; }

    /// render a frame into a line of text
    static void formatFrame(const FrameBuffer &aFrame, size_t aNumPixels, string &aLine);

  };

} // namespace lb

#endif /* defined(__ledbetter__terminaldisplay__) */
