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

#include "terminaldisplay.hpp"

using namespace lb;


TerminalDisplay::TerminalDisplay(int aFd, size_t aNumPixels) :
  mFd(aFd),
  mNumPixels(aNumPixels),
  mDisconnected(false),
  mDroppedFrames(0)
{
}


ErrorPtr TerminalDisplay::begin()
{
  return ErrorPtr();
}


ErrorPtr TerminalDisplay::setPixelCount(size_t aPixelCount)
{
  mNumPixels = aPixelCount;
  return ErrorPtr();
}


void TerminalDisplay::formatFrame(const FrameBuffer &aFrame, size_t aNumPixels, string &aLine)
{
  aLine.clear();
  for (size_t i=0; i<aNumPixels; i++) {
    PixelColor p = i<aFrame.size() ? aFrame[i] : black;
    string_format_append(aLine, "\x1B[38;2;%d;%d;%dmO", p.r, p.g, p.b);
  }
  aLine += "\x1B[0m\n";
}


ErrorPtr TerminalDisplay::render(const FrameBuffer &aFrame)
{
  if (mDisconnected) {
    mDroppedFrames++;
    return Error::err<DisplayError>(DisplayError::Disconnected);
  }
  formatFrame(aFrame, mNumPixels, mLine);
  const char *p = mLine.c_str();
  size_t remaining = mLine.size();
  while (remaining>0) {
    ssize_t res = write(mFd, p, remaining);
    if (res<0) {
      if (errno==EINTR) continue;
      ErrorPtr err = SysError::errNo();
      mDisconnected = true;
      mDroppedFrames++;
      OLOG(LOG_WARNING, "output disconnected, dropping all further frames: %s", err->text());
      return Error::err<DisplayError>(DisplayError::Disconnected, "%s", err->text());
    }
    p += res;
    remaining -= (size_t)res;
  }
  return ErrorPtr();
}
