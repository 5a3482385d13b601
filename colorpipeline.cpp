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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "colorpipeline.hpp"

#include <math.h>

using namespace lb;


FrameBuffer lb::solidFrame(size_t aPixelCount, const PixelColor &aColor)
{
  return FrameBuffer(aPixelCount, aColor);
}


ColorPipeline::ColorPipeline() :
  mBrightness(1.0),
  mGamma(2.2),
  mDithering(true),
  mLutValid(false),
  mLutRebuilds(0),
  mPixelCount(0)
{
}


void ColorPipeline::setParams(double aBrightness, double aGamma, bool aDithering)
{
  if (aBrightness!=mBrightness || aGamma!=mGamma) {
    mBrightness = aBrightness;
    mGamma = aGamma;
    mLutValid = false;
  }
  if (aDithering!=mDithering) {
    mDithering = aDithering;
    // start dithering from a clean state
    mResiduals.assign(mResiduals.size(), 0);
  }
}


void ColorPipeline::setPixelCount(size_t aPixelCount)
{
  if (aPixelCount!=mPixelCount) {
    mPixelCount = aPixelCount;
    mResiduals.assign(mPixelCount*3, 0);
  }
}


void ColorPipeline::rebuildLut()
{
  // lut[v] = 256 * 255 * ((v*brightness)/255)^gamma
  for (int v=0; v<256; v++) {
    double x = (v*mBrightness)/255.0;
    double y = x>0 ? pow(x, mGamma) : 0;
    long f = lround(256.0*255.0*y);
    if (f<0) f = 0;
    if (f>256*255) f = 256*255;
    mLut[v] = (uint16_t)f;
  }
  mLutValid = true;
  mLutRebuilds++;
  FOCUSOLOG("lookup table rebuilt for brightness=%.3f, gamma=%.2f", mBrightness, mGamma);
}


uint16_t ColorPipeline::lutValue(int aRawValue)
{
  if (!mLutValid) rebuildLut();
  if (aRawValue<0) aRawValue = 0;
  else if (aRawValue>255) aRawValue = 255;
  return mLut[aRawValue];
}


inline uint8_t ColorPipeline::convert(int aRaw, int16_t *aResidualP)
{
  if (aRaw<0) aRaw = 0;
  else if (aRaw>255) aRaw = 255;
  int32_t acc = mLut[aRaw];
  if (aResidualP) {
    acc += *aResidualP;
    int32_t out = (acc+128)>>8;
    if (out<0) out = 0;
    else if (out>255) out = 255;
    *aResidualP = (int16_t)(acc-out*256);
    return (uint8_t)out;
  }
  // round half up
  int32_t out = (acc+128)>>8;
  return (uint8_t)(out>255 ? 255 : out);
}


void ColorPipeline::process(const RawFrame &aRaw, FrameBuffer &aOutput)
{
  if (!mLutValid) rebuildLut();
  aOutput.resize(mPixelCount);
  size_t n = aRaw.size()<mPixelCount ? aRaw.size() : mPixelCount;
  for (size_t i=0; i<mPixelCount; i++) {
    int r = 0, g = 0, b = 0;
    if (i<n) {
      r = aRaw[i].r;
      g = aRaw[i].g;
      b = aRaw[i].b;
    }
    int16_t *res = mDithering ? &mResiduals[i*3] : NULL;
    PixelColor &p = aOutput[i];
    p.r = convert(r, res);
    p.g = convert(g, res ? res+1 : NULL);
    p.b = convert(b, res ? res+2 : NULL);
    p.a = 255;
  }
}
