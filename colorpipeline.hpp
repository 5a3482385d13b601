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

#ifndef __ledbetter__colorpipeline__
#define __ledbetter__colorpipeline__

#include "ledbetter_common.hpp"
#include "colorutils.hpp"

using namespace std;

namespace lb {

  /// raw pixel as produced by a program, components may be out of the 0..255 range
  typedef struct {
    int16_t r;
    int16_t g;
    int16_t b;
  } RawPixel;

  typedef std::vector<RawPixel> RawFrame;

  /// final pixels as sent to a display, alpha is always 255
  typedef std::vector<PixelColor> FrameBuffer;

  /// @return a frame of aPixelCount pixels of a single color
  FrameBuffer solidFrame(size_t aPixelCount, const PixelColor &aColor);


  /// Converts raw program output into display-ready pixels.
  /// Brightness and gamma are folded into one 8.8 fixed point lookup table, optional
  /// temporal dithering carries the fractional remainder per channel from frame to frame.
  class ColorPipeline : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

    double mBrightness;
    double mGamma;
    bool mDithering;

    bool mLutValid;
    uint16_t mLut[256]; ///< brightness and gamma corrected output in 8.8 fixed point
    long mLutRebuilds;

    size_t mPixelCount;
    std::vector<int16_t> mResiduals; ///< dithering residuals, 3 per pixel

  public:

    ColorPipeline();

    virtual string logContextPrefix() LB_OVERRIDE { return "pipeline"; }

    /// set the correction parameters
    /// @note the lookup table is rebuilt on next use only if brightness or gamma actually changed
    void setParams(double aBrightness, double aGamma, bool aDithering);

    /// set the number of output pixels
    /// @note changing the number resets the dithering residuals
    void setPixelCount(size_t aPixelCount);

    size_t pixelCount() const { return mPixelCount; }

    /// process one frame
    /// @param aRaw raw pixels, missing ones are treated as black, extra ones are ignored
    /// @param aOutput receives exactly pixelCount() pixels
    void process(const RawFrame &aRaw, FrameBuffer &aOutput);

    /// @return the 8.8 fixed point lookup table value for a raw component value (clamped to 0..255)
    uint16_t lutValue(int aRawValue);

    /// @return number of times the lookup table was built
    long lutRebuilds() const { return mLutRebuilds; }

    double brightness() const { return mBrightness; }
    double gamma() const { return mGamma; }
    bool dithering() const { return mDithering; }

  private:

    void rebuildLut();
    inline uint8_t convert(int aRaw, int16_t *aResidualP);

  };

} // namespace lb

#endif /* defined(__ledbetter__colorpipeline__) */
