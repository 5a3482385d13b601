//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2013-2025 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
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

#ifndef __ledbetter__colorutils__
#define __ledbetter__colorutils__

#include "ledbetter_minimal.hpp"

#include <string>

using namespace std;

namespace lb {

  typedef double Row3[3];

  /// @name pixel color, as used in LED chains
  /// @{

  typedef uint8_t PixelColorComponent;

  typedef struct {
    PixelColorComponent r;
    PixelColorComponent g;
    PixelColorComponent b;
    PixelColorComponent a; // alpha
  } PixelColor;

  #define PIXELMAX 255

  const PixelColor transparent = { 0, 0, 0, 0 };
  const PixelColor black = { 0, 0, 0, 255 };
  const PixelColor white = { 255, 255, 255, 255 };

  /// @return opaque pixel color from components
  inline PixelColor rgbPixel(PixelColorComponent aR, PixelColorComponent aG, PixelColorComponent aB)
  {
    PixelColor p = { aR, aG, aB, 255 };
    return p;
  }

  inline bool samePixel(const PixelColor &aP1, const PixelColor &aP2)
  {
    return aP1.r==aP2.r && aP1.g==aP2.g && aP1.b==aP2.b && aP1.a==aP2.a;
  }

  /// convert HSB to pixel
  /// @param aHue hue in degrees, 0..<360
  /// @param aSaturation 0..1
  /// @param aBrightness 0..1
  PixelColor hsbToPixel(double aHue, double aSaturation = 1.0, double aBrightness = 1.0);

  /// convert integer HSV to an encoded 0xAARRGGBB color word (alpha always 0xFF)
  /// @param aHueDegrees hue in degrees, wraps around at 360
  /// @param aSatPercent saturation 0..100, larger values are treated as 100
  /// @param aValPercent value 0..100, larger values are treated as 100
  uint32_t hsvToArgbEncoded(uint32_t aHueDegrees, uint32_t aSatPercent, uint32_t aValPercent);

  /// convert Web color to pixel color
  /// @param aWebColor web style #ARGB or #AARRGGBB color, alpha (A, AA) is optional, "#" is also optional
  /// @param aPixelColor receives the color
  /// @return false if aWebColor is not a valid web color (aPixelColor untouched then)
  bool webColorToPixel(const string aWebColor, PixelColor &aPixelColor);

  /// @}

  /// convert HSV to RGB
  /// @param HSV hue 0..<360, saturation 0..1, brightness 0..1
  /// @param RGB receives red, green, blue 0..1
  bool HSVtoRGB(const Row3 &HSV, Row3 &RGB);

} // namespace lb

#endif /* defined(__ledbetter__colorutils__) */
