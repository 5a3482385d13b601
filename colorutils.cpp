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

#include "colorutils.hpp"
#include "utils.hpp"

#include <math.h>
#include <ctype.h>
#include <stdlib.h>

using namespace lb;

// MARK: - pixel color utilities

static PixelColorComponent componentFromUnit(double aValue)
{
  double v = round(aValue*255);
  if (v<0) return 0;
  if (v>255) return 255;
  return (PixelColorComponent)v;
}


PixelColor lb::hsbToPixel(double aHue, double aSaturation, double aBrightness)
{
  Row3 RGB, HSV = { aHue, aSaturation, aBrightness };
  HSVtoRGB(HSV, RGB);
  return rgbPixel(componentFromUnit(RGB[0]), componentFromUnit(RGB[1]), componentFromUnit(RGB[2]));
}


uint32_t lb::hsvToArgbEncoded(uint32_t aHueDegrees, uint32_t aSatPercent, uint32_t aValPercent)
{
  PixelColor p = hsbToPixel(
    aHueDegrees % 360,
    (aSatPercent>100 ? 100 : aSatPercent)/100.0,
    (aValPercent>100 ? 100 : aValPercent)/100.0
  );
  return 0xFF000000u | ((uint32_t)p.r<<16) | ((uint32_t)p.g<<8) | (uint32_t)p.b;
}


bool lb::webColorToPixel(const string aWebColor, PixelColor &aPixelColor)
{
  size_t i = 0;
  size_t n = aWebColor.size();
  if (n>0 && aWebColor[0]=='#') { i++; n--; } // skip optional #
  if (n!=3 && n!=4 && n!=6 && n!=8) return false;
  for (size_t k=i; k<aWebColor.size(); k++) {
    if (!isxdigit((uint8_t)aWebColor[k])) return false;
  }
  uint32_t h = (uint32_t)strtoul(aWebColor.c_str()+i, NULL, 16);
  PixelColor res;
  res.a = 255;
  if (n<=4) {
    // short form RGB or ARGB
    if (n==4) { res.a = (h>>12)&0xF; res.a |= res.a<<4; }
    res.r = (h>>8)&0xF; res.r |= res.r<<4;
    res.g = (h>>4)&0xF; res.g |= res.g<<4;
    res.b = (h>>0)&0xF; res.b |= res.b<<4;
  }
  else {
    // long form RRGGBB or AARRGGBB
    if (n==8) { res.a = (h>>24)&0xFF; }
    res.r = (h>>16)&0xFF;
    res.g = (h>>8)&0xFF;
    res.b = (h>>0)&0xFF;
  }
  aPixelColor = res;
  return true;
}


// MARK: - color space conversions

bool lb::HSVtoRGB(const Row3 &HSV, Row3 &RGB)
{
  double hue = fmod(HSV[0], 360);
  if (hue<0) hue += 360;
  int hi = (int)floor(hue / 60) % 6;
  double f = (hue / 60 - hi);
  double p = HSV[2] * (1 - HSV[1]);
  double q = HSV[2] * (1 - (HSV[1]*f));
  double t = HSV[2] * (1 - (HSV[1]*(1-f)));
  switch (hi) {
    default:
    case 0: RGB[0] = HSV[2]; RGB[1] = t; RGB[2] = p; break;
    case 1: RGB[0] = q; RGB[1] = HSV[2]; RGB[2] = p; break;
    case 2: RGB[0] = p; RGB[1] = HSV[2]; RGB[2] = t; break;
    case 3: RGB[0] = p; RGB[1] = q; RGB[2] = HSV[2]; break;
    case 4: RGB[0] = t; RGB[1] = p; RGB[2] = HSV[2]; break;
    case 5: RGB[0] = HSV[2]; RGB[1] = p; RGB[2] = q; break;
  }
  return true;
}
