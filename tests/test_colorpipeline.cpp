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

#include <catch2/catch_all.hpp>

#include "colorpipeline.hpp"

using namespace lb;

static RawPixel raw(int aR, int aG, int aB)
{
  RawPixel p = { (int16_t)aR, (int16_t)aG, (int16_t)aB };
  return p;
}


class PipelineFixture {

public:

  ColorPipeline mPipeline;
  RawFrame mRaw;
  FrameBuffer mOut;

  PipelineFixture()
  {
    mPipeline.setPixelCount(4);
  };

};


TEST_CASE_METHOD(PipelineFixture, "half brightness without gamma halves full white", "[colorpipeline]") {
  mPipeline.setParams(0.5, 1.0, false);
  mRaw.assign(4, raw(255,255,255));
  mPipeline.process(mRaw, mOut);
  REQUIRE(mOut.size() == 4);
  for (size_t i=0; i<mOut.size(); i++) {
    REQUIRE((int)mOut[i].r == 128);
    REQUIRE((int)mOut[i].g == 128);
    REQUIRE((int)mOut[i].b == 128);
    REQUIRE((int)mOut[i].a == 255);
  }
}

TEST_CASE_METHOD(PipelineFixture, "out of range raw values are clamped before correction", "[colorpipeline]") {
  mPipeline.setParams(1.0, 2.2, false);
  mRaw.clear();
  mRaw.push_back(raw(300, -5, 255));
  mRaw.push_back(raw(32767, -32768, 0));
  mPipeline.process(mRaw, mOut);
  REQUIRE((int)mOut[0].r == 255);
  REQUIRE((int)mOut[0].g == 0);
  REQUIRE((int)mOut[0].b == 255);
  REQUIRE((int)mOut[1].r == 255);
  REQUIRE((int)mOut[1].g == 0);
  REQUIRE(mPipeline.lutValue(300) == mPipeline.lutValue(255));
  REQUIRE(mPipeline.lutValue(-1) == 0);
}

TEST_CASE_METHOD(PipelineFixture, "missing raw pixels are black, extra ones ignored", "[colorpipeline]") {
  mPipeline.setParams(1.0, 1.0, false);
  mRaw.assign(2, raw(255,0,0));
  mPipeline.process(mRaw, mOut);
  REQUIRE(mOut.size() == 4);
  REQUIRE((int)mOut[1].r == 255);
  REQUIRE((int)mOut[2].r == 0);
  REQUIRE((int)mOut[3].r == 0);
  mRaw.assign(10, raw(0,0,255));
  mPipeline.process(mRaw, mOut);
  REQUIRE(mOut.size() == 4);
  REQUIRE((int)mOut[3].b == 255);
}

TEST_CASE_METHOD(PipelineFixture, "output stays in range for any input", "[colorpipeline]") {
  SECTION("without dithering") { mPipeline.setParams(1.0, 2.2, false); }
  SECTION("with dithering") { mPipeline.setParams(0.7, 1.8, true); }
  for (int v=-400; v<=400; v+=7) {
    mRaw.assign(4, raw(v, 255-v, v/2));
    mPipeline.process(mRaw, mOut);
    for (size_t i=0; i<mOut.size(); i++) {
      REQUIRE((int)mOut[i].r <= 255);
      REQUIRE((int)mOut[i].g <= 255);
      REQUIRE((int)mOut[i].b <= 255);
    }
  }
}

TEST_CASE_METHOD(PipelineFixture, "dithering averages fractional levels over frames", "[colorpipeline]") {
  mPipeline.setParams(0.5, 1.0, true);
  mRaw.assign(4, raw(255,255,255));
  int sum = 0;
  for (int f=0; f<10; f++) {
    mPipeline.process(mRaw, mOut);
    sum += mOut[0].r;
    REQUIRE(((int)mOut[0].r == 127 || (int)mOut[0].r == 128));
  }
  // exact level is 127.5
  REQUIRE(sum == 1275);
}

TEST_CASE_METHOD(PipelineFixture, "lookup table is only rebuilt on actual change", "[colorpipeline]") {
  mPipeline.setParams(0.8, 2.0, false);
  mRaw.assign(4, raw(10,20,30));
  mPipeline.process(mRaw, mOut);
  long rebuilds = mPipeline.lutRebuilds();
  mPipeline.setParams(0.8, 2.0, true);
  mPipeline.process(mRaw, mOut);
  REQUIRE(mPipeline.lutRebuilds() == rebuilds);
  mPipeline.setParams(0.9, 2.0, true);
  mPipeline.process(mRaw, mOut);
  REQUIRE(mPipeline.lutRebuilds() == rebuilds+1);
}

TEST_CASE_METHOD(PipelineFixture, "gamma darkens mid levels", "[colorpipeline]") {
  mPipeline.setParams(1.0, 2.2, false);
  REQUIRE(mPipeline.lutValue(0) == 0);
  REQUIRE(mPipeline.lutValue(255) == 256*255);
  // (128/255)^2.2 * 255 is about 56
  REQUIRE((mPipeline.lutValue(128)+128)/256 == Catch::Approx(56).margin(1));
}

TEST_CASE("solid frames", "[colorpipeline]") {
  FrameBuffer f = solidFrame(10, rgbPixel(255,0,0));
  REQUIRE(f.size() == 10);
  REQUIRE(samePixel(f[9], rgbPixel(255,0,0)));
  REQUIRE(solidFrame(0, black).empty());
}

TEST_CASE("web colors", "[colorutils]") {
  PixelColor p;
  REQUIRE(webColorToPixel("#201000", p));
  REQUIRE(samePixel(p, rgbPixel(0x20,0x10,0x00)));
  REQUIRE(webColorToPixel("F00", p));
  REQUIRE(samePixel(p, rgbPixel(255,0,0)));
  REQUIRE_FALSE(webColorToPixel("#20100", p));
  REQUIRE_FALSE(webColorToPixel("#2010zz", p));
}

TEST_CASE("integer HSV to encoded color", "[colorutils]") {
  REQUIRE(hsvToArgbEncoded(0, 100, 100) == 0xFFFF0000u);
  REQUIRE(hsvToArgbEncoded(360, 100, 100) == 0xFFFF0000u);
  REQUIRE(hsvToArgbEncoded(0, 0, 0) == 0xFF000000u);
  REQUIRE(hsvToArgbEncoded(0, 0, 100) == 0xFFFFFFFFu);
  REQUIRE(hsvToArgbEncoded(0, 250, 250) == 0xFFFF0000u);
}
