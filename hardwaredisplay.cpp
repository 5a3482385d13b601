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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "hardwaredisplay.hpp"

#include <fcntl.h>

using namespace lb;

#if ENABLE_RPIWS281X
  #define TARGET_FREQ WS2811_TARGET_FREQ // in Hz, default is 800kHz
  #define GPIO_DEFAULT_PIN 18 // P1 Pin 12, GPIO 18 (PCM_CLK)
  #define DMA 5 // don't change unless you know why
  #define MAX_BRIGHTNESS 255 // full brightness range, dimming is done in the color pipeline
#endif // ENABLE_RPIWS281X


typedef struct {
  const char *name; ///< name of the chip
  bool hasWhite; ///< set if chip has a separate white channel
} LedChipDesc_t;

static const LedChipDesc_t ledChipDescriptors[HardwareDisplay::num_ledchips] = {
  { "none", false },
  { "WS2811", false },
  { "WS2812", false },
  { "WS2813", false },
  { "WS2815", false },
  { "P9823", false },
  { "SK6812", true }
};

static const char *ledLayoutNames[HardwareDisplay::num_ledlayouts] = {
  "none", "RGB", "GRB", "RGBW", "GRBW", "RBG", "GBR", "BRG", "BGR", "RBGW", "GBRW", "BRGW", "BGRW"
};


HardwareDisplay::HardwareDisplay(const string aLedType, const string aDeviceName, size_t aNumLeds, int aMaxRetries, MLMicroSeconds aWriteBudget) :
  mLedChip(ledchip_none),
  mLedLayout(ledlayout_none),
  mTMaxPassive_uS(0),
  mMaxRetries(aMaxRetries<0 ? 0 : (uint8_t)aMaxRetries),
  mWriteBudget(aWriteBudget),
  mDeviceName(aDeviceName),
  mNumLeds(aNumLeds),
  mNumColorComponents(3),
  mInitialized(false),
  mDegraded(false),
  mSlowWrites(0)
  #if !ENABLE_RPIWS281X
  ,mLedFd(-1)
  ,mHeaderBytes(0)
  #endif
{
  parseLedType(aLedType);
  mNumColorComponents = ledChipDescriptors[mLedChip].hasWhite ? 4 : 3;
}


HardwareDisplay::~HardwareDisplay()
{
  end();
}


string HardwareDisplay::logContextPrefix()
{
  return string_format("display %s", mDeviceName.c_str());
}


void HardwareDisplay::parseLedType(const string &aLedType)
{
  // legacy type names
  if (aLedType=="SK6812") {
    mLedChip = ledchip_sk6812;
    mLedLayout = ledlayout_grbw;
  }
  else if (aLedType=="P9823") {
    mLedChip = ledchip_p9823;
    mLedLayout = ledlayout_rgb;
  }
  else if (aLedType=="WS2815_RGB") {
    mLedChip = ledchip_ws2815;
    mLedLayout = ledlayout_rgb;
  }
  else if (aLedType=="WS2812") {
    mLedChip = ledchip_ws2812;
    mLedLayout = ledlayout_grb;
  }
  else if (aLedType=="WS2813") {
    mLedChip = ledchip_ws2813;
    mLedLayout = ledlayout_grb;
  }
  else {
    // <chip>.<layout>[.<TMaxPassive_uS>]
    const char* cP = aLedType.c_str();
    string part;
    if (nextPart(cP, part, '.')) {
      for (int i=0; i<num_ledchips; i++) { if (uequals(part, ledChipDescriptors[i].name)) { mLedChip = (LedChip)i; break; } };
    }
    if (nextPart(cP, part, '.')) {
      for (int i=0; i<num_ledlayouts; i++) { if (uequals(part, ledLayoutNames[i])) { mLedLayout = (LedLayout)i; break; } };
    }
    if (nextPart(cP, part, '.')) {
      mTMaxPassive_uS = (uint16_t)atoi(part.c_str());
    }
  }
}


string HardwareDisplay::ledTypeName() const
{
  return string_format("%s.%s", ledChipDescriptors[mLedChip].name, ledLayoutNames[mLedLayout]);
}


ErrorPtr HardwareDisplay::begin()
{
  if (mInitialized) return ErrorPtr();
  if (!knownLedType()) {
    return Error::err<DisplayError>(DisplayError::HardwareFault, "unknown LED type, chip/layout %s", ledTypeName().c_str());
  }
  #if ENABLE_RPIWS281X
  int gpio = GPIO_DEFAULT_PIN;
  bool inverted = false;
  size_t n=0;
  if (mDeviceName.substr(n,1)=="!") {
    inverted = true;
    n++;
  }
  if (mDeviceName.substr(n,4)=="gpio") {
    sscanf(mDeviceName.c_str()+n+4, "%d", &gpio);
  }
  memset(&mRPiWS281x, 0, sizeof(mRPiWS281x));
  mRPiWS281x.freq = TARGET_FREQ;
  mRPiWS281x.dmanum = DMA;
  mRPiWS281x.device = NULL; // private data pointer for library
  mRPiWS281x.channel[0].gpionum = gpio;
  mRPiWS281x.channel[0].count = (int)mNumLeds;
  mRPiWS281x.channel[0].invert = inverted ? 1 : 0;
  mRPiWS281x.channel[0].brightness = MAX_BRIGHTNESS;
  if (mLedChip==ledchip_sk6812) {
    switch (mLedLayout) {
      default:
      case ledlayout_rgbw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_RGBW; break;
      case ledlayout_rbgw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_RBGW; break;
      case ledlayout_grbw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_GRBW; break;
      case ledlayout_gbrw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_GBRW; break;
      case ledlayout_brgw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_BRGW; break;
      case ledlayout_bgrw: mRPiWS281x.channel[0].strip_type = SK6812_STRIP_BGRW; break;
    }
  }
  else {
    switch (mLedLayout) {
      case ledlayout_rgb: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_RGB; break;
      case ledlayout_rbg: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_RBG; break;
      default:
      case ledlayout_grb: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_GRB; break;
      case ledlayout_gbr: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_GBR; break;
      case ledlayout_brg: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_BRG; break;
      case ledlayout_bgr: mRPiWS281x.channel[0].strip_type = WS2811_STRIP_BGR; break;
    }
  }
  mRPiWS281x.channel[0].leds = NULL; // will be allocated by the library
  // channel 1 - unused
  mRPiWS281x.channel[1].gpionum = 0;
  mRPiWS281x.channel[1].count = 0;
  mRPiWS281x.channel[1].invert = 0;
  mRPiWS281x.channel[1].brightness = MAX_BRIGHTNESS;
  mRPiWS281x.channel[1].leds = NULL;
  ws2811_return_t ret = ws2811_init(&mRPiWS281x);
  if (ret!=WS2811_SUCCESS) {
    return Error::err<DisplayError>(DisplayError::HardwareFault, "ws281x init for GPIO%d failed: %s", gpio, ws2811_get_return_t_str(ret));
  }
  #else
  // ledchain v6 driver header: size, layout, chip, TMaxPassive (MSB, LSB), max retries
  // Note: retries are done here, the driver must not repeat on its own
  mHeaderBytes = 1+5;
  mRawBuffer.assign(mHeaderBytes+mNumColorComponents*mNumLeds, 0);
  mRawBuffer[0] = 5;
  mRawBuffer[1] = (uint8_t)mLedLayout;
  mRawBuffer[2] = (uint8_t)mLedChip;
  mRawBuffer[3] = (mTMaxPassive_uS>>8) & 0xFF;
  mRawBuffer[4] = (mTMaxPassive_uS) & 0xFF;
  mRawBuffer[5] = 0;
  mLedFd = open(mDeviceName.c_str(), O_RDWR|O_NOCTTY|O_NONBLOCK);
  if (mLedFd<0) {
    ErrorPtr err = SysError::errNo();
    return Error::err<DisplayError>(DisplayError::HardwareFault, "cannot open LED chain device '%s': %s", mDeviceName.c_str(), err->text());
  }
  #endif
  mInitialized = true;
  OLOG(LOG_INFO, "LED chain of %zu %s LEDs ready", mNumLeds, ledTypeName().c_str());
  return ErrorPtr();
}


void HardwareDisplay::end()
{
  if (mInitialized) {
    #if ENABLE_RPIWS281X
    ws2811_fini(&mRPiWS281x);
    #else
    if (mLedFd>=0) {
      close(mLedFd);
      mLedFd = -1;
    }
    #endif
    mInitialized = false;
  }
}


ErrorPtr HardwareDisplay::setPixelCount(size_t aPixelCount)
{
  if (aPixelCount==mNumLeds) return ErrorPtr();
  bool wasInitialized = mInitialized;
  end();
  mNumLeds = aPixelCount;
  if (wasInitialized && !mDegraded) return begin();
  return ErrorPtr();
}


void HardwareDisplay::loadFrame(const FrameBuffer &aFrame)
{
  // missing pixels are off
  for (size_t i=0; i<mNumLeds; i++) {
    PixelColor p = i<aFrame.size() ? aFrame[i] : black;
    #if ENABLE_RPIWS281X
    // the library applies the strip type's channel order
    mRPiWS281x.channel[0].leds[i] = ((uint32_t)p.r<<16) | ((uint32_t)p.g<<8) | (uint32_t)p.b;
    #else
    // the driver applies the layout from the header, data is in RGB(W) order
    uint8_t *ledP = &mRawBuffer[mHeaderBytes+i*mNumColorComponents];
    ledP[0] = p.r;
    ledP[1] = p.g;
    ledP[2] = p.b;
    if (mNumColorComponents>3) ledP[3] = 0;
    #endif
  }
}


ErrorPtr HardwareDisplay::writeFrame()
{
  #if ENABLE_RPIWS281X
  ws2811_return_t ret = ws2811_render(&mRPiWS281x);
  if (ret!=WS2811_SUCCESS) {
    return Error::err<DisplayError>(DisplayError::HardwareFault, "ws2811_render failed: %s", ws2811_get_return_t_str(ret));
  }
  #else
  ssize_t res = write(mLedFd, &mRawBuffer[0], mRawBuffer.size());
  if (res<0) {
    ErrorPtr err = SysError::errNo();
    return Error::err<DisplayError>(DisplayError::HardwareFault, "write failed: %s", err->text());
  }
  if ((size_t)res!=mRawBuffer.size()) {
    return Error::err<DisplayError>(DisplayError::HardwareFault, "short write, %zd of %zu bytes", res, mRawBuffer.size());
  }
  #endif
  return ErrorPtr();
}


ErrorPtr HardwareDisplay::render(const FrameBuffer &aFrame)
{
  if (mDegraded) {
    return Error::err<DisplayError>(DisplayError::HardwareFault, "display is degraded");
  }
  ErrorPtr err;
  if (!mInitialized) {
    err = begin();
    if (Error::notOK(err)) {
      enterDegraded(err);
      return err;
    }
  }
  loadFrame(aFrame);
  for (int attempt=0; attempt<=mMaxRetries; attempt++) {
    MLMicroSeconds start = MainLoop::now();
    err = writeFrame();
    MLMicroSeconds took = MainLoop::now()-start;
    if (Error::isOK(err)) {
      if (took>mWriteBudget) {
        mSlowWrites++;
        OLOG(LOG_WARNING, "frame write took %lld uS, budget is %lld uS", took, mWriteBudget);
      }
      return ErrorPtr();
    }
    OLOG(LOG_WARNING, "frame write attempt %d/%d failed: %s", attempt+1, mMaxRetries+1, err->text());
  }
  enterDegraded(err);
  return err;
}


void HardwareDisplay::enterDegraded(ErrorPtr aCause)
{
  mDegraded = true;
  OLOG(LOG_ERR, "giving up on LED output, display is degraded now: %s", Error::text(aCause));
  if (mInitialized) {
    // one last attempt to leave the LEDs dark
    loadFrame(FrameBuffer());
    ErrorPtr err = writeFrame();
    if (Error::isOK(err)) {
      OLOG(LOG_NOTICE, "blank frame written after degrading");
    }
    else {
      OLOG(LOG_ERR, "blank frame could not be written either: %s", err->text());
    }
    end();
  }
}
