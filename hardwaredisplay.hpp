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

#ifndef __ledbetter__hardwaredisplay__
#define __ledbetter__hardwaredisplay__

#include "display.hpp"

#if ENABLE_RPIWS281X

// we use the rpi_ws281x library to communicate with the LED chains on RaspberryPi
extern "C" {
  #include "clk.h"
  #include "gpio.h"
  #include "dma.h"
  #include "pwm.h"
  #include "ws2811.h"
}

#endif // ENABLE_RPIWS281X

using namespace std;

namespace lb {

  /// WS281x LED chain output
  /// @note the WS2812 bit timing produced by the low level drivers is
  ///   T0H 400nS, T0L 850nS, T1H 850nS, T1L 400nS, reset (latch) >= 50uS
  class HardwareDisplay : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

  public:

    typedef enum {
      ledlayout_none,
      ledlayout_rgb,
      ledlayout_grb,
      ledlayout_rgbw,
      ledlayout_grbw,
      ledlayout_rbg,
      ledlayout_gbr,
      ledlayout_brg,
      ledlayout_bgr,
      ledlayout_rbgw,
      ledlayout_gbrw,
      ledlayout_brgw,
      ledlayout_bgrw,
      num_ledlayouts
    } LedLayout;

    typedef enum {
      ledchip_none,
      ledchip_ws2811,
      ledchip_ws2812,
      ledchip_ws2813,
      ledchip_ws2815,
      ledchip_p9823,
      ledchip_sk6812,
      num_ledchips
    } LedChip;

  private:

    LedChip mLedChip; ///< type of LED chips in the chain
    LedLayout mLedLayout; ///< color layout in the LED chips
    uint16_t mTMaxPassive_uS; ///< max passive bit time in uS, 0 = driver default
    uint8_t mMaxRetries; ///< number of retries for a failed frame write
    MLMicroSeconds mWriteBudget; ///< writes taking longer than this are reported
    string mDeviceName; ///< the LED device name
    size_t mNumLeds; ///< number of LEDs
    uint8_t mNumColorComponents; ///< 3 or 4, depends on chip

    bool mInitialized;
    bool mDegraded; ///< set when retries were exhausted, no more hardware access then
    long mSlowWrites;

    #if ENABLE_RPIWS281X
    ws2811_t mRPiWS281x; ///< the descriptor for the rpi_ws281x library
    #else
    int mLedFd; ///< the file descriptor for the LED device
    std::vector<uint8_t> mRawBuffer; ///< header plus LED data as sent to the device
    size_t mHeaderBytes; ///< number of header bytes in mRawBuffer
    #endif

  public:

    /// create driver for a WS281x LED chain
    /// @param aLedType type of LED chips in "<chip>.<layout>[.<TMaxPassive_uS>]" form or just "<ledtypename>"
    /// @param aDeviceName the name of the LED chain device
    /// - ledchain device: full path like /dev/ledchain0
    /// - RPi library (ENABLE_RPIWS281X): "gpioN", optionally prefixed with "!" for inverted output
    /// @param aNumLeds number of LEDs in the chain
    /// @param aMaxRetries number of retries when writing a frame fails
    /// @param aWriteBudget time a frame write may take before it is reported as slow
    HardwareDisplay(const string aLedType, const string aDeviceName, size_t aNumLeds, int aMaxRetries = 3, MLMicroSeconds aWriteBudget = 5*MilliSecond);

    virtual ~HardwareDisplay();

    virtual string logContextPrefix() LB_OVERRIDE;

    /// @return true if the led type could be parsed into a known chip and layout
    bool knownLedType() const { return mLedChip!=ledchip_none && mLedLayout!=ledlayout_none; }

    /// open the output
    ErrorPtr begin();

    /// close the output
    void end();

    /// send a frame to the LEDs, with retries
    /// @return OK or DisplayError::HardwareFault (immediately when degraded)
    ErrorPtr render(const FrameBuffer &aFrame);

    size_t pixelCount() const { return mNumLeds; }

    /// change the number of LEDs
    ErrorPtr setPixelCount(size_t aPixelCount);

    bool isDegraded() const { return mDegraded; }

    long slowWrites() const { return mSlowWrites; }

    /// @return name of the chip and layout, like "WS2812.GRB"
    string ledTypeName() const;

  private:

    void parseLedType(const string &aLedType);
    void loadFrame(const FrameBuffer &aFrame);
    ErrorPtr writeFrame();
    void enterDegraded(ErrorPtr aCause);

  };

} // namespace lb

#endif /* defined(__ledbetter__hardwaredisplay__) */
