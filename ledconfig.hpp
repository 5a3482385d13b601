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

#ifndef __ledbetter__ledconfig__
#define __ledbetter__ledconfig__

#include "ledbetter_common.hpp"
#include "jsonobject.hpp"
#include "colorutils.hpp"
#include "programsandbox.hpp"

#include <unistd.h>

using namespace std;

namespace lb {

  typedef enum {
    display_hardware,
    display_terminal
  } DisplayMode;

  const char *displayModeName(DisplayMode aMode);


  /// the runtime-changeable LED parameters, always handled as a whole
  class LedConfig
  {
  public:

    uint16_t pixelCount;
    uint16_t frameRateHz;
    double brightness;
    double gamma;
    bool dithering;
    DisplayMode displayMode;
    string fallbackColor; ///< web color

    LedConfig();

    /// check all fields
    /// @return OK or ConfigError::Invalid describing the first invalid field
    ErrorPtr validate() const;

    /// apply the fields present in a JSON object, unknown fields are ignored
    /// @param aJson object with a subset of the fields
    /// @param aAllowModeChange if false, a display_mode different from the current one is rejected
    /// @return OK or ConfigError::Invalid. On error, this object may be partially modified,
    ///   so apply to a copy and discard it on error (see mergedWith())
    ErrorPtr applyJson(JsonObjectPtr aJson, bool aAllowModeChange);

    /// merge an update into a copy of this config and validate the result
    /// @param aUpdate the fields to change
    /// @param aMerged receives the merged, validated config
    /// @return OK or ConfigError (aMerged untouched then)
    ErrorPtr mergedWith(JsonObjectPtr aUpdate, LedConfig &aMerged) const;

    /// @return all fields as JSON object
    JsonObjectPtr json() const;

    /// @return the frame period
    MLMicroSeconds framePeriod() const { return Second/frameRateHz; }

    /// @return the fallback color as pixel
    PixelColor fallbackPixel() const;

  };


  /// a validated config on its way to the render thread
  class ConfigUpdate : public LBObj
  {
  public:
    LedConfig config;
    uint64_t serial; ///< increments with every accepted update
    ConfigUpdate(const LedConfig &aConfig, uint64_t aSerial) : config(aConfig), serial(aSerial) {};
  };
  typedef boost::intrusive_ptr<ConfigUpdate> ConfigUpdatePtr;


  /// reconnect backoff parameters
  struct ReconnectParams
  {
    MLMicroSeconds minInterval;
    MLMicroSeconds maxInterval;
    MLMicroSeconds resetAfter; ///< a connection lasting this long resets the backoff
    ReconnectParams() : minInterval(1*Second), maxInterval(60*Second), resetAfter(60*Second) {};
  };


  /// complete daemon configuration, from the config file and command line
  class DaemonConfig
  {
  public:

    string name;
    string controllerHost;
    uint16_t controllerPort;
    string controllerPath;

    LedConfig led;

    string ledType;
    string device;
    int maxRetries;
    MLMicroSeconds writeBudget;

    int terminalFd;

    SandboxParams sandbox;
    ReconnectParams reconnect;
    MLMicroSeconds shutdownBudget;

    DaemonConfig();

    /// load from a parsed config file
    /// @return OK or ConfigError
    ErrorPtr loadFromJson(JsonObjectPtr aJson);

    /// load from a config file
    /// @return OK or ConfigError/JsonError
    ErrorPtr loadFromFile(const char *aPath);

    /// check the complete configuration
    ErrorPtr validate() const;

    /// command line overrides, range checked before they are stored
    ErrorPtr setPixelCount(int aPixelCount);
    ErrorPtr setControllerPort(int aPort);

    /// @return true if frames are written to this process' stdout
    bool displayOwnsStdout() const { return led.displayMode==display_terminal && terminalFd==STDOUT_FILENO; }

    /// @return the controller URL
    string controllerUrl() const;

  };

} // namespace lb

#endif /* defined(__ledbetter__ledconfig__) */
