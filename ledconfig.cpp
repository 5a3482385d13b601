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

#include "ledconfig.hpp"

#include <math.h>

using namespace lb;


const char *lb::displayModeName(DisplayMode aMode)
{
  return aMode==display_terminal ? "terminal" : "hardware";
}


// MARK: - field readers

#define INVALID(...) Error::err<ConfigError>(ConfigError::Invalid, ##__VA_ARGS__)

// Readers leave the value untouched when the key is absent

static ErrorPtr readInt(JsonObjectPtr aJson, const char *aKey, int64_t aMin, int64_t aMax, int64_t &aValue)
{
  JsonObjectPtr o;
  if (!aJson->get(aKey, o)) return ErrorPtr();
  if (!o || !o->isNumber()) return INVALID("%s must be a number", aKey);
  double d = o->doubleValue();
  if (d!=floor(d)) return INVALID("%s must be an integer", aKey);
  if (d<aMin || d>aMax) return INVALID("%s must be in %lld..%lld, is %g", aKey, (long long)aMin, (long long)aMax, d);
  aValue = (int64_t)d;
  return ErrorPtr();
}


static ErrorPtr readDouble(JsonObjectPtr aJson, const char *aKey, double &aValue)
{
  JsonObjectPtr o;
  if (!aJson->get(aKey, o)) return ErrorPtr();
  if (!o || !o->isNumber()) return INVALID("%s must be a number", aKey);
  aValue = o->doubleValue();
  return ErrorPtr();
}


static ErrorPtr readBool(JsonObjectPtr aJson, const char *aKey, bool &aValue)
{
  JsonObjectPtr o;
  if (!aJson->get(aKey, o)) return ErrorPtr();
  if (!o || !o->isType(json_type_boolean)) return INVALID("%s must be true or false", aKey);
  aValue = o->boolValue();
  return ErrorPtr();
}


static ErrorPtr readString(JsonObjectPtr aJson, const char *aKey, string &aValue)
{
  JsonObjectPtr o;
  if (!aJson->get(aKey, o)) return ErrorPtr();
  if (!o || !o->isType(json_type_string)) return INVALID("%s must be a string", aKey);
  aValue = o->stringValue();
  return ErrorPtr();
}


static ErrorPtr readInterval(JsonObjectPtr aJson, const char *aKey, double aMaxSeconds, MLMicroSeconds &aValue)
{
  double secs = (double)aValue/Second;
  ErrorPtr err = readDouble(aJson, aKey, secs);
  if (Error::notOK(err)) return err;
  if (secs<=0 || secs>aMaxSeconds) return INVALID("%s must be >0 and <=%g seconds", aKey, aMaxSeconds);
  aValue = (MLMicroSeconds)(secs*Second);
  return ErrorPtr();
}


// MARK: - LedConfig

LedConfig::LedConfig() :
  pixelCount(60),
  frameRateHz(30),
  brightness(1.0),
  gamma(2.2),
  dithering(true),
  displayMode(display_hardware),
  fallbackColor("#201000")
{
}


ErrorPtr LedConfig::validate() const
{
  if (pixelCount<1 || pixelCount>4096) return INVALID("pixel_count must be in 1..4096, is %u", pixelCount);
  if (frameRateHz<1 || frameRateHz>240) return INVALID("frame_rate_hz must be in 1..240, is %u", frameRateHz);
  if (!(brightness>=0 && brightness<=1)) return INVALID("brightness must be in 0..1, is %g", brightness);
  if (!(gamma>0 && gamma<=10)) return INVALID("gamma must be >0 and <=10, is %g", gamma);
  PixelColor p;
  if (!webColorToPixel(fallbackColor, p)) return INVALID("fallback_color '%s' is not a valid color", fallbackColor.c_str());
  return ErrorPtr();
}


ErrorPtr LedConfig::applyJson(JsonObjectPtr aJson, bool aAllowModeChange)
{
  if (!aJson || !aJson->isType(json_type_object)) return INVALID("LED config must be an object");
  ErrorPtr err;
  int64_t v = pixelCount;
  if (Error::notOK(err = readInt(aJson, "pixel_count", 1, 4096, v))) return err;
  pixelCount = (uint16_t)v;
  v = frameRateHz;
  if (Error::notOK(err = readInt(aJson, "frame_rate_hz", 1, 240, v))) return err;
  frameRateHz = (uint16_t)v;
  if (Error::notOK(err = readDouble(aJson, "brightness", brightness))) return err;
  if (Error::notOK(err = readDouble(aJson, "gamma", gamma))) return err;
  if (Error::notOK(err = readBool(aJson, "dithering", dithering))) return err;
  if (Error::notOK(err = readString(aJson, "fallback_color", fallbackColor))) return err;
  string mode = displayModeName(displayMode);
  if (Error::notOK(err = readString(aJson, "display_mode", mode))) return err;
  DisplayMode newMode;
  if (uequals(mode, "hardware")) newMode = display_hardware;
  else if (uequals(mode, "terminal")) newMode = display_terminal;
  else return INVALID("display_mode must be 'hardware' or 'terminal'");
  if (newMode!=displayMode && !aAllowModeChange) {
    return INVALID("display_mode cannot be changed at runtime");
  }
  displayMode = newMode;
  return ErrorPtr();
}


ErrorPtr LedConfig::mergedWith(JsonObjectPtr aUpdate, LedConfig &aMerged) const
{
  LedConfig copy = *this;
  ErrorPtr err = copy.applyJson(aUpdate, false);
  if (Error::isOK(err)) err = copy.validate();
  if (Error::notOK(err)) return err;
  aMerged = copy;
  return ErrorPtr();
}


JsonObjectPtr LedConfig::json() const
{
  JsonObjectPtr j = JsonObject::newObj();
  j->add("pixel_count", JsonObject::newInt32(pixelCount));
  j->add("frame_rate_hz", JsonObject::newInt32(frameRateHz));
  j->add("brightness", JsonObject::newDouble(brightness));
  j->add("gamma", JsonObject::newDouble(gamma));
  j->add("dithering", JsonObject::newBool(dithering));
  j->add("display_mode", JsonObject::newString(displayModeName(displayMode)));
  j->add("fallback_color", JsonObject::newString(fallbackColor));
  return j;
}


PixelColor LedConfig::fallbackPixel() const
{
  PixelColor p = black;
  if (webColorToPixel(fallbackColor, p)) p.a = 255;
  return p;
}


// MARK: - DaemonConfig

DaemonConfig::DaemonConfig() :
  name("ledbetter"),
  controllerPort(8080),
  controllerPath("/"),
  ledType("WS2812"),
  device("/dev/ledchain0"),
  maxRetries(3),
  writeBudget(5*MilliSecond),
  terminalFd(STDOUT_FILENO),
  shutdownBudget(2*Second)
{
}


ErrorPtr DaemonConfig::loadFromJson(JsonObjectPtr aJson)
{
  if (!aJson || !aJson->isType(json_type_object)) return INVALID("config must be a JSON object");
  ErrorPtr err;
  JsonObjectPtr o;
  if (Error::notOK(err = readString(aJson, "name", name))) return err;
  if (aJson->get("controller", o, true)) {
    int64_t port = controllerPort;
    if (Error::notOK(err = readString(o, "host", controllerHost))) return err->withPrefix("controller: ");
    if (Error::notOK(err = readInt(o, "port", 1, 65535, port))) return err->withPrefix("controller: ");
    controllerPort = (uint16_t)port;
    if (Error::notOK(err = readString(o, "path", controllerPath))) return err->withPrefix("controller: ");
  }
  if (aJson->get("led", o, true)) {
    if (Error::notOK(err = led.applyJson(o, true))) return err->withPrefix("led: ");
  }
  if (aJson->get("hardware", o, true)) {
    int64_t retries = maxRetries;
    double budgetMs = (double)writeBudget/MilliSecond;
    if (Error::notOK(err = readString(o, "led_type", ledType))) return err->withPrefix("hardware: ");
    if (Error::notOK(err = readString(o, "device", device))) return err->withPrefix("hardware: ");
    if (Error::notOK(err = readInt(o, "max_retries", 0, 100, retries))) return err->withPrefix("hardware: ");
    maxRetries = (int)retries;
    if (Error::notOK(err = readDouble(o, "write_budget_ms", budgetMs))) return err->withPrefix("hardware: ");
    if (budgetMs<=0) return INVALID("hardware: write_budget_ms must be >0");
    writeBudget = (MLMicroSeconds)(budgetMs*MilliSecond);
  }
  if (aJson->get("terminal", o, true)) {
    int64_t fd = terminalFd;
    if (Error::notOK(err = readInt(o, "fd", 0, 1023, fd))) return err->withPrefix("terminal: ");
    terminalFd = (int)fd;
  }
  if (aJson->get("sandbox", o, true)) {
    int64_t threshold = sandbox.faultThreshold;
    int64_t fuel = sandbox.fuelPerMs;
    int64_t memKb = sandbox.memoryLimitKb;
    if (Error::notOK(err = readInt(o, "fault_threshold", 1, 1000, threshold))) return err->withPrefix("sandbox: ");
    if (Error::notOK(err = readInt(o, "fuel_per_ms", 100, 100000000, fuel))) return err->withPrefix("sandbox: ");
    if (Error::notOK(err = readInt(o, "memory_limit_kb", 64, 65536, memKb))) return err->withPrefix("sandbox: ");
    sandbox.faultThreshold = (uint32_t)threshold;
    sandbox.fuelPerMs = (uint32_t)fuel;
    sandbox.memoryLimitKb = (uint32_t)memKb;
  }
  if (aJson->get("reconnect", o, true)) {
    if (Error::notOK(err = readInterval(o, "min_interval", 3600, reconnect.minInterval))) return err->withPrefix("reconnect: ");
    if (Error::notOK(err = readInterval(o, "max_interval", 3600, reconnect.maxInterval))) return err->withPrefix("reconnect: ");
    if (Error::notOK(err = readInterval(o, "reset_after", 86400, reconnect.resetAfter))) return err->withPrefix("reconnect: ");
  }
  if (Error::notOK(err = readInterval(aJson, "shutdown_budget", 60, shutdownBudget))) return err;
  return ErrorPtr();
}


ErrorPtr DaemonConfig::loadFromFile(const char *aPath)
{
  ErrorPtr err;
  JsonObjectPtr json = JsonObject::objFromFile(aPath, &err, true);
  if (Error::notOK(err)) return err->withPrefix("config file '%s': ", aPath);
  if (!json) return Error::err<ConfigError>(ConfigError::Missing, "config file '%s' is empty", aPath);
  err = loadFromJson(json);
  if (Error::notOK(err)) return err->withPrefix("config file '%s': ", aPath);
  return ErrorPtr();
}


ErrorPtr DaemonConfig::validate() const
{
  if (name.empty()) return INVALID("name must not be empty");
  if (controllerHost.empty()) return Error::err<ConfigError>(ConfigError::Missing, "controller host not configured");
  if (reconnect.maxInterval<reconnect.minInterval) return INVALID("reconnect: max_interval must not be below min_interval");
  ErrorPtr err = led.validate();
  if (Error::notOK(err)) return err->withPrefix("led: ");
  return ErrorPtr();
}


ErrorPtr DaemonConfig::setPixelCount(int aPixelCount)
{
  if (aPixelCount<1 || aPixelCount>4096) return INVALID("pixel count must be in 1..4096, is %d", aPixelCount);
  led.pixelCount = (uint16_t)aPixelCount;
  return ErrorPtr();
}


ErrorPtr DaemonConfig::setControllerPort(int aPort)
{
  if (aPort<1 || aPort>65535) return INVALID("port %d out of range", aPort);
  controllerPort = (uint16_t)aPort;
  return ErrorPtr();
}


string DaemonConfig::controllerUrl() const
{
  string p = controllerPath;
  if (p.empty() || p[0]!='/') p.insert(0, "/");
  return string_format("ws://%s:%u%s", controllerHost.c_str(), controllerPort, p.c_str());
}
