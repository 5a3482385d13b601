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

#include "ledconfig.hpp"

#include <unistd.h>
#include <fcntl.h>

using namespace lb;

static JsonObjectPtr json(const char *aText)
{
  return JsonObject::objFromText(aText, -1, NULL, true);
}


TEST_CASE("LED config defaults are valid", "[config]") {
  LedConfig c;
  REQUIRE(Error::isOK(c.validate()));
  REQUIRE(c.framePeriod() == Second/30);
  PixelColor p = c.fallbackPixel();
  REQUIRE(samePixel(p, rgbPixel(0x20,0x10,0x00)));
}

TEST_CASE("merging LED config updates", "[config]") {
  LedConfig c;
  LedConfig merged;
  SECTION("partial update keeps other fields") {
    REQUIRE(Error::isOK(c.mergedWith(json("{ \"brightness\": 0.5, \"frame_rate_hz\": 60 }"), merged)));
    REQUIRE(merged.brightness == 0.5);
    REQUIRE(merged.frameRateHz == 60);
    REQUIRE(merged.pixelCount == c.pixelCount);
    REQUIRE(merged.gamma == c.gamma);
    REQUIRE(merged.framePeriod() == Second/60);
  }
  SECTION("unknown fields are ignored") {
    REQUIRE(Error::isOK(c.mergedWith(json("{ \"sparkle\": true }"), merged)));
    REQUIRE(merged.pixelCount == c.pixelCount);
  }
  SECTION("an invalid field rejects the whole update") {
    merged = c;
    ErrorPtr err = c.mergedWith(json("{ \"brightness\": 0.2, \"pixel_count\": 0 }"), merged);
    REQUIRE(Error::isError(err, ConfigError::domain(), ConfigError::Invalid));
    REQUIRE(merged.brightness == c.brightness);
    REQUIRE(merged.pixelCount == c.pixelCount);
  }
  SECTION("range checks") {
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"brightness\": 1.5 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"gamma\": 0 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"frame_rate_hz\": 241 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"pixel_count\": 4097 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"pixel_count\": 1.5 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"dithering\": 1 }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"fallback_color\": \"orange\" }"), merged)));
    REQUIRE(Error::notOK(c.mergedWith(json("[1,2]"), merged)));
  }
  SECTION("display mode is fixed at runtime") {
    REQUIRE(Error::notOK(c.mergedWith(json("{ \"display_mode\": \"terminal\" }"), merged)));
    REQUIRE(Error::isOK(c.mergedWith(json("{ \"display_mode\": \"hardware\" }"), merged)));
  }
}

TEST_CASE("LED config json representation", "[config]") {
  LedConfig c;
  c.pixelCount = 10;
  JsonObjectPtr j = c.json();
  REQUIRE(j->get("pixel_count")->int32Value() == 10);
  REQUIRE(j->get("display_mode")->stringValue() == "hardware");
  LedConfig back;
  REQUIRE(Error::isOK(back.applyJson(j, true)));
  REQUIRE(back.pixelCount == 10);
}

TEST_CASE("daemon config from JSON", "[config]") {
  DaemonConfig d;
  ErrorPtr err = d.loadFromJson(json(
    "{ \"name\": \"shelf\","
    "  \"controller\": { \"host\": \"10.0.0.2\", \"port\": 9000, \"path\": \"leds\" },"
    "  \"led\": { \"pixel_count\": 10, \"display_mode\": \"terminal\" },"
    "  \"hardware\": { \"led_type\": \"SK6812\", \"max_retries\": 1, \"write_budget_ms\": 2.5 },"
    "  \"sandbox\": { \"fault_threshold\": 3 },"
    "  \"reconnect\": { \"min_interval\": 0.5, \"max_interval\": 30 },"
    "  \"shutdown_budget\": 1 }"
  ));
  REQUIRE(Error::isOK(err));
  REQUIRE(Error::isOK(d.validate()));
  REQUIRE(d.name == "shelf");
  REQUIRE(d.controllerUrl() == "ws://10.0.0.2:9000/leds");
  REQUIRE(d.led.pixelCount == 10);
  REQUIRE(d.led.displayMode == display_terminal);
  REQUIRE(d.ledType == "SK6812");
  REQUIRE(d.maxRetries == 1);
  REQUIRE(d.writeBudget == 2500);
  REQUIRE(d.sandbox.faultThreshold == 3);
  REQUIRE(d.sandbox.fuelPerMs == SandboxParams().fuelPerMs);
  REQUIRE(d.reconnect.minInterval == 500*MilliSecond);
  REQUIRE(d.reconnect.maxInterval == 30*Second);
  REQUIRE(d.reconnect.resetAfter == 60*Second);
  REQUIRE(d.shutdownBudget == 1*Second);
}

TEST_CASE("daemon config validation", "[config]") {
  DaemonConfig d;
  SECTION("controller host is required") {
    REQUIRE(Error::isError(d.validate(), ConfigError::domain(), ConfigError::Missing));
  }
  SECTION("bad values") {
    REQUIRE(Error::notOK(d.loadFromJson(json("{ \"controller\": { \"port\": 70000 } }"))));
    REQUIRE(Error::notOK(d.loadFromJson(json("{ \"reconnect\": { \"min_interval\": 0 } }"))));
    REQUIRE(Error::notOK(d.loadFromJson(json("{ \"shutdown_budget\": \"soon\" }"))));
    REQUIRE(Error::notOK(d.loadFromJson(json("{ \"name\": 5 }"))));
  }
  SECTION("backoff range must be ordered") {
    d.controllerHost = "localhost";
    d.reconnect.minInterval = 10*Second;
    d.reconnect.maxInterval = 5*Second;
    REQUIRE(Error::isError(d.validate(), ConfigError::domain(), ConfigError::Invalid));
  }
}

TEST_CASE("command line overrides are range checked", "[config]") {
  DaemonConfig d;
  d.controllerHost = "localhost";
  uint16_t before = d.led.pixelCount;
  // 65537 would wrap around to 1 if stored unchecked
  REQUIRE(Error::isError(d.setPixelCount(65537), ConfigError::domain(), ConfigError::Invalid));
  REQUIRE(Error::isError(d.setPixelCount(0), ConfigError::domain(), ConfigError::Invalid));
  REQUIRE(Error::isError(d.setPixelCount(4097), ConfigError::domain(), ConfigError::Invalid));
  REQUIRE(Error::isError(d.setPixelCount(-3), ConfigError::domain(), ConfigError::Invalid));
  REQUIRE(d.led.pixelCount == before);
  REQUIRE(Error::isOK(d.setPixelCount(4096)));
  REQUIRE(d.led.pixelCount == 4096);
  REQUIRE(Error::isOK(d.validate()));
  REQUIRE(Error::isError(d.setControllerPort(65536), ConfigError::domain(), ConfigError::Invalid));
  REQUIRE(Error::isOK(d.setControllerPort(8081)));
  REQUIRE(d.controllerPort == 8081);
}

TEST_CASE("daemon config from file", "[config]") {
  char tmpl[] = "/tmp/ledbetter_configXXXXXX";
  int fd = mkstemp(tmpl);
  REQUIRE(fd >= 0);
  const char *text = "{\n  // controller\n  \"controller\": { \"host\": \"ctrl\" }\n}\n";
  REQUIRE(write(fd, text, strlen(text)) == (ssize_t)strlen(text));
  close(fd);
  DaemonConfig d;
  REQUIRE(Error::isOK(d.loadFromFile(tmpl)));
  REQUIRE(d.controllerHost == "ctrl");
  REQUIRE(d.controllerUrl() == "ws://ctrl:8080/");
  unlink(tmpl);
  REQUIRE(Error::notOK(d.loadFromFile(tmpl)));
}


static string fileContents(int aFd)
{
  string s;
  char buf[256];
  lseek(aFd, 0, SEEK_SET);
  ssize_t n;
  while ((n = read(aFd, buf, sizeof(buf)))>0) s.append(buf, (size_t)n);
  return s;
}

TEST_CASE("terminal display on stdout gets no log lines", "[config]") {
  DaemonConfig d;
  REQUIRE_FALSE(d.displayOwnsStdout());
  d.led.displayMode = display_terminal;
  REQUIRE(d.displayOwnsStdout());
  d.terminalFd = 5;
  REQUIRE_FALSE(d.displayOwnsStdout());
  // with all levels sent to stderr and no duplication, a daemon logger leaves stdout alone
  char outName[] = "/tmp/ledbetter_stdoutXXXXXX";
  char errName[] = "/tmp/ledbetter_stderrXXXXXX";
  int outFd = mkstemp(outName);
  int errFd = mkstemp(errName);
  REQUIRE(outFd>=0);
  REQUIRE(errFd>=0);
  fflush(stdout);
  fflush(stderr);
  int savedOut = dup(STDOUT_FILENO);
  int savedErr = dup(STDERR_FILENO);
  dup2(outFd, STDOUT_FILENO);
  dup2(errFd, STDERR_FILENO);
  Logger logger;
  logger.setDaemonMode(true);
  logger.setLogLevel(LOG_DEBUG);
  logger.setErrLevel(LOG_DEBUG, false);
  logger.log(LOG_DEBUG, "debug line");
  logger.log(LOG_NOTICE, "notice line");
  logger.log(LOG_ERR, "error line");
  fflush(stdout);
  fflush(stderr);
  dup2(savedOut, STDOUT_FILENO);
  dup2(savedErr, STDERR_FILENO);
  close(savedOut);
  close(savedErr);
  string out = fileContents(outFd);
  string err = fileContents(errFd);
  close(outFd);
  close(errFd);
  unlink(outName);
  unlink(errName);
  REQUIRE(out.empty());
  REQUIRE(err.find("debug line") != string::npos);
  REQUIRE(err.find("notice line") != string::npos);
  REQUIRE(err.find("error line") != string::npos);
}
