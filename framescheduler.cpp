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

#include "framescheduler.hpp"

using namespace lb;

#define MAX_LAG (1*Second)


FrameSchedulerCore::FrameSchedulerCore(RenderLink &aLink, const LedConfig &aInitialConfig, const SandboxParams &aSandboxParams) :
  mLink(aLink),
  mSandbox(aSandboxParams),
  mConfig(aInitialConfig),
  mConfigSerial(0),
  mState(scheduler_idle),
  mFrameIndex(0),
  mPeriod(aInitialConfig.framePeriod()),
  mEpoch(0),
  mEpochIndex(0),
  mStartTime(0),
  mOverruns(0),
  mFaults(0),
  mRebases(0)
{
  mPipeline.setParams(mConfig.brightness, mConfig.gamma, mConfig.dithering);
  mPipeline.setPixelCount(mConfig.pixelCount);
}


bool FrameSchedulerCore::consumeConfig(MLMicroSeconds aNow)
{
  ConfigUpdatePtr update = mLink.config.take();
  if (!update) return false;
  const LedConfig &c = update->config;
  OLOG(LOG_INFO, "applying config #%llu", (unsigned long long)update->serial);
  mConfigSerial = update->serial;
  mPipeline.setParams(c.brightness, c.gamma, c.dithering);
  bool resized = c.pixelCount!=mConfig.pixelCount;
  bool newPeriod = c.frameRateHz!=mConfig.frameRateHz;
  mConfig = c;
  if (newPeriod) {
    mPeriod = mConfig.framePeriod();
    rebase(aNow, "frame rate changed");
  }
  if (resized) {
    mPipeline.setPixelCount(mConfig.pixelCount);
    mLastGoodRaw.clear();
    if (mSandbox.hasProgram()) {
      ErrorPtr err = mSandbox.reinit(mConfig.pixelCount);
      if (Error::notOK(err)) {
        OLOG(LOG_WARNING, "program unloaded, showing fallback color");
      }
    }
  }
  return resized;
}


void FrameSchedulerCore::consumeProgram()
{
  WasmModulePtr module = mLink.program.take();
  if (!module) return;
  ErrorPtr err = mSandbox.load(module, mConfig.pixelCount);
  if (Error::isOK(err)) {
    mLastGoodRaw.clear();
  }
}


void FrameSchedulerCore::produceFrame()
{
  size_t n = mConfig.pixelCount;
  if (mSandbox.hasProgram()) {
    uint64_t generation = mSandbox.generation();
    uint32_t timeMs = (uint32_t)((deadline(mFrameIndex)-mStartTime)/MilliSecond);
    ErrorPtr err = mSandbox.render(mFrameIndex, timeMs, n, (uint32_t)(mPeriod/MilliSecond), mRaw);
    if (Error::isOK(err)) {
      mSandbox.noteSuccess();
      mLastGoodRaw = mRaw;
      return;
    }
    mFaults++;
    OLOG(LOG_WARNING, "frame %llu failed: %s", (unsigned long long)mFrameIndex, err->text());
    mSandbox.noteFault(generation);
    if (mSandbox.hasProgram()) {
      // keep showing the last good frame, or blank
      if (mLastGoodRaw.size()==n) {
        mRaw = mLastGoodRaw;
      }
      else {
        RawPixel off = { 0, 0, 0 };
        mRaw.assign(n, off);
      }
      return;
    }
    mLastGoodRaw.clear();
  }
  PixelColor fb = mConfig.fallbackPixel();
  RawPixel p = { fb.r, fb.g, fb.b };
  mRaw.assign(n, p);
}


void FrameSchedulerCore::finishFrame(MLMicroSeconds aNow)
{
  mFrameIndex++;
  MLMicroSeconds next = deadline(mFrameIndex);
  if (aNow>next) {
    mOverruns++;
    if (aNow-next>MAX_LAG) {
      rebase(aNow, "lagging behind");
    }
  }
}


void FrameSchedulerCore::rebase(MLMicroSeconds aNow, const char *aReason)
{
  OLOG(LOG_WARNING, "time grid rebased at frame %llu: %s", (unsigned long long)mFrameIndex, aReason);
  mEpoch = aNow;
  mEpochIndex = mFrameIndex;
  mRebases++;
}


void FrameSchedulerCore::publishStatus(bool aDisplayDegraded)
{
  RenderStatus &s = mLink.status;
  s.frames = mFrameIndex;
  s.overruns = mOverruns;
  s.faults = mFaults;
  s.generation = mSandbox.generation();
  s.state = mState;
  s.programActive = mSandbox.hasProgram();
  s.paused = mLink.pauseRequested.load();
  s.displayDegraded = aDisplayDegraded;
}
