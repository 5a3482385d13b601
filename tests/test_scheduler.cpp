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

#include "framescheduler.hpp"
#include "wasmbuilder.hpp"

#include <map>

using namespace lb;
using namespace wasmtest;

/// display recording the frames it gets
class RecordingDisplay
{
public:
  size_t mPixelCount;
  bool mBegun;
  bool mEnded;
  std::vector<FrameBuffer> mFrames;
  std::vector<MLMicroSeconds> mRenderTimes;
  std::map<size_t, MLMicroSeconds> mSlowFrames; ///< frame number -> extra time that frame's write takes
  size_t mStopAfter; ///< terminate the mainloop after this many frames, 0 = never

  RecordingDisplay(size_t aPixelCount) : mPixelCount(aPixelCount), mBegun(false), mEnded(false), mStopAfter(0) {};

  ErrorPtr begin() { mBegun = true; return ErrorPtr(); }

  ErrorPtr render(const FrameBuffer &aFrame)
  {
    mRenderTimes.push_back(MainLoop::now());
    mFrames.push_back(aFrame);
    std::map<size_t, MLMicroSeconds>::iterator pos = mSlowFrames.find(mFrames.size()-1);
    if (pos!=mSlowFrames.end()) MainLoop::sleep(pos->second);
    if (mStopAfter>0 && mFrames.size()==mStopAfter) MainLoop::currentMainLoop().terminate(EXIT_SUCCESS);
    return ErrorPtr();
  }

  size_t pixelCount() const { return mPixelCount; }
  ErrorPtr setPixelCount(size_t aPixelCount) { mPixelCount = aPixelCount; return ErrorPtr(); }
  bool isDegraded() const { return false; }
  void end() { mEnded = true; }

  bool lastIs(size_t aPixelCount, int aR, int aG, int aB) const
  {
    if (mFrames.empty()) return false;
    const FrameBuffer &f = mFrames.back();
    if (f.size()!=aPixelCount) return false;
    for (size_t i=0; i<f.size(); i++) {
      if (f[i].r!=aR || f[i].g!=aG || f[i].b!=aB) return false;
    }
    return true;
  }
};


class SchedulerFixture {

public:

  RenderLink mLink;
  RecordingDisplay mDisplay;
  LedConfig mConfig;
  FrameScheduler<RecordingDisplay> *mSchedulerP;
  int mStoppedCount;
  WasmModulePtr mNextProgram;

  SchedulerFixture() : mDisplay(8), mSchedulerP(NULL), mStoppedCount(0)
  {
    mConfig.pixelCount = 8;
    mConfig.gamma = 1;
    mConfig.dithering = false;
    mConfig.fallbackColor = "#201000";
  };

  ~SchedulerFixture()
  {
    delete mSchedulerP;
  };

  FrameScheduler<RecordingDisplay> &scheduler()
  {
    if (!mSchedulerP) {
      mSchedulerP = new FrameScheduler<RecordingDisplay>(mLink, mDisplay, mConfig);
      mSchedulerP->setStoppedHandler(boost::bind(&SchedulerFixture::stopped, this));
    }
    return *mSchedulerP;
  }

  void stopped() { mStoppedCount++; }

  void publishProgram(const string &aBinary)
  {
    WasmModulePtr m;
    ErrorPtr err = ProgramSandbox::compile(aBinary, SandboxParams(), m);
    REQUIRE(Error::isOK(err));
    mLink.program.publish(m);
  }

  void publishConfig(const LedConfig &aConfig, uint64_t aSerial)
  {
    ConfigUpdatePtr u = new ConfigUpdate(aConfig, aSerial);
    mLink.config.publish(u);
  }

  void swapProgram() { mLink.program.publish(mNextProgram); }

  void ticks(int aCount)
  {
    for (int i=0; i<aCount; i++) scheduler().tick();
  }

  /// start ticking from the mainloop until the display has seen aFrames frames
  int runFrames(size_t aFrames)
  {
    MainLoop &ml = MainLoop::currentMainLoop();
    mDisplay.mStopAfter = aFrames;
    MLTicket timeout;
    timeout.executeOnce(boost::bind(&MainLoop::terminate, &ml, EXIT_FAILURE), 10*Second);
    scheduler().start();
    return ml.run(true);
  }

  /// @return how late frame aIndex was written relative to its grid deadline
  MLMicroSeconds lateness(size_t aIndex)
  {
    return mDisplay.mRenderTimes[aIndex]-scheduler().deadline(aIndex);
  }

};


TEST_CASE_METHOD(SchedulerFixture, "fallback color without program", "[scheduler]") {
  REQUIRE(Error::isOK(scheduler().start()));
  REQUIRE(mDisplay.mBegun);
  ticks(2);
  REQUIRE(mDisplay.mFrames.size() == 2);
  REQUIRE(mDisplay.lastIs(8, 0x20, 0x10, 0x00));
  REQUIRE(scheduler().frameIndex() == 2);
  REQUIRE(mLink.status.frames == 2);
  REQUIRE(string(mLink.status.playStatus()) == "NotPlaying");
}

TEST_CASE_METHOD(SchedulerFixture, "program output reaches the display", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(255, 0, 0));
  ticks(1);
  REQUIRE(mDisplay.lastIs(8, 255, 0, 0));
  REQUIRE(mLink.status.generation == 1);
  REQUIRE(mLink.status.programActive);
  SECTION("brightness applies") {
    LedConfig c = mConfig;
    c.brightness = 0.5;
    publishConfig(c, 1);
    ticks(1);
    REQUIRE(mDisplay.lastIs(8, 128, 0, 0));
  }
  SECTION("a new program replaces the old one") {
    publishProgram(solidProgram(0, 0, 255));
    ticks(1);
    REQUIRE(mDisplay.lastIs(8, 0, 0, 255));
    REQUIRE(mLink.status.generation == 2);
  }
}

TEST_CASE_METHOD(SchedulerFixture, "a faulting frame keeps the last good frame", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(0, 255, 0, trapOnCall(2), true));
  ticks(3);
  REQUIRE(mDisplay.mFrames.size() == 3);
  REQUIRE(scheduler().faults() == 1);
  REQUIRE(scheduler().frameIndex() == 3);
  // the failed frame repeats the previous one
  const FrameBuffer &f = mDisplay.mFrames[1];
  REQUIRE(f[0].g == 255);
  REQUIRE(mDisplay.lastIs(8, 0, 255, 0));
  REQUIRE(scheduler().sandbox().hasProgram());
}

TEST_CASE_METHOD(SchedulerFixture, "repeated faults fall back", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(0, 255, 0, trapFromCall(1), true));
  ticks(4);
  REQUIRE(scheduler().sandbox().hasProgram());
  // no good frame yet, failed frames are blank
  REQUIRE(mDisplay.lastIs(8, 0, 0, 0));
  ticks(1);
  REQUIRE_FALSE(scheduler().sandbox().hasProgram());
  REQUIRE(scheduler().faults() == 5);
  REQUIRE(mDisplay.lastIs(8, 0x20, 0x10, 0x00));
  ticks(1);
  REQUIRE(scheduler().faults() == 5);
  REQUIRE(scheduler().frameIndex() == 6);
  REQUIRE_FALSE(mLink.status.programActive);
}

TEST_CASE_METHOD(SchedulerFixture, "config updates", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(10, 20, 30));
  ticks(1);
  uint64_t gen = scheduler().sandbox().generation();
  SECTION("resize reinitializes the program") {
    LedConfig c = mConfig;
    c.pixelCount = 5;
    publishConfig(c, 1);
    ticks(1);
    REQUIRE(mDisplay.mPixelCount == 5);
    REQUIRE(mDisplay.lastIs(5, 10, 20, 30));
    REQUIRE(scheduler().sandbox().generation() == gen);
    REQUIRE(scheduler().config().pixelCount == 5);
  }
  SECTION("only the latest pending update applies") {
    LedConfig c1 = mConfig;
    c1.brightness = 0.1;
    c1.pixelCount = 3;
    LedConfig c2 = mConfig;
    c2.brightness = 1;
    c2.pixelCount = 4;
    publishConfig(c1, 1);
    publishConfig(c2, 2);
    ticks(1);
    REQUIRE(mDisplay.lastIs(4, 10, 20, 30));
  }
  SECTION("frame rate change keeps running") {
    LedConfig c = mConfig;
    c.frameRateHz = 50;
    publishConfig(c, 1);
    ticks(1);
    REQUIRE(scheduler().period() == 20*MilliSecond);
    REQUIRE(scheduler().rebases() == 1);
    REQUIRE(mDisplay.lastIs(8, 10, 20, 30));
  }
}

TEST_CASE_METHOD(SchedulerFixture, "frame grid is kept across program swaps", "[scheduler]") {
  mConfig.frameRateHz = 10;
  scheduler().start();
  MLMicroSeconds d0 = scheduler().deadline(0);
  publishProgram(solidProgram(1, 1, 1));
  ticks(2);
  publishProgram(solidProgram(2, 2, 2));
  ticks(1);
  REQUIRE(scheduler().frameIndex() == 3);
  REQUIRE(scheduler().rebases() == 0);
  REQUIRE(scheduler().deadline(3) == d0+3*100*MilliSecond);
}

TEST_CASE_METHOD(SchedulerFixture, "pause", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(50, 50, 50));
  ticks(1);
  mLink.pauseRequested = true;
  ticks(3);
  REQUIRE(mDisplay.mFrames.size() == 1);
  REQUIRE(mLink.status.paused);
  REQUIRE(string(mLink.status.playStatus()) == "Paused");
  mLink.pauseRequested = false;
  ticks(1);
  REQUIRE(mDisplay.mFrames.size() == 2);
  REQUIRE(scheduler().frameIndex() == 5);
}

TEST_CASE_METHOD(SchedulerFixture, "drain writes one all-off frame and stops", "[scheduler]") {
  scheduler().start();
  publishProgram(solidProgram(200, 100, 50));
  ticks(2);
  mLink.drainRequested = true;
  ticks(1);
  REQUIRE(mDisplay.mFrames.size() == 3);
  REQUIRE(mDisplay.lastIs(8, 0, 0, 0));
  REQUIRE(mDisplay.mEnded);
  REQUIRE(scheduler().state() == scheduler_stopped);
  REQUIRE(mLink.status.state == scheduler_stopped);
  REQUIRE(mStoppedCount == 1);
  ticks(2);
  scheduler().drain();
  REQUIRE(mDisplay.mFrames.size() == 3);
  REQUIRE(mStoppedCount == 1);
}


// MARK: - running from the mainloop

TEST_CASE_METHOD(SchedulerFixture, "ticks follow the frame grid", "[scheduler]") {
  mConfig.frameRateHz = 50;
  publishProgram(solidProgram(3, 3, 3));
  REQUIRE(runFrames(10) == EXIT_SUCCESS);
  REQUIRE(scheduler().frameIndex() == 10);
  for (size_t i=0; i<10; i++) {
    INFO("frame " << i);
    REQUIRE(lateness(i) >= 0);
  }
  REQUIRE(mDisplay.mRenderTimes[9]-mDisplay.mRenderTimes[0] >= 9*20*MilliSecond);
}

TEST_CASE_METHOD(SchedulerFixture, "a slow frame is caught up without skipping frames", "[scheduler]") {
  mConfig.frameRateHz = 50;
  mDisplay.mSlowFrames[2] = 50*MilliSecond;
  REQUIRE(runFrames(12) == EXIT_SUCCESS);
  REQUIRE(scheduler().overruns() >= 1);
  REQUIRE(scheduler().rebases() == 0);
  REQUIRE(scheduler().frameIndex() == 12);
  REQUIRE(mLink.status.overruns == scheduler().overruns());
  // the frame after the slow one starts right away, late on the grid
  REQUIRE(lateness(3) > 0);
  REQUIRE(mDisplay.mRenderTimes[3]-mDisplay.mRenderTimes[2] >= 50*MilliSecond);
  REQUIRE(mDisplay.mRenderTimes[3]-mDisplay.mRenderTimes[2] < 70*MilliSecond);
  // later frames are back on the unchanged grid
  REQUIRE(scheduler().deadline(11)-scheduler().deadline(0) == 11*20*MilliSecond);
  REQUIRE(mDisplay.mRenderTimes[11] >= scheduler().deadline(11));
}

TEST_CASE_METHOD(SchedulerFixture, "a stall longer than a second rebases the grid", "[scheduler]") {
  mConfig.frameRateHz = 50;
  mDisplay.mSlowFrames[1] = 1200*MilliSecond;
  REQUIRE(runFrames(6) == EXIT_SUCCESS);
  REQUIRE(scheduler().rebases() == 1);
  REQUIRE(scheduler().overruns() == 1);
  REQUIRE(scheduler().frameIndex() == 6);
  // no burst of catch-up frames after the stall
  REQUIRE(mDisplay.mRenderTimes[5]-mDisplay.mRenderTimes[2] >= 3*20*MilliSecond);
  for (size_t i=2; i<6; i++) {
    INFO("frame " << i);
    REQUIRE(lateness(i) >= 0);
  }
}

TEST_CASE_METHOD(SchedulerFixture, "tick intervals are kept across a program swap", "[scheduler]") {
  mConfig.frameRateHz = 50;
  publishProgram(solidProgram(1, 0, 0));
  REQUIRE(Error::isOK(ProgramSandbox::compile(solidProgram(0, 0, 1), SandboxParams(), mNextProgram)));
  MLTicket swap;
  swap.executeOnce(boost::bind(&SchedulerFixture::swapProgram, this), 90*MilliSecond);
  REQUIRE(runFrames(10) == EXIT_SUCCESS);
  REQUIRE(mDisplay.mFrames[0][0].r == 1);
  REQUIRE(mDisplay.lastIs(8, 0, 0, 1));
  REQUIRE(mLink.status.generation == 2);
  REQUIRE(scheduler().rebases() == 0);
  for (size_t i=0; i<10; i++) {
    INFO("frame " << i);
    REQUIRE(lateness(i) >= 0);
  }
  REQUIRE(scheduler().deadline(9)-scheduler().deadline(0) == 9*20*MilliSecond);
}
