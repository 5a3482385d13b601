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

#include "application.hpp"
#include "ledconfig.hpp"
#include "renderlink.hpp"
#include "framescheduler.hpp"
#include "controlchannel.hpp"
#include "hardwaredisplay.hpp"
#include "terminaldisplay.hpp"
#include "websocket.hpp"

#include <unistd.h>

using namespace lb;

#define DEFAULT_CONFIG_FILE "/etc/ledbetter.json"


class LedBetterD : public CmdLineApp
{
  typedef CmdLineApp inherited;

  DaemonConfig mConfig;
  RenderLink mLink;
  ChildThreadWrapperPtr mRenderThread;
  ControlChannelPtr mControl;

  bool mShuttingDown;
  bool mRenderStopped;
  bool mControlClosed;
  MLTicket mShutdownTicket;

public:

  LedBetterD() :
    mShuttingDown(false),
    mRenderStopped(false),
    mControlClosed(false)
  {
  }

  virtual int main(int argc, char **argv)
  {
    const char *usageText =
      "Usage: %1$s [options]\n";
    const CmdLineOptionDescriptor options[] = {
      { 'c', "config",        true,  "file;JSON configuration file, default is " DEFAULT_CONFIG_FILE },
      { 0,   "name",          true,  "name;device name reported to the controller" },
      { 0,   "host",          true,  "host;controller host name or address" },
      { 0,   "port",          true,  "port;controller port" },
      { 't', "terminal",      false, "render to the terminal instead of the LED hardware" },
      { 'n', "pixels",        true,  "count;number of pixels" },
      DAEMON_APPLICATION_LOGOPTIONS,
      CMDLINE_APPLICATION_STDOPTIONS,
      { 0, NULL } // list terminator
    };

    // parse the command line, exits when syntax errors occur
    setCommandDescriptors(usageText, options);
    if (parseCommandLine(argc, argv)) {
      if (numArguments()>0) {
        // no non-option arguments
        showUsage();
        terminateApp(EXIT_FAILURE);
      }
      else {
        processStandardLogOptions(true);
        ErrorPtr err = configure();
        if (Error::notOK(err)) {
          terminateAppWith(err->withPrefix("invalid configuration: "));
        }
        else if (mConfig.displayOwnsStdout()) {
          // frames go to stdout, all log lines must go to stderr
          SETERRLEVEL(LOG_DEBUG, false);
        }
      }
    }
    // app now ready to run
    return run();
  }

  virtual void initialize() LB_OVERRIDE
  {
    LOG(LOG_NOTICE, "ledbetter %s starting as '%s', %d pixels on %s display",
      version().c_str(), mConfig.name.c_str(), mConfig.led.pixelCount, displayModeName(mConfig.led.displayMode)
    );
    mRenderThread = mainLoop().executeInThread(
      boost::bind(&LedBetterD::renderThread, this, _1),
      boost::bind(&LedBetterD::renderThreadSignal, this, _1, _2)
    );
    ControlTransportPtr transport;
    #if ENABLE_UWSC && MAINLOOP_LIBEV_BASED
    transport = ControlTransportPtr(new WebSocketClient());
    #endif
    if (!transport) {
      LOG(LOG_WARNING, "built without websocket support, running without controller");
      mControlClosed = true;
      return;
    }
    mControl = ControlChannelPtr(new ControlChannel(transport, mLink, mConfig, version()));
    mControl->start();
  }

  virtual void signalOccurred(int aSignal) LB_OVERRIDE
  {
    if (aSignal==SIGUSR1) {
      LOG(LOG_NOTICE, "render status: %s, %s, %llu frames, %llu overruns, %llu faults, program generation %llu",
        schedulerStateName((SchedulerState)mLink.status.state.load()),
        mLink.status.playStatus(),
        (unsigned long long)mLink.status.frames.load(),
        (unsigned long long)mLink.status.overruns.load(),
        (unsigned long long)mLink.status.faults.load(),
        (unsigned long long)mLink.status.generation.load()
      );
      inherited::signalOccurred(aSignal);
      return;
    }
    if (mShuttingDown) {
      LOG(LOG_ERR, "signal %d during shutdown, exiting immediately", aSignal);
      terminateApp(EXIT_FAILURE);
      return;
    }
    LOG(LOG_NOTICE, "signal %d, shutting down", aSignal);
    shutdown();
  }

  virtual void cleanup(int aExitCode) LB_OVERRIDE
  {
    mShutdownTicket.cancel();
    if (mControl) {
      mControl.reset();
    }
    if (mRenderThread) {
      // forced exit: the render thread did not finish in time and may be stuck anywhere,
      // joining it could block forever
      LOG(LOG_ERR, "render thread still running, exiting with code %d without waiting for it", EXIT_FAILURE);
      _exit(EXIT_FAILURE);
    }
    LOG(LOG_NOTICE, "exiting with code %d", aExitCode);
  }

private:

  ErrorPtr configure()
  {
    string path = DEFAULT_CONFIG_FILE;
    bool explicitConfig = getStringOption("config", path);
    if (explicitConfig || access(path.c_str(), R_OK)==0) {
      ErrorPtr err = mConfig.loadFromFile(path.c_str());
      if (Error::notOK(err)) return err;
    }
    getStringOption("name", mConfig.name);
    getStringOption("host", mConfig.controllerHost);
    int i;
    ErrorPtr err;
    if (getIntOption("port", i)) {
      if (Error::notOK(err = mConfig.setControllerPort(i))) return err;
    }
    if (getIntOption("pixels", i)) {
      if (Error::notOK(err = mConfig.setPixelCount(i))) return err;
    }
    if (getOption("terminal")) {
      mConfig.led.displayMode = display_terminal;
    }
    if (Error::notOK(err = mConfig.validate())) return err;
    if (mConfig.led.displayMode==display_hardware) {
      HardwareDisplay ledCheck(mConfig.ledType, mConfig.device, mConfig.led.pixelCount);
      if (!ledCheck.knownLedType()) {
        return Error::err<ConfigError>(ConfigError::Invalid, "unknown led_type '%s'", mConfig.ledType.c_str());
      }
    }
    return ErrorPtr();
  }

  // MARK: - render thread

  void renderThread(ChildThreadWrapper &aThread)
  {
    MainLoop &ml = aThread.threadMainLoop();
    if (mConfig.led.displayMode==display_terminal) {
      TerminalDisplay display(mConfig.terminalFd, mConfig.led.pixelCount);
      runScheduler(display, ml);
    }
    else {
      HardwareDisplay display(mConfig.ledType, mConfig.device, mConfig.led.pixelCount, mConfig.maxRetries, mConfig.writeBudget);
      runScheduler(display, ml);
    }
  }

  template<class DisplayT> void runScheduler(DisplayT &aDisplay, MainLoop &aMainLoop)
  {
    FrameScheduler<DisplayT> scheduler(mLink, aDisplay, mConfig.led, mConfig.sandbox);
    scheduler.setStoppedHandler(boost::bind(&MainLoop::terminate, &aMainLoop, EXIT_SUCCESS));
    ErrorPtr err = scheduler.start();
    if (Error::notOK(err)) {
      LOG(LOG_WARNING, "rendering continues without working display: %s", err->text());
    }
    aMainLoop.run();
  }

  // called on the main thread
  void renderThreadSignal(ChildThreadWrapper &aChildThread, ThreadSignals aSignalCode)
  {
    if (aSignalCode==threadSignalCompleted || aSignalCode==threadSignalFailedToStart || aSignalCode==threadSignalCancelled) {
      mRenderThread.reset();
      mRenderStopped = true;
      if (!mShuttingDown) {
        LOG(LOG_ERR, "render thread ended unexpectedly (signal %d)", (int)aSignalCode);
        terminateApp(EXIT_FAILURE);
        return;
      }
      LOG(LOG_INFO, "render thread finished");
      checkShutdownComplete();
    }
  }

  // MARK: - shutdown

  void shutdown()
  {
    mShuttingDown = true;
    mShutdownTicket.executeOnce(boost::bind(&LedBetterD::shutdownTimedOut, this), mConfig.shutdownBudget);
    mLink.drainRequested = true;
    if (mControl) {
      mControl->close(boost::bind(&LedBetterD::controlClosed, this));
    }
    checkShutdownComplete();
  }

  void controlClosed()
  {
    LOG(LOG_INFO, "controller connection closed");
    mControlClosed = true;
    checkShutdownComplete();
  }

  void checkShutdownComplete()
  {
    if (mRenderStopped && mControlClosed) {
      mShutdownTicket.cancel();
      LOG(LOG_NOTICE, "shutdown complete");
      terminateApp(EXIT_SUCCESS);
    }
  }

  void shutdownTimedOut()
  {
    LOG(LOG_ERR, "shutdown did not complete within %.1f seconds (render %s, controller %s), forcing exit",
      (double)mConfig.shutdownBudget/Second,
      mRenderStopped ? "stopped" : "still running",
      mControlClosed ? "closed" : "still open"
    );
    terminateApp(EXIT_FAILURE);
  }

};


int main(int argc, char **argv)
{
  // prevent debug output before application.main scans command line
  SETLOGLEVEL(LOG_EMERG);
  SETERRLEVEL(LOG_EMERG, false); // messages, if any, go to stderr
  // create app with current mainloop
  LedBetterD *application = new(LedBetterD);
  // pass control
  int status = application->main(argc, argv);
  // done
  delete application;
  return status;
}
