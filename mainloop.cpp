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

#include "mainloop.hpp"

#include <unistd.h>
#include <sys/param.h>
#include <math.h>


// MARK: - MainLoop default parameters

#define MAINLOOP_DEFAULT_MAXSLEEP Infinite // if really nothing to do, we can sleep
#define MAINLOOP_DEFAULT_MAXRUN (100*MilliSecond) // noticeable reaction time
#define MAINLOOP_DEFAULT_THROTTLE_SLEEP (2*MilliSecond) // frame timing must not suffer from throttling
#define MAINLOOP_DEFAULT_MAX_COALESCING (1*Second) // keep timing within second precision by default

using namespace lb;


// MARK: - MLTicket

MLTicket::MLTicket() :
  mTicketNo(0)
{
}


MLTicket::MLTicket(MLTicket &aTicket) : mTicketNo(0)
{
  // must not be used, ticket numbers are never copied
}


MLTicket::~MLTicket()
{
  cancel();
}


MLTicket::operator MLTicketNo() const
{
  return mTicketNo;
}


MLTicket::operator bool() const
{
  return mTicketNo!=0;
}


bool MLTicket::cancel()
{
  if (mTicketNo!=0) {
    bool cancelled = MainLoop::currentMainLoop().cancelExecutionTicket(mTicketNo);
    mTicketNo = 0;
    return cancelled;
  }
  return false; // no ticket
}


void MLTicket::executeOnceAt(TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance)
{
  MainLoop::currentMainLoop().executeTicketOnceAt(*this, aTimerCallback, aExecutionTime, aTolerance);
}


void MLTicket::executeOnce(TimerCB aTimerCallback, MLMicroSeconds aDelay, MLMicroSeconds aTolerance)
{
  MainLoop::currentMainLoop().executeTicketOnce(*this, aTimerCallback, aDelay, aTolerance);
}


MLTicketNo MLTicket::operator=(MLTicketNo aTicketNo)
{
  cancel();
  mTicketNo = aTicketNo;
  return mTicketNo;
}


// MARK: - Time base

long long _lb_now()
{
  struct timespec tsp;
  clock_gettime(CLOCK_MONOTONIC, &tsp);
  return ((long long)(tsp.tv_sec))*1000000ll + (long long)(tsp.tv_nsec/1000); // uS
}


// MARK: - MainLoop static utilities

MLMicroSeconds MainLoop::now()
{
  return _lb_now();
}


MLMicroSeconds MainLoop::unixtime()
{
  struct timespec tsp;
  clock_gettime(CLOCK_REALTIME, &tsp);
  return ((long long)(tsp.tv_sec))*1000000ll + (long long)(tsp.tv_nsec/1000); // uS
}


string MainLoop::string_mltime(MLMicroSeconds aTime)
{
  if (aTime==Infinite) return "Infinite";
  if (aTime==Never) return "Never";
  time_t t = (aTime-now()+unixtime())/Second;
  struct tm tim;
  localtime_r(&t, &tim);
  return string_ftime("%Y-%m-%d %H:%M:%S", &tim);
}


void MainLoop::sleep(MLMicroSeconds aSleepTime)
{
  timespec sleeptime;
  sleeptime.tv_sec=aSleepTime/Second;
  sleeptime.tv_nsec=(long)((aSleepTime % Second)*1000ll); // nS = 1000 uS
  nanosleep(&sleeptime,NULL);
}


// the current thread's main looop
static __thread MainLoop *currentMainLoopP = NULL;

// get the per-thread singleton mainloop
MainLoop &MainLoop::currentMainLoop()
{
  if (currentMainLoopP==NULL) {
    currentMainLoopP = new MainLoop();
  }
  return *currentMainLoopP;
}


#if MAINLOOP_STATISTICS
  #define ML_STAT_START_AT(nw) MLMicroSeconds t = (nw);
  #define ML_STAT_ADD_AT(tmr, nw) tmr += (nw)-t;
  #define ML_STAT_START ML_STAT_START_AT(now());
  #define ML_STAT_ADD(tmr) ML_STAT_ADD_AT(tmr, now());
#else
  #define ML_STAT_START_AT(now)
  #define ML_STAT_ADD_AT(tmr, nw);
  #define ML_STAT_START
  #define ML_STAT_ADD(tmr)
#endif


// MARK: - MainLoop

#if MAINLOOP_LIBEV_BASED

namespace lb {
  void libev_io_poll_handler(EV_P_ struct ev_io *i, int revents); // declaration to silence warning
  void libev_sleep_timer_done(EV_P_ struct ev_timer *t, int revents); // declaration to silence warning
}


void lb::libev_sleep_timer_done(EV_P_ struct ev_timer *t, int revents)
{
  MainLoop* mlP = static_cast<MainLoop*>(t->data);
  ev_timer_stop(mlP->mLibEvLoopP, t);
  // NOP, just needed to exit IO polling
  FOCUSLOG("libev IO polling timeout");
}

static bool gDefaultMainloopInUse = false;

#endif // MAINLOOP_LIBEV_BASED


MainLoop::MainLoop() :
  mTimersChanged(false),
  mTicketNo(0),
  mTerminated(false),
  mExitCode(EXIT_SUCCESS)
{
  #if MAINLOOP_LIBEV_BASED
  if (gDefaultMainloopInUse) {
    // this must be a subthread's mainloop, must create a new libev mainloop for it
    mLibEvLoopP = ev_loop_new(EVFLAG_AUTO);
  }
  else {
    // this is the main main loop
    gDefaultMainloopInUse = true;
    mLibEvLoopP = EV_DEFAULT;
  }
  // timer we need when we allow libev to "sleep"
  ev_timer_init(&mLibEvTimer, &libev_sleep_timer_done, 1, 0);
  mLibEvTimer.data = this;
  #endif
  // default configuration
  mMaxSleep = MAINLOOP_DEFAULT_MAXSLEEP;
  mMaxRun = MAINLOOP_DEFAULT_MAXRUN;
  mThrottleSleep = MAINLOOP_DEFAULT_THROTTLE_SLEEP;
  mMaxCoalescing = MAINLOOP_DEFAULT_MAX_COALESCING;
  #if MAINLOOP_STATISTICS
  statistics_reset();
  #endif
}


MainLoop::~MainLoop()
{
  mTimers.clear();
  mIoPollHandlers.clear();
  #if MAINLOOP_LIBEV_BASED
  if (mLibEvLoopP && !ev_is_default_loop(mLibEvLoopP)) {
    ev_loop_destroy(mLibEvLoopP);
  }
  mLibEvLoopP = NULL;
  #endif
  if (currentMainLoopP==this) currentMainLoopP = NULL;
}


// MARK: timer setup

// private implementation
MLTicketNo MainLoop::executeOnce(TimerCB aTimerCallback, MLMicroSeconds aDelay, MLMicroSeconds aTolerance)
{
  return executeOnceAt(aTimerCallback, now()+aDelay, aTolerance);
}


// private implementation
MLTicketNo MainLoop::executeOnceAt(TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance)
{
  MLTimer tmr;
  tmr.mTicketNo = ++mTicketNo;
  tmr.mExecutionTime = aExecutionTime;
  tmr.mTolerance = aTolerance;
  tmr.mCallback = aTimerCallback;
  scheduleTimer(tmr);
  return tmr.mTicketNo;
}


void MainLoop::executeTicketOnceAt(MLTicket &aTicket, TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance)
{
  aTicket.cancel();
  aTicket = (MLTicketNo)executeOnceAt(aTimerCallback, aExecutionTime, aTolerance);
}


void MainLoop::executeTicketOnce(MLTicket &aTicket, TimerCB aTimerCallback, MLMicroSeconds aDelay, MLMicroSeconds aTolerance)
{
  aTicket.cancel();
  aTicket = executeOnce(aTimerCallback, aDelay, aTolerance);
}


void MainLoop::executeNow(TimerCB aTimerCallback)
{
  executeOnce(aTimerCallback, 0, 0);
}


void MainLoop::scheduleTimer(MLTimer &aTimer)
{
  #if MAINLOOP_STATISTICS
  size_t n = mTimers.size()+1;
  if (n>mMaxTimers) mMaxTimers = n;
  #endif
  // insert in queue before first item that has a higher execution time
  TimerList::iterator pos = mTimers.begin();
  if (pos!=mTimers.end()) {
    // if new timer is later than all others, just append
    if (aTimer.mExecutionTime<mTimers.back().mExecutionTime) {
      do {
        if (pos->mExecutionTime>aTimer.mExecutionTime) {
          mTimers.insert(pos, aTimer);
          mTimersChanged = true;
          return;
        }
        ++pos;
      } while (pos!=mTimers.end());
    }
  }
  // processing iterator might be at end of list already, list must be re-checked
  mTimersChanged = true;
  mTimers.push_back(aTimer);
}


// private implementation
bool MainLoop::cancelExecutionTicket(MLTicketNo aTicketNo)
{
  if (aTicketNo==0) return false; // no ticket, NOP
  for (TimerList::iterator pos = mTimers.begin(); pos!=mTimers.end(); ++pos) {
    if (pos->mTicketNo==aTicketNo) {
      mTimers.erase(pos);
      mTimersChanged = true;
      return true; // ticket found and cancelled
    }
  }
  return false; // no such ticket
}


// MARK: mainloop core

void MainLoop::terminate(int aExitCode)
{
  mExitCode = aExitCode;
  mTerminated = true;
}


MLMicroSeconds MainLoop::checkTimers(MLMicroSeconds aTimeout)
{
  ML_STAT_START
  MLMicroSeconds nextTimer = Never;
  MLMicroSeconds runUntilMax = MainLoop::now() + aTimeout;
  do {
    nextTimer = Never;
    TimerList::iterator pos = mTimers.begin();
    mTimersChanged = false; // detect changes happening from callbacks
    // Note: mTimersChanged must be checked in the loop condition, because the runningTimer object going
    //   out of scope can cause a chain of destruction which in turn changes timers AFTER the callback has returned.
    while (!mTimersChanged && pos!=mTimers.end()) {
      nextTimer = pos->mExecutionTime;
      MLMicroSeconds now = MainLoop::now();
      MLMicroSeconds tl = pos->mTolerance;
      if (tl>mMaxCoalescing) tl=mMaxCoalescing;
      if (nextTimer-tl>now) {
        // next timer not ready to run
        goto done;
      }
      else if (now>runUntilMax) {
        // we are running too long already
        #if MAINLOOP_STATISTICS
        mTimesTimersRanToLong++;
        #endif
        goto done;
      }
      else {
        if (mTerminated) {
          nextTimer = Never; // no more timers to run if terminated
          goto done;
        }
        #if MAINLOOP_STATISTICS
        MLMicroSeconds late = now-nextTimer-pos->mTolerance;
        if (late>mMaxTimerExecutionDelay) mMaxTimerExecutionDelay = late;
        #endif
        // run this timer
        MLTimer runningTimer = *pos; // copy the timer object
        pos = mTimers.erase(pos); // remove timer from queue
        runningTimer.mCallback(runningTimer, now); // call handler
      }
    }
  } while (mTimersChanged);
done:
  ML_STAT_ADD(mTimedHandlerTime);
  return nextTimer; // report to caller when we need to be called again to meet next timer
}


// MARK: - IO event handling

#if MAINLOOP_LIBEV_BASED

static inline int pollToEv(int aPollFlags)
{
  int events = 0;
  if (aPollFlags & POLLIN) events |= EV_READ;
  if (aPollFlags & POLLOUT) events |= EV_WRITE;
  return events;
}


static inline int evToPoll(int aLibEvEvents)
{
  int pollFlags = 0;
  if (aLibEvEvents & EV_READ) pollFlags |= POLLIN;
  if (aLibEvEvents & EV_WRITE) pollFlags |= POLLOUT;
  return pollFlags;
}


void lb::libev_io_poll_handler(EV_P_ struct ev_io *i, int revents)
{
  MainLoop::IOPollHandler *h = (MainLoop::IOPollHandler*)((char *)i-offsetof(MainLoop::IOPollHandler, mIoWatcher));
  h->mPollHandler(i->fd, evToPoll(revents));
}


MainLoop::IOPollHandler::IOPollHandler()
{
  ev_io_init(&mIoWatcher, libev_io_poll_handler, 0, 0);
  mIoWatcher.data = NULL; // not yet installed
}


void MainLoop::IOPollHandler::deactivate()
{
  if (mIoWatcher.data) {
    // only if data is set, the handler is actually installed and must remove the watcher from libev
    MainLoop* mlP = static_cast<MainLoop*>(mIoWatcher.data);
    ev_io_stop(mlP->mLibEvLoopP, &mIoWatcher);
    mIoWatcher.data = NULL;
  }
}


MainLoop::IOPollHandler::~IOPollHandler()
{
  deactivate();
}


MainLoop::IOPollHandler& MainLoop::IOPollHandler::operator= (MainLoop::IOPollHandler& aReplacing)
{
  deactivate();
  mIoWatcher = aReplacing.mIoWatcher;
  mPollHandler = aReplacing.mPollHandler;
  return *this;
}

#endif // MAINLOOP_LIBEV_BASED


void MainLoop::registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler)
{
  if (aPollEventHandler.empty()) {
    unregisterPollHandler(aFD); // no handler means unregistering handler
    return;
  }
  #if MAINLOOP_LIBEV_BASED
  if (aPollFlags & ~(POLLIN|POLLOUT)) {
    LOG(LOG_WARNING, "registerPollHandler: libev based mainloop can only monitor POLLIN/POLLOUT on fd %d", aFD);
    aPollFlags &= (POLLIN|POLLOUT);
  }
  IOPollHandler h;
  h.mPollHandler = aPollEventHandler;
  mIoPollHandlers[aFD] = h; // copies h
  ev_io* w = &(mIoPollHandlers[aFD].mIoWatcher);
  w->data = this; // only now the watcher is considered active (and stopped when destructed)
  ev_io_set(w, aFD, pollToEv(aPollFlags));
  ev_io_start(mLibEvLoopP, w);
  #else
  IOPollHandler h;
  h.monitoredFD = aFD;
  h.pollFlags = aPollFlags;
  h.pollHandler = aPollEventHandler;
  mIoPollHandlers[aFD] = h;
  #endif
}


void MainLoop::unregisterPollHandler(int aFD)
{
  mIoPollHandlers.erase(aFD);
}


void MainLoop::handleIOPoll(MLMicroSeconds aTimeout)
{
  #if MAINLOOP_LIBEV_BASED
  if (aTimeout==0) {
    // just check
    ev_run(mLibEvLoopP, EVRUN_NOWAIT);
  }
  else if (aTimeout>0) {
    // pass control for specified time
    ev_timer_set(&mLibEvTimer, (double)aTimeout/Second, 0.);
    ev_timer_start(mLibEvLoopP, &mLibEvTimer);
    ev_run(mLibEvLoopP, EVRUN_ONCE);
    ev_timer_stop(mLibEvLoopP, &mLibEvTimer);
  }
  else {
    // no timers, just FDs -> run until one event has occurred
    if (!ev_run(mLibEvLoopP, EVRUN_ONCE)) {
      // a libev callback might have scheduled a new timer, check that before declaring the loop dead
      if (mTimers.empty()) {
        LOG(LOG_WARNING, "Probably dead - no candidates any more for generating mainloop events (except signals)");
        sleep(10*Second);
      }
    }
  }
  #else
  // use poll() - create poll structure
  struct pollfd *pollFds = NULL;
  size_t maxFDsToTest = mIoPollHandlers.size();
  if (maxFDsToTest>0) {
    pollFds = new struct pollfd[maxFDsToTest];
  }
  IOPollHandlerMap::iterator pos = mIoPollHandlers.begin();
  size_t numFDsToTest = 0;
  while (pos!=mIoPollHandlers.end()) {
    IOPollHandler &h = pos->second;
    if (h.pollFlags) {
      // don't include handlers that are currently disabled (no flags set)
      struct pollfd *pollfdP = &pollFds[numFDsToTest];
      pollfdP->fd = h.monitoredFD;
      pollfdP->events = h.pollFlags;
      pollfdP->revents = 0;
      ++numFDsToTest;
    }
    ++pos;
  }
  // block until input becomes available or timeout
  int numReadyFDs = 0;
  if (numFDsToTest>0) {
    // round up to full milliseconds, waking up early makes the loop spin
    int timeoutMs = aTimeout==Infinite ? -1 : (int)((aTimeout+MilliSecond-1)/MilliSecond);
    numReadyFDs = poll(pollFds, (int)numFDsToTest, timeoutMs);
  }
  else if (aTimeout>0) {
    // nothing to test, just await timeout
    MainLoop::sleep(aTimeout);
  }
  if (numReadyFDs>0) {
    for (size_t i = 0; i<numFDsToTest; i++) {
      struct pollfd *pollfdP = &pollFds[i];
      if (pollfdP->revents) {
        ML_STAT_START
        // handler might have been deleted in the meantime
        IOPollHandlerMap::iterator hpos = mIoPollHandlers.find(pollfdP->fd);
        if (hpos!=mIoPollHandlers.end()) {
          IOPollCB cb = hpos->second.pollHandler; // copy, handler might unregister itself
          cb(pollfdP->fd, pollfdP->revents);
        }
        ML_STAT_ADD(mIoHandlerTime);
      }
    }
  }
  delete[] pollFds;
  #endif
}


void MainLoop::startupMainLoop(bool aRestart)
{
  if (aRestart) mTerminated = false;
}


bool MainLoop::mainLoopCycle()
{
  MLMicroSeconds cycleStarted = MainLoop::now();
  while (!mTerminated) {
    // run timers
    MLMicroSeconds nextWake = checkTimers(mMaxRun);
    if (mTerminated) break;
    // limit sleeping time
    if (mMaxSleep!=Infinite && (nextWake==Never || nextWake>cycleStarted+mMaxSleep)) {
      nextWake = cycleStarted+mMaxSleep;
    }
    // poll I/O and/or sleep
    MLMicroSeconds pollTimeout = nextWake-MainLoop::now();
    if (nextWake!=Never && pollTimeout<=0) {
      // not sleeping at all
      handleIOPoll(0);
      if (cycleStarted+mMaxRun<MainLoop::now()) {
        return false; // run limit reached before we could sleep
      }
    }
    else {
      handleIOPoll(nextWake==Never ? Infinite : pollTimeout);
      return true; // we had the chance to sleep
    }
  }
  return true; // result does not matter any more after termination
}


int MainLoop::finalizeMainLoop()
{
  // clear all runtime handlers to release all possibly retained objects
  mTimers.clear();
  mIoPollHandlers.clear();
  return mExitCode;
}


int MainLoop::run(bool aRestart)
{
  startupMainLoop(aRestart);
  while (!mTerminated) {
    bool couldSleep = mainLoopCycle();
    if (!couldSleep) {
      // extra sleep to prevent full CPU usage
      #if MAINLOOP_STATISTICS
      mTimesThrottlingApplied++;
      #endif
      MainLoop::sleep(mThrottleSleep);
    }
  }
  return finalizeMainLoop();
}


#if MAINLOOP_LIBEV_BASED

struct ev_loop* MainLoop::libevLoop()
{
  return mLibEvLoopP;
}

#endif // MAINLOOP_LIBEV_BASED


string MainLoop::description()
{
  #if MAINLOOP_STATISTICS
  MLMicroSeconds statisticsPeriod = now()-mStatisticsStartTime;
  #endif
  return string_format(
    "Mainloop statistics:\n"
    "- installed I/O poll handlers   : %ld\n"
    "- pending timers right now      : %ld\n"
    "  - earliest                    : %s - %lld mS from now\n"
    "  - latest                      : %s - %lld mS from now\n"
    #if MAINLOOP_STATISTICS
    "- statistics period             : %.3f S\n"
    "- I/O poll handler runtime      : %lld mS / %d%% of period\n"
    "- thread signalhandler runtime  : %lld mS / %d%% of period\n"
    "- timer handler runtime         : %lld mS / %d%% of period\n"
    "  - max delay in execution      : %lld mS\n"
    "  - timer handlers ran too long : %ld times\n"
    "  - max timers waiting at once  : %ld\n"
    "- throttling sleep inserted     : %ld times\n"
    #endif
    ,(long)mIoPollHandlers.size()
    ,(long)mTimers.size()
    ,mTimers.size()>0 ? string_mltime(mTimers.front().mExecutionTime).c_str() : "none" ,(long long)(mTimers.size()>0 ? mTimers.front().mExecutionTime-now() : 0)/MilliSecond
    ,mTimers.size()>0 ? string_mltime(mTimers.back().mExecutionTime).c_str() : "none" ,(long long)(mTimers.size()>0 ? mTimers.back().mExecutionTime-now() : 0)/MilliSecond
    #if MAINLOOP_STATISTICS
    ,(double)statisticsPeriod/Second
    ,mIoHandlerTime/MilliSecond ,(int)(statisticsPeriod>0 ? 100ll * mIoHandlerTime/statisticsPeriod : 0)
    ,mThreadSignalHandlerTime/MilliSecond ,(int)(statisticsPeriod>0 ? 100ll * mThreadSignalHandlerTime/statisticsPeriod : 0)
    ,mTimedHandlerTime/MilliSecond ,(int)(statisticsPeriod>0 ? 100ll * mTimedHandlerTime/statisticsPeriod : 0)
    ,(long long)mMaxTimerExecutionDelay/MilliSecond
    ,(long)mTimesTimersRanToLong
    ,(long)mMaxTimers
    ,(long)mTimesThrottlingApplied
    #endif
  );
}


void MainLoop::statistics_reset()
{
  #if MAINLOOP_STATISTICS
  mStatisticsStartTime = now();
  mIoHandlerTime = 0;
  mThreadSignalHandlerTime = 0;
  mTimedHandlerTime = 0;
  mMaxTimerExecutionDelay = 0;
  mTimesTimersRanToLong = 0;
  mTimesThrottlingApplied = 0;
  mMaxTimers = 0;
  #endif
}


// MARK: - execution in subthreads

ChildThreadWrapperPtr MainLoop::executeInThread(ThreadRoutine aThreadRoutine, ThreadSignalHandler aThreadSignalHandler)
{
  return ChildThreadWrapperPtr(new ChildThreadWrapper(*this, aThreadRoutine, aThreadSignalHandler));
}


// MARK: - ChildThreadWrapper

static void *thread_start_function(void *arg)
{
  return static_cast<ChildThreadWrapper *>(arg)->startFunction();
}


void *ChildThreadWrapper::startFunction()
{
  mThreadRoutine(*this);
  confirmTerminated();
  return NULL;
}


ChildThreadWrapper::ChildThreadWrapper(MainLoop &aParentThreadMainLoop, ThreadRoutine aThreadRoutine, ThreadSignalHandler aThreadSignalHandler) :
  mThreadRunning(false),
  mParentThreadMainLoop(aParentThreadMainLoop),
  mChildSignalFd(-1),
  mParentSignalFd(-1),
  mParentSignalHandler(aThreadSignalHandler),
  mThreadRoutine(aThreadRoutine),
  mTerminationPending(false),
  mMyMainLoopP(NULL)
{
  int pipeFdPair[2];
  if (pipe(pipeFdPair)==0) {
    mParentSignalFd = pipeFdPair[0]; // 0 is the reading end
    mChildSignalFd = pipeFdPair[1]; // 1 is the writing end
    mParentThreadMainLoop.registerPollHandler(mParentSignalFd, POLLIN, boost::bind(&ChildThreadWrapper::signalPipeHandler, this, _2));
    // keep wrapper object alive until the parent has seen the final signal
    mSelfRef = ChildThreadWrapperPtr(this);
    // must be set before the child starts to run
    mThreadRunning = true;
    if (pthread_create(&mPthread, NULL, thread_start_function, this)!=0) {
      // could not create thread, deliver the failure through the pipe like any other signal
      mThreadRunning = false;
      LOG(LOG_ERR, "ChildThreadWrapper: cannot create thread: %s", strerror(errno));
      signalParentThread(threadSignalFailedToStart);
    }
  }
  else {
    LOG(LOG_ERR, "ChildThreadWrapper: cannot create signal pipe: %s", strerror(errno));
  }
}


ChildThreadWrapper::~ChildThreadWrapper()
{
  cancel();
  if (mMyMainLoopP) {
    delete mMyMainLoopP;
    mMyMainLoopP = NULL;
  }
}


MainLoop &ChildThreadWrapper::threadMainLoop()
{
  mMyMainLoopP = &MainLoop::currentMainLoop();
  return *mMyMainLoopP;
}


void ChildThreadWrapper::terminate()
{
  // the child polls shouldTerminate(), its mainloop belongs to the child alone
  mTerminationPending = true;
}


void ChildThreadWrapper::confirmTerminated()
{
  signalParentThread(threadSignalCompleted);
}


void ChildThreadWrapper::signalParentThread(ThreadSignals aSignalCode)
{
  uint8_t sigByte = aSignalCode;
  if (write(mChildSignalFd, &sigByte, 1)!=1) {
    LOG(LOG_ERR, "ChildThreadWrapper: cannot signal parent thread: %s", strerror(errno));
  }
}


// cleanup, called from parent thread
void ChildThreadWrapper::finalizeThreadExecution()
{
  pthread_join(mPthread, NULL);
  mThreadRunning = false;
  mParentThreadMainLoop.unregisterPollHandler(mParentSignalFd);
  close(mChildSignalFd);
  close(mParentSignalFd);
  mChildSignalFd = -1;
  mParentSignalFd = -1;
}


void ChildThreadWrapper::cancel()
{
  if (mThreadRunning) {
    pthread_cancel(mPthread);
    finalizeThreadExecution();
    if (mParentSignalHandler) {
      ML_STAT_START_AT(mParentThreadMainLoop.now());
      mParentSignalHandler(*this, threadSignalCancelled);
      ML_STAT_ADD_AT(mParentThreadMainLoop.mThreadSignalHandlerTime, mParentThreadMainLoop.now());
    }
    // thread has ended now, object must not retain itself beyond this point
    mSelfRef.reset();
  }
}


// called on parent thread from Mainloop
bool ChildThreadWrapper::signalPipeHandler(int aPollFlags)
{
  ThreadSignals sig = threadSignalNone;
  if (aPollFlags & POLLIN) {
    uint8_t sigByte;
    ssize_t res = read(mParentSignalFd, &sigByte, 1);
    if (res==1) {
      sig = (ThreadSignals)sigByte;
    }
  }
  else if (aPollFlags & POLLHUP) {
    // thread has terminated and closed the other end of the pipe already
    sig = threadSignalCompleted;
  }
  if (sig!=threadSignalNone) {
    // keep this object alive until the handler has returned
    ChildThreadWrapperPtr keepAlive(this);
    if (sig==threadSignalCompleted) {
      finalizeThreadExecution();
    }
    else if (sig==threadSignalFailedToStart) {
      mParentThreadMainLoop.unregisterPollHandler(mParentSignalFd);
      close(mChildSignalFd);
      close(mParentSignalFd);
      mChildSignalFd = -1;
      mParentSignalFd = -1;
    }
    if (mParentSignalHandler) {
      ML_STAT_START_AT(mParentThreadMainLoop.now());
      mParentSignalHandler(*this, sig);
      ML_STAT_ADD_AT(mParentThreadMainLoop.mThreadSignalHandlerTime, mParentThreadMainLoop.now());
    }
    if (sig==threadSignalCompleted || sig==threadSignalFailedToStart || sig==threadSignalCancelled) {
      mSelfRef.reset();
    }
    return true;
  }
  return false;
}
