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

#ifndef __ledbetter__mainloop__
#define __ledbetter__mainloop__

/* MARK: - C and C++ interfaces */

#ifdef __cplusplus
extern "C" {
#endif

long long _lb_now();

#ifdef __cplusplus
};
#endif

#ifdef __cplusplus

// MARK: - C++ only interface

#include "ledbetter_common.hpp"

#include <poll.h>
#include <pthread.h>
#include <atomic>

#if MAINLOOP_LIBEV_BASED
  #include <ev.h>
#endif


// if set to non-zero, mainloop will have some code to record statistics
#define MAINLOOP_STATISTICS 1

using namespace std;

namespace lb {

  class MainLoop;
  class ChildThreadWrapper;

  typedef boost::intrusive_ptr<MainLoop> MainLoopPtr;
  typedef boost::intrusive_ptr<ChildThreadWrapper> ChildThreadWrapperPtr;

  /// subthread/maintthread communication signals (sent via pipe)
  enum {
    threadSignalNone,
    threadSignalCompleted, ///< sent to parent when child thread terminates
    threadSignalFailedToStart, ///< sent to parent when child thread could not start
    threadSignalCancelled, ///< sent to parent when child thread was cancelled
    threadSignalUserSignal ///< first user-specified signal
  };
  typedef uint8_t ThreadSignals;


  typedef long MLTicketNo; ///< Mainloop timer ticket number
  class MLTimer;


  /// @name Mainloop callbacks
  /// @{

  /// Generic handler without any arguments
  typedef boost::function<void ()> SimpleCB;

  /// Generic handler or returning a status (ok or error)
  typedef boost::function<void (ErrorPtr aError)> StatusCB;

  /// Handler for timed processing
  typedef boost::function<void (MLTimer &aTimer, MLMicroSeconds aNow)> TimerCB;

  /// I/O callback
  /// @param aFD the file descriptor that was signalled and has caused this call
  /// @param aPollFlags the poll flags describing the reason for the callback
  /// @return should true if callback really handled some I/O, false if it only checked flags and found nothing to do
  typedef boost::function<bool (int aFD, int aPollFlags)> IOPollCB;

  /// thread routine, will be called on a separate thread
  /// @param aThread the object that wraps the thread and allows sending signals to the parent thread
  /// @note when this routine exits, a threadSignalCompleted will be sent to the parent thread
  typedef boost::function<void (ChildThreadWrapper &aThread)> ThreadRoutine;

  /// thread signal handler, will be called from main loop of parent thread when child thread uses signalParentThread()
  /// @param aChildThread the ChildThreadWrapper object which sent the signal
  /// @param aSignalCode the signal received from the child thread
  typedef boost::function<void (ChildThreadWrapper &aChildThread, ThreadSignals aSignalCode)> ThreadSignalHandler;

  /// @}


  class MLTimer LB_FINAL {
    friend class MainLoop;
    MLTicketNo mTicketNo;
    MLMicroSeconds mExecutionTime;
    MLMicroSeconds mTolerance;
    TimerCB mCallback;
  public:
    MLTicketNo getTicket() { return mTicketNo; };
    MLMicroSeconds getExecutionTime() { return mExecutionTime; };
  };


  class MLTicket
  {
    MLTicketNo mTicketNo;

    MLTicket(MLTicket &aTicket); ///< private copy constructor, must not be used

  public:
    MLTicket();
    ~MLTicket();

    /// conversion operator, get as MLTicketNo (number only)
    operator MLTicketNo() const;

    /// get as bool to check if ticket is running
    operator bool() const;

    /// assign ticket number (cancels previous ticket, if any)
    MLTicketNo operator= (MLTicketNo aTicketNo);

    /// cancel current ticket
    /// @return true if actually cancelled a scheduled timer
    bool cancel();

    /// have handler called from the mainloop once at a given time.
    /// If ticket was already active, it will be cancelled before
    /// @param aTimerCallback the functor to be called when timer fires
    /// @param aExecutionTime when to execute (approximately), in now() timescale. A time in the past fires ASAP
    /// @param aTolerance how precise the timer should be, default=0=as precise as possible (for timer coalescing)
    void executeOnceAt(TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance = 0);

    /// have handler called from the mainloop once with an optional delay from now
    /// If ticket was already active, it will be cancelled before
    /// @param aTimerCallback the functor to be called when timer fires
    /// @param aDelay delay from now when to execute (approximately)
    /// @param aTolerance how precise the timer should be, default=0=as precise as possible (for timer coalescing)
    void executeOnce(TimerCB aTimerCallback, MLMicroSeconds aDelay = 0, MLMicroSeconds aTolerance = 0);

  };


  /// A main loop for a thread
  class MainLoop : public LBObj
  {
    friend class ChildThreadWrapper;
    friend class MLTicket;

    // timers
    typedef std::list<MLTimer> TimerList;
    TimerList mTimers;
    bool mTimersChanged;
    MLTicketNo mTicketNo;

    // IO poll handlers
    #if MAINLOOP_LIBEV_BASED
    friend void libev_io_poll_handler(EV_P_ struct ev_io *, int);
    friend void libev_sleep_timer_done(EV_P_ struct ev_timer *t, int revents);
    class IOPollHandler LB_FINAL {
    public:
      struct ev_io mIoWatcher; // the actual IO watcher
      IOPollCB mPollHandler;
      IOPollHandler();
      ~IOPollHandler();
      IOPollHandler& operator= (IOPollHandler& aReplacing);
    private:
      void deactivate();
    };
    #else
    typedef struct {
      int monitoredFD;
      int pollFlags;
      IOPollCB pollHandler;
    } IOPollHandler;
    #endif

    typedef std::map<int, IOPollHandler> IOPollHandlerMap;
    IOPollHandlerMap mIoPollHandlers;

    // Configuration
    MLMicroSeconds mMaxSleep; ///< how long to sleep maximally per mainloop cycle, can be set to Infinite to allow unlimited sleep
    MLMicroSeconds mThrottleSleep; ///< how long to sleep after a mainloop cycle that had no chance to sleep at all. Can be 0.
    MLMicroSeconds mMaxRun; ///< how long to run maximally without any interruption. Note that this cannot limit the runtime for a single handler.
    MLMicroSeconds mMaxCoalescing; ///< how much to shift timer execution points maximally (always within limits given by timer's tolerance) to coalesce executions

    #if MAINLOOP_LIBEV_BASED
    struct ev_loop* mLibEvLoopP;
    struct ev_timer mLibEvTimer;
    #endif

  protected:

    bool mTerminated;
    int mExitCode;

    #if MAINLOOP_STATISTICS
    MLMicroSeconds mStatisticsStartTime;
    size_t mMaxTimers;
    MLMicroSeconds mIoHandlerTime;
    MLMicroSeconds mTimedHandlerTime;
    MLMicroSeconds mMaxTimerExecutionDelay;
    long mTimesTimersRanToLong;
    long mTimesThrottlingApplied;
    MLMicroSeconds mThreadSignalHandlerTime;
    #endif

    // protected constructor
    MainLoop();

  public:

    virtual ~MainLoop();

    /// returns or creates the current thread's mainloop
    /// @return the mainloop for this thread
    static MainLoop &currentMainLoop();

    /// @name time related static utility functions
    /// @{

    /// returns the current microsecond in "Mainloop" time (monotonic as long as app runs, but not necessarily anchored with real time)
    /// @return mainloop time in microseconds
    static MLMicroSeconds now();

    /// returns the Unix epoch time in mainloop time scaling (microseconds)
    /// @return unix epoch time, in microseconds
    static MLMicroSeconds unixtime();

    /// format mainloop time as localtime in YYYY-MM-DD HH:MM:SS format with output to std::string
    /// @param aTime time in mainloop now() scale
    /// @return formatted time string (in local time)
    static string string_mltime(MLMicroSeconds aTime);

    /// sleeps for given number of microseconds
    static void sleep(MLMicroSeconds aSleepTime);

    /// @}


    /// @name register timed handlers (fired at specified time)
    /// @{

    /// have handler called from the mainloop once at the specified time
    /// @param aTicket this ticket will be cancelled if active beforehand. On exit, this contains the new ticket
    /// @param aTimerCallback the functor to be called when timer fires
    /// @param aExecutionTime when to execute (approximately), in now() timescale
    /// @param aTolerance how precise the timer should be, default=0=as precise as possible (for timer coalescing)
    void executeTicketOnceAt(MLTicket &aTicket, TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance = 0);

    /// have handler called from the mainloop once with an optional delay from now
    /// @param aTicket this ticket will be cancelled if active beforehand. On exit, this contains the new ticket
    /// @param aTimerCallback the functor to be called when timer fires
    /// @param aDelay delay from now when to execute (approximately)
    /// @param aTolerance how precise the timer should be, default=0=as precise as possible (for timer coalescing)
    void executeTicketOnce(MLTicket &aTicket, TimerCB aTimerCallback, MLMicroSeconds aDelay = 0, MLMicroSeconds aTolerance = 0);

    /// execute something on the mainloop without delay, usually to unwind call stack in long chains of operations
    /// @param aTimerCallback the functor to be called from mainloop
    void executeNow(TimerCB aTimerCallback);

    /// @}


    /// @name register handlers for I/O events
    /// @{

    /// register handler to be called for activity on specified file descriptor
    /// @param aFD the file descriptor to poll
    /// @param aPollFlags POLLxxx flags to specify events we want a callback for
    /// @param aPollEventHandler the functor to be called when poll() reports an event for one of the flags set in aPollFlags
    /// @note when based on libev, only POLLIN and POLLOUT can be monitored
    void registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler);

    /// unregister poll handlers for this file descriptor
    /// @param aFD the file descriptor
    void unregisterPollHandler(int aFD);

    /// @}


    /// @name run handler in separate thread
    /// @{

    /// execute handler in a separate thread
    /// @param aThreadRoutine the routine to be executed in a separate thread
    /// @param aThreadSignalHandler will be called from main loop of parent thread when child thread uses signalParentThread()
    /// @return wrapper object for child thread.
    ChildThreadWrapperPtr executeInThread(ThreadRoutine aThreadRoutine, ThreadSignalHandler aThreadSignalHandler);

    /// @}


    /// terminate the mainloop
    /// @param aExitCode the code to return from run()
    void terminate(int aExitCode);

    /// @return true if terminate() has been called
    bool isTerminated() { return mTerminated; };

    /// run the mainloop until it terminates.
    /// @param aRestart if set, the mainloop will start again even if terminate() was called before
    /// @return returns a exit code
    int run(bool aRestart = false);

    /// description (shows some mainloop key numbers)
    string description();

    /// reset statistics
    void statistics_reset();

    #if MAINLOOP_LIBEV_BASED
    /// the underlying libev main loop
    /// @return libev loop pointer to be used as "the mainloop" from code using libev mechanisms
    struct ev_loop* libevLoop();
    #endif

  private:

    void startupMainLoop(bool aRestart);
    bool mainLoopCycle(); ///< @return true if the cycle had the chance to sleep
    int finalizeMainLoop();

    // we don't want timers to be used without a MLTicket taking care of cancelling when the called object is deleted
    MLTicketNo executeOnceAt(TimerCB aTimerCallback, MLMicroSeconds aExecutionTime, MLMicroSeconds aTolerance);
    MLTicketNo executeOnce(TimerCB aTimerCallback, MLMicroSeconds aDelay, MLMicroSeconds aTolerance);
    bool cancelExecutionTicket(MLTicketNo aTicketNo);

    MLMicroSeconds checkTimers(MLMicroSeconds aTimeout);
    void scheduleTimer(MLTimer &aTimer);

    void handleIOPoll(MLMicroSeconds aTimeout);

  };



  class ChildThreadWrapper : public LBObj
  {
    typedef LBObj inherited;

    pthread_t mPthread; ///< the pthread
    bool mThreadRunning; ///< set if thread is active

    MainLoop &mParentThreadMainLoop; ///< the parent mainloop which created this thread
    int mChildSignalFd; ///< the pipe used to transmit signals from the child thread
    int mParentSignalFd; ///< the pipe monitored by parentThreadMainLoop to get signals from child

    ThreadSignalHandler mParentSignalHandler; ///< the handler to call to deliver signals to the main thread
    ThreadRoutine mThreadRoutine; ///< the actual thread routine to run

    ChildThreadWrapperPtr mSelfRef;

    std::atomic<bool> mTerminationPending; ///< set if termination has been requested by terminate(), polled by the child

    MainLoop *mMyMainLoopP; ///< the (optional) mainloop of this thread

  public:

    /// constructor
    ChildThreadWrapper(MainLoop &aParentThreadMainLoop, ThreadRoutine aThreadRoutine, ThreadSignalHandler aThreadSignalHandler);

    /// destructor
    virtual ~ChildThreadWrapper();

    /// @name methods to call from child thread
    /// @{

    /// check if termination is requested
    bool shouldTerminate() { return mTerminationPending; }

    /// signal parent thread
    /// @param aSignalCode a signal code to be sent to the parent thread
    void signalParentThread(ThreadSignals aSignalCode);

    /// returns (and creates, if not yet existing) the thread's mainloop
    /// @note MUST be called from the thread itself to get the correct mainloop!
    MainLoop &threadMainLoop();

    /// confirm termination
    void confirmTerminated();

    /// @}

    /// @name methods to call from parent thread
    /// @{

    /// request termination
    /// @note this does not actually cancel thread execution, but relies on the thread routine to check
    ///    shouldTerminate() and finish running by itself. If a mainloop was installed using
    ///    threadMainloop(), it will be requested to terminate with exit code 0
    void terminate();

    /// cancel execution and wait for cancellation to complete
    void cancel();

    /// @}

    /// method called from thread_start_function from this child thread
    void *startFunction();

  private:

    bool signalPipeHandler(int aPollFlags);
    void finalizeThreadExecution();

  };


} // namespace lb

#endif // C++ only interface

#endif /* defined(__ledbetter__mainloop__) */
