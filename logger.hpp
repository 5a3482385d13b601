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

#ifndef __ledbetter__logger__
#define __ledbetter__logger__

#include "ledbetter_minimal.hpp"

#include <sys/time.h>
#include <string.h>
#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>
#include <errno.h>
#include <stdlib.h>
#include <unistd.h>
#include <syslog.h>

#include <string>

#ifndef __printflike
#define __printflike(...)
#endif

#include "lbobj.hpp"

// global object independent logging
#define LOGENABLED(lvl) globalLogger.logEnabled(lvl)
#define LOG(lvl,...) { if (globalLogger.logEnabled(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }
#define SETLOGLEVEL(lvl) globalLogger.setLogLevel(lvl)
#define SETERRLEVEL(lvl, dup) globalLogger.setErrLevel(lvl, dup)
#define SETDELTATIME(dt) globalLogger.setDeltaTime(dt)
#define LOGLEVEL (globalLogger.getLogLevel())
#define DAEMONMODE globalLogger.getDaemonMode()
#define SETDAEMONMODE(d) globalLogger.setDaemonMode(d)

// logging from within a LBLoggingObj (messages prefixed with object's logContextPrefix())
#define OLOGENABLED(lvl) logEnabled(lvl)
#define OLOG(lvl,...) { if (logEnabled(lvl)) log(lvl,##__VA_ARGS__); }

// debug build extra logging (not included in release code unless ALWAYS_DEBUG is set)
#if defined(DEBUG) || ALWAYS_DEBUG
#define DEBUGLOGGING 1
#define DBGLOGENABLED(lvl) LOGENABLED(lvl)
#define DBGLOG(lvl,...) LOG(lvl,##__VA_ARGS__)
#define DBGOLOG(lvl,...) OLOG(lvl,##__VA_ARGS__)
#define LOGGER_DEFAULT_LOGLEVEL LOG_DEBUG
#else
#define DEBUGLOGGING 0
#define DBGLOGENABLED(lvl) false
#define DBGLOG(lvl,...)
#define DBGOLOG(lvl,...)
#define LOGGER_DEFAULT_LOGLEVEL LOG_NOTICE
#endif

// "focus" logging during development, additional logging that can be enabled per source file
// (define FOCUSLOGLEVEL before including logger.hpp)
#if FOCUSLOGLEVEL
#define FOCUSLOG(...) LOG(FOCUSLOGLEVEL,##__VA_ARGS__)
#define FOCUSOLOG(...) OLOG(FOCUSLOGLEVEL,##__VA_ARGS__)
#define FOCUSLOGENABLED LOGENABLED(FOCUSLOGLEVEL)
#if !(defined(DEBUG) || ALWAYS_DEBUG || FOCUSLOGLEVEL>=7)
#warning "**** FOCUSLOGLEVEL<7 enabled in non-DEBUG build ****"
#endif
#else
#define FOCUSLOG(...)
#define FOCUSOLOG(...)
#define FOCUSLOGENABLED false
#endif


using namespace std;

namespace lb {

  class Logger : public LBObj
  {
    pthread_mutex_t mReportMutex; ///< serializes output from render and control threads
    struct timeval mLastLogTS; ///< timestamp of last log line
    int mLogLevel; ///< log level
    int mStderrLevel; ///< lowest level that also goes to stderr
    bool mDeltaTime; ///< if set, log timestamps will show delta time relative to previous log line
    bool mErrToStdout; ///< if set, even log lines that go to stderr are still shown on stdout as well
    bool mDaemonMode; ///< if set, normal log goes to stdout and log<=stderrLevel goes to stderr. If cleared, all log goes to stderr according to logLevel

  public:
    Logger();
    virtual ~Logger();

    /// test if log is enabled at a given level
    /// @param aLogLevel level to check
    /// @return true if any logging (stderr or stdout) is enabled at the specified level
    bool logEnabled(int aLogLevel);

    /// test if log to std out is enabled at a given level
    /// @param aErrLevel level to check
    /// @return true if logging to stdout is enabled at this level.
    bool stdoutLogEnabled(int aErrLevel);

    /// log a message if logging is enabled for the specified aErrLevel
    /// @param aErrLevel error level of the message
    /// @param aFmt ... printf style error message
    void log(int aErrLevel, const char *aFmt, ... ) __printflike(3,4);

    /// log a message with a context prefix (unconditionally)
    /// @param aErrLevel error level of the message, for inclusion into log message prefix
    /// @param aContext context prefix, empty for none
    /// @param aMessage the message string
    void contextLogStr_always(int aErrLevel, const string& aContext, const string& aMessage);

    /// set log level
    /// @param aLogLevel the new log level
    /// @note messages that qualify for going to stderr (see setErrLevel) will still be shown on stderr
    void setLogLevel(int aLogLevel);

    /// @return current log level
    int getLogLevel() { return mLogLevel; }

    /// set level required to send messages to stderr
    /// @param aStderrLevel any messages with this or a lower (=higher priority) level will be sent to stderr (default = LOG_ERR)
    /// @param aErrToStdout if set, messages that qualify for stderr will STILL be duplicated to stdout as well (default = true)
    void setErrLevel(int aStderrLevel, bool aErrToStdout);

    /// set delta time display
    /// @param aDeltaTime if set, time passed since last log line will be displayed
    void setDeltaTime(bool aDeltaTime) { mDeltaTime = aDeltaTime; };

    /// @return true if in daemonmode (log goes to stdout, only higher importance errors to stderr)
    bool getDaemonMode() { return mDaemonMode; }

    /// @param aDaemonMode true to enable daemon mode (on by default)
    void setDaemonMode(bool aDaemonMode) { mDaemonMode = aDaemonMode; }

  private:

    void logV(int aErrLevel, const char *aFmt, va_list aArgs);
    void logOutput_always(int aLevel, const char *aLinePrefix, const char *aLogMessage);

  };


  class LBLoggingObj : public LBObj
  {
    typedef LBObj inherited;

  public:

    LBLoggingObj();

    /// @return the prefix to be used for logging from this object
    virtual string logContextPrefix();

    /// test if log is enabled from this object at a given level
    /// @param aLogLevel level to check
    bool logEnabled(int aLogLevel);

    /// log a message from this object if logging is enabled for the specified aErrLevel
    /// @param aErrLevel error level of the message
    /// @param aFmt ... printf style error message. Starting it with \r suppresses the context prefix
    void log(int aErrLevel, const char *aFmt, ... ) __printflike(3,4);

  };

} // namespace lb


extern lb::Logger globalLogger;


#endif /* defined(__ledbetter__logger__) */
