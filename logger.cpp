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

#include "logger.hpp"

#include <ctype.h>

#include "utils.hpp"
#include "ledbetter_defs.hpp"

using namespace lb;

// MARK: - Logger

lb::Logger globalLogger;

Logger::Logger() :
  mLogLevel(LOGGER_DEFAULT_LOGLEVEL),
  mStderrLevel(LOG_ERR),
  mDeltaTime(false),
  mErrToStdout(true),
  mDaemonMode(true)
{
  pthread_mutex_init(&mReportMutex, NULL);
  gettimeofday(&mLastLogTS, NULL);
}


Logger::~Logger()
{
  pthread_mutex_destroy(&mReportMutex);
}


bool Logger::stdoutLogEnabled(int aErrLevel)
{
  return (aErrLevel<=mLogLevel);
}


bool Logger::logEnabled(int aErrLevel)
{
  return stdoutLogEnabled(aErrLevel) || (mDaemonMode && aErrLevel<=mStderrLevel);
}


const static char levelChars[8] = {
  '*', // LOG_EMERG   - system is unusable
  '!', // LOG_ALERT   - action must be taken immediately
  'C', // LOG_CRIT    - critical conditions
  'E', // LOG_ERR     - error conditions
  'W', // LOG_WARNING - warning conditions
  'N', // LOG_NOTICE  - normal but significant condition
  'I', // LOG_INFO    - informational
  'D'  // LOG_DEBUG   - debug-level messages
};


void Logger::logV(int aErrLevel, const char *aFmt, va_list aArgs)
{
  string message;
  string_format_v(message, false, aFmt, aArgs);
  contextLogStr_always(aErrLevel, "", message);
}


void Logger::log(int aErrLevel, const char *aFmt, ... )
{
  if (logEnabled(aErrLevel)) {
    va_list args;
    va_start(args, aFmt);
    logV(aErrLevel, aFmt, args);
    va_end(args);
  }
}


void Logger::contextLogStr_always(int aErrLevel, const string& aContext, const string& aMessage)
{
  if (aErrLevel<LOG_EMERG) aErrLevel = LOG_EMERG;
  if (aErrLevel>LOG_DEBUG) aErrLevel = LOG_DEBUG;
  // a thread cancelled while writing would leave the mutex locked for good
  int oldCancelState;
  pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, &oldCancelState);
  pthread_mutex_lock(&mReportMutex);
  // create date + level
  struct timeval t;
  gettimeofday(&t, NULL);
  struct tm lt;
  localtime_r(&t.tv_sec, &lt);
  string prefix = string_ftime("[%Y-%m-%d %H:%M:%S", &lt);
  string_format_append(prefix, ".%03d", (int)(t.tv_usec/1000));
  if (mDeltaTime) {
    long long millisPassed = (long long)(((t.tv_sec*1000000ll+t.tv_usec) - (mLastLogTS.tv_sec*1000000ll+mLastLogTS.tv_usec))/1000);
    string_format_append(prefix, "%6lldmS", millisPassed);
  }
  mLastLogTS = t;
  string_format_append(prefix, " %c] ", levelChars[aErrLevel]);
  // generate empty leading lines, if any
  string::size_type i=0;
  while (i<aMessage.length() && aMessage[i]=='\n') {
    logOutput_always(aErrLevel, "", "");
    i++;
  }
  string msg;
  if (!aContext.empty()) {
    msg += aContext;
    msg += ": ";
  }
  // now process input message, possibly multi-lined
  while (i<aMessage.length()) {
    char c = aMessage[i];
    if (c=='\n') {
      logOutput_always(aErrLevel, prefix.c_str(), msg.c_str());
      msg.clear();
      prefix.assign(prefix.size(), ' '); // continuation lines are indented
    }
    else if (!isprint((uint8_t)c) && (uint8_t)c<0x80) {
      // ASCII control character, but not bit 7 set (UTF8 component char)
      string_format_append(msg, "\\x%02x", (unsigned)(c & 0xFF));
    }
    else {
      msg += c;
    }
    i++;
  }
  logOutput_always(aErrLevel, prefix.c_str(), msg.c_str());
  pthread_mutex_unlock(&mReportMutex);
  pthread_setcancelstate(oldCancelState, NULL);
}


void Logger::logOutput_always(int aLevel, const char *aLinePrefix, const char *aLogMessage)
{
  // - in daemon mode, only level<=mStderrLevel goes to stderr
  // - in cmdline tool mode all log goes to stderr
  if (aLevel<=mStderrLevel || !mDaemonMode) {
    fputs(aLinePrefix, stderr);
    fputs(aLogMessage, stderr);
    fputs("\n", stderr);
    fflush(stderr);
  }
  // - in daemon mode only, normal log goes to stdout (and errors are duplicated to stdout as well)
  if (mDaemonMode && (aLevel>mStderrLevel || mErrToStdout)) {
    fputs(aLinePrefix, stdout);
    fputs(aLogMessage, stdout);
    fputs("\n", stdout);
    fflush(stdout);
  }
}


void Logger::setLogLevel(int aLogLevel)
{
  if (aLogLevel<LOG_EMERG || aLogLevel>LOG_DEBUG) return;
  mLogLevel = aLogLevel;
}


void Logger::setErrLevel(int aStderrLevel, bool aErrToStdout)
{
  if (aStderrLevel<LOG_EMERG || aStderrLevel>LOG_DEBUG) return;
  mStderrLevel = aStderrLevel;
  mErrToStdout = aErrToStdout;
}


// MARK: - LBLoggingObj

LBLoggingObj::LBLoggingObj()
{
}


string LBLoggingObj::logContextPrefix()
{
  return string_format("LBLoggingObj @%p", this);
}


bool LBLoggingObj::logEnabled(int aLogLevel)
{
  return globalLogger.logEnabled(aLogLevel);
}


void LBLoggingObj::log(int aErrLevel, const char *aFmt, ... )
{
  if (logEnabled(aErrLevel)) {
    va_list args;
    va_start(args, aFmt);
    string message;
    string context;
    if (*aFmt!='\r') {
      context = logContextPrefix();
    }
    else {
      aFmt++; // prefix disabled, skip marker
    }
    string_format_v(message, true, aFmt, args);
    va_end(args);
    globalLogger.contextLogStr_always(aErrLevel, context, message);
  }
}
