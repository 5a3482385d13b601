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

#include "application.hpp"

#include <stdlib.h> // for strtol
#include <fcntl.h>

using namespace lb;

// MARK: - Application base class

static int signalPipeWriteFd = -1;


Application::Application(MainLoop &aMainLoop) :
  mMainLoop(aMainLoop),
  mSignalPipeRead(-1),
  mSignalPipeWrite(-1)
{
  initializeInternal();
}


Application::Application() :
  mMainLoop(MainLoop::currentMainLoop()),
  mSignalPipeRead(-1),
  mSignalPipeWrite(-1)
{
  initializeInternal();
}


Application::~Application()
{
  signalPipeWriteFd = -1;
  if (mSignalPipeRead>=0) {
    mMainLoop.unregisterPollHandler(mSignalPipeRead);
    close(mSignalPipeRead);
    close(mSignalPipeWrite);
  }
}


void Application::initializeInternal()
{
  // signals are forwarded to the mainloop through a self-pipe
  int pipeFdPair[2];
  if (pipe(pipeFdPair)==0) {
    mSignalPipeRead = pipeFdPair[0];
    mSignalPipeWrite = pipeFdPair[1];
    fcntl(mSignalPipeWrite, F_SETFL, fcntl(mSignalPipeWrite, F_GETFL) | O_NONBLOCK);
    signalPipeWriteFd = mSignalPipeWrite;
    mMainLoop.registerPollHandler(mSignalPipeRead, POLLIN, boost::bind(&Application::signalPipeHandler, this, _2));
  }
  else {
    LOG(LOG_ERR, "Cannot create signal pipe: %s", strerror(errno));
  }
  // register signal handlers
  handleSignal(SIGHUP);
  handleSignal(SIGINT);
  handleSignal(SIGTERM);
  handleSignal(SIGUSR1);
  // a vanished peer must show up as a write error, not kill the process
  signal(SIGPIPE, SIG_IGN);
}


void Application::sigaction_handler(int aSignal, siginfo_t *aSiginfo, void *aUap)
{
  if (signalPipeWriteFd>=0) {
    int savedErrno = errno;
    uint8_t sigByte = (uint8_t)aSignal;
    // nothing more can be done in signal context when the pipe is full
    if (write(signalPipeWriteFd, &sigByte, 1)!=1) {}
    errno = savedErrno;
  }
}


void Application::handleSignal(int aSignal)
{
  struct sigaction act;

  memset(&act, 0, sizeof(act));
  act.sa_sigaction = Application::sigaction_handler;
  act.sa_flags = SA_SIGINFO | SA_RESTART;
  sigaction(aSignal, &act, NULL);
}


bool Application::signalPipeHandler(int aPollFlags)
{
  if (aPollFlags & POLLIN) {
    uint8_t sigByte;
    if (read(mSignalPipeRead, &sigByte, 1)==1) {
      signalOccurred(sigByte);
    }
    return true;
  }
  return false;
}


void Application::signalOccurred(int aSignal)
{
  if (aSignal==SIGUSR1) {
    // default for SIGUSR1 is showing mainloop statistics
    LOG(LOG_NOTICE, "SIGUSR1 requests %s", mMainLoop.description().c_str());
    mMainLoop.statistics_reset();
    return;
  }
  // default action for all other signals is terminating the program
  LOG(LOG_ERR, "Terminating because of signal %d", aSignal);
  mMainLoop.terminate(EXIT_FAILURE);
}


int Application::main(int argc, char **argv)
{
  // NOP application
  return EXIT_SUCCESS;
}


void Application::initialize()
{
  // NOP in base class
}


void Application::cleanup(int aExitCode)
{
  // NOP in base class
}


int Application::run()
{
  // schedule the initialize() method as first mainloop method
  mMainLoop.executeNow(boost::bind(&Application::initialize, this));
  // run the mainloop
  int exitCode = mMainLoop.run();
  // show the statistic
  LOG(LOG_INFO, "Terminated: %s", mMainLoop.description().c_str());
  // clean up
  cleanup(exitCode);
  return exitCode;
}


void Application::terminateApp(int aExitCode)
{
  // have mainloop terminate with given exit code and exit run()
  mMainLoop.terminate(aExitCode);
}


void Application::terminateAppWith(ErrorPtr aError)
{
  if (Error::isOK(aError)) {
    mMainLoop.terminate(EXIT_SUCCESS);
  }
  else {
    if (!LOGENABLED(LOG_ERR)) {
      // if even error logging is off, just output the error message to stderr, with no logging adornments
      const char *msg = aError->text();
      if (*msg) fprintf(stderr, "Error: %s\n", msg);
    }
    else {
      LOG(LOG_ERR, "Terminating because of error: %s", aError->text());
    }
    mMainLoop.terminate(EXIT_FAILURE);
  }
}


string Application::version() const
{
  #if defined(LB_APPLICATION_VERSION)
  return LB_APPLICATION_VERSION; // specific version number
  #elif defined(PACKAGE_VERSION)
  return PACKAGE_VERSION; // build system package version number
  #else
  return "unknown_version"; // none known
  #endif
}


// MARK: - CmdLineApp command line application

CmdLineApp::CmdLineApp(MainLoop &aMainLoop) :
  inherited(aMainLoop),
  mOptionDescriptors(NULL)
{
}


CmdLineApp::~CmdLineApp()
{
}


void CmdLineApp::setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors)
{
  mOptionDescriptors = aOptionDescriptors;
  mSynopsis = aSynopsis ? aSynopsis : "Usage: %1$s";
}


static bool isEndOfOptions(const CmdLineOptionDescriptor *aOptionDescP)
{
  return aOptionDescP==NULL || (aOptionDescP->longOptionName==NULL && aOptionDescP->shortOptionChar=='\x00');
}


void CmdLineApp::showUsage()
{
  // print synopsis
  fprintf(stderr, mSynopsis.c_str(), mInvocationName.c_str());
  // collect option column texts first to determine the indent
  vector< pair<string, string> > lines;
  size_t indent = 0;
  for (const CmdLineOptionDescriptor *optionDescP = mOptionDescriptors; !isEndOfOptions(optionDescP); optionDescP++) {
    const char *desc = optionDescP->optionDescription;
    if (!desc) continue; // undocumented option
    string col;
    if (optionDescP->shortOptionChar) string_format_append(col, "-%c", optionDescP->shortOptionChar);
    if (optionDescP->longOptionName) {
      col += optionDescP->shortOptionChar ? ", " : "    ";
      string_format_append(col, "--%s", optionDescP->longOptionName);
    }
    if (optionDescP->withArgument) {
      const char *p = strchr(desc, ';');
      if (p) {
        string_format_append(col, " <%s>", string(desc, p-desc).c_str());
        desc = p+1;
      }
    }
    if (col.size()>indent) indent = col.size();
    lines.push_back(make_pair(col, string(desc)));
  }
  if (!lines.empty()) {
    fprintf(stderr, "Options:\n");
    for (size_t i=0; i<lines.size(); i++) {
      fprintf(stderr, "  %-*s  ", (int)indent, lines[i].first.c_str());
      // continuation lines of multi-line descriptions are indented as well
      const char *cursor = lines[i].second.c_str();
      string part;
      bool first = true;
      while (nextPart(cursor, part, '\n')) {
        if (!first) fprintf(stderr, "\n  %-*s  ", (int)indent, "");
        fprintf(stderr, "%s", part.c_str());
        first = false;
      }
      fprintf(stderr, "\n");
    }
  }
  fprintf(stderr, "\n");
}


bool CmdLineApp::parseCommandLine(int aArgc, char **aArgv)
{
  if (aArgc>0) {
    mInvocationName = aArgv[0];
    int rawArgIndex=1;
    while(rawArgIndex<aArgc) {
      const char *argP = aArgv[rawArgIndex];
      if (*argP=='-') {
        // option argument
        argP++;
        bool longOpt = false;
        string optName;
        string optArg;
        bool optArgFound = false;
        if (*argP=='-') {
          // long option
          longOpt = true;
          optName = argP+1;
        }
        else {
          // short option
          optName = argP;
          if (optName.length()>1 && optName[1]!='=') {
            // option argument follows directly after single char option
            optArgFound = true;
            optArg = optName.substr(1,string::npos);
            optName.erase(1,string::npos);
          }
        }
        // option argument directly following option separated by equal sign
        string::size_type n = optName.find("=");
        if (n!=string::npos) {
          optArgFound = true; // explicit specification, counts as option argument even if empty string
          optArg = optName.substr(n+1,string::npos);
          optName.erase(n,string::npos);
        }
        // search for option descriptor
        const CmdLineOptionDescriptor *optionDescP = mOptionDescriptors;
        bool optionFound = false;
        for (; !isEndOfOptions(optionDescP); optionDescP++) {
          if (
            (longOpt && optionDescP->longOptionName && optName==optionDescP->longOptionName) ||
            (!longOpt && !optName.empty() && optName[0]==optionDescP->shortOptionChar)
          ) {
            if (!optionDescP->withArgument) {
              if (optArgFound) {
                fprintf(stderr, "Option '%s' does not expect an argument\n", optName.c_str());
                showUsage();
                terminateApp(EXIT_FAILURE);
                return false;
              }
            }
            else {
              if (!optArgFound && rawArgIndex<aArgc-1) {
                // use next argument as option argument
                optArgFound = true;
                optArg = aArgv[++rawArgIndex];
              }
              if (!optArgFound) {
                fprintf(stderr, "Option '%s' requires an argument\n", optName.c_str());
                showUsage();
                terminateApp(EXIT_FAILURE);
                return false;
              }
            }
            // now have option processed by subclass
            if (processOption(*optionDescP, optArg.c_str())) {
              if (mainLoop().isTerminated()) return false;
            }
            else {
              // not processed, store under canonical name
              if (optionDescP->longOptionName)
                optName = optionDescP->longOptionName;
              else
                optName = string(1, optionDescP->shortOptionChar);
              mOptions[optName] = optArg;
            }
            optionFound = true;
            break;
          }
        }
        if (!optionFound) {
          fprintf(stderr, "Unknown Option '%s'\n", optName.c_str());
          showUsage();
          terminateApp(EXIT_FAILURE);
          return false;
        }
      }
      else {
        // non-option argument
        if (!processArgument(argP)) {
          mArguments.push_back(argP);
        }
      }
      rawArgIndex++;
    }
  }
  return true; // parsed, not terminated
}


bool CmdLineApp::processOption(const CmdLineOptionDescriptor &aOptionDescriptor, const char *aOptionValue)
{
  string name = nonNullCStr(aOptionDescriptor.longOptionName);
  if (!aOptionDescriptor.withArgument && name=="help") {
    showUsage();
    terminateApp(EXIT_SUCCESS);
  }
  else if (!aOptionDescriptor.withArgument && name=="version") {
    fprintf(stdout, "%s\n", version().c_str());
    terminateApp(EXIT_SUCCESS);
  }
  else {
    return false; // not processed
  }
  return true; // option already processed
}


const char *CmdLineApp::getOption(const char *aOptionName, const char *aDefaultValue)
{
  OptionsMap::iterator pos = mOptions.find(aOptionName);
  if (pos!=mOptions.end()) {
    return pos->second.c_str();
  }
  return aDefaultValue;
}


bool CmdLineApp::getIntOption(const char *aOptionName, int &aInteger)
{
  const char *opt = getOption(aOptionName);
  if (opt && *opt) {
    char *e = NULL;
    long i = strtol(opt, &e, 0);
    if (e && *e==0) {
      aInteger = (int)i;
      return true;
    }
  }
  return false;
}


bool CmdLineApp::getStringOption(const char *aOptionName, string &aString)
{
  const char *opt = getOption(aOptionName);
  if (opt) {
    aString = opt;
    return true;
  }
  return false;
}


size_t CmdLineApp::numArguments()
{
  return mArguments.size();
}


void CmdLineApp::processStandardLogOptions(bool aForDaemon, int aDefaultErrLevel)
{
  SETDAEMONMODE(aForDaemon);
  if (DAEMONMODE) {
    int loglevel = LOG_NOTICE; // moderate logging by default
    getIntOption("loglevel", loglevel);
    SETLOGLEVEL(loglevel);
    int errLevel = aDefaultErrLevel;
    getIntOption("errlevel", errLevel);
    bool dontLogErrors = getOption("dontlogerrors")!=NULL;
    SETERRLEVEL(errLevel, !dontLogErrors); // errors and more serious go to stderr, all log goes to stdout
  }
  else {
    int loglevel = LOG_CRIT; // almost no logging by default
    getIntOption("loglevel", loglevel);
    SETLOGLEVEL(loglevel);
  }
  SETDELTATIME(getOption("deltatstamps")!=NULL);
}
