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

#ifndef __ledbetter__application__
#define __ledbetter__application__

#include "ledbetter_common.hpp"

#include <signal.h>

using namespace std;

namespace lb {

  class MainLoop;

  class Application : public LBObj
  {
    typedef LBObj inherited;

    MainLoop &mMainLoop;

    int mSignalPipeRead; ///< mainloop side of the signal self-pipe
    int mSignalPipeWrite; ///< signal handler side of the signal self-pipe

  public:
    /// construct application with specific mainloop
    Application(MainLoop &aMainLoop);

    /// construct application using current thread's mainloop
    Application();

    /// destructor
    virtual ~Application();

    /// main routine
    /// @param argc argument count as passed to C-level main() entry point
    /// @param argv argument pointer array as passed to C-level main() entry point
    virtual int main(int argc, char **argv);

    /// get mainloop of the app main thread (the thread the application was started from)
    MainLoop& mainLoop() { return mMainLoop; }

    /// terminate app
    /// @param aExitCode the exit code to return to the parent
    void terminateApp(int aExitCode);

    /// terminate app
    /// @param aError if NULL or ErrorOK, app will terminate with EXIT_SUCCESS
    ///   otherwise, app will log aError's description at LOG_ERR level and then terminate with EXIT_FAILURE
    void terminateAppWith(ErrorPtr aError);

    /// @return version of this application
    virtual string version() const;

  protected:

    /// start running the app's main loop
    int run();

    /// scheduled to run when mainloop has started
    virtual void initialize();

    /// called when mainloop terminates
    virtual void cleanup(int aExitCode);

    /// called on the mainloop (not in signal context) when a signal has occurred
    /// @note only SIGHUP, SIGINT, SIGTERM and SIGUSR1 are handled here
    virtual void signalOccurred(int aSignal);

  private:

    void initializeInternal();
    void handleSignal(int aSignal);
    static void sigaction_handler(int aSignal, siginfo_t *aSiginfo, void *aUap);
    bool signalPipeHandler(int aPollFlags);

  };


  /// standard option texts, can be used as part of setCommandDescriptors() string
  /// - logging options matching processStandardLogOptions()
  #define CMDLINE_APPLICATION_LOGOPTIONS \
    { 'l', "loglevel",       true,  "level;set max level of log message detail to show on stderr" }, \
    { 0  , "deltatstamps",   false, "show timestamp delta between log lines" }
  /// - for daemon apps
  #define DAEMON_APPLICATION_LOGOPTIONS \
    CMDLINE_APPLICATION_LOGOPTIONS, \
    { 0  , "errlevel",       true,  "level;set max level for log messages to go to stderr as well" }, \
    { 0  , "dontlogerrors",  false, "don't duplicate error messages (see --errlevel) on stdout" }
  /// - standard options every CmdLineApp understands
  #define CMDLINE_APPLICATION_STDOPTIONS \
    { 'V', "version",        false, "show version" }, \
    { 'h', "help",           false, "show this text" }


  /// Command line option descriptor
  /// @note a descriptor with both longOptionName==NULL and shortOptionChar=0 terminates a list of option descriptors
  typedef struct {
    char shortOptionChar; ///< the short option name (single character) or 0/NUL if none
    const char *longOptionName; ///< the long option name (string) or NULL if none
    bool withArgument; ///< true if option has an argument (separated by = or next argument)
    const char *optionDescription; ///< the description of the option, argument name separated by semicolon
    int optionIdentifier; ///< an optional identifier
  } CmdLineOptionDescriptor;

  typedef vector<string> ArgumentsVector;
  typedef map<string,string> OptionsMap;

  class CmdLineApp : public Application
  {
    typedef Application inherited;

    const CmdLineOptionDescriptor *mOptionDescriptors;

    string mInvocationName;
    string mSynopsis;
    OptionsMap mOptions;
    ArgumentsVector mArguments;

  public:

    CmdLineApp(MainLoop &aMainLoop = MainLoop::currentMainLoop());
    virtual ~CmdLineApp();

  protected:

    /// set command description constants (option definitions and synopsis)
    /// @param aSynopsis short usage description, used in showUsage(). %1$s will be replaced by invocationName
    /// @param aOptionDescriptors pointer to array of descriptors for the options
    void setCommandDescriptors(const char *aSynopsis, const CmdLineOptionDescriptor *aOptionDescriptors);

    /// show usage, consisting of invocationName + synopsis + option descriptions
    void showUsage();

    /// parse command line.
    /// @note this method might call terminateApp() in case of command line syntax errors or standard application
    ///   options such as help or version.
    /// @return false when app got terminated due to syntax errors or standard application options, true otherwise
    bool parseCommandLine(int aArgc, char **aArgv);

    /// process a command line option. Override this to implement processing command line options
    /// @return true if option has been processed; false if option should be stored for later reference via getOption()
    virtual bool processOption(const CmdLineOptionDescriptor &aOptionDescriptor, const char *aOptionValue);

    /// process a non-option command line argument
    /// @return true if argument has been processed; false if argument should be stored and counted by numArguments()
    virtual bool processArgument(const char *aArgument) { return false; /* not processed, store */ };

    /// parse standard logging options and configure logger
    /// @param aForDaemon if set, logger is configured for daemon (rather than command line utility)
    /// @param aDefaultErrLevel sets the default error level for daemons (usually LOG_ERR)
    void processStandardLogOptions(bool aForDaemon, int aDefaultErrLevel = LOG_ERR);

  public:

    /// get option
    /// @param aOptionName the name of the option (longOptionName if exists, shortOptionChar if no longOptionName exists)
    /// @param aDefaultValue this is returned in case the option is not specified, defaults to NULL
    /// @return aDefaultValue if option was not specified on the command line, empty string for options without argument, option's argument otherwise
    const char *getOption(const char *aOptionName, const char *aDefaultValue = NULL);

    /// @return true if option was specified and had a valid integer argument, false otherwise (aInteger will be untouched then)
    bool getIntOption(const char *aOptionName, int &aInteger);

    /// @return true if option was specified and had an option argument
    bool getStringOption(const char *aOptionName, string &aString);

    /// @return number of arguments not already processed by processArgument() returning true
    size_t numArguments();

  };

} // namespace lb


#endif /* defined(__ledbetter__application__) */
