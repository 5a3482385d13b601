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

#ifndef __ledbetter__controlchannel__
#define __ledbetter__controlchannel__

#include "ledbetter_common.hpp"
#include "jsonobject.hpp"
#include "ledconfig.hpp"
#include "renderlink.hpp"

#include <boost/random/mersenne_twister.hpp>
#include <boost/random/uniform_real_distribution.hpp>

using namespace std;

namespace lb {

  /// control protocol errors
  class ProtocolError : public Error
  {
    int mRpcCode;
  public:
    typedef enum {
      OK,
      Malformed, ///< not JSON, not a valid request or invalid params
      Unsupported, ///< unknown method
      ConnectionLost, ///< transport failed or was closed
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "Protocol"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return ProtocolError::domain(); };
    ProtocolError(ErrorCodes aError) : Error(ErrorCode(aError)), mRpcCode(0) {};

    /// create a protocol error to be reported as a JSON-RPC error response
    static ErrorPtr rpcErr(ErrorCodes aError, int aRpcCode, const char *aFmt, ...) __printflike(3,4);

    /// @return the JSON-RPC error code to report for any error
    static int rpcCodeFor(ErrorPtr aError);

    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const LB_OVERRIDE
    {
      static const char* const errNames[numErrorCodes] = { "OK", "Malformed", "Unsupported", "ConnectionLost" };
      return getErrorCode()<numErrorCodes ? errNames[getErrorCode()] : NULL;
    }
    #endif // ENABLE_NAMED_ERRORS
  };

  /// JSON-RPC 2.0 error codes
  enum {
    jsonrpc_parseError = -32700,
    jsonrpc_invalidRequest = -32600,
    jsonrpc_methodNotFound = -32601,
    jsonrpc_invalidParams = -32602,
    jsonrpc_internalError = -32603,
    jsonrpc_compileError = -32000
  };


  typedef boost::function<void (const string &aMessage)> TransportMessageCB;

  class ControlTransport;
  typedef boost::intrusive_ptr<ControlTransport> ControlTransportPtr;

  /// persistent duplex text message connection to the controller
  class ControlTransport : public LBObj
  {
  protected:

    TransportMessageCB mMessageCB;
    StatusCB mConnectionLostCB;

  public:

    /// open the connection
    /// @param aUrl where to connect to
    /// @param aConnectedCB called once with OK when connected, or with the error when connecting failed
    virtual void connect(const string &aUrl, StatusCB aConnectedCB) = 0;

    /// send a text message
    virtual ErrorPtr send(const string &aMessage) = 0;

    /// close gracefully
    /// @param aClosedCB called when closed
    virtual void close(SimpleCB aClosedCB) = 0;

    /// set handler for received messages
    void setMessageHandler(TransportMessageCB aMessageCB) { mMessageCB = aMessageCB; }

    /// set handler called when an established connection is lost (not on close())
    void setConnectionLostHandler(StatusCB aConnectionLostCB) { mConnectionLostCB = aConnectionLostCB; }

    /// clear all callbacks
    virtual void clearCallbacks() { mMessageCB = NoOP; mConnectionLostCB = NoOP; }

  };


  /// exponential reconnect backoff with jitter
  class ReconnectBackoff
  {
    ReconnectParams mParams;
    MLMicroSeconds mBase;
    boost::random::mt19937 mRng;
    boost::random::uniform_real_distribution<double> mJitter;

  public:

    ReconnectBackoff(const ReconnectParams &aParams = ReconnectParams(), uint32_t aSeed = 0);

    /// @return the next interval to wait, non-decreasing up to the maximum
    MLMicroSeconds next();

    /// back to the minimum interval
    void reset() { mBase = mParams.minInterval; }

    /// report how long the last connection lasted, resets the backoff if long enough
    void connectionLasted(MLMicroSeconds aDuration);

    MLMicroSeconds base() const { return mBase; }

  };


  typedef enum {
    session_disconnected,
    session_connecting,
    session_connected
  } SessionState;

  const char *sessionStateName(SessionState aState);


  class ControlChannel;
  typedef boost::intrusive_ptr<ControlChannel> ControlChannelPtr;

  /// Keeps the connection to the controller and executes its JSON-RPC requests
  class ControlChannel : public LBLoggingObj
  {
    typedef LBLoggingObj inherited;

    ControlTransportPtr mTransport;
    RenderLink &mLink;
    string mName;
    string mVersion;
    string mUrl;
    SandboxParams mSandboxParams;
    LedConfig mConfig; ///< last accepted config
    uint64_t mConfigSerial;

    ReconnectBackoff mBackoff;
    SessionState mState;
    uint32_t mAttempt;
    MLMicroSeconds mConnectedSince;
    MLMicroSeconds mBackoffDeadline;
    MLMicroSeconds mConnectTimeout;
    MLTicket mReconnectTicket;
    MLTicket mConnectTimeoutTicket;

  public:

    /// @param aTransport the connection to use
    /// @param aLink the render thread's hand-off point
    /// @param aConfig daemon configuration (name, controller address, initial LED config, sandbox and reconnect parameters)
    /// @param aVersion version reported in the hello message
    ControlChannel(ControlTransportPtr aTransport, RenderLink &aLink, const DaemonConfig &aConfig, const string &aVersion);
    virtual ~ControlChannel();

    virtual string logContextPrefix() LB_OVERRIDE;

    /// start connecting
    void start();

    /// close the connection, no reconnects afterwards
    /// @param aClosedCB called when closed
    void close(SimpleCB aClosedCB);

    /// process one received message
    void handleMessage(const string &aMessage);

    SessionState state() const { return mState; }
    uint32_t attempt() const { return mAttempt; }
    MLMicroSeconds backoffDeadline() const { return mBackoffDeadline; }
    void setConnectTimeout(MLMicroSeconds aTimeout) { mConnectTimeout = aTimeout; }
    const LedConfig &config() const { return mConfig; }

  private:

    void connect();
    void connectResult(ErrorPtr aError);
    void connectTimedOut();
    void connectionLost(ErrorPtr aError);
    void scheduleReconnect();
    void sendHello();
    void sendJson(JsonObjectPtr aMessage);
    void sendResult(JsonObjectPtr aId, JsonObjectPtr aResult);
    void sendError(JsonObjectPtr aId, ErrorPtr aError);

    ErrorPtr processRequest(JsonObjectPtr aRequest, JsonObjectPtr &aResult);
    ErrorPtr loadProgram(JsonObjectPtr aParams, JsonObjectPtr &aResult);
    ErrorPtr setConfig(JsonObjectPtr aParams, JsonObjectPtr &aResult);
    JsonObjectPtr statusJson();

  };

} // namespace lb

#endif /* defined(__ledbetter__controlchannel__) */
