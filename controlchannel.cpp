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

#include "controlchannel.hpp"

#include "wasmengine.hpp"

using namespace lb;


// MARK: - ProtocolError

ErrorPtr ProtocolError::rpcErr(ErrorCodes aError, int aRpcCode, const char *aFmt, ...)
{
  ProtocolError *errP = new ProtocolError(aError);
  errP->mRpcCode = aRpcCode;
  va_list args;
  va_start(args, aFmt);
  errP->setFormattedMessage(aFmt, args, false);
  va_end(args);
  return ErrorPtr(errP);
}


int ProtocolError::rpcCodeFor(ErrorPtr aError)
{
  if (!aError) return jsonrpc_internalError;
  ProtocolError *pe = dynamic_cast<ProtocolError *>(aError.get());
  if (pe) {
    if (pe->mRpcCode) return pe->mRpcCode;
    return pe->getErrorCode()==Unsupported ? jsonrpc_methodNotFound : jsonrpc_invalidRequest;
  }
  if (aError->isDomain(CompileError::domain())) return jsonrpc_compileError;
  if (aError->isDomain(ConfigError::domain())) return jsonrpc_invalidParams;
  return jsonrpc_internalError;
}


// MARK: - ReconnectBackoff

ReconnectBackoff::ReconnectBackoff(const ReconnectParams &aParams, uint32_t aSeed) :
  mParams(aParams),
  mBase(aParams.minInterval),
  mRng(aSeed ? aSeed : (uint32_t)MainLoop::unixtime()),
  mJitter(0.0, 0.25)
{
}


MLMicroSeconds ReconnectBackoff::next()
{
  MLMicroSeconds interval = mBase+(MLMicroSeconds)(mBase*mJitter(mRng));
  if (interval>mParams.maxInterval) interval = mParams.maxInterval;
  mBase = mBase*2>mParams.maxInterval ? mParams.maxInterval : mBase*2;
  return interval;
}


void ReconnectBackoff::connectionLasted(MLMicroSeconds aDuration)
{
  if (aDuration>=mParams.resetAfter) reset();
}


const char *lb::sessionStateName(SessionState aState)
{
  switch (aState) {
    case session_disconnected: return "disconnected";
    case session_connecting: return "connecting";
    case session_connected: return "connected";
  }
  return "unknown";
}


// MARK: - ControlChannel session

ControlChannel::ControlChannel(ControlTransportPtr aTransport, RenderLink &aLink, const DaemonConfig &aConfig, const string &aVersion) :
  mTransport(aTransport),
  mLink(aLink),
  mName(aConfig.name),
  mVersion(aVersion),
  mUrl(aConfig.controllerUrl()),
  mSandboxParams(aConfig.sandbox),
  mConfig(aConfig.led),
  mConfigSerial(0),
  mBackoff(aConfig.reconnect),
  mState(session_disconnected),
  mAttempt(0),
  mConnectedSince(Never),
  mBackoffDeadline(Never),
  mConnectTimeout(10*Second)
{
  mTransport->setMessageHandler(boost::bind(&ControlChannel::handleMessage, this, _1));
  mTransport->setConnectionLostHandler(boost::bind(&ControlChannel::connectionLost, this, _1));
}


ControlChannel::~ControlChannel()
{
  mTransport->clearCallbacks();
}


string ControlChannel::logContextPrefix()
{
  return string_format("control %s", sessionStateName(mState));
}


void ControlChannel::start()
{
  mAttempt = 0;
  mBackoff.reset();
  connect();
}


void ControlChannel::connect()
{
  mReconnectTicket.cancel();
  mState = session_connecting;
  OLOG(LOG_INFO, "connecting to %s (attempt %u)", mUrl.c_str(), mAttempt);
  mConnectTimeoutTicket.executeOnce(boost::bind(&ControlChannel::connectTimedOut, this), mConnectTimeout);
  mTransport->connect(mUrl, boost::bind(&ControlChannel::connectResult, this, _1));
}


void ControlChannel::connectResult(ErrorPtr aError)
{
  if (mState!=session_connecting) return; // late result of an abandoned attempt
  mConnectTimeoutTicket.cancel();
  if (Error::isOK(aError)) {
    mState = session_connected;
    mConnectedSince = MainLoop::now();
    OLOG(LOG_NOTICE, "connected to %s", mUrl.c_str());
    sendHello();
    return;
  }
  OLOG(LOG_WARNING, "connecting to %s failed: %s", mUrl.c_str(), aError->text());
  scheduleReconnect();
}


void ControlChannel::connectTimedOut()
{
  OLOG(LOG_WARNING, "connecting to %s timed out", mUrl.c_str());
  mState = session_disconnected;
  mTransport->close(NoOP);
  scheduleReconnect();
}


void ControlChannel::connectionLost(ErrorPtr aError)
{
  if (mState!=session_connected) return;
  MLMicroSeconds lasted = MainLoop::now()-mConnectedSince;
  mBackoff.connectionLasted(lasted);
  OLOG(LOG_WARNING, "connection lost after %lld seconds: %s", (long long)(lasted/Second), Error::text(aError));
  scheduleReconnect();
}


void ControlChannel::scheduleReconnect()
{
  mState = session_connecting;
  mAttempt++;
  MLMicroSeconds interval = mBackoff.next();
  mBackoffDeadline = MainLoop::now()+interval;
  OLOG(LOG_INFO, "reconnecting in %.1f seconds", (double)interval/Second);
  mReconnectTicket.executeOnceAt(boost::bind(&ControlChannel::connect, this), mBackoffDeadline);
}


void ControlChannel::close(SimpleCB aClosedCB)
{
  OLOG(LOG_INFO, "closing");
  mState = session_disconnected;
  mReconnectTicket.cancel();
  mConnectTimeoutTicket.cancel();
  mTransport->close(aClosedCB);
}


// MARK: - ControlChannel messages

void ControlChannel::sendJson(JsonObjectPtr aMessage)
{
  if (mState!=session_connected) return;
  ErrorPtr err = mTransport->send(aMessage->json_str());
  if (Error::notOK(err)) {
    OLOG(LOG_WARNING, "cannot send: %s", err->text());
  }
}


void ControlChannel::sendHello()
{
  JsonObjectPtr params = JsonObject::newObj();
  params->add("name", JsonObject::newString(mName));
  params->add("version", JsonObject::newString(mVersion));
  params->add("abi_version", JsonObject::newInt32(ProgramAbiVersion));
  params->add("pixel_count", JsonObject::newInt32(mConfig.pixelCount));
  JsonObjectPtr msg = JsonObject::newObj();
  msg->add("jsonrpc", JsonObject::newString("2.0"));
  msg->add("method", JsonObject::newString("hello"));
  msg->add("params", params);
  sendJson(msg);
}


void ControlChannel::sendResult(JsonObjectPtr aId, JsonObjectPtr aResult)
{
  JsonObjectPtr msg = JsonObject::newObj();
  msg->add("jsonrpc", JsonObject::newString("2.0"));
  msg->add("id", aId);
  msg->add("result", aResult);
  sendJson(msg);
}


void ControlChannel::sendError(JsonObjectPtr aId, ErrorPtr aError)
{
  JsonObjectPtr e = JsonObject::newObj();
  e->add("code", JsonObject::newInt32(ProtocolError::rpcCodeFor(aError)));
  e->add("message", JsonObject::newString(aError->getErrorMessage()));
  JsonObjectPtr msg = JsonObject::newObj();
  msg->add("jsonrpc", JsonObject::newString("2.0"));
  msg->add("id", aId);
  msg->add("error", e);
  sendJson(msg);
}


void ControlChannel::handleMessage(const string &aMessage)
{
  FOCUSOLOG("received: %s", aMessage.c_str());
  ErrorPtr err;
  JsonObjectPtr msg = JsonObject::objFromText(aMessage.c_str(), aMessage.size(), &err);
  if (Error::notOK(err) || !msg) {
    err = ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_parseError, "Parse error: %s", Error::text(err));
    OLOG(LOG_WARNING, "malformed message: %s", err->text());
    sendError(JsonObjectPtr(), err);
    return;
  }
  if (!msg->isType(json_type_object)) {
    err = ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidRequest, "Invalid Request: not an object");
    OLOG(LOG_WARNING, "malformed message: %s", err->text());
    sendError(JsonObjectPtr(), err);
    return;
  }
  JsonObjectPtr o;
  bool hasMethod = msg->get("method", o);
  if (!hasMethod && (msg->get("result", o) || msg->get("error", o))) {
    FOCUSOLOG("ignoring response message");
    return;
  }
  JsonObjectPtr id;
  bool hasId = msg->get("id", id);
  if (hasId && id && !id->isNumber() && !id->isType(json_type_string)) {
    err = ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidRequest, "Invalid Request: bad id");
    id.reset();
  }
  else if (!msg->get("jsonrpc", o) || !o || o->stringValue()!="2.0") {
    err = ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
  }
  else if (!hasMethod || !msg->get("method", o) || !o || !o->isType(json_type_string)) {
    err = ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidRequest, "Invalid Request: method missing");
  }
  JsonObjectPtr result;
  if (Error::isOK(err)) {
    err = processRequest(msg, result);
  }
  if (Error::notOK(err)) {
    OLOG(LOG_WARNING, "request failed: %s", err->text());
    if (hasId) sendError(id, err);
    return;
  }
  if (hasId) sendResult(id, result);
}


ErrorPtr ControlChannel::processRequest(JsonObjectPtr aRequest, JsonObjectPtr &aResult)
{
  string method = aRequest->get("method")->stringValue();
  JsonObjectPtr params;
  if (aRequest->get("params", params, true) && !params->isType(json_type_object)) {
    return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: must be an object");
  }
  OLOG(LOG_INFO, "request '%s'", method.c_str());
  if (method=="load_program") {
    return loadProgram(params, aResult);
  }
  else if (method=="set_config") {
    return setConfig(params, aResult);
  }
  else if (method=="ping") {
    aResult = JsonObject::newString("pong");
  }
  else if (method=="get_status") {
    aResult = statusJson();
  }
  else if (method=="pause" || method=="play") {
    bool pause = method=="pause";
    if (pause!=mLink.pauseRequested) {
      OLOG(LOG_NOTICE, "%s", pause ? "paused" : "playing");
    }
    mLink.pauseRequested = pause;
    aResult = statusJson();
  }
  else if (method=="reverse_auth") {
    JsonObjectPtr challenge;
    if (!params || !params->get("challenge", challenge, true) || !challenge->isType(json_type_string)) {
      return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: challenge string required");
    }
    aResult = JsonObject::newNull();
  }
  else {
    return ProtocolError::rpcErr(ProtocolError::Unsupported, jsonrpc_methodNotFound, "Method not found: %s", method.c_str());
  }
  return ErrorPtr();
}


ErrorPtr ControlChannel::loadProgram(JsonObjectPtr aParams, JsonObjectPtr &aResult)
{
  JsonObjectPtr o;
  if (!aParams || !aParams->get("program", o, true) || !o->isType(json_type_string)) {
    return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: program string required");
  }
  string encoded = o->stringValue();
  string encoding = "base64";
  if (aParams->get("encoding", o, true)) encoding = o->stringValue();
  string binary;
  bool decoded;
  if (encoding=="base64") decoded = base64ToBinaryString(encoded, binary);
  else if (encoding=="hex") decoded = hexToBinaryString(encoded.c_str(), binary);
  else {
    return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: unknown encoding '%s'", encoding.c_str());
  }
  if (!decoded) {
    return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: program is not valid %s", encoding.c_str());
  }
  WasmModulePtr module;
  ErrorPtr err = ProgramSandbox::compile(binary, mSandboxParams, module);
  if (Error::notOK(err)) return err;
  if (mLink.program.publish(module)) {
    OLOG(LOG_INFO, "replaced a program not yet taken by the render thread");
  }
  aResult = JsonObject::newObj();
  aResult->add("accepted", JsonObject::newBool(true));
  aResult->add("bytes", JsonObject::newInt64((int64_t)binary.size()));
  return ErrorPtr();
}


ErrorPtr ControlChannel::setConfig(JsonObjectPtr aParams, JsonObjectPtr &aResult)
{
  if (!aParams) {
    return ProtocolError::rpcErr(ProtocolError::Malformed, jsonrpc_invalidParams, "Invalid params: config object required");
  }
  LedConfig merged;
  ErrorPtr err = mConfig.mergedWith(aParams, merged);
  if (Error::notOK(err)) return err;
  mConfig = merged;
  ConfigUpdatePtr update = ConfigUpdatePtr(new ConfigUpdate(mConfig, ++mConfigSerial));
  mLink.config.publish(update);
  aResult = mConfig.json();
  return ErrorPtr();
}


JsonObjectPtr ControlChannel::statusJson()
{
  const RenderStatus &s = mLink.status;
  bool paused = mLink.pauseRequested;
  JsonObjectPtr j = JsonObject::newObj();
  j->add("status", JsonObject::newString(!s.programActive ? "NotPlaying" : (paused ? "Paused" : "Playing")));
  j->add("generation", JsonObject::newInt64((int64_t)s.generation.load()));
  j->add("frames", JsonObject::newInt64((int64_t)s.frames.load()));
  j->add("overruns", JsonObject::newInt64((int64_t)s.overruns.load()));
  j->add("faults", JsonObject::newInt64((int64_t)s.faults.load()));
  j->add("state", JsonObject::newString(schedulerStateName((SchedulerState)s.state.load())));
  j->add("display_degraded", JsonObject::newBool(s.displayDegraded));
  j->add("paused", JsonObject::newBool(paused));
  return j;
}
