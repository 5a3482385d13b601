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

#include "websocket.hpp"

#if ENABLE_UWSC && MAINLOOP_LIBEV_BASED

using namespace lb;

#if ENABLE_NAMED_ERRORS
const char* WebSocketError::errorName() const
{
  static const char* const errNames[numErrorCodes] = {
    "OK",
    "IOError",
    "InvalidHeader",
    "ServerMasked",
    "NotSupported",
    "PingTimeout",
    "Connect",
    "SSLHandshake",
  };
  ErrorCode c = getErrorCode();
  return c>=0 && c<numErrorCodes ? errNames[c] : NULL;
}
#endif // ENABLE_NAMED_ERRORS


WebSocketClient::WebSocketClient(MLMicroSeconds aPingInterval) :
  mUwscClient(NULL),
  mOpen(false),
  mPingInterval(aPingInterval)
{
}


WebSocketClient::~WebSocketClient()
{
  clearCallbacks();
  release(UWSC_CLOSE_STATUS_ABNORMAL_CLOSE, "websocket object deleted");
}


struct uwsc_client_wrapper {
  struct uwsc_client uwscClient;
  WebSocketClient* webSocketClientP;
};

void WebSocketClient::release(int aCloseCode, const char *aReason)
{
  mOpen = false;
  if (mUwscClient) {
    // Note: send_close eventually causes freeing uwsc_client automatically
    struct uwsc_client* cl = mUwscClient;
    mUwscClient = NULL;
    // late callbacks of the abandoned client must not reach this object any more
    ((struct uwsc_client_wrapper*)(void*)cl)->webSocketClientP = NULL;
    cl->send_close(cl, aCloseCode, aReason);
  }
}


static struct uwsc_client *wrapped_uwsc_new(
  WebSocketClient* aWebSocketClientP,
  struct ev_loop *aLoop, const char *aUrl,
  int aPingInterval, const char *aExtraHeader
) {
  struct uwsc_client_wrapper *wcl;

  wcl = (struct uwsc_client_wrapper*)malloc(sizeof(struct uwsc_client_wrapper));
  if (!wcl) {
    uwsc_log_err("malloc failed: %s\n", strerror(errno));
    return NULL;
  }
  wcl->webSocketClientP = aWebSocketClientP;
  if (uwsc_init((struct uwsc_client *)wcl, aLoop, aUrl, aPingInterval, aExtraHeader) < 0) {
    free(wcl);
    return NULL;
  }
  return (struct uwsc_client *)wcl;
}

static WebSocketClient* wsclient(struct uwsc_client* aCl)
{
  void* h = aCl;
  struct uwsc_client_wrapper* wcl = (struct uwsc_client_wrapper*)h;
  return wcl->webSocketClientP;
}


static void uwsc_onopen(struct uwsc_client *cl)
{
  WebSocketClient *c = wsclient(cl);
  if (c) c->cb_onopen();
}


static void uwsc_onmessage(struct uwsc_client *cl, void *data, size_t len, bool binary)
{
  WebSocketClient *c = wsclient(cl);
  if (!c) return;
  string msg;
  msg.assign((char *)data, len);
  c->cb_onmessage(msg);
}

static void uwsc_onerror(struct uwsc_client *cl, int err, const char *msg)
{
  WebSocketClient *c = wsclient(cl);
  if (c) c->cb_onerror(Error::err<WebSocketError>(err, "%s", msg));
}

static void uwsc_onclose(struct uwsc_client *cl, int code, const char *reason)
{
  WebSocketClient *c = wsclient(cl);
  // client frees itself after this, make sure no later callback reaches us
  ((struct uwsc_client_wrapper*)(void*)cl)->webSocketClientP = NULL;
  if (c) c->cb_onclose();
}


void WebSocketClient::cb_onopen()
{
  FOCUSLOG("websocket: onopen");
  mOpen = true;
  if (mConnectedCB) {
    StatusCB cb = mConnectedCB;
    mConnectedCB = NoOP;
    cb(ErrorPtr());
  }
}


void WebSocketClient::cb_onclose()
{
  FOCUSLOG("websocket: onclose");
  bool wasOpen = mOpen;
  mOpen = false;
  mUwscClient = NULL; // note: it frees itself on close
  if (mClosedCB) {
    // requested close
    SimpleCB cb = mClosedCB;
    mClosedCB = NoOP;
    cb();
  }
  else if (mConnectedCB) {
    StatusCB cb = mConnectedCB;
    mConnectedCB = NoOP;
    cb(Error::err<WebSocketError>(UWSC_ERROR_CONNECT, "closed while connecting"));
  }
  else if (wasOpen && mConnectionLostCB) {
    mConnectionLostCB(Error::err<WebSocketError>(UWSC_ERROR_IO, "closed by peer"));
  }
}


void WebSocketClient::cb_onmessage(const string &aMessage)
{
  FOCUSLOG("websocket: onmessage: %s", aMessage.c_str());
  if (mMessageCB) mMessageCB(aMessage);
}


void WebSocketClient::cb_onerror(ErrorPtr aError)
{
  FOCUSLOG("websocket: onerror: %s", Error::text(aError));
  bool wasOpen = mOpen;
  release(UWSC_CLOSE_STATUS_ABNORMAL_CLOSE, "error");
  if (mConnectedCB) {
    StatusCB cb = mConnectedCB;
    mConnectedCB = NoOP;
    cb(aError);
  }
  else if (wasOpen && mConnectionLostCB) {
    mConnectionLostCB(aError);
  }
}


void WebSocketClient::clearCallbacks()
{
  mConnectedCB = NoOP;
  mClosedCB = NoOP;
  inherited::clearCallbacks();
}


void WebSocketClient::connect(const string &aUrl, StatusCB aConnectedCB)
{
  // a previous, abandoned attempt must not report into this one
  mConnectedCB = NoOP;
  mClosedCB = NoOP;
  release(UWSC_CLOSE_STATUS_NORMAL, "reconnecting");
  mUwscClient = wrapped_uwsc_new(this, MainLoop::currentMainLoop().libevLoop(), aUrl.c_str(), (int)(mPingInterval/Second), NULL);
  if (!mUwscClient) {
    if (aConnectedCB) aConnectedCB(Error::err<WebSocketError>(UWSC_ERROR_CONNECT, "cannot connect to %s", aUrl.c_str()));
    return;
  }
  mUwscClient->onopen = uwsc_onopen;
  mUwscClient->onmessage = uwsc_onmessage;
  mUwscClient->onerror = uwsc_onerror;
  mUwscClient->onclose = uwsc_onclose;
  mConnectedCB = aConnectedCB;
}


void WebSocketClient::close(SimpleCB aClosedCB)
{
  mConnectedCB = NoOP;
  if (mUwscClient && mOpen) {
    mClosedCB = aClosedCB;
    mOpen = false;
    mUwscClient->send_close(mUwscClient, UWSC_CLOSE_STATUS_NORMAL, "daemon shutting down");
    return;
  }
  release(UWSC_CLOSE_STATUS_NORMAL, "closed while connecting");
  if (aClosedCB) aClosedCB();
}


ErrorPtr WebSocketClient::send(const string &aMessage)
{
  if (!mUwscClient || !mOpen) {
    return Error::err<WebSocketError>(UWSC_ERROR_CONNECT, "websocket is not connected");
  }
  if (mUwscClient->send(mUwscClient, aMessage.c_str(), aMessage.size(), UWSC_OP_TEXT)<0) {
    return Error::err<WebSocketError>(UWSC_ERROR_IO, "cannot send");
  }
  return ErrorPtr();
}

#endif // ENABLE_UWSC && MAINLOOP_LIBEV_BASED
