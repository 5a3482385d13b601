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

#ifndef __ledbetter__websocket__
#define __ledbetter__websocket__

#include "ledbetter_common.hpp"

#if ENABLE_UWSC && MAINLOOP_LIBEV_BASED

#include "controlchannel.hpp"

extern "C" {
  #include <uwsc/uwsc.h>
}

using namespace std;

namespace lb {

  class WebSocketError : public Error
  {
  public:
    // Errors
    typedef int ErrorCodes; // using UWSC_ERROR_xxx
    static const int numErrorCodes = UWSC_ERROR_SSL_HANDSHAKE+1;

    static const char *domain() { return "websocket"; }
    virtual const char *getErrorDomain() const LB_OVERRIDE { return WebSocketError::domain(); };
    WebSocketError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const LB_OVERRIDE;
    #endif // ENABLE_NAMED_ERRORS
  };


  class WebSocketClient;
  typedef boost::intrusive_ptr<WebSocketClient> WebSocketClientPtr;

  /// controller connection over a websocket, using libuwsc on the libev based mainloop
  class WebSocketClient : public ControlTransport
  {
    typedef ControlTransport inherited;

    struct uwsc_client* mUwscClient;
    StatusCB mConnectedCB;
    SimpleCB mClosedCB;
    bool mOpen;
    MLMicroSeconds mPingInterval;

  public:

    /// @param aPingInterval websocket ping interval
    WebSocketClient(MLMicroSeconds aPingInterval = 30*Second);
    virtual ~WebSocketClient();

    virtual void connect(const string &aUrl, StatusCB aConnectedCB) LB_OVERRIDE;
    virtual ErrorPtr send(const string &aMessage) LB_OVERRIDE;
    virtual void close(SimpleCB aClosedCB) LB_OVERRIDE;
    virtual void clearCallbacks() LB_OVERRIDE;

    // helpers called from the uwsc callbacks
    void cb_onopen();
    void cb_onclose();
    void cb_onmessage(const string &aMessage);
    void cb_onerror(ErrorPtr aError);

  private:

    void release(int aCloseCode, const char *aReason);

  };

} // namespace lb

#endif // ENABLE_UWSC && MAINLOOP_LIBEV_BASED
#endif /* defined(__ledbetter__websocket__) */
