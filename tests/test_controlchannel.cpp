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

#include <catch2/catch_all.hpp>

#include "controlchannel.hpp"
#include "wasmbuilder.hpp"

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/transform_width.hpp>

using namespace lb;
using namespace wasmtest;

/// transport recording what the channel does with it
class FakeTransport : public ControlTransport
{
public:
  int mConnects;
  int mCloses;
  string mUrl;
  StatusCB mConnectedCB;
  SimpleCB mOnConnect;
  std::vector<string> mSent;

  FakeTransport() : mConnects(0), mCloses(0) {};

  virtual void connect(const string &aUrl, StatusCB aConnectedCB) LB_OVERRIDE
  {
    mConnects++;
    mUrl = aUrl;
    mConnectedCB = aConnectedCB;
    if (mOnConnect) mOnConnect();
  }

  virtual ErrorPtr send(const string &aMessage) LB_OVERRIDE
  {
    mSent.push_back(aMessage);
    return ErrorPtr();
  }

  virtual void close(SimpleCB aClosedCB) LB_OVERRIDE
  {
    mCloses++;
    if (aClosedCB) aClosedCB();
  }

  void connectResult(ErrorPtr aError)
  {
    StatusCB cb = mConnectedCB;
    mConnectedCB = NoOP;
    if (cb) cb(aError);
  }

  void receive(const string &aMessage)
  {
    if (mMessageCB) mMessageCB(aMessage);
  }

  void lose()
  {
    if (mConnectionLostCB) mConnectionLostCB(Error::err<ProtocolError>(ProtocolError::ConnectionLost, "peer went away"));
  }
};
typedef boost::intrusive_ptr<FakeTransport> FakeTransportPtr;


static string toBase64(const string &aBinary)
{
  using namespace boost::archive::iterators;
  typedef base64_from_binary<transform_width<string::const_iterator, 6, 8> > B64It;
  string b64(B64It(aBinary.begin()), B64It(aBinary.end()));
  b64.append((3-aBinary.size()%3)%3, '=');
  return b64;
}


class ChannelFixture {

public:

  MainLoop &mMainloop;
  RenderLink mLink;
  DaemonConfig mConfig;
  FakeTransportPtr mTransport;
  ControlChannelPtr mChannel;
  MLTicket mTimeoutTicket;
  bool mClosed;

  ChannelFixture() :
    mMainloop(MainLoop::currentMainLoop()),
    mClosed(false)
  {
    mConfig.name = "test-strip";
    mConfig.controllerHost = "controller.local";
    mConfig.controllerPort = 8080;
    mConfig.controllerPath = "/leds";
    mConfig.reconnect.minInterval = 10*MilliSecond;
    mConfig.reconnect.maxInterval = 40*MilliSecond;
    mConfig.reconnect.resetAfter = 60*Second;
    mTransport = FakeTransportPtr(new FakeTransport);
    mChannel = ControlChannelPtr(new ControlChannel(mTransport, mLink, mConfig, "1.2.3"));
  };

  ~ChannelFixture()
  {
    mChannel->close(NoOP);
  };

  void connect()
  {
    mChannel->start();
    mTransport->connectResult(ErrorPtr());
    REQUIRE(mChannel->state() == session_connected);
    mTransport->mSent.clear();
  }

  /// @return the single reply to aRequest, NULL if none
  JsonObjectPtr request(const string &aRequest)
  {
    mTransport->mSent.clear();
    mTransport->receive(aRequest);
    if (mTransport->mSent.empty()) return JsonObjectPtr();
    REQUIRE(mTransport->mSent.size() == 1);
    JsonObjectPtr reply = JsonObject::objFromText(mTransport->mSent[0].c_str());
    REQUIRE(reply);
    return reply;
  }

  int errorCode(JsonObjectPtr aReply)
  {
    JsonObjectPtr e;
    if (!aReply || !aReply->get("error", e, true)) return 0;
    return e->get("code")->int32Value();
  }

  void runMainloop()
  {
    mTimeoutTicket.executeOnce(boost::bind(&ChannelFixture::timedOut, this), 5*Second);
    mMainloop.run(true);
    mTimeoutTicket.cancel();
  }

  void timedOut()
  {
    mMainloop.terminate(EXIT_FAILURE);
  }

  void terminateAtConnect(int aCount)
  {
    if (mTransport->mConnects>=aCount) mMainloop.terminate(EXIT_SUCCESS);
  }

  void closed() { mClosed = true; }

};


// MARK: - session

TEST_CASE_METHOD(ChannelFixture, "hello after connecting", "[controlchannel]") {
  mChannel->start();
  REQUIRE(mTransport->mConnects == 1);
  REQUIRE(mTransport->mUrl == "ws://controller.local:8080/leds");
  REQUIRE(mChannel->state() == session_connecting);
  REQUIRE(mTransport->mSent.empty());
  mTransport->connectResult(ErrorPtr());
  REQUIRE(mChannel->state() == session_connected);
  REQUIRE(mTransport->mSent.size() == 1);
  JsonObjectPtr hello = JsonObject::objFromText(mTransport->mSent[0].c_str());
  REQUIRE(hello);
  REQUIRE(hello->get("jsonrpc")->stringValue() == "2.0");
  REQUIRE(hello->get("method")->stringValue() == "hello");
  JsonObjectPtr o;
  REQUIRE_FALSE(hello->get("id", o));
  JsonObjectPtr p = hello->get("params");
  REQUIRE(p->get("name")->stringValue() == "test-strip");
  REQUIRE(p->get("version")->stringValue() == "1.2.3");
  REQUIRE(p->get("abi_version")->int32Value() == ProgramAbiVersion);
  REQUIRE(p->get("pixel_count")->int32Value() == mConfig.led.pixelCount);
}

TEST_CASE_METHOD(ChannelFixture, "failed connect schedules a reconnect", "[controlchannel]") {
  mChannel->start();
  MLMicroSeconds before = MainLoop::now();
  mTransport->connectResult(Error::err<ProtocolError>(ProtocolError::ConnectionLost, "refused"));
  REQUIRE(mChannel->attempt() == 1);
  REQUIRE(mChannel->state() == session_connecting);
  REQUIRE(mChannel->backoffDeadline() >= before+10*MilliSecond);
  REQUIRE(mChannel->backoffDeadline() <= MainLoop::now()+40*MilliSecond);
  mTransport->mOnConnect = boost::bind(&ChannelFixture::terminateAtConnect, this, 2);
  runMainloop();
  REQUIRE(mTransport->mConnects == 2);
  mTransport->connectResult(ErrorPtr());
  REQUIRE(mChannel->state() == session_connected);
}

TEST_CASE_METHOD(ChannelFixture, "connect attempts time out", "[controlchannel]") {
  mChannel->setConnectTimeout(20*MilliSecond);
  mTransport->mOnConnect = boost::bind(&ChannelFixture::terminateAtConnect, this, 2);
  mChannel->start();
  runMainloop();
  REQUIRE(mTransport->mCloses == 1);
  REQUIRE(mTransport->mConnects == 2);
  REQUIRE(mChannel->attempt() == 1);
}

TEST_CASE_METHOD(ChannelFixture, "lost connection reconnects", "[controlchannel]") {
  connect();
  mTransport->lose();
  REQUIRE(mChannel->state() == session_connecting);
  REQUIRE(mChannel->attempt() == 1);
  // a second report for the same loss does not count again
  mTransport->lose();
  REQUIRE(mChannel->attempt() == 1);
  mTransport->mOnConnect = boost::bind(&ChannelFixture::terminateAtConnect, this, 2);
  runMainloop();
  REQUIRE(mTransport->mConnects == 2);
}

TEST_CASE_METHOD(ChannelFixture, "close stops reconnecting", "[controlchannel]") {
  mChannel->start();
  mTransport->connectResult(Error::err<ProtocolError>(ProtocolError::ConnectionLost, "refused"));
  mChannel->close(boost::bind(&ChannelFixture::closed, this));
  REQUIRE(mClosed);
  REQUIRE(mChannel->state() == session_disconnected);
  // nothing must connect within a few backoff periods
  mTimeoutTicket.executeOnce(boost::bind(&MainLoop::terminate, &mMainloop, EXIT_SUCCESS), 150*MilliSecond);
  mMainloop.run(true);
  REQUIRE(mTransport->mConnects == 1);
}

TEST_CASE("reconnect backoff", "[controlchannel]") {
  ReconnectParams p;
  p.minInterval = 1*Second;
  p.maxInterval = 8*Second;
  p.resetAfter = 60*Second;
  ReconnectBackoff backoff(p, 42);
  MLMicroSeconds last = 0;
  for (int i=0; i<10; i++) {
    MLMicroSeconds base = backoff.base();
    MLMicroSeconds n = backoff.next();
    REQUIRE(n >= last);
    REQUIRE(n >= base);
    REQUIRE(n <= p.maxInterval);
    REQUIRE(n <= base+base/4);
    last = n;
  }
  REQUIRE(last == p.maxInterval);
  backoff.connectionLasted(59*Second);
  REQUIRE(backoff.base() == p.maxInterval);
  backoff.connectionLasted(60*Second);
  REQUIRE(backoff.base() == p.minInterval);
  MLMicroSeconds n = backoff.next();
  REQUIRE(n >= 1*Second);
  REQUIRE(n <= 1250*MilliSecond);
}


// MARK: - requests

TEST_CASE_METHOD(ChannelFixture, "JSON-RPC framing", "[controlchannel]") {
  connect();
  JsonObjectPtr o;
  SECTION("parse error") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", ");
    REQUIRE(errorCode(r) == -32700);
    REQUIRE(r->get("id", o));
    REQUIRE_FALSE(o);
  }
  SECTION("not an object") {
    REQUIRE(errorCode(request("[1, 2, 3]")) == -32600);
  }
  SECTION("wrong version") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"1.0\", \"id\": 7, \"method\": \"ping\" }");
    REQUIRE(errorCode(r) == -32600);
    REQUIRE(r->get("id")->int32Value() == 7);
  }
  SECTION("missing method") {
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 1 }")) == -32600);
  }
  SECTION("bad id") {
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": [1], \"method\": \"ping\" }")) == -32600);
  }
  SECTION("unknown method") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": \"abc\", \"method\": \"explode\" }");
    REQUIRE(errorCode(r) == -32601);
    REQUIRE(r->get("id")->stringValue() == "abc");
  }
  SECTION("params must be an object") {
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"ping\", \"params\": [1] }")) == -32602);
  }
  SECTION("notifications get no reply") {
    REQUIRE_FALSE(request("{ \"jsonrpc\": \"2.0\", \"method\": \"ping\" }"));
    REQUIRE_FALSE(request("{ \"jsonrpc\": \"2.0\", \"method\": \"explode\" }"));
  }
  SECTION("responses are ignored") {
    REQUIRE_FALSE(request("{ \"jsonrpc\": \"2.0\", \"id\": 3, \"result\": true }"));
  }
  SECTION("ping") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"ping\" }");
    REQUIRE(errorCode(r) == 0);
    REQUIRE(r->get("result")->stringValue() == "pong");
    REQUIRE(r->get("id")->int32Value() == 1);
  }
}

TEST_CASE_METHOD(ChannelFixture, "no replies while disconnected", "[controlchannel]") {
  REQUIRE_FALSE(request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"ping\" }"));
}

TEST_CASE_METHOD(ChannelFixture, "load_program", "[controlchannel]") {
  connect();
  string program = solidProgram(255, 0, 0);
  SECTION("base64") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": { \"program\": \""+toBase64(program)+"\" } }");
    REQUIRE(errorCode(r) == 0);
    REQUIRE(r->get("result")->get("accepted")->boolValue());
    REQUIRE(r->get("result")->get("bytes")->int32Value() == (int)program.size());
    WasmModulePtr m = mLink.program.take();
    REQUIRE(m);
  }
  SECTION("hex") {
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": { \"program\": \""+binaryToHexString(program)+"\", \"encoding\": \"hex\" } }");
    REQUIRE(errorCode(r) == 0);
    REQUIRE(mLink.program.pending());
  }
  SECTION("invalid program") {
    string bad = program.substr(0, program.size()-3);
    JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": { \"program\": \""+toBase64(bad)+"\" } }");
    REQUIRE(errorCode(r) == -32000);
    REQUIRE_FALSE(mLink.program.pending());
  }
  SECTION("bad encoding") {
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": { \"program\": \"!!!\" } }")) == -32602);
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": { \"program\": \"00\", \"encoding\": \"rot13\" } }")) == -32602);
    REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"load_program\", \"params\": {} }")) == -32602);
    REQUIRE_FALSE(mLink.program.pending());
  }
}

TEST_CASE_METHOD(ChannelFixture, "set_config", "[controlchannel]") {
  connect();
  JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"set_config\", \"params\": { \"brightness\": 0.5 } }");
  REQUIRE(errorCode(r) == 0);
  REQUIRE(r->get("result")->get("brightness")->doubleValue() == Catch::Approx(0.5));
  ConfigUpdatePtr u = mLink.config.take();
  REQUIRE(u);
  REQUIRE(u->serial == 1);
  REQUIRE(u->config.brightness == Catch::Approx(0.5));
  REQUIRE(u->config.pixelCount == mConfig.led.pixelCount);
  SECTION("invalid update changes nothing") {
    r = request("{ \"jsonrpc\": \"2.0\", \"id\": 2, \"method\": \"set_config\", \"params\": { \"pixel_count\": 10, \"brightness\": 7 } }");
    REQUIRE(errorCode(r) == -32602);
    REQUIRE_FALSE(mLink.config.pending());
    REQUIRE(mChannel->config().pixelCount == mConfig.led.pixelCount);
    REQUIRE(mChannel->config().brightness == Catch::Approx(0.5));
  }
  SECTION("updates accumulate") {
    r = request("{ \"jsonrpc\": \"2.0\", \"id\": 2, \"method\": \"set_config\", \"params\": { \"pixel_count\": 10 } }");
    REQUIRE(errorCode(r) == 0);
    u = mLink.config.take();
    REQUIRE(u->serial == 2);
    REQUIRE(u->config.pixelCount == 10);
    REQUIRE(u->config.brightness == Catch::Approx(0.5));
  }
}

TEST_CASE_METHOD(ChannelFixture, "status, pause and play", "[controlchannel]") {
  connect();
  mLink.status.frames = 1234;
  mLink.status.generation = 3;
  mLink.status.programActive = true;
  mLink.status.state = scheduler_running;
  JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"get_status\" }");
  JsonObjectPtr s = r->get("result");
  REQUIRE(s->get("status")->stringValue() == "Playing");
  REQUIRE(s->get("frames")->int64Value() == 1234);
  REQUIRE(s->get("generation")->int64Value() == 3);
  REQUIRE(s->get("state")->stringValue() == "running");
  REQUIRE_FALSE(s->get("display_degraded")->boolValue());
  r = request("{ \"jsonrpc\": \"2.0\", \"id\": 2, \"method\": \"pause\" }");
  REQUIRE(mLink.pauseRequested);
  REQUIRE(r->get("result")->get("status")->stringValue() == "Paused");
  r = request("{ \"jsonrpc\": \"2.0\", \"id\": 3, \"method\": \"play\" }");
  REQUIRE_FALSE(mLink.pauseRequested);
  REQUIRE(r->get("result")->get("status")->stringValue() == "Playing");
}

TEST_CASE_METHOD(ChannelFixture, "reverse_auth", "[controlchannel]") {
  connect();
  JsonObjectPtr o;
  JsonObjectPtr r = request("{ \"jsonrpc\": \"2.0\", \"id\": 1, \"method\": \"reverse_auth\", \"params\": { \"challenge\": \"xyz\" } }");
  REQUIRE(errorCode(r) == 0);
  REQUIRE(r->get("result", o));
  REQUIRE_FALSE(o);
  REQUIRE(errorCode(request("{ \"jsonrpc\": \"2.0\", \"id\": 2, \"method\": \"reverse_auth\" }")) == -32602);
}

TEST_CASE("JSON-RPC error codes for errors", "[controlchannel]") {
  REQUIRE(ProtocolError::rpcCodeFor(Error::err<CompileError>(CompileError::Malformed, "x")) == -32000);
  REQUIRE(ProtocolError::rpcCodeFor(Error::err<ConfigError>(ConfigError::Invalid, "x")) == -32602);
  REQUIRE(ProtocolError::rpcCodeFor(Error::err<ProtocolError>(ProtocolError::Unsupported, "x")) == -32601);
  REQUIRE(ProtocolError::rpcCodeFor(Error::err<ProtocolError>(ProtocolError::Malformed, "x")) == -32600);
  REQUIRE(ProtocolError::rpcCodeFor(Error::err<SandboxError>(SandboxError::Trap, "x")) == -32603);
}
