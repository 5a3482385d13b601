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

#include "renderlink.hpp"

#include <thread>

using namespace lb;

static std::atomic<int> gAlive(0);

class Token : public LBObj
{
public:
  int value;
  Token(int aValue) : value(aValue) { gAlive++; };
  virtual ~Token() { gAlive--; };
};
typedef boost::intrusive_ptr<Token> TokenPtr;


TEST_CASE("handoff cell basics", "[handoff]") {
  gAlive = 0;
  {
    HandoffCell<Token> cell;
    REQUIRE_FALSE(cell.pending());
    REQUIRE_FALSE(cell.take());

    SECTION("publish and take") {
      TokenPtr t = new Token(42);
      REQUIRE_FALSE(cell.publish(t));
      REQUIRE_FALSE(t); // given away
      REQUIRE(cell.pending());
      TokenPtr got = cell.take();
      REQUIRE(got);
      REQUIRE(got->value == 42);
      REQUIRE_FALSE(cell.pending());
      REQUIRE_FALSE(cell.take());
      got.reset();
      REQUIRE(gAlive == 0);
    }

    SECTION("latest wins") {
      TokenPtr t1 = new Token(1);
      TokenPtr t2 = new Token(2);
      REQUIRE_FALSE(cell.publish(t1));
      REQUIRE(cell.publish(t2));
      // the replaced item is released right away
      REQUIRE(gAlive == 1);
      TokenPtr got = cell.take();
      REQUIRE(got->value == 2);
    }

    SECTION("pending item is released with the cell") {
      TokenPtr t = new Token(3);
      cell.publish(t);
      REQUIRE(gAlive == 1);
    }
  }
  REQUIRE(gAlive == 0);
}


TEST_CASE("handoff cell between threads", "[handoff]") {
  gAlive = 0;
  const int numItems = 20000;
  {
    HandoffCell<Token> cell;
    std::atomic<bool> done(false);
    int received = 0;
    int last = -1;
    bool ordered = true;
    std::thread producer([&cell, &done, numItems]() {
      for (int i=0; i<numItems; i++) {
        TokenPtr t = new Token(i);
        cell.publish(t);
      }
      done = true;
    });
    while (true) {
      bool finished = done.load();
      TokenPtr t = cell.take();
      if (t) {
        received++;
        if (t->value<=last) ordered = false;
        last = t->value;
      }
      else if (finished) {
        break;
      }
    }
    producer.join();
    REQUIRE(ordered);
    REQUIRE(received > 0);
    REQUIRE(received <= numItems);
    // the last published item is never lost
    REQUIRE(last == numItems-1);
  }
  REQUIRE(gAlive == 0);
}


TEST_CASE("render status play state", "[handoff]") {
  RenderStatus s;
  REQUIRE(string(s.playStatus()) == "NotPlaying");
  s.programActive = true;
  REQUIRE(string(s.playStatus()) == "Playing");
  s.paused = true;
  REQUIRE(string(s.playStatus()) == "Paused");
  REQUIRE(string(schedulerStateName(scheduler_draining)) == "draining");
}
