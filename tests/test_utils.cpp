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

#include <catch2/catch_all.hpp>

#include "utils.hpp"

TEST_CASE( "non null C String", "[utils]" ) {
  REQUIRE( string(lb::nonNullCStr(NULL)) == "" );
  REQUIRE( string(lb::nonNullCStr(" something ")) == " something " );
}

TEST_CASE( "Whitespace trimming", "[utils]" ) {
  REQUIRE( lb::trimWhiteSpace(" something ") == "something" );
  REQUIRE( lb::trimWhiteSpace(" \t\n something\r\t \t ") == "something" );
  REQUIRE( lb::trimWhiteSpace(" something ", true, false) == "something " );
  REQUIRE( lb::trimWhiteSpace(" something ", false, true) == " something" );
}

TEST_CASE( "lowercase and case insensitive compare", "[utils]" ) {
  REQUIRE( lb::lowerCase(string("UPPER And lower")) == "upper and lower" );
  REQUIRE( lb::uequals("Hardware", "hardware") );
  REQUIRE_FALSE( lb::uequals("Hardware", "terminal") );
}

TEST_CASE( "string formatting", "[utils]" ) {
  REQUIRE( lb::string_format("%d pixels at %.1f", 60, 0.5) == "60 pixels at 0.5" );
  string s = "ws://";
  lb::string_format_append(s, "%s:%d", "host", 8080);
  REQUIRE( s == "ws://host:8080" );
  // longer than the internal buffer
  string longer(300, 'x');
  REQUIRE( lb::string_format("%s", longer.c_str()) == longer );
}

TEST_CASE( "splitting into parts", "[utils]" ) {
  const char *p = "a,bc,,d";
  string part;
  REQUIRE( lb::nextPart(p, part, ',') ); REQUIRE( part == "a" );
  REQUIRE( lb::nextPart(p, part, ',') ); REQUIRE( part == "bc" );
  REQUIRE( lb::nextPart(p, part, ',') ); REQUIRE( part == "" );
  REQUIRE( lb::nextPart(p, part, ',') ); REQUIRE( part == "d" );
  REQUIRE_FALSE( lb::nextPart(p, part, ',') );
}

TEST_CASE( "host and port splitting", "[utils]" ) {
  string host;
  uint16_t port = 80;
  lb::splitHost("controller.local:8080", &host, &port);
  REQUIRE( host == "controller.local" );
  REQUIRE( port == 8080 );
  port = 80;
  lb::splitHost("controller.local", &host, &port);
  REQUIRE( host == "controller.local" );
  REQUIRE( port == 80 );
}

TEST_CASE( "hex decoding", "[utils]" ) {
  string b;
  REQUIRE( lb::hexToBinaryString("0061736D", b) );
  REQUIRE( b == string("\0asm", 4) );
  REQUIRE( lb::hexToBinaryString("00 61:73-6d", b) );
  REQUIRE( b == string("\0asm", 4) );
  REQUIRE_FALSE( lb::hexToBinaryString("006", b) );
  REQUIRE_FALSE( lb::hexToBinaryString("0G", b) );
  // characters between '9' and 'A', and non-ASCII bytes
  REQUIRE_FALSE( lb::hexToBinaryString("0;", b) );
  REQUIRE_FALSE( lb::hexToBinaryString("=?", b) );
  REQUIRE_FALSE( lb::hexToBinaryString("@1", b) );
  REQUIRE_FALSE( lb::hexToBinaryString("\xC3\xA4", b) );
  REQUIRE_FALSE( lb::hexToBinaryString("g0", b) );
  REQUIRE( lb::hexToBinaryString("fF0a", b) );
  REQUIRE( b == string("\xFF\x0A", 2) );
  REQUIRE( lb::binaryToHexString(string("\x01\xAB", 2), ':') == "01:AB" );
}

TEST_CASE( "base64 decoding", "[utils]" ) {
  string b;
  REQUIRE( lb::base64ToBinaryString("AGFzbQ==", b) );
  REQUIRE( b == string("\0asm", 4) );
  REQUIRE( lb::base64ToBinaryString("AGFz bQEA\nAAA=", b) );
  REQUIRE( b == string("\0asm\x01\0\0\0", 8) );
  REQUIRE( lb::base64ToBinaryString("", b) );
  REQUIRE( b.empty() );
  REQUIRE_FALSE( lb::base64ToBinaryString("AGFzbQ=", b) );
  REQUIRE_FALSE( lb::base64ToBinaryString("AG*zbQ==", b) );
}

TEST_CASE( "limiting", "[utils]" ) {
  REQUIRE( lb::limited(300, 0, 255) == 255 );
  REQUIRE( lb::limited(-3, 0, 255) == 0 );
  REQUIRE( lb::limited(0.5, 0, 1) == 0.5 );
}
