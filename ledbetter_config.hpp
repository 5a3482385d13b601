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

#ifndef __ledbetter__config__
#define __ledbetter__config__

// Build options. The CMake build sets the library dependent ones from what
// it finds, these are the fallbacks for other build environments.

#ifndef ENABLE_NAMED_ERRORS
  #define ENABLE_NAMED_ERRORS LB_CPP11_FEATURE // Enable if compiler can do C++11
#endif
#ifndef MAINLOOP_LIBEV_BASED
  #define MAINLOOP_LIBEV_BASED 0 // mainloop runs on libev (required for the websocket control transport)
#endif
#ifndef ENABLE_UWSC
  #define ENABLE_UWSC 0 // websocket client via libuwsc, requires MAINLOOP_LIBEV_BASED
#endif
#ifndef ENABLE_RPIWS281X
  #define ENABLE_RPIWS281X 0 // drive WS281x LEDs directly via rpi_ws281x instead of the ledchain kernel driver
#endif

#if ENABLE_UWSC && !MAINLOOP_LIBEV_BASED
  #error "ENABLE_UWSC requires MAINLOOP_LIBEV_BASED"
#endif

#endif // __ledbetter__config__
