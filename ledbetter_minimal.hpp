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

/// This header file introduces no dependencies on code, just defines the
/// bare minimum for using independent ledbetter routines and types

#ifndef __ledbetter__minimal__
#define __ledbetter__minimal__

#ifdef HAVE_CONFIG_H
  #include "config.h"
#endif

#if __cplusplus >= 201103L
  // we have C++ 11
  #define LB_FINAL final
  #define LB_OVERRIDE override
  #define LB_CPP11_FEATURE 1
#else
  #define LB_FINAL
  #define LB_OVERRIDE
  #define LB_CPP11_FEATURE 0
#endif

#include "ledbetter_config.hpp"

// some minimal defs
#include <stddef.h>
#include <stdint.h>

#endif /* __ledbetter__minimal__ */
