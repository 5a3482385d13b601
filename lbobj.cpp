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

#include "lbobj.hpp"

using namespace lb;

namespace lb {

  void intrusive_ptr_add_ref(LBObj* o)
  {
    ++(o->refCount);
  }

  void intrusive_ptr_release(LBObj* o)
  {
    if(--(o->refCount) == 0) {
      // a destructor that temporarily adds references again (e.g. via callbacks
      // still holding the object) must not be able to trigger a second delete
      o->refCount = -4242;
      delete o;
    }
  }

  void LBObj::isMemberVariable()
  {
    // never reaches zero via intrusive_ptr_release, lives and dies with its container
    refCount = 4242;
  }

}
