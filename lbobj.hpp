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

#ifndef __ledbetter__lbobj__
#define __ledbetter__lbobj__

#include <boost/intrusive_ptr.hpp>

namespace lb {

  class LBObj;

  void intrusive_ptr_add_ref(LBObj* o);
  void intrusive_ptr_release(LBObj* o);

  /// base class for all refcounted ledbetter objects
  /// @note the reference count is not atomic. An object must only ever be referenced
  ///   from one thread at a time, ownership can be handed over (see HandoffCell)
  class LBObj
  {
    friend void intrusive_ptr_add_ref(LBObj* o);
    friend void intrusive_ptr_release(LBObj* o);

    int refCount;

  protected:

    LBObj() : refCount(0) {};
    virtual ~LBObj() {};

  public:

    /// call this on objects that are not allocated with new, but are member variables
    /// of other objects, to prevent intrusive_ptr from ever deleting them.
    void isMemberVariable();

    /// @return current reference count (for diagnostics only)
    int refCountForDiagnostics() const { return refCount; }

  };

  typedef boost::intrusive_ptr<LBObj> LBObjPtr;

} // namespace lb

#endif /* __ledbetter__lbobj__ */
