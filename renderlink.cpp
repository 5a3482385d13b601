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

#include "renderlink.hpp"

using namespace lb;


const char *lb::schedulerStateName(SchedulerState aState)
{
  switch (aState) {
    case scheduler_idle: return "idle";
    case scheduler_running: return "running";
    case scheduler_draining: return "draining";
    case scheduler_stopped: return "stopped";
  }
  return "unknown";
}


const char *RenderStatus::playStatus() const
{
  if (!programActive) return "NotPlaying";
  return paused ? "Paused" : "Playing";
}
