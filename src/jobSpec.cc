/*

Copyright (c) 2025 James Urquhart

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.

SPDX-License-Identifier: GPL-3.0-or-later

*/

#include "matrixRunner/jobSpec.h"

namespace MatrixRunner
{

static const char* sModeNames[JobMode_COUNT] = {
   "format-check",
   "coverage",
   "doc-build",
   "cross-target",
   "default"
};

const char* JobModeToString(JobMode mode)
{
   uint32_t key = (uint32_t)mode;
   return key < JobMode_COUNT ? sModeNames[key] : "unknown";
}

bool JobModeFromString(const std::string& name, JobMode& outMode)
{
   for (uint32_t i=0; i<JobMode_COUNT; i++)
   {
      if (name == sModeNames[i])
      {
         outMode = (JobMode)i;
         return true;
      }
   }
   return false;
}

const std::string* FindAxisValue(const AxisAssignment& axes, const std::string& name)
{
   for (const auto& itr : axes)
   {
      if (itr.first == name)
      {
         return &itr.second;
      }
   }
   return NULL;
}

}
