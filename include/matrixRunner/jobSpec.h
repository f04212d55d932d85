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

#pragma once

#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "matrixRunner/runnerUtil.h"

namespace MatrixRunner
{

// Script branch a job runs, in evaluation priority order.
enum class JobMode
{
   FormatCheck,
   Coverage,
   DocBuild,
   CrossTarget,
   Default
};

enum
{
   JobMode_COUNT = 5
};

const char* JobModeToString(JobMode mode);
bool JobModeFromString(const std::string& name, JobMode& outMode);

// Ordered (axis, value) pairs
typedef std::vector<std::pair<std::string, std::string>> AxisAssignment;

const std::string* FindAxisValue(const AxisAssignment& axes, const std::string& name);

// One fully resolved job of the matrix. Built by MatrixExpander, read-only afterwards.
struct JobSpec
{
   enum Origin
   {
      GENERATED,
      INCLUDED
   };

   uint32_t mIndex;
   std::string mId;        // axis values + applied overrides
   std::string mCacheKey;  // unique per run, stable across runs
   AxisAssignment mAxes;
   EnvMap mEnv;
   EnvMap mOverrides;      // entry env applied on top of the global env
   JobMode mMode;
   std::string mTargetPlatform;
   bool mAllowFailure;
   bool mPrivileged;
   std::vector<std::string> mServices;
   uint32_t mTimeoutSeconds; // 0 = no timeout
   Origin mOrigin;

   JobSpec() :
   mIndex(0),
   mMode(JobMode::Default),
   mAllowFailure(false),
   mPrivileged(false),
   mTimeoutSeconds(0),
   mOrigin(GENERATED)
   {
   }

   inline const std::string* getAxis(const std::string& name) const
   {
      return FindAxisValue(mAxes, name);
   }
};

}
