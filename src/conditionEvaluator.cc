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

#include "matrixRunner/conditionEvaluator.h"

namespace MatrixRunner
{

bool ConditionEvaluator::IsFlagSet(const EnvMap& env, const std::string& name)
{
   auto itr = env.find(name);
   return itr != env.end() && !itr->second.empty();
}

JobMode ConditionEvaluator::selectMode(const EnvMap& env) const
{
   const std::pair<JobMode, std::string>* selected = NULL;

   for (const auto& modeFlag : mConfig.mModeFlags)
   {
      if (!IsFlagSet(env, modeFlag.second))
      {
         continue;
      }

      if (selected != NULL)
      {
         throw ConfigurationError("Conflicting mode flags " + selected->second + " and " + modeFlag.second);
      }
      selected = &modeFlag;
   }

   return selected ? selected->first : JobMode::Default;
}

std::string ConditionEvaluator::targetPlatform(const EnvMap& env, JobMode mode) const
{
   if (mode != JobMode::CrossTarget)
   {
      return "";
   }

   const std::string* flag = flagForMode(mode);
   if (flag == NULL)
   {
      return "";
   }

   auto itr = env.find(*flag);
   return itr != env.end() ? itr->second : "";
}

const StepSequence& ConditionEvaluator::selectSteps(const ModeSteps& table, JobMode mode) const
{
   static const StepSequence sEmpty;

   auto itr = table.find(mode);
   if (itr != table.end())
   {
      return itr->second;
   }

   itr = table.find(JobMode::Default);
   return itr != table.end() ? itr->second : sEmpty;
}

const std::string* ConditionEvaluator::flagForMode(JobMode mode) const
{
   for (const auto& modeFlag : mConfig.mModeFlags)
   {
      if (modeFlag.first == mode)
      {
         return &modeFlag.second;
      }
   }
   return NULL;
}

}
