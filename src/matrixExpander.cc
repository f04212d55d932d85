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

#include <stdio.h>

#include "matrixRunner/matrixExpander.h"

namespace MatrixRunner
{

MatrixExpander::MatrixExpander(const PipelineConfig& config) :
mConfig(config),
mEvaluator(config)
{
}

bool MatrixExpander::EntryMatches(const MatrixEntry& entry, const AxisAssignment& axes, const EnvMap& env)
{
   for (const auto& itr : entry.mAxes)
   {
      const std::string* value = FindAxisValue(axes, itr.first);
      if (value == NULL || *value != itr.second)
      {
         return false;
      }
   }

   for (const auto& itr : entry.mEnv)
   {
      auto envItr = env.find(itr.first);
      if (envItr == env.end() || envItr->second != itr.second)
      {
         return false;
      }
   }

   return true;
}

std::string MatrixExpander::MakeJobId(const AxisAssignment& axes, const EnvMap& overrides)
{
   std::string id;

   for (const auto& itr : axes)
   {
      if (!id.empty())
         id += ", ";
      id += itr.first + "=" + itr.second;
   }

   for (const auto& itr : overrides)
   {
      if (!id.empty())
         id += ", ";
      id += itr.first + "=" + itr.second;
   }

   return id.empty() ? "default" : id;
}

void MatrixExpander::validateEntry(const MatrixEntry& entry, const char* section) const
{
   for (const auto& itr : entry.mAxes)
   {
      if (mConfig.findAxis(itr.first) == NULL)
      {
         throw ConfigurationError(std::string("Unknown axis '") + itr.first + "' in matrix." + section);
      }
   }
}

void MatrixExpander::validate() const
{
   for (size_t i=0; i<mConfig.mAxes.size(); i++)
   {
      const Axis& axis = mConfig.mAxes[i];
      if (axis.mValues.empty())
      {
         throw ConfigurationError("Axis '" + axis.mName + "' has no values");
      }

      for (size_t j=0; j<i; j++)
      {
         if (mConfig.mAxes[j].mName == axis.mName)
         {
            throw ConfigurationError("Axis '" + axis.mName + "' declared twice");
         }
      }
   }

   for (const MatrixEntry& entry : mConfig.mIncludes)
   {
      validateEntry(entry, "include");
   }

   for (const MatrixEntry& entry : mConfig.mExcludes)
   {
      validateEntry(entry, "exclude");
      if (entry.mAxes.empty() && entry.mEnv.empty())
      {
         throw ConfigurationError("Empty matrix.exclude entry would remove every job");
      }
   }

   for (const MatrixEntry& entry : mConfig.mAllowFailures)
   {
      validateEntry(entry, "allow_failures");
      if (entry.mAxes.empty() && entry.mEnv.empty())
      {
         throw ConfigurationError("Empty matrix.allow_failures entry");
      }
   }

   if (mConfig.mDeploy.mEnabled)
   {
      for (const auto& itr : mConfig.mDeploy.mTriggerAxes)
      {
         if (mConfig.findAxis(itr.first) == NULL)
         {
            throw ConfigurationError("Unknown axis '" + itr.first + "' in deploy.on");
         }
      }
   }
}

std::vector<AxisAssignment> MatrixExpander::crossProduct() const
{
   std::vector<AxisAssignment> combos;
   std::vector<size_t> counters(mConfig.mAxes.size(), 0);

   // Odometer, last axis turns fastest. No axes gives one empty combination.
   while (true)
   {
      AxisAssignment combo;
      for (size_t i=0; i<mConfig.mAxes.size(); i++)
      {
         combo.push_back(std::make_pair(mConfig.mAxes[i].mName, mConfig.mAxes[i].mValues[counters[i]]));
      }
      combos.push_back(combo);

      size_t pos = counters.size();
      while (pos > 0)
      {
         pos--;
         if (++counters[pos] < mConfig.mAxes[pos].mValues.size())
         {
            break;
         }
         counters[pos] = 0;
         if (pos == 0)
         {
            return combos;
         }
      }

      if (counters.empty())
      {
         return combos;
      }
   }
}

AxisAssignment MatrixExpander::orderAxes(const AxisAssignment& axes) const
{
   AxisAssignment ordered;
   for (const Axis& axis : mConfig.mAxes)
   {
      const std::string* value = FindAxisValue(axes, axis.mName);
      if (value)
      {
         ordered.push_back(std::make_pair(axis.mName, *value));
      }
   }
   return ordered;
}

JobSpec MatrixExpander::makeJob(const AxisAssignment& axes,
                                const MatrixEntry* entry,
                                JobSpec::Origin origin,
                                std::set<std::string>& usedKeys) const
{
   JobSpec job;
   job.mAxes = axes;
   job.mEnv = mConfig.mGlobalEnv;
   job.mOrigin = origin;
   job.mTimeoutSeconds = mConfig.mTimeoutSeconds;

   if (entry)
   {
      job.mOverrides = entry->mEnv;
      for (const auto& itr : entry->mEnv)
      {
         job.mEnv[itr.first] = itr.second;
      }

      job.mPrivileged = entry->mPrivileged;
      job.mServices = entry->mServices;
      job.mAllowFailure = entry->mAllowFailure;
      if (entry->mTimeoutSeconds != 0)
      {
         job.mTimeoutSeconds = entry->mTimeoutSeconds;
      }
   }

   job.mId = MakeJobId(job.mAxes, job.mOverrides);

   for (const MatrixEntry& allow : mConfig.mAllowFailures)
   {
      if (EntryMatches(allow, job.mAxes, job.mEnv))
      {
         job.mAllowFailure = true;
      }
   }

   try
   {
      job.mMode = mEvaluator.selectMode(job.mEnv);
   }
   catch (const ConfigurationError& e)
   {
      throw ConfigurationError("Job '" + job.mId + "': " + e.what());
   }
   job.mTargetPlatform = mEvaluator.targetPlatform(job.mEnv, job.mMode);

   // Jobs with identical identity still get their own store
   std::string base = SanitizeKey(job.mId);
   std::string key = base;
   for (uint32_t ordinal = 2; usedKeys.count(key) != 0; ordinal++)
   {
      key = base + "-" + std::to_string(ordinal);
   }
   usedKeys.insert(key);
   job.mCacheKey = key;

   return job;
}

std::vector<JobSpec> MatrixExpander::expand() const
{
   validate();

   std::vector<JobSpec> jobs;
   std::set<std::string> usedKeys;

   for (const AxisAssignment& combo : crossProduct())
   {
      bool excluded = false;
      for (const MatrixEntry& exclude : mConfig.mExcludes)
      {
         if (EntryMatches(exclude, combo, mConfig.mGlobalEnv))
         {
            excluded = true;
            break;
         }
      }

      if (!excluded)
      {
         jobs.push_back(makeJob(combo, NULL, JobSpec::GENERATED, usedKeys));
      }
   }

   for (const MatrixEntry& include : mConfig.mIncludes)
   {
      jobs.push_back(makeJob(orderAxes(include.mAxes), &include, JobSpec::INCLUDED, usedKeys));
   }

   for (size_t i=0; i<jobs.size(); i++)
   {
      jobs[i].mIndex = (uint32_t)i;
   }

   printf("MATRIX: %u axes expanded to %u jobs\n", (unsigned)mConfig.mAxes.size(), (unsigned)jobs.size());
   return jobs;
}

}
