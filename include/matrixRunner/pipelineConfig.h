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

#include <map>
#include <stdexcept>
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

#include "matrixRunner/jobSpec.h"

namespace MatrixRunner
{

// Invalid pipeline description. Always raised before any job starts.
class ConfigurationError : public std::runtime_error
{
public:
   explicit ConfigurationError(const std::string& what) : std::runtime_error(what)
   {
   }
};

struct Axis
{
   std::string mName;
   std::vector<std::string> mValues;
};

// include:, exclude: and allow_failures: items
struct MatrixEntry
{
   AxisAssignment mAxes; // partial; unspecified axes are wildcards when matching
   EnvMap mEnv;
   bool mPrivileged;
   bool mAllowFailure;
   std::vector<std::string> mServices;
   uint32_t mTimeoutSeconds; // 0 = inherit

   MatrixEntry() : mPrivileged(false), mAllowFailure(false), mTimeoutSeconds(0)
   {
   }
};

struct Step
{
   std::string mName;
   std::string mRun;
};

typedef std::vector<Step> StepSequence;
typedef std::map<JobMode, StepSequence> ModeSteps;

struct CacheConfig
{
   std::vector<std::string> mDirectories;
   std::vector<std::string> mBeforeCache; // volatile subpaths pruned before persisting
};

struct DeployConfig
{
   bool mEnabled;
   std::string mProvider;
   std::string mBranch;
   JobMode mTriggerMode;
   AxisAssignment mTriggerAxes;
   bool mTagsOnly;
   std::string mTokenEnv;
   std::string mLocalDir;
   std::string mUrl;
   StepSequence mCommands;

   DeployConfig() : mEnabled(false), mTriggerMode(JobMode::DocBuild), mTagsOnly(false)
   {
   }
};

// Immutable description of a pipeline, built once at startup.
struct PipelineConfig
{
   std::string mName;
   EnvMap mGlobalEnv;
   std::vector<std::string> mBranchesOnly;
   std::vector<std::string> mBranchesExcept;

   std::vector<Axis> mAxes;
   std::vector<MatrixEntry> mIncludes;
   std::vector<MatrixEntry> mExcludes;
   std::vector<MatrixEntry> mAllowFailures;

   // Flag variable per mode, in priority order. Default has no flag.
   std::vector<std::pair<JobMode, std::string>> mModeFlags;

   ModeSteps mSetup;
   ModeSteps mScript;
   ModeSteps mAfterSuccess;

   CacheConfig mCache;
   DeployConfig mDeploy;

   uint32_t mTimeoutSeconds;
   uint32_t mMaxParallel; // 0 = hardware concurrency

   PipelineConfig();

   // Branch filter from branches.only / branches.except
   bool isBranchEnabled(const std::string& branch) const;
   const Axis* findAxis(const std::string& name) const;
};

// Parses a pipeline document. Throws ConfigurationError.
PipelineConfig LoadPipelineConfig(const std::string& yamlText);
PipelineConfig LoadPipelineConfigFile(const std::string& filename);

}
