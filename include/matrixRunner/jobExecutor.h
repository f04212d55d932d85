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

#include <atomic>
#include <stdint.h>
#include <string>
#include <vector>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/cacheManager.h"
#include "matrixRunner/conditionEvaluator.h"
#include "matrixRunner/jobSpec.h"
#include "matrixRunner/pipelineConfig.h"
#include "matrixRunner/stepRunner.h"

namespace MatrixRunner
{

class JobTracker;

// Branch and tag of the revision under test, plus the environment secrets are read from
struct RepoContext
{
   std::string mBranch;
   std::string mTag;
   EnvMap mEnv;
};

struct JobOutcome
{
   matrixrunner::v1::Result mResult; // SUCCESS, FAILURE or ERRORED
   int mExitStatus;
   bool mAllowFailure;
   bool mSuppressed;                 // set by Scheduler::Aggregate
   std::string mReason;
   std::vector<std::string> mWarnings;
   double mDurationSeconds;
   matrixrunner::v1::JobReport mReport;

   JobOutcome() :
   mResult(matrixrunner::v1::RESULT_UNSPECIFIED),
   mExitStatus(0),
   mAllowFailure(false),
   mSuppressed(false),
   mDurationSeconds(0)
   {
   }
};

// Runs one job through Pending, Preparing, Running, Succeeded/Failed, Finalizing, Done.
// Finalizing (after_success on success, then cache release) runs on every path.
class JobExecutor
{
   const PipelineConfig& mConfig;
   RepoContext mRepo;
   StepRunner& mRunner;
   CacheManager& mCache;
   std::string mWorkspaceRoot;
   bool mQuiet;
   ConditionEvaluator mEvaluator;

public:

   JobExecutor(const PipelineConfig& config,
               const RepoContext& repo,
               StepRunner& runner,
               CacheManager& cache,
               const std::string& workspaceRoot,
               bool quiet = false);

   JobOutcome run(const JobSpec& job, const std::atomic<bool>* cancelFlag = NULL) const;

   // Outcome for a job the scheduler never started
   JobOutcome notStarted(const JobSpec& job, const std::string& reason) const;

   EnvMap buildStepEnv(const JobSpec& job) const;

   static std::string GetJobWorkspace(const std::string& root, const JobSpec& job);

   inline const PipelineConfig& getConfig() const
   {
      return mConfig;
   }

   inline const RepoContext& getRepoContext() const
   {
      return mRepo;
   }

   inline const std::string& getWorkspaceRoot() const
   {
      return mWorkspaceRoot;
   }

   inline StepRunner& getRunner() const
   {
      return mRunner;
   }

private:

   StepResult runSequence(const char* stage,
                          const StepSequence& steps,
                          const StepContext& ctx,
                          JobTracker& tracker,
                          std::string& outFailedStep) const;
};

}
