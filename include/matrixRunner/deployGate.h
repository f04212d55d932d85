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
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/deployActions.h"
#include "matrixRunner/jobExecutor.h"
#include "matrixRunner/pipelineConfig.h"
#include "matrixRunner/scheduler.h"

namespace MatrixRunner
{

struct DeployDecision
{
   bool mFire;
   bool mAlreadyFired;
   std::string mReason;
   int32_t mTriggerJob; // index into the job list, -1 if none

   DeployDecision() : mFire(false), mAlreadyFired(false), mTriggerJob(-1)
   {
   }
};

// Fires the configured deploy action at most once per run, and only when the
// pipeline passed, the branch (and tag) condition holds and the trigger job
// itself succeeded.
class DeployGate
{
   const PipelineConfig& mConfig;
   std::atomic<bool> mFired;
   std::mutex mMutex;
   matrixrunner::v1::DeployReport mReport;

public:

   explicit DeployGate(const PipelineConfig& config);

   DeployDecision evaluate(const std::vector<JobSpec>& jobs,
                           const PipelineOutcome& outcome,
                           const RepoContext& repo) const;

   // First job in list order with the trigger mode and matching trigger axes
   int32_t findTriggerJob(const std::vector<JobSpec>& jobs) const;

   // Evaluates and, if allowed, invokes the provider. Later calls are no-ops.
   DeployDecision maybeDeploy(const std::vector<JobSpec>& jobs,
                              const PipelineOutcome& outcome,
                              const RepoContext& repo,
                              const std::string& workspaceRoot,
                              StepRunner* runner,
                              const std::atomic<bool>* cancelFlag = NULL);

   inline bool hasFired() const
   {
      return mFired.load();
   }

   matrixrunner::v1::DeployReport getReport();

   DeployContext buildContext(const JobSpec& trigger,
                              const RepoContext& repo,
                              const std::string& workspaceRoot) const;
};

}
