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

#include <filesystem>
#include <stdio.h>

#include "matrixRunner/conditionEvaluator.h"
#include "matrixRunner/deployGate.h"
#include "matrixRunner/matrixExpander.h"

namespace MatrixRunner
{

DeployGate::DeployGate(const PipelineConfig& config) :
mConfig(config),
mFired(false)
{
   mReport.set_configured(mConfig.mDeploy.mEnabled);
   mReport.set_provider(mConfig.mDeploy.mProvider);
   mReport.set_result(matrixrunner::v1::RESULT_SKIPPED);
}

int32_t DeployGate::findTriggerJob(const std::vector<JobSpec>& jobs) const
{
   MatrixEntry constraint;
   constraint.mAxes = mConfig.mDeploy.mTriggerAxes;

   for (size_t i=0; i<jobs.size(); i++)
   {
      if (jobs[i].mMode == mConfig.mDeploy.mTriggerMode &&
          MatrixExpander::EntryMatches(constraint, jobs[i].mAxes, EnvMap()))
      {
         return (int32_t)i;
      }
   }
   return -1;
}

DeployDecision DeployGate::evaluate(const std::vector<JobSpec>& jobs,
                                    const PipelineOutcome& outcome,
                                    const RepoContext& repo) const
{
   const DeployConfig& deploy = mConfig.mDeploy;
   DeployDecision decision;

   if (!deploy.mEnabled)
   {
      decision.mReason = "deploy not configured";
      return decision;
   }

   if (mFired)
   {
      decision.mAlreadyFired = true;
      decision.mReason = "deployment already fired";
      return decision;
   }

   if (outcome.mResult != matrixrunner::v1::RESULT_SUCCESS)
   {
      decision.mReason = "pipeline did not succeed";
      return decision;
   }

   if (repo.mBranch.empty())
   {
      decision.mReason = "no branch given";
      return decision;
   }

   if (!deploy.mBranch.empty() && repo.mBranch != deploy.mBranch)
   {
      decision.mReason = "branch '" + repo.mBranch + "' does not match '" + deploy.mBranch + "'";
      return decision;
   }

   if (deploy.mTagsOnly && repo.mTag.empty())
   {
      decision.mReason = "deploy requires a tag";
      return decision;
   }

   decision.mTriggerJob = findTriggerJob(jobs);
   if (decision.mTriggerJob < 0)
   {
      decision.mReason = std::string("no ") + JobModeToString(deploy.mTriggerMode) + " job to trigger deploy";
      return decision;
   }

   const JobSpec& trigger = jobs[decision.mTriggerJob];
   if ((size_t)decision.mTriggerJob >= outcome.mJobs.size() ||
       outcome.mJobs[decision.mTriggerJob].mResult != matrixrunner::v1::RESULT_SUCCESS)
   {
      // allow_failure doesn't count here, the trigger must really pass
      decision.mReason = "trigger job '" + trigger.mId + "' did not succeed";
      return decision;
   }

   decision.mFire = true;
   decision.mReason = "trigger job '" + trigger.mId + "' succeeded on '" + repo.mBranch + "'";
   return decision;
}

DeployContext DeployGate::buildContext(const JobSpec& trigger,
                                       const RepoContext& repo,
                                       const std::string& workspaceRoot) const
{
   const DeployConfig& deploy = mConfig.mDeploy;
   DeployContext ctx;
   ctx.mPipeline = mConfig.mName;
   ctx.mBranch = repo.mBranch;
   ctx.mTag = repo.mTag;
   ctx.mTriggerJob = trigger.mId;
   ctx.mWorkspace = JobExecutor::GetJobWorkspace(workspaceRoot, trigger);
   ctx.mArtifactDir = deploy.mLocalDir.empty() ? ctx.mWorkspace :
                      (std::filesystem::path(ctx.mWorkspace) / deploy.mLocalDir).string();

   if (!deploy.mTokenEnv.empty())
   {
      auto itr = repo.mEnv.find(deploy.mTokenEnv);
      if (itr != repo.mEnv.end())
      {
         ctx.mToken = itr->second;
      }
   }

   for (const auto& modeFlag : mConfig.mModeFlags)
   {
      if (ConditionEvaluator::IsFlagSet(trigger.mEnv, modeFlag.second))
      {
         ctx.mFlags[modeFlag.second] = trigger.mEnv.at(modeFlag.second);
      }
   }

   return ctx;
}

DeployDecision DeployGate::maybeDeploy(const std::vector<JobSpec>& jobs,
                                       const PipelineOutcome& outcome,
                                       const RepoContext& repo,
                                       const std::string& workspaceRoot,
                                       StepRunner* runner,
                                       const std::atomic<bool>* cancelFlag)
{
   std::lock_guard<std::mutex> lock(mMutex);

   DeployDecision decision = evaluate(jobs, outcome, repo);
   if (decision.mAlreadyFired)
   {
      return decision;
   }

   mReport.set_reason(decision.mReason);
   if (decision.mTriggerJob >= 0)
   {
      mReport.set_trigger_job(jobs[decision.mTriggerJob].mId);
   }

   if (!decision.mFire)
   {
      printf("DEPLOY: skipped, %s\n", decision.mReason.c_str());
      return decision;
   }

   bool expected = false;
   if (!mFired.compare_exchange_strong(expected, true))
   {
      decision.mFire = false;
      decision.mAlreadyFired = true;
      decision.mReason = "deployment already fired";
      return decision;
   }

   mReport.set_fired(true);
   printf("DEPLOY: firing '%s', %s\n", mConfig.mDeploy.mProvider.c_str(), decision.mReason.c_str());

   DeployAction::CreateFunc createFunc = DeployAction::getAction(mConfig.mDeploy.mProvider);
   if (!createFunc)
   {
      mReport.set_result(matrixrunner::v1::RESULT_FAILURE);
      mReport.set_error("Unknown deploy provider '" + mConfig.mDeploy.mProvider + "'");
      printf("DEPLOY: %s\n", mReport.error().c_str());
      return decision;
   }

   DeployContext ctx = buildContext(jobs[decision.mTriggerJob], repo, workspaceRoot);
   ctx.mRunner = runner;
   ctx.mCancelFlag = cancelFlag;

   DeployAction* action = createFunc();
   try
   {
      action->deploy(mConfig.mDeploy, ctx);
      mReport.set_result(matrixrunner::v1::RESULT_SUCCESS);
   }
   catch (const DeployError& e)
   {
      mReport.set_result(matrixrunner::v1::RESULT_FAILURE);
      mReport.set_error(e.what());
   }
   catch (const std::exception& e)
   {
      mReport.set_result(matrixrunner::v1::RESULT_ERRORED);
      mReport.set_error(e.what());
   }
   delete action;

   if (mReport.result() == matrixrunner::v1::RESULT_SUCCESS)
      printf("DEPLOY: done\n");
   else
      printf("DEPLOY: failed, %s\n", mReport.error().c_str());

   return decision;
}

matrixrunner::v1::DeployReport DeployGate::getReport()
{
   std::lock_guard<std::mutex> lock(mMutex);
   return mReport;
}

}
