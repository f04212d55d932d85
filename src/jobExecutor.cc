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

#include <chrono>
#include <filesystem>
#include <stdio.h>

#include "matrixRunner/jobExecutor.h"
#include "matrixRunner/jobTracker.h"

namespace MatrixRunner
{

JobExecutor::JobExecutor(const PipelineConfig& config,
                         const RepoContext& repo,
                         StepRunner& runner,
                         CacheManager& cache,
                         const std::string& workspaceRoot,
                         bool quiet) :
mConfig(config),
mRepo(repo),
mRunner(runner),
mCache(cache),
mWorkspaceRoot(workspaceRoot),
mQuiet(quiet),
mEvaluator(config)
{
}

std::string JobExecutor::GetJobWorkspace(const std::string& root, const JobSpec& job)
{
   return (std::filesystem::path(root) / job.mCacheKey).string();
}

EnvMap JobExecutor::buildStepEnv(const JobSpec& job) const
{
   EnvMap env = job.mEnv;
   env["CI"] = "true";
   env["MATRIX_JOB_ID"] = job.mId;
   env["MATRIX_JOB_INDEX"] = std::to_string(job.mIndex);
   env["MATRIX_MODE"] = JobModeToString(job.mMode);
   env["MATRIX_BRANCH"] = mRepo.mBranch;
   env["MATRIX_TAG"] = mRepo.mTag;
   env["MATRIX_OS"] = GetOSName();
   env["MATRIX_ARCH"] = GetArchName();

   for (const auto& itr : job.mAxes)
   {
      env["MATRIX_" + ToEnvName(itr.first)] = itr.second;
   }

   if (job.mMode == JobMode::CrossTarget)
   {
      env["MATRIX_TARGET"] = job.mTargetPlatform;
   }

   return env;
}

StepResult JobExecutor::runSequence(const char* stage,
                                    const StepSequence& steps,
                                    const StepContext& ctx,
                                    JobTracker& tracker,
                                    std::string& outFailedStep) const
{
   for (size_t i=0; i<steps.size(); i++)
   {
      const Step& step = steps[i];
      StepResult result;
      bool started = false;

      if (ctx.shouldStop())
      {
         result = StepResult(matrixrunner::v1::RESULT_CANCELLED, -1,
                             ctx.isCancelled() ? "cancelled" : "timed out");
      }
      else
      {
         started = true;
         tracker.beginStep(stage, step);
         try
         {
            result = mRunner.runStep(step, ctx);
         }
         catch (const std::exception& e)
         {
            result = StepResult(matrixrunner::v1::RESULT_ERRORED, -1, e.what());
         }
         tracker.endStep(result.mResult, result.mExitCode);
      }

      if (result.mResult != matrixrunner::v1::RESULT_SUCCESS)
      {
         outFailedStep = step.mName;
         for (size_t j = started ? i+1 : i; j<steps.size(); j++)
         {
            tracker.skipStep(stage, steps[j]);
         }
         return result;
      }
   }

   return StepResult();
}

JobOutcome JobExecutor::notStarted(const JobSpec& job, const std::string& reason) const
{
   JobTracker tracker(job, mQuiet);
   tracker.setPhase(matrixrunner::v1::PHASE_PENDING);
   tracker.setPhase(matrixrunner::v1::PHASE_DONE);
   tracker.finish(matrixrunner::v1::RESULT_FAILURE, -1, reason, 0);

   JobOutcome outcome;
   outcome.mResult = matrixrunner::v1::RESULT_FAILURE;
   outcome.mExitStatus = -1;
   outcome.mAllowFailure = job.mAllowFailure;
   outcome.mReason = reason;
   outcome.mReport = tracker.getReport();
   return outcome;
}

JobOutcome JobExecutor::run(const JobSpec& job, const std::atomic<bool>* cancelFlag) const
{
   auto startTime = std::chrono::steady_clock::now();

   JobTracker tracker(job, mQuiet);
   tracker.begin();
   tracker.setPhase(matrixrunner::v1::PHASE_PENDING);

   JobOutcome outcome;
   outcome.mAllowFailure = job.mAllowFailure;
   outcome.mResult = matrixrunner::v1::RESULT_SUCCESS;

   StepContext ctx;
   ctx.mJob = &job;
   ctx.mWorkingDirectory = GetJobWorkspace(mWorkspaceRoot, job);
   ctx.mEnv = buildStepEnv(job);
   ctx.mTracker = &tracker;
   ctx.mCancelFlag = cancelFlag;
   if (job.mTimeoutSeconds > 0)
   {
      ctx.mHasDeadline = true;
      ctx.mDeadline = startTime + std::chrono::seconds(job.mTimeoutSeconds);
   }

   std::error_code ec;
   std::filesystem::create_directories(ctx.mWorkingDirectory, ec);
   if (ec)
   {
      outcome.mResult = matrixrunner::v1::RESULT_ERRORED;
      outcome.mExitStatus = -1;
      outcome.mReason = "Couldn't create workspace " + ctx.mWorkingDirectory + ": " + ec.message();
      tracker.setPhase(matrixrunner::v1::PHASE_FAILED);
      tracker.setPhase(matrixrunner::v1::PHASE_FINALIZING);
   }
   else
   {
      tracker.setPhase(matrixrunner::v1::PHASE_PREPARING);
      CacheLease lease(mCache, job, ctx.mWorkingDirectory);
      for (const std::string& warning : lease.getHandle().mWarnings)
      {
         tracker.warn(warning);
      }
      size_t reportedWarnings = lease.getHandle().mWarnings.size();

      std::string failedStep;
      StepResult result = runSequence("setup", mEvaluator.selectSteps(mConfig.mSetup, job.mMode), ctx, tracker, failedStep);
      const char* failedStage = "setup";

      if (result.mResult == matrixrunner::v1::RESULT_SUCCESS)
      {
         tracker.setPhase(matrixrunner::v1::PHASE_RUNNING);
         result = runSequence("script", mEvaluator.selectSteps(mConfig.mScript, job.mMode), ctx, tracker, failedStep);
         failedStage = "script";
      }
      else
      {
         for (const Step& step : mEvaluator.selectSteps(mConfig.mScript, job.mMode))
         {
            tracker.skipStep("script", step);
         }
      }

      switch (result.mResult)
      {
         case matrixrunner::v1::RESULT_SUCCESS:
            break;
         case matrixrunner::v1::RESULT_FAILURE:
            outcome.mResult = matrixrunner::v1::RESULT_FAILURE;
            outcome.mExitStatus = result.mExitCode != 0 ? result.mExitCode : 1;
            outcome.mReason = std::string(failedStage) + " step '" + failedStep + "' failed with exit code " + std::to_string(outcome.mExitStatus);
            break;
         case matrixrunner::v1::RESULT_CANCELLED:
            outcome.mResult = matrixrunner::v1::RESULT_FAILURE;
            outcome.mExitStatus = -1;
            if (ctx.isCancelled())
               outcome.mReason = "cancelled";
            else
               outcome.mReason = "timed out after " + std::to_string(job.mTimeoutSeconds) + " seconds";
            break;
         default:
            outcome.mResult = matrixrunner::v1::RESULT_ERRORED;
            outcome.mExitStatus = -1;
            outcome.mReason = std::string(failedStage) + " step '" + failedStep + "' errored: " + result.mMessage;
            break;
      }

      tracker.setPhase(outcome.mResult == matrixrunner::v1::RESULT_SUCCESS ?
                       matrixrunner::v1::PHASE_SUCCEEDED : matrixrunner::v1::PHASE_FAILED);
      tracker.setPhase(matrixrunner::v1::PHASE_FINALIZING);

      if (outcome.mResult == matrixrunner::v1::RESULT_SUCCESS)
      {
         const StepSequence& hooks = mEvaluator.selectSteps(mConfig.mAfterSuccess, job.mMode);
         StepResult hookResult = runSequence("after_success", hooks, ctx, tracker, failedStep);
         if (hookResult.mResult != matrixrunner::v1::RESULT_SUCCESS)
         {
            tracker.warn("after_success step '" + failedStep + "' did not succeed: " + hookResult.mMessage);
         }
      }

      lease.setOutcome(outcome.mResult);
      lease.release();
      for (size_t i=reportedWarnings; i<lease.getHandle().mWarnings.size(); i++)
      {
         tracker.warn(lease.getHandle().mWarnings[i]);
      }
   }

   tracker.setPhase(matrixrunner::v1::PHASE_DONE);

   outcome.mDurationSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime).count();
   tracker.finish(outcome.mResult, outcome.mExitStatus, outcome.mReason, outcome.mDurationSeconds);
   outcome.mReport = tracker.getReport();
   for (const std::string& warning : outcome.mReport.warnings())
   {
      outcome.mWarnings.push_back(warning);
   }

   printf("JOB[%u]: %s finished: %s%s\n", job.mIndex, job.mId.c_str(),
          outcome.mResult == matrixrunner::v1::RESULT_SUCCESS ? "success" :
          outcome.mResult == matrixrunner::v1::RESULT_FAILURE ? "failure" : "errored",
          job.mAllowFailure && outcome.mResult != matrixrunner::v1::RESULT_SUCCESS ? " (allowed)" : "");

   return outcome;
}

}
