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

#include <atomic>
#include <filesystem>
#include <stdio.h>
#include <stdint.h>

#include "matrixRunner/matrixExpander.h"
#include "matrixRunner/scheduler.h"
#include "testHelpers.h"

using namespace MatrixRunner;
namespace fs = std::filesystem;

static PipelineConfig MakeToolchainConfig()
{
   PipelineConfig config;
   Axis axis;
   axis.mName = "toolchain";
   axis.mValues.push_back("stable");
   axis.mValues.push_back("nightly");
   config.mAxes.push_back(axis);
   config.mCache.mBeforeCache.push_back("tmp");
   return config;
}

static void testAllowedFailureKeepsPipelineGreen()
{
   std::string root = MakeTestDir("sched-allow");
   PipelineConfig config = MakeToolchainConfig();
   MatrixEntry allow;
   allow.mAxes.push_back(std::make_pair(std::string("toolchain"), std::string("nightly")));
   config.mAllowFailures.push_back(allow);
   config.mScript[JobMode::Default].push_back({"test", "fail-if MATRIX_TOOLCHAIN=nightly"});

   std::vector<JobSpec> jobs = MatrixExpander(config).expand();
   MATRIXRUNNER_CHECK(jobs.size() == 2);

   ScriptedStepRunner runner;
   CacheManager cache(config.mCache, (fs::path(root) / "cache").string());
   JobExecutor executor(config, RepoContext(), runner, cache, (fs::path(root) / "work").string(), true);
   Scheduler scheduler(executor, 2);
   PipelineOutcome outcome = scheduler.runPipeline(jobs);

   MATRIXRUNNER_CHECK(outcome.mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(!outcome.mCancelled);
   MATRIXRUNNER_CHECK(outcome.mJobs.size() == 2);
   MATRIXRUNNER_CHECK(outcome.mJobs[0].mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(!outcome.mJobs[0].mSuppressed);
   MATRIXRUNNER_CHECK(outcome.mJobs[1].mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(outcome.mJobs[1].mSuppressed);
   MATRIXRUNNER_CHECK(outcome.mJobs[1].mReport.suppressed());
   MATRIXRUNNER_CHECK(cache.getCleanupCount() == 2);

   std::error_code ec;
   fs::remove_all(root, ec);
}

static void testFailureDoesNotStopSiblings()
{
   std::string root = MakeTestDir("sched-siblings");
   PipelineConfig config = MakeToolchainConfig();
   config.mAxes[0].mValues.push_back("beta");
   config.mScript[JobMode::Default].push_back({"test", "fail-if MATRIX_TOOLCHAIN=stable"});
   config.mScript[JobMode::Default].push_back({"bench", "bench"});

   std::vector<JobSpec> jobs = MatrixExpander(config).expand();
   ScriptedStepRunner runner;
   CacheManager cache(config.mCache, (fs::path(root) / "cache").string());
   JobExecutor executor(config, RepoContext(), runner, cache, (fs::path(root) / "work").string(), true);
   Scheduler scheduler(executor, 1);
   PipelineOutcome outcome = scheduler.runPipeline(jobs);

   MATRIXRUNNER_CHECK(outcome.mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(outcome.mJobs[0].mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(!outcome.mJobs[0].mSuppressed);
   MATRIXRUNNER_CHECK(outcome.mJobs[1].mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(outcome.mJobs[2].mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(runner.countCalls("bench") == 2);

   std::error_code ec;
   fs::remove_all(root, ec);
}

static void testWorkerBound()
{
   std::string root = MakeTestDir("sched-bound");
   PipelineConfig config;
   Axis axis;
   axis.mName = "n";
   for (int i=0; i<8; i++)
   {
      axis.mValues.push_back(std::to_string(i));
   }
   config.mAxes.push_back(axis);
   config.mScript[JobMode::Default].push_back({"work", "sleep-ms 50"});

   std::vector<JobSpec> jobs = MatrixExpander(config).expand();
   ScriptedStepRunner runner;
   CacheManager cache(config.mCache, (fs::path(root) / "cache").string());
   JobExecutor executor(config, RepoContext(), runner, cache, (fs::path(root) / "work").string(), true);
   Scheduler scheduler(executor, 3);
   PipelineOutcome outcome = scheduler.runPipeline(jobs);

   MATRIXRUNNER_CHECK(outcome.mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(runner.countCalls("sleep-ms 50") == 8);
   MATRIXRUNNER_CHECK(runner.getMaxActive() <= 3);
   MATRIXRUNNER_CHECK(runner.getMaxActive() >= 1);

   // Outcomes stay in job order
   for (size_t i=0; i<outcome.mJobs.size(); i++)
   {
      MATRIXRUNNER_CHECK(outcome.mJobs[i].mReport.index() == (int64_t)i);
   }

   std::error_code ec;
   fs::remove_all(root, ec);
}

static void testCancelPipeline()
{
   std::string root = MakeTestDir("sched-cancel");
   PipelineConfig config;
   Axis axis;
   axis.mName = "n";
   for (int i=0; i<4; i++)
   {
      axis.mValues.push_back(std::to_string(i));
   }
   config.mAxes.push_back(axis);
   config.mCache.mBeforeCache.push_back("tmp");
   config.mScript[JobMode::Default].push_back({"hang", "sleep"});

   std::vector<JobSpec> jobs = MatrixExpander(config).expand();
   ScriptedStepRunner runner;
   CacheManager cache(config.mCache, (fs::path(root) / "cache").string());
   JobExecutor executor(config, RepoContext(), runner, cache, (fs::path(root) / "work").string(), true);
   Scheduler scheduler(executor, 1);

   std::thread canceller([&scheduler]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
      scheduler.cancel();
   });
   PipelineOutcome outcome = scheduler.runPipeline(jobs);
   canceller.join();

   MATRIXRUNNER_CHECK(outcome.mCancelled);
   MATRIXRUNNER_CHECK(outcome.mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(outcome.mJobs.size() == 4);
   MATRIXRUNNER_CHECK(outcome.mJobs[0].mReason == "cancelled");
   for (size_t i=1; i<outcome.mJobs.size(); i++)
   {
      MATRIXRUNNER_CHECK(outcome.mJobs[i].mResult == matrixrunner::v1::RESULT_FAILURE);
      MATRIXRUNNER_CHECK(outcome.mJobs[i].mReason == "cancelled before start");
   }

   // Only the started job held a lease, and it was released
   MATRIXRUNNER_CHECK(cache.getCleanupCount() == 1);
   MATRIXRUNNER_CHECK(runner.countCalls("sleep") == 1);

   std::error_code ec;
   fs::remove_all(root, ec);
}

static void testAggregate()
{
   std::vector<JobOutcome> outcomes(3);
   outcomes[0].mResult = matrixrunner::v1::RESULT_SUCCESS;
   outcomes[1].mResult = matrixrunner::v1::RESULT_ERRORED;
   outcomes[1].mAllowFailure = true;
   outcomes[2].mResult = matrixrunner::v1::RESULT_SUCCESS;
   outcomes[2].mAllowFailure = true;

   MATRIXRUNNER_CHECK(Scheduler::Aggregate(outcomes, false) == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(!outcomes[0].mSuppressed);
   MATRIXRUNNER_CHECK(outcomes[1].mSuppressed);
   MATRIXRUNNER_CHECK(!outcomes[2].mSuppressed);

   MATRIXRUNNER_CHECK(Scheduler::Aggregate(outcomes, true) == matrixrunner::v1::RESULT_FAILURE);

   outcomes[0].mResult = matrixrunner::v1::RESULT_ERRORED;
   MATRIXRUNNER_CHECK(Scheduler::Aggregate(outcomes, false) == matrixrunner::v1::RESULT_FAILURE);

   std::vector<JobOutcome> none;
   MATRIXRUNNER_CHECK(Scheduler::Aggregate(none, false) == matrixrunner::v1::RESULT_SUCCESS);
}

int main(int argc, char** argv)
{
   RUN_TEST(testAllowedFailureKeepsPipelineGreen);
   RUN_TEST(testFailureDoesNotStopSiblings);
   RUN_TEST(testWorkerBound);
   RUN_TEST(testCancelPipeline);
   RUN_TEST(testAggregate);
   return FinishTests("schedulertest");
}
