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
#include <chrono>
#include <filesystem>
#include <stdio.h>
#include <string>

#include "matrixRunner/jobTracker.h"
#include "matrixRunner/shellStepRunner.h"
#include "testHelpers.h"

using namespace MatrixRunner;

static JobSpec MakeShellJob()
{
   JobSpec job;
   job.mIndex = 0;
   job.mId = "shell=sh";
   job.mCacheKey = "shell_sh";
   return job;
}

static Step MakeStep(const std::string& run)
{
   Step step;
   step.mName = run;
   step.mRun = run;
   return step;
}

static bool HasLogLine(const matrixrunner::v1::JobReport& report, const std::string& line)
{
   for (const matrixrunner::v1::LogRow& row : report.logs())
   {
      if (row.content() == line)
      {
         return true;
      }
   }
   return false;
}

static void testOutputCaptured()
{
   std::string root = MakeTestDir("shell-output");
   JobSpec job = MakeShellJob();
   JobTracker tracker(job, true);
   ShellStepRunner runner("/bin/sh");

   StepContext ctx;
   ctx.mJob = &job;
   ctx.mWorkingDirectory = root;
   ctx.mTracker = &tracker;

   StepResult result = runner.runStep(MakeStep("echo first\necho second 1>&2"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(result.mExitCode == 0);

   matrixrunner::v1::JobReport report = tracker.getReport();
   MATRIXRUNNER_CHECK(HasLogLine(report, "first"));
   MATRIXRUNNER_CHECK(HasLogLine(report, "second"));

   std::error_code ec;
   std::filesystem::remove_all(root, ec);
}

static void testExitCode()
{
   std::string root = MakeTestDir("shell-exit");
   ShellStepRunner runner("/bin/sh");

   StepContext ctx;
   ctx.mWorkingDirectory = root;

   StepResult result = runner.runStep(MakeStep("exit 7"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(result.mExitCode == 7);

   // set -e stops at the first failing command
   result = runner.runStep(MakeStep("false\ntouch reached"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_FAILURE);
   MATRIXRUNNER_CHECK(!std::filesystem::exists(std::filesystem::path(root) / "reached"));

   std::error_code ec;
   std::filesystem::remove_all(root, ec);
}

static void testEnvAndWorkingDirectory()
{
   std::string root = MakeTestDir("shell-env");
   ShellStepRunner runner("/bin/sh");

   StepContext ctx;
   ctx.mWorkingDirectory = root;
   ctx.mEnv["MATRIX_RUST"] = "stable";

   StepResult result = runner.runStep(MakeStep("test \"$MATRIX_RUST\" = stable\necho \"$MATRIX_RUST\" > out.txt"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_SUCCESS);
   MATRIXRUNNER_CHECK(ReadTestFile(std::filesystem::path(root) / "out.txt") == "stable\n");

   // Process environment is inherited underneath the step env
   std::vector<std::string> env = ShellStepRunner::BuildLaunchEnv(ctx.mEnv);
   bool found = false;
   for (const std::string& kv : env)
   {
      if (kv == "MATRIX_RUST=stable")
         found = true;
   }
   MATRIXRUNNER_CHECK(found);

   std::error_code ec;
   std::filesystem::remove_all(root, ec);
}

static void testDeadline()
{
   std::string root = MakeTestDir("shell-deadline");
   ShellStepRunner runner("/bin/sh");

   StepContext ctx;
   ctx.mWorkingDirectory = root;
   ctx.mHasDeadline = true;
   ctx.mDeadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(300);

   // sleep runs as a child of the shell and holds the output pipe open
   MATRIXRUNNER_CHECK(runner.usesProcessGroups());
   auto start = std::chrono::steady_clock::now();
   StepResult result = runner.runStep(MakeStep("echo waiting\nsleep 5\ntouch finished"), ctx);
   double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_CANCELLED);
   MATRIXRUNNER_CHECK(result.mMessage == "Step timed out");
   MATRIXRUNNER_CHECK(elapsed < 3.0);
   MATRIXRUNNER_CHECK(!std::filesystem::exists(std::filesystem::path(root) / "finished"));

   std::error_code ec;
   std::filesystem::remove_all(root, ec);
}

static void testCancel()
{
   std::string root = MakeTestDir("shell-cancel");
   ShellStepRunner runner("/bin/sh");
   std::atomic<bool> cancel(false);

   StepContext ctx;
   ctx.mWorkingDirectory = root;
   ctx.mCancelFlag = &cancel;

   std::thread canceller([&cancel]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      cancel.store(true);
   });

   auto start = std::chrono::steady_clock::now();
   StepResult result = runner.runStep(MakeStep("sleep 5 | cat\ntouch finished"), ctx);
   double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
   canceller.join();

   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_CANCELLED);
   MATRIXRUNNER_CHECK(result.mMessage == "Step cancelled");
   MATRIXRUNNER_CHECK(elapsed < 3.0);
   MATRIXRUNNER_CHECK(!std::filesystem::exists(std::filesystem::path(root) / "finished"));

   std::error_code ec;
   std::filesystem::remove_all(root, ec);
}

static void testLaunchErrors()
{
   ShellStepRunner runner("/bin/sh");
   StepContext ctx;

   StepResult result = runner.runStep(MakeStep("true"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_ERRORED);

   ShellStepRunner badTemp("/bin/sh", "/nonexistent/matrixrunner-temp");
   ctx.mWorkingDirectory = "/tmp";
   result = badTemp.runStep(MakeStep("true"), ctx);
   MATRIXRUNNER_CHECK(result.mResult == matrixrunner::v1::RESULT_ERRORED);
}

int main(int argc, char** argv)
{
   RUN_TEST(testOutputCaptured);
   RUN_TEST(testExitCode);
   RUN_TEST(testEnvAndWorkingDirectory);
   RUN_TEST(testDeadline);
   RUN_TEST(testCancel);
   RUN_TEST(testLaunchErrors);
   return FinishTests("shelltest");
}
