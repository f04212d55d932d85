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
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "matrixRunner/stepRunner.h"

static int sChecks = 0;
static int sFailures = 0;

#define MATRIXRUNNER_CHECK(cond) \
   do { \
      sChecks++; \
      if (!(cond)) \
      { \
         sFailures++; \
         printf("  FAILED %s:%d: %s\n", __FILE__, __LINE__, #cond); \
      } \
   } while (0)

#define MATRIXRUNNER_CHECK_THROWS(stmt, ExceptionType) \
   do { \
      bool caught = false; \
      try { stmt; } catch (const ExceptionType&) { caught = true; } \
      MATRIXRUNNER_CHECK(caught && #stmt); \
   } while (0)

#define RUN_TEST(func) \
   do { \
      printf("== %s\n", #func); \
      func(); \
   } while (0)

static inline int FinishTests(const char* name)
{
   printf("%s: %d/%d checks passed\n", name, sChecks - sFailures, sChecks);
   return sFailures == 0 ? 0 : 1;
}

// Fresh empty directory under the system temp dir
static inline std::string MakeTestDir(const std::string& name)
{
   std::filesystem::path path = std::filesystem::temp_directory_path() /
      ("matrixrunner-test-" + name + "-" + std::to_string(getpid()));
   std::error_code ec;
   std::filesystem::remove_all(path, ec);
   std::filesystem::create_directories(path);
   return path.string();
}

static inline void WriteTestFile(const std::filesystem::path& path, const std::string& content)
{
   std::filesystem::create_directories(path.parent_path());
   std::ofstream out(path, std::ios::binary);
   out << content;
}

static inline std::string ReadTestFile(const std::filesystem::path& path)
{
   std::ifstream in(path, std::ios::binary);
   std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
   return content;
}

// In-memory runner understanding a handful of commands:
//
//   fail                  exits 1
//   fail-if VAR=VALUE     exits 1 when the step env has VAR=VALUE
//   error                 can't launch
//   throw                 runner raises an exception
//   sleep                 blocks until cancelled or past the deadline
//   sleep-ms N            blocks N milliseconds
//   touch PATH            creates PATH inside the working directory
//   require PATH          exits 1 unless PATH exists in the working directory
//
// Anything else succeeds.
class ScriptedStepRunner : public MatrixRunner::StepRunner
{
public:
   struct Call
   {
      std::string mJobId;
      std::string mRun;
      std::string mWorkingDirectory;
      MatrixRunner::EnvMap mEnv;
   };

private:
   std::mutex mMutex;
   std::vector<Call> mCalls;
   std::atomic<int> mActive;
   std::atomic<int> mMaxActive;

public:

   ScriptedStepRunner() : mActive(0), mMaxActive(0)
   {
   }

   MatrixRunner::StepResult runStep(const MatrixRunner::Step& step, const MatrixRunner::StepContext& ctx) override
   {
      {
         std::lock_guard<std::mutex> lock(mMutex);
         Call call;
         call.mJobId = ctx.mJob ? ctx.mJob->mId : "";
         call.mRun = step.mRun;
         call.mWorkingDirectory = ctx.mWorkingDirectory;
         call.mEnv = ctx.mEnv;
         mCalls.push_back(call);
      }

      int active = ++mActive;
      int prev = mMaxActive.load();
      while (active > prev && !mMaxActive.compare_exchange_weak(prev, active))
      {
      }

      MatrixRunner::StepResult result = execute(step.mRun, ctx);
      --mActive;
      return result;
   }

   std::vector<Call> getCalls()
   {
      std::lock_guard<std::mutex> lock(mMutex);
      return mCalls;
   }

   size_t countCalls(const std::string& run)
   {
      std::lock_guard<std::mutex> lock(mMutex);
      size_t count = 0;
      for (const Call& call : mCalls)
      {
         if (call.mRun == run)
            count++;
      }
      return count;
   }

   inline int getMaxActive() const
   {
      return mMaxActive.load();
   }

private:

   MatrixRunner::StepResult execute(const std::string& run, const MatrixRunner::StepContext& ctx)
   {
      std::string cmd = run;
      std::string arg;
      size_t space = run.find(' ');
      if (space != std::string::npos)
      {
         cmd = run.substr(0, space);
         arg = run.substr(space + 1);
      }

      ctx.log("ran " + run);

      if (cmd == "fail")
      {
         return MatrixRunner::StepResult(matrixrunner::v1::RESULT_FAILURE, 1, "Exited with code 1");
      }
      else if (cmd == "fail-if")
      {
         std::string key, value;
         MatrixRunner::ParseKeyValue(arg, key, value);
         auto itr = ctx.mEnv.find(key);
         if (itr != ctx.mEnv.end() && itr->second == value)
         {
            return MatrixRunner::StepResult(matrixrunner::v1::RESULT_FAILURE, 1, "Exited with code 1");
         }
      }
      else if (cmd == "error")
      {
         return MatrixRunner::StepResult(matrixrunner::v1::RESULT_ERRORED, -1, "Couldn't launch");
      }
      else if (cmd == "throw")
      {
         throw std::runtime_error("runner exploded");
      }
      else if (cmd == "sleep")
      {
         auto limit = std::chrono::steady_clock::now() + std::chrono::seconds(10);
         while (!ctx.shouldStop() && std::chrono::steady_clock::now() < limit)
         {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
         }
         if (ctx.shouldStop())
         {
            return MatrixRunner::StepResult(matrixrunner::v1::RESULT_CANCELLED, -1, "stopped");
         }
      }
      else if (cmd == "sleep-ms")
      {
         std::this_thread::sleep_for(std::chrono::milliseconds(atoi(arg.c_str())));
      }
      else if (cmd == "touch")
      {
         WriteTestFile(std::filesystem::path(ctx.mWorkingDirectory) / arg, "data");
      }
      else if (cmd == "require")
      {
         if (!std::filesystem::exists(std::filesystem::path(ctx.mWorkingDirectory) / arg))
         {
            return MatrixRunner::StepResult(matrixrunner::v1::RESULT_FAILURE, 2, "missing " + arg);
         }
      }

      return MatrixRunner::StepResult(matrixrunner::v1::RESULT_SUCCESS, 0);
   }
};
