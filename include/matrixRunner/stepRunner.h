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
#include <string>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/jobSpec.h"
#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

class JobTracker;

// Everything a runner needs to execute one step of one job
struct StepContext
{
   const JobSpec* mJob;          // NULL for deploy commands
   std::string mWorkingDirectory;
   EnvMap mEnv;
   JobTracker* mTracker;         // NULL logs straight to stdout
   const std::atomic<bool>* mCancelFlag;
   std::chrono::steady_clock::time_point mDeadline;
   bool mHasDeadline;

   StepContext() : mJob(NULL), mTracker(NULL), mCancelFlag(NULL), mHasDeadline(false)
   {
   }

   inline bool isCancelled() const
   {
      return mCancelFlag && mCancelFlag->load();
   }

   inline bool isExpired() const
   {
      return mHasDeadline && std::chrono::steady_clock::now() >= mDeadline;
   }

   inline bool shouldStop() const
   {
      return isCancelled() || isExpired();
   }

   void log(const char* content, size_t length) const;
   void log(const std::string& content) const;
};

struct StepResult
{
   matrixrunner::v1::Result mResult;
   int mExitCode;
   std::string mMessage;

   StepResult() : mResult(matrixrunner::v1::RESULT_SUCCESS), mExitCode(0)
   {
   }

   StepResult(matrixrunner::v1::Result result, int exitCode, const std::string& message = "") :
   mResult(result), mExitCode(exitCode), mMessage(message)
   {
   }
};

// Executes opaque step payloads. Shared between concurrently running jobs,
// so implementations must be reentrant.
class StepRunner
{
public:
   virtual ~StepRunner()
   {
   }

   // RESULT_SUCCESS, RESULT_FAILURE (non-zero exit), RESULT_ERRORED (could not
   // launch) or RESULT_CANCELLED (stopped by cancellation or deadline).
   virtual StepResult runStep(const Step& step, const StepContext& ctx) = 0;
};

}
