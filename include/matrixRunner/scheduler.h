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
#include <vector>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/jobExecutor.h"
#include "matrixRunner/jobSpec.h"

namespace MatrixRunner
{

struct PipelineOutcome
{
   matrixrunner::v1::Result mResult; // SUCCESS or FAILURE
   bool mCancelled;
   std::vector<JobOutcome> mJobs;    // same order as the job list

   PipelineOutcome() : mResult(matrixrunner::v1::RESULT_UNSPECIFIED), mCancelled(false)
   {
   }
};

// Runs every job on a bounded pool of worker threads and waits for all of them.
// A failing job never stops its siblings.
class Scheduler
{
   JobExecutor& mExecutor;
   uint32_t mMaxParallel;
   std::atomic<bool> mOwnCancel;
   std::atomic<bool>* mCancelFlag;

public:

   Scheduler(JobExecutor& executor, uint32_t maxParallel, std::atomic<bool>* cancelFlag = NULL);

   PipelineOutcome runPipeline(const std::vector<JobSpec>& jobs);

   // Stops dispatching; running jobs observe it and still finalize
   void cancel();

   inline bool isCancelled() const
   {
      return mCancelFlag->load();
   }

   inline uint32_t getMaxParallel() const
   {
      return mMaxParallel;
   }

   // Marks suppressed failures and returns SUCCESS only if every job that
   // isn't allowed to fail succeeded.
   static matrixrunner::v1::Result Aggregate(std::vector<JobOutcome>& outcomes, bool cancelled);
};

}
