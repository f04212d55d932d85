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

#include <algorithm>
#include <deque>
#include <mutex>
#include <stdio.h>
#include <thread>

#include "matrixRunner/scheduler.h"

namespace MatrixRunner
{

Scheduler::Scheduler(JobExecutor& executor, uint32_t maxParallel, std::atomic<bool>* cancelFlag) :
mExecutor(executor),
mMaxParallel(maxParallel),
mOwnCancel(false),
mCancelFlag(cancelFlag ? cancelFlag : &mOwnCancel)
{
   if (mMaxParallel == 0)
   {
      mMaxParallel = std::max<uint32_t>(1, std::thread::hardware_concurrency());
   }
}

void Scheduler::cancel()
{
   if (!mCancelFlag->exchange(true))
   {
      printf("SCHEDULER: cancelling pipeline\n");
   }
}

matrixrunner::v1::Result Scheduler::Aggregate(std::vector<JobOutcome>& outcomes, bool cancelled)
{
   bool success = !cancelled;

   for (JobOutcome& outcome : outcomes)
   {
      outcome.mSuppressed = false;
      if (outcome.mResult == matrixrunner::v1::RESULT_SUCCESS)
      {
         continue;
      }

      if (outcome.mAllowFailure)
      {
         outcome.mSuppressed = true;
      }
      else
      {
         success = false;
      }
      outcome.mReport.set_suppressed(outcome.mSuppressed);
   }

   return success ? matrixrunner::v1::RESULT_SUCCESS : matrixrunner::v1::RESULT_FAILURE;
}

PipelineOutcome Scheduler::runPipeline(const std::vector<JobSpec>& jobs)
{
   PipelineOutcome pipeline;
   pipeline.mJobs.resize(jobs.size());

   std::mutex queueMutex;
   std::deque<size_t> queue;
   for (size_t i=0; i<jobs.size(); i++)
   {
      queue.push_back(i);
   }

   uint32_t workerCount = std::min<uint32_t>(mMaxParallel, (uint32_t)jobs.size());
   printf("SCHEDULER: running %u jobs on %u workers\n", (unsigned)jobs.size(), workerCount);

   auto worker = [&]() {
      while (true)
      {
         size_t idx = 0;
         {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (queue.empty())
            {
               return;
            }
            idx = queue.front();
            queue.pop_front();
         }

         if (isCancelled())
         {
            pipeline.mJobs[idx] = mExecutor.notStarted(jobs[idx], "cancelled before start");
            continue;
         }

         try
         {
            pipeline.mJobs[idx] = mExecutor.run(jobs[idx], mCancelFlag);
         }
         catch (const std::exception& e)
         {
            printf("SCHEDULER: job %s raised %s\n", jobs[idx].mId.c_str(), e.what());
            JobOutcome outcome = mExecutor.notStarted(jobs[idx], std::string("executor error: ") + e.what());
            outcome.mResult = matrixrunner::v1::RESULT_ERRORED;
            outcome.mReport.set_result(matrixrunner::v1::RESULT_ERRORED);
            pipeline.mJobs[idx] = outcome;
         }
      }
   };

   std::vector<std::thread> workers;
   for (uint32_t i=0; i<workerCount; i++)
   {
      workers.push_back(std::thread(worker));
   }

   for (std::thread& thread : workers)
   {
      thread.join();
   }

   pipeline.mCancelled = isCancelled();
   pipeline.mResult = Aggregate(pipeline.mJobs, pipeline.mCancelled);

   printf("SCHEDULER: pipeline %s%s\n",
          pipeline.mResult == matrixrunner::v1::RESULT_SUCCESS ? "succeeded" : "failed",
          pipeline.mCancelled ? " (cancelled)" : "");
   return pipeline;
}

}
