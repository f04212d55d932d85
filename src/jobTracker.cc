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
#include <stdio.h>

#include "matrixRunner/jobTracker.h"

namespace MatrixRunner
{

JobTracker::JobTracker(const JobSpec& job, bool quiet) :
mNextStepState(NULL),
mQuiet(quiet)
{
   mReport.set_index(job.mIndex);
   mReport.set_id(job.mId);
   mReport.set_cache_key(job.mCacheKey);
   for (const auto& itr : job.mAxes)
   {
      (*mReport.mutable_axes())[itr.first] = itr.second;
   }
   for (const auto& itr : job.mEnv)
   {
      (*mReport.mutable_env())[itr.first] = itr.second;
   }
   mReport.set_mode(JobModeToString(job.mMode));
   mReport.set_target_platform(job.mTargetPlatform);
   mReport.set_allow_failure(job.mAllowFailure);
   mReport.set_privileged(job.mPrivileged);
   for (const std::string& service : job.mServices)
   {
      mReport.add_services(service);
   }
   mReport.set_result(matrixrunner::v1::RESULT_UNSPECIFIED);

   mLogPrefix = "JOB[" + std::to_string(job.mIndex) + "]";
}

google::protobuf::Timestamp JobTracker::GetNowTS()
{
   google::protobuf::Timestamp ts;
   auto now = std::chrono::system_clock::now();
   auto duration = now.time_since_epoch();

   ts.set_seconds(std::chrono::duration_cast<std::chrono::seconds>(duration).count());
   ts.set_nanos(std::chrono::duration_cast<std::chrono::nanoseconds>(duration).count() % 1000000000);
   return ts;
}

void JobTracker::begin()
{
   std::lock_guard<std::mutex> lock(mMutex);
   *mReport.mutable_started_at() = GetNowTS();
   if (!mQuiet)
   {
      printf("%s: starting %s\n", mLogPrefix.c_str(), mReport.id().c_str());
   }
}

void JobTracker::setPhase(matrixrunner::v1::Phase phase)
{
   std::lock_guard<std::mutex> lock(mMutex);
   mReport.add_phases(phase);
}

matrixrunner::v1::Phase JobTracker::getPhase()
{
   std::lock_guard<std::mutex> lock(mMutex);
   if (mReport.phases_size() == 0)
   {
      return matrixrunner::v1::PHASE_UNSPECIFIED;
   }
   return (matrixrunner::v1::Phase)mReport.phases(mReport.phases_size() - 1);
}

matrixrunner::v1::StepState* JobTracker::addStepLocked(const std::string& stage, const Step& step)
{
   matrixrunner::v1::StepState* state = mReport.add_steps();
   state->set_id(mReport.steps_size() - 1);
   state->set_name(step.mName);
   state->set_stage(stage);
   state->set_result(matrixrunner::v1::RESULT_UNSPECIFIED);
   state->set_log_index(mReport.logs_size());
   return state;
}

void JobTracker::beginStep(const std::string& stage, const Step& step)
{
   std::lock_guard<std::mutex> lock(mMutex);
   mNextStepState = addStepLocked(stage, step);
   *(mNextStepState->mutable_started_at()) = GetNowTS();

   if (!mQuiet)
   {
      printf("%s: [%s] %s\n", mLogPrefix.c_str(), stage.c_str(), step.mName.c_str());
   }
}

void JobTracker::endStep(matrixrunner::v1::Result result, int exitCode)
{
   std::lock_guard<std::mutex> lock(mMutex);
   if (mNextStepState == NULL)
      return;
   mNextStepState->set_log_length(mReport.logs_size() - mNextStepState->log_index());
   mNextStepState->set_result(result);
   mNextStepState->set_exit_code(exitCode);
   *mNextStepState->mutable_stopped_at() = GetNowTS();
   mNextStepState = NULL;
}

void JobTracker::skipStep(const std::string& stage, const Step& step)
{
   std::lock_guard<std::mutex> lock(mMutex);
   matrixrunner::v1::StepState* state = addStepLocked(stage, step);
   state->set_result(matrixrunner::v1::RESULT_SKIPPED);
}

void JobTracker::log(const char* content, size_t length)
{
   std::lock_guard<std::mutex> lock(mMutex);
   matrixrunner::v1::LogRow* row = mReport.add_logs();
   *row->mutable_time() = GetNowTS();
   row->set_content(content, length);

   if (!mQuiet)
   {
      printf("%s: %s\n", mLogPrefix.c_str(), row->content().c_str());
   }
}

void JobTracker::log(const std::string& content)
{
   log(content.c_str(), content.size());
}

void JobTracker::warn(const std::string& message)
{
   std::lock_guard<std::mutex> lock(mMutex);
   mReport.add_warnings(message);
   printf("%s: WARNING %s\n", mLogPrefix.c_str(), message.c_str());
}

void JobTracker::finish(matrixrunner::v1::Result result, int exitStatus, const std::string& reason, double durationSeconds)
{
   std::lock_guard<std::mutex> lock(mMutex);
   mReport.set_result(result);
   mReport.set_exit_status(exitStatus);
   mReport.set_reason(reason);
   mReport.set_duration_seconds(durationSeconds);
   *mReport.mutable_stopped_at() = GetNowTS();
}

matrixrunner::v1::JobReport JobTracker::getReport()
{
   std::lock_guard<std::mutex> lock(mMutex);
   return mReport;
}

}
