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
#include <fstream>
#include <stdio.h>

#include <google/protobuf/util/json_util.h>

#include "matrixRunner/jobTracker.h"
#include "matrixRunner/pipelineReport.h"

using namespace google::protobuf::util;

namespace MatrixRunner
{

const char* ResultToString(matrixrunner::v1::Result res)
{
   static const char* names[] = {
      "",
      "success",
      "failure",
      "errored",
      "cancelled",
      "skipped"
   };
   uint8_t key = std::min<uint8_t>((uint8_t)res, (uint8_t)(sizeof(names) / sizeof(names[0]) - 1));
   return names[key];
}

const char* PhaseToString(matrixrunner::v1::Phase phase)
{
   static const char* names[] = {
      "",
      "pending",
      "preparing",
      "running",
      "succeeded",
      "failed",
      "finalizing",
      "done"
   };
   uint8_t key = std::min<uint8_t>((uint8_t)phase, (uint8_t)(sizeof(names) / sizeof(names[0]) - 1));
   return names[key];
}

int ComputeExitCode(const PipelineOutcome& outcome, const matrixrunner::v1::DeployReport& deploy)
{
   if (outcome.mResult != matrixrunner::v1::RESULT_SUCCESS)
   {
      return EXIT_PIPELINE_FAILED;
   }

   if (deploy.fired() && deploy.result() != matrixrunner::v1::RESULT_SUCCESS)
   {
      return EXIT_DEPLOY_FAILED;
   }

   return EXIT_OK;
}

matrixrunner::v1::PipelineReport BuildPipelineReport(const PipelineConfig& config,
                                                     const RepoContext& repo,
                                                     const PipelineOutcome& outcome,
                                                     const matrixrunner::v1::DeployReport& deploy)
{
   matrixrunner::v1::PipelineReport report;
   report.set_name(config.mName);
   report.set_branch(repo.mBranch);
   report.set_tag(repo.mTag);
   report.set_result(outcome.mResult);
   report.set_cancelled(outcome.mCancelled);

   bool haveStart = false;
   for (const JobOutcome& job : outcome.mJobs)
   {
      matrixrunner::v1::JobReport* jobReport = report.add_jobs();
      *jobReport = job.mReport;
      jobReport->set_suppressed(job.mSuppressed);

      if (job.mReport.has_started_at() &&
          (!haveStart || job.mReport.started_at().seconds() < report.started_at().seconds()))
      {
         *report.mutable_started_at() = job.mReport.started_at();
         haveStart = true;
      }
   }

   *report.mutable_deploy() = deploy;
   report.set_exit_code(ComputeExitCode(outcome, deploy));
   *report.mutable_stopped_at() = JobTracker::GetNowTS();
   return report;
}

matrixrunner::v1::PipelineReport BuildSkippedReport(const PipelineConfig& config,
                                                    const RepoContext& repo,
                                                    const std::string& reason)
{
   matrixrunner::v1::PipelineReport report;
   report.set_name(config.mName);
   report.set_branch(repo.mBranch);
   report.set_tag(repo.mTag);
   report.set_result(matrixrunner::v1::RESULT_SKIPPED);
   report.set_skipped(true);
   report.set_skip_reason(reason);
   report.mutable_deploy()->set_configured(config.mDeploy.mEnabled);
   report.mutable_deploy()->set_result(matrixrunner::v1::RESULT_SKIPPED);
   report.set_exit_code(EXIT_OK);
   *report.mutable_started_at() = JobTracker::GetNowTS();
   *report.mutable_stopped_at() = report.started_at();
   return report;
}

bool ReportToJson(const matrixrunner::v1::PipelineReport& report, std::string& outJson)
{
   JsonPrintOptions options;
   options.add_whitespace = true;
   options.preserve_proto_field_names = true;
   outJson.clear();
   return MessageToJsonString(report, &outJson, options).ok();
}

bool WriteReportJson(const matrixrunner::v1::PipelineReport& report, const std::string& filename)
{
   std::string json;
   if (!ReportToJson(report, json))
   {
      printf("REPORT: couldn't encode report\n");
      return false;
   }

   std::ofstream outFile(filename, std::ios::binary);
   if (!outFile)
   {
      printf("REPORT: couldn't open %s\n", filename.c_str());
      return false;
   }

   outFile << json;
   outFile.close();
   return !outFile.fail();
}

void PrintSummary(const matrixrunner::v1::PipelineReport& report)
{
   printf("\n== %s (%s%s%s) ==\n", report.name().c_str(), report.branch().c_str(),
          report.tag().empty() ? "" : ", tag ", report.tag().c_str());

   if (report.skipped())
   {
      printf("skipped: %s\n", report.skip_reason().c_str());
      return;
   }

   for (const matrixrunner::v1::JobReport& job : report.jobs())
   {
      printf("  %-10s %7.1fs  %s%s\n",
             ResultToString(job.result()),
             job.duration_seconds(),
             job.id().c_str(),
             job.allow_failure() ? "  [allow failure]" : "");

      if (!job.reason().empty())
      {
         printf("             %s\n", job.reason().c_str());
      }
      for (const std::string& warning : job.warnings())
      {
         printf("             warning: %s\n", warning.c_str());
      }
   }

   const matrixrunner::v1::DeployReport& deploy = report.deploy();
   if (deploy.configured())
   {
      if (deploy.fired())
         printf("deploy: %s %s%s\n", deploy.provider().c_str(), ResultToString(deploy.result()),
                deploy.error().empty() ? "" : (" (" + deploy.error() + ")").c_str());
      else
         printf("deploy: not fired, %s\n", deploy.reason().c_str());
   }

   printf("pipeline: %s%s\n", ResultToString(report.result()), report.cancelled() ? " (cancelled)" : "");
}

}
