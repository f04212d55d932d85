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
#include <signal.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <curl/curl.h>

#include <google/protobuf/stubs/common.h>

#include "matrixRunner/cacheManager.h"
#include "matrixRunner/deployActions.h"
#include "matrixRunner/deployGate.h"
#include "matrixRunner/jobExecutor.h"
#include "matrixRunner/matrixExpander.h"
#include "matrixRunner/pipelineConfig.h"
#include "matrixRunner/pipelineReport.h"
#include "matrixRunner/scheduler.h"
#include "matrixRunner/shellStepRunner.h"

using namespace MatrixRunner;

struct RunOptions
{
   std::string configPath;
   std::string workspaceRoot;
   std::string cacheRoot;
   std::string shell;
   std::string reportPath;
   RepoContext repo;
   uint32_t maxParallel;
   uint32_t timeoutSeconds;
   bool hasTimeout;
   bool listOnly;
   bool keepWorkspaces;
   bool quiet;

   RunOptions() :
   configPath(".matrixrunner.yml"),
   workspaceRoot(".matrixrunner/work"),
   cacheRoot(".matrixrunner/cache"),
   shell("/bin/bash"),
   maxParallel(0),
   timeoutSeconds(0),
   hasTimeout(false),
   listOnly(false),
   keepWorkspaces(false),
   quiet(false)
   {
   }
};

static std::atomic<bool> sCancelRequested(false);

static void HandleSignal(int)
{
   sCancelRequested = true;
}

static void PrintUsage(const char* exe)
{
   printf("Usage: %s [options]\n"
          "  --config FILE           pipeline document (default .matrixrunner.yml)\n"
          "  --branch NAME           branch under test (default $MATRIX_BRANCH)\n"
          "  --tag NAME              tag under test\n"
          "  --jobs N                maximum concurrent jobs\n"
          "  --workspace-root DIR    per-job workspaces\n"
          "  --cache-root DIR        persistent cache store\n"
          "  --env K=V               add to the repository environment\n"
          "  --env-file FILE         read K=V lines into the repository environment\n"
          "  --timeout SECS          per-job timeout, overrides the document\n"
          "  --shell PATH            shell used for steps (default /bin/bash)\n"
          "  --report FILE           write the JSON report\n"
          "  --list                  print the expanded jobs and exit\n"
          "  --keep-workspaces       don't remove job workspaces\n"
          "  --quiet                 don't echo job output\n", exe);
}

static bool ParseArgs(RunOptions& options, int argc, char** argv)
{
   options.repo.mEnv = GetProcessEnv();

   for (int i = 1; i < argc; ++i)
   {
      if (strcmp(argv[i], "--config") == 0 && i + 1 < argc)
      {
         options.configPath = argv[++i];
      }
      else if (strcmp(argv[i], "--branch") == 0 && i + 1 < argc)
      {
         options.repo.mBranch = argv[++i];
      }
      else if (strcmp(argv[i], "--tag") == 0 && i + 1 < argc)
      {
         options.repo.mTag = argv[++i];
      }
      else if (strcmp(argv[i], "--jobs") == 0 && i + 1 < argc)
      {
         if (!ParseUInt32(argv[++i], options.maxParallel))
         {
            printf("Invalid --jobs value: %s\n", argv[i]);
            return false;
         }
      }
      else if (strcmp(argv[i], "--workspace-root") == 0 && i + 1 < argc)
      {
         options.workspaceRoot = argv[++i];
      }
      else if (strcmp(argv[i], "--cache-root") == 0 && i + 1 < argc)
      {
         options.cacheRoot = argv[++i];
      }
      else if (strcmp(argv[i], "--env") == 0 && i + 1 < argc)
      {
         std::string key, value;
         if (!ParseKeyValue(argv[++i], key, value))
         {
            printf("Invalid --env value: %s\n", argv[i]);
            return false;
         }
         options.repo.mEnv[key] = value;
      }
      else if (strcmp(argv[i], "--env-file") == 0 && i + 1 < argc)
      {
         std::string path = argv[++i];
         if (!std::filesystem::exists(path))
         {
            printf("Env file not found: %s\n", path.c_str());
            return false;
         }
         for (auto& itr : ParseEnvFile(path))
         {
            options.repo.mEnv[itr.first] = itr.second;
         }
      }
      else if (strcmp(argv[i], "--timeout") == 0 && i + 1 < argc)
      {
         if (!ParseUInt32(argv[++i], options.timeoutSeconds))
         {
            printf("Invalid --timeout value: %s\n", argv[i]);
            return false;
         }
         options.hasTimeout = true;
      }
      else if (strcmp(argv[i], "--shell") == 0 && i + 1 < argc)
      {
         options.shell = argv[++i];
      }
      else if (strcmp(argv[i], "--report") == 0 && i + 1 < argc)
      {
         options.reportPath = argv[++i];
      }
      else if (strcmp(argv[i], "--list") == 0)
      {
         options.listOnly = true;
      }
      else if (strcmp(argv[i], "--keep-workspaces") == 0)
      {
         options.keepWorkspaces = true;
      }
      else if (strcmp(argv[i], "--quiet") == 0)
      {
         options.quiet = true;
      }
      else
      {
         printf("Unknown argument: %s\n", argv[i]);
         return false;
      }
   }

   if (options.repo.mBranch.empty())
   {
      // Fall back to what a CI host usually exports, otherwise stays empty
      auto itr = options.repo.mEnv.find("MATRIX_BRANCH");
      if (itr != options.repo.mEnv.end())
      {
         options.repo.mBranch = itr->second;
      }
   }

   return true;
}

static void ListJobs(const std::vector<JobSpec>& jobs)
{
   for (const JobSpec& job : jobs)
   {
      printf("%3u  %-12s %s%s%s\n", job.mIndex, JobModeToString(job.mMode), job.mId.c_str(),
             job.mAllowFailure ? "  [allow failure]" : "",
             job.mPrivileged ? "  [privileged]" : "");
   }
}

static int RunPipeline(RunOptions& options)
{
   PipelineConfig config;
   std::vector<JobSpec> jobs;

   try
   {
      config = LoadPipelineConfigFile(options.configPath);
      if (options.hasTimeout)
      {
         config.mTimeoutSeconds = options.timeoutSeconds;
      }
      if (options.maxParallel != 0)
      {
         config.mMaxParallel = options.maxParallel;
      }

      MatrixExpander expander(config);
      jobs = expander.expand();
   }
   catch (const ConfigurationError& e)
   {
      printf("Configuration error: %s\n", e.what());
      return EXIT_CONFIG_ERROR;
   }

   if (options.listOnly)
   {
      ListJobs(jobs);
      return EXIT_OK;
   }

   if (!config.isBranchEnabled(options.repo.mBranch))
   {
      std::string reason = "branch '" + options.repo.mBranch + "' is filtered out";
      printf("SCHEDULER: %s\n", reason.c_str());
      matrixrunner::v1::PipelineReport report = BuildSkippedReport(config, options.repo, reason);
      PrintSummary(report);
      if (!options.reportPath.empty())
      {
         WriteReportJson(report, options.reportPath);
      }
      return EXIT_OK;
   }

   signal(SIGINT, HandleSignal);
   signal(SIGTERM, HandleSignal);

   ShellStepRunner runner(options.shell);
   CacheManager cache(config.mCache, options.cacheRoot);
   JobExecutor executor(config, options.repo, runner, cache, options.workspaceRoot, options.quiet);
   Scheduler scheduler(executor, config.mMaxParallel, &sCancelRequested);

   PipelineOutcome outcome = scheduler.runPipeline(jobs);

   DeployGate gate(config);
   gate.maybeDeploy(jobs, outcome, options.repo, options.workspaceRoot, &runner, &sCancelRequested);

   matrixrunner::v1::PipelineReport report = BuildPipelineReport(config, options.repo, outcome, gate.getReport());
   PrintSummary(report);

   if (!options.reportPath.empty() && !WriteReportJson(report, options.reportPath))
   {
      printf("REPORT: couldn't write %s\n", options.reportPath.c_str());
   }

   if (!options.keepWorkspaces)
   {
      for (const JobSpec& job : jobs)
      {
         std::error_code ec;
         std::filesystem::remove_all(JobExecutor::GetJobWorkspace(options.workspaceRoot, job), ec);
      }
   }

   return report.exit_code();
}

// Entrypoint
int main(int argc, char** argv)
{
   GOOGLE_PROTOBUF_VERIFY_VERSION;

   RunOptions options;
   for (int i = 1; i < argc; ++i)
   {
      if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0)
      {
         PrintUsage(argv[0]);
         return EXIT_OK;
      }
   }

   if (!ParseArgs(options, argc, argv))
   {
      PrintUsage(argv[0]);
      return EXIT_USAGE;
   }

   if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
   {
      printf("Failed to initialize CURL\n");
      return EXIT_USAGE;
   }

   DeployAction::RegisterDefaultActions();

   int ret = RunPipeline(options);

   curl_global_cleanup();
   google::protobuf::ShutdownProtobufLibrary();
   return ret;
}
