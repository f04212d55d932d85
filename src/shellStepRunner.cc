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

#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <mutex>
#include <stdio.h>
#include <string.h>
#include <thread>

#ifndef _WIN32
   #include <signal.h>
   #include <sys/types.h>
#endif

#include "subprocess.h"

#include "matrixRunner/shellStepRunner.h"

namespace MatrixRunner
{

typedef std::function<void(const char*, std::size_t)> LogHandlerFunc;

// Splits combined process output into lines until the pipe closes
static void PollLogs(struct subprocess_s* proc, const LogHandlerFunc& handler)
{
   char buffer[4096];
   char* curLine = buffer;
   buffer[0] = '\0';

   while (true)
   {
      size_t bytesAvailable = sizeof(buffer) - 1 - (curLine - buffer);
      unsigned bytesRead = subprocess_read_stdout(proc, curLine, (unsigned)bytesAvailable);

      if (bytesRead == 0)
      {
         break;
      }

      char* eof = curLine + bytesRead;
      const char* nextLine = buffer;

      while (nextLine < eof)
      {
         const char* lineEnd = (const char*)memchr(nextLine, '\n', eof - nextLine);
         if (!lineEnd)
         {
            break;
         }

         size_t lineLength = lineEnd - nextLine;
         if (lineLength > 0 && nextLine[lineLength - 1] == '\r')
         {
            lineLength--;
         }

         handler(nextLine, lineLength);
         nextLine = lineEnd + 1;
      }

      size_t remaining = eof - nextLine;
      if (remaining > 0)
      {
         memmove(buffer, nextLine, remaining);
      }
      curLine = buffer + remaining;

      // Full buffer without a newline goes out as one line
      if (curLine == buffer + sizeof(buffer) - 1)
      {
         handler(buffer, curLine - buffer);
         curLine = buffer;
      }
   }

   if (curLine > buffer)
   {
      handler(buffer, curLine - buffer);
   }
}

ShellStepRunner::ShellStepRunner(const std::string& shell, const std::string& tempDir) :
mShell(shell),
mTempDir(tempDir),
mScriptCounter(0)
{
   if (mTempDir.empty())
   {
      mTempDir = std::filesystem::temp_directory_path().string();
   }

#ifndef _WIN32
   const char* setsidPaths[] = { "/usr/bin/setsid", "/bin/setsid" };
   for (const char* path : setsidPaths)
   {
      std::error_code ec;
      if (std::filesystem::exists(path, ec))
      {
         mSetsidPath = path;
         break;
      }
   }
   if (mSetsidPath.empty())
   {
      printf("STEP: WARNING setsid not found, cancelled steps may leave child processes running\n");
   }
#endif
}

// Kills the step shell and, when it leads its own session, everything it started
static void KillStepProcess(struct subprocess_s* proc, bool ownGroup)
{
#ifndef _WIN32
   if (ownGroup && proc->child > 0)
   {
      kill(-proc->child, SIGKILL);
   }
#endif
   subprocess_terminate(proc);
}

std::vector<std::string> ShellStepRunner::BuildLaunchEnv(const EnvMap& env)
{
   EnvMap merged = GetProcessEnv();
   for (const auto& itr : env)
   {
      merged[itr.first] = itr.second;
   }

   std::vector<std::string> launchEnv;
   for (const auto& itr : merged)
   {
      launchEnv.push_back(itr.first + "=" + itr.second);
   }
   return launchEnv;
}

std::string ShellStepRunner::writeScript(const std::string& prefix, const std::string& cwd, const std::string& cmdList)
{
   std::string path = (std::filesystem::path(mTempDir) / (prefix + ".sh")).string();
   std::ofstream outFile(path, std::ios::binary);
   if (!outFile)
   {
      return "";
   }

   outFile << "set -e\n";
   outFile << "cd \"" + cwd + "\"\n";
   outFile << cmdList;
   outFile << "\n";
   outFile.close();

   return outFile.fail() ? "" : path;
}

StepResult ShellStepRunner::runStep(const Step& step, const StepContext& ctx)
{
   if (ctx.mWorkingDirectory.empty())
   {
      return StepResult(matrixrunner::v1::RESULT_ERRORED, -1, "Working directory not set");
   }

   std::string key = ctx.mJob ? ctx.mJob->mCacheKey : std::string("deploy");
   std::string prefix = MakeTempPrefix(key) + "-" + std::to_string(mScriptCounter++);
   std::string scriptPath = writeScript(prefix, ctx.mWorkingDirectory, step.mRun);
   if (scriptPath.empty())
   {
      return StepResult(matrixrunner::v1::RESULT_ERRORED, -1, "Couldn't write step script");
   }

   std::vector<std::string> envS = BuildLaunchEnv(ctx.mEnv);
   std::vector<const char*> envC;
   for (const std::string& str : envS)
   {
      envC.push_back(str.c_str());
   }
   envC.push_back(NULL);

   // setsid execs in place, so the shell pid also becomes its process group id
   bool ownGroup = !mSetsidPath.empty();
   std::vector<const char*> launchCmds;
   if (ownGroup)
   {
      launchCmds.push_back(mSetsidPath.c_str());
   }
   launchCmds.push_back(mShell.c_str());
   launchCmds.push_back(scriptPath.c_str());
   launchCmds.push_back(NULL);
   int procFlags = subprocess_option_enable_async | subprocess_option_combined_stdout_stderr;

   struct subprocess_s proc;
   if (subprocess_create_ex(&launchCmds[0], procFlags, &envC[0], &proc) != 0)
   {
      std::error_code ec;
      std::filesystem::remove(scriptPath, ec);
      std::string err = "Unknown error launching " + mShell;
      ctx.log(err);
      return StepResult(matrixrunner::v1::RESULT_ERRORED, -1, err);
   }

   // Watches for cancellation and deadline while output is being read
   std::mutex watchMutex;
   std::condition_variable watchCond;
   bool done = false;
   bool killed = false;

   std::thread watcher([&]() {
      std::unique_lock<std::mutex> lock(watchMutex);
      while (!done)
      {
         if (ctx.shouldStop())
         {
            KillStepProcess(&proc, ownGroup);
            killed = true;
            break;
         }
         watchCond.wait_for(lock, std::chrono::milliseconds(100));
      }
   });

   PollLogs(&proc, [&ctx](const char* line, std::size_t length) {
      ctx.log(line, length);
   });

   {
      std::lock_guard<std::mutex> lock(watchMutex);
      done = true;
   }
   watchCond.notify_all();
   watcher.join();

   int processReturn = 1;
   if (subprocess_join(&proc, &processReturn) != 0)
   {
      processReturn = -1;
   }
   subprocess_destroy(&proc);

   std::error_code ec;
   std::filesystem::remove(scriptPath, ec);

   if (killed)
   {
      return StepResult(matrixrunner::v1::RESULT_CANCELLED, processReturn,
                        ctx.isCancelled() ? "Step cancelled" : "Step timed out");
   }

   if (processReturn != 0)
   {
      return StepResult(matrixrunner::v1::RESULT_FAILURE, processReturn,
                        "Exited with code " + std::to_string(processReturn));
   }

   return StepResult(matrixrunner::v1::RESULT_SUCCESS, 0);
}

}
