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
#include <string>
#include <vector>

#include "matrixRunner/stepRunner.h"

namespace MatrixRunner
{

// Runs each step as a temporary shell script:
//
//    set -e
//    cd "<working directory>"
//    <step>
//
// Output (stdout and stderr combined) is forwarded line by line to the step context.
// The shell is started through setsid(1) where available so cancellation and
// deadlines kill its whole process group, not just the shell.
class ShellStepRunner : public StepRunner
{
   std::string mShell;
   std::string mTempDir;
   std::string mSetsidPath;
   std::atomic<uint32_t> mScriptCounter;

public:

   explicit ShellStepRunner(const std::string& shell = "/bin/bash", const std::string& tempDir = "");

   StepResult runStep(const Step& step, const StepContext& ctx) override;

   inline const std::string& getShell() const
   {
      return mShell;
   }

   inline bool usesProcessGroups() const
   {
      return !mSetsidPath.empty();
   }

   // Returns the script path, or an empty string if it couldn't be written
   std::string writeScript(const std::string& prefix, const std::string& cwd, const std::string& cmdList);

   static std::vector<std::string> BuildLaunchEnv(const EnvMap& env);
};

}
