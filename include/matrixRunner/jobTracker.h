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

#include <mutex>
#include <stdint.h>
#include <string>

#include <google/protobuf/timestamp.pb.h>
#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/jobSpec.h"
#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

// Thread safe record of a single job: phases, step states, log rows and warnings.
// Log rows are indexed so each StepState can reference the rows it produced.
class JobTracker
{
   matrixrunner::v1::JobReport mReport;
   matrixrunner::v1::StepState* mNextStepState;
   std::string mLogPrefix;
   bool mQuiet;
   std::mutex mMutex;

public:

   JobTracker(const JobSpec& job, bool quiet);

   static google::protobuf::Timestamp GetNowTS();

   void begin();
   void setPhase(matrixrunner::v1::Phase phase);
   matrixrunner::v1::Phase getPhase();

   void beginStep(const std::string& stage, const Step& step);
   void endStep(matrixrunner::v1::Result result, int exitCode);

   // Records a step that never ran
   void skipStep(const std::string& stage, const Step& step);

   void log(const char* content, size_t length);
   void log(const std::string& content);
   void warn(const std::string& message);

   void finish(matrixrunner::v1::Result result, int exitStatus, const std::string& reason, double durationSeconds);

   matrixrunner::v1::JobReport getReport();

private:

   matrixrunner::v1::StepState* addStepLocked(const std::string& stage, const Step& step);
};

}
