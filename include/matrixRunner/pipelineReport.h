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

#include <string>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/jobExecutor.h"
#include "matrixRunner/pipelineConfig.h"
#include "matrixRunner/scheduler.h"

namespace MatrixRunner
{

enum
{
   EXIT_OK = 0,
   EXIT_PIPELINE_FAILED = 1,
   EXIT_CONFIG_ERROR = 2,
   EXIT_DEPLOY_FAILED = 3,
   EXIT_USAGE = 64
};

const char* ResultToString(matrixrunner::v1::Result res);
const char* PhaseToString(matrixrunner::v1::Phase phase);

int ComputeExitCode(const PipelineOutcome& outcome, const matrixrunner::v1::DeployReport& deploy);

matrixrunner::v1::PipelineReport BuildPipelineReport(const PipelineConfig& config,
                                                     const RepoContext& repo,
                                                     const PipelineOutcome& outcome,
                                                     const matrixrunner::v1::DeployReport& deploy);

// Report for a run filtered out by branches.only / branches.except
matrixrunner::v1::PipelineReport BuildSkippedReport(const PipelineConfig& config,
                                                    const RepoContext& repo,
                                                    const std::string& reason);

bool ReportToJson(const matrixrunner::v1::PipelineReport& report, std::string& outJson);
bool WriteReportJson(const matrixrunner::v1::PipelineReport& report, const std::string& filename);

void PrintSummary(const matrixrunner::v1::PipelineReport& report);

}
