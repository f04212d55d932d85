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

#include <set>
#include <string>
#include <vector>

#include "matrixRunner/conditionEvaluator.h"
#include "matrixRunner/jobSpec.h"
#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

class MatrixExpander
{
   const PipelineConfig& mConfig;
   ConditionEvaluator mEvaluator;

public:

   explicit MatrixExpander(const PipelineConfig& config);

   // Cross product (first axis slowest), minus excludes, plus includes.
   // Every job is validated here; throws ConfigurationError.
   std::vector<JobSpec> expand() const;

   // True if every axis and env key the entry specifies equals the candidate's
   static bool EntryMatches(const MatrixEntry& entry, const AxisAssignment& axes, const EnvMap& env);

   static std::string MakeJobId(const AxisAssignment& axes, const EnvMap& overrides);

private:

   void validate() const;
   void validateEntry(const MatrixEntry& entry, const char* section) const;
   std::vector<AxisAssignment> crossProduct() const;
   AxisAssignment orderAxes(const AxisAssignment& axes) const;

   JobSpec makeJob(const AxisAssignment& axes,
                   const MatrixEntry* entry,
                   JobSpec::Origin origin,
                   std::set<std::string>& usedKeys) const;
};

}
