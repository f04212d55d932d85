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

#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

// Maps a job environment onto one JobMode. Modes are tested in the fixed
// priority order of PipelineConfig::mModeFlags, first set flag wins.
class ConditionEvaluator
{
   const PipelineConfig& mConfig;

public:

   explicit ConditionEvaluator(const PipelineConfig& config) : mConfig(config)
   {
   }

   // Throws ConfigurationError when more than one mode flag is set.
   JobMode selectMode(const EnvMap& env) const;

   // Value of the cross-target flag, empty unless mode is CrossTarget
   std::string targetPlatform(const EnvMap& env, JobMode mode) const;

   // Falls back to the Default sequence when the mode has none
   const StepSequence& selectSteps(const ModeSteps& table, JobMode mode) const;

   const std::string* flagForMode(JobMode mode) const;

   // A flag is set when present and non-empty
   static bool IsFlagSet(const EnvMap& env, const std::string& name);
};

}
