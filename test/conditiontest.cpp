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

#include <stdio.h>
#include <stdint.h>

#include "matrixRunner/conditionEvaluator.h"
#include "testHelpers.h"

using namespace MatrixRunner;

static void testModeSelection()
{
   PipelineConfig config;
   ConditionEvaluator eval(config);

   MATRIXRUNNER_CHECK(eval.selectMode(EnvMap()) == JobMode::Default);
   MATRIXRUNNER_CHECK(eval.selectMode({{"BUILD_FMT", "1"}}) == JobMode::FormatCheck);
   MATRIXRUNNER_CHECK(eval.selectMode({{"TARPAULIN", "1"}}) == JobMode::Coverage);
   MATRIXRUNNER_CHECK(eval.selectMode({{"BUILD_DOC", "1"}}) == JobMode::DocBuild);
   MATRIXRUNNER_CHECK(eval.selectMode({{"TARGET", "x86_64-unknown-freebsd"}}) == JobMode::CrossTarget);
   MATRIXRUNNER_CHECK(eval.selectMode({{"UNRELATED", "1"}}) == JobMode::Default);
}

static void testFlagPresence()
{
   MATRIXRUNNER_CHECK(ConditionEvaluator::IsFlagSet({{"BUILD_FMT", "1"}}, "BUILD_FMT"));
   MATRIXRUNNER_CHECK(ConditionEvaluator::IsFlagSet({{"BUILD_FMT", "0"}}, "BUILD_FMT"));
   MATRIXRUNNER_CHECK(!ConditionEvaluator::IsFlagSet({{"BUILD_FMT", ""}}, "BUILD_FMT"));
   MATRIXRUNNER_CHECK(!ConditionEvaluator::IsFlagSet(EnvMap(), "BUILD_FMT"));

   PipelineConfig config;
   ConditionEvaluator eval(config);
   MATRIXRUNNER_CHECK(eval.selectMode({{"BUILD_FMT", ""}, {"BUILD_DOC", "1"}}) == JobMode::DocBuild);
}

static void testConflicts()
{
   PipelineConfig config;
   ConditionEvaluator eval(config);

   MATRIXRUNNER_CHECK_THROWS(eval.selectMode({{"BUILD_FMT", "1"}, {"BUILD_DOC", "1"}}), ConfigurationError);
   MATRIXRUNNER_CHECK_THROWS(eval.selectMode({{"TARPAULIN", "1"}, {"TARGET", "arm"}}), ConfigurationError);
}

static void testCustomFlags()
{
   PipelineConfig config;
   config.mModeFlags[2].second = "DOCS";
   ConditionEvaluator eval(config);

   MATRIXRUNNER_CHECK(eval.selectMode({{"DOCS", "yes"}}) == JobMode::DocBuild);
   MATRIXRUNNER_CHECK(eval.selectMode({{"BUILD_DOC", "1"}}) == JobMode::Default);
   MATRIXRUNNER_CHECK(*eval.flagForMode(JobMode::DocBuild) == "DOCS");
   MATRIXRUNNER_CHECK(eval.flagForMode(JobMode::Default) == NULL);
}

static void testTargetPlatform()
{
   PipelineConfig config;
   ConditionEvaluator eval(config);
   EnvMap env = {{"TARGET", "x86_64-unknown-freebsd"}};

   MATRIXRUNNER_CHECK(eval.targetPlatform(env, JobMode::CrossTarget) == "x86_64-unknown-freebsd");
   MATRIXRUNNER_CHECK(eval.targetPlatform(env, JobMode::Default) == "");
}

static void testStepSelection()
{
   PipelineConfig config;
   ConditionEvaluator eval(config);

   ModeSteps table;
   table[JobMode::Default].push_back({"test", "cargo test"});
   table[JobMode::FormatCheck].push_back({"fmt", "cargo fmt -- --check"});

   MATRIXRUNNER_CHECK(eval.selectSteps(table, JobMode::FormatCheck)[0].mName == "fmt");
   MATRIXRUNNER_CHECK(eval.selectSteps(table, JobMode::Coverage)[0].mName == "test");
   MATRIXRUNNER_CHECK(eval.selectSteps(ModeSteps(), JobMode::Coverage).empty());

   // An explicitly empty sequence doesn't fall back
   table[JobMode::DocBuild] = StepSequence();
   MATRIXRUNNER_CHECK(eval.selectSteps(table, JobMode::DocBuild).empty());
}

static void testModeNames()
{
   for (int i=0; i<JobMode_COUNT; i++)
   {
      JobMode mode;
      MATRIXRUNNER_CHECK(JobModeFromString(JobModeToString((JobMode)i), mode));
      MATRIXRUNNER_CHECK(mode == (JobMode)i);
   }

   JobMode mode;
   MATRIXRUNNER_CHECK(!JobModeFromString("docs", mode));
   MATRIXRUNNER_CHECK(std::string(JobModeToString(JobMode::CrossTarget)) == "cross-target");
}

int main(int argc, char** argv)
{
   RUN_TEST(testModeSelection);
   RUN_TEST(testFlagPresence);
   RUN_TEST(testConflicts);
   RUN_TEST(testCustomFlags);
   RUN_TEST(testTargetPlatform);
   RUN_TEST(testStepSelection);
   RUN_TEST(testModeNames);
   return FinishTests("conditiontest");
}
