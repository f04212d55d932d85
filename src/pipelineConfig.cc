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
#include <sstream>
#include <stdio.h>

#include <fkYAML/node.hpp>

#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

PipelineConfig::PipelineConfig() :
mName("pipeline"),
mTimeoutSeconds(0),
mMaxParallel(0)
{
   mModeFlags.push_back(std::make_pair(JobMode::FormatCheck, std::string("BUILD_FMT")));
   mModeFlags.push_back(std::make_pair(JobMode::Coverage, std::string("TARPAULIN")));
   mModeFlags.push_back(std::make_pair(JobMode::DocBuild, std::string("BUILD_DOC")));
   mModeFlags.push_back(std::make_pair(JobMode::CrossTarget, std::string("TARGET")));
}

bool PipelineConfig::isBranchEnabled(const std::string& branch) const
{
   if (std::find(mBranchesExcept.begin(), mBranchesExcept.end(), branch) != mBranchesExcept.end())
   {
      return false;
   }

   if (mBranchesOnly.empty())
   {
      return true;
   }

   return std::find(mBranchesOnly.begin(), mBranchesOnly.end(), branch) != mBranchesOnly.end();
}

const Axis* PipelineConfig::findAxis(const std::string& name) const
{
   for (const Axis& axis : mAxes)
   {
      if (axis.mName == name)
      {
         return &axis;
      }
   }
   return NULL;
}

// YAML helpers

static const fkyaml::node* FindKey(const fkyaml::node& node, const char* key)
{
   if (!node.is_mapping())
   {
      return NULL;
   }

   for (auto& itr : node.as_map())
   {
      if (itr.first.is_string() && itr.first.as_str() == key)
      {
         return &itr.second;
      }
   }
   return NULL;
}

static std::string ScalarToString(const fkyaml::node& node, const char* what)
{
   if (node.is_string())
   {
      return node.as_str();
   }
   else if (node.is_boolean())
   {
      return node.as_bool() ? "true" : "false";
   }
   else if (node.is_integer())
   {
      return std::to_string(node.as_int());
   }
   else if (node.is_float_number())
   {
      std::ostringstream ss;
      ss << node.as_float();
      return ss.str();
   }
   else if (node.is_null())
   {
      return "";
   }

   throw ConfigurationError(std::string(what) + " must be a scalar");
}

static std::vector<std::string> StringList(const fkyaml::node& node, const char* what)
{
   std::vector<std::string> list;
   if (node.is_sequence())
   {
      for (auto& itr : node.as_seq())
      {
         list.push_back(ScalarToString(itr, what));
      }
   }
   else if (!node.is_null())
   {
      list.push_back(ScalarToString(node, what));
   }
   return list;
}

static bool BoolValue(const fkyaml::node& node, const char* what)
{
   if (node.is_boolean())
   {
      return node.as_bool();
   }

   std::string value = ScalarToString(node, what);
   if (value == "true" || value == "1" || value == "yes")
      return true;
   if (value == "false" || value == "0" || value == "no" || value.empty())
      return false;

   throw ConfigurationError(std::string(what) + " must be a boolean");
}

static uint32_t UIntValue(const fkyaml::node& node, const char* what)
{
   if (node.is_integer())
   {
      if (node.as_int() < 0)
      {
         throw ConfigurationError(std::string(what) + " must not be negative");
      }
      if ((uint64_t)node.as_int() > UINT32_MAX)
      {
         throw ConfigurationError(std::string(what) + " must be below 2^32");
      }
      return (uint32_t)node.as_int();
   }

   uint32_t ret = 0;
   if (!ParseUInt32(ScalarToString(node, what), ret))
   {
      throw ConfigurationError(std::string(what) + " must be a whole number below 2^32");
   }
   return ret;
}

// env may be a map, a single "K=V" string, or a list of "K=V" strings
static void ParseEnv(const fkyaml::node& node, EnvMap& outEnv)
{
   if (node.is_mapping())
   {
      for (auto& itr : node.as_map())
      {
         std::string key = ScalarToString(itr.first, "env key");
         if (key.empty())
         {
            throw ConfigurationError("env key must not be empty");
         }
         outEnv[key] = ScalarToString(itr.second, "env value");
      }
      return;
   }

   for (const std::string& kv : StringList(node, "env"))
   {
      std::string key, value;
      if (!ParseKeyValue(Trim(kv), key, value))
      {
         throw ConfigurationError("Invalid env assignment '" + kv + "'");
      }
      outEnv[key] = value;
   }
}

static void ParseEntry(const fkyaml::node& node, const char* section, MatrixEntry& outEntry)
{
   if (!node.is_mapping())
   {
      throw ConfigurationError(std::string("matrix.") + section + " entries must be mappings");
   }

   for (auto& itr : node.as_map())
   {
      std::string key = ScalarToString(itr.first, "entry key");

      if (key == "env")
         ParseEnv(itr.second, outEntry.mEnv);
      else if (key == "privileged" || key == "sudo")
         outEntry.mPrivileged = BoolValue(itr.second, "privileged");
      else if (key == "services")
         outEntry.mServices = StringList(itr.second, "services");
      else if (key == "allow_failure")
         outEntry.mAllowFailure = BoolValue(itr.second, "allow_failure");
      else if (key == "timeout")
         outEntry.mTimeoutSeconds = UIntValue(itr.second, "timeout");
      else
         outEntry.mAxes.push_back(std::make_pair(key, ScalarToString(itr.second, "axis value")));
   }
}

static Step ParseStep(const fkyaml::node& node)
{
   Step step;
   if (node.is_mapping())
   {
      const fkyaml::node* run = FindKey(node, "run");
      const fkyaml::node* name = FindKey(node, "name");
      if (run == NULL)
      {
         throw ConfigurationError("Step mapping needs a 'run' key");
      }
      step.mRun = ScalarToString(*run, "run");
      step.mName = name ? ScalarToString(*name, "name") : step.mRun;
   }
   else
   {
      step.mRun = ScalarToString(node, "step");
      step.mName = step.mRun;
   }

   if (Trim(step.mRun).empty())
   {
      throw ConfigurationError("Empty step");
   }
   return step;
}

static StepSequence ParseStepList(const fkyaml::node& node)
{
   StepSequence steps;
   if (node.is_sequence())
   {
      for (auto& itr : node.as_seq())
      {
         steps.push_back(ParseStep(itr));
      }
   }
   else if (!node.is_null())
   {
      steps.push_back(ParseStep(node));
   }
   return steps;
}

// Either a list (default mode) or a mapping keyed by mode name
static ModeSteps ParseModeSteps(const fkyaml::node& node, const char* section)
{
   ModeSteps table;
   if (node.is_mapping())
   {
      for (auto& itr : node.as_map())
      {
         std::string modeName = ScalarToString(itr.first, section);
         JobMode mode;
         if (!JobModeFromString(modeName, mode))
         {
            throw ConfigurationError(std::string("Unknown mode '") + modeName + "' in " + section);
         }
         table[mode] = ParseStepList(itr.second);
      }
   }
   else
   {
      table[JobMode::Default] = ParseStepList(node);
   }
   return table;
}

static void ParseMatrix(const fkyaml::node& node, PipelineConfig& config)
{
   if (!node.is_mapping())
   {
      throw ConfigurationError("matrix must be a mapping");
   }

   if (const fkyaml::node* axes = FindKey(node, "axes"))
   {
      // A sequence keeps declaration order, which drives expansion order
      if (!axes->is_sequence())
      {
         throw ConfigurationError("matrix.axes must be a sequence");
      }

      for (auto& itr : axes->as_seq())
      {
         const fkyaml::node* name = FindKey(itr, "name");
         const fkyaml::node* values = FindKey(itr, "values");
         if (name == NULL || values == NULL)
         {
            throw ConfigurationError("matrix.axes entries need 'name' and 'values'");
         }

         Axis axis;
         axis.mName = ScalarToString(*name, "axis name");
         if (axis.mName.empty())
         {
            throw ConfigurationError("Axis name must not be empty");
         }
         if (!values->is_sequence() && !values->is_null())
         {
            throw ConfigurationError("Values of axis '" + axis.mName + "' must be a sequence");
         }
         axis.mValues = StringList(*values, "axis value");
         config.mAxes.push_back(axis);
      }
   }

   struct { const char* key; std::vector<MatrixEntry>* list; } sections[] = {
      {"include", &config.mIncludes},
      {"exclude", &config.mExcludes},
      {"allow_failures", &config.mAllowFailures}
   };

   for (auto& section : sections)
   {
      const fkyaml::node* list = FindKey(node, section.key);
      if (list == NULL || list->is_null())
      {
         continue;
      }
      if (!list->is_sequence())
      {
         throw ConfigurationError(std::string("matrix.") + section.key + " must be a sequence");
      }

      for (auto& itr : list->as_seq())
      {
         MatrixEntry entry;
         ParseEntry(itr, section.key, entry);
         section.list->push_back(entry);
      }
   }
}

static void ParseModes(const fkyaml::node& node, PipelineConfig& config)
{
   if (!node.is_mapping())
   {
      throw ConfigurationError("modes must be a mapping");
   }

   for (auto& itr : node.as_map())
   {
      std::string modeName = ScalarToString(itr.first, "mode");
      JobMode mode;
      if (!JobModeFromString(modeName, mode) || mode == JobMode::Default)
      {
         throw ConfigurationError("Unknown mode '" + modeName + "' in modes");
      }

      std::string flag = ScalarToString(itr.second, "mode flag");
      if (flag.empty())
      {
         throw ConfigurationError("Mode '" + modeName + "' needs a flag name");
      }

      for (auto& modeFlag : config.mModeFlags)
      {
         if (modeFlag.first == mode)
         {
            modeFlag.second = flag;
         }
      }
   }

   for (size_t i=0; i<config.mModeFlags.size(); i++)
   {
      for (size_t j=i+1; j<config.mModeFlags.size(); j++)
      {
         if (config.mModeFlags[i].second == config.mModeFlags[j].second)
         {
            throw ConfigurationError("Flag '" + config.mModeFlags[i].second + "' is bound to more than one mode");
         }
      }
   }
}

static void ParseCache(const fkyaml::node& node, PipelineConfig& config)
{
   if (!node.is_mapping())
   {
      throw ConfigurationError("cache must be a mapping");
   }

   if (const fkyaml::node* dirs = FindKey(node, "directories"))
      config.mCache.mDirectories = StringList(*dirs, "cache.directories");
   if (const fkyaml::node* prune = FindKey(node, "before_cache"))
      config.mCache.mBeforeCache = StringList(*prune, "cache.before_cache");
}

static void ParseDeploy(const fkyaml::node& node, PipelineConfig& config)
{
   DeployConfig& deploy = config.mDeploy;

   if (!node.is_mapping())
   {
      throw ConfigurationError("deploy must be a mapping");
   }

   deploy.mEnabled = true;
   deploy.mProvider = "command";

   for (auto& itr : node.as_map())
   {
      std::string key = ScalarToString(itr.first, "deploy key");

      if (key == "provider")
         deploy.mProvider = ScalarToString(itr.second, "deploy.provider");
      else if (key == "commands" || key == "script")
         deploy.mCommands = ParseStepList(itr.second);
      else if (key == "url")
         deploy.mUrl = ScalarToString(itr.second, "deploy.url");
      else if (key == "token_env")
         deploy.mTokenEnv = ScalarToString(itr.second, "deploy.token_env");
      else if (key == "local_dir")
         deploy.mLocalDir = ScalarToString(itr.second, "deploy.local_dir");
      else if (key == "enabled")
         deploy.mEnabled = BoolValue(itr.second, "deploy.enabled");
      else if (key == "on")
      {
         if (!itr.second.is_mapping())
         {
            throw ConfigurationError("deploy.on must be a mapping");
         }

         for (auto& cond : itr.second.as_map())
         {
            std::string condKey = ScalarToString(cond.first, "deploy.on key");

            if (condKey == "branch")
               deploy.mBranch = ScalarToString(cond.second, "deploy.on.branch");
            else if (condKey == "tags")
               deploy.mTagsOnly = BoolValue(cond.second, "deploy.on.tags");
            else if (condKey == "mode")
            {
               std::string modeName = ScalarToString(cond.second, "deploy.on.mode");
               if (!JobModeFromString(modeName, deploy.mTriggerMode))
               {
                  throw ConfigurationError("Unknown deploy trigger mode '" + modeName + "'");
               }
            }
            else if (condKey == "flag")
            {
               // Trigger given by flag name rather than mode
               std::string flag = ScalarToString(cond.second, "deploy.on.flag");
               bool found = false;
               for (auto& modeFlag : config.mModeFlags)
               {
                  if (modeFlag.second == flag)
                  {
                     deploy.mTriggerMode = modeFlag.first;
                     found = true;
                  }
               }
               if (!found)
               {
                  throw ConfigurationError("deploy.on.flag '" + flag + "' is not a mode flag");
               }
            }
            else
               deploy.mTriggerAxes.push_back(std::make_pair(condKey, ScalarToString(cond.second, "deploy.on axis")));
         }
      }
      else
      {
         throw ConfigurationError("Unknown deploy key '" + key + "'");
      }
   }

   if (deploy.mProvider != "command" && deploy.mProvider != "webhook")
   {
      throw ConfigurationError("Unknown deploy provider '" + deploy.mProvider + "'");
   }

   if (deploy.mProvider == "webhook" && deploy.mUrl.empty())
   {
      throw ConfigurationError("deploy provider 'webhook' needs a url");
   }

   if (deploy.mEnabled && deploy.mProvider == "command" && deploy.mCommands.empty())
   {
      throw ConfigurationError("deploy provider 'command' needs commands");
   }
}

PipelineConfig LoadPipelineConfig(const std::string& yamlText)
{
   fkyaml::node root;
   try
   {
      root = fkyaml::node::deserialize(yamlText);
   }
   catch (const fkyaml::exception& e)
   {
      throw ConfigurationError(std::string("Invalid YAML: ") + e.what());
   }

   if (!root.is_mapping())
   {
      throw ConfigurationError("Pipeline document must be a mapping");
   }

   PipelineConfig config;

   try
   {
      // modes first, deploy.on.flag refers to them
      if (const fkyaml::node* node = FindKey(root, "modes"))
         ParseModes(*node, config);

      for (auto& itr : root.as_map())
      {
         std::string key = ScalarToString(itr.first, "key");

         if (key == "name")
            config.mName = ScalarToString(itr.second, "name");
         else if (key == "env")
            ParseEnv(itr.second, config.mGlobalEnv);
         else if (key == "branches")
         {
            if (const fkyaml::node* only = FindKey(itr.second, "only"))
               config.mBranchesOnly = StringList(*only, "branches.only");
            if (const fkyaml::node* except = FindKey(itr.second, "except"))
               config.mBranchesExcept = StringList(*except, "branches.except");
         }
         else if (key == "max_parallel")
            config.mMaxParallel = UIntValue(itr.second, "max_parallel");
         else if (key == "timeout")
            config.mTimeoutSeconds = UIntValue(itr.second, "timeout");
         else if (key == "matrix")
            ParseMatrix(itr.second, config);
         else if (key == "modes")
            continue;
         else if (key == "setup")
            config.mSetup = ParseModeSteps(itr.second, "setup");
         else if (key == "script")
            config.mScript = ParseModeSteps(itr.second, "script");
         else if (key == "after_success")
            config.mAfterSuccess = ParseModeSteps(itr.second, "after_success");
         else if (key == "cache")
            ParseCache(itr.second, config);
         else if (key == "deploy")
            ParseDeploy(itr.second, config);
         else
            throw ConfigurationError("Unknown key '" + key + "'");
      }
   }
   catch (const fkyaml::exception& e)
   {
      throw ConfigurationError(std::string("Invalid pipeline document: ") + e.what());
   }

   return config;
}

PipelineConfig LoadPipelineConfigFile(const std::string& filename)
{
   std::ifstream file(filename, std::ios::binary);
   if (!file)
   {
      throw ConfigurationError("Could not open " + filename);
   }

   std::stringstream buffer;
   buffer << file.rdbuf();
   return LoadPipelineConfig(buffer.str());
}

}
