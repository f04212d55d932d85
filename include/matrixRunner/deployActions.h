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
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/pipelineConfig.h"
#include "matrixRunner/stepRunner.h"

namespace MatrixRunner
{

class DeployError : public std::runtime_error
{
public:
   explicit DeployError(const std::string& what) : std::runtime_error(what)
   {
   }
};

struct DeployContext
{
   std::string mPipeline;
   std::string mBranch;
   std::string mTag;
   std::string mToken;
   std::string mArtifactDir;
   std::string mWorkspace;   // trigger job workspace
   std::string mTriggerJob;
   EnvMap mFlags;            // mode flags set on the trigger job
   StepRunner* mRunner;
   const std::atomic<bool>* mCancelFlag;

   DeployContext() : mRunner(NULL), mCancelFlag(NULL)
   {
   }
};

// Provider invoked by the deploy gate. Failures are thrown as DeployError.
class DeployAction
{
public:
   typedef std::function<DeployAction*()> CreateFunc;

   virtual ~DeployAction()
   {
   }

   virtual void deploy(const DeployConfig& config, const DeployContext& ctx) = 0;

   template<class T> static T* createAction() { return new T(); }

   static void registerAction(const std::string& key, CreateFunc createFunc)
   {
      getRegistry()[key] = createFunc;
   }

   // Empty function if nothing is registered under key
   static CreateFunc getAction(const std::string& key)
   {
      auto& registry = getRegistry();
      auto itr = registry.find(key);
      return itr != registry.end() ? itr->second : CreateFunc();
   }

   // "command" and "webhook"
   static void RegisterDefaultActions();

private:

   static std::unordered_map<std::string, CreateFunc>& getRegistry()
   {
      static std::unordered_map<std::string, CreateFunc> registry;
      return registry;
   }
};

// Runs deploy.commands through the step runner inside the trigger job's workspace
class CommandDeployAction : public DeployAction
{
public:
   void deploy(const DeployConfig& config, const DeployContext& ctx) override;

   static EnvMap BuildDeployEnv(const DeployContext& ctx);
};

// POSTs a DeployRequest as JSON to deploy.url
class WebhookDeployAction : public DeployAction
{
public:
   void deploy(const DeployConfig& config, const DeployContext& ctx) override;

   static matrixrunner::v1::DeployRequest BuildRequest(const DeployContext& ctx);
   static bool BuildRequestJson(const DeployContext& ctx, std::string& outJson);
};

}
