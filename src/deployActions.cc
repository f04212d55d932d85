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

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include "matrixRunner/deployActions.h"

using namespace google::protobuf::util;

namespace MatrixRunner
{

void DeployAction::RegisterDefaultActions()
{
   registerAction("command", createAction<CommandDeployAction>);
   registerAction("webhook", createAction<WebhookDeployAction>);
}

EnvMap CommandDeployAction::BuildDeployEnv(const DeployContext& ctx)
{
   EnvMap env = ctx.mFlags;
   env["CI"] = "true";
   env["DEPLOY_PIPELINE"] = ctx.mPipeline;
   env["DEPLOY_BRANCH"] = ctx.mBranch;
   env["DEPLOY_TAG"] = ctx.mTag;
   env["DEPLOY_TOKEN"] = ctx.mToken;
   env["DEPLOY_ARTIFACT_DIR"] = ctx.mArtifactDir;
   env["DEPLOY_TRIGGER_JOB"] = ctx.mTriggerJob;
   return env;
}

void CommandDeployAction::deploy(const DeployConfig& config, const DeployContext& ctx)
{
   if (ctx.mRunner == NULL)
   {
      throw DeployError("No step runner for deploy commands");
   }

   if (config.mCommands.empty())
   {
      throw DeployError("deploy provider 'command' has no commands");
   }

   StepContext stepCtx;
   stepCtx.mWorkingDirectory = ctx.mWorkspace;
   stepCtx.mEnv = BuildDeployEnv(ctx);
   stepCtx.mCancelFlag = ctx.mCancelFlag;

   for (const Step& step : config.mCommands)
   {
      printf("DEPLOY: %s\n", step.mName.c_str());

      StepResult result = ctx.mRunner->runStep(step, stepCtx);
      if (result.mResult != matrixrunner::v1::RESULT_SUCCESS)
      {
         throw DeployError("deploy command '" + step.mName + "' failed: " +
                           (result.mMessage.empty() ? "exit code " + std::to_string(result.mExitCode) : result.mMessage));
      }
   }
}

matrixrunner::v1::DeployRequest WebhookDeployAction::BuildRequest(const DeployContext& ctx)
{
   matrixrunner::v1::DeployRequest request;
   request.set_pipeline(ctx.mPipeline);
   request.set_branch(ctx.mBranch);
   request.set_tag(ctx.mTag);
   request.set_trigger_job(ctx.mTriggerJob);
   request.set_artifact_dir(ctx.mArtifactDir);
   for (const auto& itr : ctx.mFlags)
   {
      (*request.mutable_flags())[itr.first] = itr.second;
   }
   return request;
}

bool WebhookDeployAction::BuildRequestJson(const DeployContext& ctx, std::string& outJson)
{
   matrixrunner::v1::DeployRequest request = BuildRequest(ctx);
   JsonPrintOptions options;
   options.preserve_proto_field_names = true;
   outJson.clear();
   return MessageToJsonString(request, &outJson, options).ok();
}

void WebhookDeployAction::deploy(const DeployConfig& config, const DeployContext& ctx)
{
   std::string jsonRequest;
   if (!BuildRequestJson(ctx, jsonRequest))
   {
      throw DeployError("Couldn't encode deploy request");
   }

   printf("DEPLOY: POST %s\n", config.mUrl.c_str());

   CURL* curl = curl_easy_init();
   if (curl == NULL)
   {
      throw DeployError("Couldn't initialize curl");
   }

   std::string responseData;

   curl_easy_setopt(curl, CURLOPT_URL, config.mUrl.c_str());
   curl_easy_setopt(curl, CURLOPT_POST, 1L);
   curl_easy_setopt(curl, CURLOPT_POSTFIELDS, jsonRequest.c_str());
   curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)jsonRequest.size());

   struct curl_slist *headers = NULL;
   headers = curl_slist_append(headers, "Content-Type: application/json");
   headers = curl_slist_append(headers, "Accept: application/json");

   std::string auth;
   if (!ctx.mToken.empty())
   {
      auth = "Authorization: token " + ctx.mToken;
      headers = curl_slist_append(headers, auth.c_str());
   }

   curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

   auto writeCallback = +[](void *contents, size_t size, size_t nmemb, std::string *userp) -> size_t {
      size_t total_size = size * nmemb;
      userp->append((char*)contents, total_size);
      return total_size;
   };

   curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
   curl_easy_setopt(curl, CURLOPT_WRITEDATA, &responseData);

   CURLcode res = curl_easy_perform(curl);
   long httpCode = 0;
   if (res == CURLE_OK)
   {
      curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &httpCode);
   }

   curl_slist_free_all(headers);
   curl_easy_cleanup(curl);

   if (res != CURLE_OK)
   {
      throw DeployError(std::string("CURL error: ") + curl_easy_strerror(res));
   }

   if (httpCode < 200 || httpCode >= 300)
   {
      throw DeployError("Webhook returned HTTP " + std::to_string(httpCode) + ": " + responseData);
   }

   matrixrunner::v1::DeployResponse response;
   JsonParseOptions parseOptions;
   parseOptions.ignore_unknown_fields = true;
   if (!responseData.empty() && JsonStringToMessage(responseData, &response, parseOptions).ok())
   {
      printf("DEPLOY: webhook responded %s %s\n", response.status().c_str(), response.message().c_str());
   }
   else
   {
      printf("DEPLOY: webhook responded HTTP %ld\n", httpCode);
   }
}

}
