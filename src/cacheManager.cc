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

#include <filesystem>
#include <stdio.h>

#include "matrixRunner/cacheManager.h"

#ifdef _WIN32
    #include <windows.h>
    #define GET_PID() GetCurrentProcessId()
#else
    #include <unistd.h>
    #define GET_PID() getpid()
#endif

namespace fs = std::filesystem;

namespace MatrixRunner
{

static const fs::copy_options sCopyOptions = fs::copy_options::recursive |
                                             fs::copy_options::overwrite_existing |
                                             fs::copy_options::copy_symlinks;

static bool CopyTree(const fs::path& src, const fs::path& dest, std::string& outError)
{
   std::error_code ec;

   fs::file_status status = fs::symlink_status(src, ec);
   if (ec || !fs::exists(status))
   {
      return true;
   }

   if (dest.has_parent_path())
   {
      fs::create_directories(dest.parent_path(), ec);
      if (ec)
      {
         outError = "Couldn't create " + dest.parent_path().string() + ": " + ec.message();
         return false;
      }
   }

   fs::copy(src, dest, sCopyOptions, ec);
   if (ec)
   {
      outError = "Couldn't copy " + src.string() + " to " + dest.string() + ": " + ec.message();
      return false;
   }
   return true;
}

CacheManager::CacheManager(const CacheConfig& config, const std::string& cacheRoot) :
mConfig(config),
mCacheRoot(cacheRoot),
mCleanupCount(0)
{
}

bool CacheManager::RebasePath(const std::string& path, std::string& outRelative)
{
   fs::path p = fs::path(path).lexically_normal();
   if (p.is_absolute())
   {
      p = p.relative_path();
   }

   if (p.empty() || p == ".")
   {
      return false;
   }

   for (const fs::path& part : p)
   {
      if (part == "..")
      {
         return false;
      }
   }

   outRelative = p.string();
   while (!outRelative.empty() && outRelative.back() == '/')
   {
      outRelative.pop_back();
   }
   return !outRelative.empty();
}

bool CacheManager::isLeased(const std::string& key)
{
   std::lock_guard<std::mutex> lock(mMutex);
   return mLeased.count(key) != 0;
}

CacheHandle CacheManager::acquire(const JobSpec& job, const std::string& workspace)
{
   CacheHandle handle;
   handle.mKey = job.mCacheKey;
   handle.mWorkspace = workspace;
   handle.mStorePath = (fs::path(mCacheRoot) / job.mCacheKey).string();

   {
      std::lock_guard<std::mutex> lock(mMutex);
      if (mLeased.count(handle.mKey) != 0)
      {
         handle.mWarnings.push_back("CacheError: key '" + handle.mKey + "' is already leased, cache disabled for this job");
         printf("CACHE: refused lease on %s\n", handle.mKey.c_str());
         return handle;
      }
      mLeased.insert(handle.mKey);
   }

   handle.mValid = true;

   for (const std::string& dir : mConfig.mDirectories)
   {
      std::string rel;
      if (!RebasePath(dir, rel))
      {
         handle.mWarnings.push_back("CacheError: ignoring cache directory '" + dir + "' outside the workspace");
         continue;
      }
      handle.mDirectories.push_back(rel);

      fs::path src = fs::path(handle.mStorePath) / rel;
      std::error_code ec;
      if (!fs::exists(src, ec))
      {
         continue;
      }

      std::string error;
      if (CopyTree(src, fs::path(workspace) / rel, error))
      {
         handle.mRestored = true;
      }
      else
      {
         handle.mWarnings.push_back("CacheError: restore failed: " + error);
      }
   }

   printf("CACHE: acquired %s (%s)\n", handle.mKey.c_str(), handle.mRestored ? "restored" : "empty");
   return handle;
}

void CacheManager::prune(CacheHandle& handle)
{
   for (const std::string& path : mConfig.mBeforeCache)
   {
      std::string rel;
      if (!RebasePath(path, rel))
      {
         handle.mWarnings.push_back("CacheError: ignoring before_cache path '" + path + "' outside the workspace");
         continue;
      }

      std::error_code ec;
      fs::remove_all(fs::path(handle.mWorkspace) / rel, ec);
      if (ec)
      {
         handle.mWarnings.push_back("CacheError: couldn't prune " + rel + ": " + ec.message());
      }
   }

   mCleanupCount++;
}

void CacheManager::persist(CacheHandle& handle)
{
   if (handle.mDirectories.empty())
   {
      return;
   }

   fs::path store(handle.mStorePath);
   fs::path staging = fs::path(mCacheRoot) / (".staging-" + handle.mKey + "-" + std::to_string(GET_PID()));
   fs::path old = fs::path(mCacheRoot) / (".old-" + handle.mKey + "-" + std::to_string(GET_PID()));
   std::error_code ec;

   fs::remove_all(staging, ec);
   fs::create_directories(staging, ec);
   if (ec)
   {
      handle.mWarnings.push_back("CacheError: couldn't create " + staging.string() + ": " + ec.message());
      return;
   }

   for (const std::string& rel : handle.mDirectories)
   {
      std::string error;
      if (!CopyTree(fs::path(handle.mWorkspace) / rel, staging / rel, error))
      {
         handle.mWarnings.push_back("CacheError: persist failed: " + error);
         fs::remove_all(staging, ec);
         return;
      }
   }

   // Swap the staged copy in
   fs::remove_all(old, ec);
   if (fs::exists(store, ec))
   {
      fs::rename(store, old, ec);
      if (ec)
      {
         handle.mWarnings.push_back("CacheError: couldn't replace " + store.string() + ": " + ec.message());
         fs::remove_all(staging, ec);
         return;
      }
   }

   fs::rename(staging, store, ec);
   if (ec)
   {
      handle.mWarnings.push_back("CacheError: couldn't store " + store.string() + ": " + ec.message());
      std::error_code restoreEc;
      fs::rename(old, store, restoreEc);
      fs::remove_all(staging, restoreEc);
      return;
   }

   fs::remove_all(old, ec);
}

void CacheManager::release(CacheHandle& handle, matrixrunner::v1::Result outcome)
{
   if (!handle.mValid || handle.mReleased)
   {
      return;
   }
   handle.mReleased = true;

   prune(handle);
   persist(handle);

   {
      std::lock_guard<std::mutex> lock(mMutex);
      mLeased.erase(handle.mKey);
   }

   printf("CACHE: released %s after %s job\n", handle.mKey.c_str(),
          outcome == matrixrunner::v1::RESULT_SUCCESS ? "successful" : "unsuccessful");
}

CacheLease::CacheLease(CacheManager& manager, const JobSpec& job, const std::string& workspace) :
mManager(manager),
mOutcome(matrixrunner::v1::RESULT_UNSPECIFIED)
{
   mHandle = mManager.acquire(job, workspace);
}

CacheLease::~CacheLease()
{
   release();
}

void CacheLease::release()
{
   mManager.release(mHandle, mOutcome);
}

}
