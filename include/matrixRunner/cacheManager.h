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
#include <mutex>
#include <set>
#include <stdint.h>
#include <string>
#include <vector>

#include "matrixrunner/v1/report.pb.h"

#include "matrixRunner/jobSpec.h"
#include "matrixRunner/pipelineConfig.h"

namespace MatrixRunner
{

// Lease on <cache root>/<key>, exclusive to one job while it runs
struct CacheHandle
{
   std::string mKey;
   std::string mStorePath;
   std::string mWorkspace;
   std::vector<std::string> mDirectories; // relative to the workspace
   bool mValid;
   bool mRestored;
   bool mReleased;
   std::vector<std::string> mWarnings;

   CacheHandle() : mValid(false), mRestored(false), mReleased(false)
   {
   }
};

class CacheManager
{
   CacheConfig mConfig;
   std::string mCacheRoot;
   std::mutex mMutex;
   std::set<std::string> mLeased;
   std::atomic<uint32_t> mCleanupCount;

public:

   CacheManager(const CacheConfig& config, const std::string& cacheRoot);

   // Restores stored content into the workspace. Never throws; problems
   // are returned as warnings on the handle.
   CacheHandle acquire(const JobSpec& job, const std::string& workspace);

   // Prunes before_cache paths, then persists. Runs at most once per handle
   // whatever the job outcome was.
   void release(CacheHandle& handle, matrixrunner::v1::Result outcome);

   bool isLeased(const std::string& key);

   inline uint32_t getCleanupCount() const
   {
      return mCleanupCount.load();
   }

   inline const std::string& getCacheRoot() const
   {
      return mCacheRoot;
   }

   // Resolves a configured path inside the workspace. Absolute paths are
   // rebased, paths escaping the workspace are rejected.
   static bool RebasePath(const std::string& path, std::string& outRelative);

private:

   void prune(CacheHandle& handle);
   void persist(CacheHandle& handle);
};

// Releases its handle on destruction unless released explicitly first
class CacheLease
{
   CacheManager& mManager;
   CacheHandle mHandle;
   matrixrunner::v1::Result mOutcome;

public:

   CacheLease(CacheManager& manager, const JobSpec& job, const std::string& workspace);
   ~CacheLease();

   CacheLease(const CacheLease&) = delete;
   CacheLease& operator=(const CacheLease&) = delete;

   inline CacheHandle& getHandle()
   {
      return mHandle;
   }

   inline void setOutcome(matrixrunner::v1::Result outcome)
   {
      mOutcome = outcome;
   }

   void release();
};

}
