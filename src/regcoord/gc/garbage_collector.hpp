// Copyright 2025 Huawei Cloud Computing Technology Co., Ltd.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef INCLUDED_SRC_REGCOORD_GC_GARBAGE_COLLECTOR_HPP
#define INCLUDED_SRC_REGCOORD_GC_GARBAGE_COLLECTOR_HPP

#include <cstddef>
#include <cstdint>
#include <set>
#include <vector>

#include "gsl/gsl"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Outcome of a garbage collection run.
struct GcReport {
    bool dry_run{};
    std::size_t repositories{};  ///< Tag indices scanned.
    std::size_t marked{};        ///< Stored blobs reachable from a root.
    std::size_t removed{};       ///< Blobs deleted, or to delete on dry runs.
    std::uintmax_t bytes_freed{};
    std::size_t failed{};        ///< Unreachable blobs that could not be deleted.
    std::size_t temporaries{};   ///< Stale temporary files removed.
    std::vector<Digest> unreachable;
};

/// \brief Mark and sweep collection of blobs no tag or linked manifest
/// reaches, performed under the store-wide lease.
class GarbageCollector final {
  public:
    GarbageCollector(gsl::not_null<BlobStore*> const& store,
                     gsl::not_null<LockManager*> const& locks) noexcept
        : store_{store}, locks_{locks} {}

    /// \brief Run a collection. Any failure to enumerate or read while
    /// marking aborts the run before anything is deleted.
    [[nodiscard]] auto Run(bool dry_run = false) noexcept
        -> expected<GcReport, Error>;

  private:
    gsl::not_null<BlobStore*> store_;
    gsl::not_null<LockManager*> locks_;
    Logger logger_{"GarbageCollector"};

    /// \brief Digests reachable from the tags and linked manifests of all
    /// repositories, following indices to their child manifests and image
    /// manifests to their config and layers.
    [[nodiscard]] auto Mark(LockToken const& lease, GcReport* report) const
        -> expected<std::set<Digest>, Error>;
};

#endif  // INCLUDED_SRC_REGCOORD_GC_GARBAGE_COLLECTOR_HPP
