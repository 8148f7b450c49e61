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

#ifndef INCLUDED_SRC_REGCOORD_COORDINATOR_COORDINATOR_HPP
#define INCLUDED_SRC_REGCOORD_COORDINATOR_COORDINATOR_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/coordinator/registry_response.hpp"
#include "src/regcoord/coordinator/request.hpp"
#include "src/regcoord/facets/local_facet.hpp"
#include "src/regcoord/facets/mirror_facet.hpp"
#include "src/regcoord/gc/garbage_collector.hpp"
#include "src/regcoord/gc/gc_scheduler.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/regcoord/storage/config.hpp"
#include "src/regcoord/upstream/retry_config.hpp"
#include "src/regcoord/upstream/upstream_registry.hpp"
#include "src/utils/cpp/expected.hpp"

inline constexpr auto kDefaultTagTtl = std::chrono::seconds{300};

struct CoordinatorOptions {
    StoreConfig store;
    LockManager::Options locking{};

    // Upstream of the mirror facet; without one, the mirror facet is off.
    IUpstreamRegistry::Ptr upstream{};
    RetryConfig retry{};
    std::chrono::seconds tag_ttl{kDefaultTagTtl};

    // Listen addresses ("host:port") requests are routed by.
    std::optional<std::string> mirror_endpoint{};
    std::optional<std::string> local_endpoint{};

    // Zero disables periodic collection.
    std::chrono::seconds gc_interval{0};

    std::optional<std::filesystem::path> audit_file{};
};

/// \brief Outcome of a full store verification.
struct VerifyReport {
    std::size_t checked{};
    std::vector<Digest> corrupted;
    std::size_t failed{};
};

/// \brief Single owner of a shared blob store. Routes registry requests to
/// the mirror or local facet and runs garbage collection.
///
/// Requests with an explicit facet go to that facet; otherwise the endpoint
/// they arrived on decides. Requests with neither are served by the local
/// facet, and reads it can not serve fall back to the mirror facet.
class Coordinator final {
  public:
    [[nodiscard]] static auto Create(CoordinatorOptions options) noexcept
        -> expected<std::unique_ptr<Coordinator>, Error>;

    Coordinator(Coordinator const&) = delete;
    Coordinator(Coordinator&&) = delete;
    auto operator=(Coordinator const&) -> Coordinator& = delete;
    auto operator=(Coordinator&&) -> Coordinator& = delete;
    ~Coordinator() noexcept;

    /// \brief Serve a request; never throws, failures become error
    /// responses.
    [[nodiscard]] auto Handle(RegistryRequest const& request) noexcept
        -> RegistryResponse;

    /// \brief Run garbage collection now, on the calling thread.
    [[nodiscard]] auto CollectGarbage(bool dry_run = false) noexcept
        -> expected<GcReport, Error>;

    /// \brief Ask the background scheduler for a collection.
    void TriggerGc() noexcept;

    /// \brief Re-hash every stored blob under the lease and quarantine the
    /// corrupted ones.
    [[nodiscard]] auto Verify() noexcept -> expected<VerifyReport, Error>;

    /// \brief Stop background work. Requests may still be served.
    void Shutdown() noexcept;

    [[nodiscard]] auto Store() const noexcept -> BlobStore& { return *store_; }

    [[nodiscard]] auto Locks() noexcept -> LockManager& { return locks_; }

    [[nodiscard]] auto Local() noexcept -> LocalFacet& { return local_; }

    [[nodiscard]] auto Scheduler() noexcept -> GcScheduler& {
        return *scheduler_;
    }

    [[nodiscard]] auto HasMirror() const noexcept -> bool {
        return mirror_ != nullptr;
    }

  private:
    CoordinatorOptions const options_;
    std::unique_ptr<AuditLog> audit_;
    std::unique_ptr<BlobStore> store_;
    LockManager locks_;
    LocalFacet local_;
    std::unique_ptr<MirrorFacet> mirror_;
    GarbageCollector collector_;
    std::unique_ptr<GcScheduler> scheduler_;
    Logger logger_{"Coordinator"};

    Coordinator(CoordinatorOptions options,
                std::unique_ptr<AuditLog> audit,
                std::unique_ptr<BlobStore> store);

    /// \brief Facet a request is explicitly routed to, if any.
    [[nodiscard]] auto Route(RegistryRequest const& request) const
        -> expected<std::optional<Facet>, Error>;

    [[nodiscard]] auto Serve(Facet facet, RegistryRequest const& request)
        -> RegistryResponse;

    [[nodiscard]] auto ServeMirror(RegistryRequest const& request)
        -> RegistryResponse;

    [[nodiscard]] auto ServeLocal(RegistryRequest const& request)
        -> RegistryResponse;

    [[nodiscard]] static auto ErrorResponse(Error error,
                                            RegistryRequest const& request)
        -> RegistryResponse;
};

#endif  // INCLUDED_SRC_REGCOORD_COORDINATOR_COORDINATOR_HPP
