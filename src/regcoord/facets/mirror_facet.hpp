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

#ifndef INCLUDED_SRC_REGCOORD_FACETS_MIRROR_FACET_HPP
#define INCLUDED_SRC_REGCOORD_FACETS_MIRROR_FACET_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>

#include "gsl/gsl"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/facets/manifest_content.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/regcoord/upstream/retry_config.hpp"
#include "src/regcoord/upstream/upstream_registry.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Read-only pull-through front end of the store.
///
/// A blob missing from the store is fetched from the upstream registry,
/// verified against its digest, stored, and served. Concurrent misses on the
/// same digest coalesce: the first taker of the exclusive digest lock
/// fetches, all later ones find the blob stored when they get the lock.
class MirrorFacet final {
  public:
    MirrorFacet(gsl::not_null<BlobStore*> const& store,
                gsl::not_null<LockManager*> const& locks,
                gsl::not_null<AuditLog const*> const& audit,
                IUpstreamRegistry::Ptr upstream,
                RetryConfig retry,
                std::chrono::seconds tag_ttl) noexcept;

    [[nodiscard]] auto GetBlob(std::string const& repository,
                               Digest const& digest) noexcept
        -> expected<std::string, Error>;

    /// \brief Size of a blob, pulling it into the store if needed.
    [[nodiscard]] auto HeadBlob(std::string const& repository,
                                Digest const& digest) noexcept
        -> expected<std::uintmax_t, Error>;

    /// \brief Get a manifest by tag or digest. A cached tag younger than the
    /// tag TTL is served without asking the upstream; an older one is served
    /// only if the upstream can not be reached. Pulled manifests are stored
    /// and linked together with everything they reference.
    [[nodiscard]] auto GetManifest(std::string const& repository,
                                   std::string const& reference) noexcept
        -> expected<ManifestContent, Error>;

  private:
    using Fetch = std::function<expected<UpstreamContent, Error>()>;

    gsl::not_null<BlobStore*> store_;
    gsl::not_null<LockManager*> locks_;
    gsl::not_null<AuditLog const*> audit_;
    IUpstreamRegistry::Ptr upstream_;
    RetryConfig const retry_;
    std::chrono::seconds const tag_ttl_;
    Logger logger_{"MirrorFacet"};

    /// \brief Read a blob under a shared digest lock.
    /// \returns the content, or nullopt on a cache miss.
    [[nodiscard]] auto ReadCached(Digest const& digest) noexcept
        -> expected<std::optional<std::string>, Error>;

    /// \brief Fetch, verify and store a missing blob under an exclusive
    /// digest lock. Returns the stored content if another caller stored it
    /// first.
    [[nodiscard]] auto PullCoalesced(Digest const& digest,
                                     Fetch const& fetch) noexcept
        -> expected<std::string, Error>;

    [[nodiscard]] auto Pull(Digest const& digest, Fetch const& fetch) noexcept
        -> expected<std::string, Error>;

    /// \brief Make sure a referenced blob is cached, without reading it.
    [[nodiscard]] auto Prefetch(Digest const& digest, Fetch const& fetch) noexcept
        -> expected<std::monostate, Error>;

    [[nodiscard]] auto FetchWithRetry(Fetch const& fetch,
                                      std::string const& what) noexcept
        -> expected<UpstreamContent, Error>;

    /// \brief Cache everything a manifest references, then store and link
    /// the manifest itself.
    [[nodiscard]] auto Ingest(std::string const& repository,
                              std::optional<std::string> const& tag,
                              Digest const& digest,
                              UpstreamContent const& fetched) noexcept
        -> expected<ManifestContent, Error>;

    [[nodiscard]] auto GetManifestByTag(std::string const& repository,
                                        std::string const& tag) noexcept
        -> expected<ManifestContent, Error>;

    [[nodiscard]] auto GetManifestByDigest(std::string const& repository,
                                           Digest const& digest) noexcept
        -> expected<ManifestContent, Error>;

    /// \brief Read a cached manifest blob.
    [[nodiscard]] auto ReadManifest(Digest const& digest) noexcept
        -> expected<ManifestContent, Error>;

    /// \brief Move a blob found corrupted into quarantine.
    void QuarantineCorrupted(Digest const& digest) noexcept;
};

#endif  // INCLUDED_SRC_REGCOORD_FACETS_MIRROR_FACET_HPP
