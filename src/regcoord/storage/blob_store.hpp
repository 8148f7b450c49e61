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

#ifndef INCLUDED_SRC_REGCOORD_STORAGE_BLOB_STORE_HPP
#define INCLUDED_SRC_REGCOORD_STORAGE_BLOB_STORE_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/storage/config.hpp"
#include "src/regcoord/storage/tag_index.hpp"
#include "src/utils/cpp/expected.hpp"
#include "src/utils/cpp/file_locking.hpp"

/// \brief Content-addressed blob store with per-repository tag indices on a
/// shared directory tree.
///
/// Every operation requires a LockToken covering the keys it touches; the
/// store does not lock by itself. Blobs become visible only complete and
/// verified (write to a temporary file, sync, no-clobber rename) and are
/// never overwritten. The process that opened a store holds an exclusive
/// file lock on it until the store is destroyed.
class BlobStore final {
  public:
    /// \brief Called with a fully written temporary file right before it is
    /// renamed into place. Returning false aborts the write.
    using PreCommitHook =
        std::function<bool(Digest const&, std::filesystem::path const&)>;

    /// \brief Open a store, creating its layout if needed. Stale temporary
    /// files and abandoned upload staging files are removed, and the usage
    /// counters are recomputed from the blobs found.
    [[nodiscard]] static auto Open(
        StoreConfig config,
        gsl::not_null<AuditLog const*> const& audit) noexcept
        -> expected<std::unique_ptr<BlobStore>, Error>;

    BlobStore(BlobStore const&) = delete;
    BlobStore(BlobStore&&) = delete;
    auto operator=(BlobStore const&) -> BlobStore& = delete;
    auto operator=(BlobStore&&) -> BlobStore& = delete;
    ~BlobStore() noexcept = default;

    [[nodiscard]] auto Config() const& noexcept -> StoreConfig const& {
        return config_;
    }

    [[nodiscard]] auto UsedBytes() const noexcept -> std::uintmax_t {
        return used_bytes_.load();
    }

    [[nodiscard]] auto BlobCount() const noexcept -> std::size_t {
        return blob_count_.load();
    }

    void SetPreCommitHook(PreCommitHook hook) noexcept;

    /// \brief Store data under digest. Requires an exclusive lock on the
    /// digest. Storing identical data again succeeds without effect; other
    /// data under an existing digest is a CorruptionDetected error and the
    /// stored blob is kept. Data not hashing to digest is an InvalidDigest
    /// error.
    [[nodiscard]] auto Put(Digest const& digest,
                           std::string const& data,
                           LockToken const& token) noexcept
        -> expected<Ack, Error>;

    /// \brief Store the content of a file under digest, with the semantics of
    /// Put. The source file must be on the same file system as the store and
    /// is consumed.
    [[nodiscard]] auto PutFile(Digest const& digest,
                               std::filesystem::path const& source,
                               LockToken const& token) noexcept
        -> expected<Ack, Error>;

    /// \brief Read a blob, verified against its digest. Requires at least a
    /// shared lock on the digest.
    [[nodiscard]] auto Get(Digest const& digest,
                           LockToken const& token) const noexcept
        -> expected<std::string, Error>;

    [[nodiscard]] auto Has(Digest const& digest,
                           LockToken const& token) const noexcept
        -> expected<bool, Error>;

    [[nodiscard]] auto Size(Digest const& digest,
                            LockToken const& token) const noexcept
        -> expected<std::uintmax_t, Error>;

    /// \brief Lock requests needed by PutManifest: exclusive on the manifest
    /// digest and on the repository, shared on every required digest.
    [[nodiscard]] static auto ManifestLocks(
        std::string const& repository,
        Digest const& digest,
        std::vector<Digest> const& required) -> std::vector<LockRequest>;

    /// \brief Store a manifest and link it into a repository, under a tag or,
    /// without tag, as linked manifest. Requires exclusive locks on the
    /// manifest digest and on the repository, and at least shared locks on
    /// every blob the manifest requires. Those blobs must already be stored,
    /// otherwise nothing is written and a DanglingReference error is
    /// returned.
    [[nodiscard]] auto PutManifest(
        std::string const& repository,
        std::optional<std::string> const& tag,
        Digest const& digest,
        std::string const& content,
        std::optional<std::string> const& content_type,
        LockToken const& token) noexcept -> expected<Ack, Error>;

    /// \brief Look up a tag. Requires at least a shared lock on the
    /// repository.
    [[nodiscard]] auto ResolveTag(std::string const& repository,
                                  std::string const& tag,
                                  LockToken const& token) const noexcept
        -> expected<TagEntry, Error>;

    [[nodiscard]] auto ListTags(std::string const& repository,
                                LockToken const& token) const noexcept
        -> expected<std::vector<std::string>, Error>;

    /// \brief Remove a tag; the manifest stays until garbage collected.
    /// Requires an exclusive lock on the repository.
    /// \returns the removed entry.
    [[nodiscard]] auto DeleteTag(std::string const& repository,
                                 std::string const& tag,
                                 LockToken const& token) noexcept
        -> expected<TagEntry, Error>;

    [[nodiscard]] auto ReadTagIndex(std::string const& repository,
                                    LockToken const& token) const noexcept
        -> expected<TagIndex, Error>;

    /// \brief All repositories with a tag index. Requires the lease.
    [[nodiscard]] auto ListRepositories(LockToken const& lease) const noexcept
        -> expected<std::vector<std::string>, Error>;

    /// \brief All stored digests. Requires the lease.
    [[nodiscard]] auto ListBlobs(LockToken const& lease) const noexcept
        -> expected<std::vector<Digest>, Error>;

    /// \brief Delete a blob. Requires the lease.
    /// \returns the number of bytes freed.
    [[nodiscard]] auto Delete(Digest const& digest,
                              LockToken const& lease) noexcept
        -> expected<std::uintmax_t, Error>;

    /// \brief Move a blob aside into the quarantine directory. Requires an
    /// exclusive lock on the digest.
    /// \returns the path the blob was moved to.
    [[nodiscard]] auto Quarantine(Digest const& digest,
                                  LockToken const& token) noexcept
        -> expected<std::filesystem::path, Error>;

    /// \brief Remove leftover temporary files. Requires the lease.
    /// \returns the number of files removed.
    [[nodiscard]] auto RemoveTemporaries(LockToken const& lease) noexcept
        -> expected<std::size_t, Error>;

  private:
    StoreConfig const config_;
    gsl::not_null<AuditLog const*> audit_;
    LockFile owner_lock_;
    std::atomic<std::uintmax_t> used_bytes_{};
    std::atomic<std::size_t> blob_count_{};
    mutable std::mutex hook_mutex_;
    PreCommitHook hook_;
    Logger logger_{"BlobStore"};

    BlobStore(StoreConfig config,
              gsl::not_null<AuditLog const*> const& audit,
              LockFile owner_lock) noexcept;

    [[nodiscard]] auto Scan() noexcept -> expected<std::monostate, Error>;

    [[nodiscard]] static auto CheckToken(LockToken const& token,
                                         LockKey const& key,
                                         LockMode mode,
                                         std::string const& operation)
        -> expected<std::monostate, Error>;

    [[nodiscard]] static auto CheckLease(LockToken const& token,
                                         std::string const& operation)
        -> expected<std::monostate, Error>;

    [[nodiscard]] auto PutUnchecked(Digest const& digest,
                                    std::string const& data) noexcept
        -> expected<Ack, Error>;

    [[nodiscard]] auto CompareExisting(Digest const& digest,
                                       std::string const& data) const
        -> expected<Ack, Error>;

    /// \brief Run the hook and rename a staged file into place.
    [[nodiscard]] auto Commit(Digest const& digest,
                              std::filesystem::path const& staged,
                              std::uintmax_t size) -> expected<Ack, Error>;

    [[nodiscard]] auto Reserve(std::uintmax_t size) noexcept -> bool;
    void Unreserve(std::uintmax_t size) noexcept;

    [[nodiscard]] auto ReadIndex(std::string const& repository) const
        -> expected<TagIndex, Error>;

    [[nodiscard]] auto WriteIndex(std::string const& repository,
                                  TagIndex const& index) const
        -> expected<std::monostate, Error>;

    [[nodiscard]] static auto ErrnoToError(int err, std::string const& what)
        -> Error;
};

#endif  // INCLUDED_SRC_REGCOORD_STORAGE_BLOB_STORE_HPP
