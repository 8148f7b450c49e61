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

#include "src/regcoord/storage/blob_store.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <exception>
#include <tuple>
#include <utility>

#include "fmt/core.h"
#include "fmt/format.h"
#include "src/regcoord/common/reference.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/storage/manifest.hpp"

namespace {

[[nodiscard]] auto UnixNow() noexcept -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/// \brief Digest of a blob path relative to the blobs root, i.e.,
/// <algorithm>/<xx>/<hex>.
[[nodiscard]] auto DigestFromRelativePath(std::filesystem::path const& rel)
    -> std::optional<Digest> {
    std::vector<std::string> parts{};
    for (auto const& part : rel) {
        parts.push_back(part.string());
    }
    if (parts.size() != 3 or parts[2].substr(0, 2) != parts[1]) {
        return std::nullopt;
    }
    auto digest = Digest::Parse(fmt::format("{}:{}", parts[0], parts[2]));
    if (not digest) {
        return std::nullopt;
    }
    return *digest;
}

}  // namespace

BlobStore::BlobStore(StoreConfig config,
                     gsl::not_null<AuditLog const*> const& audit,
                     LockFile owner_lock) noexcept
    : config_{std::move(config)},
      audit_{audit},
      owner_lock_{std::move(owner_lock)} {}

auto BlobStore::Open(StoreConfig config,
                     gsl::not_null<AuditLog const*> const& audit) noexcept
    -> expected<std::unique_ptr<BlobStore>, Error> {
    for (auto const& dir : {config.root,
                            config.BlobsRoot(),
                            config.RepositoriesRoot(),
                            config.QuarantineRoot(),
                            config.UploadsRoot()}) {
        if (not FileSystemManager::CreateDirectory(dir)) {
            return MakeError(
                ErrorCode::IoFailure,
                fmt::format("could not create store directory {}",
                            dir.string()));
        }
    }
    auto owner_lock = LockFile::TryAcquire(config.OwnerLockPath(),
                                           LockFile::Mode::Exclusive);
    if (not owner_lock) {
        return MakeError(
            ErrorCode::Busy,
            fmt::format("store {} is owned by another coordinator",
                        config.root.string()));
    }
    try {
        auto store = std::unique_ptr<BlobStore>(
            new BlobStore(std::move(config), audit, *std::move(owner_lock)));
        auto scanned = store->Scan();
        if (not scanned) {
            return unexpected{scanned.error()};
        }
        return store;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("opening store failed: {}", e.what()));
    }
}

void BlobStore::SetPreCommitHook(PreCommitHook hook) noexcept {
    std::lock_guard lock{hook_mutex_};
    hook_ = std::move(hook);
}

auto BlobStore::Put(Digest const& digest,
                    std::string const& data,
                    LockToken const& token) noexcept -> expected<Ack, Error> {
    try {
        auto allowed = CheckToken(
            token, LockKey::ForDigest(digest), LockMode::Exclusive, "put");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        return PutUnchecked(digest, data);
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("put of {} failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto BlobStore::PutFile(Digest const& digest,
                        std::filesystem::path const& source,
                        LockToken const& token) noexcept
    -> expected<Ack, Error> {
    try {
        auto allowed = CheckToken(
            token, LockKey::ForDigest(digest), LockMode::Exclusive, "put");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto actual = Digest::ComputeFile(source, digest.Algorithm());
        if (not actual) {
            return MakeError(ErrorCode::IoFailure,
                             fmt::format("could not hash staged file {}",
                                         source.string()));
        }
        auto const path = config_.BlobPath(digest);
        if (FileSystemManager::IsFile(path)) {
            auto stored = Digest::ComputeFile(path, digest.Algorithm());
            std::ignore = FileSystemManager::RemoveFile(source);
            if (stored and *stored == digest and *actual == digest) {
                return Ack{.created = false};
            }
            audit_->Record("digest-collision",
                           digest.ToString(),
                           {{"path", path.string()}});
            return MakeError(
                ErrorCode::CorruptionDetected,
                fmt::format("different content already stored under {}",
                            digest.ToString()));
        }
        if (*actual != digest) {
            return MakeError(ErrorCode::InvalidDigest,
                             fmt::format("content hashes to {}, not {}",
                                         actual->ToString(),
                                         digest.ToString()));
        }
        auto size = FileSystemManager::FileSize(source);
        if (not size) {
            return MakeError(ErrorCode::IoFailure,
                             fmt::format("could not stat staged file {}",
                                         source.string()));
        }
        if (not Reserve(*size)) {
            return MakeError(
                ErrorCode::CapacityExceeded,
                fmt::format("storing {} bytes would exceed the store quota",
                            *size));
        }
        if (not FileSystemManager::CreateDirectory(path.parent_path())) {
            Unreserve(*size);
            return MakeError(ErrorCode::IoFailure,
                             fmt::format("could not create directory for {}",
                                         digest.ToString()));
        }
        return Commit(digest, source, *size);
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("put of {} from file failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto BlobStore::Get(Digest const& digest, LockToken const& token) const noexcept
    -> expected<std::string, Error> {
    try {
        auto allowed = CheckToken(
            token, LockKey::ForDigest(digest), LockMode::Shared, "get");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto const path = config_.BlobPath(digest);
        if (not FileSystemManager::IsFile(path)) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("blob {} not found", digest.ToString()));
        }
        auto content = FileSystemManager::ReadFile(path);
        if (not content) {
            return MakeError(
                ErrorCode::IoFailure,
                fmt::format("could not read blob {}", digest.ToString()));
        }
        if (not digest.Matches(*content)) {
            audit_->Record("corruption-detected",
                           digest.ToString(),
                           {{"path", path.string()},
                            {"size", content->size()}});
            return MakeError(ErrorCode::CorruptionDetected,
                             fmt::format("stored content of {} does not match "
                                         "its digest",
                                         digest.ToString()));
        }
        return *std::move(content);
    } catch (std::exception const& e) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("get of {} failed: {}", digest.ToString(), e.what()));
    }
}

auto BlobStore::Has(Digest const& digest, LockToken const& token) const noexcept
    -> expected<bool, Error> {
    try {
        auto allowed = CheckToken(
            token, LockKey::ForDigest(digest), LockMode::Shared, "has");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        return FileSystemManager::IsFile(config_.BlobPath(digest));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::Size(Digest const& digest, LockToken const& token) const noexcept
    -> expected<std::uintmax_t, Error> {
    try {
        auto allowed = CheckToken(
            token, LockKey::ForDigest(digest), LockMode::Shared, "size");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto size = FileSystemManager::FileSize(config_.BlobPath(digest));
        if (not size) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("blob {} not found", digest.ToString()));
        }
        return *size;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::ManifestLocks(std::string const& repository,
                              Digest const& digest,
                              std::vector<Digest> const& required)
    -> std::vector<LockRequest> {
    std::vector<LockRequest> requests{};
    requests.reserve(required.size() + 2);
    requests.push_back(
        LockRequest{LockKey::ForDigest(digest), LockMode::Exclusive});
    requests.push_back(
        LockRequest{LockKey::ForRepository(repository), LockMode::Exclusive});
    for (auto const& blob : required) {
        requests.push_back(
            LockRequest{LockKey::ForDigest(blob), LockMode::Shared});
    }
    return requests;
}

auto BlobStore::PutManifest(std::string const& repository,
                            std::optional<std::string> const& tag,
                            Digest const& digest,
                            std::string const& content,
                            std::optional<std::string> const& content_type,
                            LockToken const& token) noexcept
    -> expected<Ack, Error> {
    try {
        if (auto valid = ValidateRepositoryName(repository); not valid) {
            return unexpected{valid.error()};
        }
        if (tag) {
            if (auto valid = ValidateTag(*tag); not valid) {
                return unexpected{valid.error()};
            }
        }
        for (auto const& key : {LockKey::ForDigest(digest),
                                LockKey::ForRepository(repository)}) {
            auto allowed =
                CheckToken(token, key, LockMode::Exclusive, "put manifest");
            if (not allowed) {
                return unexpected{allowed.error()};
            }
        }

        auto manifest = Manifest::Parse(content, content_type);
        if (not manifest) {
            return unexpected{manifest.error()};
        }
        auto const required_digests = manifest->RequiredDigests();
        // Referenced blobs must not be quarantined while the manifest is
        // committed.
        for (auto const& required : required_digests) {
            auto allowed = CheckToken(token,
                                      LockKey::ForDigest(required),
                                      LockMode::Shared,
                                      "put manifest");
            if (not allowed) {
                return unexpected{allowed.error()};
            }
        }
        std::vector<std::string> missing{};
        for (auto const& required : required_digests) {
            if (not FileSystemManager::IsFile(config_.BlobPath(required))) {
                missing.push_back(required.ToString());
            }
        }
        if (not missing.empty()) {
            return MakeError(
                ErrorCode::DanglingReference,
                fmt::format("manifest {} references missing blobs: {}",
                            digest.ToString(),
                            fmt::join(missing, ", ")));
        }

        // read the index first, so a broken index aborts before any write
        auto index = ReadIndex(repository);
        if (not index) {
            if (index.error().code != ErrorCode::NotFound) {
                return unexpected{index.error()};
            }
            index = TagIndex{};
        }

        auto ack = PutUnchecked(digest, content);
        if (not ack) {
            return ack;
        }
        if (tag) {
            index->SetTag(*tag, digest, UnixNow());
        }
        else {
            index->Link(digest);
        }
        auto written = WriteIndex(repository, *index);
        if (not written) {
            return unexpected{written.error()};
        }
        logger_.Emit(LogLevel::Debug,
                     "linked manifest {} as {}:{}",
                     digest.ToString(),
                     repository,
                     tag.value_or(digest.ToString()));
        return ack;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("put of manifest {} failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto BlobStore::ResolveTag(std::string const& repository,
                           std::string const& tag,
                           LockToken const& token) const noexcept
    -> expected<TagEntry, Error> {
    try {
        auto allowed = CheckToken(token,
                                  LockKey::ForRepository(repository),
                                  LockMode::Shared,
                                  "resolve tag");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto index = ReadIndex(repository);
        if (not index) {
            return unexpected{index.error()};
        }
        auto entry = index->Resolve(tag);
        if (not entry) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("tag {}:{} not found", repository, tag));
        }
        return *entry;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::ListTags(std::string const& repository,
                         LockToken const& token) const noexcept
    -> expected<std::vector<std::string>, Error> {
    auto index = ReadTagIndex(repository, token);
    if (not index) {
        return unexpected{index.error()};
    }
    try {
        return index->TagNames();
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::DeleteTag(std::string const& repository,
                          std::string const& tag,
                          LockToken const& token) noexcept
    -> expected<TagEntry, Error> {
    try {
        auto allowed = CheckToken(token,
                                  LockKey::ForRepository(repository),
                                  LockMode::Exclusive,
                                  "delete tag");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto index = ReadIndex(repository);
        if (not index) {
            return unexpected{index.error()};
        }
        auto entry = index->Resolve(tag);
        if (not entry or not index->RemoveTag(tag)) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("tag {}:{} not found", repository, tag));
        }
        auto written = WriteIndex(repository, *index);
        if (not written) {
            return unexpected{written.error()};
        }
        return *entry;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::ReadTagIndex(std::string const& repository,
                             LockToken const& token) const noexcept
    -> expected<TagIndex, Error> {
    try {
        auto allowed = CheckToken(token,
                                  LockKey::ForRepository(repository),
                                  LockMode::Shared,
                                  "read tag index");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        return ReadIndex(repository);
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::ListRepositories(LockToken const& lease) const noexcept
    -> expected<std::vector<std::string>, Error> {
    try {
        auto allowed = CheckLease(lease, "list repositories");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        std::vector<std::string> repositories{};
        auto ok = FileSystemManager::ReadFilesRecursive(
            config_.RepositoriesRoot(), [&](auto const& rel) {
                if (rel.filename() == StoreConfig::kTagIndexName) {
                    repositories.push_back(rel.parent_path().string());
                }
                return true;
            });
        if (not ok) {
            return MakeError(ErrorCode::IoFailure,
                             "could not enumerate repositories");
        }
        std::sort(repositories.begin(), repositories.end());
        return repositories;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::ListBlobs(LockToken const& lease) const noexcept
    -> expected<std::vector<Digest>, Error> {
    try {
        auto allowed = CheckLease(lease, "list blobs");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        std::vector<Digest> digests{};
        auto ok = FileSystemManager::ReadFilesRecursive(
            config_.BlobsRoot(), [&](auto const& rel) {
                if (FileSystemAtomic::IsTemporaryName(
                        rel.filename().string())) {
                    return true;
                }
                if (auto digest = DigestFromRelativePath(rel)) {
                    digests.push_back(*std::move(digest));
                }
                else {
                    logger_.Emit(LogLevel::Warning,
                                 "ignoring unexpected file {} in blob tree",
                                 rel.string());
                }
                return true;
            });
        if (not ok) {
            return MakeError(ErrorCode::IoFailure, "could not enumerate blobs");
        }
        std::sort(digests.begin(), digests.end());
        return digests;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::Delete(Digest const& digest, LockToken const& lease) noexcept
    -> expected<std::uintmax_t, Error> {
    try {
        auto allowed = CheckLease(lease, "delete");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto const path = config_.BlobPath(digest);
        auto size = FileSystemManager::FileSize(path);
        if (not size) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("blob {} not found", digest.ToString()));
        }
        if (not FileSystemManager::RemoveFile(path)) {
            return MakeError(
                ErrorCode::IoFailure,
                fmt::format("could not remove blob {}", digest.ToString()));
        }
        Unreserve(*size);
        --blob_count_;
        return *size;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::Quarantine(Digest const& digest,
                           LockToken const& token) noexcept
    -> expected<std::filesystem::path, Error> {
    try {
        auto allowed = CheckToken(token,
                                  LockKey::ForDigest(digest),
                                  LockMode::Exclusive,
                                  "quarantine");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        auto const path = config_.BlobPath(digest);
        auto size = FileSystemManager::FileSize(path);
        if (not size) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("blob {} not found", digest.ToString()));
        }
        auto const dir = config_.QuarantineRoot() / digest.AlgorithmName();
        if (not FileSystemManager::CreateDirectory(dir)) {
            return MakeError(ErrorCode::IoFailure,
                             "could not create quarantine directory");
        }
        auto const now = UnixNow();
        auto target = dir / fmt::format("{}.{}", digest.Hex(), now);
        for (int n = 1; FileSystemManager::Exists(target); ++n) {
            target = dir / fmt::format("{}.{}.{}", digest.Hex(), now, n);
        }
        if (not FileSystemManager::Rename(path, target, /*no_clobber=*/true)) {
            return MakeError(
                ErrorCode::IoFailure,
                fmt::format("could not quarantine {}", digest.ToString()));
        }
        Unreserve(*size);
        --blob_count_;
        audit_->Record("quarantined",
                       digest.ToString(),
                       {{"path", target.string()}, {"size", *size}});
        return target;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::RemoveTemporaries(LockToken const& lease) noexcept
    -> expected<std::size_t, Error> {
    try {
        auto allowed = CheckLease(lease, "remove temporaries");
        if (not allowed) {
            return unexpected{allowed.error()};
        }
        std::vector<std::filesystem::path> stale{};
        for (auto const& root :
             {config_.BlobsRoot(), config_.RepositoriesRoot()}) {
            auto ok = FileSystemManager::ReadFilesRecursive(
                root, [&](auto const& rel) {
                    if (FileSystemAtomic::IsTemporaryName(
                            rel.filename().string())) {
                        stale.push_back(root / rel);
                    }
                    return true;
                });
            if (not ok) {
                return MakeError(
                    ErrorCode::IoFailure,
                    fmt::format("could not enumerate {}", root.string()));
            }
        }
        std::size_t removed{};
        for (auto const& path : stale) {
            if (FileSystemManager::RemoveFile(path)) {
                ++removed;
            }
            else {
                logger_.Emit(LogLevel::Warning,
                             "could not remove temporary file {}",
                             path.string());
            }
        }
        return removed;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure, e.what());
    }
}

auto BlobStore::Scan() noexcept -> expected<std::monostate, Error> {
    try {
        // upload sessions do not survive a restart
        if (not FileSystemManager::RemoveDirectory(config_.UploadsRoot(),
                                                   /*recursively=*/true) or
            not FileSystemManager::CreateDirectory(config_.UploadsRoot())) {
            return MakeError(ErrorCode::IoFailure,
                             "could not reset upload staging directory");
        }

        std::vector<std::filesystem::path> stale{};
        std::uintmax_t bytes{};
        std::size_t count{};
        auto ok = FileSystemManager::ReadFilesRecursive(
            config_.BlobsRoot(), [&](auto const& rel) {
                auto const path = config_.BlobsRoot() / rel;
                if (FileSystemAtomic::IsTemporaryName(
                        rel.filename().string())) {
                    stale.push_back(path);
                    return true;
                }
                if (not DigestFromRelativePath(rel)) {
                    logger_.Emit(LogLevel::Warning,
                                 "ignoring unexpected file {} in blob tree",
                                 rel.string());
                    return true;
                }
                bytes += FileSystemManager::FileSize(path).value_or(0);
                ++count;
                return true;
            });
        ok = ok and FileSystemManager::ReadFilesRecursive(
                        config_.RepositoriesRoot(), [&](auto const& rel) {
                            if (FileSystemAtomic::IsTemporaryName(
                                    rel.filename().string())) {
                                stale.push_back(config_.RepositoriesRoot() /
                                                rel);
                            }
                            return true;
                        });
        if (not ok) {
            return MakeError(
                ErrorCode::IoFailure,
                fmt::format("could not scan store {}", config_.root.string()));
        }
        for (auto const& path : stale) {
            logger_.Emit(LogLevel::Info,
                         "removing stale temporary file {}",
                         path.string());
            if (not FileSystemManager::RemoveFile(path)) {
                return MakeError(ErrorCode::IoFailure,
                                 fmt::format("could not remove {}",
                                             path.string()));
            }
        }
        used_bytes_ = bytes;
        blob_count_ = count;
        logger_.Emit(LogLevel::Info,
                     "opened store {} with {} blobs ({} bytes)",
                     config_.root.string(),
                     count,
                     bytes);
        if (config_.max_bytes and bytes > *config_.max_bytes) {
            logger_.Emit(LogLevel::Warning,
                         "store already exceeds its quota of {} bytes",
                         *config_.max_bytes);
        }
        return std::monostate{};
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("scanning store failed: {}", e.what()));
    }
}

auto BlobStore::CheckToken(LockToken const& token,
                           LockKey const& key,
                           LockMode mode,
                           std::string const& operation)
    -> expected<std::monostate, Error> {
    if (token.Covers(key, mode)) {
        return std::monostate{};
    }
    return MakeError(
        ErrorCode::IoFailure,
        fmt::format("{} requires {} lock on {}",
                    operation,
                    mode == LockMode::Exclusive ? "an exclusive" : "a shared",
                    key.ToString()));
}

auto BlobStore::CheckLease(LockToken const& token, std::string const& operation)
    -> expected<std::monostate, Error> {
    if (token.IsLease()) {
        return std::monostate{};
    }
    return MakeError(ErrorCode::IoFailure,
                     fmt::format("{} requires the store lease", operation));
}

auto BlobStore::PutUnchecked(Digest const& digest,
                             std::string const& data) noexcept
    -> expected<Ack, Error> {
    try {
        auto const path = config_.BlobPath(digest);
        if (FileSystemManager::IsFile(path)) {
            return CompareExisting(digest, data);
        }
        if (not digest.Matches(data)) {
            return MakeError(
                ErrorCode::InvalidDigest,
                fmt::format("content does not hash to {}", digest.ToString()));
        }
        if (not Reserve(data.size())) {
            return MakeError(
                ErrorCode::CapacityExceeded,
                fmt::format("storing {} bytes would exceed the store quota",
                            data.size()));
        }
        if (not FileSystemManager::CreateDirectory(path.parent_path())) {
            Unreserve(data.size());
            return MakeError(ErrorCode::IoFailure,
                             fmt::format("could not create directory for {}",
                                         digest.ToString()));
        }
        auto staged = FileSystemAtomic::StageFile(path, data);
        if (not staged) {
            Unreserve(data.size());
            return unexpected{ErrnoToError(
                staged.error(),
                fmt::format("writing blob {}", digest.ToString()))};
        }
        auto ack = Commit(digest, *staged, data.size());
        if (ack and not ack->created) {
            // created concurrently outside of the lock discipline
            return CompareExisting(digest, data);
        }
        return ack;
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("put of {} failed: {}",
                                     digest.ToString(),
                                     e.what()));
    }
}

auto BlobStore::CompareExisting(Digest const& digest,
                                std::string const& data) const
    -> expected<Ack, Error> {
    auto const path = config_.BlobPath(digest);
    auto stored = FileSystemManager::ReadFile(path);
    if (not stored) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("could not read stored blob {}", digest.ToString()));
    }
    if (*stored == data) {
        return Ack{.created = false};
    }
    audit_->Record("digest-collision",
                   digest.ToString(),
                   {{"path", path.string()},
                    {"stored_size", stored->size()},
                    {"offered_size", data.size()}});
    return MakeError(ErrorCode::CorruptionDetected,
                     fmt::format("different content already stored under {}",
                                 digest.ToString()));
}

auto BlobStore::Commit(Digest const& digest,
                       std::filesystem::path const& staged,
                       std::uintmax_t size) -> expected<Ack, Error> {
    auto const path = config_.BlobPath(digest);
    PreCommitHook hook{};
    {
        std::lock_guard lock{hook_mutex_};
        hook = hook_;
    }
    if (hook and not hook(digest, staged)) {
        std::ignore = FileSystemManager::RemoveFile(staged);
        Unreserve(size);
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("write of {} aborted before commit",
                        digest.ToString()));
    }
    auto committed =
        FileSystemAtomic::CommitFile(staged, path, /*no_clobber=*/true);
    if (not committed) {
        std::ignore = FileSystemManager::RemoveFile(staged);
        Unreserve(size);
        return unexpected{ErrnoToError(
            committed.error(),
            fmt::format("committing blob {}", digest.ToString()))};
    }
    if (not *committed) {
        Unreserve(size);
        return Ack{.created = false};
    }
    ++blob_count_;
    logger_.Emit(LogLevel::Trace, "stored blob {}", digest.ToString());
    return Ack{.created = true};
}

auto BlobStore::Reserve(std::uintmax_t size) noexcept -> bool {
    if (not config_.max_bytes) {
        used_bytes_ += size;
        return true;
    }
    auto current = used_bytes_.load();
    do {
        if (current + size > *config_.max_bytes) {
            return false;
        }
    } while (not used_bytes_.compare_exchange_weak(current, current + size));
    return true;
}

void BlobStore::Unreserve(std::uintmax_t size) noexcept {
    auto current = used_bytes_.load();
    while (not used_bytes_.compare_exchange_weak(
        current, current >= size ? current - size : 0)) {
    }
}

auto BlobStore::ReadIndex(std::string const& repository) const
    -> expected<TagIndex, Error> {
    auto const path = config_.TagIndexPath(repository);
    if (not FileSystemManager::IsFile(path)) {
        return MakeError(
            ErrorCode::NotFound,
            fmt::format("repository {} not found", repository));
    }
    auto content = FileSystemManager::ReadFile(path);
    if (not content) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("could not read tag index of {}", repository));
    }
    auto index = TagIndex::FromJson(*content);
    if (not index) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("tag index of {} is broken: {}",
                                     repository,
                                     index.error()));
    }
    return *std::move(index);
}

auto BlobStore::WriteIndex(std::string const& repository,
                           TagIndex const& index) const
    -> expected<std::monostate, Error> {
    auto const path = config_.TagIndexPath(repository);
    if (not FileSystemManager::CreateDirectory(path.parent_path())) {
        return MakeError(
            ErrorCode::IoFailure,
            fmt::format("could not create directory for {}", repository));
    }
    if (auto err = FileSystemAtomic::WriteFile(path, index.ToJson());
        err != 0) {
        return unexpected{ErrnoToError(
            err, fmt::format("writing tag index of {}", repository))};
    }
    return std::monostate{};
}

auto BlobStore::ErrnoToError(int err, std::string const& what) -> Error {
    if (err == ENOSPC or err == EDQUOT) {
        return Error{ErrorCode::CapacityExceeded,
                     fmt::format("{}: {}", what, strerror(err))};
    }
    return Error{ErrorCode::IoFailure,
                 fmt::format("{}: {}", what, strerror(err))};
}
