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

#include "src/regcoord/facets/local_facet.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <tuple>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/common/ids.hpp"
#include "src/regcoord/common/reference.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/locking/lock_key.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/storage/manifest.hpp"

LocalFacet::~LocalFacet() noexcept {
    std::lock_guard lock{sessions_mutex_};
    for (auto const& [uuid, session] : sessions_) {
        std::lock_guard session_lock{session->mutex};
        if (not FileSystemManager::RemoveFile(session->staging)) {
            logger_.Emit(LogLevel::Warning,
                         "could not remove staging file of upload {}",
                         uuid);
        }
    }
    sessions_.clear();
}

auto LocalFacet::GetBlob(std::string const& repository,
                         Digest const& digest) noexcept
    -> expected<std::string, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    expected<std::string, Error> blob = MakeError(ErrorCode::IoFailure, "");
    {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Shared);
        if (not token) {
            return unexpected{token.error()};
        }
        blob = store_->Get(digest, *token);
    }
    if (not blob and blob.error().code == ErrorCode::CorruptionDetected) {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Exclusive);
        if (token) {
            auto moved = store_->Quarantine(digest, *token);
            if (not moved and moved.error().code != ErrorCode::NotFound) {
                logger_.Emit(LogLevel::Warning,
                             "quarantining {} failed: {}",
                             digest.ToString(),
                             moved.error().message);
            }
        }
    }
    return blob;
}

auto LocalFacet::HeadBlob(std::string const& repository,
                          Digest const& digest) noexcept
    -> expected<std::uintmax_t, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto token = locks_->Acquire(LockKey::ForDigest(digest), LockMode::Shared);
    if (not token) {
        return unexpected{token.error()};
    }
    return store_->Size(digest, *token);
}

auto LocalFacet::GetManifest(std::string const& repository,
                             std::string const& reference) noexcept
    -> expected<ManifestContent, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto parsed = ParseManifestReference(reference);
    if (not parsed) {
        return unexpected{parsed.error()};
    }
    std::optional<Digest> digest{};
    if (auto const* by_digest = std::get_if<Digest>(&*parsed)) {
        digest = *by_digest;
    }
    else {
        auto token = locks_->Acquire(LockKey::ForRepository(repository),
                                     LockMode::Shared);
        if (not token) {
            return unexpected{token.error()};
        }
        auto entry = store_->ResolveTag(
            repository, std::get<std::string>(*parsed), *token);
        if (not entry) {
            return unexpected{entry.error()};
        }
        digest = entry->digest;
    }
    auto content = GetBlob(repository, *digest);
    if (not content) {
        return unexpected{content.error()};
    }
    auto manifest = Manifest::Parse(*content);
    if (not manifest) {
        return unexpected{manifest.error()};
    }
    return ManifestContent{.digest = *digest,
                           .content = *std::move(content),
                           .media_type = manifest->MediaType()};
}

auto LocalFacet::PutBlob(std::string const& repository,
                         Digest const& digest,
                         std::string const& data) noexcept
    -> expected<Ack, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto token =
        locks_->Acquire(LockKey::ForDigest(digest), LockMode::Exclusive);
    if (not token) {
        return unexpected{token.error()};
    }
    return store_->Put(digest, data, *token);
}

auto LocalFacet::PutManifest(
    std::string const& repository,
    std::string const& reference,
    std::string const& content,
    std::optional<std::string> const& content_type) noexcept
    -> expected<Digest, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto parsed = ParseManifestReference(reference);
    if (not parsed) {
        return unexpected{parsed.error()};
    }
    auto const* by_digest = std::get_if<Digest>(&*parsed);
    auto digest = by_digest != nullptr
                      ? Digest::Compute(content, by_digest->Algorithm())
                      : Digest::Compute(content);
    if (not digest) {
        return MakeError(ErrorCode::IoFailure, "could not hash manifest");
    }
    if (by_digest != nullptr and *by_digest != *digest) {
        return MakeError(ErrorCode::InvalidDigest,
                         fmt::format("manifest hashes to {}, not {}",
                                     digest->ToString(),
                                     by_digest->ToString()));
    }
    std::optional<std::string> tag{};
    if (by_digest == nullptr) {
        tag = std::get<std::string>(*parsed);
    }

    auto manifest = Manifest::Parse(content, content_type);
    if (not manifest) {
        return unexpected{manifest.error()};
    }
    auto token = locks_->AcquireAll(BlobStore::ManifestLocks(
        repository, *digest, manifest->RequiredDigests()));
    if (not token) {
        return unexpected{token.error()};
    }
    auto ack = store_->PutManifest(
        repository, tag, *digest, content, content_type, *token);
    if (not ack) {
        return unexpected{ack.error()};
    }
    logger_.Emit(LogLevel::Info,
                 "pushed manifest {}:{} ({})",
                 repository,
                 reference,
                 digest->ToString());
    return *digest;
}

auto LocalFacet::StartUpload(std::string const& repository) noexcept
    -> expected<UploadStatus, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    try {
        auto uuid = CreateUUID();
        if (not uuid) {
            return MakeError(ErrorCode::IoFailure,
                             "could not create upload id");
        }
        auto session = std::make_shared<Session>();
        session->uuid = *uuid;
        session->repository = repository;
        session->staging = store_->Config().UploadsRoot() / *uuid;
        if (not FileSystemManager::CreateFileExclusive(session->staging)) {
            return MakeError(ErrorCode::IoFailure,
                             fmt::format("could not create staging file {}",
                                         session->staging.string()));
        }
        {
            std::lock_guard lock{sessions_mutex_};
            sessions_.emplace(*uuid, session);
        }
        logger_.Emit(
            LogLevel::Debug, "started upload {} to {}", *uuid, repository);
        return UploadStatus{
            .uuid = *uuid, .repository = repository, .offset = 0};
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("starting upload failed: {}", e.what()));
    }
}

auto LocalFacet::AppendChunk(std::string const& uuid,
                             std::string const& chunk) noexcept
    -> expected<UploadStatus, Error> {
    auto session = FindSession(uuid);
    if (not session) {
        return unexpected{session.error()};
    }
    auto const& s = *session;
    std::lock_guard lock{s->mutex};
    // committed or cancelled while we were waiting for the session
    if (not FileSystemManager::IsFile(s->staging)) {
        return MakeError(ErrorCode::UploadUnknown,
                         fmt::format("upload {} has ended", uuid));
    }
    auto appended = Append(s.get(), chunk);
    if (not appended) {
        return unexpected{appended.error()};
    }
    return UploadStatus{
        .uuid = s->uuid, .repository = s->repository, .offset = s->offset};
}

auto LocalFacet::CommitUpload(
    std::string const& uuid,
    Digest const& digest,
    std::optional<std::string> const& last_chunk) noexcept
    -> expected<Ack, Error> {
    auto session = FindSession(uuid);
    if (not session) {
        return unexpected{session.error()};
    }
    auto const& s = *session;
    std::lock_guard lock{s->mutex};
    if (not FileSystemManager::IsFile(s->staging)) {
        return MakeError(ErrorCode::UploadUnknown,
                         fmt::format("upload {} has ended", uuid));
    }
    auto result = [&]() -> expected<Ack, Error> {
        auto token =
            locks_->Acquire(LockKey::ForDigest(digest), LockMode::Exclusive);
        if (not token) {
            return unexpected{token.error()};
        }
        if (last_chunk) {
            auto appended = Append(s.get(), *last_chunk);
            if (not appended) {
                return unexpected{appended.error()};
            }
        }
        return store_->PutFile(digest, s->staging, *token);
    }();
    bool const staged = FileSystemManager::IsFile(s->staging);
    if (not result and staged and
        (result.error().IsRetryable() or
         result.error().code == ErrorCode::CapacityExceeded)) {
        logger_.Emit(LogLevel::Debug,
                     "upload {} kept open: {}",
                     uuid,
                     result.error().message);
        return result;
    }
    // a concurrent cancel may have taken the session already
    std::ignore = TakeSession(uuid);
    // the store consumed the staging file on success
    if (staged and not FileSystemManager::RemoveFile(s->staging)) {
        logger_.Emit(LogLevel::Warning,
                     "could not remove staging file of upload {}",
                     uuid);
    }
    if (result) {
        logger_.Emit(LogLevel::Debug,
                     "upload {} committed as {}",
                     uuid,
                     digest.ToString());
    }
    return result;
}

auto LocalFacet::CancelUpload(std::string const& uuid) noexcept
    -> expected<std::monostate, Error> {
    auto session = TakeSession(uuid);
    if (not session) {
        return unexpected{session.error()};
    }
    auto const& s = *session;
    std::lock_guard lock{s->mutex};
    if (not FileSystemManager::RemoveFile(s->staging)) {
        return MakeError(ErrorCode::IoFailure,
                         fmt::format("could not remove staging file of "
                                     "upload {}",
                                     uuid));
    }
    logger_.Emit(LogLevel::Debug, "cancelled upload {}", uuid);
    return std::monostate{};
}

auto LocalFacet::UploadStatusOf(std::string const& uuid) noexcept
    -> expected<UploadStatus, Error> {
    auto session = FindSession(uuid);
    if (not session) {
        return unexpected{session.error()};
    }
    auto const& s = *session;
    std::lock_guard lock{s->mutex};
    return UploadStatus{
        .uuid = s->uuid, .repository = s->repository, .offset = s->offset};
}

auto LocalFacet::OpenUploads() const noexcept -> std::size_t {
    std::lock_guard lock{sessions_mutex_};
    return sessions_.size();
}

auto LocalFacet::ListTags(std::string const& repository) noexcept
    -> expected<std::vector<std::string>, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    auto token =
        locks_->Acquire(LockKey::ForRepository(repository), LockMode::Shared);
    if (not token) {
        return unexpected{token.error()};
    }
    return store_->ListTags(repository, *token);
}

auto LocalFacet::DeleteTag(std::string const& repository,
                           std::string const& tag) noexcept
    -> expected<TagEntry, Error> {
    if (auto valid = ValidateRepositoryName(repository); not valid) {
        return unexpected{valid.error()};
    }
    if (auto valid = ValidateTag(tag); not valid) {
        return unexpected{valid.error()};
    }
    auto token = locks_->Acquire(LockKey::ForRepository(repository),
                                 LockMode::Exclusive);
    if (not token) {
        return unexpected{token.error()};
    }
    auto removed = store_->DeleteTag(repository, tag, *token);
    if (removed) {
        logger_.Emit(LogLevel::Info,
                     "deleted tag {}:{} ({})",
                     repository,
                     tag,
                     removed->digest.ToString());
    }
    return removed;
}

auto LocalFacet::FindSession(std::string const& uuid) const noexcept
    -> expected<std::shared_ptr<Session>, Error> {
    std::lock_guard lock{sessions_mutex_};
    auto it = sessions_.find(uuid);
    if (it == sessions_.end()) {
        return MakeError(ErrorCode::UploadUnknown,
                         fmt::format("unknown upload {}", uuid));
    }
    return it->second;
}

auto LocalFacet::TakeSession(std::string const& uuid) noexcept
    -> expected<std::shared_ptr<Session>, Error> {
    std::lock_guard lock{sessions_mutex_};
    auto it = sessions_.find(uuid);
    if (it == sessions_.end()) {
        return MakeError(ErrorCode::UploadUnknown,
                         fmt::format("unknown upload {}", uuid));
    }
    auto session = std::move(it->second);
    sessions_.erase(it);
    return session;
}

auto LocalFacet::Append(Session* session, std::string const& chunk) noexcept
    -> expected<std::monostate, Error> {
    if (chunk.empty()) {
        return std::monostate{};
    }
    if (auto err = FileSystemAtomic::AppendToFile(session->staging, chunk);
        err != 0) {
        return MakeError(
            err == ENOSPC or err == EDQUOT ? ErrorCode::CapacityExceeded
                                           : ErrorCode::IoFailure,
            fmt::format("appending to upload {} failed: {}",
                        session->uuid,
                        strerror(err)));
    }
    session->offset += chunk.size();
    return std::monostate{};
}
