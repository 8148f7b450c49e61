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

#ifndef INCLUDED_SRC_REGCOORD_FACETS_LOCAL_FACET_HPP
#define INCLUDED_SRC_REGCOORD_FACETS_LOCAL_FACET_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "gsl/gsl"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/facets/manifest_content.hpp"
#include "src/regcoord/locking/lock_manager.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/storage/blob_store.hpp"
#include "src/regcoord/storage/tag_index.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief State of a chunked upload as reported to clients.
struct UploadStatus {
    std::string uuid;
    std::string repository;
    std::uintmax_t offset{};
};

/// \brief Writable push/pull front end of the store. Pulls are served from
/// the store only; pushes write blobs, then manifests, each under the
/// exclusive locks of the keys they touch.
class LocalFacet final {
  public:
    LocalFacet(gsl::not_null<BlobStore*> const& store,
               gsl::not_null<LockManager*> const& locks) noexcept
        : store_{store}, locks_{locks} {}

    LocalFacet(LocalFacet const&) = delete;
    LocalFacet(LocalFacet&&) = delete;
    auto operator=(LocalFacet const&) -> LocalFacet& = delete;
    auto operator=(LocalFacet&&) -> LocalFacet& = delete;

    /// \brief Cancels all open upload sessions.
    ~LocalFacet() noexcept;

    [[nodiscard]] auto GetBlob(std::string const& repository,
                               Digest const& digest) noexcept
        -> expected<std::string, Error>;

    [[nodiscard]] auto HeadBlob(std::string const& repository,
                                Digest const& digest) noexcept
        -> expected<std::uintmax_t, Error>;

    /// \brief Get a manifest by tag or digest.
    [[nodiscard]] auto GetManifest(std::string const& repository,
                                   std::string const& reference) noexcept
        -> expected<ManifestContent, Error>;

    /// \brief Monolithic blob upload.
    [[nodiscard]] auto PutBlob(std::string const& repository,
                               Digest const& digest,
                               std::string const& data) noexcept
        -> expected<Ack, Error>;

    /// \brief Push a manifest under a tag or its digest. When pushed by
    /// digest, the reference must be the digest of the content.
    /// \returns the digest of the manifest.
    [[nodiscard]] auto PutManifest(
        std::string const& repository,
        std::string const& reference,
        std::string const& content,
        std::optional<std::string> const& content_type) noexcept
        -> expected<Digest, Error>;

    [[nodiscard]] auto StartUpload(std::string const& repository) noexcept
        -> expected<UploadStatus, Error>;

    [[nodiscard]] auto AppendChunk(std::string const& uuid,
                                   std::string const& chunk) noexcept
        -> expected<UploadStatus, Error>;

    /// \brief Finish an upload: append the optional last chunk, verify the
    /// content against digest and move it into the store. The session ends
    /// on success and on permanent failures. It stays open when the digest
    /// lock could not be taken or the store is full, so the commit can be
    /// retried; a last chunk appended before such a failure is reflected in
    /// the session offset.
    [[nodiscard]] auto CommitUpload(
        std::string const& uuid,
        Digest const& digest,
        std::optional<std::string> const& last_chunk) noexcept
        -> expected<Ack, Error>;

    /// \brief Abort an upload and remove its staging file.
    [[nodiscard]] auto CancelUpload(std::string const& uuid) noexcept
        -> expected<std::monostate, Error>;

    [[nodiscard]] auto UploadStatusOf(std::string const& uuid) noexcept
        -> expected<UploadStatus, Error>;

    [[nodiscard]] auto OpenUploads() const noexcept -> std::size_t;

    [[nodiscard]] auto ListTags(std::string const& repository) noexcept
        -> expected<std::vector<std::string>, Error>;

    /// \brief Remove a tag. The manifest stays until garbage collected.
    [[nodiscard]] auto DeleteTag(std::string const& repository,
                                 std::string const& tag) noexcept
        -> expected<TagEntry, Error>;

  private:
    struct Session {
        std::string uuid;
        std::string repository;
        std::filesystem::path staging;
        std::uintmax_t offset{};
        std::mutex mutex;  // serializes appends
    };

    gsl::not_null<BlobStore*> store_;
    gsl::not_null<LockManager*> locks_;
    Logger logger_{"LocalFacet"};

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;

    [[nodiscard]] auto FindSession(std::string const& uuid) const noexcept
        -> expected<std::shared_ptr<Session>, Error>;

    /// \brief Remove a session from the map.
    [[nodiscard]] auto TakeSession(std::string const& uuid) noexcept
        -> expected<std::shared_ptr<Session>, Error>;

    /// \brief Append to the staging file of a session locked by the caller.
    [[nodiscard]] static auto Append(Session* session,
                                     std::string const& chunk) noexcept
        -> expected<std::monostate, Error>;
};

#endif  // INCLUDED_SRC_REGCOORD_FACETS_LOCAL_FACET_HPP
