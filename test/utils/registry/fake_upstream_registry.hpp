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

#ifndef INCLUDED_SRC_TEST_UTILS_REGISTRY_FAKE_UPSTREAM_REGISTRY_HPP
#define INCLUDED_SRC_TEST_UTILS_REGISTRY_FAKE_UPSTREAM_REGISTRY_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "src/regcoord/upstream/upstream_registry.hpp"
#include "src/utils/cpp/expected.hpp"
#include "test/utils/registry/image_creator.hpp"

/// \brief In-process upstream registry. Serves what was added to it and
/// counts the fetches it answers. Failures can be injected for a number of
/// calls, or permanently by taking it offline.
class FakeUpstreamRegistry final : public IUpstreamRegistry {
  public:
    void AddBlob(TestBlob const& blob) {
        std::unique_lock lock{mutex_};
        blobs_[blob.digest.ToString()] = blob.content;
    }

    void AddImage(std::string const& repository,
                  TestImage const& image,
                  std::optional<std::string> const& tag = std::nullopt) {
        AddBlob(image.config);
        for (auto const& layer : image.layers) {
            AddBlob(layer);
        }
        AddManifest(repository, image.manifest, media_type::kOciManifest, tag);
    }

    /// \brief Serve a manifest by digest and, if given, by tag.
    void AddManifest(std::string const& repository,
                     TestBlob const& manifest,
                     std::string const& content_type,
                     std::optional<std::string> const& tag = std::nullopt) {
        std::unique_lock lock{mutex_};
        UpstreamContent content{manifest.content, content_type};
        manifests_[Key(repository, manifest.digest.ToString())] = content;
        if (tag) {
            manifests_[Key(repository, *tag)] = std::move(content);
        }
    }

    /// \brief Serve other content than requested for a digest.
    void CorruptBlob(Digest const& digest, std::string content) {
        std::unique_lock lock{mutex_};
        blobs_[digest.ToString()] = std::move(content);
    }

    /// \brief Fail the next count calls with a retryable error.
    void FailNext(std::size_t count) noexcept { failures_ = count; }

    void SetOffline(bool offline) noexcept { offline_ = offline; }

    /// \brief Answer every call only after the given delay.
    void SetDelay(std::chrono::milliseconds delay) noexcept {
        delay_ms_ = delay.count();
    }

    [[nodiscard]] auto BlobFetches() const noexcept -> std::size_t {
        return blob_fetches_;
    }

    [[nodiscard]] auto ManifestFetches() const noexcept -> std::size_t {
        return manifest_fetches_;
    }

    [[nodiscard]] auto FetchBlob(std::string const& /*repository*/,
                                 Digest const& digest) noexcept
        -> expected<UpstreamContent, Error> final {
        ++blob_fetches_;
        if (auto failure = Failure()) {
            return unexpected{*std::move(failure)};
        }
        std::unique_lock lock{mutex_};
        auto it = blobs_.find(digest.ToString());
        if (it == blobs_.end()) {
            return MakeError(ErrorCode::NotFound,
                             fmt::format("blob {} unknown", digest.ToString()));
        }
        return UpstreamContent{it->second, "application/octet-stream"};
    }

    [[nodiscard]] auto FetchManifest(std::string const& repository,
                                     std::string const& reference) noexcept
        -> expected<UpstreamContent, Error> final {
        ++manifest_fetches_;
        if (auto failure = Failure()) {
            return unexpected{*std::move(failure)};
        }
        std::unique_lock lock{mutex_};
        auto it = manifests_.find(Key(repository, reference));
        if (it == manifests_.end()) {
            return MakeError(
                ErrorCode::NotFound,
                fmt::format("manifest {}:{} unknown", repository, reference));
        }
        return it->second;
    }

  private:
    std::mutex mutex_;
    std::map<std::string, std::string> blobs_;
    std::map<std::string, UpstreamContent> manifests_;
    std::atomic<std::size_t> failures_{};
    std::atomic<bool> offline_{};
    std::atomic<long> delay_ms_{};
    std::atomic<std::size_t> blob_fetches_{};
    std::atomic<std::size_t> manifest_fetches_{};

    [[nodiscard]] static auto Key(std::string const& repository,
                                  std::string const& reference)
        -> std::string {
        return repository + "@" + reference;
    }

    [[nodiscard]] auto Failure() noexcept -> std::optional<Error> {
        if (auto delay = delay_ms_.load(); delay > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{delay});
        }
        if (offline_) {
            return Error{ErrorCode::UpstreamUnavailable, "upstream offline"};
        }
        auto remaining = failures_.load();
        while (remaining > 0) {
            if (failures_.compare_exchange_weak(remaining, remaining - 1)) {
                return Error{ErrorCode::UpstreamUnavailable,
                             "injected upstream failure"};
            }
        }
        return std::nullopt;
    }
};

#endif  // INCLUDED_SRC_TEST_UTILS_REGISTRY_FAKE_UPSTREAM_REGISTRY_HPP
