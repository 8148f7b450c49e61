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

#ifndef INCLUDED_SRC_REGCOORD_UPSTREAM_HTTP_UPSTREAM_REGISTRY_HPP
#define INCLUDED_SRC_REGCOORD_UPSTREAM_HTTP_UPSTREAM_REGISTRY_HPP

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/upstream/upstream_registry.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Connection settings of the upstream registry.
struct UpstreamConfig final {
    class Builder;

    std::string const url;
    bool const no_ssl_verify = false;
    std::optional<std::filesystem::path> const ca_bundle = std::nullopt;
    std::chrono::milliseconds const timeout = std::chrono::seconds{300};
};

class UpstreamConfig::Builder final {
  public:
    auto SetUrl(std::optional<std::string> value) noexcept -> Builder& {
        url_ = std::move(value);
        return *this;
    }

    auto SetNoSslVerify(bool value) noexcept -> Builder& {
        no_ssl_verify_ = value;
        return *this;
    }

    auto SetCaBundle(std::optional<std::filesystem::path> value) noexcept
        -> Builder& {
        ca_bundle_ = std::move(value);
        return *this;
    }

    auto SetTimeoutMs(std::optional<unsigned int> value) noexcept
        -> Builder& {
        timeout_ms_ = value;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<UpstreamConfig, std::string>;

  private:
    std::optional<std::string> url_;
    bool no_ssl_verify_{false};
    std::optional<std::filesystem::path> ca_bundle_;
    std::optional<unsigned int> timeout_ms_;
};

/// \brief Upstream registry spoken to over HTTP(S) through libcurl, using
/// the distribution API paths /v2/<name>/blobs/<digest> and
/// /v2/<name>/manifests/<reference>.
class HttpUpstreamRegistry final : public IUpstreamRegistry {
  public:
    explicit HttpUpstreamRegistry(UpstreamConfig config) noexcept
        : config_{std::move(config)} {}

    [[nodiscard]] auto FetchBlob(std::string const& repository,
                                 Digest const& digest) noexcept
        -> expected<UpstreamContent, Error> final;

    [[nodiscard]] auto FetchManifest(std::string const& repository,
                                     std::string const& reference) noexcept
        -> expected<UpstreamContent, Error> final;

  private:
    UpstreamConfig const config_;
    Logger logger_{"HttpUpstream"};

    [[nodiscard]] auto Fetch(std::string const& url,
                             std::vector<std::string> const& headers,
                             std::string const& what) const noexcept
        -> expected<UpstreamContent, Error>;
};

#endif  // INCLUDED_SRC_REGCOORD_UPSTREAM_HTTP_UPSTREAM_REGISTRY_HPP
