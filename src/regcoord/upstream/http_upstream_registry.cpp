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

#include "src/regcoord/upstream/http_upstream_registry.hpp"

#include <exception>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/storage/manifest.hpp"
#include "src/regcoord/upstream/curl_easy_handle.hpp"

auto UpstreamConfig::Builder::Build() const noexcept
    -> expected<UpstreamConfig, std::string> {
    if (not url_ or url_->empty()) {
        return unexpected(std::string{"An upstream url must be given."});
    }
    if (url_->rfind("http://", 0) != 0 and url_->rfind("https://", 0) != 0) {
        return unexpected(fmt::format(
            "Upstream url {} must start with http:// or https://.", *url_));
    }
    if (timeout_ms_ and *timeout_ms_ == 0) {
        return unexpected(
            std::string{"Upstream timeout must be greater than 0."});
    }
    auto url = *url_;
    while (url.ends_with('/')) {
        url.pop_back();
    }
    return UpstreamConfig{
        .url = std::move(url),
        .no_ssl_verify = no_ssl_verify_,
        .ca_bundle = ca_bundle_,
        .timeout = timeout_ms_ ? std::chrono::milliseconds{*timeout_ms_}
                               : std::chrono::milliseconds{
                                     std::chrono::seconds{300}}};
}

auto HttpUpstreamRegistry::FetchBlob(std::string const& repository,
                                     Digest const& digest) noexcept
    -> expected<UpstreamContent, Error> {
    try {
        return Fetch(fmt::format("{}/v2/{}/blobs/{}",
                                 config_.url,
                                 repository,
                                 digest.ToString()),
                     {},
                     fmt::format("blob {}@{}", repository, digest.ToString()));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::UpstreamUnavailable, e.what());
    }
}

auto HttpUpstreamRegistry::FetchManifest(std::string const& repository,
                                         std::string const& reference) noexcept
    -> expected<UpstreamContent, Error> {
    try {
        return Fetch(
            fmt::format(
                "{}/v2/{}/manifests/{}", config_.url, repository, reference),
            {fmt::format("Accept: {}", Manifest::AcceptedMediaTypes())},
            fmt::format("manifest {}:{}", repository, reference));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::UpstreamUnavailable, e.what());
    }
}

auto HttpUpstreamRegistry::Fetch(std::string const& url,
                                 std::vector<std::string> const& headers,
                                 std::string const& what) const noexcept
    -> expected<UpstreamContent, Error> {
    try {
        // easy handles are not shareable between threads
        auto curl = CurlEasyHandle::Create(
            config_.no_ssl_verify, config_.ca_bundle, LogLevel::Debug);
        if (not curl) {
            return MakeError(ErrorCode::UpstreamUnavailable,
                             "could not create curl handle");
        }
        logger_.Emit(LogLevel::Debug, "GET {}", url);
        auto response = curl->Get(url, headers, config_.timeout);
        if (not response) {
            return MakeError(
                ErrorCode::UpstreamUnavailable,
                fmt::format("fetching {} failed: {}", what, response.error()));
        }
        if (response->status == 200) {  // NOLINT
            return UpstreamContent{.content = std::move(response->body),
                                   .content_type =
                                       std::move(response->content_type)};
        }
        if (response->status == 404) {  // NOLINT
            return MakeError(ErrorCode::NotFound,
                             fmt::format("upstream has no {}", what));
        }
        return MakeError(ErrorCode::UpstreamUnavailable,
                         fmt::format("fetching {} failed with HTTP status {}",
                                     what,
                                     response->status));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::UpstreamUnavailable,
                         fmt::format("fetching {} failed: {}", what, e.what()));
    }
}
