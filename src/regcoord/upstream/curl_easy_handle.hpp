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

#ifndef INCLUDED_SRC_REGCOORD_UPSTREAM_CURL_EASY_HANDLE_HPP
#define INCLUDED_SRC_REGCOORD_UPSTREAM_CURL_EASY_HANDLE_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/upstream/curl_context.hpp"
#include "src/utils/cpp/expected.hpp"

extern "C" {
#if defined(BUILDING_LIBCURL) || defined(CURL_STRICTER)
using CURL = struct Curl_easy;
#else
using CURL = void;
#endif
}

void curl_easy_closer(gsl::owner<CURL*> curl);

/// \brief Status, body and content type of a completed HTTP exchange.
struct HttpResponse {
    long status{};
    std::string body;
    std::optional<std::string> content_type;
};

class CurlEasyHandle {
  public:
    CurlEasyHandle() noexcept = default;
    ~CurlEasyHandle() noexcept = default;

    // prohibit moves and copies
    CurlEasyHandle(CurlEasyHandle const&) = delete;
    CurlEasyHandle(CurlEasyHandle&& other) = delete;
    auto operator=(CurlEasyHandle const&) = delete;
    auto operator=(CurlEasyHandle&& other) = delete;

    /// \brief Create a CurlEasyHandle object
    [[nodiscard]] auto static Create(
        LogLevel log_level = LogLevel::Error) noexcept
        -> std::shared_ptr<CurlEasyHandle>;

    /// \brief Create a CurlEasyHandle object with non-default CA info
    [[nodiscard]] auto static Create(
        bool no_ssl_verify,
        std::optional<std::filesystem::path> const& ca_bundle,
        LogLevel log_level = LogLevel::Error) noexcept
        -> std::shared_ptr<CurlEasyHandle>;

    /// \brief Issue a GET request, following redirects.
    /// \param headers  Request header lines ("Name: value").
    /// \param timeout  Bound of the whole transfer.
    /// \returns the response of the server, whatever its status, or the
    /// transport error message.
    [[nodiscard]] auto Get(std::string const& url,
                           std::vector<std::string> const& headers,
                           std::chrono::milliseconds timeout) noexcept
        -> expected<HttpResponse, std::string>;

  private:
    // IMPORTANT: the CurlContext must to be initialized before any curl object!
    CurlContext curl_context_;
    std::unique_ptr<CURL, decltype(&curl_easy_closer)> handle_{
        nullptr,
        curl_easy_closer};
    // allow also non-fatal logging of curl operations
    LogLevel log_level_{};

    bool no_ssl_verify_{false};
    std::optional<std::filesystem::path> ca_bundle_{std::nullopt};

    /// \brief Overwrites write_callback to redirect to string instead of
    /// stdout.
    [[nodiscard]] auto static EasyWriteToString(gsl::owner<char*> data,
                                                std::size_t size,
                                                std::size_t nmemb,
                                                gsl::owner<void*> userptr)
        -> std::streamsize;
};

#endif  // INCLUDED_SRC_REGCOORD_UPSTREAM_CURL_EASY_HANDLE_HPP
