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

#include "src/regcoord/upstream/curl_easy_handle.hpp"

#include <exception>

#include "src/regcoord/logging/logger.hpp"

extern "C" {
#include "curl/curl.h"
}

namespace {

/// \brief Owner of a curl header list.
class HeaderList {
  public:
    explicit HeaderList(std::vector<std::string> const& lines) noexcept {
        for (auto const& line : lines) {
            auto* appended = curl_slist_append(list_, line.c_str());
            if (appended == nullptr) {
                valid_ = false;
                return;
            }
            list_ = appended;
        }
    }
    ~HeaderList() noexcept { curl_slist_free_all(list_); }
    HeaderList(HeaderList const&) = delete;
    HeaderList(HeaderList&&) = delete;
    auto operator=(HeaderList const&) -> HeaderList& = delete;
    auto operator=(HeaderList&&) -> HeaderList& = delete;

    [[nodiscard]] auto Get() const noexcept -> curl_slist* { return list_; }
    [[nodiscard]] auto IsValid() const noexcept -> bool { return valid_; }

  private:
    gsl::owner<curl_slist*> list_{nullptr};
    bool valid_{true};
};

}  // namespace

void curl_easy_closer(gsl::owner<CURL*> curl) {
    curl_easy_cleanup(curl);
}

auto CurlEasyHandle::Create(LogLevel log_level) noexcept
    -> std::shared_ptr<CurlEasyHandle> {
    return Create(/*no_ssl_verify=*/false, std::nullopt, log_level);
}

auto CurlEasyHandle::Create(
    bool no_ssl_verify,
    std::optional<std::filesystem::path> const& ca_bundle,
    LogLevel log_level) noexcept -> std::shared_ptr<CurlEasyHandle> {
    try {
        auto curl = std::make_shared<CurlEasyHandle>();
        if (not curl->curl_context_.IsInitialized()) {
            return nullptr;
        }
        auto* handle = curl_easy_init();
        if (handle == nullptr) {
            return nullptr;
        }
        curl->handle_.reset(handle);
        curl->log_level_ = log_level;
        curl->no_ssl_verify_ = no_ssl_verify;
        curl->ca_bundle_ = ca_bundle;
        return curl;
    } catch (std::exception const& ex) {
        Logger::Log(log_level,
                    "create curl easy handle failed with:\n{}",
                    ex.what());
        return nullptr;
    }
}

auto CurlEasyHandle::EasyWriteToString(gsl::owner<char*> data,
                                       size_t size,
                                       size_t nmemb,
                                       gsl::owner<void*> userptr)
    -> std::streamsize {
    size_t actual_size = size * nmemb;
    (static_cast<std::string*>(userptr))->append(data, actual_size);
    return static_cast<std::streamsize>(actual_size);
}

auto CurlEasyHandle::Get(std::string const& url,
                         std::vector<std::string> const& headers,
                         std::chrono::milliseconds timeout) noexcept
    -> expected<HttpResponse, std::string> {
    try {
        // the handle is reused; drop options of the previous request
        curl_easy_reset(handle_.get());

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle_.get(), CURLOPT_URL, url.c_str());

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle_.get(), CURLOPT_FOLLOWLOCATION, 1L);

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle_.get(),
                         CURLOPT_TIMEOUT_MS,
                         static_cast<long>(timeout.count()));

        if (no_ssl_verify_) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
            curl_easy_setopt(handle_.get(), CURLOPT_SSL_VERIFYPEER, 0L);
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
            curl_easy_setopt(handle_.get(), CURLOPT_SSL_VERIFYHOST, 0L);
        }
        else if (ca_bundle_) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
            curl_easy_setopt(
                handle_.get(), CURLOPT_CAINFO, ca_bundle_->c_str());
        }

        HeaderList header_list{headers};
        if (not header_list.IsValid()) {
            return unexpected<std::string>{"could not build request headers"};
        }
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle_.get(), CURLOPT_HTTPHEADER, header_list.Get());

        HttpResponse response{};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(
            handle_.get(), CURLOPT_WRITEFUNCTION, EasyWriteToString);
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_setopt(handle_.get(),
                         CURLOPT_WRITEDATA,
                         static_cast<void*>(&response.body));

        auto res = curl_easy_perform(handle_.get());
        if (res != CURLE_OK) {
            return unexpected<std::string>{curl_easy_strerror(res)};
        }

        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_getinfo(handle_.get(), CURLINFO_RESPONSE_CODE, &response.status);
        char* content_type{nullptr};
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg, hicpp-vararg)
        curl_easy_getinfo(handle_.get(), CURLINFO_CONTENT_TYPE, &content_type);
        if (content_type != nullptr) {
            response.content_type = std::string{content_type};
        }
        return response;
    } catch (std::exception const& ex) {
        Logger::Log(
            log_level_, "curl GET {} failed with:\n{}", url, ex.what());
        return unexpected<std::string>{ex.what()};
    }
}
