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

#ifndef INCLUDED_SRC_REGCOORD_UPSTREAM_UPSTREAM_REGISTRY_HPP
#define INCLUDED_SRC_REGCOORD_UPSTREAM_UPSTREAM_REGISTRY_HPP

#include <memory>
#include <optional>
#include <string>

#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Content fetched from an upstream registry.
struct UpstreamContent {
    std::string content;
    std::optional<std::string> content_type;
};

/// \brief Read API of the registry a mirror pulls through from. Each call is
/// a single attempt; retrying is up to the caller. Implementations must be
/// safe to call from several threads.
class IUpstreamRegistry {
  public:
    using Ptr = std::shared_ptr<IUpstreamRegistry>;

    IUpstreamRegistry() = default;
    IUpstreamRegistry(IUpstreamRegistry const&) = delete;
    IUpstreamRegistry(IUpstreamRegistry&&) = delete;
    auto operator=(IUpstreamRegistry const&) -> IUpstreamRegistry& = delete;
    auto operator=(IUpstreamRegistry&&) -> IUpstreamRegistry& = delete;
    virtual ~IUpstreamRegistry() = default;

    /// \brief Fetch a blob.
    /// \returns the content, NotFound if the upstream does not know the
    /// blob, or UpstreamUnavailable for any other failure.
    [[nodiscard]] virtual auto FetchBlob(std::string const& repository,
                                         Digest const& digest) noexcept
        -> expected<UpstreamContent, Error> = 0;

    /// \brief Fetch a manifest by tag or digest, with the same error
    /// classification as FetchBlob.
    [[nodiscard]] virtual auto FetchManifest(
        std::string const& repository,
        std::string const& reference) noexcept
        -> expected<UpstreamContent, Error> = 0;
};

#endif  // INCLUDED_SRC_REGCOORD_UPSTREAM_UPSTREAM_REGISTRY_HPP
