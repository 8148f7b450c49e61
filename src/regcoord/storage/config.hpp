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

#ifndef INCLUDED_SRC_REGCOORD_STORAGE_CONFIG_HPP
#define INCLUDED_SRC_REGCOORD_STORAGE_CONFIG_HPP

#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/common/digest.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Layout of the shared store below its root directory.
struct StoreConfig final {
    class Builder;

    std::filesystem::path const root;

    // Upper bound of bytes stored in blobs; unlimited if not set.
    std::optional<std::uintmax_t> const max_bytes = std::nullopt;

    /// \brief Content-addressed blobs: blobs/<algorithm>/<xx>/<hex>.
    [[nodiscard]] auto BlobsRoot() const noexcept -> std::filesystem::path {
        return root / "blobs";
    }

    [[nodiscard]] auto BlobPath(Digest const& digest) const
        -> std::filesystem::path {
        return BlobsRoot() / digest.AlgorithmName() / digest.Hex().substr(0, 2) /
               digest.Hex();
    }

    /// \brief Per-repository tag indices: repositories/<name>/_index.json.
    [[nodiscard]] auto RepositoriesRoot() const noexcept
        -> std::filesystem::path {
        return root / "repositories";
    }

    [[nodiscard]] auto TagIndexPath(std::string const& repository) const
        -> std::filesystem::path {
        return RepositoriesRoot() / repository / kTagIndexName;
    }

    /// \brief Corrupted blobs moved aside for inspection.
    [[nodiscard]] auto QuarantineRoot() const noexcept
        -> std::filesystem::path {
        return root / "quarantine";
    }

    /// \brief Staging files of chunked uploads in progress.
    [[nodiscard]] auto UploadsRoot() const noexcept -> std::filesystem::path {
        return root / "uploads";
    }

    /// \brief File locked by the process owning the store.
    [[nodiscard]] auto OwnerLockPath() const noexcept -> std::filesystem::path {
        return root / "coordinator.lock";
    }

    static constexpr auto kTagIndexName = "_index.json";
};

class StoreConfig::Builder final {
  public:
    auto SetRoot(std::filesystem::path value) noexcept -> Builder& {
        root_ = std::move(value);
        return *this;
    }

    auto SetMaxBytes(std::optional<std::uintmax_t> value) noexcept
        -> Builder& {
        max_bytes_ = value;
        return *this;
    }

    [[nodiscard]] auto Build() const noexcept
        -> expected<StoreConfig, std::string> {
        if (not root_ or root_->empty()) {
            return unexpected(std::string{"A store root must be given."});
        }
        std::filesystem::path root{};
        try {
            root = std::filesystem::absolute(*root_).lexically_normal();
        } catch (std::exception const& e) {
            return unexpected(fmt::format(
                "Invalid store root {}:\n{}", root_->string(), e.what()));
        }
        if (max_bytes_ and *max_bytes_ == 0) {
            return unexpected(
                std::string{"The store capacity must be greater than 0."});
        }
        return StoreConfig{.root = std::move(root), .max_bytes = max_bytes_};
    }

  private:
    std::optional<std::filesystem::path> root_;
    std::optional<std::uintmax_t> max_bytes_;
};

#endif  // INCLUDED_SRC_REGCOORD_STORAGE_CONFIG_HPP
