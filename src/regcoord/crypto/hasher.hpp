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

#ifndef INCLUDED_SRC_REGCOORD_CRYPTO_HASHER_HPP
#define INCLUDED_SRC_REGCOORD_CRYPTO_HASHER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>  // std::move

#include "src/utils/cpp/hex_string.hpp"

/// \brief Incremental SHA-2 hasher backed by OpenSSL.
class Hasher final {
  public:
    /// \brief Hash algorithms accepted for content digests.
    enum class HashType : std::uint8_t { SHA256, SHA512 };

    struct ShaContext;

    /// \brief Raw bytes of a finished hash.
    class HashDigest final {
        friend Hasher;

      public:
        [[nodiscard]] auto Bytes() const& noexcept -> std::string const& {
            return bytes_;
        }

        [[nodiscard]] auto Bytes() && noexcept -> std::string {
            return std::move(bytes_);
        }

        /// \brief Get lower-case hexadecimal string of digest.
        [[nodiscard]] auto HexString() const -> std::string {
            return ToHexString(bytes_);
        }

        [[nodiscard]] auto Length() const noexcept -> std::size_t {
            return bytes_.size();
        }

      private:
        std::string bytes_;

        explicit HashDigest(std::string bytes) : bytes_{std::move(bytes)} {}
    };

    /// \brief Create and initialize a hasher
    /// \return An initialized hasher on success or std::nullopt on failure.
    [[nodiscard]] static auto Create(HashType type) noexcept
        -> std::optional<Hasher>;

    /// \brief Hash a complete string in one go.
    [[nodiscard]] static auto HashData(HashType type,
                                       std::string const& data) noexcept
        -> std::optional<HashDigest>;

    /// \brief Hash the content of a file, reading it in chunks.
    [[nodiscard]] static auto HashFile(
        HashType type,
        std::filesystem::path const& path) noexcept
        -> std::optional<HashDigest>;

    Hasher(Hasher&& other) noexcept;
    auto operator=(Hasher&& other) noexcept -> Hasher&;

    Hasher(Hasher const& other) noexcept = delete;
    auto operator=(Hasher const& other) noexcept -> Hasher& = delete;
    ~Hasher() noexcept;

    /// \brief Feed data to the hasher.
    [[nodiscard]] auto Update(std::string const& data) noexcept -> bool;

    /// \brief Finalize hash.
    [[nodiscard]] auto Finalize() && noexcept -> std::optional<HashDigest>;

    /// \brief Obtain length of the resulting hex string.
    [[nodiscard]] auto GetHashLength() const noexcept -> std::size_t;

    /// \brief Length of the hex string of the given algorithm.
    [[nodiscard]] static auto HexLength(HashType type) noexcept -> std::size_t;

  private:
    std::unique_ptr<ShaContext> sha_ctx_;

    explicit Hasher(std::unique_ptr<ShaContext> sha_ctx) noexcept;
};

#endif  // INCLUDED_SRC_REGCOORD_CRYPTO_HASHER_HPP
