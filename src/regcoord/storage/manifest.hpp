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

#ifndef INCLUDED_SRC_REGCOORD_STORAGE_MANIFEST_HPP
#define INCLUDED_SRC_REGCOORD_STORAGE_MANIFEST_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/common/error.hpp"
#include "src/utils/cpp/expected.hpp"

namespace media_type {
inline constexpr auto kOciManifest = "application/vnd.oci.image.manifest.v1+json";
inline constexpr auto kOciIndex = "application/vnd.oci.image.index.v1+json";
inline constexpr auto kDockerManifest =
    "application/vnd.docker.distribution.manifest.v2+json";
inline constexpr auto kDockerManifestList =
    "application/vnd.docker.distribution.manifest.list.v2+json";
}  // namespace media_type

/// \brief Reference from a manifest to a blob or child manifest.
struct Descriptor {
    Digest digest;
    std::string media_type;
    std::int64_t size{};
    // Foreign layers are fetched from their urls by clients and are not
    // required to be present in the store.
    bool foreign{};
};

/// \brief Parsed image manifest or image index.
class Manifest final {
  public:
    enum class Kind : std::uint8_t { Image, Index };

    /// \brief Parse manifest content. The media type is taken from the
    /// document, or from content_type if the document does not declare one.
    /// \returns the manifest or an InvalidManifest error.
    [[nodiscard]] static auto Parse(
        std::string const& content,
        std::optional<std::string> const& content_type = std::nullopt) noexcept
        -> expected<Manifest, Error>;

    /// \brief Registry Accept header value listing all supported types.
    [[nodiscard]] static auto AcceptedMediaTypes() -> std::string;

    [[nodiscard]] static auto IsSupportedMediaType(
        std::string const& media_type) noexcept -> bool;

    [[nodiscard]] auto GetKind() const noexcept -> Kind { return kind_; }

    [[nodiscard]] auto MediaType() const& noexcept -> std::string const& {
        return media_type_;
    }

    /// \brief Config blob of an image manifest.
    [[nodiscard]] auto Config() const& noexcept
        -> std::optional<Descriptor> const& {
        return config_;
    }

    /// \brief Layers of an image manifest.
    [[nodiscard]] auto Layers() const& noexcept
        -> std::vector<Descriptor> const& {
        return layers_;
    }

    /// \brief Child manifests of an index.
    [[nodiscard]] auto Manifests() const& noexcept
        -> std::vector<Descriptor> const& {
        return manifests_;
    }

    /// \brief Digests that must be present in the store before this manifest
    /// may be linked: config and non-foreign layers, or child manifests.
    /// Sorted and without duplicates.
    [[nodiscard]] auto RequiredDigests() const -> std::vector<Digest>;

    /// \brief All digests referenced, foreign layers included. Sorted and
    /// without duplicates.
    [[nodiscard]] auto AllDigests() const -> std::vector<Digest>;

  private:
    Kind kind_{Kind::Image};
    std::string media_type_;
    std::optional<Descriptor> config_;
    std::vector<Descriptor> layers_;
    std::vector<Descriptor> manifests_;

    Manifest() = default;
};

#endif  // INCLUDED_SRC_REGCOORD_STORAGE_MANIFEST_HPP
