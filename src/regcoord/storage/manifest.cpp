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

#include "src/regcoord/storage/manifest.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "fmt/core.h"
#include "nlohmann/json.hpp"

namespace {

inline constexpr int kSchemaVersion = 2;

[[nodiscard]] auto KindOf(std::string const& media_type)
    -> std::optional<Manifest::Kind> {
    if (media_type == media_type::kOciManifest or
        media_type == media_type::kDockerManifest) {
        return Manifest::Kind::Image;
    }
    if (media_type == media_type::kOciIndex or
        media_type == media_type::kDockerManifestList) {
        return Manifest::Kind::Index;
    }
    return std::nullopt;
}

[[nodiscard]] auto ParseDescriptor(nlohmann::json const& json,
                                   std::string const& context)
    -> expected<Descriptor, Error> {
    if (not json.is_object()) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("{} is not an object", context));
    }
    auto digest_it = json.find("digest");
    if (digest_it == json.end() or not digest_it->is_string()) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("{} lacks a digest", context));
    }
    auto digest = Digest::Parse(digest_it->get<std::string>());
    if (not digest) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("{} has an invalid digest: {}",
                                     context,
                                     digest.error().message));
    }
    auto size_it = json.find("size");
    if (size_it == json.end() or not size_it->is_number_integer() or
        size_it->get<std::int64_t>() < 0) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("{} lacks a valid size", context));
    }
    auto urls_it = json.find("urls");
    bool foreign = urls_it != json.end() and urls_it->is_array() and
                   not urls_it->empty();
    return Descriptor{.digest = *digest,
                      .media_type = json.value("mediaType", std::string{}),
                      .size = size_it->get<std::int64_t>(),
                      .foreign = foreign};
}

[[nodiscard]] auto SortedUnique(std::vector<Digest> digests)
    -> std::vector<Digest> {
    std::sort(digests.begin(), digests.end());
    digests.erase(std::unique(digests.begin(), digests.end()), digests.end());
    return digests;
}

}  // namespace

auto Manifest::IsSupportedMediaType(std::string const& media_type) noexcept
    -> bool {
    return KindOf(media_type).has_value();
}

auto Manifest::Parse(std::string const& content,
                     std::optional<std::string> const& content_type) noexcept
    -> expected<Manifest, Error> {
    try {
        auto json = nlohmann::json::parse(content);
        if (not json.is_object()) {
            return MakeError(ErrorCode::InvalidManifest,
                             "manifest is not a JSON object");
        }
        auto version = json.find("schemaVersion");
        if (version == json.end() or not version->is_number_integer() or
            version->get<int>() != kSchemaVersion) {
            return MakeError(ErrorCode::InvalidManifest,
                             fmt::format("schemaVersion must be {}",
                                         kSchemaVersion));
        }

        Manifest manifest{};
        auto declared = json.find("mediaType");
        if (declared != json.end()) {
            if (not declared->is_string()) {
                return MakeError(ErrorCode::InvalidManifest,
                                 "mediaType is not a string");
            }
            manifest.media_type_ = declared->get<std::string>();
            if (content_type and not content_type->empty() and
                *content_type != manifest.media_type_) {
                return MakeError(
                    ErrorCode::InvalidManifest,
                    fmt::format("content type {} does not match media type {}",
                                *content_type,
                                manifest.media_type_));
            }
        }
        else if (content_type and not content_type->empty()) {
            manifest.media_type_ = *content_type;
        }
        else if (json.contains("manifests")) {
            manifest.media_type_ = media_type::kOciIndex;
        }
        else {
            manifest.media_type_ = media_type::kOciManifest;
        }

        auto kind = KindOf(manifest.media_type_);
        if (not kind) {
            return MakeError(ErrorCode::InvalidManifest,
                             fmt::format("unsupported manifest media type {}",
                                         manifest.media_type_));
        }
        manifest.kind_ = *kind;

        if (manifest.kind_ == Kind::Image) {
            auto config = json.find("config");
            if (config == json.end()) {
                return MakeError(ErrorCode::InvalidManifest,
                                 "image manifest lacks a config");
            }
            auto descriptor = ParseDescriptor(*config, "config");
            if (not descriptor) {
                return unexpected{descriptor.error()};
            }
            manifest.config_ = *descriptor;

            auto layers = json.find("layers");
            if (layers == json.end() or not layers->is_array()) {
                return MakeError(ErrorCode::InvalidManifest,
                                 "image manifest lacks a layers list");
            }
            for (std::size_t i = 0; i < layers->size(); ++i) {
                auto layer =
                    ParseDescriptor(layers->at(i), fmt::format("layer {}", i));
                if (not layer) {
                    return unexpected{layer.error()};
                }
                manifest.layers_.emplace_back(*std::move(layer));
            }
        }
        else {
            auto children = json.find("manifests");
            if (children == json.end() or not children->is_array()) {
                return MakeError(ErrorCode::InvalidManifest,
                                 "index lacks a manifests list");
            }
            for (std::size_t i = 0; i < children->size(); ++i) {
                auto child = ParseDescriptor(children->at(i),
                                             fmt::format("manifest {}", i));
                if (not child) {
                    return unexpected{child.error()};
                }
                manifest.manifests_.emplace_back(*std::move(child));
            }
        }
        return manifest;
    } catch (nlohmann::json::exception const& e) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("malformed manifest JSON: {}", e.what()));
    } catch (std::exception const& e) {
        return MakeError(ErrorCode::InvalidManifest,
                         fmt::format("parsing manifest failed: {}", e.what()));
    }
}

auto Manifest::AcceptedMediaTypes() -> std::string {
    return fmt::format("{}, {}, {}, {}",
                       media_type::kOciManifest,
                       media_type::kOciIndex,
                       media_type::kDockerManifest,
                       media_type::kDockerManifestList);
}

auto Manifest::RequiredDigests() const -> std::vector<Digest> {
    std::vector<Digest> digests{};
    if (config_) {
        digests.push_back(config_->digest);
    }
    for (auto const& layer : layers_) {
        if (not layer.foreign) {
            digests.push_back(layer.digest);
        }
    }
    for (auto const& child : manifests_) {
        digests.push_back(child.digest);
    }
    return SortedUnique(std::move(digests));
}

auto Manifest::AllDigests() const -> std::vector<Digest> {
    std::vector<Digest> digests{};
    if (config_) {
        digests.push_back(config_->digest);
    }
    for (auto const& layer : layers_) {
        digests.push_back(layer.digest);
    }
    for (auto const& child : manifests_) {
        digests.push_back(child.digest);
    }
    return SortedUnique(std::move(digests));
}
