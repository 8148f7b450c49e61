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

#ifndef INCLUDED_SRC_TEST_UTILS_REGISTRY_IMAGE_CREATOR_HPP
#define INCLUDED_SRC_TEST_UTILS_REGISTRY_IMAGE_CREATOR_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "nlohmann/json.hpp"
#include "src/regcoord/common/digest.hpp"
#include "src/regcoord/storage/manifest.hpp"

/// \brief Content together with its digest.
struct TestBlob {
    Digest digest;
    std::string content;
};

[[nodiscard]] static inline auto CreateTestBlob(std::string content)
    -> TestBlob {
    auto digest = Digest::Compute(content);
    return TestBlob{*digest, std::move(content)};
}

[[nodiscard]] static inline auto Describe(TestBlob const& blob,
                                          std::string const& content_type)
    -> nlohmann::json {
    return nlohmann::json{{"mediaType", content_type},
                          {"digest", blob.digest.ToString()},
                          {"size", static_cast<std::int64_t>(blob.content.size())}};
}

/// \brief OCI image manifest over a config and layers. Foreign layers are
/// given urls and need not be stored.
[[nodiscard]] static inline auto CreateImageManifest(
    TestBlob const& config,
    std::vector<TestBlob> const& layers,
    std::vector<TestBlob> const& foreign_layers = {}) -> TestBlob {
    auto layer_list = nlohmann::json::array();
    for (auto const& layer : layers) {
        layer_list.push_back(
            Describe(layer, "application/vnd.oci.image.layer.v1.tar+gzip"));
    }
    for (auto const& layer : foreign_layers) {
        auto entry = Describe(
            layer, "application/vnd.oci.image.layer.nondistributable.v1.tar");
        entry["urls"] = nlohmann::json::array({"https://example.com/layer"});
        layer_list.push_back(std::move(entry));
    }
    nlohmann::json manifest{
        {"schemaVersion", 2},
        {"mediaType", media_type::kOciManifest},
        {"config",
         Describe(config, "application/vnd.oci.image.config.v1+json")},
        {"layers", layer_list}};
    return CreateTestBlob(manifest.dump());
}

/// \brief OCI image index over image manifests.
[[nodiscard]] static inline auto CreateImageIndex(
    std::vector<TestBlob> const& manifests) -> TestBlob {
    auto manifest_list = nlohmann::json::array();
    for (auto const& manifest : manifests) {
        manifest_list.push_back(Describe(manifest, media_type::kOciManifest));
    }
    nlohmann::json index{{"schemaVersion", 2},
                         {"mediaType", media_type::kOciIndex},
                         {"manifests", manifest_list}};
    return CreateTestBlob(index.dump());
}

/// \brief A complete single-platform image.
struct TestImage {
    TestBlob config;
    std::vector<TestBlob> layers;
    TestBlob manifest;
};

[[nodiscard]] static inline auto CreateTestImage(std::string const& name,
                                                 std::size_t layer_count = 2)
    -> TestImage {
    auto config =
        CreateTestBlob(nlohmann::json{{"architecture", "amd64"},
                                      {"os", "linux"},
                                      {"name", name}}
                           .dump());
    std::vector<TestBlob> layers{};
    for (std::size_t i = 0; i < layer_count; ++i) {
        layers.emplace_back(CreateTestBlob(name + " layer " + std::to_string(i)));
    }
    auto manifest = CreateImageManifest(config, layers);
    return TestImage{std::move(config), std::move(layers), std::move(manifest)};
}

#endif  // INCLUDED_SRC_TEST_UTILS_REGISTRY_IMAGE_CREATOR_HPP
