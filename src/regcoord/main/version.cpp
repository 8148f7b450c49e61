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

#include "src/regcoord/main/version.hpp"

#include <cstddef>
#include <string>

#include "src/regcoord/storage/manifest.hpp"

namespace {

// Bumped whenever the directory layout below the store root changes.
constexpr std::size_t kStoreLayoutVersion = 1;

}  // namespace

auto VersionInfo() -> nlohmann::json {
    std::size_t major = 0;
    std::size_t minor = 3;
    std::size_t revision = 0;
    std::string suffix{};
#ifdef VERSION_EXTRA_SUFFIX
    suffix += VERSION_EXTRA_SUFFIX;
#endif

    auto info = nlohmann::json{{"name", "regcoord"},
                               {"version", {major, minor, revision}},
                               {"suffix", suffix},
                               {"store-layout", kStoreLayoutVersion},
                               {"digest-algorithms",
                                nlohmann::json::array({"sha256"})},
                               {"media-types",
                                {media_type::kOciManifest,
                                 media_type::kOciIndex,
                                 media_type::kDockerManifest,
                                 media_type::kDockerManifestList}}};
#ifdef SOURCE_DATE_EPOCH
    info["SOURCE_DATE_EPOCH"] = static_cast<std::size_t>(SOURCE_DATE_EPOCH);
#else
    info["SOURCE_DATE_EPOCH"] = nullptr;
#endif
    return info;
}

auto version() -> std::string {
    return VersionInfo().dump(2);
}
