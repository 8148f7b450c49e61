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

#ifndef INCLUDED_SRC_REGCOORD_STORAGE_TAG_INDEX_HPP
#define INCLUDED_SRC_REGCOORD_STORAGE_TAG_INDEX_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "src/regcoord/common/digest.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Manifest a tag points to, with the time the tag was last written
/// in seconds since the epoch.
struct TagEntry {
    Digest digest;
    std::int64_t updated{};
};

/// \brief Content of a repository's tag index file. Besides the tags it
/// records the manifests pushed by digest ("linked" manifests); both are
/// roots for garbage collection.
class TagIndex final {
  public:
    [[nodiscard]] static auto FromJson(std::string const& content) noexcept
        -> expected<TagIndex, std::string>;

    [[nodiscard]] auto ToJson() const -> std::string;

    [[nodiscard]] auto Resolve(std::string const& tag) const
        -> std::optional<TagEntry>;

    void SetTag(std::string const& tag, Digest const& digest, std::int64_t now);

    /// \brief Remove a tag.
    /// \returns false if the tag did not exist.
    [[nodiscard]] auto RemoveTag(std::string const& tag) -> bool;

    void Link(Digest const& digest);

    [[nodiscard]] auto Tags() const& noexcept
        -> std::map<std::string, TagEntry> const& {
        return tags_;
    }

    [[nodiscard]] auto Linked() const& noexcept -> std::set<Digest> const& {
        return linked_;
    }

    /// \brief Sorted tag names.
    [[nodiscard]] auto TagNames() const -> std::vector<std::string>;

    /// \brief Manifests reachable directly from this repository.
    [[nodiscard]] auto Roots() const -> std::set<Digest>;

    [[nodiscard]] auto Empty() const noexcept -> bool {
        return tags_.empty() and linked_.empty();
    }

  private:
    std::map<std::string, TagEntry> tags_;
    std::set<Digest> linked_;
};

#endif  // INCLUDED_SRC_REGCOORD_STORAGE_TAG_INDEX_HPP
