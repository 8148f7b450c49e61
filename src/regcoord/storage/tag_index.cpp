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

#include "src/regcoord/storage/tag_index.hpp"

#include <exception>

#include "fmt/core.h"
#include "nlohmann/json.hpp"

auto TagIndex::FromJson(std::string const& content) noexcept
    -> expected<TagIndex, std::string> {
    try {
        auto json = nlohmann::json::parse(content);
        if (not json.is_object()) {
            return unexpected{std::string{"tag index is not a JSON object"}};
        }
        TagIndex index{};
        if (auto tags = json.find("tags"); tags != json.end()) {
            if (not tags->is_object()) {
                return unexpected{std::string{"tags is not an object"}};
            }
            for (auto const& [tag, entry] : tags->items()) {
                auto digest =
                    Digest::Parse(entry.at("digest").get<std::string>());
                if (not digest) {
                    return unexpected{fmt::format(
                        "tag {}: {}", tag, digest.error().message)};
                }
                index.tags_.emplace(
                    tag,
                    TagEntry{.digest = *digest,
                             .updated = entry.value("updated", std::int64_t{})});
            }
        }
        if (auto linked = json.find("manifests"); linked != json.end()) {
            if (not linked->is_array()) {
                return unexpected{std::string{"manifests is not a list"}};
            }
            for (auto const& entry : *linked) {
                auto digest = Digest::Parse(entry.get<std::string>());
                if (not digest) {
                    return unexpected{fmt::format("linked manifest: {}",
                                                  digest.error().message)};
                }
                index.linked_.insert(*digest);
            }
        }
        return index;
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("malformed tag index JSON: {}", e.what())};
    }
}

auto TagIndex::ToJson() const -> std::string {
    auto tags = nlohmann::json::object();
    for (auto const& [tag, entry] : tags_) {
        tags[tag] = nlohmann::json{{"digest", entry.digest.ToString()},
                                   {"updated", entry.updated}};
    }
    auto linked = nlohmann::json::array();
    for (auto const& digest : linked_) {
        linked.push_back(digest.ToString());
    }
    return nlohmann::json{{"tags", tags}, {"manifests", linked}}.dump(2);
}

auto TagIndex::Resolve(std::string const& tag) const
    -> std::optional<TagEntry> {
    auto it = tags_.find(tag);
    if (it == tags_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void TagIndex::SetTag(std::string const& tag,
                      Digest const& digest,
                      std::int64_t now) {
    tags_.insert_or_assign(tag, TagEntry{.digest = digest, .updated = now});
}

auto TagIndex::RemoveTag(std::string const& tag) -> bool {
    return tags_.erase(tag) > 0;
}

void TagIndex::Link(Digest const& digest) { linked_.insert(digest); }

auto TagIndex::TagNames() const -> std::vector<std::string> {
    std::vector<std::string> names{};
    names.reserve(tags_.size());
    for (auto const& [tag, entry] : tags_) {
        names.push_back(tag);
    }
    return names;
}

auto TagIndex::Roots() const -> std::set<Digest> {
    auto roots = linked_;
    for (auto const& [tag, entry] : tags_) {
        roots.insert(entry.digest);
    }
    return roots;
}
