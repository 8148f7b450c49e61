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

#include "src/regcoord/main/config_reader.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>

#include "fmt/core.h"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/storage/config.hpp"
#include "src/regcoord/upstream/http_upstream_registry.hpp"
#include "src/regcoord/upstream/retry_config.hpp"

namespace {

using Result = expected<std::monostate, std::string>;

[[nodiscard]] auto Section(nlohmann::json const& config,
                           std::string const& name)
    -> expected<nlohmann::json, std::string> {
    auto const it = config.find(name);
    if (it == config.end() or it->is_null()) {
        return nlohmann::json::object();
    }
    if (not it->is_object()) {
        return unexpected{fmt::format(
            "Configuration section {} has to be an object, but found {}",
            name,
            it->dump())};
    }
    return *it;
}

/// \brief Lookup a key of a section; absent and null keys are not set.
[[nodiscard]] auto Lookup(nlohmann::json const& section, std::string const& key)
    -> std::optional<nlohmann::json> {
    auto const it = section.find(key);
    if (it == section.end() or it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

template <class T>
[[nodiscard]] auto ReadNumber(nlohmann::json const& section,
                              std::string const& name,
                              std::string const& key,
                              std::optional<T>* const target) -> Result {
    auto value = Lookup(section, key);
    if (not value or target->has_value()) {
        return std::monostate{};
    }
    if (not value->is_number_unsigned() or
        value->get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return unexpected{fmt::format(
            "Configuration-file specified {}.{} has to be a non-negative "
            "number, but found {}",
            name,
            key,
            value->dump())};
    }
    *target = static_cast<T>(value->get<std::uint64_t>());
    return std::monostate{};
}

[[nodiscard]] auto ReadString(
    nlohmann::json const& section,
    std::string const& name,
    std::string const& key,
    gsl::not_null<std::optional<std::string>*> const& target) -> Result {
    auto value = Lookup(section, key);
    if (not value or target->has_value()) {
        return std::monostate{};
    }
    if (not value->is_string()) {
        return unexpected{fmt::format(
            "Configuration-file specified {}.{} has to be a string, but "
            "found {}",
            name,
            key,
            value->dump())};
    }
    *target = value->get<std::string>();
    return std::monostate{};
}

[[nodiscard]] auto ToPath(nlohmann::json const& value,
                          std::string const& what,
                          std::filesystem::path const& base_dir)
    -> expected<std::filesystem::path, std::string> {
    if (not value.is_string() or value.get<std::string>().empty()) {
        return unexpected{fmt::format(
            "Configuration-file specified {} has to be a non-empty path, but "
            "found {}",
            what,
            value.dump())};
    }
    auto path = std::filesystem::path{value.get<std::string>()};
    if (path.is_relative()) {
        path = base_dir / path;
    }
    return path.lexically_normal();
}

[[nodiscard]] auto ReadPath(
    nlohmann::json const& section,
    std::string const& name,
    std::string const& key,
    std::filesystem::path const& base_dir,
    gsl::not_null<std::optional<std::filesystem::path>*> const& target)
    -> Result {
    auto value = Lookup(section, key);
    if (not value or target->has_value()) {
        return std::monostate{};
    }
    auto path = ToPath(*value, fmt::format("{}.{}", name, key), base_dir);
    if (not path) {
        return unexpected{std::move(path).error()};
    }
    *target = *std::move(path);
    return std::monostate{};
}

/// \brief Flags can only be switched on from the configuration.
[[nodiscard]] auto ReadFlag(nlohmann::json const& section,
                            std::string const& name,
                            std::string const& key,
                            gsl::not_null<bool*> const& target) -> Result {
    auto value = Lookup(section, key);
    if (not value) {
        return std::monostate{};
    }
    if (not value->is_boolean()) {
        return unexpected{fmt::format(
            "Configuration-file specified {}.{} has to be a boolean, but "
            "found {}",
            name,
            key,
            value->dump())};
    }
    *target = *target or value->get<bool>();
    return std::monostate{};
}

[[nodiscard]] auto ReadLogLimit(nlohmann::json const& section,
                                gsl::not_null<LogArguments*> const& clargs)
    -> Result {
    auto value = Lookup(section, "limit");
    if (not value or clargs->log_limit) {
        return std::monostate{};
    }
    if (value->is_number_unsigned()) {
        auto const limit = std::min(value->get<std::uint64_t>(),
                                    static_cast<std::uint64_t>(kLastLogLevel));
        clargs->log_limit = ToLogLevel(
            static_cast<std::underlying_type_t<LogLevel>>(limit));
        return std::monostate{};
    }
    if (value->is_string()) {
        if (auto level = ParseLogLevel(value->get<std::string>())) {
            clargs->log_limit = *level;
            return std::monostate{};
        }
    }
    return unexpected{fmt::format(
        "Configuration-file specified logging.limit has to be a number or a "
        "level name, but found {}",
        value->dump())};
}

[[nodiscard]] auto ReadLogging(nlohmann::json const& config,
                               std::filesystem::path const& base_dir,
                               gsl::not_null<LogArguments*> const& clargs)
    -> Result {
    auto section = Section(config, "logging");
    if (not section) {
        return unexpected{std::move(section).error()};
    }
    if (auto files = Lookup(*section, "files")) {
        if (not files->is_array()) {
            return unexpected{fmt::format(
                "Configuration-file specified logging.files has to be a list "
                "of paths, but found {}",
                files->dump())};
        }
        for (auto const& entry : *files) {
            auto path = ToPath(entry, "log file", base_dir);
            if (not path) {
                return unexpected{std::move(path).error()};
            }
            clargs->log_files.emplace_back(*std::move(path));
        }
    }
    for (auto const& result :
         {ReadLogLimit(*section, clargs),
          ReadFlag(*section, "logging", "plain", &clargs->plain_log),
          ReadFlag(*section, "logging", "append", &clargs->log_append),
          ReadPath(*section,
                   "logging",
                   "audit-file",
                   base_dir,
                   &clargs->audit_file)}) {
        if (not result) {
            return result;
        }
    }
    return std::monostate{};
}

}  // namespace

auto ApplyConfiguration(
    nlohmann::json const& config,
    std::filesystem::path const& base_dir,
    gsl::not_null<CommandLineArguments*> const& clargs) noexcept -> Result {
    try {
        if (not config.is_object()) {
            return unexpected{fmt::format(
                "Configuration has to be a JSON object, but found {}",
                config.dump())};
        }
        auto store = Section(config, "store");
        auto locking = Section(config, "locking");
        auto upstream = Section(config, "upstream");
        auto endpoints = Section(config, "endpoints");
        auto gc = Section(config, "gc");
        for (auto const* section :
             {&store, &locking, &upstream, &endpoints, &gc}) {
            if (not *section) {
                return unexpected{section->error()};
            }
        }

        auto* up = &clargs->upstream;
        for (auto const& result : {
                 ReadPath(*store, "store", "root", base_dir, &clargs->store.root),
                 ReadNumber(*store, "store", "max-bytes", &clargs->store.max_bytes),
                 ReadNumber(*locking,
                            "locking",
                            "wait-timeout-ms",
                            &clargs->lock.wait_timeout_ms),
                 ReadNumber(*locking,
                            "locking",
                            "lease-grace-ms",
                            &clargs->lock.lease_grace_ms),
                 ReadString(*upstream, "upstream", "url", &up->url),
                 ReadNumber(
                     *upstream, "upstream", "max-attempts", &up->max_attempts),
                 ReadNumber(*upstream,
                            "upstream",
                            "initial-backoff-ms",
                            &up->initial_backoff_ms),
                 ReadNumber(*upstream,
                            "upstream",
                            "max-backoff-ms",
                            &up->max_backoff_ms),
                 ReadNumber(*upstream, "upstream", "timeout-ms", &up->timeout_ms),
                 ReadNumber(*upstream,
                            "upstream",
                            "tag-ttl-seconds",
                            &up->tag_ttl_seconds),
                 ReadPath(
                     *upstream, "upstream", "ca-bundle", base_dir, &up->ca_bundle),
                 ReadFlag(
                     *upstream, "upstream", "no-ssl-verify", &up->no_ssl_verify),
                 ReadString(
                     *endpoints, "endpoints", "mirror", &clargs->endpoint.mirror),
                 ReadString(
                     *endpoints, "endpoints", "local", &clargs->endpoint.local),
                 ReadNumber(*gc,
                            "gc",
                            "interval-seconds",
                            &clargs->gc.interval_seconds),
                 ReadNumber(*gc,
                            "gc",
                            "lease-timeout-ms",
                            &clargs->lock.lease_timeout_ms),
                 ReadLogging(config, base_dir, &clargs->log)}) {
            if (not result) {
                return result;
            }
        }
        return std::monostate{};
    } catch (std::exception const& e) {
        return unexpected{
            fmt::format("Reading configuration failed with:\n{}", e.what())};
    }
}

auto ReadConfigurationFile(
    std::filesystem::path const& file,
    gsl::not_null<CommandLineArguments*> const& clargs) noexcept -> Result {
    auto content = FileSystemManager::ReadFile(file);
    if (not content) {
        return unexpected{fmt::format(
            "Cannot read configuration file {}", file.string())};
    }
    nlohmann::json config{};
    try {
        config = nlohmann::json::parse(*content);
    } catch (std::exception const& e) {
        return unexpected{fmt::format("Parsing configuration file {} failed "
                                      "with:\n{}",
                                      file.string(),
                                      e.what())};
    }
    std::filesystem::path base_dir{};
    try {
        base_dir = std::filesystem::absolute(file).parent_path();
    } catch (std::exception const& e) {
        return unexpected{fmt::format(
            "Cannot resolve configuration file {}:\n{}", file.string(), e.what())};
    }
    return ApplyConfiguration(config, base_dir, clargs);
}

auto CreateCoordinatorOptions(CommandLineArguments const& clargs) noexcept
    -> expected<CoordinatorOptions, std::string> {
    auto store = StoreConfig::Builder{}
                     .SetRoot(clargs.store.root.value_or(""))
                     .SetMaxBytes(clargs.store.max_bytes)
                     .Build();
    if (not store) {
        return unexpected{std::move(store).error()};
    }

    auto retry = RetryConfig::Builder{}
                     .SetInitialBackoffMs(clargs.upstream.initial_backoff_ms)
                     .SetMaxBackoffMs(clargs.upstream.max_backoff_ms)
                     .SetMaxAttempts(clargs.upstream.max_attempts)
                     .Build();
    if (not retry) {
        return unexpected{std::move(retry).error()};
    }

    LockManager::Options locking{};
    if (clargs.lock.wait_timeout_ms) {
        locking.wait_timeout =
            std::chrono::milliseconds{*clargs.lock.wait_timeout_ms};
    }
    if (clargs.lock.lease_grace_ms) {
        locking.lease_grace =
            std::chrono::milliseconds{*clargs.lock.lease_grace_ms};
    }
    if (clargs.lock.lease_timeout_ms) {
        locking.lease_timeout =
            std::chrono::milliseconds{*clargs.lock.lease_timeout_ms};
    }

    IUpstreamRegistry::Ptr upstream{};
    if (clargs.upstream.url) {
        auto config = UpstreamConfig::Builder{}
                          .SetUrl(clargs.upstream.url)
                          .SetNoSslVerify(clargs.upstream.no_ssl_verify)
                          .SetCaBundle(clargs.upstream.ca_bundle)
                          .SetTimeoutMs(clargs.upstream.timeout_ms)
                          .Build();
        if (not config) {
            return unexpected{std::move(config).error()};
        }
        try {
            upstream =
                std::make_shared<HttpUpstreamRegistry>(*std::move(config));
        } catch (std::exception const& e) {
            return unexpected{fmt::format(
                "Creating upstream registry failed with:\n{}", e.what())};
        }
    }

    return CoordinatorOptions{
        .store = *std::move(store),
        .locking = locking,
        .upstream = std::move(upstream),
        .retry = *retry,
        .tag_ttl = clargs.upstream.tag_ttl_seconds
                       ? std::chrono::seconds{*clargs.upstream.tag_ttl_seconds}
                       : kDefaultTagTtl,
        .mirror_endpoint = clargs.endpoint.mirror,
        .local_endpoint = clargs.endpoint.local,
        .gc_interval =
            std::chrono::seconds{clargs.gc.interval_seconds.value_or(0)},
        .audit_file = clargs.log.audit_file};
}
