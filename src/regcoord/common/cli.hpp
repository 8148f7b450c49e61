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

#ifndef INCLUDED_SRC_REGCOORD_COMMON_CLI_HPP
#define INCLUDED_SRC_REGCOORD_COMMON_CLI_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include "CLI/CLI.hpp"
#include "fmt/core.h"
#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"

/// \brief Arguments common to all commands.
struct CommonArguments {
    std::optional<std::filesystem::path> config_file;
};

/// \brief Arguments used for logging.
struct LogArguments {
    std::vector<std::filesystem::path> log_files;
    std::optional<LogLevel> log_limit;
    std::optional<LogLevel> restrict_stderr_log_limit;
    bool plain_log{false};
    bool log_append{false};
    std::optional<std::filesystem::path> audit_file;
};

/// \brief Location and capacity of the shared store.
struct StoreArguments {
    std::optional<std::filesystem::path> root;
    std::optional<std::uintmax_t> max_bytes;
};

/// \brief Bounds of lock waits.
struct LockArguments {
    std::optional<unsigned int> wait_timeout_ms;
    std::optional<unsigned int> lease_grace_ms;
    std::optional<unsigned int> lease_timeout_ms;
};

/// \brief Upstream registry of the mirror facet.
struct UpstreamArguments {
    std::optional<std::string> url;
    std::optional<unsigned int> max_attempts;
    std::optional<unsigned int> initial_backoff_ms;
    std::optional<unsigned int> max_backoff_ms;
    std::optional<unsigned int> timeout_ms;
    std::optional<unsigned int> tag_ttl_seconds;
    std::optional<std::filesystem::path> ca_bundle;
    bool no_ssl_verify{false};
};

/// \brief Listen addresses requests are routed by.
struct EndpointArguments {
    std::optional<std::string> mirror;
    std::optional<std::string> local;
};

/// \brief Arguments for garbage collection.
struct GcArguments {
    std::optional<unsigned int> interval_seconds;
    bool dry_run{false};
};

/// \brief Arguments of the registry request commands.
struct RequestArguments {
    std::string repository;
    std::string reference;
    std::optional<std::filesystem::path> input;
    std::optional<std::filesystem::path> output;
    std::optional<std::string> content_type;
    std::optional<std::string> facet;
    std::optional<std::size_t> chunk_size;
};

static inline auto SetupCommonArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommonArguments*> const& clargs) {
    app->add_option("-C,--config",
                    clargs->config_file,
                    "Path to the JSON configuration file.")
        ->type_name("PATH");
}

static inline auto SetupLogArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<LogArguments*> const& clargs) {
    app->add_option_function<std::string>(
           "-f,--log-file",
           [clargs](auto const& log_file_) {
               clargs->log_files.emplace_back(log_file_);
           },
           "Path to local log file.")
        ->type_name("PATH")
        ->trigger_on_parse();  // run callback on all instances while parsing,
                               // not after all parsing is done
    app->add_option_function<std::underlying_type_t<LogLevel>>(
           "--log-limit",
           [clargs](auto const& limit) {
               clargs->log_limit = ToLogLevel(limit);
           },
           fmt::format("Log limit (higher is more verbose) in interval [{},{}] "
                       "(Default: {}).",
                       static_cast<int>(kFirstLogLevel),
                       static_cast<int>(kLastLogLevel),
                       static_cast<int>(kDefaultLogLevel)))
        ->type_name("NUM");
    app->add_option_function<std::underlying_type_t<LogLevel>>(
           "--restrict-stderr-log-limit",
           [clargs](auto const& limit) {
               clargs->restrict_stderr_log_limit = ToLogLevel(limit);
           },
           "Restrict logging on console to the minimum of the specified "
           "--log-limit and this value")
        ->type_name("NUM");
    app->add_flag("--plain-log",
                  clargs->plain_log,
                  "Do not use ANSI escape sequences to highlight messages.");
    app->add_flag(
        "--log-append",
        clargs->log_append,
        "Append messages to log file instead of overwriting existing.");
    app->add_option("--audit-file",
                    clargs->audit_file,
                    "Append corruption and quarantine events to this file.")
        ->type_name("PATH");
}

static inline auto SetupStoreArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<StoreArguments*> const& clargs) {
    app->add_option(
           "--store", clargs->root, "Root directory of the shared store.")
        ->type_name("PATH");
    app->add_option("--max-bytes",
                    clargs->max_bytes,
                    "Maximal number of bytes stored in blobs (Default: "
                    "unlimited).")
        ->type_name("NUM");
}

static inline auto SetupLockArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<LockArguments*> const& clargs) {
    app->add_option("--wait-timeout-ms",
                    clargs->wait_timeout_ms,
                    "Maximal time to wait for a lock (Default: 10000).")
        ->type_name("NUM");
    app->add_option("--lease-grace-ms",
                    clargs->lease_grace_ms,
                    "Time after which queued requests pass a pending garbage "
                    "collection lease (Default: 2000).")
        ->type_name("NUM");
    app->add_option("--lease-timeout-ms",
                    clargs->lease_timeout_ms,
                    "Maximal time to wait for the garbage collection lease "
                    "(Default: 60000).")
        ->type_name("NUM");
}

static inline auto SetupUpstreamArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<UpstreamArguments*> const& clargs) {
    app->add_option("--upstream",
                    clargs->url,
                    "Base URL of the registry the mirror pulls through from.")
        ->type_name("URL");
    app->add_option("--max-attempts",
                    clargs->max_attempts,
                    "Total number of attempts of an upstream fetch. Must be "
                    "greater than 0. (Default: 3)")
        ->type_name("NUM");
    app->add_option("--initial-backoff-ms",
                    clargs->initial_backoff_ms,
                    "Initial time to wait before retrying an upstream fetch. "
                    "The waiting time is doubled at each attempt. (Default: "
                    "200)")
        ->type_name("NUM");
    app->add_option("--max-backoff-ms",
                    clargs->max_backoff_ms,
                    "The backoff time cannot be bigger than this parameter. "
                    "Some jitter is still added. (Default: 5000)")
        ->type_name("NUM");
    app->add_option("--upstream-timeout-ms",
                    clargs->timeout_ms,
                    "Maximal duration of a single upstream transfer "
                    "(Default: 300000).")
        ->type_name("NUM");
    app->add_option("--tag-ttl-seconds",
                    clargs->tag_ttl_seconds,
                    "Time a mirrored tag is served without asking the "
                    "upstream (Default: 300).")
        ->type_name("NUM");
    app->add_option("--ca-bundle",
                    clargs->ca_bundle,
                    "CA bundle to verify the upstream with.")
        ->type_name("PATH");
    app->add_flag("--no-ssl-verify",
                  clargs->no_ssl_verify,
                  "Do not verify the TLS certificate of the upstream.");
}

static inline auto SetupEndpointArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<EndpointArguments*> const& clargs) {
    app->add_option("--mirror-endpoint",
                    clargs->mirror,
                    "Listen address of the mirror facet.")
        ->type_name("HOST:PORT");
    app->add_option("--local-endpoint",
                    clargs->local,
                    "Listen address of the local facet.")
        ->type_name("HOST:PORT");
}

static inline auto SetupGcArguments(gsl::not_null<CLI::App*> const& app,
                                    gsl::not_null<GcArguments*> const& args) {
    app->add_flag("--dry-run",
                  args->dry_run,
                  "Only report what would be removed.");
}

static inline auto SetupRepositoryArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RequestArguments*> const& clargs) {
    app->add_option("-r,--repository", clargs->repository, "Repository name.")
        ->type_name("NAME")
        ->required();
    app->add_option("--facet",
                    clargs->facet,
                    "Facet to serve the request (mirror or local).")
        ->type_name("FACET")
        ->check(CLI::IsMember({"mirror", "local"}));
}

static inline auto SetupReferenceArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RequestArguments*> const& clargs,
    std::string const& description) {
    app->add_option("reference", clargs->reference, description)
        ->type_name("REF")
        ->required();
}

static inline auto SetupInputArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RequestArguments*> const& clargs) {
    app->add_option("-i,--input",
                    clargs->input,
                    "File to read the content from (Default: stdin).")
        ->type_name("PATH");
}

static inline auto SetupOutputArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<RequestArguments*> const& clargs) {
    app->add_option("-o,--output",
                    clargs->output,
                    "File to write the content to (Default: stdout).")
        ->type_name("PATH");
}

#endif  // INCLUDED_SRC_REGCOORD_COMMON_CLI_HPP
