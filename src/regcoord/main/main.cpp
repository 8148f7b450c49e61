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

#include <cstddef>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "gsl/gsl"
#include "nlohmann/json.hpp"
#include "src/regcoord/coordinator/coordinator.hpp"
#include "src/regcoord/coordinator/registry_response.hpp"
#include "src/regcoord/coordinator/request.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/logging/log_config.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/log_sink_cmdline.hpp"
#include "src/regcoord/logging/log_sink_file.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/main/cli.hpp"
#include "src/regcoord/main/config_reader.hpp"
#include "src/regcoord/main/exit_codes.hpp"
#include "src/regcoord/main/version.hpp"

namespace {

void SetupDefaultLogging() {
    LogConfig::SetLogLimit(kDefaultLogLevel);
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory()});
}

void SetupLogging(LogArguments const& clargs) {
    LogConfig::SetLogLimit(clargs.log_limit.value_or(kDefaultLogLevel));
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(
        not clargs.plain_log, clargs.restrict_stderr_log_limit)});
    for (auto const& log_file : clargs.log_files) {
        LogConfig::AddSink(LogSinkFile::CreateFactory(
            log_file,
            clargs.log_append ? LogSinkFile::Mode::Append
                              : LogSinkFile::Mode::Overwrite));
    }
}

[[nodiscard]] auto ExitCode(Error const& error) noexcept -> int {
    return error.IsRetryable() ? kExitRetryable : kExitFailure;
}

[[nodiscard]] auto ReadInput(std::optional<std::filesystem::path> const& file)
    -> std::optional<std::string> {
    if (file) {
        auto content = FileSystemManager::ReadFile(*file);
        if (not content) {
            Logger::Log(LogLevel::Error, "Cannot read {}", file->string());
        }
        return content;
    }
    return std::string{std::istreambuf_iterator<char>{std::cin},
                       std::istreambuf_iterator<char>{}};
}

[[nodiscard]] auto WriteOutput(std::optional<std::filesystem::path> const& file,
                               std::string const& content) -> bool {
    if (file) {
        if (auto err = FileSystemAtomic::WriteFile(*file, content); err != 0) {
            Logger::Log(LogLevel::Error,
                        "Writing {} failed: {}",
                        file->string(),
                        std::strerror(err));
            return false;
        }
        return true;
    }
    std::cout << content << std::flush;
    return true;
}

[[nodiscard]] auto MakeRequest(Operation operation,
                               RequestArguments const& args)
    -> RegistryRequest {
    RegistryRequest request{.operation = operation,
                            .repository = args.repository,
                            .reference = args.reference,
                            .content_type = args.content_type};
    if (args.facet) {
        request.facet = *args.facet == "mirror" ? Facet::Mirror : Facet::Local;
    }
    return request;
}

/// \brief Report a failed response and return the exit code for it.
[[nodiscard]] auto Fail(RegistryResponse const& response) -> int {
    if (response.error) {
        Logger::Log(LogLevel::Error, "{}", response.error->ToString());
        return ExitCode(*response.error);
    }
    Logger::Log(
        LogLevel::Error, "Request failed with status {}", response.status);
    return kExitFailure;
}

/// \brief Push a blob through an upload session, chunk by chunk.
[[nodiscard]] auto PushChunked(
    gsl::not_null<Coordinator*> const& coordinator,
    RequestArguments const& args,
    std::string const& content,
    std::size_t chunk_size) -> RegistryResponse {
    auto started =
        coordinator->Handle(MakeRequest(Operation::StartUpload, args));
    if (not started.IsSuccess()) {
        return started;
    }
    auto uuid = started.Header("Docker-Upload-UUID").value_or("");
    Logger::Log(LogLevel::Debug, "Started upload {}", uuid);

    std::size_t offset = 0;
    while (content.size() - offset > chunk_size) {
        auto patch = MakeRequest(Operation::PatchUpload, args);
        patch.upload_uuid = uuid;
        patch.body = content.substr(offset, chunk_size);
        auto patched = coordinator->Handle(patch);
        if (not patched.IsSuccess()) {
            auto cancel = MakeRequest(Operation::CancelUpload, args);
            cancel.upload_uuid = uuid;
            if (auto cancelled = coordinator->Handle(cancel);
                not cancelled.IsSuccess()) {
                Logger::Log(
                    LogLevel::Warning, "Cancelling upload {} failed", uuid);
            }
            return patched;
        }
        offset += chunk_size;
        Logger::Log(LogLevel::Progress,
                    "Uploaded {} of {} bytes",
                    offset,
                    content.size());
    }

    auto complete = MakeRequest(Operation::CompleteUpload, args);
    complete.upload_uuid = uuid;
    complete.body = content.substr(offset);
    return coordinator->Handle(complete);
}

[[nodiscard]] auto ToJson(GcReport const& report) -> nlohmann::json {
    auto unreachable = nlohmann::json::array();
    for (auto const& digest : report.unreachable) {
        unreachable.push_back(digest.ToString());
    }
    return nlohmann::json{{"dry-run", report.dry_run},
                          {"repositories", report.repositories},
                          {"marked", report.marked},
                          {"removed", report.removed},
                          {"bytes-freed", report.bytes_freed},
                          {"failed", report.failed},
                          {"temporaries", report.temporaries},
                          {"unreachable", unreachable}};
}

[[nodiscard]] auto ToJson(VerifyReport const& report) -> nlohmann::json {
    auto corrupted = nlohmann::json::array();
    for (auto const& digest : report.corrupted) {
        corrupted.push_back(digest.ToString());
    }
    return nlohmann::json{{"checked", report.checked},
                          {"corrupted", corrupted},
                          {"failed", report.failed}};
}

[[nodiscard]] auto Run(gsl::not_null<Coordinator*> const& coordinator,
                       CommandLineArguments const& arguments) -> int {
    auto const& args = arguments.request;
    switch (arguments.cmd) {
        case SubCommand::kPullBlob:
        case SubCommand::kPullManifest:
        case SubCommand::kTags: {
            auto operation = arguments.cmd == SubCommand::kPullBlob
                                 ? Operation::GetBlob
                             : arguments.cmd == SubCommand::kPullManifest
                                 ? Operation::GetManifest
                                 : Operation::ListTags;
            auto response = coordinator->Handle(MakeRequest(operation, args));
            if (not response.IsSuccess()) {
                return Fail(response);
            }
            return WriteOutput(args.output, response.body) ? kExitSuccess
                                                           : kExitFailure;
        }
        case SubCommand::kPushBlob:
        case SubCommand::kPushManifest: {
            auto content = ReadInput(args.input);
            if (not content) {
                return kExitFailure;
            }
            RegistryResponse response{};
            if (arguments.cmd == SubCommand::kPushManifest) {
                auto request = MakeRequest(Operation::PutManifest, args);
                request.body = *std::move(content);
                response = coordinator->Handle(request);
            }
            else if (args.chunk_size) {
                response =
                    PushChunked(coordinator, args, *content, *args.chunk_size);
            }
            else {
                auto request = MakeRequest(Operation::PutBlob, args);
                request.body = *std::move(content);
                response = coordinator->Handle(request);
            }
            if (not response.IsSuccess()) {
                return Fail(response);
            }
            std::cout << response.Header("Docker-Content-Digest").value_or("")
                      << std::endl;
            return kExitSuccess;
        }
        case SubCommand::kDeleteTag: {
            auto response =
                coordinator->Handle(MakeRequest(Operation::DeleteTag, args));
            return response.IsSuccess() ? kExitSuccess : Fail(response);
        }
        case SubCommand::kGc: {
            auto report = coordinator->CollectGarbage(arguments.gc.dry_run);
            if (not report) {
                Logger::Log(LogLevel::Error, "{}", report.error().ToString());
                return ExitCode(report.error());
            }
            std::cout << ToJson(*report).dump(2) << std::endl;
            return report->failed == 0 ? kExitSuccess : kExitFailure;
        }
        case SubCommand::kVerify: {
            auto report = coordinator->Verify();
            if (not report) {
                Logger::Log(LogLevel::Error, "{}", report.error().ToString());
                return ExitCode(report.error());
            }
            std::cout << ToJson(*report).dump(2) << std::endl;
            return report->corrupted.empty() and report->failed == 0
                       ? kExitSuccess
                       : kExitFailure;
        }
        case SubCommand::kUnknown:
        case SubCommand::kVersion:
            break;
    }
    return kExitFailure;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    SetupDefaultLogging();
    try {
        auto arguments = ParseCommandLineArguments(argc, argv);

        if (arguments.cmd == SubCommand::kVersion) {
            std::cout << version() << std::endl;
            return kExitSuccess;
        }

        if (arguments.common.config_file) {
            auto read = ReadConfigurationFile(*arguments.common.config_file,
                                              &arguments);
            if (not read) {
                Logger::Log(LogLevel::Error, "{}", read.error());
                return kExitFailure;
            }
        }

        SetupLogging(arguments.log);

        auto options = CreateCoordinatorOptions(arguments);
        if (not options) {
            Logger::Log(LogLevel::Error, "{}", options.error());
            return kExitFailure;
        }

        auto coordinator = Coordinator::Create(*std::move(options));
        if (not coordinator) {
            Logger::Log(LogLevel::Error, "{}", coordinator.error().ToString());
            return ExitCode(coordinator.error());
        }

        auto result = Run(coordinator->get(), arguments);
        (*coordinator)->Shutdown();
        return result;
    } catch (std::exception const& ex) {
        Logger::Log(
            LogLevel::Error, "Caught exception with message: {}", ex.what());
    }
    return kExitFailure;
}
