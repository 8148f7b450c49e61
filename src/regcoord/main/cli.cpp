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

#include "src/regcoord/main/cli.hpp"

#include <cstdlib>
#include <exception>

#include "gsl/gsl"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"
#include "src/regcoord/main/exit_codes.hpp"

namespace {

/// \brief Options every command opening the store understands.
auto SetupStoreCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupCommonArguments(app, &clargs->common);
    SetupLogArguments(app, &clargs->log);
    SetupStoreArguments(app, &clargs->store);
    SetupLockArguments(app, &clargs->lock);
}

/// \brief Options of commands that may be served by the mirror facet.
auto SetupServingCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupStoreCommandArguments(app, clargs);
    SetupUpstreamArguments(app, &clargs->upstream);
    SetupEndpointArguments(app, &clargs->endpoint);
    SetupRepositoryArguments(app, &clargs->request);
}

/// \brief Setup arguments for sub command "regcoord pull-blob".
auto SetupPullBlobCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupReferenceArguments(app, &clargs->request, "Digest of the blob.");
    SetupOutputArguments(app, &clargs->request);
}

/// \brief Setup arguments for sub command "regcoord pull-manifest".
auto SetupPullManifestCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupReferenceArguments(
        app, &clargs->request, "Tag or digest of the manifest.");
    SetupOutputArguments(app, &clargs->request);
}

/// \brief Setup arguments for sub command "regcoord push-blob".
auto SetupPushBlobCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupReferenceArguments(
        app, &clargs->request, "Expected digest of the content.");
    SetupInputArguments(app, &clargs->request);
    app->add_option("--chunk-size",
                    clargs->request.chunk_size,
                    "Upload in chunks of this many bytes instead of a single "
                    "request.")
        ->type_name("NUM")
        ->check(CLI::PositiveNumber);
}

/// \brief Setup arguments for sub command "regcoord push-manifest".
auto SetupPushManifestCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupReferenceArguments(
        app, &clargs->request, "Tag or digest to push the manifest as.");
    SetupInputArguments(app, &clargs->request);
    app->add_option("--content-type",
                    clargs->request.content_type,
                    "Media type of the manifest, if it does not declare one.")
        ->type_name("TYPE");
}

/// \brief Setup arguments for sub command "regcoord tags".
auto SetupTagsCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupOutputArguments(app, &clargs->request);
}

/// \brief Setup arguments for sub command "regcoord delete-tag".
auto SetupDeleteTagCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupServingCommandArguments(app, clargs);
    SetupReferenceArguments(app, &clargs->request, "Tag to delete.");
}

/// \brief Setup arguments for sub command "regcoord gc".
auto SetupGcCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupStoreCommandArguments(app, clargs);
    SetupGcArguments(app, &clargs->gc);
}

/// \brief Setup arguments for sub command "regcoord verify".
auto SetupVerifyCommandArguments(
    gsl::not_null<CLI::App*> const& app,
    gsl::not_null<CommandLineArguments*> const& clargs) {
    SetupStoreCommandArguments(app, clargs);
}

}  // namespace

auto ParseCommandLineArguments(int argc, char const* const* argv)
    -> CommandLineArguments {
    CLI::App app("regcoord, a write-through registry cache coordinator");
    app.option_defaults()->take_last();

    auto* cmd_version = app.add_subcommand(
        "version", "Print version information in JSON format.");
    auto* cmd_pull_blob =
        app.add_subcommand("pull-blob", "Read a blob from the store.");
    auto* cmd_pull_manifest = app.add_subcommand(
        "pull-manifest", "Read a manifest by tag or digest.");
    auto* cmd_push_blob =
        app.add_subcommand("push-blob", "Store a blob in a repository.");
    auto* cmd_push_manifest = app.add_subcommand(
        "push-manifest", "Store a manifest under a tag or digest.");
    auto* cmd_tags =
        app.add_subcommand("tags", "List the tags of a repository.");
    auto* cmd_delete_tag =
        app.add_subcommand("delete-tag", "Remove a tag from a repository.");
    auto* cmd_gc = app.add_subcommand(
        "gc", "Remove blobs no longer reachable from any tag.");
    auto* cmd_verify = app.add_subcommand(
        "verify", "Re-hash all blobs and quarantine corrupted ones.");
    app.require_subcommand(1);

    CommandLineArguments clargs;
    SetupPullBlobCommandArguments(cmd_pull_blob, &clargs);
    SetupPullManifestCommandArguments(cmd_pull_manifest, &clargs);
    SetupPushBlobCommandArguments(cmd_push_blob, &clargs);
    SetupPushManifestCommandArguments(cmd_push_manifest, &clargs);
    SetupTagsCommandArguments(cmd_tags, &clargs);
    SetupDeleteTagCommandArguments(cmd_delete_tag, &clargs);
    SetupGcCommandArguments(cmd_gc, &clargs);
    SetupVerifyCommandArguments(cmd_verify, &clargs);
    try {
        app.parse(argc, argv);
    } catch (CLI::Error& e) {
        std::exit(app.exit(e));
    } catch (std::exception const& ex) {
        Logger::Log(LogLevel::Error, "Command line parse error: {}", ex.what());
        std::exit(kExitFailure);
    }

    if (*cmd_version) {
        clargs.cmd = SubCommand::kVersion;
    }
    else if (*cmd_pull_blob) {
        clargs.cmd = SubCommand::kPullBlob;
    }
    else if (*cmd_pull_manifest) {
        clargs.cmd = SubCommand::kPullManifest;
    }
    else if (*cmd_push_blob) {
        clargs.cmd = SubCommand::kPushBlob;
    }
    else if (*cmd_push_manifest) {
        clargs.cmd = SubCommand::kPushManifest;
    }
    else if (*cmd_tags) {
        clargs.cmd = SubCommand::kTags;
    }
    else if (*cmd_delete_tag) {
        clargs.cmd = SubCommand::kDeleteTag;
    }
    else if (*cmd_gc) {
        clargs.cmd = SubCommand::kGc;
    }
    else if (*cmd_verify) {
        clargs.cmd = SubCommand::kVerify;
    }

    return clargs;
}
