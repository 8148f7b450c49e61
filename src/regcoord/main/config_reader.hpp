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

#ifndef INCLUDED_SRC_REGCOORD_MAIN_CONFIG_READER_HPP
#define INCLUDED_SRC_REGCOORD_MAIN_CONFIG_READER_HPP

#include <filesystem>
#include <string>
#include <variant>

#include "gsl/gsl"
#include "nlohmann/json.hpp"
#include "src/regcoord/coordinator/coordinator.hpp"
#include "src/regcoord/main/cli.hpp"
#include "src/utils/cpp/expected.hpp"

/// \brief Read the JSON configuration file and fill in all arguments not
/// given on the command line. Log files of the configuration are added to
/// those of the command line.
[[nodiscard]] auto ReadConfigurationFile(
    std::filesystem::path const& file,
    gsl::not_null<CommandLineArguments*> const& clargs) noexcept
    -> expected<std::monostate, std::string>;

/// \brief Apply an already parsed configuration. Relative paths are
/// resolved against base_dir.
[[nodiscard]] auto ApplyConfiguration(
    nlohmann::json const& config,
    std::filesystem::path const& base_dir,
    gsl::not_null<CommandLineArguments*> const& clargs) noexcept
    -> expected<std::monostate, std::string>;

/// \brief Validate the arguments and turn them into coordinator options.
/// An upstream registry is created if an upstream url is configured.
[[nodiscard]] auto CreateCoordinatorOptions(
    CommandLineArguments const& clargs) noexcept
    -> expected<CoordinatorOptions, std::string>;

#endif  // INCLUDED_SRC_REGCOORD_MAIN_CONFIG_READER_HPP
