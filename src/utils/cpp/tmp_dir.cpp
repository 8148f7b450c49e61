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

#include "src/utils/cpp/tmp_dir.hpp"

#ifdef __unix__
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include <cstdlib>
#include <exception>
#include <string>
#include <string_view>
#include <tuple>

#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"

auto TmpDir::Create(std::filesystem::path const& prefix) noexcept -> Ptr {
    static constexpr std::string_view kDirTemplate = "tmp.XXXXXX";
    if (not FileSystemManager::CreateDirectory(prefix)) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: could not create prefix directory {}",
                    prefix.string());
        return nullptr;
    }

    std::string dir_path;
    try {
        dir_path = std::filesystem::weakly_canonical(prefix / kDirTemplate);
        if (mkdtemp(dir_path.data()) == nullptr) {
            Logger::Log(LogLevel::Error,
                        "TmpDir: could not create directory in {}",
                        prefix.string());
            return nullptr;
        }
        return std::shared_ptr<TmpDir const>(new TmpDir(dir_path));
    } catch (std::exception const& e) {
        Logger::Log(LogLevel::Error,
                    "TmpDir: creating directory in {} failed:\n{}",
                    prefix.string(),
                    e.what());
        if (not dir_path.empty()) {
            rmdir(dir_path.c_str());
        }
    }
    return nullptr;
}

TmpDir::~TmpDir() noexcept {
    std::ignore =
        FileSystemManager::RemoveDirectory(tmp_dir_, /*recursively=*/true);
}
