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

#include "src/regcoord/file_system/atomic.hpp"

#ifdef __unix__
#include <fcntl.h>
#include <unistd.h>
#else
#error "Non-unix is not supported yet"
#endif

#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>

#include "fmt/core.h"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/logger.hpp"

namespace {

[[nodiscard]] auto WriteAll(int fd, std::string const& content) noexcept
    -> int {
    std::size_t to_write = content.length();
    char const* buf = content.c_str();
    while (to_write > 0) {
        auto written = write(fd, buf, to_write);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            return errno;
        }
        to_write -= static_cast<std::size_t>(written);
        buf = &buf[written];  // NOLINT
    }
    return 0;
}

void SyncDirectory(std::filesystem::path const& dir) noexcept {
    auto fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY);  // NOLINT
    if (fd == -1) {
        return;
    }
    if (fsync(fd) != 0) {
        Logger::Log(LogLevel::Debug,
                    "syncing directory {} failed: {}",
                    dir.string(),
                    strerror(errno));
    }
    (void)close(fd);
}

}  // namespace

auto FileSystemAtomic::IsTemporaryName(std::string const& filename) noexcept
    -> bool {
    return filename.find(kTmpInfix) != std::string::npos;
}

auto FileSystemAtomic::StageFile(std::filesystem::path const& target,
                                 std::string const& content) noexcept
    -> expected<std::filesystem::path, int> {
    std::string tmp_name{};
    try {
        // As there is no high-level replacement of mkstemp(3), we fall back
        // to using the libc functions.
        tmp_name = fmt::format("{}{}XXXXXX", target.string(), kTmpInfix);
    } catch (std::exception const&) {
        return unexpected{ENOMEM};
    }
    auto fd = mkstemp(tmp_name.data());
    if (fd == -1) {
        return unexpected{errno};
    }
    auto err = WriteAll(fd, content);
    if (err == 0 and fsync(fd) != 0) {
        err = errno;
    }
    if (close(fd) != 0 and err == 0) {
        err = errno;
    }
    if (err != 0) {
        (void)unlink(tmp_name.c_str());
        return unexpected{err};
    }
    try {
        return std::filesystem::path{tmp_name};
    } catch (std::exception const&) {
        (void)unlink(tmp_name.c_str());
        return unexpected{ENOMEM};
    }
}

auto FileSystemAtomic::CommitFile(std::filesystem::path const& staged,
                                  std::filesystem::path const& target,
                                  bool no_clobber) noexcept
    -> expected<bool, int> {
    bool created = true;
    if (no_clobber) {
        if (link(staged.c_str(), target.c_str()) != 0) {
            auto err = errno;
            if (err != EEXIST) {
                return unexpected{err};
            }
            created = false;
        }
        (void)unlink(staged.c_str());
    }
    else if (rename(staged.c_str(), target.c_str()) != 0) {
        return unexpected{errno};
    }
    if (created) {
        SyncDirectory(target.parent_path());
    }
    return created;
}

auto FileSystemAtomic::WriteFile(std::filesystem::path const& filename,
                                 std::string const& content) noexcept -> int {
    auto staged = StageFile(filename, content);
    if (not staged) {
        return staged.error();
    }
    auto committed = CommitFile(*staged, filename, /*no_clobber=*/false);
    if (not committed) {
        (void)unlink(staged->c_str());
        return committed.error();
    }
    return 0;
}

auto FileSystemAtomic::AppendToFile(std::filesystem::path const& filename,
                                    std::string const& content) noexcept
    -> int {
    auto fd = open(filename.c_str(), O_WRONLY | O_APPEND);  // NOLINT
    if (fd == -1) {
        return errno;
    }
    auto err = WriteAll(fd, content);
    if (err == 0 and fsync(fd) != 0) {
        err = errno;
    }
    if (close(fd) != 0 and err == 0) {
        err = errno;
    }
    return err;
}
