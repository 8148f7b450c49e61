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

#include "src/regcoord/logging/log_sink_file.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "catch2/catch_test_macros.hpp"
#include "catch2/matchers/catch_matchers_all.hpp"
#include "nlohmann/json.hpp"
#include "src/regcoord/file_system/atomic.hpp"
#include "src/regcoord/file_system/file_system_manager.hpp"
#include "src/regcoord/logging/audit_log.hpp"
#include "src/regcoord/logging/log_config.hpp"
#include "src/regcoord/logging/log_level.hpp"
#include "src/regcoord/logging/log_sink_cmdline.hpp"
#include "src/utils/cpp/tmp_dir.hpp"

[[nodiscard]] static auto GetLines(std::filesystem::path const& file_path)
    -> std::vector<std::string> {
    std::ifstream file(file_path);
    std::string line{};
    std::vector<std::string> lines{};
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

[[nodiscard]] static auto CreateLogDir() -> TmpDir::Ptr {
    auto dir = TmpDir::Create(
        std::filesystem::path{std::string{std::getenv("TEST_TMPDIR")}} /
        "logs");
    REQUIRE(dir != nullptr);
    return dir;
}

TEST_CASE("LogSinkFile", "[logging]") {
    LogConfig::SetSinks({LogSinkCmdLine::CreateFactory(false /*no color*/)});
    auto dir = CreateLogDir();

    SECTION("Overwrite mode") {
        auto filename = dir->GetPath() / "overwrite.log";
        REQUIRE(FileSystemAtomic::WriteFile(filename, "somecontent\n") == 0);
        LogSinkFile sink{filename, LogSinkFile::Mode::Overwrite};

        sink.Emit(nullptr, LogLevel::Info, "first");
        sink.Emit(nullptr, LogLevel::Info, "second");
        sink.Emit(nullptr, LogLevel::Info, "third");

        CHECK(GetLines(filename).size() == 3);
    }

    SECTION("Append mode") {
        auto filename = dir->GetPath() / "append.log";
        REQUIRE(FileSystemAtomic::WriteFile(filename, "somecontent\n") == 0);
        LogSinkFile sink{filename, LogSinkFile::Mode::Append};

        sink.Emit(nullptr, LogLevel::Info, "first");
        sink.Emit(nullptr, LogLevel::Info, "second");
        sink.Emit(nullptr, LogLevel::Info, "third");

        CHECK(GetLines(filename).size() == 4);
    }

    SECTION("Thread-safety") {
        int const num_threads = 20;
        auto filename = dir->GetPath() / "threads.log";
        LogSinkFile sink{filename, LogSinkFile::Mode::Append};

        std::vector<std::thread> threads{};
        for (int id{}; id < num_threads; ++id) {
            threads.emplace_back(
                [&](int tid) {
                    sink.Emit(nullptr,
                              LogLevel::Info,
                              "this is thread " + std::to_string(tid));
                },
                id);
        }
        for (auto& thread : threads) {
            thread.join();
        }

        auto lines = GetLines(filename);
        CHECK(lines.size() == num_threads);
        for (auto const& line : lines) {
            CHECK_THAT(line,
                       Catch::Matchers::ContainsSubstring("this is thread"));
        }
    }
}

TEST_CASE("AuditLog", "[logging]") {
    auto dir = CreateLogDir();

    SECTION("Events are appended as JSON lines") {
        auto filename = dir->GetPath() / "audit.jsonl";
        AuditLog audit{filename};
        audit.Record("corruption-detected", "sha256:00");
        audit.Record("quarantined",
                     "sha256:11",
                     nlohmann::json{{"path", "quarantine/x"}});

        auto lines = GetLines(filename);
        REQUIRE(lines.size() == 2);
        auto first = nlohmann::json::parse(lines[0]);
        CHECK(first["event"] == "corruption-detected");
        CHECK(first["digest"] == "sha256:00");
        CHECK(first.contains("time"));
        auto second = nlohmann::json::parse(lines[1]);
        CHECK(second["event"] == "quarantined");
        CHECK(second["path"] == "quarantine/x");
    }

    SECTION("Without file only the logger is used") {
        AuditLog audit{std::nullopt};
        audit.Record("quarantined", "sha256:22");
        CHECK(not audit.File());
    }
}
