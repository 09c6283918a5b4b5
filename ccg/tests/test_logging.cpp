/*
 * File:        test_logging.cpp
 * Module:      ccg-tests
 * Purpose:     Application logger setup tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include <logging.h>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace ccg;
namespace fs = std::filesystem;

void test_parse_log_level() {
    assert(parse_log_level("trace") == spdlog::level::trace);
    assert(parse_log_level("DEBUG") == spdlog::level::debug);
    assert(parse_log_level("warn") == spdlog::level::warn);
    assert(parse_log_level("warning") == spdlog::level::warn);
    assert(parse_log_level("error") == spdlog::level::err);
    assert(parse_log_level("off") == spdlog::level::off);
    assert(parse_log_level("bogus") == spdlog::level::info);

    std::cout << "test_parse_log_level: PASSED\n";
}

void test_file_sink_receives_messages() {
    auto dir = fs::temp_directory_path() / "ccg_test_logging";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto log_file = (dir / "ccg.log").string();

    init_app_logging("debug", kDefaultLogPattern, log_file);
    auto logger = get_app_logger();
    assert(logger->level() == spdlog::level::debug);
    assert(logger->sinks().size() == 2);

    CCG_LOG_INFO("Running cppcheck on {}", "/tmp/proj");
    logger->flush();

    std::ifstream file(log_file);
    std::ostringstream contents;
    contents << file.rdbuf();
    assert(contents.str().find("Running cppcheck on /tmp/proj") != std::string::npos);
    assert(contents.str().find("[ccg]") != std::string::npos);

    reset_logging();
    fs::remove_all(dir);
    std::cout << "test_file_sink_receives_messages: PASSED\n";
}

void test_unusable_log_file_keeps_console() {
    auto dir = fs::temp_directory_path() / "ccg_test_logging_bad";
    fs::remove_all(dir);
    fs::create_directories(dir);
    // A regular file where a directory is expected
    auto blocker = dir / "not_a_dir";
    std::ofstream(blocker) << "x";

    init_app_logging("info", kDefaultLogPattern, (blocker / "ccg.log").string());
    assert(get_app_logger()->sinks().size() == 1);

    reset_logging();
    fs::remove_all(dir);
    std::cout << "test_unusable_log_file_keeps_console: PASSED\n";
}

int main() {
    std::cout << "Running logging tests...\n";

    test_parse_log_level();
    test_file_sink_receives_messages();
    test_unusable_log_file_keeps_console();

    std::cout << "All logging tests passed!\n";
    return 0;
}
