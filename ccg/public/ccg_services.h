/*
 * File:        ccg_services.h
 * Module:      ccg-public
 * Purpose:     Service ports for subprocesses, files, tool lookup and URI opening
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <variant>
#include <error_codes.h>

namespace ccg::public_api {

/**
 * @brief An external program and its argument list
 *
 * Arguments are passed to the program verbatim, without shell quoting.
 */
struct CommandLine {
    std::string program;
    std::vector<std::string> arguments;

    /// Space-joined rendering for log output
    std::string to_string() const {
        std::string text = program;
        for (const auto& arg : arguments) {
            text += ' ';
            text += arg;
        }
        return text;
    }

    bool operator==(const CommandLine& other) const {
        return program == other.program && arguments == other.arguments;
    }
    bool operator!=(const CommandLine& other) const { return !(*this == other); }
};

/**
 * @brief How a launched process ended
 */
enum class ExitStatus {
    Normal,     ///< Process returned from main (any exit code)
    Crashed     ///< Process was killed or terminated abnormally
};

/**
 * @brief Captured result of a process that was started
 */
struct ProcessOutput {
    int exit_code{0};                       ///< Exit code (meaningful for Normal only)
    ExitStatus exit_status{ExitStatus::Normal};
    std::string standard_output;            ///< Captured stdout, verbatim
    std::string standard_error;             ///< Captured stderr, verbatim
};

/**
 * @brief The process could not be started at all
 */
struct LaunchError {
    std::string program;
    ResultCode code{ResultCode::ERROR_LAUNCH_FAILED};
    std::string message;
};

/// Uniform outcome of running an external tool
using ProcessResult = std::variant<ProcessOutput, LaunchError>;

inline bool launched(const ProcessResult& result) {
    return std::holds_alternative<ProcessOutput>(result);
}

/// True when the process started and ended normally, regardless of exit code
inline bool completed_normally(const ProcessResult& result) {
    const auto* output = std::get_if<ProcessOutput>(&result);
    return output && output->exit_status == ExitStatus::Normal;
}

/**
 * @brief Runs external programs synchronously
 *
 * run() blocks the caller until the process exits. No timeout is applied.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;
    virtual ProcessResult run(const CommandLine& command) = 0;
};

/**
 * @brief Resolves executable names on the system search path
 */
class ToolLocator {
public:
    virtual ~ToolLocator() = default;

    /// Absolute path of the executable, or nullopt if it cannot be found or run
    virtual std::optional<std::string> locate(const std::string& name) const = 0;
};

/**
 * @brief Result of a file or URI operation that can fail
 */
struct OperationResult {
    ResultCode code{ResultCode::SUCCESS};
    std::string message;

    bool ok() const { return is_success(code); }

    static OperationResult success() { return {}; }
    static OperationResult failure(ResultCode code, std::string message) {
        return OperationResult{code, std::move(message)};
    }
};

/**
 * @brief Minimal filesystem access for report artifacts
 */
class FileStore {
public:
    virtual ~FileStore() = default;

    /// Create or truncate @p path and write @p contents verbatim
    virtual OperationResult write_file(const std::string& path, const std::string& contents) = 0;

    virtual bool exists(const std::string& path) const = 0;
};

/**
 * @brief Opens a URI with the desktop's default handler
 */
class UriOpener {
public:
    virtual ~UriOpener() = default;
    virtual OperationResult open_uri(const std::string& uri) = 0;
};

} // namespace ccg::public_api
