/*
 * File:        error_codes.h
 * Module:      ccg-common
 * Purpose:     Common error codes and status enums
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstdint>

namespace ccg {

/**
 * @brief Common result codes for service operations
 */
enum class ResultCode : int32_t {
    SUCCESS = 0,
    ERROR_INVALID_ARGUMENT = -1,
    ERROR_FILE_NOT_FOUND = -2,
    ERROR_IO_ERROR = -3,
    ERROR_LAUNCH_FAILED = -4,
    ERROR_CRASHED = -5,
    ERROR_NO_HANDLER = -6,
    ERROR_INTERNAL = -7,
    ERROR_UNKNOWN = -99
};

/**
 * @brief Check if a result code indicates success
 */
inline bool is_success(ResultCode code) {
    return code == ResultCode::SUCCESS;
}

/**
 * @brief Check if a result code indicates an error
 */
inline bool is_error(ResultCode code) {
    return code != ResultCode::SUCCESS;
}

/**
 * @brief Short human-readable name for a result code
 */
inline const char* result_code_name(ResultCode code) {
    switch (code) {
    case ResultCode::SUCCESS:                return "success";
    case ResultCode::ERROR_INVALID_ARGUMENT: return "invalid argument";
    case ResultCode::ERROR_FILE_NOT_FOUND:   return "file not found";
    case ResultCode::ERROR_IO_ERROR:         return "I/O error";
    case ResultCode::ERROR_LAUNCH_FAILED:    return "launch failed";
    case ResultCode::ERROR_CRASHED:          return "crashed";
    case ResultCode::ERROR_NO_HANDLER:       return "no handler";
    case ResultCode::ERROR_INTERNAL:         return "internal error";
    case ResultCode::ERROR_UNKNOWN:          break;
    }
    return "unknown error";
}

} // namespace ccg
