/*
 * File:        local_file_store.cpp
 * Module:      ccg-core
 * Purpose:     FileStore backed by the local filesystem
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/local_file_store.h"

#include <logging.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace ccg {

using public_api::OperationResult;

OperationResult LocalFileStore::write_file(const std::string& path, const std::string& contents) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        // Streams are not required to set errno
        std::string reason = errno != 0 ? std::strerror(errno) : "cannot open for writing";
        CCG_LOG_WARN("Cannot open {} for writing: {}", path, reason);
        return OperationResult::failure(ResultCode::ERROR_IO_ERROR, reason);
    }

    file.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    file.close();
    if (!file) {
        CCG_LOG_WARN("Write to {} failed", path);
        return OperationResult::failure(ResultCode::ERROR_IO_ERROR, "write failed");
    }

    CCG_LOG_DEBUG("Wrote {} bytes to {}", contents.size(), path);
    return OperationResult::success();
}

bool LocalFileStore::exists(const std::string& path) const {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

} // namespace ccg
