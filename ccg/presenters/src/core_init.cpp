/*
 * File:        core_init.cpp
 * Module:      ccg-presenters
 * Purpose:     Core initialization functions for presenters layer
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "../include/app_presenter.h"
#include "../../core/include/local_file_store.h"
#include <logging.h>

namespace ccg::presenters {

void initCoreLogging(const std::string& level, const std::string& pattern, const std::string& log_file) {
    ccg::init_app_logging(level, pattern, log_file);
}

std::vector<spdlog::sink_ptr> coreLogSinks() {
    return ccg::get_app_logger()->sinks();
}

spdlog::level::level_enum coreLogLevel() {
    return ccg::get_app_logger()->level();
}

std::shared_ptr<public_api::FileStore> makeLocalFileStore() {
    return std::make_shared<ccg::LocalFileStore>();
}

} // namespace ccg::presenters
