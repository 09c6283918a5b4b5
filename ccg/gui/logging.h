/*
 * File:        logging.h
 * Module:      ccg-gui
 * Purpose:     GUI logging convenience header
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace ccg {

/// Get the GUI-specific logger
std::shared_ptr<spdlog::logger> get_gui_logger();

/// Reset the GUI logger (it will be recreated on next use)
void reset_gui_logger();

} // namespace ccg

// GUI-specific logging macros that use the GUI logger
#define CCG_LOG_TRACE(...)    SPDLOG_LOGGER_TRACE(ccg::get_gui_logger(), __VA_ARGS__)
#define CCG_LOG_DEBUG(...)    SPDLOG_LOGGER_DEBUG(ccg::get_gui_logger(), __VA_ARGS__)
#define CCG_LOG_INFO(...)     SPDLOG_LOGGER_INFO(ccg::get_gui_logger(), __VA_ARGS__)
#define CCG_LOG_WARN(...)     SPDLOG_LOGGER_WARN(ccg::get_gui_logger(), __VA_ARGS__)
#define CCG_LOG_ERROR(...)    SPDLOG_LOGGER_ERROR(ccg::get_gui_logger(), __VA_ARGS__)
#define CCG_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(ccg::get_gui_logger(), __VA_ARGS__)
