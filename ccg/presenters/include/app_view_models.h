/*
 * File:        app_view_models.h
 * Module:      ccg-presenters
 * Purpose:     View models consumed by the main window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace ccg::presenters {

/**
 * @brief Severity toggles as exposed to the GUI
 */
enum class SeverityToggle {
    Error,
    Warning,
    Style,
    Performance
};

/**
 * @brief Snapshot of everything the main window displays
 */
struct AppViewModel {
    std::string project_label;          ///< Selected path, or the translated prompt
    bool has_project{false};

    bool error_enabled{true};
    bool warning_enabled{true};
    bool style_enabled{false};
    bool performance_enabled{false};

    bool run_enabled{false};            ///< A project directory is selected
    bool html_enabled{false};           ///< Set once an analysis run completed
    bool pdf_enabled{false};

    bool installer_visible{false};      ///< Some required tool is missing
    bool installer_enabled{false};      ///< Installer not used yet
    std::vector<std::string> missing_tools;

    double progress{0.0};
    std::size_t log_size{0};            ///< Number of chunks in the log buffer
};

} // namespace ccg::presenters
