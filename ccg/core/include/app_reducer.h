/*
 * File:        app_reducer.h
 * Module:      ccg-core
 * Purpose:     Pure state transition function for the application
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <vector>
#include "app_state.h"
#include "toolchain_config.h"

namespace ccg {

/// Messages appended to the log buffer (each ends with a newline)
namespace messages {
    inline constexpr const char* kInstalling = "Installing missing utilities...\n";
    inline constexpr const char* kXmlRunFailed = "Error running cppcheck --xml\n";
    inline constexpr const char* kXmlWriteFailed = "Failed to write XML report\n";
    inline constexpr const char* kHtmlRenderFailed = "Error generating HTML report\n";
    inline constexpr const char* kNoPdfUtility = "No PDF utility available\n";
    inline constexpr const char* kPdfRunFailed = "Error generating PDF report\n";
    inline constexpr const char* kPdfMissing = "PDF report was not generated\n";
}

/**
 * @brief New state plus the effects needed to continue
 */
struct Transition {
    AppState state;
    std::vector<Effect> effects;
};

/**
 * @brief Apply one event to the application state
 *
 * Never performs I/O. Subprocesses, file access and URI opening are
 * requested as effects; their outcomes come back as further events.
 * Actions that need a project directory do nothing while none is selected.
 */
Transition reduce(const ToolchainConfig& config, AppState state, const Event& event);

} // namespace ccg
