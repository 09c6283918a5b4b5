/*
 * File:        tool_probe.h
 * Module:      ccg-core
 * Purpose:     Startup availability check of external tools
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <ccg_services.h>
#include "toolchain_config.h"

namespace ccg {

/**
 * @brief Which external tools were found on the search path
 *
 * Computed once at startup. The table is an existence check only; it says
 * nothing about versions or capabilities.
 */
struct ToolAvailability {
    std::map<std::string, bool> available;  ///< Tool name -> found
    std::vector<std::string> missing;       ///< Required tools not found, config order
    std::optional<std::string> pdf_browser; ///< First browser found, if any

    bool is_available(const std::string& name) const;
    bool has_missing() const { return !missing.empty(); }
};

/**
 * @brief Probe the required tools and browser candidates
 *
 * A lookup error is treated the same as "not found".
 */
ToolAvailability probe_tools(const public_api::ToolLocator& locator, const ToolchainConfig& config);

} // namespace ccg
