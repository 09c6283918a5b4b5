/*
 * File:        tool_probe.cpp
 * Module:      ccg-core
 * Purpose:     Startup availability check of external tools
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/tool_probe.h"

#include <logging.h>

namespace ccg {

bool ToolAvailability::is_available(const std::string& name) const {
    auto it = available.find(name);
    return it != available.end() && it->second;
}

ToolAvailability probe_tools(const public_api::ToolLocator& locator, const ToolchainConfig& config) {
    ToolAvailability result;

    auto probe = [&](const std::string& name) {
        auto it = result.available.find(name);
        if (it != result.available.end()) {
            return it->second;
        }
        auto location = locator.locate(name);
        bool found = location.has_value();
        result.available[name] = found;
        if (found) {
            CCG_LOG_DEBUG("Found {} at {}", name, *location);
        } else {
            CCG_LOG_DEBUG("{} not found on search path", name);
        }
        return found;
    };

    for (const auto& tool : config.required_tools) {
        if (!probe(tool)) {
            result.missing.push_back(tool);
        }
    }

    for (const auto& browser : config.pdf_browsers) {
        if (probe(browser) && !result.pdf_browser) {
            result.pdf_browser = browser;
        }
    }

    if (result.has_missing()) {
        CCG_LOG_INFO("{} required tool(s) missing", result.missing.size());
    }
    if (result.pdf_browser) {
        CCG_LOG_INFO("Using {} for PDF export", *result.pdf_browser);
    } else {
        CCG_LOG_WARN("No headless browser found, PDF export unavailable");
    }

    return result;
}

} // namespace ccg
