/*
 * File:        severity_filter.cpp
 * Module:      ccg-core
 * Purpose:     Severity filter set and its --enable argument
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/severity_filter.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace ccg {

std::string severity_enable_id(Severity severity) {
    switch (severity) {
    case Severity::Error:       return "";
    case Severity::Warning:     return "warning";
    case Severity::Style:       return "style";
    case Severity::Performance: return "performance";
    }
    return "";
}

std::string severity_name(Severity severity) {
    switch (severity) {
    case Severity::Error:       return "error";
    case Severity::Warning:     return "warning";
    case Severity::Style:       return "style";
    case Severity::Performance: return "performance";
    }
    return "unknown";
}

SeverityFilterSet::SeverityFilterSet(bool error, bool warning, bool style, bool performance)
    : error_(error), warning_(warning), style_(style), performance_(performance) {
}

bool SeverityFilterSet::is_enabled(Severity severity) const {
    switch (severity) {
    case Severity::Error:       return error_;
    case Severity::Warning:     return warning_;
    case Severity::Style:       return style_;
    case Severity::Performance: return performance_;
    }
    return false;
}

void SeverityFilterSet::set_enabled(Severity severity, bool enabled) {
    switch (severity) {
    case Severity::Error:       error_ = enabled; break;
    case Severity::Warning:     warning_ = enabled; break;
    case Severity::Style:       style_ = enabled; break;
    case Severity::Performance: performance_ = enabled; break;
    }
}

std::vector<std::string> SeverityFilterSet::enabled_ids() const {
    std::vector<std::string> ids;
    if (warning_) ids.push_back(severity_enable_id(Severity::Warning));
    if (style_) ids.push_back(severity_enable_id(Severity::Style));
    if (performance_) ids.push_back(severity_enable_id(Severity::Performance));
    return ids;
}

std::optional<std::string> SeverityFilterSet::enable_argument() const {
    auto ids = enabled_ids();
    if (ids.empty()) {
        return std::nullopt;
    }
    return fmt::format("--enable={}", fmt::join(ids, ","));
}

bool SeverityFilterSet::operator==(const SeverityFilterSet& other) const {
    return error_ == other.error_ && warning_ == other.warning_ &&
           style_ == other.style_ && performance_ == other.performance_;
}

} // namespace ccg
