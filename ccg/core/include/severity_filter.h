/*
 * File:        severity_filter.h
 * Module:      ccg-core
 * Purpose:     Severity filter set and its --enable argument
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace ccg {

/**
 * @brief Diagnostic categories the user can toggle
 *
 * Error class diagnostics are always reported by cppcheck, so Error is
 * tracked for display only and never forwarded on the command line.
 */
enum class Severity {
    Error,
    Warning,
    Style,
    Performance
};

/// All severities in display order
inline constexpr std::array<Severity, 4> kAllSeverities = {
    Severity::Error, Severity::Warning, Severity::Style, Severity::Performance
};

/// cppcheck's --enable identifier for a severity, empty for Error
std::string severity_enable_id(Severity severity);

/// Display name ("error", "warning", ...)
std::string severity_name(Severity severity);

/**
 * @brief Four independent severity toggles
 *
 * Defaults match the initial state of the window: error and warning on,
 * style and performance off.
 */
class SeverityFilterSet {
public:
    SeverityFilterSet() = default;
    SeverityFilterSet(bool error, bool warning, bool style, bool performance);

    bool is_enabled(Severity severity) const;
    void set_enabled(Severity severity, bool enabled);

    /// Forwarded ids in the fixed order warning, style, performance
    std::vector<std::string> enabled_ids() const;

    /// "--enable=<ids>" or nullopt when no forwarded severity is active
    std::optional<std::string> enable_argument() const;

    bool operator==(const SeverityFilterSet& other) const;
    bool operator!=(const SeverityFilterSet& other) const { return !(*this == other); }

private:
    bool error_{true};
    bool warning_{true};
    bool style_{false};
    bool performance_{false};
};

} // namespace ccg
