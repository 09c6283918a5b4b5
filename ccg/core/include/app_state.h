/*
 * File:        app_state.h
 * Module:      ccg-core
 * Purpose:     Application state, events and effects
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <ccg_services.h>
#include "severity_filter.h"
#include "tool_probe.h"

namespace ccg {

using public_api::ProcessResult;
using public_api::OperationResult;

/**
 * @brief Append-only sequence of text chunks shown in the log view
 *
 * Never truncated or rotated for the life of the window.
 */
class LogBuffer {
public:
    void append(std::string chunk);

    const std::vector<std::string>& chunks() const { return chunks_; }
    std::size_t size() const { return chunks_.size(); }
    bool empty() const { return chunks_.empty(); }

    /// Last chunk, or an empty string
    const std::string& last() const;

    /// All chunks concatenated
    std::string text() const;

private:
    std::vector<std::string> chunks_;
};

/**
 * @brief Everything the window knows, owned by the presenter
 */
struct AppState {
    std::optional<std::string> project_path;
    SeverityFilterSet severities;
    ToolAvailability tools;
    bool tools_probed{false};
    bool reports_enabled{false};    ///< HTML/PDF actions usable after a run
    bool installer_used{false};
    double progress{0.0};           ///< 0.0 before a run, 1.0 once it has returned
    LogBuffer log;
};

/**
 * @brief Pipeline step an effect (and its result event) belongs to
 */
enum class Step {
    InstallDependencies,
    RunAnalysis,
    XmlReport,
    HtmlReport,
    OpenHtmlReport,
    PdfReport,
    OpenPdfReport
};

const char* step_name(Step step);

// === Effects: work for the effect runner ===

struct RunProcess {
    Step step;
    public_api::CommandLine command;
};

struct WriteFile {
    Step step;
    std::string path;
    std::string contents;
};

struct CheckFile {
    Step step;
    std::string path;
};

struct OpenUri {
    Step step;
    std::string uri;
};

using Effect = std::variant<RunProcess, WriteFile, CheckFile, OpenUri>;

// === Events: user actions and effect results ===

struct ToolsProbed {
    ToolAvailability tools;
};

struct ProjectSelected {
    std::string path;   ///< Absolute, no trailing separator
};

struct SeverityToggled {
    Severity severity;
    bool enabled;
};

struct InstallRequested {};
struct RunAnalysisRequested {};
struct HtmlReportRequested {};
struct PdfReportRequested {};

struct ProcessCompleted {
    Step step;
    ProcessResult result;
};

struct FileWritten {
    Step step;
    OperationResult result;
};

struct FileChecked {
    Step step;
    bool exists;
};

struct UriOpened {
    Step step;
    OperationResult result;
};

using Event = std::variant<ToolsProbed, ProjectSelected, SeverityToggled,
                           InstallRequested, RunAnalysisRequested,
                           HtmlReportRequested, PdfReportRequested,
                           ProcessCompleted, FileWritten, FileChecked, UriOpened>;

} // namespace ccg
