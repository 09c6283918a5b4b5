/*
 * File:        toolchain_config.h
 * Module:      ccg-core
 * Purpose:     External tool names, artifact locations and command construction
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <string>
#include <vector>
#include <ccg_services.h>
#include "severity_filter.h"

namespace ccg {

using public_api::CommandLine;

/**
 * @brief Names of the external programs and the artifacts they produce
 *
 * Every artifact lives inside the selected project directory.
 */
struct ToolchainConfig {
    std::string analyzer{"cppcheck"};
    std::string report_renderer{"cppcheck-htmlreport"};

    /// Headless PDF renderers, most preferred first
    std::vector<std::string> pdf_browsers{"google-chrome", "chromium-browser", "chromium"};

    /// Tools the dependency installer offers to install when missing
    std::vector<std::string> required_tools{"cppcheck", "cppcheck-htmlreport", "google-chrome"};

    /// Elevated package manager invocation; missing tool names are appended
    std::vector<std::string> install_command{"sudo", "apt-get", "install", "-y"};

    std::string xml_report_name{"cppcheck.xml"};
    std::string html_report_dir_name{"html_report"};
    std::string html_index_name{"index.html"};
    std::string pdf_report_name{"report.pdf"};
    int xml_version{2};
    std::string report_title_prefix{"Cppcheck report - "};
};

// === Artifact locations ===

/// <project>/cppcheck.xml
std::string xml_report_path(const ToolchainConfig& config, const std::string& project);

/// <project>/html_report
std::string html_report_dir(const ToolchainConfig& config, const std::string& project);

/// <project>/html_report/index.html
std::string html_index_path(const ToolchainConfig& config, const std::string& project);

/// <project>/report.pdf
std::string pdf_report_path(const ToolchainConfig& config, const std::string& project);

/// "file://" followed by an absolute path
std::string file_uri(const std::string& absolute_path);

/// Last path component of the project, or "project" if there is none
std::string project_basename(const std::string& project);

/// Absolute form of @p path without a trailing separator
std::string normalize_project_path(const std::string& path);

// === Commands ===

/// cppcheck [--enable=<ids>] <project>
CommandLine build_analysis_command(const ToolchainConfig& config,
                                   const SeverityFilterSet& filters,
                                   const std::string& project);

/// cppcheck --xml --xml-version=2 <project>
CommandLine build_xml_report_command(const ToolchainConfig& config, const std::string& project);

/// cppcheck-htmlreport --file ... --report-dir ... --source-dir ... --title ...
CommandLine build_html_report_command(const ToolchainConfig& config, const std::string& project);

/// <browser> --headless --disable-gpu --print-to-pdf=<pdf> <index uri>
CommandLine build_pdf_command(const ToolchainConfig& config,
                              const std::string& browser,
                              const std::string& project);

/// sudo apt-get install -y <missing...>
CommandLine build_install_command(const ToolchainConfig& config,
                                  const std::vector<std::string>& missing_tools);

} // namespace ccg
