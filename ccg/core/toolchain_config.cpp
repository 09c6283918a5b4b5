/*
 * File:        toolchain_config.cpp
 * Module:      ccg-core
 * Purpose:     External tool names, artifact locations and command construction
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/toolchain_config.h"

#include <fmt/format.h>
#include <filesystem>

namespace ccg {

namespace fs = std::filesystem;

std::string xml_report_path(const ToolchainConfig& config, const std::string& project) {
    return fmt::format("{}/{}", project, config.xml_report_name);
}

std::string html_report_dir(const ToolchainConfig& config, const std::string& project) {
    return fmt::format("{}/{}", project, config.html_report_dir_name);
}

std::string html_index_path(const ToolchainConfig& config, const std::string& project) {
    return fmt::format("{}/{}", html_report_dir(config, project), config.html_index_name);
}

std::string pdf_report_path(const ToolchainConfig& config, const std::string& project) {
    return fmt::format("{}/{}", project, config.pdf_report_name);
}

std::string file_uri(const std::string& absolute_path) {
    return "file://" + absolute_path;
}

std::string project_basename(const std::string& project) {
    auto name = fs::path(project).filename().string();
    if (name.empty()) {
        return "project";
    }
    return name;
}

std::string normalize_project_path(const std::string& path) {
    if (path.empty()) {
        return path;
    }

    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(path), ec);
    if (ec) {
        absolute = fs::path(path);
    }

    std::string text = absolute.lexically_normal().string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return text;
}

CommandLine build_analysis_command(const ToolchainConfig& config,
                                   const SeverityFilterSet& filters,
                                   const std::string& project) {
    CommandLine command{config.analyzer, {}};
    if (auto enable = filters.enable_argument()) {
        command.arguments.push_back(*enable);
    }
    command.arguments.push_back(project);
    return command;
}

CommandLine build_xml_report_command(const ToolchainConfig& config, const std::string& project) {
    return CommandLine{
        config.analyzer,
        {"--xml", fmt::format("--xml-version={}", config.xml_version), project}
    };
}

CommandLine build_html_report_command(const ToolchainConfig& config, const std::string& project) {
    return CommandLine{
        config.report_renderer,
        {
            "--file", xml_report_path(config, project),
            "--report-dir", html_report_dir(config, project),
            "--source-dir", project,
            "--title", config.report_title_prefix + project_basename(project)
        }
    };
}

CommandLine build_pdf_command(const ToolchainConfig& config,
                              const std::string& browser,
                              const std::string& project) {
    return CommandLine{
        browser,
        {
            "--headless",
            "--disable-gpu",
            fmt::format("--print-to-pdf={}", pdf_report_path(config, project)),
            file_uri(html_index_path(config, project))
        }
    };
}

CommandLine build_install_command(const ToolchainConfig& config,
                                  const std::vector<std::string>& missing_tools) {
    CommandLine command;
    if (config.install_command.empty()) {
        return command;
    }
    command.program = config.install_command.front();
    command.arguments.assign(config.install_command.begin() + 1, config.install_command.end());
    command.arguments.insert(command.arguments.end(), missing_tools.begin(), missing_tools.end());
    return command;
}

} // namespace ccg
