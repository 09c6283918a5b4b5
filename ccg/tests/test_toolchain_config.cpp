/*
 * File:        test_toolchain_config.cpp
 * Module:      ccg-tests
 * Purpose:     Artifact paths and external command construction
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "toolchain_config.h"
#include <cassert>
#include <iostream>

using namespace ccg;

void test_artifact_paths() {
    ToolchainConfig config;
    assert(xml_report_path(config, "/tmp/proj") == "/tmp/proj/cppcheck.xml");
    assert(html_report_dir(config, "/tmp/proj") == "/tmp/proj/html_report");
    assert(html_index_path(config, "/tmp/proj") == "/tmp/proj/html_report/index.html");
    assert(pdf_report_path(config, "/tmp/proj") == "/tmp/proj/report.pdf");
    assert(file_uri("/tmp/proj/report.pdf") == "file:///tmp/proj/report.pdf");

    std::cout << "test_artifact_paths: PASSED\n";
}

void test_project_basename() {
    assert(project_basename("/tmp/proj") == "proj");
    assert(project_basename("/home/user/my app") == "my app");
    assert(project_basename("/") == "project");

    std::cout << "test_project_basename: PASSED\n";
}

void test_normalize_project_path() {
    assert(normalize_project_path("/tmp/proj/") == "/tmp/proj");
    assert(normalize_project_path("/tmp/./proj") == "/tmp/proj");
    assert(normalize_project_path("/") == "/");
    assert(normalize_project_path("").empty());

    auto relative = normalize_project_path("some/dir");
    assert(!relative.empty() && relative.front() == '/');
    assert(relative.size() >= 9 && relative.compare(relative.size() - 9, 9, "/some/dir") == 0);

    std::cout << "test_normalize_project_path: PASSED\n";
}

void test_analysis_command() {
    ToolchainConfig config;

    SeverityFilterSet only_warning(true, true, false, false);
    auto cmd = build_analysis_command(config, only_warning, "/tmp/proj");
    assert(cmd.program == "cppcheck");
    assert((cmd.arguments == std::vector<std::string>{"--enable=warning", "/tmp/proj"}));
    assert(cmd.to_string() == "cppcheck --enable=warning /tmp/proj");

    SeverityFilterSet none(true, false, false, false);
    cmd = build_analysis_command(config, none, "/tmp/proj");
    assert((cmd.arguments == std::vector<std::string>{"/tmp/proj"}));

    SeverityFilterSet all(false, true, true, true);
    cmd = build_analysis_command(config, all, "/tmp/proj");
    assert(cmd.arguments.front() == "--enable=warning,style,performance");

    std::cout << "test_analysis_command: PASSED\n";
}

void test_report_commands() {
    ToolchainConfig config;

    auto xml = build_xml_report_command(config, "/tmp/proj");
    assert(xml.program == "cppcheck");
    assert((xml.arguments == std::vector<std::string>{"--xml", "--xml-version=2", "/tmp/proj"}));

    auto html = build_html_report_command(config, "/tmp/proj");
    assert(html.program == "cppcheck-htmlreport");
    assert((html.arguments == std::vector<std::string>{
        "--file", "/tmp/proj/cppcheck.xml",
        "--report-dir", "/tmp/proj/html_report",
        "--source-dir", "/tmp/proj",
        "--title", "Cppcheck report - proj"}));

    auto pdf = build_pdf_command(config, "chromium-browser", "/tmp/proj");
    assert(pdf.program == "chromium-browser");
    assert((pdf.arguments == std::vector<std::string>{
        "--headless", "--disable-gpu",
        "--print-to-pdf=/tmp/proj/report.pdf",
        "file:///tmp/proj/html_report/index.html"}));

    std::cout << "test_report_commands: PASSED\n";
}

void test_install_command() {
    ToolchainConfig config;
    auto cmd = build_install_command(config, {"cppcheck-htmlreport", "google-chrome"});
    assert(cmd.program == "sudo");
    assert((cmd.arguments == std::vector<std::string>{
        "apt-get", "install", "-y", "cppcheck-htmlreport", "google-chrome"}));

    config.install_command.clear();
    assert(build_install_command(config, {"cppcheck"}).program.empty());

    std::cout << "test_install_command: PASSED\n";
}

int main() {
    std::cout << "Running toolchain config tests...\n";

    test_artifact_paths();
    test_project_basename();
    test_normalize_project_path();
    test_analysis_command();
    test_report_commands();
    test_install_command();

    std::cout << "All toolchain config tests passed!\n";
    return 0;
}
