/*
 * File:        test_app_reducer.cpp
 * Module:      ccg-tests
 * Purpose:     State transition tests for the application reducer
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "app_reducer.h"
#include "test_fakes.h"
#include <cassert>
#include <iostream>

using namespace ccg;
using namespace ccg::testing;

namespace {

ToolAvailability all_tools() {
    ToolAvailability tools;
    tools.available = {{"cppcheck", true}, {"cppcheck-htmlreport", true}, {"google-chrome", true}};
    tools.pdf_browser = "google-chrome";
    return tools;
}

AppState state_with_project(const std::string& path = "/tmp/proj") {
    AppState state;
    state.tools = all_tools();
    state.tools_probed = true;
    state.project_path = path;
    return state;
}

template <typename T>
const T& only_effect(const Transition& t) {
    assert(t.effects.size() == 1);
    const T* effect = std::get_if<T>(&t.effects.front());
    assert(effect != nullptr);
    return *effect;
}

} // namespace

void test_actions_without_project_are_noops() {
    ToolchainConfig config;
    AppState state;
    state.tools = all_tools();

    for (const Event& event : {Event{RunAnalysisRequested{}}, Event{HtmlReportRequested{}},
                               Event{PdfReportRequested{}}}) {
        auto t = reduce(config, state, event);
        assert(t.effects.empty());
        assert(t.state.log.empty());
        assert(!t.state.reports_enabled);
    }

    std::cout << "test_actions_without_project_are_noops: PASSED\n";
}

void test_project_selection_replaces_path() {
    ToolchainConfig config;
    AppState state;

    auto t = reduce(config, state, ProjectSelected{"/tmp/a"});
    assert(t.state.project_path == std::string("/tmp/a"));
    t = reduce(config, t.state, ProjectSelected{"/tmp/b"});
    assert(t.state.project_path == std::string("/tmp/b"));

    // Cancel leaves the selection alone
    t = reduce(config, t.state, ProjectSelected{""});
    assert(t.state.project_path == std::string("/tmp/b"));
    assert(t.effects.empty());

    std::cout << "test_project_selection_replaces_path: PASSED\n";
}

void test_run_analysis_builds_command() {
    ToolchainConfig config;
    auto state = state_with_project();
    state.severities = SeverityFilterSet(true, false, true, true);
    state.progress = 1.0;

    auto t = reduce(config, state, RunAnalysisRequested{});
    const auto& run = only_effect<RunProcess>(t);
    assert(run.step == Step::RunAnalysis);
    assert(run.command.to_string() == "cppcheck --enable=style,performance /tmp/proj");
    assert(t.state.log.last() == "Running cppcheck on /tmp/proj\n");
    assert(t.state.progress == 0.0);
    assert(!t.state.reports_enabled);

    std::cout << "test_run_analysis_builds_command: PASSED\n";
}

void test_run_completion_enables_reports() {
    ToolchainConfig config;
    auto state = state_with_project();

    auto t = reduce(config, state, ProcessCompleted{Step::RunAnalysis, normal_exit("out\n", "err\n", 1)});
    assert(t.state.reports_enabled);
    assert(t.state.progress == 1.0);
    assert(t.state.log.size() == 2);
    assert(t.state.log.chunks()[0] == "out\n");
    assert(t.state.log.chunks()[1] == "err\n");
    assert(t.effects.empty());

    std::cout << "test_run_completion_enables_reports: PASSED\n";
}

void test_run_launch_failure_keeps_reports_disabled() {
    ToolchainConfig config;
    auto state = state_with_project();

    auto t = reduce(config, state, ProcessCompleted{Step::RunAnalysis, launch_failure("cppcheck")});
    assert(!t.state.reports_enabled);
    assert(t.state.log.empty());
    assert(t.state.progress == 1.0);

    std::cout << "test_run_launch_failure_keeps_reports_disabled: PASSED\n";
}

void test_run_crash_still_enables_reports() {
    ToolchainConfig config;
    auto state = state_with_project();

    // Only the launch is checked; a crash is treated like any other exit
    auto t = reduce(config, state, ProcessCompleted{Step::RunAnalysis, crashed("partial")});
    assert(t.state.reports_enabled);
    assert(t.state.progress == 1.0);
    assert(t.state.log.chunks().front() == "partial");

    std::cout << "test_run_crash_still_enables_reports: PASSED\n";
}

void test_html_pipeline_steps() {
    ToolchainConfig config;
    auto state = state_with_project();

    auto t = reduce(config, state, HtmlReportRequested{});
    assert(t.state.log.last() == "Generating HTML report for /tmp/proj\n");
    const auto& xml = only_effect<RunProcess>(t);
    assert(xml.step == Step::XmlReport);
    assert(xml.command.to_string() == "cppcheck --xml --xml-version=2 /tmp/proj");

    // The XML document comes from stderr, not stdout
    t = reduce(config, t.state, ProcessCompleted{Step::XmlReport, normal_exit("Checking...\n", "<results/>")});
    const auto& write = only_effect<WriteFile>(t);
    assert(write.path == "/tmp/proj/cppcheck.xml");
    assert(write.contents == "<results/>");

    t = reduce(config, t.state, FileWritten{Step::XmlReport, OperationResult::success()});
    const auto& render = only_effect<RunProcess>(t);
    assert(render.step == Step::HtmlReport);
    assert(render.command.program == "cppcheck-htmlreport");

    t = reduce(config, t.state, ProcessCompleted{Step::HtmlReport, normal_exit("")});
    assert(t.state.log.last() == "HTML report saved to /tmp/proj/html_report\n");
    const auto& open = only_effect<OpenUri>(t);
    assert(open.step == Step::OpenHtmlReport);
    assert(open.uri == "file:///tmp/proj/html_report/index.html");

    t = reduce(config, t.state, UriOpened{Step::OpenHtmlReport, OperationResult::failure(ResultCode::ERROR_NO_HANDLER, "no browser")});
    assert(t.state.log.last() == "Failed to open HTML report: no browser\n");

    std::cout << "test_html_pipeline_steps: PASSED\n";
}

void test_html_pipeline_failures() {
    ToolchainConfig config;
    auto state = state_with_project();

    auto t = reduce(config, state, ProcessCompleted{Step::XmlReport, launch_failure("cppcheck")});
    assert(t.effects.empty());
    assert(t.state.log.last() == messages::kXmlRunFailed);

    t = reduce(config, state, FileWritten{Step::XmlReport, OperationResult::failure(ResultCode::ERROR_IO_ERROR, "denied")});
    assert(t.effects.empty());
    assert(t.state.log.last() == "Failed to write XML report\n");

    t = reduce(config, state, ProcessCompleted{Step::HtmlReport, launch_failure("cppcheck-htmlreport")});
    assert(t.effects.empty());
    assert(t.state.log.last() == messages::kHtmlRenderFailed);

    std::cout << "test_html_pipeline_failures: PASSED\n";
}

void test_html_pipeline_continues_after_crash() {
    ToolchainConfig config;
    auto state = state_with_project();

    // A crashed XML run still has its partial stderr written
    auto t = reduce(config, state, ProcessCompleted{Step::XmlReport, crashed("", "<results>")});
    const auto& write = only_effect<WriteFile>(t);
    assert(write.path == "/tmp/proj/cppcheck.xml");
    assert(write.contents == "<results>");
    assert(t.state.log.empty());

    t = reduce(config, state, ProcessCompleted{Step::HtmlReport, crashed()});
    assert(t.state.log.last() == "HTML report saved to /tmp/proj/html_report\n");
    assert(only_effect<OpenUri>(t).uri == "file:///tmp/proj/html_report/index.html");

    std::cout << "test_html_pipeline_continues_after_crash: PASSED\n";
}

void test_pdf_without_browser() {
    ToolchainConfig config;
    auto state = state_with_project();
    state.tools.pdf_browser.reset();

    auto t = reduce(config, state, PdfReportRequested{});
    assert(t.effects.empty());
    assert(t.state.log.size() == 1);
    assert(t.state.log.last() == "No PDF utility available\n");

    std::cout << "test_pdf_without_browser: PASSED\n";
}

void test_pdf_pipeline() {
    ToolchainConfig config;
    auto state = state_with_project();
    state.tools.pdf_browser = "chromium-browser";

    auto t = reduce(config, state, PdfReportRequested{});
    assert(t.state.log.last() == "Generating PDF report for /tmp/proj\n");
    const auto& run = only_effect<RunProcess>(t);
    assert(run.command.program == "chromium-browser");

    // Normal exit is not trusted on its own
    auto after_run = reduce(config, t.state, ProcessCompleted{Step::PdfReport, normal_exit("")});
    const auto& check = only_effect<CheckFile>(after_run);
    assert(check.path == "/tmp/proj/report.pdf");

    auto missing = reduce(config, after_run.state, FileChecked{Step::PdfReport, false});
    assert(missing.effects.empty());
    assert(missing.state.log.last() == "PDF report was not generated\n");

    auto present = reduce(config, after_run.state, FileChecked{Step::PdfReport, true});
    assert(present.state.log.last() == "PDF report saved to /tmp/proj/report.pdf\n");
    assert(only_effect<OpenUri>(present).uri == "file:///tmp/proj/report.pdf");

    auto crash = reduce(config, t.state, ProcessCompleted{Step::PdfReport, crashed()});
    assert(crash.effects.empty());
    assert(crash.state.log.last() == "Error generating PDF report\n");

    std::cout << "test_pdf_pipeline: PASSED\n";
}

void test_installer_runs_once() {
    ToolchainConfig config;
    AppState state;
    state.tools.missing = {"cppcheck-htmlreport"};

    auto t = reduce(config, state, InstallRequested{});
    assert(t.state.installer_used);
    assert(t.state.log.last() == "Installing missing utilities...\n");
    const auto& run = only_effect<RunProcess>(t);
    assert(run.command.to_string() == "sudo apt-get install -y cppcheck-htmlreport");

    t = reduce(config, t.state, ProcessCompleted{Step::InstallDependencies, launch_failure("sudo")});
    assert(t.state.installer_used);
    assert(t.state.log.size() == 1);

    auto again = reduce(config, t.state, InstallRequested{});
    assert(again.effects.empty());
    assert(again.state.log.size() == 1);

    // Nothing missing, nothing to install
    auto nothing = reduce(config, AppState{}, InstallRequested{});
    assert(nothing.effects.empty());
    assert(!nothing.state.installer_used);

    std::cout << "test_installer_runs_once: PASSED\n";
}

void test_severity_toggle() {
    ToolchainConfig config;
    auto t = reduce(config, AppState{}, SeverityToggled{Severity::Style, true});
    assert(t.state.severities.is_enabled(Severity::Style));
    t = reduce(config, t.state, SeverityToggled{Severity::Warning, false});
    assert(t.state.severities.enable_argument() == std::string("--enable=style"));

    std::cout << "test_severity_toggle: PASSED\n";
}

int main() {
    std::cout << "Running app reducer tests...\n";

    test_actions_without_project_are_noops();
    test_project_selection_replaces_path();
    test_run_analysis_builds_command();
    test_run_completion_enables_reports();
    test_run_launch_failure_keeps_reports_disabled();
    test_run_crash_still_enables_reports();
    test_html_pipeline_steps();
    test_html_pipeline_failures();
    test_html_pipeline_continues_after_crash();
    test_pdf_without_browser();
    test_pdf_pipeline();
    test_installer_runs_once();
    test_severity_toggle();

    std::cout << "All app reducer tests passed!\n";
    return 0;
}
