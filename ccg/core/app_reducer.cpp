/*
 * File:        app_reducer.cpp
 * Module:      ccg-core
 * Purpose:     Pure state transition function for the application
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/app_reducer.h"

#include <fmt/format.h>

namespace ccg {

namespace {

using public_api::ProcessOutput;
using public_api::completed_normally;
using public_api::launched;

void append_output(LogBuffer& log, const ProcessResult& result) {
    if (const auto* output = std::get_if<ProcessOutput>(&result)) {
        log.append(output->standard_output);
        log.append(output->standard_error);
    }
}

class Reducer {
public:
    Reducer(const ToolchainConfig& config, AppState state)
        : config_(config) {
        transition_.state = std::move(state);
    }

    Transition take() { return std::move(transition_); }

    void operator()(const ToolsProbed& event) {
        state().tools = event.tools;
        state().tools_probed = true;
    }

    void operator()(const ProjectSelected& event) {
        if (event.path.empty()) {
            return;
        }
        state().project_path = event.path;
    }

    void operator()(const SeverityToggled& event) {
        state().severities.set_enabled(event.severity, event.enabled);
    }

    void operator()(const InstallRequested&) {
        if (state().installer_used || !state().tools.has_missing()) {
            return;
        }
        state().installer_used = true;
        state().log.append(messages::kInstalling);
        emit(RunProcess{Step::InstallDependencies,
                        build_install_command(config_, state().tools.missing)});
    }

    void operator()(const RunAnalysisRequested&) {
        if (!state().project_path) {
            return;
        }
        const auto& path = *state().project_path;
        state().log.append(fmt::format("Running cppcheck on {}\n", path));
        state().progress = 0.0;
        emit(RunProcess{Step::RunAnalysis,
                        build_analysis_command(config_, state().severities, path)});
    }

    void operator()(const HtmlReportRequested&) {
        if (!state().project_path) {
            return;
        }
        const auto& path = *state().project_path;
        state().log.append(fmt::format("Generating HTML report for {}\n", path));
        emit(RunProcess{Step::XmlReport, build_xml_report_command(config_, path)});
    }

    void operator()(const PdfReportRequested&) {
        if (!state().project_path) {
            return;
        }
        if (!state().tools.pdf_browser) {
            state().log.append(messages::kNoPdfUtility);
            return;
        }
        const auto& path = *state().project_path;
        state().log.append(fmt::format("Generating PDF report for {}\n", path));
        emit(RunProcess{Step::PdfReport,
                        build_pdf_command(config_, *state().tools.pdf_browser, path)});
    }

    void operator()(const ProcessCompleted& event) {
        switch (event.step) {
        case Step::InstallDependencies:
            append_output(state().log, event.result);
            break;

        case Step::RunAnalysis:
            append_output(state().log, event.result);
            state().progress = 1.0;
            // Exit status is not inspected; a crash still enables reports
            if (launched(event.result)) {
                state().reports_enabled = true;
            }
            break;

        case Step::XmlReport:
            if (!state().project_path) break;
            if (!launched(event.result)) {
                state().log.append(messages::kXmlRunFailed);
                break;
            }
            // cppcheck writes its XML to stderr, partial if it crashed
            emit(WriteFile{Step::XmlReport,
                           xml_report_path(config_, *state().project_path),
                           std::get<ProcessOutput>(event.result).standard_error});
            break;

        case Step::HtmlReport:
            if (!state().project_path) break;
            if (!launched(event.result)) {
                state().log.append(messages::kHtmlRenderFailed);
                break;
            }
            state().log.append(fmt::format("HTML report saved to {}\n",
                                           html_report_dir(config_, *state().project_path)));
            emit(OpenUri{Step::OpenHtmlReport,
                         file_uri(html_index_path(config_, *state().project_path))});
            break;

        case Step::PdfReport:
            if (!state().project_path) break;
            if (!completed_normally(event.result)) {
                state().log.append(messages::kPdfRunFailed);
                break;
            }
            // The exit status alone does not prove the file was written
            emit(CheckFile{Step::PdfReport, pdf_report_path(config_, *state().project_path)});
            break;

        case Step::OpenHtmlReport:
        case Step::OpenPdfReport:
            break;
        }
    }

    void operator()(const FileWritten& event) {
        if (event.step != Step::XmlReport || !state().project_path) {
            return;
        }
        if (!event.result.ok()) {
            state().log.append(messages::kXmlWriteFailed);
            return;
        }
        emit(RunProcess{Step::HtmlReport,
                        build_html_report_command(config_, *state().project_path)});
    }

    void operator()(const FileChecked& event) {
        if (event.step != Step::PdfReport || !state().project_path) {
            return;
        }
        if (!event.exists) {
            state().log.append(messages::kPdfMissing);
            return;
        }
        auto pdf = pdf_report_path(config_, *state().project_path);
        state().log.append(fmt::format("PDF report saved to {}\n", pdf));
        emit(OpenUri{Step::OpenPdfReport, file_uri(pdf)});
    }

    void operator()(const UriOpened& event) {
        if (event.result.ok()) {
            return;
        }
        if (event.step == Step::OpenHtmlReport) {
            state().log.append(fmt::format("Failed to open HTML report: {}\n", event.result.message));
        } else if (event.step == Step::OpenPdfReport) {
            state().log.append(fmt::format("Failed to open PDF report: {}\n", event.result.message));
        }
    }

private:
    AppState& state() { return transition_.state; }
    void emit(Effect effect) { transition_.effects.push_back(std::move(effect)); }

    const ToolchainConfig& config_;
    Transition transition_;
};

} // namespace

Transition reduce(const ToolchainConfig& config, AppState state, const Event& event) {
    Reducer reducer(config, std::move(state));
    std::visit(reducer, event);
    return reducer.take();
}

} // namespace ccg
