/*
 * File:        app_presenter.cpp
 * Module:      ccg-presenters
 * Purpose:     Main window presenter - MVP architecture
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "../include/app_presenter.h"
#include "../../core/include/app_reducer.h"
#include "../../core/include/app_state.h"
#include "../../core/include/toolchain_config.h"
#include "../../core/include/tool_probe.h"
#include <logging.h>
#include <deque>
#include <stdexcept>
#include <type_traits>

namespace ccg::presenters {

namespace {

Severity to_core(SeverityToggle severity) {
    switch (severity) {
    case SeverityToggle::Error:       return Severity::Error;
    case SeverityToggle::Warning:     return Severity::Warning;
    case SeverityToggle::Style:       return Severity::Style;
    case SeverityToggle::Performance: return Severity::Performance;
    }
    return Severity::Error;
}

} // namespace

class AppPresenter::Impl {
public:
    Impl(Services services, std::shared_ptr<const ToolchainConfig> config)
        : services_(std::move(services)),
          config_(config ? std::move(config) : std::make_shared<const ToolchainConfig>()) {
        if (!services_.process_runner || !services_.tool_locator ||
            !services_.file_store || !services_.uri_opener) {
            throw std::invalid_argument("AppPresenter: all services must be provided");
        }
    }

    void dispatch(Event event) {
        std::deque<Event> pending;
        pending.push_back(std::move(event));

        while (!pending.empty()) {
            auto transition = reduce(*config_, std::move(state_), pending.front());
            pending.pop_front();
            state_ = std::move(transition.state);
            notify();

            for (const auto& effect : transition.effects) {
                pending.push_back(execute(effect));
            }
        }
    }

    AppViewModel viewModel() const {
        AppViewModel vm;
        vm.has_project = state_.project_path.has_value();
        vm.project_label = vm.has_project ? *state_.project_path
                                          : ui_text(language_, TextId::SelectProject);

        vm.error_enabled = state_.severities.is_enabled(Severity::Error);
        vm.warning_enabled = state_.severities.is_enabled(Severity::Warning);
        vm.style_enabled = state_.severities.is_enabled(Severity::Style);
        vm.performance_enabled = state_.severities.is_enabled(Severity::Performance);

        vm.run_enabled = vm.has_project;
        vm.html_enabled = state_.reports_enabled;
        vm.pdf_enabled = state_.reports_enabled;

        vm.installer_visible = state_.tools.has_missing();
        vm.installer_enabled = vm.installer_visible && !state_.installer_used;
        vm.missing_tools = state_.tools.missing;

        vm.progress = state_.progress;
        vm.log_size = state_.log.size();
        return vm;
    }

    std::vector<std::string> logChunks(std::size_t from) const {
        const auto& chunks = state_.log.chunks();
        if (from >= chunks.size()) {
            return {};
        }
        return std::vector<std::string>(chunks.begin() + static_cast<std::ptrdiff_t>(from), chunks.end());
    }

    void probeTools() {
        dispatch(ToolsProbed{probe_tools(*services_.tool_locator, *config_)});
    }

    void notify() {
        if (listener_) {
            listener_(viewModel());
        }
    }

    Services services_;
    std::shared_ptr<const ToolchainConfig> config_;
    AppState state_;
    Language language_{Language::English};
    StateListener listener_;

private:
    Event execute(const Effect& effect) {
        return std::visit([this](const auto& e) -> Event {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, RunProcess>) {
                return runProcess(e);
            } else if constexpr (std::is_same_v<T, WriteFile>) {
                auto result = services_.file_store->write_file(e.path, e.contents);
                if (!result.ok()) {
                    CCG_LOG_WARN("[{}] Writing {} failed: {}", step_name(e.step), e.path, result.message);
                }
                return FileWritten{e.step, result};
            } else if constexpr (std::is_same_v<T, CheckFile>) {
                bool exists = services_.file_store->exists(e.path);
                CCG_LOG_DEBUG("[{}] {} {}", step_name(e.step), e.path, exists ? "exists" : "is missing");
                return FileChecked{e.step, exists};
            } else {
                CCG_LOG_INFO("[{}] Opening {}", step_name(e.step), e.uri);
                auto result = services_.uri_opener->open_uri(e.uri);
                if (!result.ok()) {
                    CCG_LOG_WARN("[{}] Cannot open {}: {}", step_name(e.step), e.uri, result.message);
                }
                return UriOpened{e.step, result};
            }
        }, effect);
    }

    Event runProcess(const RunProcess& effect) {
        CCG_LOG_INFO("[{}] Running: {}", step_name(effect.step), effect.command.to_string());
        auto result = services_.process_runner->run(effect.command);

        if (const auto* error = std::get_if<public_api::LaunchError>(&result)) {
            CCG_LOG_WARN("[{}] {} could not be started: {}",
                         step_name(effect.step), error->program, error->message);
        } else {
            const auto& output = std::get<public_api::ProcessOutput>(result);
            if (output.exit_status == public_api::ExitStatus::Crashed) {
                CCG_LOG_WARN("[{}] {} terminated abnormally", step_name(effect.step), effect.command.program);
            } else {
                CCG_LOG_DEBUG("[{}] {} exited with code {}",
                              step_name(effect.step), effect.command.program, output.exit_code);
            }
        }
        return ProcessCompleted{effect.step, std::move(result)};
    }
};

AppPresenter::AppPresenter(Services services, std::shared_ptr<const ccg::ToolchainConfig> config)
    : impl_(std::make_unique<Impl>(std::move(services), std::move(config))) {
}

AppPresenter::~AppPresenter() = default;

void AppPresenter::probeTools() {
    impl_->probeTools();
}

void AppPresenter::selectProject(const std::string& path) {
    if (path.empty()) {
        CCG_LOG_DEBUG("Project selection cancelled");
        return;
    }
    auto normalized = normalize_project_path(path);
    CCG_LOG_INFO("Project directory: {}", normalized);
    impl_->dispatch(ProjectSelected{normalized});
}

void AppPresenter::setSeverity(SeverityToggle severity, bool enabled) {
    impl_->dispatch(SeverityToggled{to_core(severity), enabled});
}

void AppPresenter::installDependencies() {
    impl_->dispatch(InstallRequested{});
}

void AppPresenter::runAnalysis() {
    if (!impl_->state_.project_path) {
        CCG_LOG_DEBUG("Run requested without a project directory");
    }
    impl_->dispatch(RunAnalysisRequested{});
}

void AppPresenter::generateHtmlReport() {
    impl_->dispatch(HtmlReportRequested{});
}

void AppPresenter::generatePdfReport() {
    impl_->dispatch(PdfReportRequested{});
}

AppViewModel AppPresenter::viewModel() const {
    return impl_->viewModel();
}

std::vector<std::string> AppPresenter::logChunks(std::size_t from) const {
    return impl_->logChunks(from);
}

void AppPresenter::setLanguage(Language language) {
    impl_->language_ = language;
    impl_->notify();
}

Language AppPresenter::language() const {
    return impl_->language_;
}

void AppPresenter::setStateListener(StateListener listener) {
    impl_->listener_ = std::move(listener);
}

} // namespace ccg::presenters
