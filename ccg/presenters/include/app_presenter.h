/*
 * File:        app_presenter.h
 * Module:      ccg-presenters
 * Purpose:     Main window presenter - MVP architecture
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef CCG_PRESENTERS_APP_PRESENTER_H
#define CCG_PRESENTERS_APP_PRESENTER_H

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <ccg_services.h>
#include "app_view_models.h"
#include "ui_text.h"

// Forward declare core types
namespace ccg {
    struct ToolchainConfig;
}

namespace ccg::presenters {

// === Application Initialization ===

/**
 * @brief Initialize the core logging system
 * @param level Log level (trace, debug, info, warn, error, critical, off)
 * @param pattern Optional custom pattern
 * @param log_file Optional file path to write logs to (in addition to console)
 */
void initCoreLogging(const std::string& level = "info",
                     const std::string& pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                     const std::string& log_file = "");

/**
 * @brief Sinks of the core logger, so the GUI logger can share them
 */
std::vector<spdlog::sink_ptr> coreLogSinks();

/**
 * @brief Current level of the core logger
 */
spdlog::level::level_enum coreLogLevel();

/**
 * @brief Platform services the presenter drives
 *
 * All four must be non-null.
 */
struct Services {
    std::shared_ptr<public_api::ProcessRunner> process_runner;
    std::shared_ptr<public_api::ToolLocator> tool_locator;
    std::shared_ptr<public_api::FileStore> file_store;
    std::shared_ptr<public_api::UriOpener> uri_opener;
};

/**
 * @brief FileStore writing to the local filesystem
 */
std::shared_ptr<public_api::FileStore> makeLocalFileStore();

/**
 * @brief AppPresenter - Owns the application state and runs its effects
 *
 * Every user action becomes an event for the core reducer. The effects the
 * reducer asks for (subprocesses, file writes, existence checks, URI
 * opening) are executed here, in order, and their results are fed back as
 * events until nothing is left to do.
 *
 * Everything runs synchronously on the caller's thread, so a long external
 * tool blocks the caller for its whole duration.
 */
class AppPresenter {
public:
    using StateListener = std::function<void(const AppViewModel&)>;

    /**
     * @brief Construct the presenter
     * @param services Platform services (must all be set)
     * @param config Toolchain configuration, defaults when null
     * @throws std::invalid_argument if a service is missing
     */
    explicit AppPresenter(Services services,
                          std::shared_ptr<const ccg::ToolchainConfig> config = nullptr);
    ~AppPresenter();

    AppPresenter(const AppPresenter&) = delete;
    AppPresenter& operator=(const AppPresenter&) = delete;

    /**
     * @brief Look up every external tool once
     *
     * Call at startup, before any other action.
     */
    void probeTools();

    /**
     * @brief Set the project directory
     *
     * The path is made absolute and loses any trailing separator. An empty
     * path (dialog cancelled) leaves the current selection unchanged.
     */
    void selectProject(const std::string& path);

    void setSeverity(SeverityToggle severity, bool enabled);

    /// Install the missing tools with the package manager (once)
    void installDependencies();

    /// Run the analyzer on the selected directory
    void runAnalysis();

    /// Produce and open the HTML report
    void generateHtmlReport();

    /// Print the HTML report to PDF with a headless browser and open it
    void generatePdfReport();

    AppViewModel viewModel() const;

    /// Log chunks starting at index @p from
    std::vector<std::string> logChunks(std::size_t from = 0) const;

    void setLanguage(Language language);
    Language language() const;

    /// Called after every state change, including intermediate pipeline steps
    void setStateListener(StateListener listener);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ccg::presenters

#endif // CCG_PRESENTERS_APP_PRESENTER_H
