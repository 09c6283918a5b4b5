/*
 * File:        main.cpp
 * Module:      ccg-gui
 * Purpose:     Application entry point
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "logging.h"
#include "version.h"
#include "app_presenter.h"
#include <QApplication>
#include <QCommandLineParser>
#include <QtGlobal>

namespace ccg {

static std::shared_ptr<spdlog::logger> g_gui_logger;

std::shared_ptr<spdlog::logger> get_gui_logger() {
    if (!g_gui_logger) {
        // Create GUI logger that shares the core logger's sinks
        auto sinks = presenters::coreLogSinks();
        g_gui_logger = std::make_shared<spdlog::logger>("gui", sinks.begin(), sinks.end());
        spdlog::register_logger(g_gui_logger);
        g_gui_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");

        // Match log level with core logger
        g_gui_logger->set_level(presenters::coreLogLevel());
    }
    return g_gui_logger;
}

void reset_gui_logger() {
    if (g_gui_logger) {
        spdlog::drop(g_gui_logger->name());
        g_gui_logger.reset();
    }
}

} // namespace ccg

// Qt message handler that bridges to spdlog
void qtMessageHandler(QtMsgType type, const QMessageLogContext& /*context*/, const QString& msg)
{
    switch (type) {
    case QtDebugMsg:
        CCG_LOG_DEBUG("[Qt] {}", msg.toStdString());
        break;
    case QtInfoMsg:
        CCG_LOG_INFO("[Qt] {}", msg.toStdString());
        break;
    case QtWarningMsg:
        CCG_LOG_WARN("[Qt] {}", msg.toStdString());
        break;
    case QtCriticalMsg:
        CCG_LOG_ERROR("[Qt] {}", msg.toStdString());
        break;
    case QtFatalMsg:
        CCG_LOG_CRITICAL("[Qt] {}", msg.toStdString());
        break;
    }
}

int main(int argc, char *argv[])
{
    // GIO proxy modules fail to load inside some sandboxes (Snap)
    qputenv("GIO_USE_PROXY", "none");

    QApplication app(argc, argv);

    app.setApplicationName("cppcheck-gui");
    app.setApplicationVersion(CCG_VERSION);
    app.setOrganizationName("cppcheck-gui");

    // Command-line argument parsing
    QCommandLineParser parser;
    parser.setApplicationDescription("Cppcheck GUI - run cppcheck and export HTML/PDF reports");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption logLevelOption(
        "log-level",
        "Set logging verbosity (trace, debug, info, warn, error, critical, off)",
        "level",
        "info"
    );
    parser.addOption(logLevelOption);

    QCommandLineOption logFileOption(
        "log-file",
        "Write logs to specified file (in addition to console)",
        "filename"
    );
    parser.addOption(logFileOption);

    parser.addPositionalArgument("project", "Project directory to select (optional)");

    parser.process(app);

    // Initialize logging system
    std::string log_level = parser.value(logLevelOption).toStdString();
    std::string log_file = parser.value(logFileOption).toStdString();

    // Reset GUI logger so it is recreated with the new sinks
    ccg::reset_gui_logger();
    ccg::presenters::initCoreLogging(log_level, "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v", log_file);

    // Now create GUI logger (it picks up the file sink if one was requested)
    ccg::get_gui_logger()->flush_on(spdlog::level::warn);

    // Install Qt message handler to bridge Qt messages to spdlog
    qInstallMessageHandler(qtMessageHandler);

    CCG_LOG_INFO("cppcheck-gui {} starting", CCG_VERSION);

    MainWindow window;

    const QStringList args = parser.positionalArguments();
    if (!args.isEmpty()) {
        CCG_LOG_INFO("Selecting project from command line: {}", args.first().toStdString());
        window.openProject(args.first());
    }

    window.show();
    CCG_LOG_DEBUG("Main window shown, entering event loop");

    int result = app.exec();
    CCG_LOG_INFO("cppcheck-gui exiting");
    return result;
}
