/*
 * File:        qt_services.cpp
 * Module:      ccg-gui
 * Purpose:     Qt implementations of the process, lookup and URI services
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "qt_services.h"
#include "logging.h"
#include <QDesktopServices>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>
#include <QUrl>

using ccg::ResultCode;
using ccg::public_api::CommandLine;
using ccg::public_api::ExitStatus;
using ccg::public_api::LaunchError;
using ccg::public_api::OperationResult;
using ccg::public_api::ProcessOutput;
using ccg::public_api::ProcessResult;

ProcessResult QtProcessRunner::run(const CommandLine& command)
{
    QStringList arguments;
    for (const auto& arg : command.arguments) {
        arguments << QString::fromStdString(arg);
    }

    QProcess process;
    process.setProcessChannelMode(QProcess::SeparateChannels);
    process.start(QString::fromStdString(command.program), arguments);

    if (!process.waitForStarted(-1)) {
        CCG_LOG_DEBUG("QProcess failed to start {}: {}", command.program,
                      process.errorString().toStdString());
        return LaunchError{command.program, ResultCode::ERROR_LAUNCH_FAILED,
                           process.errorString().toStdString()};
    }

    // No timeout: a hung tool keeps the caller waiting
    process.waitForFinished(-1);

    ProcessOutput output;
    output.exit_status = process.exitStatus() == QProcess::NormalExit ? ExitStatus::Normal
                                                                      : ExitStatus::Crashed;
    output.exit_code = process.exitCode();

    QByteArray out = process.readAllStandardOutput();
    QByteArray err = process.readAllStandardError();
    output.standard_output.assign(out.constData(), static_cast<size_t>(out.size()));
    output.standard_error.assign(err.constData(), static_cast<size_t>(err.size()));
    return output;
}

std::optional<std::string> QtToolLocator::locate(const std::string& name) const
{
    QString path = QStandardPaths::findExecutable(QString::fromStdString(name));
    if (path.isEmpty()) {
        return std::nullopt;
    }
    return path.toStdString();
}

OperationResult QtUriOpener::open_uri(const std::string& uri)
{
    QUrl url(QString::fromStdString(uri), QUrl::TolerantMode);
    if (!url.isValid()) {
        return OperationResult::failure(ResultCode::ERROR_INVALID_ARGUMENT,
                                        url.errorString().toStdString());
    }
    if (!QDesktopServices::openUrl(url)) {
        return OperationResult::failure(ResultCode::ERROR_NO_HANDLER,
                                        "no application could open " + uri);
    }
    return OperationResult::success();
}
