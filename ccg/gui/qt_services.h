/*
 * File:        qt_services.h
 * Module:      ccg-gui
 * Purpose:     Qt implementations of the process, lookup and URI services
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef QT_SERVICES_H
#define QT_SERVICES_H

#include <ccg_services.h>

/**
 * @brief Runs external tools with QProcess
 *
 * Blocks until the process exits (no timeout). stdout and stderr are
 * captured on separate channels.
 */
class QtProcessRunner : public ccg::public_api::ProcessRunner
{
public:
    ccg::public_api::ProcessResult run(const ccg::public_api::CommandLine& command) override;
};

/**
 * @brief Finds executables on PATH with QStandardPaths
 */
class QtToolLocator : public ccg::public_api::ToolLocator
{
public:
    std::optional<std::string> locate(const std::string& name) const override;
};

/**
 * @brief Opens URIs with the desktop's default handler
 */
class QtUriOpener : public ccg::public_api::UriOpener
{
public:
    ccg::public_api::OperationResult open_uri(const std::string& uri) override;
};

#endif // QT_SERVICES_H
