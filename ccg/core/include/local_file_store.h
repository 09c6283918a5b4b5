/*
 * File:        local_file_store.h
 * Module:      ccg-core
 * Purpose:     FileStore backed by the local filesystem
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <ccg_services.h>

namespace ccg {

class LocalFileStore : public public_api::FileStore {
public:
    public_api::OperationResult write_file(const std::string& path, const std::string& contents) override;
    bool exists(const std::string& path) const override;
};

} // namespace ccg
