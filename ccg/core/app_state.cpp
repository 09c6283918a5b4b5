/*
 * File:        app_state.cpp
 * Module:      ccg-core
 * Purpose:     Application state, events and effects
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "include/app_state.h"

namespace ccg {

void LogBuffer::append(std::string chunk) {
    chunks_.push_back(std::move(chunk));
}

const std::string& LogBuffer::last() const {
    static const std::string empty;
    return chunks_.empty() ? empty : chunks_.back();
}

std::string LogBuffer::text() const {
    std::string all;
    for (const auto& chunk : chunks_) {
        all += chunk;
    }
    return all;
}

const char* step_name(Step step) {
    switch (step) {
    case Step::InstallDependencies: return "install-dependencies";
    case Step::RunAnalysis:         return "run-analysis";
    case Step::XmlReport:           return "xml-report";
    case Step::HtmlReport:          return "html-report";
    case Step::OpenHtmlReport:      return "open-html-report";
    case Step::PdfReport:           return "pdf-report";
    case Step::OpenPdfReport:       return "open-pdf-report";
    }
    return "unknown";
}

} // namespace ccg
