/*
 * File:        ui_text.h
 * Module:      ccg-presenters
 * Purpose:     Translated widget labels
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ccg::presenters {

/**
 * @brief Languages offered by the language selector
 *
 * Only widget labels are translated. Log output stays in English.
 */
enum class Language {
    English,
    Russian
};

/**
 * @brief Identifiers of translatable labels
 */
enum class TextId {
    WindowTitle,
    SelectProject,
    SelectProjectDialogTitle,
    SeverityError,
    SeverityWarning,
    SeverityStyle,
    SeverityPerformance,
    RunAnalysis,
    GenerateHtml,
    GeneratePdf,
    InstallDependencies,
    MissingToolsHint
};

/// Label text for @p id in @p language (UTF-8)
std::string ui_text(Language language, TextId id);

/// Short code shown in the selector ("en", "ru")
std::string language_code(Language language);

/// Parse a code produced by language_code()
std::optional<Language> language_from_code(const std::string& code);

/// Languages in selector order
std::vector<Language> available_languages();

} // namespace ccg::presenters
