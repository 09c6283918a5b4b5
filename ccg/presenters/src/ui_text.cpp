/*
 * File:        ui_text.cpp
 * Module:      ccg-presenters
 * Purpose:     Translated widget labels
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "../include/ui_text.h"

namespace ccg::presenters {

namespace {

std::string english(TextId id) {
    switch (id) {
    case TextId::WindowTitle:              return "Cppcheck GUI";
    case TextId::SelectProject:            return "Select Project Directory";
    case TextId::SelectProjectDialogTitle: return "Select Project Directory";
    case TextId::SeverityError:            return "Error";
    case TextId::SeverityWarning:          return "Warning";
    case TextId::SeverityStyle:            return "Style";
    case TextId::SeverityPerformance:      return "Performance";
    case TextId::RunAnalysis:              return "Run Cppcheck";
    case TextId::GenerateHtml:             return "Generate HTML";
    case TextId::GeneratePdf:              return "Generate PDF";
    case TextId::InstallDependencies:      return "Install Dependencies";
    case TextId::MissingToolsHint:         return "Missing utilities:";
    }
    return "";
}

std::string russian(TextId id) {
    switch (id) {
    case TextId::WindowTitle:              return "Cppcheck GUI";
    case TextId::SelectProject:            return "Выбрать каталог проекта";
    case TextId::SelectProjectDialogTitle: return "Выбор каталога проекта";
    case TextId::SeverityError:            return "Ошибки";
    case TextId::SeverityWarning:          return "Предупреждения";
    case TextId::SeverityStyle:            return "Стиль";
    case TextId::SeverityPerformance:      return "Производительность";
    case TextId::RunAnalysis:              return "Запустить Cppcheck";
    case TextId::GenerateHtml:             return "Создать HTML";
    case TextId::GeneratePdf:              return "Создать PDF";
    case TextId::InstallDependencies:      return "Установить зависимости";
    case TextId::MissingToolsHint:         return "Отсутствующие утилиты:";
    }
    return "";
}

} // namespace

std::string ui_text(Language language, TextId id) {
    switch (language) {
    case Language::English: return english(id);
    case Language::Russian: return russian(id);
    }
    return english(id);
}

std::string language_code(Language language) {
    switch (language) {
    case Language::English: return "en";
    case Language::Russian: return "ru";
    }
    return "en";
}

std::optional<Language> language_from_code(const std::string& code) {
    for (auto language : available_languages()) {
        if (language_code(language) == code) {
            return language;
        }
    }
    return std::nullopt;
}

std::vector<Language> available_languages() {
    return {Language::English, Language::Russian};
}

} // namespace ccg::presenters
