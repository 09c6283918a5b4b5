/*
 * File:        test_ui_text.cpp
 * Module:      ccg-tests
 * Purpose:     Widget label translation tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "ui_text.h"
#include <cassert>
#include <iostream>

using namespace ccg::presenters;

void test_language_codes() {
    assert(language_code(Language::English) == "en");
    assert(language_code(Language::Russian) == "ru");
    assert(language_from_code("ru") == Language::Russian);
    assert(language_from_code("en") == Language::English);
    assert(!language_from_code("de").has_value());
    assert(!language_from_code("").has_value());

    auto languages = available_languages();
    assert(languages.size() == 2);
    assert(languages.front() == Language::English);

    std::cout << "test_language_codes: PASSED\n";
}

void test_every_label_translated() {
    const TextId ids[] = {
        TextId::SelectProject, TextId::SelectProjectDialogTitle,
        TextId::SeverityError, TextId::SeverityWarning,
        TextId::SeverityStyle, TextId::SeverityPerformance,
        TextId::RunAnalysis, TextId::GenerateHtml, TextId::GeneratePdf,
        TextId::InstallDependencies, TextId::MissingToolsHint};

    for (auto id : ids) {
        auto en = ui_text(Language::English, id);
        auto ru = ui_text(Language::Russian, id);
        assert(!en.empty());
        assert(!ru.empty());
        assert(en != ru);
    }

    assert(ui_text(Language::English, TextId::RunAnalysis) == "Run Cppcheck");
    assert(ui_text(Language::English, TextId::WindowTitle) ==
           ui_text(Language::Russian, TextId::WindowTitle));

    std::cout << "test_every_label_translated: PASSED\n";
}

int main() {
    std::cout << "Running UI text tests...\n";

    test_language_codes();
    test_every_label_translated();

    std::cout << "All UI text tests passed!\n";
    return 0;
}
