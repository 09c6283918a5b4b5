/*
 * File:        mainwindow.h
 * Module:      ccg-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QString>
#include <memory>
#include <cstddef>
#include <functional>
#include "app_presenter.h"

class QCheckBox;
class QComboBox;
class QPlainTextEdit;
class QProgressBar;
class QPushButton;
class QLabel;

/**
 * Main window for cppcheck-gui
 *
 * Layout (top to bottom):
 * - Language selector
 * - Project directory button (shows the selected path)
 * - Severity checkboxes
 * - Run / Generate HTML / Generate PDF buttons
 * - Log view
 * - Install Dependencies button (only when tools are missing)
 * - Progress bar
 *
 * Architecture: this window is a thin display client. All decisions are
 * made by ccg::presenters::AppPresenter; the window forwards user actions
 * and redraws itself from the presenter's view model.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    /// Select a project directory without showing the chooser
    void openProject(const QString& directory);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onSelectProject();
    void onRunAnalysis();
    void onGenerateHtml();
    void onGeneratePdf();
    void onInstallDependencies();
    void onLanguageChanged(int index);
    void onSeverityToggled();

private:
    void setupUI();
    void retranslateUI();
    void applyViewModel(const ccg::presenters::AppViewModel& vm);
    void appendNewLogChunks();
    void runPresenterAction(const std::function<void()>& action);

    void saveSettings();
    void restoreSettings();
    QString getLastProjectDirectory() const;
    void setLastProjectDirectory(const QString& path);

    std::unique_ptr<ccg::presenters::AppPresenter> presenter_;

    QComboBox* language_combo_;
    QPushButton* select_button_;
    QCheckBox* error_check_;
    QCheckBox* warning_check_;
    QCheckBox* style_check_;
    QCheckBox* performance_check_;
    QPushButton* run_button_;
    QPushButton* html_button_;
    QPushButton* pdf_button_;
    QPlainTextEdit* log_view_;
    QLabel* missing_label_;
    QPushButton* install_button_;
    QProgressBar* progress_bar_;

    std::size_t shown_log_chunks_;
    bool updating_ui_;
    bool dispatching_;
    bool close_pending_;
};

#endif // MAINWINDOW_H
