/*
 * File:        mainwindow.cpp
 * Module:      ccg-gui
 * Purpose:     Main application window
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2026 Simon Inns
 */

#include "mainwindow.h"
#include "qt_services.h"
#include "logging.h"
#include <QApplication>
#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDir>
#include <QFileDialog>
#include <QFileInfo>
#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QPlainTextEdit>
#include <QProgressBar>
#include <QPushButton>
#include <QScrollBar>
#include <QSettings>
#include <QSignalBlocker>
#include <QStringList>
#include <QTextCursor>
#include <QVBoxLayout>
#include <QWidget>

using ccg::presenters::AppPresenter;
using ccg::presenters::AppViewModel;
using ccg::presenters::Language;
using ccg::presenters::SeverityToggle;
using ccg::presenters::TextId;

namespace {

QString tr_text(Language language, TextId id)
{
    return QString::fromStdString(ccg::presenters::ui_text(language, id));
}

} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent),
      language_combo_(nullptr),
      select_button_(nullptr),
      error_check_(nullptr),
      warning_check_(nullptr),
      style_check_(nullptr),
      performance_check_(nullptr),
      run_button_(nullptr),
      html_button_(nullptr),
      pdf_button_(nullptr),
      log_view_(nullptr),
      missing_label_(nullptr),
      install_button_(nullptr),
      progress_bar_(nullptr),
      shown_log_chunks_(0),
      updating_ui_(false),
      dispatching_(false),
      close_pending_(false)
{
    ccg::presenters::Services services;
    services.process_runner = std::make_shared<QtProcessRunner>();
    services.tool_locator = std::make_shared<QtToolLocator>();
    services.file_store = ccg::presenters::makeLocalFileStore();
    services.uri_opener = std::make_shared<QtUriOpener>();
    presenter_ = std::make_unique<AppPresenter>(std::move(services));

    setupUI();
    restoreSettings();

    presenter_->setStateListener([this](const AppViewModel& vm) {
        applyViewModel(vm);
        // Let the label and log repaint before a blocking tool run. Window
        // close requests can still arrive here; closeEvent defers them.
        QApplication::processEvents(QEventLoop::ExcludeUserInputEvents);
    });

    presenter_->probeTools();
    retranslateUI();
}

MainWindow::~MainWindow()
{
    // The listener captures this; drop it before widgets go away
    presenter_->setStateListener(nullptr);
}

void MainWindow::setupUI()
{
    auto* central = new QWidget(this);
    auto* main_layout = new QVBoxLayout(central);
    main_layout->setSpacing(8);

    // Language selector
    language_combo_ = new QComboBox();
    for (auto language : ccg::presenters::available_languages()) {
        language_combo_->addItem(QString::fromStdString(ccg::presenters::language_code(language)),
                                 static_cast<int>(language));
    }
    main_layout->addWidget(language_combo_);

    // Directory chooser button
    select_button_ = new QPushButton();
    main_layout->addWidget(select_button_);

    // Severity filters
    auto* checks_layout = new QHBoxLayout();
    checks_layout->setSpacing(4);
    error_check_ = new QCheckBox();
    warning_check_ = new QCheckBox();
    style_check_ = new QCheckBox();
    performance_check_ = new QCheckBox();
    checks_layout->addWidget(error_check_);
    checks_layout->addWidget(warning_check_);
    checks_layout->addWidget(style_check_);
    checks_layout->addWidget(performance_check_);
    checks_layout->addStretch();
    main_layout->addLayout(checks_layout);

    // Control buttons
    auto* buttons_layout = new QHBoxLayout();
    buttons_layout->setSpacing(4);
    run_button_ = new QPushButton();
    html_button_ = new QPushButton();
    pdf_button_ = new QPushButton();
    buttons_layout->addWidget(run_button_);
    buttons_layout->addWidget(html_button_);
    buttons_layout->addWidget(pdf_button_);
    buttons_layout->addStretch();
    main_layout->addLayout(buttons_layout);

    // Log area
    log_view_ = new QPlainTextEdit();
    log_view_->setReadOnly(true);
    log_view_->setLineWrapMode(QPlainTextEdit::NoWrap);
    QFont mono("Monospace");
    mono.setStyleHint(QFont::TypeWriter);
    log_view_->setFont(mono);
    main_layout->addWidget(log_view_, 1);

    // Dependency installer (hidden unless something is missing)
    missing_label_ = new QLabel();
    missing_label_->setVisible(false);
    main_layout->addWidget(missing_label_);
    install_button_ = new QPushButton();
    install_button_->setVisible(false);
    main_layout->addWidget(install_button_);

    // Progress bar
    progress_bar_ = new QProgressBar();
    progress_bar_->setRange(0, 100);
    progress_bar_->setValue(0);
    main_layout->addWidget(progress_bar_);

    setCentralWidget(central);

    connect(language_combo_, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onLanguageChanged);
    connect(select_button_, &QPushButton::clicked, this, &MainWindow::onSelectProject);
    connect(error_check_, &QCheckBox::toggled, this, &MainWindow::onSeverityToggled);
    connect(warning_check_, &QCheckBox::toggled, this, &MainWindow::onSeverityToggled);
    connect(style_check_, &QCheckBox::toggled, this, &MainWindow::onSeverityToggled);
    connect(performance_check_, &QCheckBox::toggled, this, &MainWindow::onSeverityToggled);
    connect(run_button_, &QPushButton::clicked, this, &MainWindow::onRunAnalysis);
    connect(html_button_, &QPushButton::clicked, this, &MainWindow::onGenerateHtml);
    connect(pdf_button_, &QPushButton::clicked, this, &MainWindow::onGeneratePdf);
    connect(install_button_, &QPushButton::clicked, this, &MainWindow::onInstallDependencies);
}

void MainWindow::retranslateUI()
{
    auto language = presenter_->language();
    setWindowTitle(tr_text(language, TextId::WindowTitle));
    error_check_->setText(tr_text(language, TextId::SeverityError));
    warning_check_->setText(tr_text(language, TextId::SeverityWarning));
    style_check_->setText(tr_text(language, TextId::SeverityStyle));
    performance_check_->setText(tr_text(language, TextId::SeverityPerformance));
    run_button_->setText(tr_text(language, TextId::RunAnalysis));
    html_button_->setText(tr_text(language, TextId::GenerateHtml));
    pdf_button_->setText(tr_text(language, TextId::GeneratePdf));
    install_button_->setText(tr_text(language, TextId::InstallDependencies));

    applyViewModel(presenter_->viewModel());
}

void MainWindow::applyViewModel(const AppViewModel& vm)
{
    updating_ui_ = true;

    select_button_->setText(QString::fromStdString(vm.project_label));

    error_check_->setChecked(vm.error_enabled);
    warning_check_->setChecked(vm.warning_enabled);
    style_check_->setChecked(vm.style_enabled);
    performance_check_->setChecked(vm.performance_enabled);

    run_button_->setEnabled(vm.run_enabled);
    html_button_->setEnabled(vm.html_enabled);
    pdf_button_->setEnabled(vm.pdf_enabled);

    install_button_->setVisible(vm.installer_visible);
    install_button_->setEnabled(vm.installer_enabled);
    missing_label_->setVisible(vm.installer_visible);
    if (vm.installer_visible) {
        QStringList names;
        for (const auto& tool : vm.missing_tools) {
            names << QString::fromStdString(tool);
        }
        missing_label_->setText(tr_text(presenter_->language(), TextId::MissingToolsHint) +
                                " " + names.join(", "));
    }

    progress_bar_->setValue(static_cast<int>(vm.progress * 100.0));

    if (vm.log_size > shown_log_chunks_) {
        appendNewLogChunks();
    }

    updating_ui_ = false;
}

void MainWindow::appendNewLogChunks()
{
    const auto chunks = presenter_->logChunks(shown_log_chunks_);
    shown_log_chunks_ += chunks.size();

    QTextCursor cursor(log_view_->document());
    cursor.movePosition(QTextCursor::End);
    for (const auto& chunk : chunks) {
        cursor.insertText(QString::fromUtf8(chunk.data(), static_cast<int>(chunk.size())));
    }
    log_view_->verticalScrollBar()->setValue(log_view_->verticalScrollBar()->maximum());
}

void MainWindow::openProject(const QString& directory)
{
    QFileInfo info(directory);
    if (!info.isDir()) {
        CCG_LOG_WARN("Not a directory, ignoring: {}", directory.toStdString());
        return;
    }
    presenter_->selectProject(info.absoluteFilePath().toStdString());
}

void MainWindow::onSelectProject()
{
    QString directory = QFileDialog::getExistingDirectory(
        this,
        tr_text(presenter_->language(), TextId::SelectProjectDialogTitle),
        getLastProjectDirectory(),
        QFileDialog::ShowDirsOnly
    );

    if (directory.isEmpty()) {
        CCG_LOG_DEBUG("Directory selection cancelled");
        return;
    }

    setLastProjectDirectory(directory);
    presenter_->selectProject(QDir(directory).absolutePath().toStdString());
}

void MainWindow::onRunAnalysis()
{
    runPresenterAction([this]() { presenter_->runAnalysis(); });
}

void MainWindow::onGenerateHtml()
{
    runPresenterAction([this]() { presenter_->generateHtmlReport(); });
}

void MainWindow::onGeneratePdf()
{
    runPresenterAction([this]() { presenter_->generatePdfReport(); });
}

void MainWindow::onInstallDependencies()
{
    runPresenterAction([this]() { presenter_->installDependencies(); });
}

void MainWindow::onLanguageChanged(int index)
{
    if (index < 0) {
        return;
    }
    auto language = static_cast<Language>(language_combo_->itemData(index).toInt());
    presenter_->setLanguage(language);
    retranslateUI();
}

void MainWindow::onSeverityToggled()
{
    if (updating_ui_) {
        return;
    }
    auto* check = qobject_cast<QCheckBox*>(sender());
    if (!check) {
        return;
    }

    SeverityToggle severity = SeverityToggle::Error;
    if (check == warning_check_) {
        severity = SeverityToggle::Warning;
    } else if (check == style_check_) {
        severity = SeverityToggle::Style;
    } else if (check == performance_check_) {
        severity = SeverityToggle::Performance;
    }
    presenter_->setSeverity(severity, check->isChecked());
}

void MainWindow::runPresenterAction(const std::function<void()>& action)
{
    if (dispatching_) {
        CCG_LOG_DEBUG("Action ignored, another one is still running");
        return;
    }

    dispatching_ = true;
    action();
    dispatching_ = false;

    if (close_pending_) {
        CCG_LOG_DEBUG("Closing after the running action finished");
        close();
    }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    if (dispatching_) {
        // Presenter is mid-dispatch below us on the stack
        close_pending_ = true;
        event->ignore();
        return;
    }

    saveSettings();
    QMainWindow::closeEvent(event);
}

// Settings helpers

void MainWindow::saveSettings()
{
    QSettings settings("cppcheck-gui", "cppcheck-gui");
    settings.setValue("mainwindow/geometry", saveGeometry());
    settings.setValue("language",
                      QString::fromStdString(ccg::presenters::language_code(presenter_->language())));
}

void MainWindow::restoreSettings()
{
    QSettings settings("cppcheck-gui", "cppcheck-gui");

    if (settings.contains("mainwindow/geometry")) {
        restoreGeometry(settings.value("mainwindow/geometry").toByteArray());
    } else {
        resize(800, 600);
    }

    auto code = settings.value("language", "en").toString().toStdString();
    if (auto language = ccg::presenters::language_from_code(code)) {
        presenter_->setLanguage(*language);
        int index = language_combo_->findData(static_cast<int>(*language));
        if (index >= 0) {
            QSignalBlocker blocker(language_combo_);
            language_combo_->setCurrentIndex(index);
        }
    }
}

QString MainWindow::getLastProjectDirectory() const
{
    QSettings settings("cppcheck-gui", "cppcheck-gui");
    QString dir = settings.value("lastProjectDirectory", QString()).toString();
    if (dir.isEmpty() || !QFileInfo(dir).isDir()) {
        return QDir::homePath();
    }
    return dir;
}

void MainWindow::setLastProjectDirectory(const QString& path)
{
    QSettings settings("cppcheck-gui", "cppcheck-gui");
    settings.setValue("lastProjectDirectory", path);
}
