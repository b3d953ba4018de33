// BSD 3-Clause License
//
// Copyright (c) 2021-2025, 🍀☀🌕🌥 🌊
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice, this
//    list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
//    this list of conditions and the following disclaimer in the documentation
//    and/or other materials provided with the distribution.
//
// 3. Neither the name of the copyright holder nor the names of its
//    contributors may be used to endorse or promote products derived from
//    this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE
// FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL
// DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR
// SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER
// CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY,
// OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE
// OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

// Ecosystem logger headers must precede Qt to avoid emit() macro conflict
#include <kcenon/common/interfaces/global_logger_registry.h>

#include "ui/dialogs/settings_dialog.hpp"

#include <QCheckBox>
#include <QComboBox>
#include <QDialogButtonBox>
#include <QFileDialog>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSettings>
#include <QVBoxLayout>

#include <iterator>

namespace graft_template::ui {

namespace {

struct LogLevelEntry {
    AppLogLevel level;
    const char* name;
    const char* description;
};

constexpr LogLevelEntry kLogLevels[] = {
    {AppLogLevel::Exception,   "Exception",   "Unexpected failures only"},
    {AppLogLevel::Error,       "Error",       "Exception + rejected fenestrations and export errors"},
    {AppLogLevel::Information, "Information", "Exception + Error + planning and export events (default)"},
    {AppLogLevel::Debug,       "Debug",       "All messages including rendering traces"},
};

} // anonymous namespace

class SettingsDialog::Impl {
public:
    QComboBox* logLevelCombo = nullptr;
    QLabel* descriptionLabel = nullptr;
    QCheckBox* fileLoggingCheck = nullptr;
    QLineEdit* devicesPathEdit = nullptr;
    QString initialDevicesPath;
};

SettingsDialog::SettingsDialog(QWidget* parent)
    : QDialog(parent)
    , impl_(std::make_unique<Impl>())
{
    setupUI();
    loadSettings();
}

SettingsDialog::~SettingsDialog() = default;

void SettingsDialog::setupUI()
{
    setWindowTitle(tr("Preferences"));
    setMinimumWidth(440);

    auto* mainLayout = new QVBoxLayout(this);

    // Logging
    auto* loggingGroup = new QGroupBox(tr("Logging"));
    auto* loggingLayout = new QVBoxLayout(loggingGroup);

    auto* levelLayout = new QHBoxLayout;
    levelLayout->addWidget(new QLabel(tr("Log Level:")));

    impl_->logLevelCombo = new QComboBox;
    for (const auto& entry : kLogLevels) {
        impl_->logLevelCombo->addItem(tr(entry.name));
    }
    levelLayout->addWidget(impl_->logLevelCombo, 1);
    loggingLayout->addLayout(levelLayout);

    impl_->descriptionLabel = new QLabel;
    impl_->descriptionLabel->setWordWrap(true);
    impl_->descriptionLabel->setStyleSheet("color: gray; font-style: italic;");
    loggingLayout->addWidget(impl_->descriptionLabel);

    impl_->fileLoggingCheck = new QCheckBox(tr("Write log file (applies after restart)"));
    loggingLayout->addWidget(impl_->fileLoggingCheck);

    mainLayout->addWidget(loggingGroup);

    // Device catalog
    auto* catalogGroup = new QGroupBox(tr("Device Catalog"));
    auto* catalogLayout = new QHBoxLayout(catalogGroup);
    impl_->devicesPathEdit = new QLineEdit;
    impl_->devicesPathEdit->setPlaceholderText(tr("Built-in devices"));
    catalogLayout->addWidget(impl_->devicesPathEdit, 1);
    auto* browseBtn = new QPushButton(tr("Browse..."));
    catalogLayout->addWidget(browseBtn);

    mainLayout->addWidget(catalogGroup);
    mainLayout->addStretch();

    auto* buttons = new QDialogButtonBox(
        QDialogButtonBox::Ok | QDialogButtonBox::Cancel);
    mainLayout->addWidget(buttons);

    connect(buttons, &QDialogButtonBox::accepted, this, &SettingsDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(browseBtn, &QPushButton::clicked, this, &SettingsDialog::onBrowseDevices);
    connect(impl_->logLevelCombo, &QComboBox::currentIndexChanged,
            this, &SettingsDialog::onLogLevelChanged);
}

void SettingsDialog::loadSettings()
{
    QSettings settings;
    const int levelValue = settings.value(settings_keys::kLogLevel,
        to_settings_value(AppLogLevel::Information)).toInt();
    const int index = static_cast<int>(from_settings_value(levelValue));
    impl_->logLevelCombo->setCurrentIndex(index);
    onLogLevelChanged(index);

    impl_->fileLoggingCheck->setChecked(
        settings.value(settings_keys::kLogFileEnabled, false).toBool());

    impl_->initialDevicesPath = settings.value(settings_keys::kDevicesPath).toString();
    impl_->devicesPathEdit->setText(impl_->initialDevicesPath);
}

void SettingsDialog::saveSettings()
{
    QSettings settings;
    settings.setValue(settings_keys::kLogLevel, to_settings_value(selectedLogLevel()));
    settings.setValue(settings_keys::kLogFileEnabled, impl_->fileLoggingCheck->isChecked());
    settings.setValue(settings_keys::kDevicesPath, devicesPath());
}

AppLogLevel SettingsDialog::selectedLogLevel() const
{
    const int index = impl_->logLevelCombo->currentIndex();
    if (index < 0 || index >= static_cast<int>(std::size(kLogLevels))) {
        return AppLogLevel::Information;
    }
    return kLogLevels[index].level;
}

QString SettingsDialog::devicesPath() const
{
    return impl_->devicesPathEdit->text().trimmed();
}

void SettingsDialog::applyLogLevel(AppLogLevel level)
{
    logging::LoggerFactory::setGlobalLevel(to_logger_level(level));

    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    if (logger) {
        logger->set_level(to_ecosystem_level(level));
    }
}

void SettingsDialog::accept()
{
    saveSettings();
    applyLogLevel(selectedLogLevel());
    if (devicesPath() != impl_->initialDevicesPath) {
        emit devicesPathChanged(devicesPath());
    }
    QDialog::accept();
}

void SettingsDialog::onLogLevelChanged(int index)
{
    if (index >= 0 && index < static_cast<int>(std::size(kLogLevels))) {
        impl_->descriptionLabel->setText(tr(kLogLevels[index].description));
    }
}

void SettingsDialog::onBrowseDevices()
{
    const QString path = QFileDialog::getOpenFileName(
        this, tr("Select Device Catalog"), devicesPath(),
        tr("Device catalog (*.json);;All files (*)"));
    if (!path.isEmpty()) {
        impl_->devicesPathEdit->setText(path);
    }
}

} // namespace graft_template::ui
