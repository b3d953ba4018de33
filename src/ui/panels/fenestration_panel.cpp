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

#include "ui/panels/fenestration_panel.hpp"

#include "services/catalog/vessel_catalog.hpp"
#include "services/planning/fenestration.hpp"

#include <QComboBox>
#include <QDoubleSpinBox>
#include <QFont>
#include <QFormLayout>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QPushButton>
#include <QSpinBox>
#include <QStyle>
#include <QVBoxLayout>

#include <format>

namespace graft_template::ui {

// =========================================================================
// Pimpl
// =========================================================================

class FenestrationPanel::Impl {
public:
    QComboBox* deviceCombo = nullptr;
    QLabel* graftSummaryLabel = nullptr;

    QComboBox* vesselCombo = nullptr;
    QDoubleSpinBox* distanceSpin = nullptr;
    QSpinBox* clockSpin = nullptr;
    QDoubleSpinBox* diameterSpin = nullptr;
    QPushButton* addBtn = nullptr;

    QListWidget* fenestrationList = nullptr;
    QPushButton* removeBtn = nullptr;
    QPushButton* clearBtn = nullptr;
    QPushButton* exportBtn = nullptr;

    QLabel* errorLabel = nullptr;
};

// =========================================================================
// Construction
// =========================================================================

FenestrationPanel::FenestrationPanel(QWidget* parent)
    : QWidget(parent)
    , impl_(std::make_unique<Impl>())
{
    setupUI();
    connectSignals();
    updateButtons();
}

FenestrationPanel::~FenestrationPanel() = default;

void FenestrationPanel::setupUI()
{
    auto* layout = new QVBoxLayout(this);
    layout->setContentsMargins(8, 8, 8, 8);
    layout->setSpacing(6);

    // Section header: Device
    auto* deviceHeader = new QLabel(tr("Graft Device"));
    QFont headerFont = deviceHeader->font();
    headerFont.setBold(true);
    deviceHeader->setFont(headerFont);
    layout->addWidget(deviceHeader);

    impl_->deviceCombo = new QComboBox;
    impl_->deviceCombo->setToolTip(tr("Changing the device clears the planned fenestrations"));
    layout->addWidget(impl_->deviceCombo);

    impl_->graftSummaryLabel = new QLabel;
    impl_->graftSummaryLabel->setStyleSheet("color: gray;");
    layout->addWidget(impl_->graftSummaryLabel);

    layout->addSpacing(8);

    // Section header: New fenestration
    auto* entryHeader = new QLabel(tr("Add Fenestration"));
    entryHeader->setFont(headerFont);
    layout->addWidget(entryHeader);

    auto* form = new QFormLayout;

    impl_->vesselCombo = new QComboBox;
    for (auto vessel : services::kAllVessels) {
        const auto info = services::vesselInfo(vessel);
        impl_->vesselCombo->addItem(
            QString::fromStdString(std::format("{} ({})", info.shortLabel, info.displayName)),
            QString::fromUtf8(info.shortLabel.data(),
                              static_cast<qsizetype>(info.shortLabel.size())));
    }
    form->addRow(tr("Vessel:"), impl_->vesselCombo);

    impl_->distanceSpin = new QDoubleSpinBox;
    impl_->distanceSpin->setRange(0.0, 1000.0);
    impl_->distanceSpin->setDecimals(1);
    impl_->distanceSpin->setSingleStep(1.0);
    impl_->distanceSpin->setSuffix(tr(" mm"));
    impl_->distanceSpin->setToolTip(tr("Distance of the center from the proximal end"));
    form->addRow(tr("Distance:"), impl_->distanceSpin);

    impl_->clockSpin = new QSpinBox;
    impl_->clockSpin->setRange(1, 12);
    impl_->clockSpin->setValue(12);
    impl_->clockSpin->setWrapping(true);
    impl_->clockSpin->setSuffix(tr(" o'clock"));
    impl_->clockSpin->setToolTip(tr("12 o'clock is anterior"));
    form->addRow(tr("Clock position:"), impl_->clockSpin);

    impl_->diameterSpin = new QDoubleSpinBox;
    impl_->diameterSpin->setRange(services::kMinFenestrationDiameterMm,
                                  services::kMaxFenestrationDiameterMm);
    impl_->diameterSpin->setDecimals(1);
    impl_->diameterSpin->setSingleStep(0.5);
    impl_->diameterSpin->setValue(6.0);
    impl_->diameterSpin->setSuffix(tr(" mm"));
    form->addRow(tr("Diameter:"), impl_->diameterSpin);

    layout->addLayout(form);

    impl_->addBtn = new QPushButton(
        style()->standardIcon(QStyle::SP_DialogApplyButton),
        tr("  Add Fenestration"));
    impl_->addBtn->setMinimumHeight(32);
    layout->addWidget(impl_->addBtn);

    impl_->errorLabel = new QLabel;
    impl_->errorLabel->setWordWrap(true);
    impl_->errorLabel->setStyleSheet("color: #be1e1e;");
    impl_->errorLabel->hide();
    layout->addWidget(impl_->errorLabel);

    layout->addSpacing(8);

    // Section header: Planned
    auto* listHeader = new QLabel(tr("Planned Fenestrations"));
    listHeader->setFont(headerFont);
    layout->addWidget(listHeader);

    impl_->fenestrationList = new QListWidget;
    impl_->fenestrationList->setSelectionMode(QAbstractItemView::SingleSelection);
    layout->addWidget(impl_->fenestrationList, 1);

    auto* listButtons = new QHBoxLayout;
    impl_->removeBtn = new QPushButton(
        style()->standardIcon(QStyle::SP_TrashIcon), tr("Delete"));
    impl_->clearBtn = new QPushButton(tr("Clear All"));
    listButtons->addWidget(impl_->removeBtn);
    listButtons->addWidget(impl_->clearBtn);
    layout->addLayout(listButtons);

    layout->addSpacing(8);

    impl_->exportBtn = new QPushButton(
        style()->standardIcon(QStyle::SP_DialogSaveButton),
        tr("  Export Template..."));
    impl_->exportBtn->setMinimumHeight(32);
    impl_->exportBtn->setToolTip(tr("Save the printable 1:1 template as PDF"));
    layout->addWidget(impl_->exportBtn);
}

void FenestrationPanel::connectSignals()
{
    connect(impl_->deviceCombo, &QComboBox::activated, this, [this](int index) {
        emit deviceSelected(impl_->deviceCombo->itemText(index));
    });
    connect(impl_->addBtn, &QPushButton::clicked,
            this, &FenestrationPanel::addRequested);
    connect(impl_->removeBtn, &QPushButton::clicked, this, [this]() {
        const int row = selectedFenestration();
        if (row >= 0) {
            emit removeRequested(row);
        }
    });
    connect(impl_->clearBtn, &QPushButton::clicked,
            this, &FenestrationPanel::clearRequested);
    connect(impl_->exportBtn, &QPushButton::clicked,
            this, &FenestrationPanel::exportRequested);
    connect(impl_->fenestrationList, &QListWidget::currentRowChanged,
            this, [this](int) { updateButtons(); });
}

// =========================================================================
// Model updates
// =========================================================================

void FenestrationPanel::setDevices(const QStringList& labels, const QString& current)
{
    QSignalBlocker blocker(impl_->deviceCombo);
    impl_->deviceCombo->clear();
    impl_->deviceCombo->addItems(labels);
    const int index = impl_->deviceCombo->findText(current);
    impl_->deviceCombo->setCurrentIndex(index >= 0 ? index : 0);
}

QString FenestrationPanel::currentDevice() const
{
    return impl_->deviceCombo->currentText();
}

void FenestrationPanel::setGraftSummary(const services::GraftSpecification& graft)
{
    impl_->graftSummaryLabel->setText(QString::fromStdString(
        std::format("Ø{:g} x {:g} mm, circumference {:.1f} mm",
                    graft.diameterMm(), graft.lengthMm(), graft.circumferenceMm())));
    setMaximumDistance(graft.lengthMm());
}

void FenestrationPanel::setFenestrations(const services::FenestrationRegistry& registry)
{
    impl_->fenestrationList->clear();
    for (std::size_t i = 0; i < registry.size(); ++i) {
        impl_->fenestrationList->addItem(QString::fromStdString(
            std::format("F{}  {}", i + 1, services::describe(registry.at(i)))));
    }
    updateButtons();
}

int FenestrationPanel::fenestrationCount() const
{
    return impl_->fenestrationList->count();
}

services::FenestrationRequest FenestrationPanel::currentRequest() const
{
    services::FenestrationRequest request;
    request.vesselKey = impl_->vesselCombo->currentData().toString().toStdString();
    request.distanceFromProximalMm = impl_->distanceSpin->value();
    request.clockHour = impl_->clockSpin->value();
    request.diameterMm = impl_->diameterSpin->value();
    return request;
}

void FenestrationPanel::setRequest(const services::FenestrationRequest& request)
{
    const int vesselIndex = impl_->vesselCombo->findData(
        QString::fromStdString(request.vesselKey));
    if (vesselIndex >= 0) {
        impl_->vesselCombo->setCurrentIndex(vesselIndex);
    }
    impl_->distanceSpin->setValue(request.distanceFromProximalMm);
    impl_->clockSpin->setValue(request.clockHour);
    impl_->diameterSpin->setValue(request.diameterMm);
}

void FenestrationPanel::setMaximumDistance(double lengthMm)
{
    impl_->distanceSpin->setMaximum(lengthMm);
}

void FenestrationPanel::selectFenestration(int index)
{
    impl_->fenestrationList->setCurrentRow(index);
}

int FenestrationPanel::selectedFenestration() const
{
    return impl_->fenestrationList->currentRow();
}

void FenestrationPanel::showError(const QString& message)
{
    impl_->errorLabel->setText(message);
    impl_->errorLabel->show();
}

void FenestrationPanel::clearError()
{
    impl_->errorLabel->clear();
    impl_->errorLabel->hide();
}

QString FenestrationPanel::errorText() const
{
    return impl_->errorLabel->text();
}

void FenestrationPanel::updateButtons()
{
    const bool hasEntries = impl_->fenestrationList->count() > 0;
    impl_->removeBtn->setEnabled(hasEntries && selectedFenestration() >= 0);
    impl_->clearBtn->setEnabled(hasEntries);
}

} // namespace graft_template::ui
