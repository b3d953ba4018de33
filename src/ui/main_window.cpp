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

#include "ui/main_window.hpp"

#include "core/logging.hpp"
#include "services/planning/template_planner.hpp"
#include "ui/dialogs/settings_dialog.hpp"
#include "ui/panels/fenestration_panel.hpp"
#include "ui/widgets/template_preview_widget.hpp"

#include <QApplication>
#include <QDockWidget>
#include <QFile>
#include <QFileDialog>
#include <QKeySequence>
#include <QMenuBar>
#include <QMessageBox>
#include <QStatusBar>

#include <format>
#include <optional>

namespace graft_template::ui {

namespace {

auto& getLogger() {
    static auto logger = logging::LoggerFactory::create("MainWindow");
    return logger;
}

QStringList toLabelList(const services::DeviceCatalog& catalog)
{
    QStringList labels;
    for (const auto& label : catalog.labels()) {
        labels << QString::fromStdString(label);
    }
    return labels;
}

} // anonymous namespace

class MainWindow::Impl {
public:
    services::TemplatePlanner planner;
    std::optional<services::PlanningSession> session;
    QString deviceLabel;

    FenestrationPanel* panel = nullptr;
    TemplatePreviewWidget* preview = nullptr;
    QDockWidget* panelDock = nullptr;

    explicit Impl(services::DeviceCatalog catalog)
        : planner(std::move(catalog)) {}
};

MainWindow::MainWindow(services::DeviceCatalog catalog, QWidget* parent)
    : QMainWindow(parent)
    , impl_(std::make_unique<Impl>(std::move(catalog)))
{
    setWindowTitle(tr("Graft Template Planner"));
    resize(1100, 800);

    setupLayout();
    setupMenuBar();
    setupConnections();

    const auto labels = toLabelList(impl_->planner.catalog());
    if (!labels.isEmpty()) {
        impl_->panel->setDevices(labels, labels.front());
        openSession(labels.front());
    }

    statusBar()->showMessage(tr("Ready"));
}

MainWindow::~MainWindow() = default;

void MainWindow::setupMenuBar()
{
    auto fileMenu = menuBar()->addMenu(tr("&File"));
    fileMenu->addAction(tr("&Export Template..."), this, &MainWindow::onExportTemplate,
                        QKeySequence::Save);
    fileMenu->addAction(tr("Load &Device Catalog..."), this, [this]() {
        const QString path = QFileDialog::getOpenFileName(
            this, tr("Load Device Catalog"), QString(),
            tr("Device catalog (*.json);;All files (*)"));
        if (!path.isEmpty()) {
            onLoadDeviceCatalog(path);
        }
    });
    fileMenu->addAction(tr("Use &Built-in Devices"), this, [this]() {
        onLoadDeviceCatalog(QString());
    });
    fileMenu->addSeparator();
    fileMenu->addAction(tr("E&xit"), qApp, &QApplication::quit, QKeySequence::Quit);

    auto editMenu = menuBar()->addMenu(tr("&Edit"));
    editMenu->addAction(tr("&Clear All Fenestrations"), this, &MainWindow::onClearFenestrations);
    editMenu->addSeparator();
    editMenu->addAction(tr("&Settings..."), this, &MainWindow::onShowSettings);

    auto viewMenu = menuBar()->addMenu(tr("&View"));
    viewMenu->addAction(impl_->panelDock->toggleViewAction());

    auto helpMenu = menuBar()->addMenu(tr("&Help"));
    helpMenu->addAction(tr("&About"), this, &MainWindow::onShowAbout);
}

void MainWindow::setupLayout()
{
    impl_->preview = new TemplatePreviewWidget(this);
    setCentralWidget(impl_->preview);

    impl_->panel = new FenestrationPanel;
    impl_->panelDock = new QDockWidget(tr("Planning"), this);
    impl_->panelDock->setObjectName("PlanningDock");
    impl_->panelDock->setWidget(impl_->panel);
    impl_->panelDock->setFeatures(QDockWidget::DockWidgetMovable |
                                  QDockWidget::DockWidgetClosable);
    addDockWidget(Qt::LeftDockWidgetArea, impl_->panelDock);
}

void MainWindow::setupConnections()
{
    connect(impl_->panel, &FenestrationPanel::deviceSelected,
            this, &MainWindow::onDeviceSelected);
    connect(impl_->panel, &FenestrationPanel::addRequested,
            this, &MainWindow::onAddFenestration);
    connect(impl_->panel, &FenestrationPanel::removeRequested,
            this, &MainWindow::onRemoveFenestration);
    connect(impl_->panel, &FenestrationPanel::clearRequested,
            this, &MainWindow::onClearFenestrations);
    connect(impl_->panel, &FenestrationPanel::exportRequested,
            this, &MainWindow::onExportTemplate);
    connect(impl_->preview, &TemplatePreviewWidget::fenestrationClicked,
            impl_->panel, &FenestrationPanel::selectFenestration);
}

const services::PlanningSession* MainWindow::session() const
{
    return impl_->session ? &*impl_->session : nullptr;
}

FenestrationPanel* MainWindow::fenestrationPanel() const
{
    return impl_->panel;
}

TemplatePreviewWidget* MainWindow::previewWidget() const
{
    return impl_->preview;
}

void MainWindow::openSession(const QString& deviceLabel)
{
    auto session = impl_->planner.startSession(deviceLabel.toStdString());
    if (!session) {
        impl_->session.reset();
        impl_->preview->setSession(nullptr, nullptr);
        impl_->panel->showError(QString::fromStdString(session.error().toString()));
        return;
    }

    impl_->session.emplace(std::move(*session));
    impl_->deviceLabel = deviceLabel;
    impl_->preview->setSession(&impl_->planner, &*impl_->session);
    syncViews();
}

void MainWindow::syncViews()
{
    if (!impl_->session) {
        return;
    }
    impl_->panel->setGraftSummary(impl_->session->graft);
    impl_->panel->setFenestrations(impl_->session->registry);
    impl_->preview->refresh();
}

bool MainWindow::confirmDiscardLayout(const QString& title, int fenestrationCount)
{
    const auto answer = QMessageBox::question(
        this, title,
        tr("Changing the device discards %n planned fenestration(s). Continue?", "",
           fenestrationCount));
    return answer == QMessageBox::Yes;
}

void MainWindow::onDeviceSelected(const QString& label)
{
    impl_->panel->clearError();
    if (!impl_->session) {
        openSession(label);
        return;
    }

    if (!impl_->session->registry.empty()) {
        if (!confirmDiscardLayout(tr("Change Device"),
                                  static_cast<int>(impl_->session->registry.size()))) {
            impl_->panel->setDevices(toLabelList(impl_->planner.catalog()),
                                     impl_->deviceLabel);
            return;
        }
    }

    auto result = impl_->planner.selectDevice(*impl_->session, label.toStdString());
    if (!result) {
        impl_->panel->showError(QString::fromStdString(result.error().toString()));
        return;
    }
    impl_->deviceLabel = label;
    syncViews();
    statusBar()->showMessage(tr("Device: %1").arg(label), 3000);
}

void MainWindow::onAddFenestration()
{
    if (!impl_->session) {
        return;
    }

    auto index = impl_->planner.addFenestration(*impl_->session,
                                                impl_->panel->currentRequest());
    if (!index) {
        impl_->panel->showError(QString::fromStdString(index.error().toString()));
        if (index.error().conflict) {
            impl_->panel->selectFenestration(static_cast<int>(index.error().conflict->index));
        }
        return;
    }

    impl_->panel->clearError();
    syncViews();
    impl_->panel->selectFenestration(static_cast<int>(*index));
    statusBar()->showMessage(tr("Added F%1").arg(*index + 1), 3000);
}

void MainWindow::onRemoveFenestration(int index)
{
    if (!impl_->session || index < 0) {
        return;
    }

    auto removed = impl_->planner.removeFenestration(*impl_->session,
                                                     static_cast<std::size_t>(index));
    if (!removed) {
        impl_->panel->showError(QString::fromStdString(removed.error().toString()));
        return;
    }

    impl_->panel->clearError();
    syncViews();
    statusBar()->showMessage(tr("Removed %1")
        .arg(QString::fromStdString(services::describe(*removed))), 3000);
}

void MainWindow::onClearFenestrations()
{
    if (!impl_->session) {
        return;
    }
    const auto count = impl_->planner.clearFenestrations(*impl_->session);
    impl_->panel->clearError();
    syncViews();
    statusBar()->showMessage(tr("Cleared %1 fenestration(s)").arg(count), 3000);
}

std::expected<void, services::TemplateError>
MainWindow::saveTemplate(const QString& filePath)
{
    if (!impl_->session) {
        return std::unexpected(services::TemplateError{
            services::TemplateError::Code::InternalError,
            "no planning session"
        });
    }

    auto artifact = impl_->planner.exportDocument(*impl_->session);
    if (!artifact) {
        return std::unexpected(artifact.error());
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return std::unexpected(services::TemplateError{
            services::TemplateError::Code::FileCreationFailed,
            std::format("cannot write {}: {}", filePath.toStdString(),
                        file.errorString().toStdString())
        });
    }
    if (file.write(artifact->data) != artifact->data.size()) {
        return std::unexpected(services::TemplateError{
            services::TemplateError::Code::FileCreationFailed,
            std::format("short write to {}", filePath.toStdString())
        });
    }

    getLogger()->info("Template saved to {}", filePath.toStdString());
    return {};
}

void MainWindow::onExportTemplate()
{
    if (!impl_->session) {
        return;
    }

    const QString suggested = QString::fromStdString(
        services::DocumentRenderer::suggestedFileName(impl_->session->graft));
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Export Template"), suggested, tr("PDF Documents (*.pdf)"));
    if (path.isEmpty()) {
        return;
    }

    auto saved = saveTemplate(path);
    if (!saved) {
        getLogger()->error("Template export failed: {}", saved.error().toString());
        QMessageBox::warning(this, tr("Export Failed"),
                             QString::fromStdString(saved.error().toString()));
        return;
    }

    if (impl_->session->registry.empty()) {
        statusBar()->showMessage(tr("Exported template without fenestrations: %1").arg(path), 5000);
    } else {
        statusBar()->showMessage(tr("Exported %1").arg(path), 5000);
    }
}

void MainWindow::onLoadDeviceCatalog(const QString& path)
{
    services::DeviceCatalog catalog = services::DeviceCatalog::builtin();
    if (!path.isEmpty()) {
        auto loaded = services::DeviceCatalog::loadFromFile(path.toStdString());
        if (!loaded) {
            getLogger()->warn("Device catalog {} rejected: {}",
                              path.toStdString(), loaded.error().toString());
            QMessageBox::warning(this, tr("Device Catalog"),
                                 QString::fromStdString(loaded.error().toString()));
            return;
        }
        catalog = std::move(*loaded);
    }

    const auto labels = toLabelList(catalog);

    // Keep the session when the new catalog still offers the same device
    QString current = labels.isEmpty() ? QString() : labels.front();
    bool keepSession = false;
    if (impl_->session) {
        const auto& graft = impl_->session->graft;
        for (const auto& device : catalog.devices()) {
            if (device.name == graft.name() &&
                device.diameterMm == graft.diameterMm() &&
                device.lengthMm == graft.lengthMm()) {
                current = QString::fromStdString(device.label);
                keepSession = true;
                break;
            }
        }

        if (!keepSession && !impl_->session->registry.empty() &&
            !confirmDiscardLayout(tr("Device Catalog"),
                                  static_cast<int>(impl_->session->registry.size()))) {
            getLogger()->info("Catalog change cancelled; {} no longer offered",
                              graft.name());
            return;
        }
    }

    impl_->planner.setCatalog(std::move(catalog));
    if (keepSession) {
        impl_->deviceLabel = current;
    }
    impl_->panel->setDevices(labels, current);
    if (!keepSession && !current.isEmpty()) {
        openSession(current);
    }
    statusBar()->showMessage(tr("%1 devices available").arg(labels.size()), 3000);
}

void MainWindow::onShowSettings()
{
    SettingsDialog dialog(this);
    connect(&dialog, &SettingsDialog::devicesPathChanged,
            this, &MainWindow::onLoadDeviceCatalog);
    dialog.exec();
}

void MainWindow::onShowAbout()
{
    QMessageBox::about(this, tr("About Graft Template Planner"),
        tr("<h3>Graft Template Planner</h3>"
           "<p>Version %1</p>"
           "<p>Plans fenestrations on a tubular graft and prints a 1:1 "
           "cutting template with calibration markers.</p>"
           "<p>Planning aid only. Verify all positions against patient imaging.</p>")
            .arg(QApplication::applicationVersion()));
}

} // namespace graft_template::ui
