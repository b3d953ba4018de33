// Ecosystem logger headers must precede Qt to avoid emit() macro conflict
#include <kcenon/common/logging/log_macros.h>

#include "core/app_log_level.hpp"
#include "core/logging.hpp"
#include "services/catalog/device_catalog.hpp"
#include "ui/dialogs/settings_dialog.hpp"
#include "ui/main_window.hpp"

#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QSettings>
#include <QStandardPaths>
#include <QStyleFactory>

#include <filesystem>
#include <format>
#include <system_error>

namespace {

using namespace graft_template;

/**
 * @brief Device catalog from --devices, else the stored path, else built-in
 */
services::DeviceCatalog loadCatalog(const QString& path)
{
    if (path.isEmpty()) {
        return services::DeviceCatalog::builtin();
    }

    auto catalog = services::DeviceCatalog::loadFromFile(path.toStdString());
    if (!catalog) {
        LOG_WARNING(std::format("Falling back to built-in devices: {}",
                                catalog.error().toString()));
        return services::DeviceCatalog::builtin();
    }
    return std::move(*catalog);
}

} // anonymous namespace

/**
 * @brief Application entry point
 *
 * Reads logging and catalog configuration, then launches the main window.
 */
int main(int argc, char* argv[])
{
    QApplication app(argc, argv);
    app.setApplicationName("Graft Template Planner");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("kcenon");
    app.setOrganizationDomain("github.com/kcenon");

    app.setStyle(QStyleFactory::create("Fusion"));

    QCommandLineParser parser;
    parser.setApplicationDescription("Plan fenestrations and print a 1:1 graft template");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption devicesOption(
        "devices", "Device catalog JSON file.", "path");
    QCommandLineOption logLevelOption(
        "log-level", "trace, debug, info, warn, error, critical or off.", "level");
    parser.addOption(devicesOption);
    parser.addOption(logLevelOption);
    parser.process(app);

    QSettings settings;
    const auto appLevel = from_settings_value(
        settings.value(ui::settings_keys::kLogLevel,
                       to_settings_value(AppLogLevel::Information)).toInt());

    logging::LogConfig logConfig;
    logConfig.level = to_logger_level(appLevel);
    logConfig.enableFileLogging =
        settings.value(ui::settings_keys::kLogFileEnabled, false).toBool();
    logConfig.logDirectory = QStandardPaths::writableLocation(
        QStandardPaths::AppLocalDataLocation).toStdString();

    if (parser.isSet(logLevelOption)) {
        auto level = logging::parseLogLevel(parser.value(logLevelOption).toStdString());
        if (level) {
            logConfig.level = *level;
        } else {
            LOG_WARNING(std::format("Ignoring unknown log level '{}'",
                                    parser.value(logLevelOption).toStdString()));
        }
    }

    if (logConfig.enableFileLogging) {
        std::error_code ec;
        std::filesystem::create_directories(logConfig.logDirectory, ec);
        if (ec) {
            logConfig.enableFileLogging = false;
        }
    }
    // Ecosystem logger first; configure() then sets the exact spdlog level
    ui::SettingsDialog::applyLogLevel(from_logger_level(logConfig.level));
    logging::LoggerFactory::configure(logConfig);

    const QString devicesPath = parser.isSet(devicesOption)
        ? parser.value(devicesOption)
        : settings.value(ui::settings_keys::kDevicesPath).toString();

    ui::MainWindow mainWindow(loadCatalog(devicesPath));
    mainWindow.show();

    const int status = app.exec();
    logging::LoggerFactory::shutdown();
    return status;
}
