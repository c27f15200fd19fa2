#include "taskdash/core/AppConfig.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "taskdash/core/Logging.hpp"

namespace taskdash {
namespace core {

namespace {
const QString ApiTokenKey = QStringLiteral("api_token");
const QString UserIdKey = QStringLiteral("user_id");
const QString AutoRefreshKey = QStringLiteral("auto_refresh");
const QString DataDirKey = QStringLiteral("data_dir");

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
} // namespace

std::optional<quint64> AppConfig::numericUserId() const
{
    bool ok = false;
    const quint64 id = userId.trimmed().toULongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return id;
}

QString defaultConfigDirectory()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + QStringLiteral("/.config");
    }
    return QDir(base).filePath(QStringLiteral("taskdash"));
}

QString defaultConfigPath()
{
    return QDir(defaultConfigDirectory()).filePath(QStringLiteral("config.ini"));
}

std::optional<AppConfig> loadConfig(const QString &path, QString *errorMessage)
{
    if (!QFileInfo::exists(path)) {
        AppConfig defaults;
        QString saveError;
        if (!saveConfig(defaults, path, &saveError)) {
            setError(errorMessage, saveError);
            return std::nullopt;
        }
        setError(errorMessage,
                 QStringLiteral("Config file created at %1. Please edit it to add your ClickUp API token and user ID.")
                     .arg(path));
        return std::nullopt;
    }

    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        setError(errorMessage, QStringLiteral("Failed to parse config from %1").arg(path));
        return std::nullopt;
    }

    AppConfig config;
    config.apiToken = settings.value(ApiTokenKey).toString().trimmed();
    config.userId = settings.value(UserIdKey).toString().trimmed();
    config.autoRefresh = settings.value(AutoRefreshKey, true).toBool();
    config.dataDirectory = settings.value(DataDirKey).toString().trimmed();
    if (config.dataDirectory.isEmpty()) {
        config.dataDirectory = QFileInfo(path).absolutePath();
    }

    if (config.apiToken.isEmpty()) {
        setError(errorMessage, QStringLiteral("api_token is required in config file: %1").arg(path));
        return std::nullopt;
    }
    if (config.userId.isEmpty()) {
        setError(errorMessage, QStringLiteral("user_id is required in config file: %1").arg(path));
        return std::nullopt;
    }
    if (!config.numericUserId().has_value()) {
        LOG_WARN(tdCore, "user_id '%s' is not numeric; showing tasks of all assignees",
                 qUtf8Printable(config.userId));
    }
    return config;
}

bool saveConfig(const AppConfig &config, const QString &path, QString *errorMessage)
{
    const QString directory = QFileInfo(path).absolutePath();
    if (!QDir().mkpath(directory)) {
        setError(errorMessage, QStringLiteral("Failed to create config directory: %1").arg(directory));
        return false;
    }

    QSettings settings(path, QSettings::IniFormat);
    settings.setValue(ApiTokenKey, config.apiToken);
    settings.setValue(UserIdKey, config.userId);
    settings.setValue(AutoRefreshKey, config.autoRefresh);
    if (!config.dataDirectory.isEmpty()) {
        settings.setValue(DataDirKey, config.dataDirectory);
    }
    settings.sync();
    if (settings.status() != QSettings::NoError) {
        setError(errorMessage, QStringLiteral("Failed to write config to %1").arg(path));
        return false;
    }
    return true;
}

} // namespace core
} // namespace taskdash
