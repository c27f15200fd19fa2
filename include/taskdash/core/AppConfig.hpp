#pragma once

#include <QString>
#include <optional>

namespace taskdash {
namespace core {

struct AppConfig
{
    QString apiToken;
    QString userId;
    // Kept in the file for the interactive dashboard; the CLI never fetches.
    bool autoRefresh = true;
    QString dataDirectory;

    // Absent when the configured id is not a number; the board then shows
    // tasks of every assignee.
    std::optional<quint64> numericUserId() const;
};

QString defaultConfigDirectory();
QString defaultConfigPath();

/**
 * Reads the INI file at @p path. A missing file is created with empty values
 * and reported as an error so the user can fill it in. The token and the user
 * id are required.
 */
std::optional<AppConfig> loadConfig(const QString &path, QString *errorMessage = nullptr);
bool saveConfig(const AppConfig &config, const QString &path, QString *errorMessage = nullptr);

} // namespace core
} // namespace taskdash
