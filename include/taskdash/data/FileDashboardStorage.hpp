#pragma once

#include <QJsonDocument>
#include <QString>
#include <functional>
#include <vector>

#include "taskdash/data/LocalState.hpp"
#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

/**
 * Keeps the task cache and the local state in two JSON files inside one
 * directory. Both files are loaded on construction and rewritten atomically on
 * every change. Missing files start empty; unreadable ones are logged and
 * ignored so a broken cache never blocks startup.
 */
class FileDashboardStorage
{
public:
    explicit FileDashboardStorage(QString directory);
    ~FileDashboardStorage() = default;

    const std::vector<Task> &tasks() const;
    bool replaceTasks(std::vector<Task> tasks);

    const LocalState &localState() const;
    bool updateLocalState(const std::function<void(LocalState &)> &mutate);

    QString tasksFilePath() const;
    QString stateFilePath() const;

private:
    void load();
    bool saveTasks() const;
    bool saveLocalState() const;

    static bool readDocument(const QString &filePath, QJsonDocument &document);
    static bool writeDocument(const QString &filePath, const QJsonDocument &document);

    QString m_directory;
    std::vector<Task> m_tasks;
    LocalState m_state;
};

} // namespace data
} // namespace taskdash
