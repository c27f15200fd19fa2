#pragma once

#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <optional>
#include <vector>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

// Converts one task object of the ClickUp v2 API into a Task.
std::optional<Task> taskFromClickUp(const QJsonObject &object);

// Accepts either a `{"tasks": [...]}` search response or a single task object.
std::vector<Task> tasksFromClickUp(const QJsonDocument &document);

std::optional<std::vector<Task>> readClickUpExport(const QString &filePath, QString *errorMessage = nullptr);

} // namespace data
} // namespace taskdash
