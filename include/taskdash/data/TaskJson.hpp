#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <optional>
#include <vector>

#include "taskdash/data/LocalState.hpp"
#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

QJsonObject taskToJson(const Task &task);
std::optional<Task> taskFromJson(const QJsonObject &object);

QJsonArray tasksToJson(const std::vector<Task> &tasks);
std::vector<Task> tasksFromJson(const QJsonArray &array);

QJsonObject overlayToJson(const TaskOverlay &overlay);
TaskOverlay overlayFromJson(const QJsonObject &object);

QJsonObject localStateToJson(const LocalState &state);
LocalState localStateFromJson(const QJsonObject &object);

} // namespace data
} // namespace taskdash
