#include "taskdash/data/TaskJson.hpp"

#include <QJsonValue>
#include <QList>
#include <algorithm>
#include <cmath>
#include <limits>

#include "taskdash/core/Logging.hpp"

namespace taskdash {
namespace data {

namespace {
QJsonValue optionalString(const std::optional<QString> &value)
{
    return value.has_value() ? QJsonValue(value.value()) : QJsonValue(QJsonValue::Null);
}

QJsonValue optionalInt(const std::optional<int> &value)
{
    return value.has_value() ? QJsonValue(value.value()) : QJsonValue(QJsonValue::Null);
}

std::optional<QString> readOptionalString(const QJsonObject &object, const QString &key)
{
    const QJsonValue value = object.value(key);
    if (!value.isString()) {
        return std::nullopt;
    }
    return value.toString();
}

// Whole numbers only; anything outside the qint64 range is dropped.
std::optional<qint64> readNumber(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    constexpr double limit = 9223372036854775808.0; // 2^63
    if (!std::isfinite(number) || number < -limit || number >= limit) {
        return std::nullopt;
    }
    return static_cast<qint64>(number);
}

std::optional<int> readOptionalInt(const QJsonObject &object, const QString &key)
{
    const auto number = readNumber(object.value(key));
    if (!number.has_value() || number.value() < std::numeric_limits<int>::min()
        || number.value() > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(number.value());
}

QJsonValue formatTimestamp(const QDateTime &timestamp)
{
    if (!timestamp.isValid()) {
        return QJsonValue(QJsonValue::Null);
    }
    return timestamp.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime parseTimestamp(const QJsonValue &value)
{
    if (!value.isString()) {
        return {};
    }
    return QDateTime::fromString(value.toString(), Qt::ISODateWithMs);
}
} // namespace

QJsonObject taskToJson(const Task &task)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), task.id);
    object.insert(QStringLiteral("name"), task.name);
    object.insert(QStringLiteral("status"), task.status);
    object.insert(QStringLiteral("list_name"), task.listName);
    object.insert(QStringLiteral("due_date"),
                  task.dueDate.isValid() ? QJsonValue(task.dueDate.toMSecsSinceEpoch())
                                         : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("priority"), optionalInt(task.priority));
    object.insert(QStringLiteral("url"), task.url);
    object.insert(QStringLiteral("tags"), QJsonArray::fromStringList(task.tags));
    object.insert(QStringLiteral("description"), optionalString(task.description));
    object.insert(QStringLiteral("custom_item_id"),
                  task.customItemId.has_value() ? QJsonValue(static_cast<qint64>(task.customItemId.value()))
                                                : QJsonValue(QJsonValue::Null));
    object.insert(QStringLiteral("custom_id"),
                  task.customId.isEmpty() ? QJsonValue(QJsonValue::Null) : QJsonValue(task.customId));
    object.insert(QStringLiteral("parent_id"), optionalString(task.parentId));

    QList<quint64> assignees = task.assigneeIds.values();
    std::sort(assignees.begin(), assignees.end());
    QJsonArray assigneeArray;
    for (const auto id : assignees) {
        assigneeArray.append(static_cast<qint64>(id));
    }
    object.insert(QStringLiteral("assignee_ids"), assigneeArray);
    return object;
}

std::optional<Task> taskFromJson(const QJsonObject &object)
{
    const QString id = object.value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        return std::nullopt;
    }

    Task task;
    task.id = id;
    task.name = object.value(QStringLiteral("name")).toString();
    task.status = object.value(QStringLiteral("status")).toString();
    task.listName = object.value(QStringLiteral("list_name")).toString();
    if (const auto due = readNumber(object.value(QStringLiteral("due_date")))) {
        task.dueDate = QDateTime::fromMSecsSinceEpoch(due.value(), Qt::UTC);
    }
    if (const auto priority = readNumber(object.value(QStringLiteral("priority")))) {
        task.priority = priorityFromNumber(priority.value());
    }
    task.url = object.value(QStringLiteral("url")).toString();
    for (const auto &tag : object.value(QStringLiteral("tags")).toArray()) {
        task.tags << tag.toString();
    }
    task.description = readOptionalString(object, QStringLiteral("description"));
    const auto itemId = readNumber(object.value(QStringLiteral("custom_item_id")));
    if (itemId.has_value() && itemId.value() >= 0 && itemId.value() <= std::numeric_limits<quint32>::max()) {
        task.customItemId = static_cast<quint32>(itemId.value());
    }
    task.customId = object.value(QStringLiteral("custom_id")).toString();
    task.parentId = readOptionalString(object, QStringLiteral("parent_id"));
    for (const auto &assignee : object.value(QStringLiteral("assignee_ids")).toArray()) {
        const auto userId = readNumber(assignee);
        if (userId.has_value() && userId.value() >= 0) {
            task.assigneeIds.insert(static_cast<quint64>(userId.value()));
        }
    }
    return task;
}

QJsonArray tasksToJson(const std::vector<Task> &tasks)
{
    QJsonArray array;
    for (const auto &task : tasks) {
        array.append(taskToJson(task));
    }
    return array;
}

std::vector<Task> tasksFromJson(const QJsonArray &array)
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(array.size()));
    for (const auto &value : array) {
        auto task = taskFromJson(value.toObject());
        if (!task.has_value()) {
            LOG_WARN(tdData, "Skipping cached task without id");
            continue;
        }
        tasks.push_back(std::move(task.value()));
    }
    return tasks;
}

QJsonObject overlayToJson(const TaskOverlay &overlay)
{
    QJsonObject object;
    object.insert(QStringLiteral("pinned"), overlay.pinned);
    object.insert(QStringLiteral("snoozed_until"), formatTimestamp(overlay.snoozedUntil));
    object.insert(QStringLiteral("sort_order"), optionalInt(overlay.sortOrder));
    return object;
}

TaskOverlay overlayFromJson(const QJsonObject &object)
{
    TaskOverlay overlay;
    overlay.pinned = object.value(QStringLiteral("pinned")).toBool(false);
    overlay.snoozedUntil = parseTimestamp(object.value(QStringLiteral("snoozed_until")));
    overlay.sortOrder = readOptionalInt(object, QStringLiteral("sort_order"));
    return overlay;
}

QJsonObject localStateToJson(const LocalState &state)
{
    QJsonObject overlays;
    for (auto it = state.overlays.constBegin(); it != state.overlays.constEnd(); ++it) {
        overlays.insert(it.key(), overlayToJson(it.value()));
    }
    QJsonObject object;
    object.insert(QStringLiteral("overlays"), overlays);
    object.insert(QStringLiteral("last_refresh"), formatTimestamp(state.lastRefresh));
    return object;
}

LocalState localStateFromJson(const QJsonObject &object)
{
    LocalState state;
    const QJsonObject overlays = object.value(QStringLiteral("overlays")).toObject();
    for (auto it = overlays.constBegin(); it != overlays.constEnd(); ++it) {
        state.overlays.insert(it.key(), overlayFromJson(it.value().toObject()));
    }
    state.lastRefresh = parseTimestamp(object.value(QStringLiteral("last_refresh")));
    return state;
}

} // namespace data
} // namespace taskdash
