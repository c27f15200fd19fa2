#include "taskdash/data/ClickUpImport.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonParseError>
#include <cmath>
#include <limits>

#include "taskdash/core/Logging.hpp"

namespace taskdash {
namespace data {

namespace {
// The API reports several numbers as strings; unparsable ones are dropped.
std::optional<qint64> parseNumber(const QJsonValue &value)
{
    if (value.isDouble()) {
        const double number = value.toDouble();
        constexpr double limit = 9223372036854775808.0; // 2^63
        if (!std::isfinite(number) || number < -limit || number >= limit) {
            return std::nullopt;
        }
        return static_cast<qint64>(number);
    }
    if (!value.isString()) {
        return std::nullopt;
    }
    bool ok = false;
    const qint64 number = value.toString().toLongLong(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return number;
}

void setError(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}
} // namespace

std::optional<Task> taskFromClickUp(const QJsonObject &object)
{
    const QString id = object.value(QStringLiteral("id")).toString();
    if (id.isEmpty()) {
        return std::nullopt;
    }

    Task task;
    task.id = id;
    task.name = object.value(QStringLiteral("name")).toString();
    task.status = object.value(QStringLiteral("status")).toObject().value(QStringLiteral("status")).toString();
    task.listName = object.value(QStringLiteral("list")).toObject().value(QStringLiteral("name")).toString();
    task.url = object.value(QStringLiteral("url")).toString();

    if (const auto due = parseNumber(object.value(QStringLiteral("due_date")))) {
        task.dueDate = QDateTime::fromMSecsSinceEpoch(due.value(), Qt::UTC);
    }
    const QJsonValue priority = object.value(QStringLiteral("priority"));
    if (priority.isObject()) {
        if (const auto level = parseNumber(priority.toObject().value(QStringLiteral("id")))) {
            task.priority = priorityFromNumber(level.value());
        }
    }

    for (const auto &tag : object.value(QStringLiteral("tags")).toArray()) {
        task.tags << tag.toObject().value(QStringLiteral("name")).toString();
    }

    const QJsonValue text = object.value(QStringLiteral("text_content"));
    if (text.isString()) {
        task.description = text.toString();
    }
    const auto itemId = parseNumber(object.value(QStringLiteral("custom_item_id")));
    if (itemId.has_value() && itemId.value() >= 0 && itemId.value() <= std::numeric_limits<quint32>::max()) {
        task.customItemId = static_cast<quint32>(itemId.value());
    }
    task.customId = object.value(QStringLiteral("custom_id")).toString();
    const QJsonValue parent = object.value(QStringLiteral("parent"));
    if (parent.isString() && !parent.toString().isEmpty()) {
        task.parentId = parent.toString();
    }

    for (const auto &assignee : object.value(QStringLiteral("assignees")).toArray()) {
        const auto userId = parseNumber(assignee.toObject().value(QStringLiteral("id")));
        if (userId.has_value() && userId.value() >= 0) {
            task.assigneeIds.insert(static_cast<quint64>(userId.value()));
        }
    }
    return task;
}

std::vector<Task> tasksFromClickUp(const QJsonDocument &document)
{
    std::vector<Task> tasks;
    if (!document.isObject()) {
        return tasks;
    }

    const QJsonObject root = document.object();
    if (!root.contains(QStringLiteral("tasks"))) {
        if (auto task = taskFromClickUp(root)) {
            tasks.push_back(std::move(task.value()));
        }
        return tasks;
    }

    const QJsonArray entries = root.value(QStringLiteral("tasks")).toArray();
    tasks.reserve(static_cast<size_t>(entries.size()));
    for (const auto &entry : entries) {
        auto task = taskFromClickUp(entry.toObject());
        if (!task.has_value()) {
            LOG_WARN(tdData, "Skipping ClickUp task without id");
            continue;
        }
        tasks.push_back(std::move(task.value()));
    }
    return tasks;
}

std::optional<std::vector<Task>> readClickUpExport(const QString &filePath, QString *errorMessage)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Failed to open %1: %2").arg(filePath, file.errorString()));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Failed to parse %1: %2").arg(filePath, parseError.errorString()));
        return std::nullopt;
    }
    if (!document.isObject()) {
        setError(errorMessage, QStringLiteral("Expected a JSON object in %1").arg(filePath));
        return std::nullopt;
    }
    return tasksFromClickUp(document);
}

} // namespace data
} // namespace taskdash
