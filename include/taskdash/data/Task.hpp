#pragma once

#include <QDateTime>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <optional>

namespace taskdash {
namespace data {

constexpr quint32 PersonItemId = 1020;
constexpr int UrgentPriority = 1;
constexpr int LowPriority = 4;

// Priorities outside Urgent..Low are treated as absent.
std::optional<int> priorityFromNumber(qint64 value);

struct Task
{
    QString id;
    QString name;
    QString status;
    QString listName;
    QDateTime dueDate;
    std::optional<int> priority; // 1 = Urgent ... 4 = Low
    QString url;
    QStringList tags;
    std::optional<QString> description;
    std::optional<quint32> customItemId;
    QString customId;
    std::optional<QString> parentId;
    QSet<quint64> assigneeIds;

    bool isPerson() const { return customItemId == PersonItemId; }
    bool isSubtask() const { return parentId.has_value(); }
    bool isAssignedTo(quint64 userId) const { return assigneeIds.contains(userId); }
};

struct TaskOverlay
{
    bool pinned = false;
    QDateTime snoozedUntil;
    std::optional<int> sortOrder; // stored, not used for ordering

    bool isSnoozedAt(const QDateTime &now) const
    {
        return snoozedUntil.isValid() && snoozedUntil > now;
    }
};

using OverlayMap = QHash<QString, TaskOverlay>;

struct DisplayTask
{
    Task task;
    TaskOverlay overlay;
};

TaskOverlay overlayFor(const OverlayMap &overlays, const QString &taskId);
DisplayTask makeDisplayTask(const Task &task, const OverlayMap &overlays);

std::optional<QString> priorityLabel(const Task &task);
std::optional<QString> typeLabel(const Task &task);

} // namespace data
} // namespace taskdash
