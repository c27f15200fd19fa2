#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

TaskOverlay overlayFor(const OverlayMap &overlays, const QString &taskId)
{
    const auto it = overlays.constFind(taskId);
    if (it == overlays.constEnd()) {
        return TaskOverlay{};
    }
    return it.value();
}

DisplayTask makeDisplayTask(const Task &task, const OverlayMap &overlays)
{
    return DisplayTask{ task, overlayFor(overlays, task.id) };
}

std::optional<int> priorityFromNumber(qint64 value)
{
    if (value < UrgentPriority || value > LowPriority) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

std::optional<QString> priorityLabel(const Task &task)
{
    if (!task.priority.has_value()) {
        return std::nullopt;
    }
    switch (task.priority.value()) {
    case 1:
        return QStringLiteral("Urgent");
    case 2:
        return QStringLiteral("High");
    case 3:
        return QStringLiteral("Normal");
    case 4:
        return QStringLiteral("Low");
    default:
        return std::nullopt;
    }
}

std::optional<QString> typeLabel(const Task &task)
{
    if (!task.customItemId.has_value()) {
        return std::nullopt;
    }
    switch (task.customItemId.value()) {
    case 0:
        return QStringLiteral("Task");
    case 1004:
        return QStringLiteral("Bug");
    case 1005:
        return QStringLiteral("Milestone");
    case 1006:
        return QStringLiteral("Feature");
    case 1007:
        return QStringLiteral("Epic");
    case 1008:
        return QStringLiteral("Story");
    case 1009:
        return QStringLiteral("Spike");
    case PersonItemId:
        return QStringLiteral("Person");
    default:
        return QStringLiteral("Custom");
    }
}

} // namespace data
} // namespace taskdash
