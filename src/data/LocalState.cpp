#include "taskdash/data/LocalState.hpp"

namespace taskdash {
namespace data {

TaskOverlay LocalState::overlay(const QString &taskId) const
{
    return overlayFor(overlays, taskId);
}

bool LocalState::isPinned(const QString &taskId) const
{
    const auto it = overlays.constFind(taskId);
    return it != overlays.constEnd() && it->pinned;
}

void LocalState::togglePin(const QString &taskId)
{
    auto &entry = overlays[taskId];
    entry.pinned = !entry.pinned;
}

void LocalState::snooze(const QString &taskId, const QDateTime &until)
{
    overlays[taskId].snoozedUntil = until;
}

void LocalState::unsnooze(const QString &taskId)
{
    auto it = overlays.find(taskId);
    if (it == overlays.end()) {
        return;
    }
    it->snoozedUntil = QDateTime();
}

} // namespace data
} // namespace taskdash
