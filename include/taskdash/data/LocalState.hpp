#pragma once

#include <QDateTime>
#include <QString>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

// Annotations kept on this machine only, next to the stamp of the last import.
struct LocalState
{
    OverlayMap overlays;
    QDateTime lastRefresh;

    TaskOverlay overlay(const QString &taskId) const;
    bool isPinned(const QString &taskId) const;
    void togglePin(const QString &taskId);
    void snooze(const QString &taskId, const QDateTime &until);
    void unsnooze(const QString &taskId);
};

} // namespace data
} // namespace taskdash
