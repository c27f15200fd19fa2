#pragma once

#include <QDateTime>
#include <QString>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

// Mutators return false when the change could not be persisted.
class OverlayRepository
{
public:
    virtual ~OverlayRepository() = default;

    virtual OverlayMap overlays() const = 0;
    virtual TaskOverlay overlay(const QString &taskId) const = 0;
    virtual bool isPinned(const QString &taskId) const = 0;
    virtual bool togglePin(const QString &taskId) = 0;
    virtual bool snooze(const QString &taskId, const QDateTime &until) = 0;
    virtual bool unsnooze(const QString &taskId) = 0;
    virtual QDateTime lastRefresh() const = 0;
    virtual bool setLastRefresh(const QDateTime &timestamp) = 0;
};

} // namespace data
} // namespace taskdash
