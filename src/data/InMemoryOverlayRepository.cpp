#include "taskdash/data/InMemoryOverlayRepository.hpp"

namespace taskdash {
namespace data {

InMemoryOverlayRepository::InMemoryOverlayRepository() = default;
InMemoryOverlayRepository::~InMemoryOverlayRepository() = default;

OverlayMap InMemoryOverlayRepository::overlays() const
{
    return m_state.overlays;
}

TaskOverlay InMemoryOverlayRepository::overlay(const QString &taskId) const
{
    return m_state.overlay(taskId);
}

bool InMemoryOverlayRepository::isPinned(const QString &taskId) const
{
    return m_state.isPinned(taskId);
}

bool InMemoryOverlayRepository::togglePin(const QString &taskId)
{
    m_state.togglePin(taskId);
    return true;
}

bool InMemoryOverlayRepository::snooze(const QString &taskId, const QDateTime &until)
{
    m_state.snooze(taskId, until);
    return true;
}

bool InMemoryOverlayRepository::unsnooze(const QString &taskId)
{
    m_state.unsnooze(taskId);
    return true;
}

QDateTime InMemoryOverlayRepository::lastRefresh() const
{
    return m_state.lastRefresh;
}

bool InMemoryOverlayRepository::setLastRefresh(const QDateTime &timestamp)
{
    m_state.lastRefresh = timestamp;
    return true;
}

} // namespace data
} // namespace taskdash
