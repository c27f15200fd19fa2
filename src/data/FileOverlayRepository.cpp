#include "taskdash/data/FileOverlayRepository.hpp"

namespace taskdash {
namespace data {

FileOverlayRepository::FileOverlayRepository(std::shared_ptr<FileDashboardStorage> storage)
    : m_storage(std::move(storage))
{
}

OverlayMap FileOverlayRepository::overlays() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->localState().overlays;
}

TaskOverlay FileOverlayRepository::overlay(const QString &taskId) const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->localState().overlay(taskId);
}

bool FileOverlayRepository::isPinned(const QString &taskId) const
{
    return m_storage && m_storage->localState().isPinned(taskId);
}

bool FileOverlayRepository::togglePin(const QString &taskId)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->updateLocalState([&taskId](LocalState &state) { state.togglePin(taskId); });
}

bool FileOverlayRepository::snooze(const QString &taskId, const QDateTime &until)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->updateLocalState([&](LocalState &state) { state.snooze(taskId, until); });
}

bool FileOverlayRepository::unsnooze(const QString &taskId)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->updateLocalState([&taskId](LocalState &state) { state.unsnooze(taskId); });
}

QDateTime FileOverlayRepository::lastRefresh() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->localState().lastRefresh;
}

bool FileOverlayRepository::setLastRefresh(const QDateTime &timestamp)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->updateLocalState([&timestamp](LocalState &state) { state.lastRefresh = timestamp; });
}

} // namespace data
} // namespace taskdash
