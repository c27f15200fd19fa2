#pragma once

#include "taskdash/data/LocalState.hpp"
#include "taskdash/data/OverlayRepository.hpp"

namespace taskdash {
namespace data {

class InMemoryOverlayRepository : public OverlayRepository
{
public:
    InMemoryOverlayRepository();
    ~InMemoryOverlayRepository() override;

    OverlayMap overlays() const override;
    TaskOverlay overlay(const QString &taskId) const override;
    bool isPinned(const QString &taskId) const override;
    bool togglePin(const QString &taskId) override;
    bool snooze(const QString &taskId, const QDateTime &until) override;
    bool unsnooze(const QString &taskId) override;
    QDateTime lastRefresh() const override;
    bool setLastRefresh(const QDateTime &timestamp) override;

private:
    LocalState m_state;
};

} // namespace data
} // namespace taskdash
