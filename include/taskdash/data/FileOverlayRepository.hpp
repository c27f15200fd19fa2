#pragma once

#include "taskdash/data/FileDashboardStorage.hpp"
#include "taskdash/data/OverlayRepository.hpp"

#include <memory>

namespace taskdash {
namespace data {

class FileOverlayRepository : public OverlayRepository
{
public:
    explicit FileOverlayRepository(std::shared_ptr<FileDashboardStorage> storage);
    ~FileOverlayRepository() override = default;

    OverlayMap overlays() const override;
    TaskOverlay overlay(const QString &taskId) const override;
    bool isPinned(const QString &taskId) const override;
    bool togglePin(const QString &taskId) override;
    bool snooze(const QString &taskId, const QDateTime &until) override;
    bool unsnooze(const QString &taskId) override;
    QDateTime lastRefresh() const override;
    bool setLastRefresh(const QDateTime &timestamp) override;

private:
    std::shared_ptr<FileDashboardStorage> m_storage;
};

} // namespace data
} // namespace taskdash
