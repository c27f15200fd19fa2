#pragma once

#include <memory>
#include <QString>

namespace taskdash {
namespace data {

class TaskRepository;
class OverlayRepository;
class FileDashboardStorage;

class DataProvider
{
public:
    explicit DataProvider(const QString &dataDirectory);
    ~DataProvider();

    TaskRepository &taskRepository();
    OverlayRepository &overlayRepository();

private:
    std::shared_ptr<FileDashboardStorage> m_storage;
    std::unique_ptr<TaskRepository> m_taskRepository;
    std::unique_ptr<OverlayRepository> m_overlayRepository;
};

} // namespace data
} // namespace taskdash
