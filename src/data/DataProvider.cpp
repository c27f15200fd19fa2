#include "taskdash/data/DataProvider.hpp"

#include "taskdash/data/FileDashboardStorage.hpp"
#include "taskdash/data/FileOverlayRepository.hpp"
#include "taskdash/data/FileTaskRepository.hpp"

namespace taskdash {
namespace data {

DataProvider::DataProvider(const QString &dataDirectory)
    : m_storage(std::make_shared<FileDashboardStorage>(dataDirectory))
    , m_taskRepository(std::make_unique<FileTaskRepository>(m_storage))
    , m_overlayRepository(std::make_unique<FileOverlayRepository>(m_storage))
{
}

DataProvider::~DataProvider() = default;

TaskRepository &DataProvider::taskRepository()
{
    return *m_taskRepository;
}

OverlayRepository &DataProvider::overlayRepository()
{
    return *m_overlayRepository;
}

} // namespace data
} // namespace taskdash
