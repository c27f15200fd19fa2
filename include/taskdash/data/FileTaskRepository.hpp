#pragma once

#include "taskdash/data/FileDashboardStorage.hpp"
#include "taskdash/data/TaskRepository.hpp"

#include <memory>

namespace taskdash {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileDashboardStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    bool replaceTasks(std::vector<Task> tasks) override;

private:
    std::shared_ptr<FileDashboardStorage> m_storage;
};

} // namespace data
} // namespace taskdash
