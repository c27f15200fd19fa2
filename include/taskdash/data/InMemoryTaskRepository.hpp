#pragma once

#include "taskdash/data/TaskRepository.hpp"

namespace taskdash {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    explicit InMemoryTaskRepository(std::vector<Task> tasks);
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    bool replaceTasks(std::vector<Task> tasks) override;

private:
    std::vector<Task> m_tasks;
};

} // namespace data
} // namespace taskdash
