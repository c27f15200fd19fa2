#include "taskdash/data/InMemoryTaskRepository.hpp"

#include <algorithm>

namespace taskdash {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;

InMemoryTaskRepository::InMemoryTaskRepository(std::vector<Task> tasks)
    : m_tasks(std::move(tasks))
{
}

InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    return m_tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QString &id) const
{
    const auto it = std::find_if(m_tasks.begin(), m_tasks.end(), [&id](const Task &task) {
        return task.id == id;
    });
    if (it == m_tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

bool InMemoryTaskRepository::replaceTasks(std::vector<Task> tasks)
{
    m_tasks = std::move(tasks);
    return true;
}

} // namespace data
} // namespace taskdash
