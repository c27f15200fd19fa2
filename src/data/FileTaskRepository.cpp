#include "taskdash/data/FileTaskRepository.hpp"

#include <algorithm>

namespace taskdash {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileDashboardStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskRepository::fetchTasks() const
{
    if (!m_storage) {
        return {};
    }
    return m_storage->tasks();
}

std::optional<Task> FileTaskRepository::findById(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->tasks();
    const auto it = std::find_if(tasks.begin(), tasks.end(), [&id](const Task &task) {
        return task.id == id;
    });
    if (it == tasks.end()) {
        return std::nullopt;
    }
    return *it;
}

bool FileTaskRepository::replaceTasks(std::vector<Task> tasks)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->replaceTasks(std::move(tasks));
}

} // namespace data
} // namespace taskdash
