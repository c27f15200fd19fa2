#pragma once

#include <optional>
#include <vector>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace data {

class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(const QString &id) const = 0;
    virtual bool replaceTasks(std::vector<Task> tasks) = 0;
};

} // namespace data
} // namespace taskdash
