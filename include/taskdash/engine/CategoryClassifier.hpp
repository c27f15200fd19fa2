#pragma once

#include <QDateTime>

#include "taskdash/data/Task.hpp"
#include "taskdash/data/TaskCategory.hpp"

namespace taskdash {
namespace engine {

// Effective category of a task: Person tasks always stay in Person, an active
// snooze wins over the status, otherwise the status decides.
data::TaskCategory classify(const data::Task &task, const data::TaskOverlay &overlay, const QDateTime &now);

bool belongsTo(const data::Task &task,
               const data::TaskOverlay &overlay,
               const QDateTime &now,
               data::TaskCategory category);

} // namespace engine
} // namespace taskdash
