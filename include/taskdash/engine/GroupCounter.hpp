#pragma once

#include <QDateTime>
#include <QMap>
#include <vector>

#include "taskdash/data/Task.hpp"
#include "taskdash/data/TaskCategory.hpp"

namespace taskdash {
namespace engine {

using CategoryCounts = QMap<data::TaskCategory, int>;

// Tasks per category for every category, ignoring user and text filters.
CategoryCounts countByCategory(const std::vector<data::Task> &tasks,
                               const data::OverlayMap &overlays,
                               const QDateTime &now);

} // namespace engine
} // namespace taskdash
