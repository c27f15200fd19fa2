#pragma once

#include <QHash>
#include <QString>
#include <vector>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace engine {

// Position of a task inside a visible set. The root is the topmost ancestor
// that is part of the set; depth counts the visible ancestors.
struct HierarchyPosition
{
    QString rootId;
    int depth = 0;
};

QHash<QString, HierarchyPosition> hierarchyPositions(const std::vector<data::DisplayTask> &tasks);

// Orders by root priority (missing last), root id, depth and finally task id.
void sortHierarchically(std::vector<data::DisplayTask> &tasks);

} // namespace engine
} // namespace taskdash
