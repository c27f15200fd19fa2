#include "taskdash/engine/GroupCounter.hpp"

#include "taskdash/engine/CategoryClassifier.hpp"

namespace taskdash {
namespace engine {

CategoryCounts countByCategory(const std::vector<data::Task> &tasks,
                               const data::OverlayMap &overlays,
                               const QDateTime &now)
{
    CategoryCounts counts;
    for (const auto category : data::allCategories()) {
        counts.insert(category, 0);
    }
    for (const auto &task : tasks) {
        ++counts[classify(task, data::overlayFor(overlays, task.id), now)];
    }
    return counts;
}

} // namespace engine
} // namespace taskdash
