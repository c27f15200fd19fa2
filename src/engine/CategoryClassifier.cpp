#include "taskdash/engine/CategoryClassifier.hpp"

namespace taskdash {
namespace engine {

data::TaskCategory classify(const data::Task &task, const data::TaskOverlay &overlay, const QDateTime &now)
{
    if (task.isPerson()) {
        return data::TaskCategory::Person;
    }
    if (overlay.isSnoozedAt(now)) {
        return data::TaskCategory::Snoozed;
    }
    return data::statusToCategory(task.status);
}

bool belongsTo(const data::Task &task,
               const data::TaskOverlay &overlay,
               const QDateTime &now,
               data::TaskCategory category)
{
    return classify(task, overlay, now) == category;
}

} // namespace engine
} // namespace taskdash
