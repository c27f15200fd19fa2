#include "taskdash/engine/WorkingSetBuilder.hpp"

#include <QHash>
#include <QSet>

#include "taskdash/engine/CategoryClassifier.hpp"
#include "taskdash/engine/HierarchicalSorter.hpp"

namespace taskdash {
namespace engine {

bool passesAssignment(const data::Task &task, const std::optional<quint64> &userId)
{
    return !userId.has_value() || task.isAssignedTo(userId.value());
}

bool matchesText(const data::Task &task, const QString &text)
{
    if (text.isEmpty()) {
        return true;
    }
    if (task.name.contains(text, Qt::CaseInsensitive) || task.listName.contains(text, Qt::CaseInsensitive)
        || task.status.contains(text, Qt::CaseInsensitive)) {
        return true;
    }
    return task.description.has_value() && task.description->contains(text, Qt::CaseInsensitive);
}

std::vector<data::DisplayTask> buildWorkingSet(const std::vector<data::Task> &tasks,
                                               const data::OverlayMap &overlays,
                                               const QDateTime &now,
                                               const ViewFilter &filter)
{
    QHash<QString, const data::Task *> index;
    index.reserve(static_cast<int>(tasks.size()));
    for (const auto &task : tasks) {
        index.insert(task.id, &task);
    }

    std::vector<data::DisplayTask> result;
    QSet<QString> includedIds;
    auto include = [&](const data::Task &task) {
        if (includedIds.contains(task.id)) {
            return;
        }
        includedIds.insert(task.id);
        result.push_back(data::makeDisplayTask(task, overlays));
    };

    for (const auto &task : tasks) {
        const auto overlay = data::overlayFor(overlays, task.id);
        if (!belongsTo(task, overlay, now, filter.category) || !passesAssignment(task, filter.userId)
            || !matchesText(task, filter.text)) {
            continue;
        }
        include(task);

        // Parent references may form a cycle; never revisit a task.
        QSet<QString> visited{ task.id };
        auto parentId = task.parentId;
        while (parentId.has_value() && !visited.contains(parentId.value())) {
            const auto it = index.constFind(parentId.value());
            if (it == index.constEnd()) {
                break;
            }
            const data::Task *parent = it.value();
            visited.insert(parent->id);
            include(*parent);
            if (!passesAssignment(*parent, filter.userId)) {
                break;
            }
            parentId = parent->parentId;
        }
    }

    sortHierarchically(result);
    return result;
}

} // namespace engine
} // namespace taskdash
