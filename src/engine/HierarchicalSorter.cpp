#include "taskdash/engine/HierarchicalSorter.hpp"

#include <QSet>
#include <algorithm>
#include <numeric>
#include <optional>

namespace taskdash {
namespace engine {

namespace {
struct SortKey
{
    std::optional<int> rootPriority;
    QString rootId;
    int depth = 0;
    QString id;
};

int comparePriority(const std::optional<int> &lhs, const std::optional<int> &rhs)
{
    if (lhs.has_value() && rhs.has_value()) {
        if (lhs.value() == rhs.value()) {
            return 0;
        }
        return lhs.value() < rhs.value() ? -1 : 1;
    }
    if (lhs.has_value()) {
        return -1;
    }
    if (rhs.has_value()) {
        return 1;
    }
    return 0;
}

bool keyLess(const SortKey &lhs, const SortKey &rhs)
{
    const int priority = comparePriority(lhs.rootPriority, rhs.rootPriority);
    if (priority != 0) {
        return priority < 0;
    }
    if (lhs.rootId != rhs.rootId) {
        return lhs.rootId < rhs.rootId;
    }
    if (lhs.depth != rhs.depth) {
        return lhs.depth < rhs.depth;
    }
    return lhs.id < rhs.id;
}
} // namespace

QHash<QString, HierarchyPosition> hierarchyPositions(const std::vector<data::DisplayTask> &tasks)
{
    QHash<QString, const data::Task *> visible;
    visible.reserve(static_cast<int>(tasks.size()));
    for (const auto &entry : tasks) {
        visible.insert(entry.task.id, &entry.task);
    }

    QHash<QString, HierarchyPosition> positions;
    positions.reserve(visible.size());
    for (const auto &entry : tasks) {
        HierarchyPosition position{ entry.task.id, 0 };
        QSet<QString> seen{ entry.task.id };
        auto parentId = entry.task.parentId;
        while (parentId.has_value() && !seen.contains(parentId.value())) {
            const auto it = visible.constFind(parentId.value());
            if (it == visible.constEnd()) {
                break;
            }
            seen.insert(parentId.value());
            position.rootId = parentId.value();
            ++position.depth;
            parentId = it.value()->parentId;
        }
        positions.insert(entry.task.id, position);
    }
    return positions;
}

void sortHierarchically(std::vector<data::DisplayTask> &tasks)
{
    if (tasks.size() < 2) {
        return;
    }

    QHash<QString, std::optional<int>> priorities;
    for (const auto &entry : tasks) {
        priorities.insert(entry.task.id, entry.task.priority);
    }
    const auto positions = hierarchyPositions(tasks);

    std::vector<SortKey> keys;
    keys.reserve(tasks.size());
    for (const auto &entry : tasks) {
        const auto position = positions.value(entry.task.id);
        keys.push_back({ priorities.value(position.rootId), position.rootId, position.depth, entry.task.id });
    }

    std::vector<std::size_t> order(tasks.size());
    std::iota(order.begin(), order.end(), std::size_t{ 0 });
    std::stable_sort(order.begin(), order.end(), [&keys](std::size_t lhs, std::size_t rhs) {
        return keyLess(keys[lhs], keys[rhs]);
    });

    std::vector<data::DisplayTask> sorted;
    sorted.reserve(tasks.size());
    for (const auto index : order) {
        sorted.push_back(std::move(tasks[index]));
    }
    tasks = std::move(sorted);
}

} // namespace engine
} // namespace taskdash
