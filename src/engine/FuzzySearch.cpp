#include "taskdash/engine/FuzzySearch.hpp"

#include <QVector>
#include <algorithm>

namespace taskdash {
namespace engine {

namespace {
// Fields are tried in a fixed order and the first match decides the score.
std::optional<int> scoreTask(const data::Task &task, const QString &loweredQuery)
{
    if (auto score = fuzzyScore(task.name, loweredQuery)) {
        return score;
    }
    if (auto score = fuzzyScore(task.listName, loweredQuery)) {
        return score;
    }
    if (auto score = fuzzyScore(task.status, loweredQuery)) {
        return score;
    }
    if (task.description.has_value()) {
        if (auto score = fuzzyScore(task.description.value(), loweredQuery)) {
            return score;
        }
    }
    for (const auto &tag : task.tags) {
        if (auto score = fuzzyScore(tag, loweredQuery)) {
            return score;
        }
    }
    return std::nullopt;
}
} // namespace

std::optional<int> fuzzyScore(const QString &text, const QString &loweredQuery)
{
    if (loweredQuery.isEmpty()) {
        return 0;
    }

    // Positions count code points, so surrogate pairs match as one character.
    const QVector<uint> lowered = text.toLower().toUcs4();
    const QVector<uint> query = loweredQuery.toUcs4();
    int queryIndex = 0;
    int lastMatch = -1;
    int score = 0;
    for (int i = 0; i < lowered.size() && queryIndex < query.size(); ++i) {
        if (lowered.at(i) != query.at(queryIndex)) {
            continue;
        }
        if (lastMatch >= 0 && i == lastMatch + 1) {
            score += FuzzyConsecutiveBonus;
        }
        if (i == 0 || !QChar::isLetterOrNumber(lowered.at(i - 1))) {
            score += FuzzyWordBoundaryBonus;
        }
        score += FuzzyMatchPoint;
        lastMatch = i;
        ++queryIndex;
    }

    if (queryIndex < query.size()) {
        return std::nullopt;
    }
    return score;
}

std::vector<SearchHit> rankTasks(const std::vector<data::Task> &tasks,
                                 const data::OverlayMap &overlays,
                                 const QString &query)
{
    std::vector<SearchHit> hits;
    if (query.isEmpty()) {
        return hits;
    }

    const QString loweredQuery = query.toLower();
    for (const auto &task : tasks) {
        const auto score = scoreTask(task, loweredQuery);
        if (!score.has_value()) {
            continue;
        }
        hits.push_back({ data::makeDisplayTask(task, overlays), score.value() });
    }

    std::stable_sort(hits.begin(), hits.end(), [](const SearchHit &lhs, const SearchHit &rhs) {
        return lhs.score > rhs.score;
    });
    return hits;
}

std::vector<data::DisplayTask> searchTasks(const std::vector<data::Task> &tasks,
                                           const data::OverlayMap &overlays,
                                           const QString &query)
{
    auto hits = rankTasks(tasks, overlays, query);
    std::vector<data::DisplayTask> result;
    result.reserve(hits.size());
    for (auto &hit : hits) {
        result.push_back(std::move(hit.task));
    }
    return result;
}

} // namespace engine
} // namespace taskdash
