#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace engine {

constexpr int FuzzyMatchPoint = 1;
constexpr int FuzzyWordBoundaryBonus = 10;
constexpr int FuzzyConsecutiveBonus = 5;

/**
 * Scores @p text against @p loweredQuery, which must already be lowercase.
 * Returns std::nullopt unless every query character occurs in the text in
 * order. Each matched character earns a point, matches at the start of a word
 * earn a boundary bonus and matches directly following the previous match earn
 * a consecutive bonus.
 */
std::optional<int> fuzzyScore(const QString &text, const QString &loweredQuery);

struct SearchHit
{
    data::DisplayTask task;
    int score = 0;
};

// Best score first; equal scores keep the order of @p tasks.
std::vector<SearchHit> rankTasks(const std::vector<data::Task> &tasks,
                                 const data::OverlayMap &overlays,
                                 const QString &query);

std::vector<data::DisplayTask> searchTasks(const std::vector<data::Task> &tasks,
                                           const data::OverlayMap &overlays,
                                           const QString &query);

} // namespace engine
} // namespace taskdash
