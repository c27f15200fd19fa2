#pragma once

#include <QDateTime>
#include <QString>
#include <optional>
#include <vector>

#include "taskdash/data/Task.hpp"
#include "taskdash/data/TaskCategory.hpp"

namespace taskdash {
namespace engine {

struct ViewFilter
{
    data::TaskCategory category = data::TaskCategory::MyAction;
    std::optional<quint64> userId;
    QString text;
};

bool passesAssignment(const data::Task &task, const std::optional<quint64> &userId);

// Case-insensitive substring test against name, list, status and description.
bool matchesText(const data::Task &task, const QString &text);

/**
 * Tasks of one category that pass the filters, together with the ancestors
 * needed to show them in context. An ancestor chain stops after the first
 * ancestor that is not assigned to the filtered user; ancestors ignore the
 * category and text filters. The result is sorted hierarchically.
 */
std::vector<data::DisplayTask> buildWorkingSet(const std::vector<data::Task> &tasks,
                                               const data::OverlayMap &overlays,
                                               const QDateTime &now,
                                               const ViewFilter &filter);

} // namespace engine
} // namespace taskdash
