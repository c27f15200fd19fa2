#pragma once

#include <QString>
#include <array>
#include <cstddef>
#include <optional>

namespace taskdash {
namespace data {

enum class TaskCategory
{
    MyAction,
    Waiting,
    Backlog,
    Done,
    Snoozed,
    Person,
};

constexpr std::size_t TaskCategoryCount = 6;

const std::array<TaskCategory, TaskCategoryCount> &allCategories();

QString categoryLabel(TaskCategory category);
std::size_t categoryIndex(TaskCategory category);
std::optional<TaskCategory> categoryFromIndex(std::size_t index);
TaskCategory nextCategory(TaskCategory category);
TaskCategory previousCategory(TaskCategory category);

// Accepts CLI spellings such as "my-action", "waiting" or "person".
std::optional<TaskCategory> categoryFromKeyword(const QString &keyword);

// Maps a free-text workflow status onto one of the four status-driven
// categories. Unknown statuses land in Backlog.
TaskCategory statusToCategory(const QString &status);

} // namespace data
} // namespace taskdash
