#include "taskdash/data/TaskCategory.hpp"

#include <QHash>

namespace taskdash {
namespace data {

namespace {
const QHash<QString, TaskCategory> &statusTable()
{
    static const QHash<QString, TaskCategory> table = {
        // Actionable by me
        { QStringLiteral("in progress"), TaskCategory::MyAction },
        { QStringLiteral("to do"), TaskCategory::MyAction },
        { QStringLiteral("todo"), TaskCategory::MyAction },
        { QStringLiteral("to-do"), TaskCategory::MyAction },
        { QStringLiteral("in review"), TaskCategory::MyAction },
        { QStringLiteral("review"), TaskCategory::MyAction },
        { QStringLiteral("to review"), TaskCategory::MyAction },
        // Someone else holds the ball
        { QStringLiteral("blocked"), TaskCategory::Waiting },
        { QStringLiteral("in testing"), TaskCategory::Waiting },
        { QStringLiteral("testing"), TaskCategory::Waiting },
        { QStringLiteral("to validate"), TaskCategory::Waiting },
        { QStringLiteral("validation"), TaskCategory::Waiting },
        { QStringLiteral("pending review"), TaskCategory::Waiting },
        { QStringLiteral("backlog"), TaskCategory::Backlog },
        { QStringLiteral("open"), TaskCategory::Backlog },
        { QStringLiteral("new"), TaskCategory::Backlog },
        { QStringLiteral("done"), TaskCategory::Done },
        { QStringLiteral("complete"), TaskCategory::Done },
        { QStringLiteral("completed"), TaskCategory::Done },
        { QStringLiteral("closed"), TaskCategory::Done },
        { QStringLiteral("released"), TaskCategory::Done },
        { QStringLiteral("deployed"), TaskCategory::Done },
        { QStringLiteral("shipped"), TaskCategory::Done },
        { QStringLiteral("cancelled"), TaskCategory::Done },
        { QStringLiteral("canceled"), TaskCategory::Done },
        { QStringLiteral("won't do"), TaskCategory::Done },
        { QStringLiteral("wontdo"), TaskCategory::Done },
        { QStringLiteral("for reference"), TaskCategory::Done },
    };
    return table;
}
} // namespace

const std::array<TaskCategory, TaskCategoryCount> &allCategories()
{
    static const std::array<TaskCategory, TaskCategoryCount> categories = {
        TaskCategory::MyAction, TaskCategory::Waiting, TaskCategory::Backlog,
        TaskCategory::Done,     TaskCategory::Snoozed, TaskCategory::Person,
    };
    return categories;
}

QString categoryLabel(TaskCategory category)
{
    switch (category) {
    case TaskCategory::MyAction:
        return QStringLiteral("My Action");
    case TaskCategory::Waiting:
        return QStringLiteral("Waiting");
    case TaskCategory::Backlog:
        return QStringLiteral("Backlog");
    case TaskCategory::Done:
        return QStringLiteral("Done");
    case TaskCategory::Snoozed:
        return QStringLiteral("Snoozed");
    case TaskCategory::Person:
        return QStringLiteral("Person");
    }
    return {};
}

std::size_t categoryIndex(TaskCategory category)
{
    return static_cast<std::size_t>(category);
}

std::optional<TaskCategory> categoryFromIndex(std::size_t index)
{
    if (index >= TaskCategoryCount) {
        return std::nullopt;
    }
    return allCategories()[index];
}

TaskCategory nextCategory(TaskCategory category)
{
    return allCategories()[(categoryIndex(category) + 1) % TaskCategoryCount];
}

TaskCategory previousCategory(TaskCategory category)
{
    return allCategories()[(categoryIndex(category) + TaskCategoryCount - 1) % TaskCategoryCount];
}

std::optional<TaskCategory> categoryFromKeyword(const QString &keyword)
{
    const QString key = keyword.trimmed().toLower();
    if (key == QLatin1String("my-action") || key == QLatin1String("myaction")
        || key == QLatin1String("action")) {
        return TaskCategory::MyAction;
    }
    if (key == QLatin1String("waiting")) {
        return TaskCategory::Waiting;
    }
    if (key == QLatin1String("backlog")) {
        return TaskCategory::Backlog;
    }
    if (key == QLatin1String("done")) {
        return TaskCategory::Done;
    }
    if (key == QLatin1String("snoozed")) {
        return TaskCategory::Snoozed;
    }
    if (key == QLatin1String("person")) {
        return TaskCategory::Person;
    }
    return std::nullopt;
}

TaskCategory statusToCategory(const QString &status)
{
    return statusTable().value(status.toLower(), TaskCategory::Backlog);
}

} // namespace data
} // namespace taskdash
