#include "taskdash/ui/models/TaskListModel.hpp"

namespace taskdash {
namespace ui {

TaskListModel::TaskListModel(QObject *parent)
    : QAbstractListModel(parent)
{
}

int TaskListModel::rowCount(const QModelIndex &parent) const
{
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(m_tasks.size());
}

QVariant TaskListModel::data(const QModelIndex &index, int role) const
{
    const auto *entry = taskAt(index);
    if (!entry) {
        return {};
    }

    const auto &task = entry->task;
    switch (role) {
    case Qt::DisplayRole:
        if (!task.customId.isEmpty()) {
            return QStringLiteral("[%1] %2").arg(task.customId, task.name);
        }
        return task.name;
    case Qt::ToolTipRole:
        return task.description.value_or(QString());
    case IdRole:
        return task.id;
    case StatusRole:
        return task.status;
    case ListNameRole:
        return task.listName;
    case PriorityLabelRole:
        return data::priorityLabel(task).value_or(QString());
    case TypeLabelRole:
        return data::typeLabel(task).value_or(QString());
    case PinnedRole:
        return entry->overlay.pinned;
    case SnoozedUntilRole:
        return entry->overlay.snoozedUntil;
    case UrlRole:
        return task.url;
    case ParentIdRole:
        return task.parentId.value_or(QString());
    case DepthRole:
        return m_depths.value(task.id, 0);
    default:
        return {};
    }
}

QHash<int, QByteArray> TaskListModel::roleNames() const
{
    auto roles = QAbstractListModel::roleNames();
    roles.insert(IdRole, "taskId");
    roles.insert(StatusRole, "status");
    roles.insert(ListNameRole, "listName");
    roles.insert(PriorityLabelRole, "priorityLabel");
    roles.insert(TypeLabelRole, "typeLabel");
    roles.insert(PinnedRole, "pinned");
    roles.insert(SnoozedUntilRole, "snoozedUntil");
    roles.insert(UrlRole, "url");
    roles.insert(ParentIdRole, "parentId");
    roles.insert(DepthRole, "depth");
    return roles;
}

void TaskListModel::setTasks(std::vector<data::DisplayTask> tasks, QHash<QString, int> depths)
{
    beginResetModel();
    m_tasks = std::move(tasks);
    m_depths = std::move(depths);
    endResetModel();
}

const data::DisplayTask *TaskListModel::taskAt(const QModelIndex &index) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= static_cast<int>(m_tasks.size())) {
        return nullptr;
    }
    return &m_tasks.at(static_cast<size_t>(index.row()));
}

} // namespace ui
} // namespace taskdash
