#pragma once

#include <QAbstractListModel>
#include <QHash>
#include <vector>

#include "taskdash/data/Task.hpp"

namespace taskdash {
namespace ui {

class TaskListModel : public QAbstractListModel
{
    Q_OBJECT

public:
    enum Roles
    {
        IdRole = Qt::UserRole + 1,
        StatusRole,
        ListNameRole,
        PriorityLabelRole,
        TypeLabelRole,
        PinnedRole,
        SnoozedUntilRole,
        UrlRole,
        ParentIdRole,
        DepthRole,
    };

    explicit TaskListModel(QObject *parent = nullptr);

    int rowCount(const QModelIndex &parent = QModelIndex()) const override;
    QVariant data(const QModelIndex &index, int role) const override;
    QHash<int, QByteArray> roleNames() const override;

    // @p depths maps task ids to their indentation level; missing ids are 0.
    void setTasks(std::vector<data::DisplayTask> tasks, QHash<QString, int> depths = {});
    const data::DisplayTask *taskAt(const QModelIndex &index) const;

private:
    std::vector<data::DisplayTask> m_tasks;
    QHash<QString, int> m_depths;
};

} // namespace ui
} // namespace taskdash
