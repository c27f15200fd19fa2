#include <QtTest/QtTest>

#include "taskdash/ui/models/TaskListModel.hpp"

using namespace taskdash;

namespace {
data::DisplayTask makeEntry(const QString &id, const QString &name)
{
    data::DisplayTask entry;
    entry.task.id = id;
    entry.task.name = name;
    entry.task.status = QStringLiteral("in progress");
    entry.task.listName = QStringLiteral("Operations");
    return entry;
}
} // namespace

class TaskListModelTest : public QObject
{
    Q_OBJECT

private slots:
    void setTasksAndData();
    void customRoles();
    void outOfRangeIsEmpty();
};

void TaskListModelTest::setTasksAndData()
{
    ui::TaskListModel model;
    auto plain = makeEntry(QStringLiteral("a"), QStringLiteral("Plain"));
    auto tagged = makeEntry(QStringLiteral("b"), QStringLiteral("Tagged"));
    tagged.task.customId = QStringLiteral("OPS-1");
    tagged.task.description = QStringLiteral("Desc");
    model.setTasks({ plain, tagged });

    QCOMPARE(model.rowCount(), 2);
    QCOMPARE(model.data(model.index(0, 0), Qt::DisplayRole), QVariant(QStringLiteral("Plain")));
    QCOMPARE(model.data(model.index(1, 0), Qt::DisplayRole), QVariant(QStringLiteral("[OPS-1] Tagged")));
    QCOMPARE(model.data(model.index(1, 0), Qt::ToolTipRole), QVariant(QStringLiteral("Desc")));
}

void TaskListModelTest::customRoles()
{
    ui::TaskListModel model;
    auto parent = makeEntry(QStringLiteral("p"), QStringLiteral("Parent"));
    parent.task.priority = 1;
    parent.task.customItemId = 1004;
    parent.overlay.pinned = true;
    auto child = makeEntry(QStringLiteral("c"), QStringLiteral("Child"));
    child.task.parentId = QStringLiteral("p");
    model.setTasks({ parent, child }, { { QStringLiteral("c"), 1 } });

    const auto first = model.index(0, 0);
    QCOMPARE(model.data(first, ui::TaskListModel::IdRole).toString(), QStringLiteral("p"));
    QCOMPARE(model.data(first, ui::TaskListModel::PriorityLabelRole).toString(), QStringLiteral("Urgent"));
    QCOMPARE(model.data(first, ui::TaskListModel::TypeLabelRole).toString(), QStringLiteral("Bug"));
    QCOMPARE(model.data(first, ui::TaskListModel::PinnedRole).toBool(), true);
    QCOMPARE(model.data(first, ui::TaskListModel::DepthRole).toInt(), 0);

    const auto second = model.index(1, 0);
    QCOMPARE(model.data(second, ui::TaskListModel::ParentIdRole).toString(), QStringLiteral("p"));
    QCOMPARE(model.data(second, ui::TaskListModel::DepthRole).toInt(), 1);
    QVERIFY(model.data(second, ui::TaskListModel::PriorityLabelRole).toString().isEmpty());

    QCOMPARE(model.roleNames().value(ui::TaskListModel::IdRole), QByteArray("taskId"));
}

void TaskListModelTest::outOfRangeIsEmpty()
{
    ui::TaskListModel model;
    model.setTasks({ makeEntry(QStringLiteral("a"), QStringLiteral("Only")) });
    QVERIFY(!model.data(model.index(3, 0), Qt::DisplayRole).isValid());
    QVERIFY(model.taskAt(model.index(3, 0)) == nullptr);
    QCOMPARE(model.taskAt(model.index(0, 0))->task.id, QStringLiteral("a"));
}

QTEST_GUILESS_MAIN(TaskListModelTest)
#include "TaskListModelTest.moc"
