#include <QtTest/QtTest>

#include "taskdash/engine/WorkingSetBuilder.hpp"

using namespace taskdash;

namespace {
const QDateTime Now(QDate(2024, 5, 1), QTime(12, 0), Qt::UTC);
constexpr quint64 Me = 42;
constexpr quint64 Someone = 7;

data::Task makeTask(const QString &id,
                    const QString &status,
                    std::optional<QString> parentId = std::nullopt,
                    QSet<quint64> assignees = { Me })
{
    data::Task task;
    task.id = id;
    task.name = QStringLiteral("Task %1").arg(id);
    task.status = status;
    task.listName = QStringLiteral("Sprint");
    task.parentId = std::move(parentId);
    task.assigneeIds = std::move(assignees);
    return task;
}

QStringList idsOf(const std::vector<data::DisplayTask> &tasks)
{
    QStringList ids;
    for (const auto &entry : tasks) {
        ids << entry.task.id;
    }
    return ids;
}

engine::ViewFilter filterFor(data::TaskCategory category, std::optional<quint64> userId = Me, QString text = {})
{
    engine::ViewFilter filter;
    filter.category = category;
    filter.userId = userId;
    filter.text = std::move(text);
    return filter;
}
} // namespace

class WorkingSetBuilderTest : public QObject
{
    Q_OBJECT

private slots:
    void selectsCategoryMembers();
    void includesAncestorsOutsideCategory();
    void stopsAfterUnassignedAncestor();
    void ignoresMissingParents();
    void terminatesOnParentCycle();
    void terminatesOnSelfParent();
    void appliesAssignmentFilter();
    void appliesTextFilterToPrimaryTasksOnly();
    void personCategoryIsPartitioned();
    void attachesOverlays();
    void duplicateIdsAppearOnce();
};

void WorkingSetBuilderTest::selectsCategoryMembers()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("a"), QStringLiteral("in progress")),
        makeTask(QStringLiteral("b"), QStringLiteral("blocked")),
        makeTask(QStringLiteral("c"), QStringLiteral("to do")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("a"), QStringLiteral("c") }));
}

void WorkingSetBuilderTest::includesAncestorsOutsideCategory()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("root"), QStringLiteral("done")),
        makeTask(QStringLiteral("mid"), QStringLiteral("backlog"), QStringLiteral("root")),
        makeTask(QStringLiteral("leaf"), QStringLiteral("in progress"), QStringLiteral("mid")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("root"), QStringLiteral("mid"), QStringLiteral("leaf") }));
}

void WorkingSetBuilderTest::stopsAfterUnassignedAncestor()
{
    // leaf -> mid -> root; mid belongs to someone else, so root is cut off.
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("root"), QStringLiteral("open")),
        makeTask(QStringLiteral("mid"), QStringLiteral("open"), QStringLiteral("root"), { Someone }),
        makeTask(QStringLiteral("leaf"), QStringLiteral("in progress"), QStringLiteral("mid")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("mid"), QStringLiteral("leaf") }));

    const auto everyone = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction, std::nullopt));
    QCOMPARE(everyone.size(), static_cast<size_t>(3));
}

void WorkingSetBuilderTest::ignoresMissingParents()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("leaf"), QStringLiteral("in progress"), QStringLiteral("not-fetched")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("leaf") }));
}

void WorkingSetBuilderTest::terminatesOnParentCycle()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("a"), QStringLiteral("in progress"), QStringLiteral("b")),
        makeTask(QStringLiteral("b"), QStringLiteral("in progress"), QStringLiteral("a")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    auto ids = idsOf(result);
    ids.sort();
    QCOMPARE(ids, QStringList({ QStringLiteral("a"), QStringLiteral("b") }));
}

void WorkingSetBuilderTest::terminatesOnSelfParent()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("a"), QStringLiteral("in progress"), QStringLiteral("a")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("a") }));
}

void WorkingSetBuilderTest::appliesAssignmentFilter()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("mine"), QStringLiteral("blocked")),
        makeTask(QStringLiteral("theirs"), QStringLiteral("blocked"), std::nullopt, { Someone }),
    };

    const auto mine = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::Waiting));
    QCOMPARE(idsOf(mine), QStringList({ QStringLiteral("mine") }));

    const auto all = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::Waiting, std::nullopt));
    QCOMPARE(all.size(), static_cast<size_t>(2));
}

void WorkingSetBuilderTest::appliesTextFilterToPrimaryTasksOnly()
{
    auto parent = makeTask(QStringLiteral("parent"), QStringLiteral("open"));
    parent.name = QStringLiteral("Release planning");
    auto child = makeTask(QStringLiteral("child"), QStringLiteral("open"), QStringLiteral("parent"));
    child.name = QStringLiteral("Write notes");
    child.description = QStringLiteral("Mention the DATABASE migration");
    auto other = makeTask(QStringLiteral("other"), QStringLiteral("open"));
    other.name = QStringLiteral("Unrelated");
    const std::vector<data::Task> tasks = { parent, child, other };

    const auto result = engine::buildWorkingSet(tasks, {}, Now,
                                                filterFor(data::TaskCategory::Backlog, Me, QStringLiteral("database")));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("parent"), QStringLiteral("child") }));

    const auto byList = engine::buildWorkingSet(tasks, {}, Now,
                                                filterFor(data::TaskCategory::Backlog, Me, QStringLiteral("SPRINT")));
    QCOMPARE(byList.size(), static_cast<size_t>(3));
}

void WorkingSetBuilderTest::personCategoryIsPartitioned()
{
    auto person = makeTask(QStringLiteral("p"), QStringLiteral("in progress"));
    person.customItemId = data::PersonItemId;
    const std::vector<data::Task> tasks = { person, makeTask(QStringLiteral("t"), QStringLiteral("in progress")) };

    const auto people = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::Person));
    QCOMPARE(idsOf(people), QStringList({ QStringLiteral("p") }));

    const auto action = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(action), QStringList({ QStringLiteral("t") }));
}

void WorkingSetBuilderTest::attachesOverlays()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("a"), QStringLiteral("done")),
        makeTask(QStringLiteral("b"), QStringLiteral("done")),
    };
    data::OverlayMap overlays;
    overlays[QStringLiteral("a")].pinned = true;
    overlays[QStringLiteral("b")].snoozedUntil = Now.addDays(1);

    const auto done = engine::buildWorkingSet(tasks, overlays, Now, filterFor(data::TaskCategory::Done));
    QCOMPARE(done.size(), static_cast<size_t>(1));
    QVERIFY(done.front().overlay.pinned);

    const auto snoozed = engine::buildWorkingSet(tasks, overlays, Now, filterFor(data::TaskCategory::Snoozed));
    QCOMPARE(idsOf(snoozed), QStringList({ QStringLiteral("b") }));
}

void WorkingSetBuilderTest::duplicateIdsAppearOnce()
{
    auto staleParent = makeTask(QStringLiteral("p"), QStringLiteral("done"));
    staleParent.name = QStringLiteral("stale");
    auto freshParent = makeTask(QStringLiteral("p"), QStringLiteral("done"));
    freshParent.name = QStringLiteral("fresh");
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("a"), QStringLiteral("in progress")),
        makeTask(QStringLiteral("a"), QStringLiteral("in progress")),
        staleParent,
        freshParent,
        makeTask(QStringLiteral("child"), QStringLiteral("in progress"), QStringLiteral("p")),
    };

    const auto result = engine::buildWorkingSet(tasks, {}, Now, filterFor(data::TaskCategory::MyAction));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("a"), QStringLiteral("p"), QStringLiteral("child") }));
    // Ancestors resolve to the last record carrying the id.
    QCOMPARE(result[1].task.name, QStringLiteral("fresh"));
}

QTEST_GUILESS_MAIN(WorkingSetBuilderTest)
#include "WorkingSetBuilderTest.moc"
