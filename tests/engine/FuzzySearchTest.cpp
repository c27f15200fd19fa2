#include <QtTest/QtTest>

#include "taskdash/engine/FuzzySearch.hpp"

using namespace taskdash;

namespace {
data::Task makeTask(const QString &id, const QString &name)
{
    data::Task task;
    task.id = id;
    task.name = name;
    task.status = QStringLiteral("open");
    task.listName = QStringLiteral("Inbox");
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
} // namespace

class FuzzySearchTest : public QObject
{
    Q_OBJECT

private slots:
    void matchesSubsequence();
    void rejectsOutOfOrderCharacters();
    void rewardsWordBoundaries();
    void rewardsConsecutiveMatches();
    void countsSurrogatePairsOnce();
    void emptyQueryReturnsNothing();
    void queryIsCaseInsensitive();
    void firstMatchingFieldDecidesScore();
    void searchesDescriptionAndTags();
    void ranksByScoreAndKeepsInputOrderOnTies();
};

void FuzzySearchTest::matchesSubsequence()
{
    const auto score = engine::fuzzyScore(QStringLiteral("Task Create"), QStringLiteral("tc"));
    QVERIFY(score.has_value());
    // 't' at the start and 'c' after a space both earn the boundary bonus.
    QCOMPARE(score.value(), 22);
}

void FuzzySearchTest::rejectsOutOfOrderCharacters()
{
    QVERIFY(!engine::fuzzyScore(QStringLiteral("Card"), QStringLiteral("tc")).has_value());
    QVERIFY(!engine::fuzzyScore(QString(), QStringLiteral("a")).has_value());
}

void FuzzySearchTest::rewardsWordBoundaries()
{
    const auto boundary = engine::fuzzyScore(QStringLiteral("Task Create"), QStringLiteral("tc"));
    const auto inner = engine::fuzzyScore(QStringLiteral("xtycx"), QStringLiteral("tc"));
    QVERIFY(boundary.has_value());
    QVERIFY(inner.has_value());
    QCOMPARE(inner.value(), 2);
    QVERIFY(boundary.value() > inner.value());

    // Punctuation counts as a word separator.
    QCOMPARE(engine::fuzzyScore(QStringLiteral("fix-bug"), QStringLiteral("b")).value(), 11);
}

void FuzzySearchTest::rewardsConsecutiveMatches()
{
    // "abc" at the start: 10 + 1, then two adjacent matches with 1 + 5 each.
    QCOMPARE(engine::fuzzyScore(QStringLiteral("abcd"), QStringLiteral("abc")).value(), 23);
    QCOMPARE(engine::fuzzyScore(QStringLiteral("axbxc"), QStringLiteral("abc")).value(), 13);
}

void FuzzySearchTest::countsSurrogatePairsOnce()
{
    const uint grinning[] = { 0x1F600 };
    const QString emoji = QString::fromUcs4(grinning, 1);
    QCOMPARE(emoji.size(), 2);

    // One code point at the start: 10 + 1, no consecutive bonus.
    QCOMPARE(engine::fuzzyScore(emoji, emoji).value(), 11);
    // The emoji is not alphanumeric, so the following letter starts a word.
    QCOMPARE(engine::fuzzyScore(emoji + QStringLiteral("go"), QStringLiteral("g")).value(), 11);
}

void FuzzySearchTest::emptyQueryReturnsNothing()
{
    const std::vector<data::Task> tasks = { makeTask(QStringLiteral("1"), QStringLiteral("Anything")),
                                            makeTask(QStringLiteral("2"), QStringLiteral("Else")) };
    QVERIFY(engine::searchTasks(tasks, {}, QString()).empty());
    QVERIFY(engine::rankTasks(tasks, {}, QString()).empty());
}

void FuzzySearchTest::queryIsCaseInsensitive()
{
    const std::vector<data::Task> tasks = { makeTask(QStringLiteral("1"), QStringLiteral("deploy release")) };
    QCOMPARE(idsOf(engine::searchTasks(tasks, {}, QStringLiteral("DR"))), QStringList({ QStringLiteral("1") }));
}

void FuzzySearchTest::firstMatchingFieldDecidesScore()
{
    // The name matches weakly; the list name would match better but is never tried.
    auto task = makeTask(QStringLiteral("1"), QStringLiteral("xaxb"));
    task.listName = QStringLiteral("ab");
    const auto hits = engine::rankTasks({ task }, {}, QStringLiteral("ab"));
    QCOMPARE(hits.size(), static_cast<size_t>(1));
    QCOMPARE(hits.front().score, 2);

    task.name = QStringLiteral("zzz");
    const auto fromList = engine::rankTasks({ task }, {}, QStringLiteral("ab"));
    QCOMPARE(fromList.front().score, 17);
}

void FuzzySearchTest::searchesDescriptionAndTags()
{
    auto described = makeTask(QStringLiteral("d"), QStringLiteral("zzz"));
    described.description = QStringLiteral("quarterly report");
    auto tagged = makeTask(QStringLiteral("t"), QStringLiteral("zzz"));
    tagged.tags = QStringList({ QStringLiteral("infra"), QStringLiteral("quota") });
    const auto none = makeTask(QStringLiteral("n"), QStringLiteral("zzz"));

    const auto result = engine::searchTasks({ none, described, tagged }, {}, QStringLiteral("quo"));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("t"), QStringLiteral("d") }));
}

void FuzzySearchTest::ranksByScoreAndKeepsInputOrderOnTies()
{
    const std::vector<data::Task> tasks = {
        makeTask(QStringLiteral("weak-1"), QStringLiteral("xtycx")),
        makeTask(QStringLiteral("strong"), QStringLiteral("Task Create")),
        makeTask(QStringLiteral("weak-2"), QStringLiteral("atbc")),
        makeTask(QStringLiteral("miss"), QStringLiteral("Card")),
    };
    data::OverlayMap overlays;
    overlays[QStringLiteral("strong")].pinned = true;

    const auto result = engine::searchTasks(tasks, overlays, QStringLiteral("tc"));
    QCOMPARE(idsOf(result), QStringList({ QStringLiteral("strong"), QStringLiteral("weak-1"),
                                          QStringLiteral("weak-2") }));
    QVERIFY(result.front().overlay.pinned);
}

QTEST_GUILESS_MAIN(FuzzySearchTest)
#include "FuzzySearchTest.moc"
