#include <QCommandLineParser>
#include <QCoreApplication>
#include <QString>
#include <QTextStream>

#include "taskdash/core/AppConfig.hpp"
#include "taskdash/core/AppContext.hpp"
#include "taskdash/core/Logging.hpp"
#include "taskdash/data/ClickUpImport.hpp"
#include "taskdash/data/OverlayRepository.hpp"
#include "taskdash/data/TaskRepository.hpp"
#include "taskdash/engine/HierarchicalSorter.hpp"
#include "taskdash/ui/viewmodels/TaskBoardViewModel.hpp"

using namespace taskdash;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString &message)
{
    err() << message << Qt::endl;
    return 1;
}

QString formatLine(const data::DisplayTask &entry, int depth)
{
    QString line = QString(depth * 2, QLatin1Char(' '));
    line += entry.overlay.pinned ? QStringLiteral("* ") : QStringLiteral("  ");
    if (const auto label = data::priorityLabel(entry.task)) {
        line += QStringLiteral("[%1] ").arg(label.value());
    }
    if (!entry.task.customId.isEmpty()) {
        line += entry.task.customId + QLatin1Char(' ');
    }
    line += entry.task.name;
    line += QStringLiteral("  (%1, %2)").arg(entry.task.status, entry.task.id);
    return line;
}

int runList(ui::TaskBoardViewModel &board, const QCommandLineParser &parser)
{
    if (parser.isSet(QStringLiteral("category"))) {
        const QString keyword = parser.value(QStringLiteral("category"));
        const auto category = data::categoryFromKeyword(keyword);
        if (!category.has_value()) {
            return fail(QStringLiteral("Unknown category: %1").arg(keyword));
        }
        board.switchCategory(category.value());
    }
    board.setSearchQuery(parser.value(QStringLiteral("filter")));

    const auto tasks = board.currentTasks();
    const auto positions = engine::hierarchyPositions(tasks);
    out() << data::categoryLabel(board.currentCategory()) << QStringLiteral(" (%1)").arg(static_cast<int>(tasks.size())) << Qt::endl;
    for (const auto &entry : tasks) {
        out() << formatLine(entry, positions.value(entry.task.id).depth) << Qt::endl;
    }
    return 0;
}

int runSearch(ui::TaskBoardViewModel &board, const QStringList &args)
{
    const QString query = args.mid(1).join(QLatin1Char(' '));
    if (query.isEmpty()) {
        return fail(QStringLiteral("search needs a query"));
    }
    board.setSearchQuery(query);
    for (const auto &entry : board.searchResults()) {
        out() << formatLine(entry, 0) << Qt::endl;
    }
    return 0;
}

int runCounts(const ui::TaskBoardViewModel &board)
{
    const auto counts = board.counts();
    for (const auto category : data::allCategories()) {
        out() << data::categoryLabel(category) << QStringLiteral(": ") << counts.value(category, 0) << Qt::endl;
    }
    return 0;
}

int runOverlayEdit(core::AppContext &context, const QString &command, const QStringList &args)
{
    if (args.size() < 2) {
        return fail(QStringLiteral("%1 needs a task id").arg(command));
    }
    const QString taskId = args.at(1);
    if (!context.taskRepository().findById(taskId).has_value()) {
        return fail(QStringLiteral("Unknown task: %1").arg(taskId));
    }

    auto &overlays = context.overlayRepository();
    if (command == QLatin1String("pin")) {
        if (!overlays.togglePin(taskId)) {
            return fail(QStringLiteral("Failed to save local state"));
        }
        out() << (overlays.isPinned(taskId) ? QStringLiteral("Task pinned") : QStringLiteral("Task unpinned"))
              << Qt::endl;
        return 0;
    }
    if (command == QLatin1String("unsnooze")) {
        if (!overlays.unsnooze(taskId)) {
            return fail(QStringLiteral("Failed to save local state"));
        }
        out() << QStringLiteral("Task unsnoozed") << Qt::endl;
        return 0;
    }

    bool ok = false;
    const qint64 days = args.value(2).toLongLong(&ok);
    const QDateTime until = ok && days >= 0 ? QDateTime::currentDateTimeUtc().addDays(days) : QDateTime();
    if (!until.isValid()) {
        return fail(QStringLiteral("Invalid number"));
    }
    if (!overlays.snooze(taskId, until)) {
        return fail(QStringLiteral("Failed to save local state"));
    }
    out() << QStringLiteral("Task snoozed for %1 days").arg(days) << Qt::endl;
    return 0;
}

int runImport(ui::TaskBoardViewModel &board, const QStringList &args)
{
    if (args.size() < 2) {
        return fail(QStringLiteral("import needs a file"));
    }
    QString error;
    auto tasks = data::readClickUpExport(args.at(1), &error);
    if (!tasks.has_value()) {
        return fail(error);
    }
    const bool saved = board.setTasks(std::move(tasks.value()));
    if (!saved) {
        return fail(board.statusMessage());
    }
    out() << board.statusMessage() << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("taskdash"));
    QCoreApplication::setApplicationVersion(QStringLiteral(TASKDASH_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Personal task dashboard"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOptions({
        { QStringLiteral("config"), QStringLiteral("Config file to use."), QStringLiteral("path") },
        { QStringLiteral("data-dir"), QStringLiteral("Directory holding the task cache and local state."),
          QStringLiteral("path") },
        { { QStringLiteral("c"), QStringLiteral("category") },
          QStringLiteral("Category to list (my-action, waiting, backlog, done, snoozed, person)."),
          QStringLiteral("name") },
        { { QStringLiteral("f"), QStringLiteral("filter") }, QStringLiteral("Only list tasks containing text."),
          QStringLiteral("text") },
        { QStringLiteral("all-users"), QStringLiteral("Do not restrict the board to the configured user.") },
    });
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("list | search <query> | counts | pin <id> | snooze <id> <days> | "
                                                "unsnooze <id> | import <file>"));
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    QString error;
    const QString configPath =
        parser.isSet(QStringLiteral("config")) ? parser.value(QStringLiteral("config")) : core::defaultConfigPath();
    auto config = core::loadConfig(configPath, &error);
    if (!config.has_value()) {
        return fail(QStringLiteral("Configuration error: %1").arg(error));
    }
    if (parser.isSet(QStringLiteral("data-dir"))) {
        config->dataDirectory = parser.value(QStringLiteral("data-dir"));
    }
    LOG_DEBUG(tdCli, "Using data directory %s", qUtf8Printable(config->dataDirectory));

    core::AppContext context(config.value());
    ui::TaskBoardViewModel board(context.taskRepository(), context.overlayRepository());
    board.refresh();
    if (!parser.isSet(QStringLiteral("all-users"))) {
        board.setUserId(context.config().numericUserId());
    }

    const QString command = args.first();
    if (command == QLatin1String("list")) {
        return runList(board, parser);
    }
    if (command == QLatin1String("search")) {
        return runSearch(board, args);
    }
    if (command == QLatin1String("counts")) {
        return runCounts(board);
    }
    if (command == QLatin1String("pin") || command == QLatin1String("snooze") || command == QLatin1String("unsnooze")) {
        return runOverlayEdit(context, command, args);
    }
    if (command == QLatin1String("import")) {
        return runImport(board, args);
    }
    return fail(QStringLiteral("Unknown command: %1").arg(command));
}
