#include "taskdash/ui/viewmodels/TaskBoardViewModel.hpp"

#include "taskdash/core/Logging.hpp"
#include "taskdash/data/OverlayRepository.hpp"
#include "taskdash/data/TaskRepository.hpp"
#include "taskdash/engine/FuzzySearch.hpp"
#include "taskdash/engine/HierarchicalSorter.hpp"
#include "taskdash/engine/WorkingSetBuilder.hpp"
#include "taskdash/ui/models/TaskListModel.hpp"

namespace taskdash {
namespace ui {

namespace {
QString saveFailedMessage()
{
    return QStringLiteral("Failed to save local state");
}

std::optional<data::DisplayTask> entryAt(std::vector<data::DisplayTask> tasks, int index)
{
    if (index < 0 || index >= static_cast<int>(tasks.size())) {
        return std::nullopt;
    }
    return std::move(tasks[static_cast<size_t>(index)]);
}

int lastIndex(size_t count)
{
    return count == 0 ? 0 : static_cast<int>(count) - 1;
}
} // namespace

TaskBoardViewModel::TaskBoardViewModel(data::TaskRepository &taskRepository,
                                       data::OverlayRepository &overlayRepository,
                                       Clock clock,
                                       QObject *parent)
    : QObject(parent)
    , m_taskRepository(taskRepository)
    , m_overlayRepository(overlayRepository)
    , m_clock(std::move(clock))
    , m_model(std::make_unique<TaskListModel>(this))
{
    if (!m_clock) {
        m_clock = []() { return QDateTime::currentDateTimeUtc(); };
    }
}

TaskBoardViewModel::~TaskBoardViewModel() = default;

TaskListModel *TaskBoardViewModel::model() const
{
    return m_model.get();
}

void TaskBoardViewModel::setUserId(std::optional<quint64> userId)
{
    if (m_userId == userId) {
        return;
    }
    m_userId = userId;
    m_selectedIndex = 0;
    publish();
}

std::optional<quint64> TaskBoardViewModel::userId() const
{
    return m_userId;
}

bool TaskBoardViewModel::setTasks(std::vector<data::Task> tasks)
{
    m_tasks = std::move(tasks);
    m_selectedIndex = 0;
    m_searchSelectedIndex = 0;

    bool saved = true;
    if (!m_taskRepository.replaceTasks(m_tasks)) {
        LOG_WARN(tdCore, "Task cache could not be written");
        setStatus(QStringLiteral("Failed to save task cache"));
        saved = false;
    } else if (!m_overlayRepository.setLastRefresh(now())) {
        setStatus(saveFailedMessage());
        saved = false;
    } else {
        setStatus(QStringLiteral("Loaded %1 tasks").arg(static_cast<int>(m_tasks.size())));
    }
    publish();
    return saved;
}

const std::vector<data::Task> &TaskBoardViewModel::tasks() const
{
    return m_tasks;
}

data::TaskCategory TaskBoardViewModel::currentCategory() const
{
    return m_category;
}

int TaskBoardViewModel::selectedIndex() const
{
    return m_selectedIndex;
}

int TaskBoardViewModel::searchSelectedIndex() const
{
    return m_searchSelectedIndex;
}

const QString &TaskBoardViewModel::searchQuery() const
{
    return m_searchQuery;
}

InputMode TaskBoardViewModel::inputMode() const
{
    return m_inputMode;
}

const QString &TaskBoardViewModel::snoozeInput() const
{
    return m_snoozeInput;
}

const QString &TaskBoardViewModel::statusMessage() const
{
    return m_statusMessage;
}

std::vector<data::DisplayTask> TaskBoardViewModel::currentTasks() const
{
    engine::ViewFilter filter;
    filter.category = m_category;
    filter.userId = m_userId;
    filter.text = m_searchQuery;
    return engine::buildWorkingSet(m_tasks, m_overlayRepository.overlays(), now(), filter);
}

std::vector<data::DisplayTask> TaskBoardViewModel::searchResults() const
{
    return engine::searchTasks(m_tasks, m_overlayRepository.overlays(), m_searchQuery);
}

engine::CategoryCounts TaskBoardViewModel::counts() const
{
    return engine::countByCategory(m_tasks, m_overlayRepository.overlays(), now());
}

std::optional<data::DisplayTask> TaskBoardViewModel::selectedTask() const
{
    return entryAt(currentTasks(), m_selectedIndex);
}

std::optional<data::DisplayTask> TaskBoardViewModel::selectedSearchResult() const
{
    return entryAt(searchResults(), m_searchSelectedIndex);
}

void TaskBoardViewModel::refresh()
{
    m_tasks = m_taskRepository.fetchTasks();
    m_selectedIndex = qBound(0, m_selectedIndex, lastIndex(currentTasks().size()));
    publish();
}

void TaskBoardViewModel::switchCategory(data::TaskCategory category)
{
    m_category = category;
    m_selectedIndex = 0;
    publish();
}

void TaskBoardViewModel::nextCategory()
{
    switchCategory(data::nextCategory(m_category));
}

void TaskBoardViewModel::previousCategory()
{
    switchCategory(data::previousCategory(m_category));
}

void TaskBoardViewModel::selectNext()
{
    if (m_selectedIndex < lastIndex(currentTasks().size())) {
        ++m_selectedIndex;
    }
}

void TaskBoardViewModel::selectPrevious()
{
    if (m_selectedIndex > 0) {
        --m_selectedIndex;
    }
}

void TaskBoardViewModel::searchSelectNext()
{
    if (m_searchSelectedIndex < lastIndex(searchResults().size())) {
        ++m_searchSelectedIndex;
    }
}

void TaskBoardViewModel::searchSelectPrevious()
{
    if (m_searchSelectedIndex > 0) {
        --m_searchSelectedIndex;
    }
}

void TaskBoardViewModel::togglePin()
{
    const auto selected = selectedTask();
    if (!selected.has_value()) {
        return;
    }
    const QString &id = selected->task.id;
    if (!m_overlayRepository.togglePin(id)) {
        setStatus(saveFailedMessage());
    } else {
        setStatus(m_overlayRepository.isPinned(id) ? QStringLiteral("Task pinned") : QStringLiteral("Task unpinned"));
    }
    publish();
}

void TaskBoardViewModel::startSnooze()
{
    if (!selectedTask().has_value()) {
        return;
    }
    m_inputMode = InputMode::Snooze;
    m_snoozeInput.clear();
    setStatus(QStringLiteral("Snooze for how many days? (Enter number)"));
}

void TaskBoardViewModel::confirmSnooze()
{
    bool ok = false;
    const qint64 days = m_snoozeInput.toLongLong(&ok);
    const QDateTime until = ok ? now().addDays(days) : QDateTime();
    if (!until.isValid()) {
        setStatus(QStringLiteral("Invalid number"));
    } else if (const auto selected = selectedTask()) {
        if (!m_overlayRepository.snooze(selected->task.id, until)) {
            setStatus(saveFailedMessage());
        } else {
            setStatus(QStringLiteral("Task snoozed for %1 days").arg(days));
        }
    }
    m_inputMode = InputMode::Normal;
    m_snoozeInput.clear();
    publish();
}

void TaskBoardViewModel::unsnooze()
{
    const auto selected = selectedTask();
    if (!selected.has_value()) {
        return;
    }
    if (!m_overlayRepository.unsnooze(selected->task.id)) {
        setStatus(saveFailedMessage());
    } else {
        setStatus(QStringLiteral("Task unsnoozed"));
    }
    publish();
}

void TaskBoardViewModel::startSearch()
{
    m_inputMode = InputMode::Search;
    m_searchQuery.clear();
    m_searchSelectedIndex = 0;
    publish();
}

void TaskBoardViewModel::setSearchQuery(const QString &query)
{
    if (m_searchQuery == query) {
        return;
    }
    m_searchQuery = query;
    m_selectedIndex = 0;
    m_searchSelectedIndex = 0;
    publish();
}

void TaskBoardViewModel::cancelInput()
{
    m_inputMode = InputMode::Normal;
    m_searchQuery.clear();
    m_snoozeInput.clear();
    publish();
}

void TaskBoardViewModel::handleChar(QChar c)
{
    switch (m_inputMode) {
    case InputMode::Search:
        m_searchQuery.append(c);
        m_searchSelectedIndex = 0;
        publish();
        break;
    case InputMode::Snooze:
        if (c >= QLatin1Char('0') && c <= QLatin1Char('9')) {
            m_snoozeInput.append(c);
        }
        break;
    case InputMode::Normal:
        break;
    }
}

void TaskBoardViewModel::handleBackspace()
{
    switch (m_inputMode) {
    case InputMode::Search:
        m_searchQuery.chop(1);
        m_searchSelectedIndex = 0;
        publish();
        break;
    case InputMode::Snooze:
        m_snoozeInput.chop(1);
        break;
    case InputMode::Normal:
        break;
    }
}

void TaskBoardViewModel::clearStatus()
{
    setStatus(QString());
}

QDateTime TaskBoardViewModel::now() const
{
    return m_clock();
}

void TaskBoardViewModel::setStatus(const QString &message)
{
    if (m_statusMessage == message) {
        return;
    }
    m_statusMessage = message;
    emit statusMessageChanged(m_statusMessage);
}

void TaskBoardViewModel::publish()
{
    // While searching the list shows the global ranking instead of the board.
    if (m_inputMode == InputMode::Search && !m_searchQuery.isEmpty()) {
        m_model->setTasks(searchResults());
        emit tasksChanged();
        return;
    }

    auto board = currentTasks();
    QHash<QString, int> depths;
    const auto positions = engine::hierarchyPositions(board);
    for (auto it = positions.constBegin(); it != positions.constEnd(); ++it) {
        depths.insert(it.key(), it->depth);
    }
    m_model->setTasks(std::move(board), std::move(depths));
    emit tasksChanged();
}

} // namespace ui
} // namespace taskdash
