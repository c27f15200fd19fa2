#pragma once

#include <QDateTime>
#include <QObject>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "taskdash/data/Task.hpp"
#include "taskdash/data/TaskCategory.hpp"
#include "taskdash/engine/GroupCounter.hpp"

namespace taskdash {
namespace data {
class TaskRepository;
class OverlayRepository;
}

namespace ui {

class TaskListModel;

enum class InputMode
{
    Normal,
    Search,
    Snooze,
};

class TaskBoardViewModel : public QObject
{
    Q_OBJECT

public:
    using Clock = std::function<QDateTime()>;

    TaskBoardViewModel(data::TaskRepository &taskRepository,
                       data::OverlayRepository &overlayRepository,
                       Clock clock = Clock(),
                       QObject *parent = nullptr);
    ~TaskBoardViewModel() override;

    TaskListModel *model() const;

    void setUserId(std::optional<quint64> userId);
    std::optional<quint64> userId() const;

    // Replaces the cached tasks with a fresh import and stamps the refresh time.
    // Returns false when the cache or the stamp could not be written.
    bool setTasks(std::vector<data::Task> tasks);
    const std::vector<data::Task> &tasks() const;

    data::TaskCategory currentCategory() const;
    int selectedIndex() const;
    int searchSelectedIndex() const;
    const QString &searchQuery() const;
    InputMode inputMode() const;
    const QString &snoozeInput() const;
    const QString &statusMessage() const;

    std::vector<data::DisplayTask> currentTasks() const;
    std::vector<data::DisplayTask> searchResults() const;
    engine::CategoryCounts counts() const;
    std::optional<data::DisplayTask> selectedTask() const;
    std::optional<data::DisplayTask> selectedSearchResult() const;

public slots:
    void refresh();

    void switchCategory(data::TaskCategory category);
    void nextCategory();
    void previousCategory();
    void selectNext();
    void selectPrevious();
    void searchSelectNext();
    void searchSelectPrevious();

    void togglePin();
    void startSnooze();
    void confirmSnooze();
    void unsnooze();

    void startSearch();
    void setSearchQuery(const QString &query);
    void cancelInput();
    void handleChar(QChar c);
    void handleBackspace();
    void clearStatus();

signals:
    void tasksChanged();
    void statusMessageChanged(const QString &message);

private:
    QDateTime now() const;
    void setStatus(const QString &message);
    void publish();

    data::TaskRepository &m_taskRepository;
    data::OverlayRepository &m_overlayRepository;
    Clock m_clock;
    std::unique_ptr<TaskListModel> m_model;

    std::vector<data::Task> m_tasks;
    std::optional<quint64> m_userId;
    data::TaskCategory m_category = data::TaskCategory::MyAction;
    int m_selectedIndex = 0;
    int m_searchSelectedIndex = 0;
    QString m_searchQuery;
    InputMode m_inputMode = InputMode::Normal;
    QString m_snoozeInput;
    QString m_statusMessage;
};

} // namespace ui
} // namespace taskdash
