#include "taskdash/data/FileDashboardStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonParseError>
#include <QSaveFile>

#include "taskdash/core/Logging.hpp"
#include "taskdash/data/TaskJson.hpp"

namespace taskdash {
namespace data {

namespace {
constexpr auto TASKS_FILE_NAME = "tasks_cache.json";
constexpr auto STATE_FILE_NAME = "local_state.json";
} // namespace

FileDashboardStorage::FileDashboardStorage(QString directory)
    : m_directory(std::move(directory))
{
    load();
}

const std::vector<Task> &FileDashboardStorage::tasks() const
{
    return m_tasks;
}

bool FileDashboardStorage::replaceTasks(std::vector<Task> tasks)
{
    m_tasks = std::move(tasks);
    return saveTasks();
}

const LocalState &FileDashboardStorage::localState() const
{
    return m_state;
}

bool FileDashboardStorage::updateLocalState(const std::function<void(LocalState &)> &mutate)
{
    if (!mutate) {
        return false;
    }
    mutate(m_state);
    return saveLocalState();
}

QString FileDashboardStorage::tasksFilePath() const
{
    return QDir(m_directory).filePath(QString::fromLatin1(TASKS_FILE_NAME));
}

QString FileDashboardStorage::stateFilePath() const
{
    return QDir(m_directory).filePath(QString::fromLatin1(STATE_FILE_NAME));
}

void FileDashboardStorage::load()
{
    m_tasks.clear();
    m_state = LocalState{};

    QJsonDocument document;
    if (readDocument(tasksFilePath(), document)) {
        if (document.isArray()) {
            m_tasks = tasksFromJson(document.array());
        } else {
            LOG_WARN(tdData, "Task cache is not a JSON array: %s", qUtf8Printable(tasksFilePath()));
        }
    }

    document = QJsonDocument();
    if (readDocument(stateFilePath(), document)) {
        if (document.isObject()) {
            m_state = localStateFromJson(document.object());
        } else {
            LOG_WARN(tdData, "Local state is not a JSON object: %s", qUtf8Printable(stateFilePath()));
        }
    }

    LOG_DEBUG(tdData, "Loaded %d cached tasks and %d overlays from %s", static_cast<int>(m_tasks.size()),
              m_state.overlays.size(), qUtf8Printable(m_directory));
}

bool FileDashboardStorage::saveTasks() const
{
    return writeDocument(tasksFilePath(), QJsonDocument(tasksToJson(m_tasks)));
}

bool FileDashboardStorage::saveLocalState() const
{
    return writeDocument(stateFilePath(), QJsonDocument(localStateToJson(m_state)));
}

bool FileDashboardStorage::readDocument(const QString &filePath, QJsonDocument &document)
{
    QFile file(filePath);
    if (!file.exists()) {
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(tdData, "Failed to open %s: %s", qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        LOG_WARN(tdData, "Failed to parse %s: %s", qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return false;
    }
    return true;
}

bool FileDashboardStorage::writeDocument(const QString &filePath, const QJsonDocument &document)
{
    const QString directory = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(directory)) {
        LOG_ERROR(tdData, "Failed to create data directory: %s", qUtf8Printable(directory));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(tdData, "Failed to open %s for writing: %s", qUtf8Printable(filePath),
                  qUtf8Printable(file.errorString()));
        return false;
    }
    if (file.write(document.toJson(QJsonDocument::Indented)) < 0) {
        LOG_ERROR(tdData, "Failed to write %s: %s", qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        file.cancelWriting();
        return false;
    }
    if (!file.commit()) {
        LOG_ERROR(tdData, "Failed to commit %s: %s", qUtf8Printable(filePath), qUtf8Printable(file.errorString()));
        return false;
    }
    return true;
}

} // namespace data
} // namespace taskdash
