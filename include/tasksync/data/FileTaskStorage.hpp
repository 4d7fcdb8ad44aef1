#pragma once

#include <QHash>
#include <QString>

#include "tasksync/data/Task.hpp"

namespace tasksync {
namespace data {

// iCalendar (VTODO) file holding the local task cache. Every mutation
// rewrites the file atomically; the in-memory copy only changes when the
// write committed.
class FileTaskStorage
{
public:
    explicit FileTaskStorage(QString filePath);
    ~FileTaskStorage() = default;

    const QHash<QString, Task> &tasks() const;

    bool addOrUpdateTask(const Task &task);
    bool removeTask(const QString &id);
    bool removeCompletedTasks();
    bool removeAllTasks();

private:
    void load();
    bool commit(const QHash<QString, Task> &tasks);
    bool save(const QHash<QString, Task> &tasks) const;

    static QString encodeText(const QString &text);
    static QString decodeText(const QString &text);
    static QString statusToString(bool completed);
    static bool completedFromString(const QString &value);

    QString m_filePath;
    QHash<QString, Task> m_tasks;
};

} // namespace data
} // namespace tasksync
