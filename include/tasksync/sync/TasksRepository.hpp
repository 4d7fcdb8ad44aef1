#pragma once

#include <QFuture>
#include <QString>

#include "tasksync/data/Task.hpp"
#include "tasksync/sync/WriteOutcome.hpp"

namespace tasksync {
namespace sync {

// Single entry point for task data used by front ends.
class TasksRepository
{
public:
    virtual ~TasksRepository() = default;

    // Reads always come from the local cache. A forced read resyncs first;
    // a failed resync is logged and the cached content is served.
    virtual QFuture<data::TaskList> getTasks(bool forceUpdate) = 0;
    virtual QFuture<data::Task> getTask(const QString &id, bool forceUpdate) = 0;

    // Explicit resyncs; the futures fail with the StoreError that stopped them.
    virtual QFuture<void> refreshTasks() = 0;
    virtual QFuture<void> refreshTask(const QString &id) = 0;

    virtual QFuture<WriteOutcome> saveTask(const data::Task &task) = 0;
    virtual QFuture<WriteOutcome> setCompleted(const data::Task &task, bool completed) = 0;
    virtual QFuture<WriteOutcome> setCompleted(const QString &id, bool completed) = 0;
    virtual QFuture<WriteOutcome> clearCompletedTasks() = 0;
    virtual QFuture<WriteOutcome> deleteAllTasks() = 0;
    virtual QFuture<WriteOutcome> deleteTask(const QString &id) = 0;

    QFuture<WriteOutcome> completeTask(const data::Task &task) { return setCompleted(task, true); }
    QFuture<WriteOutcome> completeTask(const QString &id) { return setCompleted(id, true); }
    QFuture<WriteOutcome> activateTask(const data::Task &task) { return setCompleted(task, false); }
    QFuture<WriteOutcome> activateTask(const QString &id) { return setCompleted(id, false); }
};

} // namespace sync
} // namespace tasksync
