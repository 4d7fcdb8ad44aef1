#pragma once

#include <QFuture>
#include <QString>

#include "tasksync/data/Task.hpp"

namespace tasksync {
namespace source {

// Capability contract shared by the remote and the local store. Read
// futures are cold one-shot streams: every call performs a fresh fetch and
// yields a single snapshot. Failures are carried as StoreError.
class TaskDataSource
{
public:
    virtual ~TaskDataSource() = default;

    virtual QFuture<data::TaskList> getTasks() = 0;
    // Fails with NotFound when no task has this id.
    virtual QFuture<data::Task> getTask(const QString &id) = 0;

    virtual QFuture<void> saveTask(const data::Task &task) = 0;
    virtual QFuture<void> setCompleted(const data::Task &task, bool completed) = 0;
    virtual QFuture<void> setCompleted(const QString &id, bool completed) = 0;
    virtual QFuture<void> deleteAllCompleted() = 0;
    virtual QFuture<void> deleteAll() = 0;
    virtual QFuture<void> deleteTask(const QString &id) = 0;

    virtual QFuture<void> refreshTasks() = 0;
    virtual QFuture<void> refreshTask(const QString &id) = 0;
};

} // namespace source
} // namespace tasksync
