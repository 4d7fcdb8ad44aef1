#pragma once

#include <QAtomicInt>
#include <QObject>
#include <QThreadPool>

#include "tasksync/sync/SyncState.hpp"
#include "tasksync/sync/TasksRepository.hpp"

namespace tasksync {
namespace source {
class TaskDataSource;
}

namespace sync {

// Reconciles one remote and one local store. Writes are started on both
// stores at once and joined into a WriteOutcome; neither side is rolled
// back when the other fails. A full resync empties the local store and
// re-inserts the remote snapshot one task at a time, so a failure part way
// leaves the cache torn until the next successful resync. Overlapping
// resyncs are not serialised.
class DefaultTasksRepository : public QObject, public TasksRepository
{
    Q_OBJECT
public:
    DefaultTasksRepository(source::TaskDataSource &remote, source::TaskDataSource &local,
                           int maxThreads = 4, QObject *parent = nullptr);
    ~DefaultTasksRepository() override;

    QFuture<data::TaskList> getTasks(bool forceUpdate) override;
    QFuture<data::Task> getTask(const QString &id, bool forceUpdate) override;

    QFuture<void> refreshTasks() override;
    QFuture<void> refreshTask(const QString &id) override;

    QFuture<WriteOutcome> saveTask(const data::Task &task) override;
    QFuture<WriteOutcome> setCompleted(const data::Task &task, bool completed) override;
    QFuture<WriteOutcome> setCompleted(const QString &id, bool completed) override;
    QFuture<WriteOutcome> clearCompletedTasks() override;
    QFuture<WriteOutcome> deleteAllTasks() override;
    QFuture<WriteOutcome> deleteTask(const QString &id) override;

    SyncState syncState() const;

signals:
    void syncStateChanged(tasksync::sync::SyncState state);

private:
    void updateTasksFromRemote();
    void updateTaskFromRemote(const QString &id);
    QFuture<WriteOutcome> joinWrites(const char *operation, QFuture<void> remote, QFuture<void> local);
    void setSyncState(SyncState state);

    source::TaskDataSource &m_remote;
    source::TaskDataSource &m_local;
    QAtomicInt m_syncState;
    QThreadPool m_pool;
};

} // namespace sync
} // namespace tasksync
