#pragma once

#include <QMutex>
#include <QObject>
#include <QThreadPool>

#include "tasksync/source/TaskDataSource.hpp"

namespace tasksync {
namespace data {
class TaskRepository;
}

namespace source {

// Local cache store. Engine calls run on a worker pool and are serialised
// by a mutex; no ordering between queued calls is guaranteed.
class LocalTaskDataSource : public QObject, public TaskDataSource
{
    Q_OBJECT
public:
    explicit LocalTaskDataSource(data::TaskRepository &repository, QObject *parent = nullptr);
    ~LocalTaskDataSource() override;

    QFuture<data::TaskList> getTasks() override;
    QFuture<data::Task> getTask(const QString &id) override;

    QFuture<void> saveTask(const data::Task &task) override;
    QFuture<void> setCompleted(const data::Task &task, bool completed) override;
    QFuture<void> setCompleted(const QString &id, bool completed) override;
    QFuture<void> deleteAllCompleted() override;
    QFuture<void> deleteAll() override;
    QFuture<void> deleteTask(const QString &id) override;

    QFuture<void> refreshTasks() override;
    QFuture<void> refreshTask(const QString &id) override;

signals:
    void tasksChanged();

private:
    data::TaskRepository &m_repository;
    mutable QMutex m_mutex;
    QThreadPool m_pool;
};

} // namespace source
} // namespace tasksync
