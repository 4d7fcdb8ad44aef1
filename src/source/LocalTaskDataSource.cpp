#include "tasksync/source/LocalTaskDataSource.hpp"

#include <QMutexLocker>
#include <QtConcurrent/QtConcurrentRun>

#include "tasksync/core/Logging.hpp"
#include "tasksync/data/TaskRepository.hpp"
#include "tasksync/source/FutureSupport.hpp"

namespace tasksync {
namespace source {

LocalTaskDataSource::LocalTaskDataSource(data::TaskRepository &repository, QObject *parent)
    : QObject(parent)
    , m_repository(repository)
{
    m_pool.setMaxThreadCount(1);
}

LocalTaskDataSource::~LocalTaskDataSource()
{
    m_pool.waitForDone();
}

QFuture<data::TaskList> LocalTaskDataSource::getTasks()
{
    return QtConcurrent::run(&m_pool, [this]() {
        QMutexLocker locker(&m_mutex);
        return m_repository.fetchTasks();
    });
}

QFuture<data::Task> LocalTaskDataSource::getTask(const QString &id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        QMutexLocker locker(&m_mutex);
        const auto task = m_repository.findById(id);
        if (!task) {
            throw StoreError::notFound(id);
        }
        return *task;
    });
}

QFuture<void> LocalTaskDataSource::saveTask(const data::Task &task)
{
    if (task.id.isEmpty()) {
        return failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot save a task without id")));
    }
    return QtConcurrent::run(&m_pool, [this, task]() {
        {
            QMutexLocker locker(&m_mutex);
            if (!m_repository.upsertTask(task)) {
                throw StoreError::unavailable(QStringLiteral("local store rejected task %1").arg(task.id));
            }
        }
        emit tasksChanged();
    });
}

QFuture<void> LocalTaskDataSource::setCompleted(const data::Task &task, bool completed)
{
    return setCompleted(task.id, completed);
}

QFuture<void> LocalTaskDataSource::setCompleted(const QString &id, bool completed)
{
    if (id.isEmpty()) {
        return failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot update a task without id")));
    }
    return QtConcurrent::run(&m_pool, [this, id, completed]() {
        {
            QMutexLocker locker(&m_mutex);
            auto task = m_repository.findById(id);
            if (!task) {
                throw StoreError::notFound(id);
            }
            if (task->completed == completed) {
                return;
            }
            task->completed = completed;
            if (!m_repository.upsertTask(*task)) {
                throw StoreError::unavailable(QStringLiteral("local store rejected task %1").arg(id));
            }
        }
        emit tasksChanged();
    });
}

QFuture<void> LocalTaskDataSource::deleteAllCompleted()
{
    return QtConcurrent::run(&m_pool, [this]() {
        {
            QMutexLocker locker(&m_mutex);
            if (!m_repository.removeCompletedTasks()) {
                throw StoreError::unavailable(QStringLiteral("local store could not remove completed tasks"));
            }
        }
        emit tasksChanged();
    });
}

QFuture<void> LocalTaskDataSource::deleteAll()
{
    return QtConcurrent::run(&m_pool, [this]() {
        {
            QMutexLocker locker(&m_mutex);
            if (!m_repository.removeAllTasks()) {
                throw StoreError::unavailable(QStringLiteral("local store could not be cleared"));
            }
        }
        emit tasksChanged();
    });
}

QFuture<void> LocalTaskDataSource::deleteTask(const QString &id)
{
    if (id.isEmpty()) {
        return failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot delete a task without id")));
    }
    return QtConcurrent::run(&m_pool, [this, id]() {
        {
            QMutexLocker locker(&m_mutex);
            if (!m_repository.findById(id)) {
                qCDebug(core::lcLocal) << "Delete of unknown task" << id;
                return;
            }
            if (!m_repository.removeTask(id)) {
                throw StoreError::unavailable(QStringLiteral("local store could not remove task %1").arg(id));
            }
        }
        emit tasksChanged();
    });
}

QFuture<void> LocalTaskDataSource::refreshTasks()
{
    // The cache is the source of truth for reads; nothing to pull.
    auto pending = makePending<void>();
    resolve(pending);
    return pending.future();
}

QFuture<void> LocalTaskDataSource::refreshTask(const QString &id)
{
    Q_UNUSED(id)
    return refreshTasks();
}

} // namespace source
} // namespace tasksync
