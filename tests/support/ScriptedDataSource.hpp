#pragma once

#include <QAtomicInt>
#include <QMutex>
#include <QMutexLocker>
#include <QSet>

#include "tasksync/source/FutureSupport.hpp"
#include "tasksync/source/TaskDataSource.hpp"

namespace tasksync {
namespace testing {

// Forwards to another store, counting calls and failing chosen operations
// with Unavailable before they reach it.
class ScriptedDataSource : public source::TaskDataSource
{
public:
    enum class Operation
    {
        GetTasks,
        GetTask,
        Save,
        SetCompleted,
        DeleteAllCompleted,
        DeleteAll,
        Delete,
        RefreshTasks,
        RefreshTask,
    };

    explicit ScriptedDataSource(source::TaskDataSource &inner)
        : m_inner(inner)
    {
    }

    int calls() const { return m_calls.loadRelaxed(); }

    void fail(Operation operation)
    {
        QMutexLocker locker(&m_mutex);
        m_failing.insert(static_cast<int>(operation));
    }

    void clearFailures()
    {
        QMutexLocker locker(&m_mutex);
        m_failing.clear();
    }

    QFuture<data::TaskList> getTasks() override
    {
        if (record(Operation::GetTasks)) {
            return failure<data::TaskList>();
        }
        return m_inner.getTasks();
    }

    QFuture<data::Task> getTask(const QString &id) override
    {
        if (record(Operation::GetTask)) {
            return failure<data::Task>();
        }
        return m_inner.getTask(id);
    }

    QFuture<void> saveTask(const data::Task &task) override
    {
        if (record(Operation::Save)) {
            return failure<void>();
        }
        return m_inner.saveTask(task);
    }

    QFuture<void> setCompleted(const data::Task &task, bool completed) override
    {
        if (record(Operation::SetCompleted)) {
            return failure<void>();
        }
        return m_inner.setCompleted(task, completed);
    }

    QFuture<void> setCompleted(const QString &id, bool completed) override
    {
        if (record(Operation::SetCompleted)) {
            return failure<void>();
        }
        return m_inner.setCompleted(id, completed);
    }

    QFuture<void> deleteAllCompleted() override
    {
        if (record(Operation::DeleteAllCompleted)) {
            return failure<void>();
        }
        return m_inner.deleteAllCompleted();
    }

    QFuture<void> deleteAll() override
    {
        if (record(Operation::DeleteAll)) {
            return failure<void>();
        }
        return m_inner.deleteAll();
    }

    QFuture<void> deleteTask(const QString &id) override
    {
        if (record(Operation::Delete)) {
            return failure<void>();
        }
        return m_inner.deleteTask(id);
    }

    QFuture<void> refreshTasks() override
    {
        if (record(Operation::RefreshTasks)) {
            return failure<void>();
        }
        return m_inner.refreshTasks();
    }

    QFuture<void> refreshTask(const QString &id) override
    {
        if (record(Operation::RefreshTask)) {
            return failure<void>();
        }
        return m_inner.refreshTask(id);
    }

private:
    bool record(Operation operation)
    {
        m_calls.fetchAndAddRelaxed(1);
        QMutexLocker locker(&m_mutex);
        return m_failing.contains(static_cast<int>(operation));
    }

    template <typename T>
    static QFuture<T> failure()
    {
        return source::failedFuture<T>(source::StoreError::unavailable(QStringLiteral("scripted failure")));
    }

    source::TaskDataSource &m_inner;
    QAtomicInt m_calls;
    QMutex m_mutex;
    QSet<int> m_failing;
};

} // namespace testing
} // namespace tasksync
