#include "tasksync/sync/DefaultTasksRepository.hpp"

#include <QtConcurrent/QtConcurrentRun>

#include "tasksync/core/Logging.hpp"
#include "tasksync/source/FutureSupport.hpp"
#include "tasksync/source/TaskDataSource.hpp"

namespace tasksync {
namespace sync {

using source::StoreError;

namespace {

std::optional<StoreError> settle(QFuture<void> future)
{
    try {
        source::waitFor(future);
    } catch (const StoreError &error) {
        return error;
    } catch (const QException &error) {
        return StoreError::unavailable(QString::fromUtf8(error.what()));
    }
    return std::nullopt;
}

WriteOutcome settleWrites(const char *operation, QFuture<void> remote, QFuture<void> local)
{
    WriteOutcome outcome(settle(remote), settle(local));
    if (!outcome.succeeded()) {
        qCWarning(core::lcSync).noquote() << operation << "->" << outcome.describe();
    }
    return outcome;
}

} // namespace

DefaultTasksRepository::DefaultTasksRepository(source::TaskDataSource &remote,
                                               source::TaskDataSource &local,
                                               int maxThreads, QObject *parent)
    : QObject(parent)
    , m_remote(remote)
    , m_local(local)
    , m_syncState(static_cast<int>(SyncState::Idle))
{
    qRegisterMetaType<tasksync::sync::SyncState>();
    m_pool.setMaxThreadCount(qMax(1, maxThreads));
}

DefaultTasksRepository::~DefaultTasksRepository()
{
    m_pool.waitForDone();
}

QFuture<data::TaskList> DefaultTasksRepository::getTasks(bool forceUpdate)
{
    return QtConcurrent::run(&m_pool, [this, forceUpdate]() {
        if (forceUpdate) {
            try {
                updateTasksFromRemote();
            } catch (const StoreError &error) {
                qCWarning(core::lcSync) << "Forced refresh failed, serving cached tasks:" << error;
            } catch (const QException &error) {
                qCWarning(core::lcSync) << "Forced refresh failed, serving cached tasks:" << error.what();
            }
        }
        return source::waitFor(m_local.getTasks());
    });
}

QFuture<data::Task> DefaultTasksRepository::getTask(const QString &id, bool forceUpdate)
{
    return QtConcurrent::run(&m_pool, [this, id, forceUpdate]() {
        if (forceUpdate) {
            try {
                updateTaskFromRemote(id);
            } catch (const StoreError &error) {
                qCWarning(core::lcSync) << "Forced refresh of" << id << "failed, serving cached task:" << error;
            } catch (const QException &error) {
                qCWarning(core::lcSync) << "Forced refresh of" << id << "failed, serving cached task:" << error.what();
            }
        }
        return source::waitFor(m_local.getTask(id));
    });
}

QFuture<void> DefaultTasksRepository::refreshTasks()
{
    return QtConcurrent::run(&m_pool, [this]() {
        updateTasksFromRemote();
    });
}

QFuture<void> DefaultTasksRepository::refreshTask(const QString &id)
{
    return QtConcurrent::run(&m_pool, [this, id]() {
        updateTaskFromRemote(id);
    });
}

QFuture<WriteOutcome> DefaultTasksRepository::saveTask(const data::Task &task)
{
    return joinWrites("save", m_remote.saveTask(task), m_local.saveTask(task));
}

QFuture<WriteOutcome> DefaultTasksRepository::setCompleted(const data::Task &task, bool completed)
{
    return joinWrites(completed ? "complete" : "activate",
                      m_remote.setCompleted(task, completed),
                      m_local.setCompleted(task, completed));
}

QFuture<WriteOutcome> DefaultTasksRepository::setCompleted(const QString &id, bool completed)
{
    return QtConcurrent::run(&m_pool, [this, id, completed]() {
        const auto task = source::waitFor(m_local.getTask(id));
        return settleWrites(completed ? "complete" : "activate",
                            m_remote.setCompleted(task, completed),
                            m_local.setCompleted(task, completed));
    });
}

QFuture<WriteOutcome> DefaultTasksRepository::clearCompletedTasks()
{
    return joinWrites("clear completed", m_remote.deleteAllCompleted(), m_local.deleteAllCompleted());
}

QFuture<WriteOutcome> DefaultTasksRepository::deleteAllTasks()
{
    return joinWrites("delete all", m_remote.deleteAll(), m_local.deleteAll());
}

QFuture<WriteOutcome> DefaultTasksRepository::deleteTask(const QString &id)
{
    return joinWrites("delete", m_remote.deleteTask(id), m_local.deleteTask(id));
}

SyncState DefaultTasksRepository::syncState() const
{
    return static_cast<SyncState>(m_syncState.loadAcquire());
}

void DefaultTasksRepository::updateTasksFromRemote()
{
    setSyncState(SyncState::Resyncing);
    try {
        const auto tasks = source::waitFor(m_remote.getTasks());
        source::waitFor(m_local.deleteAll());
        for (const auto &task : tasks) {
            source::waitFor(m_local.saveTask(task));
        }
        qCDebug(core::lcSync) << "Local cache replaced with" << tasks.size() << "remote tasks";
    } catch (const QException &) {
        setSyncState(SyncState::Stale);
        throw;
    }
    setSyncState(SyncState::Synced);
}

void DefaultTasksRepository::updateTaskFromRemote(const QString &id)
{
    const auto task = source::waitFor(m_remote.getTask(id));
    source::waitFor(m_local.saveTask(task));
    qCDebug(core::lcSync) << "Local copy of" << id << "refreshed";
}

// Both writes are already in flight when this is called.
QFuture<WriteOutcome> DefaultTasksRepository::joinWrites(const char *operation,
                                                         QFuture<void> remote,
                                                         QFuture<void> local)
{
    return QtConcurrent::run(&m_pool, [operation, remote, local]() {
        return settleWrites(operation, remote, local);
    });
}

void DefaultTasksRepository::setSyncState(SyncState state)
{
    const int previous = m_syncState.fetchAndStoreOrdered(static_cast<int>(state));
    if (previous != static_cast<int>(state)) {
        emit syncStateChanged(state);
    }
}

} // namespace sync
} // namespace tasksync
