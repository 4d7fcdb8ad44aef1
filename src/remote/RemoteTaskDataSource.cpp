#include "tasksync/remote/RemoteTaskDataSource.hpp"

#include <QAtomicInt>
#include <QMutex>
#include <QMutexLocker>
#include <QStringList>

#include <algorithm>
#include <memory>

#include "tasksync/core/Logging.hpp"
#include "tasksync/source/FutureSupport.hpp"

namespace tasksync {
namespace remote {

using source::StoreError;

struct RemoteTaskDataSource::Cache
{
    QMutex mutex;
    data::TaskList tasks;
};

namespace {

data::TaskList toTasks(const QVector<RemoteDocument> &documents)
{
    data::TaskList tasks;
    tasks.reserve(static_cast<size_t>(documents.size()));
    for (const auto &document : documents) {
        if (document.id.isEmpty()) {
            qCWarning(core::lcRemote) << "Skipping remote document without id";
            continue;
        }
        tasks.push_back(data::Task::fromFields(document.id, document.fields));
    }
    return tasks;
}

RemoteTaskService::Failure rejectWith(QFutureInterface<void> pending)
{
    return [pending](const RemoteFailure &failure) mutable {
        source::reject(pending, RemoteTaskDataSource::toStoreError(failure));
    };
}

RemoteTaskService::Completion resolveWith(QFutureInterface<void> pending)
{
    return [pending]() mutable {
        source::resolve(pending);
    };
}

struct BulkDelete
{
    RemoteTaskService *service;
    QFutureInterface<void> pending;
    QStringList ids;
    int index = 0;
};

enum StepState
{
    Issuing,
    Returned,
    CompletedInline,
};

// Issues one delete at a time. A completion that fires inside remove() is
// picked up by the loop; a later one resumes the run from its own thread, so
// the stack stays flat either way.
void runDeletes(const std::shared_ptr<BulkDelete> &run)
{
    for (;;) {
        if (run->index >= run->ids.size()) {
            source::resolve(run->pending);
            return;
        }
        if (run->pending.isCanceled()) {
            qCDebug(core::lcRemote) << "Bulk delete cancelled after" << run->index << "of" << run->ids.size();
            run->pending.reportFinished();
            return;
        }
        const QString id = run->ids.at(run->index);
        auto state = std::make_shared<QAtomicInt>(Issuing);
        run->service->remove(
            id,
            [run, state]() {
                ++run->index;
                if (!state->testAndSetOrdered(Issuing, CompletedInline)) {
                    runDeletes(run);
                }
            },
            [run, id](const RemoteFailure &failure) {
                qCWarning(core::lcRemote) << "Bulk delete stopped at" << id << failure.message;
                source::reject(run->pending, RemoteTaskDataSource::toStoreError(failure));
            });
        if (state->testAndSetOrdered(Issuing, Returned)) {
            return;
        }
    }
}

} // namespace

RemoteTaskDataSource::RemoteTaskDataSource(RemoteTaskService &service)
    : m_service(service)
    , m_cache(std::make_shared<Cache>())
{
}

RemoteTaskDataSource::~RemoteTaskDataSource() = default;

QFuture<data::TaskList> RemoteTaskDataSource::getTasks()
{
    auto pending = source::makePending<data::TaskList>();
    m_service.fetchAll(
        [pending](const QVector<RemoteDocument> &documents) mutable {
            if (pending.isCanceled()) {
                qCDebug(core::lcRemote) << "Dropping task list for a cancelled request";
                pending.reportFinished();
                return;
            }
            source::resolve(pending, toTasks(documents));
        },
        [pending](const RemoteFailure &failure) mutable {
            source::reject(pending, toStoreError(failure));
        });
    return pending.future();
}

QFuture<data::Task> RemoteTaskDataSource::getTask(const QString &id)
{
    if (id.isEmpty()) {
        return source::failedFuture<data::Task>(StoreError::invalidArgument(QStringLiteral("empty task id")));
    }
    auto pending = source::makePending<data::Task>();
    m_service.fetch(
        id,
        [pending, id](const std::optional<QVariantMap> &document) mutable {
            if (pending.isCanceled()) {
                qCDebug(core::lcRemote) << "Dropping task" << id << "for a cancelled request";
                pending.reportFinished();
                return;
            }
            if (!document) {
                source::reject(pending, StoreError::notFound(id));
                return;
            }
            source::resolve(pending, data::Task::fromFields(id, *document));
        },
        [pending](const RemoteFailure &failure) mutable {
            source::reject(pending, toStoreError(failure));
        });
    return pending.future();
}

QFuture<void> RemoteTaskDataSource::saveTask(const data::Task &task)
{
    if (task.id.isEmpty()) {
        return source::failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot save a task without id")));
    }
    auto pending = source::makePending<void>();
    m_service.set(task.id, task.toFields(), true, resolveWith(pending), rejectWith(pending));
    return pending.future();
}

QFuture<void> RemoteTaskDataSource::setCompleted(const data::Task &task, bool completed)
{
    return setCompleted(task.id, completed);
}

QFuture<void> RemoteTaskDataSource::setCompleted(const QString &id, bool completed)
{
    if (id.isEmpty()) {
        return source::failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot update a task without id")));
    }
    auto pending = source::makePending<void>();
    m_service.update(id, QLatin1String(data::fields::Completed), completed,
                     resolveWith(pending), rejectWith(pending));
    return pending.future();
}

QFuture<void> RemoteTaskDataSource::deleteAllCompleted()
{
    return deleteMatching([](const data::Task &task) {
        return task.completed;
    });
}

QFuture<void> RemoteTaskDataSource::deleteAll()
{
    return deleteMatching([](const data::Task &) {
        return true;
    });
}

QFuture<void> RemoteTaskDataSource::deleteTask(const QString &id)
{
    if (id.isEmpty()) {
        return source::failedFuture<void>(StoreError::invalidArgument(QStringLiteral("cannot delete a task without id")));
    }
    auto pending = source::makePending<void>();
    m_service.remove(id, resolveWith(pending), rejectWith(pending));
    return pending.future();
}

QFuture<void> RemoteTaskDataSource::refreshTasks()
{
    auto pending = source::makePending<void>();
    auto cache = m_cache;
    m_service.fetchAll(
        [pending, cache](const QVector<RemoteDocument> &documents) mutable {
            {
                QMutexLocker locker(&cache->mutex);
                cache->tasks = toTasks(documents);
            }
            source::resolve(pending);
        },
        rejectWith(pending));
    return pending.future();
}

QFuture<void> RemoteTaskDataSource::refreshTask(const QString &id)
{
    if (id.isEmpty()) {
        return source::failedFuture<void>(StoreError::invalidArgument(QStringLiteral("empty task id")));
    }
    auto pending = source::makePending<void>();
    auto cache = m_cache;
    m_service.fetch(
        id,
        [pending, cache, id](const std::optional<QVariantMap> &document) mutable {
            {
                QMutexLocker locker(&cache->mutex);
                auto &tasks = cache->tasks;
                tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                           [&id](const data::Task &task) { return task.id == id; }),
                            tasks.end());
                if (document) {
                    tasks.push_back(data::Task::fromFields(id, *document));
                }
            }
            if (!document) {
                source::reject(pending, StoreError::notFound(id));
                return;
            }
            source::resolve(pending);
        },
        rejectWith(pending));
    return pending.future();
}

data::TaskList RemoteTaskDataSource::cachedTasks() const
{
    QMutexLocker locker(&m_cache->mutex);
    return m_cache->tasks;
}

StoreError RemoteTaskDataSource::toStoreError(const RemoteFailure &failure)
{
    if (failure.code == RemoteFailure::Code::NotFound) {
        return StoreError(StoreError::Kind::NotFound, failure.message);
    }
    return StoreError::unavailable(failure.message);
}

QFuture<void> RemoteTaskDataSource::deleteMatching(std::function<bool(const data::Task &)> matches)
{
    auto pending = source::makePending<void>();
    RemoteTaskService *service = &m_service;
    m_service.fetchAll(
        [service, pending, matches](const QVector<RemoteDocument> &documents) {
            auto run = std::make_shared<BulkDelete>(BulkDelete{service, pending, QStringList()});
            for (const auto &task : toTasks(documents)) {
                if (matches(task)) {
                    run->ids << task.id;
                }
            }
            qCDebug(core::lcRemote) << "Deleting" << run->ids.size() << "of" << documents.size() << "remote tasks";
            runDeletes(run);
        },
        rejectWith(pending));
    return pending.future();
}

} // namespace remote
} // namespace tasksync
