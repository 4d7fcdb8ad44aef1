#pragma once

#include <memory>

#include "tasksync/remote/RemoteTaskService.hpp"
#include "tasksync/source/StoreError.hpp"
#include "tasksync/source/TaskDataSource.hpp"

namespace tasksync {
namespace remote {

// Store contract over the callback based backend API. Each call issues its
// request(s) immediately and completes the returned future from the
// backend callback. Cancelling a future marks it inactive: a reply arriving
// afterwards is dropped, the request itself is not aborted.
class RemoteTaskDataSource : public source::TaskDataSource
{
public:
    explicit RemoteTaskDataSource(RemoteTaskService &service);
    ~RemoteTaskDataSource() override;

    QFuture<data::TaskList> getTasks() override;
    QFuture<data::Task> getTask(const QString &id) override;

    QFuture<void> saveTask(const data::Task &task) override;
    QFuture<void> setCompleted(const data::Task &task, bool completed) override;
    QFuture<void> setCompleted(const QString &id, bool completed) override;
    // Both fetch the remote snapshot first, then delete the matching
    // documents one at a time. The first failed delete ends the sequence;
    // documents already deleted stay deleted.
    QFuture<void> deleteAllCompleted() override;
    QFuture<void> deleteAll() override;
    QFuture<void> deleteTask(const QString &id) override;

    // Pull the snapshot (or one document) into the adapter's cache.
    QFuture<void> refreshTasks() override;
    QFuture<void> refreshTask(const QString &id) override;

    data::TaskList cachedTasks() const;

    static source::StoreError toStoreError(const RemoteFailure &failure);

private:
    struct Cache;

    QFuture<void> deleteMatching(std::function<bool(const data::Task &)> matches);

    RemoteTaskService &m_service;
    std::shared_ptr<Cache> m_cache;
};

} // namespace remote
} // namespace tasksync
