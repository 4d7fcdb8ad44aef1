#pragma once

#include <QFuture>
#include <QFutureInterface>

#include "tasksync/source/StoreError.hpp"

namespace tasksync {
namespace source {

// Promise side of a QFuture fed by a completion callback.
template <typename T>
QFutureInterface<T> makePending()
{
    QFutureInterface<T> pending;
    pending.reportStarted();
    return pending;
}

// Results reported after the consumer cancelled are discarded by
// QFutureInterface itself; finishing is still required to release waiters.
template <typename T>
void resolve(QFutureInterface<T> &pending, const T &value)
{
    pending.reportResult(value);
    pending.reportFinished();
}

inline void resolve(QFutureInterface<void> &pending)
{
    pending.reportFinished();
}

template <typename T>
void reject(QFutureInterface<T> &pending, const StoreError &error)
{
    pending.reportException(error);
    pending.reportFinished();
}

template <typename T>
QFuture<T> failedFuture(const StoreError &error)
{
    auto pending = makePending<T>();
    reject(pending, error);
    return pending.future();
}

// Blocks the calling worker until the future settles. Stored errors are
// rethrown; a cancelled future without a value raises Cancelled.
template <typename T>
T waitFor(QFuture<T> future)
{
    future.waitForFinished();
    if (future.isCanceled() || future.resultCount() == 0) {
        throw StoreError::cancelled();
    }
    return future.result();
}

inline void waitFor(QFuture<void> future)
{
    future.waitForFinished();
    if (future.isCanceled()) {
        throw StoreError::cancelled();
    }
}

} // namespace source
} // namespace tasksync
