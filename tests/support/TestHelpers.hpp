#pragma once

#include <QStringList>

#include <optional>

#include "tasksync/data/Task.hpp"
#include "tasksync/remote/RemoteTaskService.hpp"
#include "tasksync/source/StoreError.hpp"

namespace tasksync {
namespace testing {

inline data::Task makeTask(const QString &id, const QString &title, bool completed = false,
                           const QString &description = QString())
{
    data::Task task;
    task.id = id;
    task.title = title;
    task.description = description;
    task.completed = completed;
    return task;
}

inline QStringList ids(const data::TaskList &tasks)
{
    QStringList result;
    for (const auto &task : tasks) {
        result << task.id;
    }
    result.sort();
    return result;
}

inline QStringList ids(const QVector<remote::RemoteDocument> &documents)
{
    QStringList result;
    for (const auto &document : documents) {
        result << document.id;
    }
    result.sort();
    return result;
}

inline std::optional<data::Task> findTask(const data::TaskList &tasks, const QString &id)
{
    for (const auto &task : tasks) {
        if (task.id == id) {
            return task;
        }
    }
    return std::nullopt;
}

inline std::optional<QVariantMap> findDocument(const QVector<remote::RemoteDocument> &documents,
                                               const QString &id)
{
    for (const auto &document : documents) {
        if (document.id == id) {
            return document.fields;
        }
    }
    return std::nullopt;
}

// Runs fn and returns the kind of the StoreError it threw, if any.
template <typename Fn>
std::optional<source::StoreError::Kind> errorKindOf(Fn fn)
{
    try {
        fn();
    } catch (const source::StoreError &error) {
        return error.kind();
    }
    return std::nullopt;
}

} // namespace testing
} // namespace tasksync
