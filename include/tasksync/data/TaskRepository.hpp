#pragma once

#include <optional>
#include <vector>

#include "tasksync/data/Task.hpp"

namespace tasksync {
namespace data {

// Synchronous storage engine behind the local data source. Mutators return
// false when nothing was persisted.
class TaskRepository
{
public:
    virtual ~TaskRepository() = default;

    virtual std::vector<Task> fetchTasks() const = 0;
    virtual std::optional<Task> findById(const QString &id) const = 0;
    virtual bool upsertTask(const Task &task) = 0;
    virtual bool removeTask(const QString &id) = 0;
    virtual bool removeCompletedTasks() = 0;
    virtual bool removeAllTasks() = 0;
};

} // namespace data
} // namespace tasksync
