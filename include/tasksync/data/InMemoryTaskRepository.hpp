#pragma once

#include <QHash>

#include "tasksync/data/TaskRepository.hpp"

namespace tasksync {
namespace data {

class InMemoryTaskRepository : public TaskRepository
{
public:
    InMemoryTaskRepository();
    ~InMemoryTaskRepository() override;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    bool upsertTask(const Task &task) override;
    bool removeTask(const QString &id) override;
    bool removeCompletedTasks() override;
    bool removeAllTasks() override;

private:
    QHash<QString, Task> m_items;
};

} // namespace data
} // namespace tasksync
