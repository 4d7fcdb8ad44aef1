#pragma once

#include "tasksync/data/FileTaskStorage.hpp"
#include "tasksync/data/TaskRepository.hpp"

#include <memory>

namespace tasksync {
namespace data {

class FileTaskRepository : public TaskRepository
{
public:
    explicit FileTaskRepository(std::shared_ptr<FileTaskStorage> storage);
    ~FileTaskRepository() override = default;

    std::vector<Task> fetchTasks() const override;
    std::optional<Task> findById(const QString &id) const override;
    bool upsertTask(const Task &task) override;
    bool removeTask(const QString &id) override;
    bool removeCompletedTasks() override;
    bool removeAllTasks() override;

private:
    std::shared_ptr<FileTaskStorage> m_storage;
};

} // namespace data
} // namespace tasksync
