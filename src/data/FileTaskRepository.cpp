#include "tasksync/data/FileTaskRepository.hpp"

#include <algorithm>

namespace tasksync {
namespace data {

FileTaskRepository::FileTaskRepository(std::shared_ptr<FileTaskStorage> storage)
    : m_storage(std::move(storage))
{
}

std::vector<Task> FileTaskRepository::fetchTasks() const
{
    std::vector<Task> result;
    if (!m_storage) {
        return result;
    }
    const auto &tasks = m_storage->tasks();
    result.reserve(static_cast<size_t>(tasks.size()));
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        result.push_back(it.value());
    }
    std::sort(result.begin(), result.end(), [](const Task &lhs, const Task &rhs) {
        if (lhs.isActive() == rhs.isActive()) {
            return lhs.title.toLower() < rhs.title.toLower();
        }
        return lhs.isActive();
    });
    return result;
}

std::optional<Task> FileTaskRepository::findById(const QString &id) const
{
    if (!m_storage) {
        return std::nullopt;
    }
    const auto &tasks = m_storage->tasks();
    if (tasks.contains(id)) {
        return tasks.value(id);
    }
    return std::nullopt;
}

bool FileTaskRepository::upsertTask(const Task &task)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->addOrUpdateTask(task);
}

bool FileTaskRepository::removeTask(const QString &id)
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeTask(id);
}

bool FileTaskRepository::removeCompletedTasks()
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeCompletedTasks();
}

bool FileTaskRepository::removeAllTasks()
{
    if (!m_storage) {
        return false;
    }
    return m_storage->removeAllTasks();
}

} // namespace data
} // namespace tasksync
