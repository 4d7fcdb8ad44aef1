#include "tasksync/data/InMemoryTaskRepository.hpp"

namespace tasksync {
namespace data {

InMemoryTaskRepository::InMemoryTaskRepository() = default;
InMemoryTaskRepository::~InMemoryTaskRepository() = default;

std::vector<Task> InMemoryTaskRepository::fetchTasks() const
{
    std::vector<Task> tasks;
    tasks.reserve(static_cast<size_t>(m_items.size()));
    for (const auto &item : m_items) {
        tasks.push_back(item);
    }
    return tasks;
}

std::optional<Task> InMemoryTaskRepository::findById(const QString &id) const
{
    if (m_items.contains(id)) {
        return m_items.value(id);
    }
    return std::nullopt;
}

bool InMemoryTaskRepository::upsertTask(const Task &task)
{
    if (task.id.isEmpty()) {
        return false;
    }
    m_items.insert(task.id, task);
    return true;
}

bool InMemoryTaskRepository::removeTask(const QString &id)
{
    return m_items.remove(id) > 0;
}

bool InMemoryTaskRepository::removeCompletedTasks()
{
    for (auto it = m_items.begin(); it != m_items.end();) {
        if (it->completed) {
            it = m_items.erase(it);
        } else {
            ++it;
        }
    }
    return true;
}

bool InMemoryTaskRepository::removeAllTasks()
{
    m_items.clear();
    return true;
}

} // namespace data
} // namespace tasksync
