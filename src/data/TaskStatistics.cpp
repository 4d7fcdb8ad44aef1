#include "tasksync/data/TaskStatistics.hpp"

namespace tasksync {
namespace data {

TaskStatistics computeStatistics(const std::vector<Task> &tasks)
{
    TaskStatistics stats;
    if (tasks.empty()) {
        return stats;
    }
    for (const auto &task : tasks) {
        if (task.isActive()) {
            ++stats.activeCount;
        } else {
            ++stats.completedCount;
        }
    }
    const float total = static_cast<float>(tasks.size());
    stats.activePercent = 100.0f * static_cast<float>(stats.activeCount) / total;
    stats.completedPercent = 100.0f * static_cast<float>(stats.completedCount) / total;
    return stats;
}

} // namespace data
} // namespace tasksync
