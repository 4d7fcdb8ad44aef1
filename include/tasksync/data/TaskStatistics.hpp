#pragma once

#include <vector>

#include "tasksync/data/Task.hpp"

namespace tasksync {
namespace data {

struct TaskStatistics
{
    int activeCount = 0;
    int completedCount = 0;
    float activePercent = 0.0f;
    float completedPercent = 0.0f;
};

TaskStatistics computeStatistics(const std::vector<Task> &tasks);

} // namespace data
} // namespace tasksync
