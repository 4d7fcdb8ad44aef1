#pragma once

#include <memory>

#include "tasksync/core/Settings.hpp"

namespace tasksync {
namespace data {
class FileTaskStorage;
class TaskRepository;
}
namespace source {
class LocalTaskDataSource;
}
namespace remote {
class SimulatedTaskService;
class RemoteTaskDataSource;
}
namespace sync {
class DefaultTasksRepository;
class TasksRepository;
}

namespace core {

// Owns the backend, both stores and the orchestrator. Members are torn
// down in reverse order, so pending work drains before the stores go.
class AppContext
{
public:
    explicit AppContext(Settings settings);
    ~AppContext();

    sync::TasksRepository &tasksRepository();
    remote::SimulatedTaskService &remoteService();

private:
    void seedDemoData();

    Settings m_settings;
    std::unique_ptr<remote::SimulatedTaskService> m_remoteService;
    std::shared_ptr<data::FileTaskStorage> m_storage;
    std::unique_ptr<data::TaskRepository> m_localRepository;
    std::unique_ptr<source::LocalTaskDataSource> m_localSource;
    std::unique_ptr<remote::RemoteTaskDataSource> m_remoteSource;
    std::unique_ptr<sync::DefaultTasksRepository> m_tasksRepository;
};

} // namespace core
} // namespace tasksync
