#include "tasksync/core/AppContext.hpp"

#include <QObject>

#include "tasksync/core/Logging.hpp"
#include "tasksync/data/FileTaskRepository.hpp"
#include "tasksync/data/FileTaskStorage.hpp"
#include "tasksync/remote/RemoteTaskDataSource.hpp"
#include "tasksync/remote/SimulatedTaskService.hpp"
#include "tasksync/source/LocalTaskDataSource.hpp"
#include "tasksync/sync/DefaultTasksRepository.hpp"

namespace tasksync {
namespace core {

AppContext::AppContext(Settings settings)
    : m_settings(std::move(settings))
{
    m_remoteService = std::make_unique<remote::SimulatedTaskService>(m_settings.remoteLatencyMs,
                                                                     m_settings.remoteSnapshotPath);
    m_storage = std::make_shared<data::FileTaskStorage>(m_settings.storagePath);
    m_localRepository = std::make_unique<data::FileTaskRepository>(m_storage);
    m_localSource = std::make_unique<source::LocalTaskDataSource>(*m_localRepository);
    m_remoteSource = std::make_unique<remote::RemoteTaskDataSource>(*m_remoteService);
    m_tasksRepository = std::make_unique<sync::DefaultTasksRepository>(*m_remoteSource, *m_localSource,
                                                                       m_settings.maxThreads);

    seedDemoData();
    qCDebug(lcApp) << "Local cache" << m_settings.storagePath << "backend" << m_settings.remoteSnapshotPath;
}

AppContext::~AppContext() = default;

sync::TasksRepository &AppContext::tasksRepository()
{
    return *m_tasksRepository;
}

remote::SimulatedTaskService &AppContext::remoteService()
{
    return *m_remoteService;
}

void AppContext::seedDemoData()
{
    if (!m_remoteService->documents().isEmpty()) {
        return;
    }

    data::Task review;
    review.title = QObject::tr("Review sync design");
    review.description = QObject::tr("Check resync and fan-out write behaviour");

    data::Task offline;
    offline.title = QObject::tr("Test offline mode");
    offline.description = QObject::tr("Disable the backend and reload the list");

    data::Task docs;
    docs.title = QObject::tr("Write release notes");
    docs.description = QObject::tr("Summarise changes for the next version");
    docs.completed = true;

    for (const auto &task : {review, offline, docs}) {
        m_remoteService->putDocument(task.id, task.toFields());
    }
}

} // namespace core
} // namespace tasksync
