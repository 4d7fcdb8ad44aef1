#include "tasksync/remote/SimulatedTaskService.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QThread>
#include <QtConcurrent/QtConcurrentRun>

#include "tasksync/core/Logging.hpp"

namespace tasksync {
namespace remote {

namespace {
constexpr auto SNAPSHOT_KEY = "tasks";

RemoteFailure transportFailure(const QString &message)
{
    return RemoteFailure{RemoteFailure::Code::Transport, message};
}
} // namespace

SimulatedTaskService::SimulatedTaskService(int latencyMs, QString snapshotPath)
    : m_snapshotPath(std::move(snapshotPath))
    , m_latencyMs(latencyMs)
    , m_requestCount(0)
{
    m_pool.setMaxThreadCount(4);
    load();
}

SimulatedTaskService::~SimulatedTaskService()
{
    m_pool.waitForDone();
}

void SimulatedTaskService::fetchAll(CollectionCallback onSuccess, Failure onFailure)
{
    dispatch([this, onSuccess, onFailure]() {
        QVector<RemoteDocument> documents;
        {
            QMutexLocker locker(&m_mutex);
            if (!m_available) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("backend unavailable")));
                return;
            }
            documents.reserve(m_documents.size());
            for (auto it = m_documents.constBegin(); it != m_documents.constEnd(); ++it) {
                documents.append(RemoteDocument{it.key(), it.value()});
            }
        }
        onSuccess(documents);
    });
}

void SimulatedTaskService::fetch(const QString &id, DocumentCallback onSuccess, Failure onFailure)
{
    dispatch([this, id, onSuccess, onFailure]() {
        std::optional<QVariantMap> document;
        {
            QMutexLocker locker(&m_mutex);
            if (failsLocked(id)) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("fetch of %1 failed").arg(id)));
                return;
            }
            const auto it = m_documents.constFind(id);
            if (it != m_documents.constEnd()) {
                document = it.value();
            }
        }
        onSuccess(document);
    });
}

void SimulatedTaskService::set(const QString &id, const QVariantMap &fields, bool merge,
                               Completion onSuccess, Failure onFailure)
{
    dispatch([this, id, fields, merge, onSuccess, onFailure]() {
        {
            QMutexLocker locker(&m_mutex);
            if (failsLocked(id)) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("write of %1 failed").arg(id)));
                return;
            }
            const bool committed = commitLocked([&](QMap<QString, QVariantMap> &documents) {
                QVariantMap document = merge ? documents.value(id) : QVariantMap();
                for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
                    document.insert(it.key(), it.value());
                }
                documents.insert(id, document);
            });
            if (!committed) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("backend could not persist %1").arg(id)));
                return;
            }
        }
        onSuccess();
    });
}

void SimulatedTaskService::update(const QString &id, const QString &field, const QVariant &value,
                                  Completion onSuccess, Failure onFailure)
{
    dispatch([this, id, field, value, onSuccess, onFailure]() {
        {
            QMutexLocker locker(&m_mutex);
            if (failsLocked(id)) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("update of %1 failed").arg(id)));
                return;
            }
            if (!m_documents.contains(id)) {
                locker.unlock();
                onFailure(RemoteFailure{RemoteFailure::Code::NotFound,
                                        QStringLiteral("no document %1").arg(id)});
                return;
            }
            const bool committed = commitLocked([&](QMap<QString, QVariantMap> &documents) {
                documents[id].insert(field, value);
            });
            if (!committed) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("backend could not persist %1").arg(id)));
                return;
            }
        }
        onSuccess();
    });
}

void SimulatedTaskService::remove(const QString &id, Completion onSuccess, Failure onFailure)
{
    dispatch([this, id, onSuccess, onFailure]() {
        {
            QMutexLocker locker(&m_mutex);
            if (failsLocked(id)) {
                locker.unlock();
                onFailure(transportFailure(QStringLiteral("delete of %1 failed").arg(id)));
                return;
            }
            if (m_documents.contains(id)) {
                const bool committed = commitLocked([&](QMap<QString, QVariantMap> &documents) {
                    documents.remove(id);
                });
                if (!committed) {
                    locker.unlock();
                    onFailure(transportFailure(QStringLiteral("backend could not persist %1").arg(id)));
                    return;
                }
            }
        }
        onSuccess();
    });
}

void SimulatedTaskService::setLatency(int latencyMs)
{
    m_latencyMs.storeRelaxed(latencyMs);
}

void SimulatedTaskService::setAvailable(bool available)
{
    QMutexLocker locker(&m_mutex);
    m_available = available;
}

bool SimulatedTaskService::isAvailable() const
{
    QMutexLocker locker(&m_mutex);
    return m_available;
}

void SimulatedTaskService::addFailingDocument(const QString &id)
{
    QMutexLocker locker(&m_mutex);
    m_failingIds.insert(id);
}

void SimulatedTaskService::clearFailingDocuments()
{
    QMutexLocker locker(&m_mutex);
    m_failingIds.clear();
}

int SimulatedTaskService::requestCount() const
{
    return m_requestCount.loadRelaxed();
}

void SimulatedTaskService::resetRequestCount()
{
    m_requestCount.storeRelaxed(0);
}

QVector<RemoteDocument> SimulatedTaskService::documents() const
{
    QMutexLocker locker(&m_mutex);
    QVector<RemoteDocument> documents;
    documents.reserve(m_documents.size());
    for (auto it = m_documents.constBegin(); it != m_documents.constEnd(); ++it) {
        documents.append(RemoteDocument{it.key(), it.value()});
    }
    return documents;
}

void SimulatedTaskService::putDocument(const QString &id, const QVariantMap &fields)
{
    QMutexLocker locker(&m_mutex);
    const bool committed = commitLocked([&](QMap<QString, QVariantMap> &documents) {
        documents.insert(id, fields);
    });
    if (!committed) {
        qCWarning(core::lcRemote) << "Could not persist seeded document" << id;
    }
}

void SimulatedTaskService::waitForIdle()
{
    m_pool.waitForDone();
}

void SimulatedTaskService::dispatch(std::function<void()> work)
{
    m_requestCount.fetchAndAddRelaxed(1);
    const int latencyMs = m_latencyMs.loadRelaxed();
    if (latencyMs <= 0) {
        work();
        return;
    }
    QtConcurrent::run(&m_pool, [latencyMs, work]() {
        QThread::msleep(static_cast<unsigned long>(latencyMs));
        work();
    });
}

bool SimulatedTaskService::failsLocked(const QString &id) const
{
    return !m_available || m_failingIds.contains(id);
}

bool SimulatedTaskService::commitLocked(const std::function<void(QMap<QString, QVariantMap> &)> &change)
{
    if (m_snapshotPath.isEmpty()) {
        change(m_documents);
        return true;
    }
    auto next = m_documents;
    change(next);
    if (!save(next)) {
        return false;
    }
    m_documents = next;
    return true;
}

void SimulatedTaskService::load()
{
    if (m_snapshotPath.isEmpty()) {
        return;
    }
    QFile file(m_snapshotPath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(core::lcRemote) << "Cannot open backend snapshot" << m_snapshotPath << file.errorString();
        return;
    }
    QJsonParseError error;
    const auto json = QJsonDocument::fromJson(file.readAll(), &error);
    if (error.error != QJsonParseError::NoError || !json.isObject()) {
        qCWarning(core::lcRemote) << "Ignoring malformed backend snapshot" << m_snapshotPath
                                  << error.errorString();
        return;
    }
    const auto tasks = json.object().value(QLatin1String(SNAPSHOT_KEY)).toObject();
    for (auto it = tasks.constBegin(); it != tasks.constEnd(); ++it) {
        if (it.key().isEmpty()) {
            continue;
        }
        m_documents.insert(it.key(), it.value().toObject().toVariantMap());
    }
}

bool SimulatedTaskService::save(const QMap<QString, QVariantMap> &documents) const
{
    QFileInfo info(m_snapshotPath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }

    QJsonObject tasks;
    for (auto it = documents.constBegin(); it != documents.constEnd(); ++it) {
        tasks.insert(it.key(), QJsonObject::fromVariantMap(it.value()));
    }
    QJsonObject root;
    root.insert(QLatin1String(SNAPSHOT_KEY), tasks);

    QSaveFile file(m_snapshotPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return file.commit();
}

} // namespace remote
} // namespace tasksync
