#pragma once

#include <QAtomicInt>
#include <QMap>
#include <QMutex>
#include <QSet>
#include <QThreadPool>

#include "tasksync/remote/RemoteTaskService.hpp"

namespace tasksync {
namespace remote {

// In-process document backend standing in for the network service. Replies
// are delivered from a worker thread after the configured latency, or
// inline when the latency is zero. Documents can be persisted to a JSON
// snapshot so the backend survives restarts of the CLI.
class SimulatedTaskService : public RemoteTaskService
{
public:
    explicit SimulatedTaskService(int latencyMs = 0, QString snapshotPath = QString());
    ~SimulatedTaskService() override;

    void fetchAll(CollectionCallback onSuccess, Failure onFailure) override;
    void fetch(const QString &id, DocumentCallback onSuccess, Failure onFailure) override;
    void set(const QString &id, const QVariantMap &fields, bool merge,
             Completion onSuccess, Failure onFailure) override;
    void update(const QString &id, const QString &field, const QVariant &value,
                Completion onSuccess, Failure onFailure) override;
    void remove(const QString &id, Completion onSuccess, Failure onFailure) override;

    void setLatency(int latencyMs);

    // While unavailable every request fails with a transport error.
    void setAvailable(bool available);
    bool isAvailable() const;

    // Requests addressing this document fail with a transport error.
    void addFailingDocument(const QString &id);
    void clearFailingDocuments();

    int requestCount() const;
    void resetRequestCount();

    // Direct backend access, bypassing latency and failure injection.
    QVector<RemoteDocument> documents() const;
    void putDocument(const QString &id, const QVariantMap &fields);

    void waitForIdle();

private:
    void dispatch(std::function<void()> work);
    bool failsLocked(const QString &id) const;
    // Applies change to the documents. With a snapshot path the change is
    // made on a copy that replaces the documents only once it was saved.
    bool commitLocked(const std::function<void(QMap<QString, QVariantMap> &)> &change);
    void load();
    bool save(const QMap<QString, QVariantMap> &documents) const;

    QString m_snapshotPath;
    QAtomicInt m_latencyMs;
    QAtomicInt m_requestCount;

    mutable QMutex m_mutex;
    QMap<QString, QVariantMap> m_documents;
    QSet<QString> m_failingIds;
    bool m_available = true;

    QThreadPool m_pool;
};

} // namespace remote
} // namespace tasksync
