#pragma once

#include <QString>
#include <QVariant>
#include <QVariantMap>
#include <QVector>

#include <functional>
#include <optional>

namespace tasksync {
namespace remote {

struct RemoteDocument
{
    QString id;
    QVariantMap fields;
};

struct RemoteFailure
{
    enum class Code
    {
        Transport,
        NotFound,
    };

    Code code = Code::Transport;
    QString message;
};

// Callback based document API of the backend. Exactly one of the two
// callbacks fires per request, possibly on another thread and possibly
// after the caller lost interest.
class RemoteTaskService
{
public:
    using Completion = std::function<void()>;
    using Failure = std::function<void(const RemoteFailure &)>;
    using CollectionCallback = std::function<void(const QVector<RemoteDocument> &)>;
    // An absent document is reported as success with no fields.
    using DocumentCallback = std::function<void(const std::optional<QVariantMap> &)>;

    virtual ~RemoteTaskService() = default;

    virtual void fetchAll(CollectionCallback onSuccess, Failure onFailure) = 0;
    virtual void fetch(const QString &id, DocumentCallback onSuccess, Failure onFailure) = 0;
    virtual void set(const QString &id, const QVariantMap &fields, bool merge,
                     Completion onSuccess, Failure onFailure) = 0;
    // Fails with Code::NotFound when the document does not exist.
    virtual void update(const QString &id, const QString &field, const QVariant &value,
                        Completion onSuccess, Failure onFailure) = 0;
    // Removing an absent document succeeds.
    virtual void remove(const QString &id, Completion onSuccess, Failure onFailure) = 0;
};

} // namespace remote
} // namespace tasksync
