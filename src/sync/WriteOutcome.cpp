#include "tasksync/sync/WriteOutcome.hpp"

namespace tasksync {
namespace sync {

WriteOutcome::WriteOutcome(std::optional<source::StoreError> remoteError,
                           std::optional<source::StoreError> localError)
    : m_remoteError(std::move(remoteError))
    , m_localError(std::move(localError))
{
}

WriteOutcome::Status WriteOutcome::status() const
{
    if (m_remoteError && m_localError) {
        return Status::BothFailed;
    }
    if (m_remoteError) {
        return Status::RemoteFailed;
    }
    if (m_localError) {
        return Status::LocalFailed;
    }
    return Status::Succeeded;
}

QString WriteOutcome::describe() const
{
    switch (status()) {
    case Status::Succeeded:
        return QStringLiteral("stored remotely and locally");
    case Status::RemoteFailed:
        return QStringLiteral("remote write failed (%1)").arg(m_remoteError->message());
    case Status::LocalFailed:
        return QStringLiteral("local write failed (%1)").arg(m_localError->message());
    case Status::BothFailed:
    default:
        return QStringLiteral("remote write failed (%1), local write failed (%2)")
            .arg(m_remoteError->message(), m_localError->message());
    }
}

} // namespace sync
} // namespace tasksync
