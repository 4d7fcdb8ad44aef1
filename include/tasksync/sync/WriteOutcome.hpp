#pragma once

#include <optional>

#include "tasksync/source/StoreError.hpp"

namespace tasksync {
namespace sync {

// Settled result of a write dispatched to both stores.
class WriteOutcome
{
public:
    enum class Status
    {
        Succeeded,
        RemoteFailed,
        LocalFailed,
        BothFailed,
    };

    WriteOutcome() = default;
    WriteOutcome(std::optional<source::StoreError> remoteError,
                 std::optional<source::StoreError> localError);

    Status status() const;
    bool succeeded() const { return status() == Status::Succeeded; }
    bool remoteSucceeded() const { return !m_remoteError.has_value(); }
    bool localSucceeded() const { return !m_localError.has_value(); }

    const std::optional<source::StoreError> &remoteError() const { return m_remoteError; }
    const std::optional<source::StoreError> &localError() const { return m_localError; }

    QString describe() const;

private:
    std::optional<source::StoreError> m_remoteError;
    std::optional<source::StoreError> m_localError;
};

} // namespace sync
} // namespace tasksync
