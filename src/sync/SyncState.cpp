#include "tasksync/sync/SyncState.hpp"

namespace tasksync {
namespace sync {

QString toString(SyncState state)
{
    switch (state) {
    case SyncState::Resyncing:
        return QStringLiteral("resyncing");
    case SyncState::Synced:
        return QStringLiteral("synced");
    case SyncState::Stale:
        return QStringLiteral("stale");
    case SyncState::Idle:
    default:
        return QStringLiteral("idle");
    }
}

} // namespace sync
} // namespace tasksync
