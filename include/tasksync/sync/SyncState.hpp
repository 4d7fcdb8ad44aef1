#pragma once

#include <QMetaType>
#include <QString>

namespace tasksync {
namespace sync {

// Idle until the first resync; Stale when the last resync failed and the
// local cache may be outdated or torn.
enum class SyncState
{
    Idle,
    Resyncing,
    Synced,
    Stale,
};

QString toString(SyncState state);

} // namespace sync
} // namespace tasksync

Q_DECLARE_METATYPE(tasksync::sync::SyncState)
