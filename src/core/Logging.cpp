#include "tasksync/core/Logging.hpp"

namespace tasksync {
namespace core {

Q_LOGGING_CATEGORY(lcSync, "tasksync.sync")
Q_LOGGING_CATEGORY(lcRemote, "tasksync.remote")
Q_LOGGING_CATEGORY(lcLocal, "tasksync.local")
Q_LOGGING_CATEGORY(lcApp, "tasksync.app")

} // namespace core
} // namespace tasksync
