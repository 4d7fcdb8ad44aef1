#pragma once

#include <QLoggingCategory>

namespace tasksync {
namespace core {

Q_DECLARE_LOGGING_CATEGORY(lcSync)
Q_DECLARE_LOGGING_CATEGORY(lcRemote)
Q_DECLARE_LOGGING_CATEGORY(lcLocal)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

} // namespace core
} // namespace tasksync
