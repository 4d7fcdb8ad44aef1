#include "tasksync/source/StoreError.hpp"

namespace tasksync {
namespace source {

StoreError::StoreError(Kind kind, QString message)
    : m_kind(kind)
    , m_message(std::move(message))
    , m_what(QStringLiteral("%1: %2").arg(toString(kind), m_message).toUtf8())
{
}

const char *StoreError::what() const noexcept
{
    return m_what.constData();
}

void StoreError::raise() const
{
    throw *this;
}

StoreError *StoreError::clone() const
{
    return new StoreError(*this);
}

StoreError StoreError::unavailable(const QString &message)
{
    return StoreError(Kind::Unavailable, message);
}

StoreError StoreError::notFound(const QString &id)
{
    return StoreError(Kind::NotFound, QStringLiteral("task %1 not found").arg(id));
}

StoreError StoreError::cancelled()
{
    return StoreError(Kind::Cancelled, QStringLiteral("operation cancelled"));
}

StoreError StoreError::invalidArgument(const QString &message)
{
    return StoreError(Kind::InvalidArgument, message);
}

QString toString(StoreError::Kind kind)
{
    switch (kind) {
    case StoreError::Kind::NotFound:
        return QStringLiteral("NotFound");
    case StoreError::Kind::Cancelled:
        return QStringLiteral("Cancelled");
    case StoreError::Kind::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case StoreError::Kind::Unavailable:
    default:
        return QStringLiteral("Unavailable");
    }
}

QDebug operator<<(QDebug debug, const StoreError &error)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "StoreError(" << toString(error.kind()) << ", " << error.message() << ')';
    return debug;
}

} // namespace source
} // namespace tasksync
