#pragma once

#include <QByteArray>
#include <QDebug>
#include <QException>
#include <QString>

namespace tasksync {
namespace source {

class StoreError : public QException
{
public:
    enum class Kind
    {
        Unavailable,
        NotFound,
        Cancelled,
        InvalidArgument,
    };

    StoreError(Kind kind, QString message);

    Kind kind() const noexcept { return m_kind; }
    const QString &message() const noexcept { return m_message; }

    const char *what() const noexcept override;
    void raise() const override;
    StoreError *clone() const override;

    static StoreError unavailable(const QString &message);
    static StoreError notFound(const QString &id);
    static StoreError cancelled();
    static StoreError invalidArgument(const QString &message);

private:
    Kind m_kind;
    QString m_message;
    QByteArray m_what;
};

QString toString(StoreError::Kind kind);
QDebug operator<<(QDebug debug, const StoreError &error);

} // namespace source
} // namespace tasksync
