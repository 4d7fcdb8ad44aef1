#pragma once

#include <QString>
#include <QUuid>
#include <QVariantMap>

#include <vector>

namespace tasksync {
namespace data {

struct Task
{
    QString id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    QString title;
    QString description;
    bool completed = false;

    bool isActive() const { return !completed; }

    // Remote document shape, keyed by id outside the map.
    QVariantMap toFields() const;
    static Task fromFields(const QString &id, const QVariantMap &document);
};

// Identity is the id; content is not compared.
inline bool operator==(const Task &lhs, const Task &rhs)
{
    return lhs.id == rhs.id;
}

inline bool operator!=(const Task &lhs, const Task &rhs)
{
    return !(lhs == rhs);
}

using TaskList = std::vector<Task>;

namespace fields {
constexpr auto Title = "title";
constexpr auto Description = "description";
constexpr auto Completed = "completed";
} // namespace fields

} // namespace data
} // namespace tasksync
