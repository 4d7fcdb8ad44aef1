#include "tasksync/data/Task.hpp"

namespace tasksync {
namespace data {

QVariantMap Task::toFields() const
{
    QVariantMap map;
    map.insert(QLatin1String(fields::Title), title);
    map.insert(QLatin1String(fields::Description), description);
    map.insert(QLatin1String(fields::Completed), completed);
    return map;
}

Task Task::fromFields(const QString &id, const QVariantMap &document)
{
    Task task;
    task.id = id;
    task.title = document.value(QLatin1String(fields::Title)).toString();
    task.description = document.value(QLatin1String(fields::Description)).toString();
    task.completed = document.value(QLatin1String(fields::Completed)).toBool();
    return task;
}

} // namespace data
} // namespace tasksync
