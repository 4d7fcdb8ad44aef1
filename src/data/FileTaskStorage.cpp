#include "tasksync/data/FileTaskStorage.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>
#include <algorithm>

#include "tasksync/core/Logging.hpp"

namespace tasksync {
namespace data {

FileTaskStorage::FileTaskStorage(QString filePath)
    : m_filePath(std::move(filePath))
{
    load();
}

const QHash<QString, Task> &FileTaskStorage::tasks() const
{
    return m_tasks;
}

bool FileTaskStorage::addOrUpdateTask(const Task &task)
{
    if (task.id.isEmpty()) {
        return false;
    }
    auto next = m_tasks;
    next.insert(task.id, task);
    return commit(next);
}

bool FileTaskStorage::removeTask(const QString &id)
{
    if (!m_tasks.contains(id)) {
        return false;
    }
    auto next = m_tasks;
    next.remove(id);
    return commit(next);
}

bool FileTaskStorage::removeCompletedTasks()
{
    auto next = m_tasks;
    for (auto it = next.begin(); it != next.end();) {
        if (it->completed) {
            it = next.erase(it);
        } else {
            ++it;
        }
    }
    if (next.size() == m_tasks.size()) {
        return true;
    }
    return commit(next);
}

bool FileTaskStorage::removeAllTasks()
{
    return commit({});
}

bool FileTaskStorage::commit(const QHash<QString, Task> &tasks)
{
    if (!save(tasks)) {
        qCWarning(core::lcLocal) << "Failed to write task cache" << m_filePath;
        return false;
    }
    m_tasks = tasks;
    return true;
}

void FileTaskStorage::load()
{
    m_tasks.clear();

    QFile file(m_filePath);
    if (!file.exists()) {
        return;
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qCWarning(core::lcLocal) << "Cannot open task cache" << m_filePath << file.errorString();
        return;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    bool inTodo = false;
    Task current;

    auto handleLine = [&](const QString &line) {
        if (line == QLatin1String("BEGIN:VTODO")) {
            inTodo = true;
            current = Task{};
            current.id.clear();
            return;
        }
        if (line == QLatin1String("END:VTODO")) {
            // Entries without a UID cannot be addressed and are dropped.
            if (!current.id.isEmpty()) {
                m_tasks.insert(current.id, current);
            }
            inTodo = false;
            return;
        }
        if (!inTodo) {
            return;
        }

        const int colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            return;
        }

        const QString name = line.left(colonIndex).section(';', 0, 0).toUpper();
        const QString rawValue = line.mid(colonIndex + 1);
        const QString value = decodeText(rawValue);

        if (name == QLatin1String("UID")) {
            current.id = value.trimmed();
        } else if (name == QLatin1String("SUMMARY")) {
            current.title = value;
        } else if (name == QLatin1String("DESCRIPTION")) {
            current.description = value;
        } else if (name == QLatin1String("STATUS")) {
            current.completed = completedFromString(rawValue);
        }
    };

    QString accumulator;
    bool hasAccumulator = false;
    while (!stream.atEnd()) {
        QString line = stream.readLine();
        if (!line.isEmpty() && (line.startsWith(' ') || line.startsWith('\t'))) {
            if (hasAccumulator) {
                accumulator += line.mid(1);
            }
        } else {
            if (hasAccumulator) {
                handleLine(accumulator);
            }
            accumulator = line;
            hasAccumulator = true;
        }
    }
    if (hasAccumulator) {
        handleLine(accumulator);
    }
    qCDebug(core::lcLocal) << "Loaded" << m_tasks.size() << "tasks from" << m_filePath;
}

bool FileTaskStorage::save(const QHash<QString, Task> &tasks) const
{
    if (m_filePath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        return false;
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return false;
    }

    QTextStream stream(&file);
    stream.setCodec("UTF-8");

    stream << "BEGIN:VCALENDAR\n";
    stream << "VERSION:2.0\n";
    stream << "PRODID:-//tasksync//EN\n";

    auto ordered = tasks.values();
    std::sort(ordered.begin(), ordered.end(), [](const Task &lhs, const Task &rhs) {
        return lhs.id < rhs.id;
    });
    for (const Task &task : ordered) {
        stream << "BEGIN:VTODO\n";
        stream << "UID:" << task.id << '\n';
        stream << "SUMMARY:" << encodeText(task.title) << '\n';
        if (!task.description.isEmpty()) {
            stream << "DESCRIPTION:" << encodeText(task.description) << '\n';
        }
        stream << "STATUS:" << statusToString(task.completed) << '\n';
        stream << "END:VTODO\n";
    }

    stream << "END:VCALENDAR\n";

    stream.flush();
    if (stream.status() != QTextStream::Ok) {
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

QString FileTaskStorage::encodeText(const QString &text)
{
    QString encoded = text;
    encoded.replace('\\', "\\\\");
    encoded.replace('\n', "\\n");
    encoded.replace(',', "\\,");
    encoded.replace(';', "\\;");
    return encoded;
}

QString FileTaskStorage::decodeText(const QString &text)
{
    QString decoded;
    decoded.reserve(text.size());
    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);
        if (ch == '\\' && i + 1 < text.size()) {
            const QChar next = text.at(++i);
            if (next == 'n' || next == 'N') {
                decoded += '\n';
            } else {
                decoded += next;
            }
        } else {
            decoded += ch;
        }
    }
    return decoded;
}

QString FileTaskStorage::statusToString(bool completed)
{
    return completed ? QStringLiteral("COMPLETED") : QStringLiteral("NEEDS-ACTION");
}

bool FileTaskStorage::completedFromString(const QString &value)
{
    return value.trimmed().toUpper() == QLatin1String("COMPLETED");
}

} // namespace data
} // namespace tasksync
