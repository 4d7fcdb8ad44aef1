#include "tasksync/core/Settings.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>

namespace tasksync {
namespace core {

namespace {
constexpr auto KEY_STORAGE_PATH = "local/storagePath";
constexpr auto KEY_REMOTE_SNAPSHOT = "remote/snapshotPath";
constexpr auto KEY_REMOTE_LATENCY = "remote/latencyMs";
constexpr auto KEY_MAX_THREADS = "io/maxThreads";
} // namespace

Settings Settings::load(const QSettings &settings)
{
    const QDir dir(defaultDataDirectory());
    Settings result;
    result.storagePath = settings.value(QLatin1String(KEY_STORAGE_PATH),
                                        dir.filePath(QStringLiteral("tasks.ics"))).toString();
    result.remoteSnapshotPath = settings.value(QLatin1String(KEY_REMOTE_SNAPSHOT),
                                               dir.filePath(QStringLiteral("remote.json"))).toString();
    result.remoteLatencyMs = qMax(0, settings.value(QLatin1String(KEY_REMOTE_LATENCY), result.remoteLatencyMs).toInt());
    result.maxThreads = qMax(1, settings.value(QLatin1String(KEY_MAX_THREADS), result.maxThreads).toInt());
    return result;
}

void Settings::store(QSettings &settings) const
{
    settings.setValue(QLatin1String(KEY_STORAGE_PATH), storagePath);
    settings.setValue(QLatin1String(KEY_REMOTE_SNAPSHOT), remoteSnapshotPath);
    settings.setValue(QLatin1String(KEY_REMOTE_LATENCY), remoteLatencyMs);
    settings.setValue(QLatin1String(KEY_MAX_THREADS), maxThreads);
}

QString Settings::defaultDataDirectory()
{
    QString storageFolder = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (storageFolder.isEmpty()) {
        storageFolder = QDir::homePath() + QStringLiteral("/.local/share/tasksync");
    }
    return storageFolder;
}

} // namespace core
} // namespace tasksync
