#pragma once

#include <QString>

class QSettings;

namespace tasksync {
namespace core {

struct Settings
{
    QString storagePath;
    QString remoteSnapshotPath;
    int remoteLatencyMs = 150;
    int maxThreads = 4;

    static Settings load(const QSettings &settings);
    void store(QSettings &settings) const;

    static QString defaultDataDirectory();
};

} // namespace core
} // namespace tasksync
