#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QString>
#include <QTextStream>

#include "version.h"

#include "tasksync/core/AppContext.hpp"
#include "tasksync/core/Logging.hpp"
#include "tasksync/data/TaskStatistics.hpp"
#include "tasksync/remote/SimulatedTaskService.hpp"
#include "tasksync/source/FutureSupport.hpp"
#include "tasksync/sync/TasksRepository.hpp"

using namespace tasksync;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

void printTask(const data::Task &task)
{
    out() << (task.completed ? "[x] " : "[ ] ") << task.id << "  " << task.title;
    if (!task.description.isEmpty()) {
        out() << " - " << task.description;
    }
    out() << '\n';
}

int report(const sync::WriteOutcome &outcome)
{
    if (outcome.succeeded()) {
        out() << QObject::tr("ok") << '\n';
        return 0;
    }
    err() << outcome.describe() << '\n';
    return 2;
}

int runCommand(sync::TasksRepository &repository, const QStringList &args, bool refresh)
{
    const QString command = args.value(0);
    const QString argument = args.value(1);

    if (command == QLatin1String("list")) {
        const auto tasks = source::waitFor(repository.getTasks(refresh));
        for (const auto &task : tasks) {
            printTask(task);
        }
        return 0;
    }
    if (command == QLatin1String("show")) {
        printTask(source::waitFor(repository.getTask(argument, refresh)));
        return 0;
    }
    if (command == QLatin1String("add")) {
        if (argument.isEmpty()) {
            err() << QObject::tr("add needs a title") << '\n';
            return 1;
        }
        data::Task task;
        task.title = argument;
        task.description = args.mid(2).join(' ');
        out() << task.id << '\n';
        return report(source::waitFor(repository.saveTask(task)));
    }
    if (command == QLatin1String("complete")) {
        return report(source::waitFor(repository.completeTask(argument)));
    }
    if (command == QLatin1String("activate")) {
        return report(source::waitFor(repository.activateTask(argument)));
    }
    if (command == QLatin1String("delete")) {
        return report(source::waitFor(repository.deleteTask(argument)));
    }
    if (command == QLatin1String("clear-completed")) {
        return report(source::waitFor(repository.clearCompletedTasks()));
    }
    if (command == QLatin1String("delete-all")) {
        return report(source::waitFor(repository.deleteAllTasks()));
    }
    if (command == QLatin1String("refresh")) {
        source::waitFor(repository.refreshTasks());
        out() << QObject::tr("ok") << '\n';
        return 0;
    }
    if (command == QLatin1String("stats")) {
        const auto stats = data::computeStatistics(source::waitFor(repository.getTasks(refresh)));
        out() << QObject::tr("active: %1 (%2%)").arg(stats.activeCount).arg(stats.activePercent, 0, 'f', 1) << '\n';
        out() << QObject::tr("completed: %1 (%2%)").arg(stats.completedCount).arg(stats.completedPercent, 0, 'f', 1) << '\n';
        return 0;
    }

    err() << QObject::tr("unknown command: %1").arg(command) << '\n';
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("tasksync"));
    QCoreApplication::setApplicationName(QStringLiteral("tasksync"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTaskSyncVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Task list kept in sync between a backend and a local cache."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QObject::tr("list | show <id> | add <title> [description] | complete <id> | "
                                             "activate <id> | delete <id> | clear-completed | delete-all | "
                                             "refresh | stats"));

    const QCommandLineOption refreshOption({QStringLiteral("r"), QStringLiteral("refresh")},
                                           QObject::tr("Resync from the backend before reading."));
    const QCommandLineOption storageOption(QStringLiteral("storage"),
                                           QObject::tr("Local cache file."), QStringLiteral("path"));
    const QCommandLineOption backendOption(QStringLiteral("backend"),
                                           QObject::tr("Backend snapshot file."), QStringLiteral("path"));
    const QCommandLineOption latencyOption(QStringLiteral("latency"),
                                           QObject::tr("Simulated backend latency."), QStringLiteral("ms"));
    const QCommandLineOption offlineOption(QStringLiteral("offline"),
                                           QObject::tr("Treat the backend as unreachable."));
    parser.addOptions({refreshOption, storageOption, backendOption, latencyOption, offlineOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    QSettings stored;
    auto settings = core::Settings::load(stored);
    if (parser.isSet(storageOption)) {
        settings.storagePath = parser.value(storageOption);
    }
    if (parser.isSet(backendOption)) {
        settings.remoteSnapshotPath = parser.value(backendOption);
    }
    if (parser.isSet(latencyOption)) {
        settings.remoteLatencyMs = qMax(0, parser.value(latencyOption).toInt());
    }

    core::AppContext context(settings);
    if (parser.isSet(offlineOption)) {
        context.remoteService().setAvailable(false);
    }

    try {
        return runCommand(context.tasksRepository(), args, parser.isSet(refreshOption));
    } catch (const source::StoreError &error) {
        qCWarning(core::lcApp) << error;
        err() << error.what() << '\n';
        return 1;
    }
}
