#include <QSignalSpy>
#include <QtTest/QtTest>

#include "support/TestHelpers.hpp"
#include "tasksync/data/InMemoryTaskRepository.hpp"
#include "tasksync/source/FutureSupport.hpp"
#include "tasksync/source/LocalTaskDataSource.hpp"

using namespace tasksync;
using Kind = source::StoreError::Kind;

class LocalTaskDataSourceTest : public QObject
{
    Q_OBJECT

private slots:
    void saveAndRead();
    void getMissingFailsNotFound();
    void setCompletedUpdatesFlag();
    void deleteMissingTaskSucceeds();
    void deleteAllCompletedKeepsActive();
    void deleteAllClearsStore();
    void emptyIdIsRejected();
    void mutationsAnnounceChanges();
    void refreshIsNoOp();
};

void LocalTaskDataSourceTest::saveAndRead()
{
    data::InMemoryTaskRepository repository;
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.saveTask(testing::makeTask(QStringLiteral("1"), "A", false, "first")));
    source::waitFor(local.saveTask(testing::makeTask(QStringLiteral("1"), "A2", false, "second")));

    const auto tasks = source::waitFor(local.getTasks());
    QCOMPARE(tasks.size(), static_cast<std::size_t>(1));
    const auto task = source::waitFor(local.getTask(QStringLiteral("1")));
    QCOMPARE(task.title, QStringLiteral("A2"));
    QCOMPARE(task.description, QStringLiteral("second"));
}

void LocalTaskDataSourceTest::getMissingFailsNotFound()
{
    data::InMemoryTaskRepository repository;
    source::LocalTaskDataSource local(repository);

    const auto error = testing::errorKindOf([&]() {
        source::waitFor(local.getTask(QStringLiteral("missing")));
    });
    QVERIFY(error == Kind::NotFound);
}

void LocalTaskDataSourceTest::setCompletedUpdatesFlag()
{
    data::InMemoryTaskRepository repository;
    repository.upsertTask(testing::makeTask(QStringLiteral("1"), "A"));
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.setCompleted(QStringLiteral("1"), true));
    QVERIFY(repository.findById(QStringLiteral("1"))->completed);

    source::waitFor(local.setCompleted(testing::makeTask(QStringLiteral("1"), "ignored"), false));
    const auto task = repository.findById(QStringLiteral("1"));
    QVERIFY(!task->completed);
    QCOMPARE(task->title, QStringLiteral("A"));

    const auto error = testing::errorKindOf([&]() {
        source::waitFor(local.setCompleted(QStringLiteral("missing"), true));
    });
    QVERIFY(error == Kind::NotFound);
}

void LocalTaskDataSourceTest::deleteMissingTaskSucceeds()
{
    data::InMemoryTaskRepository repository;
    repository.upsertTask(testing::makeTask(QStringLiteral("1"), "A"));
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.deleteTask(QStringLiteral("missing")));
    source::waitFor(local.deleteTask(QStringLiteral("1")));

    QVERIFY(repository.fetchTasks().empty());
}

void LocalTaskDataSourceTest::deleteAllCompletedKeepsActive()
{
    data::InMemoryTaskRepository repository;
    repository.upsertTask(testing::makeTask(QStringLiteral("1"), "A", false));
    repository.upsertTask(testing::makeTask(QStringLiteral("2"), "B", true));
    repository.upsertTask(testing::makeTask(QStringLiteral("3"), "C", true));
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.deleteAllCompleted());

    QCOMPARE(testing::ids(repository.fetchTasks()), QStringList{QStringLiteral("1")});
}

void LocalTaskDataSourceTest::deleteAllClearsStore()
{
    data::InMemoryTaskRepository repository;
    repository.upsertTask(testing::makeTask(QStringLiteral("1"), "A"));
    repository.upsertTask(testing::makeTask(QStringLiteral("2"), "B", true));
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.deleteAll());

    QVERIFY(source::waitFor(local.getTasks()).empty());
}

void LocalTaskDataSourceTest::emptyIdIsRejected()
{
    data::InMemoryTaskRepository repository;
    source::LocalTaskDataSource local(repository);

    const auto saved = testing::errorKindOf([&]() {
        source::waitFor(local.saveTask(testing::makeTask(QString(), "A")));
    });
    const auto deleted = testing::errorKindOf([&]() {
        source::waitFor(local.deleteTask(QString()));
    });

    QVERIFY(saved == Kind::InvalidArgument);
    QVERIFY(deleted == Kind::InvalidArgument);
    QVERIFY(repository.fetchTasks().empty());
}

void LocalTaskDataSourceTest::mutationsAnnounceChanges()
{
    data::InMemoryTaskRepository repository;
    source::LocalTaskDataSource local(repository);
    QSignalSpy spy(&local, &source::LocalTaskDataSource::tasksChanged);

    source::waitFor(local.saveTask(testing::makeTask(QStringLiteral("1"), "A")));
    source::waitFor(local.setCompleted(QStringLiteral("1"), true));
    // Unchanged flag and unknown id do not count as changes.
    source::waitFor(local.setCompleted(QStringLiteral("1"), true));
    source::waitFor(local.deleteTask(QStringLiteral("missing")));
    source::waitFor(local.getTasks());
    source::waitFor(local.deleteAll());

    QCOMPARE(spy.count(), 3);
}

void LocalTaskDataSourceTest::refreshIsNoOp()
{
    data::InMemoryTaskRepository repository;
    repository.upsertTask(testing::makeTask(QStringLiteral("1"), "A"));
    source::LocalTaskDataSource local(repository);

    source::waitFor(local.refreshTasks());
    source::waitFor(local.refreshTask(QStringLiteral("1")));

    QCOMPARE(testing::ids(repository.fetchTasks()), QStringList{QStringLiteral("1")});
}

QTEST_GUILESS_MAIN(LocalTaskDataSourceTest)
#include "LocalTaskDataSourceTest.moc"
