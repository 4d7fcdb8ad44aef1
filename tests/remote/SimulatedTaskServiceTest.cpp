#include <QTemporaryDir>
#include <QtTest/QtTest>

#include <atomic>

#include "support/TestHelpers.hpp"
#include "tasksync/remote/SimulatedTaskService.hpp"

using namespace tasksync;
using remote::RemoteFailure;

class SimulatedTaskServiceTest : public QObject
{
    Q_OBJECT

private slots:
    void setMergesOrReplaces();
    void updateMissingDocumentFails();
    void removeIsIdempotent();
    void snapshotSurvivesRestart();
    void latencyDeliversFromWorker();
};

void SimulatedTaskServiceTest::setMergesOrReplaces()
{
    remote::SimulatedTaskService service;
    service.putDocument(QStringLiteral("1"), QVariantMap{{QStringLiteral("title"), QStringLiteral("A")},
                                                         {QStringLiteral("extra"), 1}});

    bool done = false;
    service.set(QStringLiteral("1"), QVariantMap{{QStringLiteral("completed"), true}}, true,
                [&done]() { done = true; }, [](const RemoteFailure &) { QFAIL("merge failed"); });
    QVERIFY(done);
    auto document = testing::findDocument(service.documents(), QStringLiteral("1"));
    QCOMPARE(document->value(QStringLiteral("title")).toString(), QStringLiteral("A"));
    QVERIFY(document->value(QStringLiteral("completed")).toBool());

    service.set(QStringLiteral("1"), QVariantMap{{QStringLiteral("title"), QStringLiteral("B")}}, false,
                []() {}, [](const RemoteFailure &) { QFAIL("replace failed"); });
    document = testing::findDocument(service.documents(), QStringLiteral("1"));
    QCOMPARE(document->size(), 1);
    QCOMPARE(document->value(QStringLiteral("title")).toString(), QStringLiteral("B"));
}

void SimulatedTaskServiceTest::updateMissingDocumentFails()
{
    remote::SimulatedTaskService service;
    std::optional<RemoteFailure> failure;

    service.update(QStringLiteral("nope"), QStringLiteral("completed"), true,
                   []() {}, [&failure](const RemoteFailure &f) { failure = f; });

    QVERIFY(failure.has_value());
    QVERIFY(failure->code == RemoteFailure::Code::NotFound);
    QVERIFY(service.documents().isEmpty());
}

void SimulatedTaskServiceTest::removeIsIdempotent()
{
    remote::SimulatedTaskService service;
    int successes = 0;

    service.remove(QStringLiteral("nope"), [&successes]() { ++successes; },
                   [](const RemoteFailure &) { QFAIL("remove failed"); });

    QCOMPARE(successes, 1);
    QCOMPARE(service.requestCount(), 1);
}

void SimulatedTaskServiceTest::snapshotSurvivesRestart()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("backend/remote.json"));

    {
        remote::SimulatedTaskService service(0, path);
        service.putDocument(QStringLiteral("1"), testing::makeTask(QStringLiteral("1"), "Kept", true).toFields());
        service.set(QStringLiteral("2"), testing::makeTask(QStringLiteral("2"), "Added").toFields(), true,
                    []() {}, [](const RemoteFailure &) { QFAIL("set failed"); });
    }

    remote::SimulatedTaskService reloaded(0, path);
    const auto documents = reloaded.documents();
    QCOMPARE(testing::ids(documents), (QStringList{QStringLiteral("1"), QStringLiteral("2")}));
    const auto task = data::Task::fromFields(QStringLiteral("1"), *testing::findDocument(documents, QStringLiteral("1")));
    QCOMPARE(task.title, QStringLiteral("Kept"));
    QVERIFY(task.completed);
}

void SimulatedTaskServiceTest::latencyDeliversFromWorker()
{
    remote::SimulatedTaskService service(20);
    service.putDocument(QStringLiteral("1"), testing::makeTask(QStringLiteral("1"), "A").toFields());
    std::atomic<int> received{0};
    std::atomic<bool> otherThread{false};
    QThread *caller = QThread::currentThread();

    service.fetchAll(
        [&](const QVector<remote::RemoteDocument> &documents) {
            received = documents.size();
            otherThread = QThread::currentThread() != caller;
        },
        [](const RemoteFailure &) {});
    QCOMPARE(received.load(), 0);

    service.waitForIdle();
    QCOMPARE(received.load(), 1);
    QVERIFY(otherThread.load());
}

QTEST_GUILESS_MAIN(SimulatedTaskServiceTest)
#include "SimulatedTaskServiceTest.moc"
