#include <QtTest/QtTest>

#include "tasksync/sync/WriteOutcome.hpp"

using namespace tasksync;
using source::StoreError;
using Status = sync::WriteOutcome::Status;

class WriteOutcomeTest : public QObject
{
    Q_OBJECT

private slots:
    void classifiesEachCombination();
    void describesFailingSides();
};

void WriteOutcomeTest::classifiesEachCombination()
{
    const auto remoteDown = StoreError::unavailable(QStringLiteral("offline"));
    const auto localMissing = StoreError::notFound(QStringLiteral("7"));

    QVERIFY(sync::WriteOutcome().status() == Status::Succeeded);
    QVERIFY(sync::WriteOutcome(std::nullopt, std::nullopt).succeeded());

    const sync::WriteOutcome remoteOnly(remoteDown, std::nullopt);
    QVERIFY(remoteOnly.status() == Status::RemoteFailed);
    QVERIFY(!remoteOnly.remoteSucceeded());
    QVERIFY(remoteOnly.localSucceeded());

    const sync::WriteOutcome localOnly(std::nullopt, localMissing);
    QVERIFY(localOnly.status() == Status::LocalFailed);
    QVERIFY(localOnly.localError()->kind() == StoreError::Kind::NotFound);

    const sync::WriteOutcome both(remoteDown, localMissing);
    QVERIFY(both.status() == Status::BothFailed);
    QVERIFY(!both.succeeded());
}

void WriteOutcomeTest::describesFailingSides()
{
    const sync::WriteOutcome both(StoreError::unavailable(QStringLiteral("offline")),
                                  StoreError::unavailable(QStringLiteral("disk full")));
    const QString text = both.describe();
    QVERIFY(text.contains(QStringLiteral("offline")));
    QVERIFY(text.contains(QStringLiteral("disk full")));
    QCOMPARE(QString::fromUtf8(both.remoteError()->what()), QStringLiteral("Unavailable: offline"));
}

QTEST_GUILESS_MAIN(WriteOutcomeTest)
#include "WriteOutcomeTest.moc"
