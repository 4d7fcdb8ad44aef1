#include <QtTest/QtTest>

#include "tasksync/data/TaskStatistics.hpp"

using namespace tasksync::data;

class TaskStatisticsTest : public QObject
{
    Q_OBJECT

private slots:
    void emptyListHasNoPercentages();
    void mixedList();
};

void TaskStatisticsTest::emptyListHasNoPercentages()
{
    const auto stats = computeStatistics({});
    QCOMPARE(stats.activeCount, 0);
    QCOMPARE(stats.completedCount, 0);
    QCOMPARE(stats.activePercent, 0.0f);
    QCOMPARE(stats.completedPercent, 0.0f);
}

void TaskStatisticsTest::mixedList()
{
    std::vector<Task> tasks(4);
    tasks[0].completed = true;

    const auto stats = computeStatistics(tasks);
    QCOMPARE(stats.activeCount, 3);
    QCOMPARE(stats.completedCount, 1);
    QCOMPARE(stats.activePercent, 75.0f);
    QCOMPARE(stats.completedPercent, 25.0f);
}

QTEST_GUILESS_MAIN(TaskStatisticsTest)
#include "TaskStatisticsTest.moc"
