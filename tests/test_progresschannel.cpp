#include <QtTest>
#include <QSignalSpy>
#include <QThread>

#include "services/progresschannel.h"

class TestProgressChannel : public QObject
{
    Q_OBJECT

private slots:
    void testDrainDeliversInOrder()
    {
        ProgressChannel channel;
        QSignalSpy progressSpy(&channel, &ProgressChannel::progress);
        QSignalSpy processingSpy(&channel, &ProgressChannel::processingStarted);

        channel.postProgress(10.0, "first");
        channel.postProgress(20.0, "second");
        channel.postProcessing("Processing / Converting...");

        channel.drain();

        QCOMPARE(progressSpy.count(), 2);
        QCOMPARE(progressSpy.at(0).at(0).toDouble(), 10.0);
        QCOMPARE(progressSpy.at(1).at(1).toString(), QString("second"));
        QCOMPARE(processingSpy.count(), 1);
        QCOMPARE(processingSpy.at(0).at(0).toString(), QString("Processing / Converting..."));
        QCOMPARE(channel.pendingCount(), 0);
    }

    void testPostSchedulesDrainOnEventLoop()
    {
        ProgressChannel channel;
        QSignalSpy spy(&channel, &ProgressChannel::progress);

        channel.postProgress(5.0, "x");
        QCOMPARE(spy.count(), 0);

        QTRY_COMPARE(spy.count(), 1);
    }

    void testTakeAllEmptiesQueue()
    {
        ProgressChannel channel;
        channel.postProgress(1.0, "a");
        channel.postProgress(2.0, "b");

        const QList<ProgressUpdate> updates = channel.takeAll();

        QCOMPARE(updates.size(), 2);
        QCOMPARE(updates.at(1).message, QString("b"));
        QVERIFY(channel.takeAll().isEmpty());
    }

    void testPostFromWorkerThread()
    {
        ProgressChannel channel;
        QSignalSpy spy(&channel, &ProgressChannel::progress);

        QThread *worker = QThread::create([&channel]() {
            for (int i = 0; i < 50; ++i) {
                channel.postProgress(i, QString::number(i));
            }
        });
        worker->start();
        QVERIFY(worker->wait(5000));
        delete worker;

        channel.drain();

        QCOMPARE(spy.count(), 50);
        for (int i = 0; i < 50; ++i) {
            QCOMPARE(spy.at(i).at(1).toString(), QString::number(i));
        }
    }
};

QTEST_MAIN(TestProgressChannel)
#include "test_progresschannel.moc"
