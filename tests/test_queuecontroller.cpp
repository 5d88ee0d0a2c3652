#include <QtTest>
#include <QDir>
#include <QFile>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "mocks/mockretrievalengine.h"
#include "models/queuemanager.h"
#include "services/queuecontroller.h"
#include "services/settingsmanager.h"

class TestQueueController : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;
    QueueManager *queue_ = nullptr;
    MockRetrievalEngine *engine_ = nullptr;
    SettingsManager *settings_ = nullptr;
    QueueController *controller_ = nullptr;

    QString destination() const { return tempDir_->filePath("out"); }

    static QString urlFor(int n) { return QString("https://example.com/watch?v=%1").arg(n); }

    void enqueue(int count)
    {
        for (int i = 1; i <= count; ++i) {
            engine_->mockSetOutputFile(urlFor(i), QString("clip%1.mp4").arg(i), "video");
            queue_->add(urlFor(i), QueueItem::Mode::Video);
        }
    }

    QueueItem::Status statusAt(int index) const
    {
        return queue_->item(index)->status;
    }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
        queue_ = new QueueManager();
        engine_ = new MockRetrievalEngine();
        settings_ = new SettingsManager(tempDir_->filePath("settings.ini"));
        controller_ = new QueueController(queue_, engine_, settings_);
        controller_->setDestinationFolder(destination());
    }

    void cleanup()
    {
        engine_->mockReleaseInfo();
        delete controller_;
        delete settings_;
        delete engine_;
        delete queue_;
        delete tempDir_;
        controller_ = nullptr;
        settings_ = nullptr;
        engine_ = nullptr;
        queue_ = nullptr;
        tempDir_ = nullptr;
    }

    // === Starting ===

    void testStartEmptyQueue()
    {
        QSignalSpy statusSpy(controller_, &QueueController::statusMessage);

        QVERIFY(!controller_->startQueue());
        QCOMPARE(statusSpy.count(), 1);
        QCOMPARE(statusSpy.at(0).at(0).toString(), QString("Queue is empty."));
        QVERIFY(!controller_->isQueueRunning());
    }

    void testStartTwiceRejected()
    {
        enqueue(1);

        QVERIFY(controller_->startQueue());
        QVERIFY(!controller_->startQueue());
        QVERIFY(!controller_->startSingleDownload(urlFor(9), QueueItem::Mode::Video));

        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);
        QTRY_COMPARE(finishedSpy.count(), 1);
    }

    // === Whole runs ===

    void testAllItemsFinish()
    {
        enqueue(3);
        QSignalSpy startedSpy(controller_, &QueueController::itemStarted);
        QSignalSpy itemSpy(controller_, &QueueController::itemFinished);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 3);
        QCOMPARE(finishedSpy.at(0).at(1).toInt(), 0);
        QCOMPARE(finishedSpy.at(0).at(2).toInt(), 0);
        QCOMPARE(startedSpy.count(), 3);
        QCOMPARE(itemSpy.count(), 3);
        QCOMPARE(queue_->countPending(), 0);
        QCOMPARE(queue_->countWithStatus(QueueItem::Status::Finished), 3);
        QCOMPARE(engine_->mockGetDownloadRequests(), (QStringList{urlFor(1), urlFor(2), urlFor(3)}));

        for (int i = 0; i < 3; ++i) {
            QCOMPARE(queue_->item(i)->progress, 100.0);
            QCOMPARE(queue_->item(i)->title, QString("Title of %1").arg(urlFor(i + 1)));
        }
        QVERIFY(QFile::exists(QDir(destination()).filePath("clip1.mp4")));
        QVERIFY(QFile::exists(QDir(destination()).filePath("clip3.mp4")));
        QVERIFY(!controller_->isActive());
        QVERIFY(!controller_->isQueueRunning());
    }

    void testMiddleItemCancelledMidFlight()
    {
        enqueue(3);
        engine_->mockSetBlockUntilAbort(urlFor(2), true);
        QSignalSpy cancelledSpy(controller_, &QueueController::itemCancelled);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockGetDownloadRequests().size() == 2 && engine_->mockIsDownloadRunning());
        QCOMPARE(controller_->state(), QueueController::State::Transferring);

        QVERIFY(controller_->cancelCurrent());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Finished);
        QCOMPARE(statusAt(1), QueueItem::Status::Cancelled);
        QCOMPARE(statusAt(2), QueueItem::Status::Finished);
        QCOMPARE(cancelledSpy.count(), 1);
        QCOMPARE(cancelledSpy.at(0).at(0).toInt(), 1);
        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 2);
        QCOMPARE(finishedSpy.at(0).at(2).toInt(), 1);
    }

    void testMetadataErrorSkipsTransfer()
    {
        enqueue(2);
        engine_->mockSetInfoError(urlFor(1), "ERROR: Video unavailable");
        QSignalSpy failedSpy(controller_, &QueueController::itemFailed);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Error);
        QCOMPARE(queue_->item(0)->errorMessage, QString("ERROR: Video unavailable"));
        QCOMPARE(statusAt(1), QueueItem::Status::Finished);
        QCOMPARE(engine_->mockGetDownloadRequests(), QStringList{urlFor(2)});
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(controller_->errorHandler()->count(ErrorCategory::Metadata), 1);
    }

    void testErrorCountsResetPerRun()
    {
        enqueue(1);
        engine_->mockSetInfoError(urlFor(1), "ERROR: Video unavailable");
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);
        QCOMPARE(controller_->errorHandler()->totalCount(), 1);

        engine_->mockSetOutputFile(urlFor(2), "clip2.mp4", "video");
        queue_->add(urlFor(2), QueueItem::Mode::Video);
        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 2);

        QCOMPARE(statusAt(1), QueueItem::Status::Finished);
        QCOMPARE(controller_->errorHandler()->totalCount(), 0);
    }

    void testTransferErrorRecorded()
    {
        enqueue(1);
        engine_->mockSetDownloadError(urlFor(1), "HTTP Error 403: Forbidden");
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Error);
        QCOMPARE(queue_->item(0)->errorMessage, QString("Error: HTTP Error 403: Forbidden..."));
        QCOMPARE(finishedSpy.at(0).at(1).toInt(), 1);
        QCOMPARE(controller_->errorHandler()->count(ErrorCategory::Transfer), 1);
    }

    void testPlacementErrorRecorded()
    {
        queue_->add(urlFor(1), QueueItem::Mode::Video);
        engine_->mockSetOutputFile(urlFor(1), "nested/clip.mp4", "video");
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Error);
        QCOMPARE(queue_->item(0)->errorMessage, QString("Error: File not found."));
        QCOMPARE(controller_->errorHandler()->count(ErrorCategory::Placement), 1);
    }

    // === Cancellation ===

    void testCancelBeforeFirstItemStarts()
    {
        enqueue(2);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QVERIFY(controller_->cancelCurrent());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Cancelled);
        QCOMPARE(queue_->item(0)->errorMessage, QString("Cancelled by user"));
        QCOMPARE(statusAt(1), QueueItem::Status::Finished);
        QCOMPARE(engine_->mockGetInfoRequests(), QStringList{urlFor(2)});
    }

    void testCancelDuringMetadataFetch()
    {
        enqueue(1);
        engine_->mockHoldInfo(true);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockIsInfoWaiting());
        QCOMPARE(controller_->state(), QueueController::State::FetchingMetadata);

        QVERIFY(controller_->cancelCurrent());
        engine_->mockReleaseInfo();
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Cancelled);
        QCOMPARE(engine_->mockDownloadCount(), 0);
    }

    void testCancelAllMarksEverything()
    {
        enqueue(3);
        engine_->mockSetBlockUntilAbort(urlFor(1), true);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockIsDownloadRunning());

        controller_->cancelAll();
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(queue_->countWithStatus(QueueItem::Status::Cancelled), 3);
        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);
        QCOMPARE(finishedSpy.at(0).at(2).toInt(), 3);
        QCOMPARE(engine_->mockDownloadCount(), 1);
    }

    void testBulkCancelOverridesLateSuccess()
    {
        enqueue(2);
        engine_->mockSetIgnoreAbort(urlFor(1), true);

        // Bulk cancel arrives after the engine started but is never seen by it
        QueueController *controller = controller_;
        engine_->mockSetOnDownloadStarted([controller](const QString &) {
            QMetaObject::invokeMethod(controller, [controller]() { controller->cancelAll(); },
                                      Qt::BlockingQueuedConnection);
        });
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Cancelled);
        QCOMPARE(statusAt(1), QueueItem::Status::Cancelled);
        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);
        QCOMPARE(finishedSpy.at(0).at(2).toInt(), 2);
    }

    void testLateCancelDuringQueueCountsAsCancelled()
    {
        enqueue(2);
        engine_->mockSetIgnoreAbort(urlFor(1), true);

        QueueController *controller = controller_;
        const QString firstUrl = urlFor(1);
        engine_->mockSetOnDownloadStarted([controller, firstUrl](const QString &url) {
            if (url == firstUrl) {
                QMetaObject::invokeMethod(controller, [controller]() { controller->cancelCurrent(); },
                                          Qt::BlockingQueuedConnection);
            }
        });
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(statusAt(0), QueueItem::Status::Cancelled);
        QCOMPARE(statusAt(1), QueueItem::Status::Finished);
        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 1);
        QCOMPARE(finishedSpy.at(0).at(2).toInt(), 1);
    }

    void testCancelWhenIdleReturnsFalse()
    {
        QVERIFY(!controller_->cancelCurrent());
        controller_->cancelAll();
        QCOMPARE(controller_->state(), QueueController::State::Idle);
    }

    // === Queue changes while running ===

    void testAddWhileProcessing()
    {
        enqueue(1);
        engine_->mockHoldInfo(true);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockIsInfoWaiting());

        engine_->mockSetOutputFile(urlFor(2), "clip2.mp4", "video");
        queue_->add(urlFor(2), QueueItem::Mode::Video);
        engine_->mockReleaseInfo();
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(finishedSpy.at(0).at(0).toInt(), 2);
        QCOMPARE(queue_->countWithStatus(QueueItem::Status::Finished), 2);
    }

    void testEarlierItemRemovedWhileProcessing()
    {
        queue_->add(urlFor(0), QueueItem::Mode::Video);
        QVERIFY(queue_->updateStatus(0, QueueItem::Status::Downloading));
        QVERIFY(queue_->updateStatus(0, QueueItem::Status::Finished));
        enqueue(1);
        engine_->mockHoldInfo(true);
        QSignalSpy itemSpy(controller_, &QueueController::itemFinished);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockIsInfoWaiting());

        QVERIFY(queue_->remove(0));
        engine_->mockReleaseInfo();
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(queue_->size(), 1);
        QCOMPARE(statusAt(0), QueueItem::Status::Finished);
        QCOMPARE(itemSpy.at(0).at(0).toInt(), 0);
    }

    void testProgressForwarded()
    {
        enqueue(1);
        engine_->mockSetProgressEvents(urlFor(1), {
            MockRetrievalEngine::downloading(0, 100),
            MockRetrievalEngine::downloading(50, 100),
            MockRetrievalEngine::finished(),
        });
        QSignalSpy progressSpy(controller_, &QueueController::progress);
        QSignalSpy processingSpy(controller_, &QueueController::processingStarted);
        QSignalSpy itemSpy(controller_, &QueueController::itemFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(itemSpy.count(), 1);

        // Processing is reported once, not as a progress line as well
        QCOMPARE(progressSpy.count(), 2);
        QCOMPARE(progressSpy.at(1).at(1).toDouble(), 50.0);
        QCOMPARE(processingSpy.count(), 1);
        QCOMPARE(processingSpy.at(0).at(0).toInt(), 0);
        QCOMPARE(processingSpy.at(0).at(1).toString(), QString("Processing / Converting..."));
        QCOMPARE(queue_->item(0)->progress, 100.0);
    }

    void testClearQueueDuringTransfer()
    {
        enqueue(2);
        engine_->mockSetBlockUntilAbort(urlFor(1), true);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_VERIFY(engine_->mockIsDownloadRunning());

        controller_->clearQueue();
        QVERIFY(queue_->isEmpty());
        QTRY_COMPARE(controller_->state(), QueueController::State::Idle);

        QVERIFY(!controller_->isQueueRunning());
        QCOMPARE(finishedSpy.count(), 0);
        QCOMPARE(engine_->mockDownloadCount(), 1);
    }

    // === Single downloads ===

    void testSingleAudioDownload()
    {
        QSignalSpy doneSpy(controller_, &QueueController::singleDownloadFinished);
        QSignalSpy startedSpy(controller_, &QueueController::itemStarted);

        QVERIFY(controller_->startSingleDownload(urlFor(7), QueueItem::Mode::Audio,
                                                 {{QueueOptions::AudioFormat, "mp3"},
                                                  {QueueOptions::AudioBitrate, "192"}}));
        QTRY_COMPARE(doneSpy.count(), 1);

        QCOMPARE(doneSpy.at(0).at(0).toString(), QString("DONE! File saved."));
        QCOMPARE(startedSpy.at(0).at(0).toInt(), -1);
        QVERIFY(QFile::exists(QDir(destination()).filePath("media [mp3 192kbps].mp3")));
        QVERIFY(queue_->isEmpty());
        QCOMPARE(controller_->state(), QueueController::State::Idle);
    }

    void testSingleDownloadFailure()
    {
        engine_->mockSetInfoError(urlFor(8), "ERROR: Unsupported URL");
        QSignalSpy failSpy(controller_, &QueueController::singleDownloadFailed);

        QVERIFY(controller_->startSingleDownload(urlFor(8), QueueItem::Mode::Video));
        QTRY_COMPARE(failSpy.count(), 1);

        QCOMPARE(failSpy.at(0).at(0).toString(), QString("ERROR: Unsupported URL"));
    }

    void testSingleDownloadRejectsEmptyUrl()
    {
        QVERIFY(!controller_->startSingleDownload("  ", QueueItem::Mode::Video));
    }

    // === Settings ===

    void testDestinationFallsBackToSettings()
    {
        QueueController controller(queue_, engine_, settings_);
        settings_->setDefaultFolder(tempDir_->filePath("music"));

        QCOMPARE(controller.destinationFolder(), tempDir_->filePath("music"));
    }

    void testRateLimitOverrideReachesEngine()
    {
        enqueue(1);
        settings_->setSpeedLimitKb(10);
        controller_->setRateLimitOverride(20);
        QSignalSpy finishedSpy(controller_, &QueueController::queueFinished);

        QVERIFY(controller_->startQueue());
        QTRY_COMPARE(finishedSpy.count(), 1);

        QCOMPARE(engine_->mockGetLastConfig().rateLimitBytesPerSecond, qint64(20 * 1024));
    }
};

QTEST_MAIN(TestQueueController)
#include "test_queuecontroller.moc"
