/**
 * @file queuecontroller.h
 * @brief Drives queued downloads through metadata fetch and transfer.
 */

#ifndef QUEUECONTROLLER_H
#define QUEUECONTROLLER_H

#include <QFutureWatcher>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QVariantMap>
#include <memory>

#include "errorhandler.h"
#include "metadatatask.h"
#include "models/queueitem.h"
#include "transfertask.h"

class IRetrievalEngine;
class ProgressChannel;
class QueueManager;
class SettingsManager;

/**
 * @brief Counters reported when a queue run ends.
 */
struct QueueSummary {
    int finished = 0;
    int failed = 0;
    int cancelled = 0;
};

/**
 * @brief Runs queue items one at a time through the two-phase pipeline.
 *
 * For every item the controller marks it Downloading, fetches its metadata
 * on a worker thread, builds a fresh TransferConfig, runs the TransferTask
 * on a worker thread and routes the outcome back into the QueueManager.
 * At most one metadata fetch or transfer is in flight at any time.
 *
 * All public methods and all signals live on the thread that owns the
 * controller. Workers report progress through a ProgressChannel that is
 * drained on this thread before the worker's outcome is handled.
 *
 * The active item is tracked by its id, not its position, so items added
 * or removed while it runs do not affect it.
 *
 * @par Example usage:
 * @code
 * QueueManager queue;
 * YtDlpEngine engine;
 * SettingsManager settings(SettingsManager::defaultSettingsPath());
 * QueueController controller(&queue, &engine, &settings);
 *
 * connect(&controller, &QueueController::queueFinished,
 *         &app, &QCoreApplication::quit);
 *
 * queue.add(url, QueueItem::Mode::Audio);
 * controller.startQueue();
 * @endcode
 */
class QueueController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        FetchingMetadata,
        Transferring
    };
    Q_ENUM(State)

    QueueController(QueueManager *queue,
                    IRetrievalEngine *engine,
                    SettingsManager *settings,
                    QObject *parent = nullptr);

    /**
     * @brief Cancels the active work and waits for the worker to return.
     */
    ~QueueController() override;

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isActive() const { return state_ != State::Idle; }
    [[nodiscard]] bool isQueueRunning() const { return queueRunning_; }
    [[nodiscard]] QueueSummary summary() const { return summary_; }
    [[nodiscard]] ErrorHandler *errorHandler() const { return errorHandler_; }

    /// Folder finished files are placed in; defaults to the settings value
    [[nodiscard]] QString destinationFolder() const;
    void setDestinationFolder(const QString &folder);

    /// Speed limit in KB/s used instead of the settings value; negative restores it
    void setRateLimitOverride(int kilobytesPerSecond) { rateLimitOverrideKb_ = kilobytesPerSecond; }

    /**
     * @brief Starts processing pending items.
     * @return False if work is already in flight or nothing is pending.
     */
    bool startQueue();

    /**
     * @brief Downloads one URL that is not part of the queue.
     *
     * The outcome is reported through singleDownloadFinished() or
     * singleDownloadFailed().
     *
     * @return False if work is already in flight or @p url is empty.
     */
    bool startSingleDownload(const QString &url,
                             QueueItem::Mode mode,
                             const QVariantMap &options = QVariantMap());

    /**
     * @brief Cancels the active item.
     *
     * During a transfer the request is forwarded to the task. During a
     * metadata fetch the transfer is not started once the fetch returns.
     * Between two queue items the next item is cancelled without contacting
     * the engine.
     *
     * @return False if there was nothing to cancel.
     */
    bool cancelCurrent();

    /// Cancels every pending item and the active one
    void cancelAll();

    /// Cancels the active item and removes everything from the queue
    void clearQueue();

signals:
    void stateChanged(QueueController::State state);

    void itemStarted(int index, const QString &url);
    void progress(int index, double percent, const QString &message);
    void processingStarted(int index, const QString &message);
    void itemFinished(int index, const QString &message);
    void itemFailed(int index, const QString &message);
    void itemCancelled(int index, const QString &message);

    void queueFinished(int finished, int failed, int cancelled);

    void singleDownloadFinished(const QString &message);
    void singleDownloadFailed(const QString &message);

    void statusMessage(const QString &message, int timeout);

private slots:
    void processNext();
    void onMetadataFinished();
    void onTransferFinished();
    void onChannelProgress(double percent, const QString &message);
    void onChannelProcessing(const QString &message);

private:
    struct ActiveJob {
        bool valid = false;
        bool single = false;
        QueueItem item;
    };

    void setState(State state);
    void scheduleNext();
    void startMetadata();
    void startTransfer(const MediaInfo &info);
    void finishQueue();
    void completeActive();

    /// Current index of the active queue item, -1 for single downloads or removed items
    [[nodiscard]] int activeIndex() const;

    void markFinished(const QString &message);
    void markFailed(ErrorCategory category, const QString &message);
    void markCancelled(const QString &message);

    QueueManager *queue_;
    IRetrievalEngine *engine_;
    QPointer<SettingsManager> settings_;
    ErrorHandler *errorHandler_;
    ProgressChannel *channel_;

    QFutureWatcher<MetadataResult> metadataWatcher_;
    QFutureWatcher<TransferOutcome> transferWatcher_;
    std::shared_ptr<TransferTask> task_;

    State state_ = State::Idle;
    ActiveJob active_;
    QueueSummary summary_;
    QString destinationOverride_;
    int rateLimitOverrideKb_ = -1;

    bool queueRunning_ = false;
    bool nextScheduled_ = false;
    bool cancelRequested_ = false;
    bool bulkCancelRequested_ = false;
};

#endif // QUEUECONTROLLER_H
