/**
 * @file transfertask.h
 * @brief One transfer attempt: engine call, progress reporting and placement.
 */

#ifndef TRANSFERTASK_H
#define TRANSFERTASK_H

#include <QDateTime>
#include <QString>
#include <QStringList>
#include <atomic>
#include <memory>

#include "iretrievalengine.h"
#include "progressthrottle.h"
#include "transferconfig.h"

class ProgressChannel;
class QTemporaryDir;

/**
 * @brief Terminal result of a TransferTask.
 */
struct TransferOutcome {
    enum class Kind {
        Finished,         ///< Artifact(s) placed in the destination
        Failed,           ///< Engine reported an error
        Cancelled,        ///< Engine call unwound by a cancellation request
        PlacementFailed   ///< Engine succeeded but the artifact could not be placed
    };

    Kind kind = Kind::Failed;
    QString message;
    QStringList placedFiles;

    /// Set when cancel() arrived after the engine had already completed
    bool cancelRequested = false;
};

[[nodiscard]] inline const char *transferOutcomeToString(TransferOutcome::Kind kind)
{
    switch (kind) {
        case TransferOutcome::Kind::Finished: return "finished";
        case TransferOutcome::Kind::Failed: return "failed";
        case TransferOutcome::Kind::Cancelled: return "cancelled";
        case TransferOutcome::Kind::PlacementFailed: return "placement failed";
    }
    return "unknown";
}

/**
 * @brief Runs one transfer through the engine and places the result.
 *
 * run() blocks and is executed on a worker thread; it returns exactly one
 * TransferOutcome. cancel() may be called from any thread; the engine call
 * is unwound at its next progress hook invocation.
 *
 * Progress is posted to the ProgressChannel, never delivered directly, so
 * that the owner thread receives it in order and before the outcome.
 *
 * The scratch directory is owned by the task and removed when run()
 * returns, whatever the outcome.
 */
class TransferTask
{
public:
    static constexpr int ErrorExcerptLength = 100;
    static constexpr qint64 RecentFileToleranceMs = 2000;

    TransferTask(IRetrievalEngine *engine,
                 const QString &url,
                 const TransferConfig &config,
                 std::unique_ptr<QTemporaryDir> scratchDirectory,
                 ProgressChannel *channel);
    ~TransferTask();

    TransferTask(const TransferTask &) = delete;
    TransferTask &operator=(const TransferTask &) = delete;

    [[nodiscard]] TransferOutcome run();

    /// Requests cooperative cancellation (thread-safe, idempotent)
    void cancel() { cancelled_.store(true); }
    [[nodiscard]] bool isCancelled() const { return cancelled_.load(); }

    [[nodiscard]] const QString &url() const { return url_; }
    [[nodiscard]] const TransferConfig &config() const { return config_; }

    /**
     * @brief Formats the status line shown while bytes are flowing.
     * @return "Downloading: 1.0 MB / 4.0 MB | 2.0MiB/s | ETA: 00:02"
     */
    [[nodiscard]] static QString formatStatusLine(const ProgressEvent &event);

    /// Percentage of the effective total, 0 when the total is unknown
    [[nodiscard]] static double percentOf(const ProgressEvent &event);

private:
    HookAction onProgress(const ProgressEvent &event);
    TransferOutcome finishTransfer();
    void removeScratchDirectory();

    IRetrievalEngine *engine_;
    QString url_;
    TransferConfig config_;
    std::unique_ptr<QTemporaryDir> scratch_;
    ProgressChannel *channel_;

    std::atomic<bool> cancelled_{false};
    ProgressThrottle throttle_;
    bool processingPosted_ = false;
    QDateTime startedAt_;
};

#endif // TRANSFERTASK_H
