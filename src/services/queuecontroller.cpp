#include "queuecontroller.h"
#include "iretrievalengine.h"
#include "models/queuemanager.h"
#include "progresschannel.h"
#include "settingsmanager.h"
#include "toollocation.h"
#include "transferconfigbuilder.h"
#include "utils/logging.h"

#include <QDir>
#include <QTemporaryDir>
#include <QTimer>
#include <QtConcurrent/QtConcurrent>

QueueController::QueueController(QueueManager *queue,
                                 IRetrievalEngine *engine,
                                 SettingsManager *settings,
                                 QObject *parent)
    : QObject(parent)
    , queue_(queue)
    , engine_(engine)
    , settings_(settings)
    , errorHandler_(new ErrorHandler(this))
    , channel_(new ProgressChannel(this))
{
    connect(&metadataWatcher_, &QFutureWatcher<MetadataResult>::finished,
            this, &QueueController::onMetadataFinished);
    connect(&transferWatcher_, &QFutureWatcher<TransferOutcome>::finished,
            this, &QueueController::onTransferFinished);

    connect(channel_, &ProgressChannel::progress,
            this, &QueueController::onChannelProgress);
    connect(channel_, &ProgressChannel::processingStarted,
            this, &QueueController::onChannelProcessing);

    connect(errorHandler_, &ErrorHandler::statusMessage,
            this, &QueueController::statusMessage);
}

QueueController::~QueueController()
{
    metadataWatcher_.disconnect(this);
    transferWatcher_.disconnect(this);

    if (task_) {
        task_->cancel();
    }
    // The metadata call cannot be interrupted; it is bounded by the engine's socket timeout
    metadataWatcher_.waitForFinished();
    transferWatcher_.waitForFinished();
}

QString QueueController::destinationFolder() const
{
    if (!destinationOverride_.isEmpty()) {
        return destinationOverride_;
    }
    if (settings_) {
        return settings_->defaultFolder();
    }
    return QDir(QDir::homePath()).filePath(QStringLiteral("Downloads"));
}

void QueueController::setDestinationFolder(const QString &folder)
{
    destinationOverride_ = folder;
}

bool QueueController::startQueue()
{
    if (isActive() || queueRunning_) {
        LOG_VERBOSE() << "QueueController: Already processing";
        return false;
    }
    if (queue_->countPending() == 0) {
        emit statusMessage(tr("Queue is empty."), 3000);
        return false;
    }

    qInfo() << "QueueController: Starting queue with" << queue_->countPending() << "pending items";

    summary_ = QueueSummary();
    errorHandler_->resetCounts();
    queueRunning_ = true;
    cancelRequested_ = false;
    bulkCancelRequested_ = false;
    scheduleNext();
    return true;
}

bool QueueController::startSingleDownload(const QString &url,
                                          QueueItem::Mode mode,
                                          const QVariantMap &options)
{
    const QString trimmed = url.trimmed();
    if (trimmed.isEmpty() || isActive() || queueRunning_) {
        return false;
    }

    active_ = ActiveJob();
    active_.valid = true;
    active_.single = true;
    active_.item.url = trimmed;
    active_.item.title = trimmed;
    active_.item.mode = mode;
    active_.item.options = options;
    active_.item.status = QueueItem::Status::Downloading;
    cancelRequested_ = false;
    bulkCancelRequested_ = false;

    qInfo() << "QueueController: Single download" << trimmed << queueModeToString(mode);
    emit itemStarted(-1, trimmed);
    startMetadata();
    return true;
}

bool QueueController::cancelCurrent()
{
    switch (state_) {
    case State::Transferring:
        cancelRequested_ = true;
        if (task_) {
            task_->cancel();
        }
        emit statusMessage(tr("Cancelling..."), 3000);
        return true;
    case State::FetchingMetadata:
        cancelRequested_ = true;
        emit statusMessage(tr("Cancelling..."), 3000);
        return true;
    case State::Idle:
        if (queueRunning_) {
            cancelRequested_ = true;
            return true;
        }
        return false;
    }
    return false;
}

void QueueController::cancelAll()
{
    bulkCancelRequested_ = true;
    const int cancelled = queue_->cancelAllPending();
    if (queueRunning_) {
        summary_.cancelled += cancelled;
    }
    LOG_VERBOSE() << "QueueController: Cancelled" << cancelled << "pending items";

    if (!cancelCurrent()) {
        bulkCancelRequested_ = false;
    }
}

void QueueController::clearQueue()
{
    cancelCurrent();
    queueRunning_ = false;
    queue_->clearAll();
}

void QueueController::setState(State state)
{
    if (state_ == state) {
        return;
    }
    state_ = state;
    emit stateChanged(state_);
}

void QueueController::scheduleNext()
{
    if (nextScheduled_) {
        return;
    }
    nextScheduled_ = true;
    QTimer::singleShot(0, this, &QueueController::processNext);
}

void QueueController::processNext()
{
    nextScheduled_ = false;
    if (isActive() || !queueRunning_) {
        return;
    }

    const std::optional<QueueManager::PendingEntry> next = queue_->nextPending();
    if (!next) {
        finishQueue();
        return;
    }

    active_ = ActiveJob();
    active_.valid = true;
    active_.single = false;
    active_.item = next->item;

    if (cancelRequested_) {
        // Cancelled between items: never reaches the engine
        markCancelled(tr("Cancelled by user"));
        completeActive();
        return;
    }

    queue_->updateStatus(next->index, QueueItem::Status::Downloading);
    queue_->updateProgress(next->index, 0.0);

    qInfo() << "QueueController: Processing" << active_.item.url
            << "(" << queue_->countPending() << "more pending )";
    emit itemStarted(next->index, active_.item.url);
    startMetadata();
}

void QueueController::startMetadata()
{
    setState(State::FetchingMetadata);
    emit statusMessage(tr("Fetching info..."), 0);

    const MetadataTask task(engine_, active_.item.url);
    metadataWatcher_.setFuture(QtConcurrent::run([task]() { return task.run(); }));
}

void QueueController::onMetadataFinished()
{
    if (state_ != State::FetchingMetadata || !active_.valid) {
        return;
    }

    const MetadataResult result = metadataWatcher_.result();

    if (cancelRequested_) {
        markCancelled(tr("Cancelled by user"));
        completeActive();
        return;
    }

    if (!result.success) {
        markFailed(ErrorCategory::Metadata, result.errorMessage);
        completeActive();
        return;
    }

    if (!result.info.title.isEmpty()) {
        active_.item.title = result.info.title;
        const int index = activeIndex();
        if (index >= 0) {
            queue_->updateTitle(index, result.info.title);
        }
    }

    startTransfer(result.info);
}

void QueueController::startTransfer(const MediaInfo &info)
{
    const bool playlistMode = active_.item.options.value(QueueOptions::Playlist).toBool();

    std::unique_ptr<QTemporaryDir> scratch;
    QString scratchPath;
    if (!playlistMode) {
        scratch = std::make_unique<QTemporaryDir>(
            QDir(QDir::tempPath()).filePath(QStringLiteral("mediadl_tmp_XXXXXX")));
        if (!scratch->isValid()) {
            markFailed(ErrorCategory::Filesystem,
                       tr("Error: Cannot create temporary folder: %1").arg(scratch->errorString()));
            completeActive();
            return;
        }
        scratchPath = scratch->path();
    }

    TransferConfigBuilder builder(settings_);
    builder.setRateLimitOverride(rateLimitOverrideKb_);
    const TransferConfig config = builder.build(active_.item, info, scratchPath,
                                                destinationFolder(), FfmpegLocator::location());

    const QString problem = config.validate();
    if (!problem.isEmpty()) {
        markFailed(ErrorCategory::Configuration, tr("Error: %1").arg(problem));
        completeActive();
        return;
    }

    qInfo() << "QueueController: Download started:" << active_.item.url
            << "type" << queueModeToString(active_.item.mode)
            << "playlist" << playlistMode
            << "target" << config.targetExtension
            << "folder" << config.destinationDirectory;

    task_ = std::make_shared<TransferTask>(engine_, active_.item.url, config,
                                           std::move(scratch), channel_);
    setState(State::Transferring);
    emit statusMessage(tr("Starting download..."), 0);

    std::shared_ptr<TransferTask> task = task_;
    transferWatcher_.setFuture(QtConcurrent::run([task]() { return task->run(); }));
}

void QueueController::onTransferFinished()
{
    if (state_ != State::Transferring || !active_.valid) {
        return;
    }

    // Deliver every progress update before the outcome
    LOG_VERBOSE() << "QueueController: Delivering" << channel_->pendingCount() << "queued updates";
    channel_->drain();

    const TransferOutcome outcome = transferWatcher_.result();
    task_.reset();

    LOG_VERBOSE() << "QueueController: Transfer" << transferOutcomeToString(outcome.kind)
                  << "for" << active_.item.url;

    switch (outcome.kind) {
    case TransferOutcome::Kind::Finished:
        // A queue item cancelled too late still counts as cancelled
        if (outcome.cancelRequested && (bulkCancelRequested_ || (cancelRequested_ && !active_.single))) {
            markCancelled(tr("Cancelled by user"));
        } else {
            markFinished(outcome.message);
        }
        break;
    case TransferOutcome::Kind::Cancelled:
        markCancelled(outcome.message);
        break;
    case TransferOutcome::Kind::Failed:
        markFailed(ErrorCategory::Transfer, outcome.message);
        break;
    case TransferOutcome::Kind::PlacementFailed:
        markFailed(ErrorCategory::Placement, outcome.message);
        break;
    }

    completeActive();
}

void QueueController::onChannelProgress(double percent, const QString &message)
{
    if (!active_.valid) {
        return;
    }

    const int index = activeIndex();
    if (index >= 0) {
        queue_->updateProgress(index, percent);
    }
    emit progress(index, percent, message);
}

void QueueController::onChannelProcessing(const QString &message)
{
    if (!active_.valid) {
        return;
    }

    const int index = activeIndex();
    if (index >= 0) {
        queue_->updateProgress(index, 100.0);
    }
    emit processingStarted(index, message);
}

void QueueController::markFinished(const QString &message)
{
    if (active_.single) {
        emit singleDownloadFinished(message);
        emit statusMessage(message, 5000);
        return;
    }

    const int index = activeIndex();
    if (index >= 0) {
        queue_->updateProgress(index, 100.0);
        queue_->updateStatus(index, QueueItem::Status::Finished);
    }
    ++summary_.finished;
    emit itemFinished(index, message);
    emit statusMessage(message, 5000);
}

void QueueController::markFailed(ErrorCategory category, const QString &message)
{
    switch (category) {
    case ErrorCategory::Metadata:
        errorHandler_->handleMetadataError(active_.item.url, message);
        break;
    case ErrorCategory::Placement:
        errorHandler_->handlePlacementError(active_.item.url, message);
        break;
    case ErrorCategory::Configuration:
        errorHandler_->handleConfigurationError(message);
        break;
    case ErrorCategory::Transfer:
        errorHandler_->handleTransferError(active_.item.url, message);
        break;
    case ErrorCategory::Filesystem:
    case ErrorCategory::Cancelled:
        errorHandler_->handleError(category, ErrorSeverity::Warning, active_.item.url, message);
        break;
    }

    if (active_.single) {
        emit singleDownloadFailed(message);
        return;
    }

    const int index = activeIndex();
    if (index >= 0) {
        queue_->updateStatus(index, QueueItem::Status::Error, message);
    }
    ++summary_.failed;
    emit itemFailed(index, message);
}

void QueueController::markCancelled(const QString &message)
{
    errorHandler_->handleCancelled(active_.item.url);

    if (active_.single) {
        emit singleDownloadFailed(message);
        return;
    }

    const int index = activeIndex();
    if (index >= 0) {
        queue_->updateStatus(index, QueueItem::Status::Cancelled, message);
    }
    ++summary_.cancelled;
    emit itemCancelled(index, message);
}

void QueueController::completeActive()
{
    active_ = ActiveJob();
    cancelRequested_ = false;
    bulkCancelRequested_ = false;
    setState(State::Idle);

    if (queueRunning_) {
        scheduleNext();
    }
}

void QueueController::finishQueue()
{
    queueRunning_ = false;
    cancelRequested_ = false;
    bulkCancelRequested_ = false;

    const QString message = tr("Queue finished: %1 completed, %2 failed, %3 cancelled.")
        .arg(summary_.finished)
        .arg(summary_.failed)
        .arg(summary_.cancelled);
    qInfo().noquote() << "QueueController:" << message;
    LOG_VERBOSE() << "QueueController:" << errorHandler_->totalCount() << "errors reported during the run";

    emit statusMessage(message, 0);
    emit queueFinished(summary_.finished, summary_.failed, summary_.cancelled);
}

int QueueController::activeIndex() const
{
    if (!active_.valid || active_.single) {
        return -1;
    }
    return queue_->indexOfId(active_.item.id);
}
