#include "transfertask.h"
#include "outputresolver.h"
#include "progresschannel.h"
#include "utils/formatutils.h"
#include "utils/logging.h"

#include <QDebug>
#include <QObject>
#include <QScopeGuard>
#include <QTemporaryDir>

TransferTask::TransferTask(IRetrievalEngine *engine,
                           const QString &url,
                           const TransferConfig &config,
                           std::unique_ptr<QTemporaryDir> scratchDirectory,
                           ProgressChannel *channel)
    : engine_(engine)
    , url_(url)
    , config_(config)
    , scratch_(std::move(scratchDirectory))
    , channel_(channel)
{
}

TransferTask::~TransferTask()
{
    removeScratchDirectory();
}

TransferOutcome TransferTask::run()
{
    auto cleanup = qScopeGuard([this]() { removeScratchDirectory(); });

    startedAt_ = QDateTime::currentDateTime();
    throttle_.reset();
    processingPosted_ = false;

    TransferOutcome outcome;
    if (!engine_) {
        outcome.kind = TransferOutcome::Kind::Failed;
        outcome.message = QObject::tr("Error: No retrieval engine configured");
        return outcome;
    }

    qInfo() << "TransferTask: Starting" << url_ << "->" << config_.destinationDirectory;

    const EngineResult result = engine_->download(url_, config_,
        [this](const ProgressEvent &event) { return onProgress(event); });

    if (!result.success) {
        if (isCancelled()) {
            qInfo() << "TransferTask: Cancelled by user:" << url_;
            outcome.kind = TransferOutcome::Kind::Cancelled;
            outcome.message = QObject::tr("Cancelled.");
        } else {
            qWarning() << "TransferTask: Transfer failed for" << url_ << ":" << result.errorMessage;
            outcome.kind = TransferOutcome::Kind::Failed;
            outcome.message = QObject::tr("Error: %1...")
                .arg(result.errorMessage.left(ErrorExcerptLength));
        }
        return outcome;
    }

    return finishTransfer();
}

TransferOutcome TransferTask::finishTransfer()
{
    TransferOutcome outcome;
    outcome.cancelRequested = isCancelled();

    if (config_.playlistMode) {
        const QDateTime cutoff = startedAt_.addMSecs(-RecentFileToleranceMs);
        outcome.placedFiles = OutputResolver::applySuffixToRecentFiles(
            config_.destinationDirectory, config_.targetExtension, config_.fileNameSuffix, cutoff);
        outcome.kind = TransferOutcome::Kind::Finished;
        outcome.message = QObject::tr("DONE! Playlist saved.");
        qInfo() << "TransferTask: Playlist saved to" << config_.destinationDirectory;
        return outcome;
    }

    const QString scratchPath = scratch_ ? scratch_->path() : config_.homePath;
    const PlacementResult placement = OutputResolver::placeArtifact(
        scratchPath, config_.destinationDirectory, config_.targetExtension, config_.fileNameSuffix);

    outcome.message = placement.message;
    if (!placement.success) {
        qWarning() << "TransferTask: Placement failed for" << url_ << ":" << placement.message;
        outcome.kind = TransferOutcome::Kind::PlacementFailed;
        return outcome;
    }

    outcome.kind = TransferOutcome::Kind::Finished;
    outcome.placedFiles.append(placement.finalPath);
    qInfo() << "TransferTask: Saved" << placement.finalPath;
    return outcome;
}

HookAction TransferTask::onProgress(const ProgressEvent &event)
{
    if (isCancelled()) {
        return HookAction::Abort;
    }

    switch (event.status) {
    case ProgressEvent::Status::Downloading: {
        const double percent = percentOf(event);
        if (!throttle_.shouldEmit(percent, event.downloadedBytes, event.effectiveTotal())) {
            break;
        }
        if (channel_) {
            channel_->postProgress(percent, formatStatusLine(event));
        }
        break;
    }
    case ProgressEvent::Status::Finished:
        if (!processingPosted_) {
            processingPosted_ = true;
            if (channel_) {
                channel_->postProcessing(QObject::tr("Processing / Converting..."));
            }
        }
        break;
    case ProgressEvent::Status::Error:
        LOG_VERBOSE() << "TransferTask: Engine reported a stream error for" << url_;
        break;
    }
    return HookAction::Continue;
}

double TransferTask::percentOf(const ProgressEvent &event)
{
    const qint64 total = event.effectiveTotal();
    if (total <= 0) {
        return 0.0;
    }
    return static_cast<double>(event.downloadedBytes) / static_cast<double>(total) * 100.0;
}

QString TransferTask::formatStatusLine(const ProgressEvent &event)
{
    QString speed = FormatUtils::stripAnsi(event.speedText).trimmed();
    if (speed.isEmpty()) {
        speed = QStringLiteral("N/A");
    }
    QString eta = FormatUtils::stripAnsi(event.etaText).trimmed();
    if (eta.isEmpty()) {
        eta = QStringLiteral("N/A");
    }

    return QString("Downloading: %1 / %2 | %3 | ETA: %4")
        .arg(FormatUtils::formatSize(event.downloadedBytes),
             FormatUtils::formatSize(event.effectiveTotal()),
             speed,
             eta);
}

void TransferTask::removeScratchDirectory()
{
    if (!scratch_) {
        return;
    }
    if (scratch_->isValid() && !scratch_->remove()) {
        qDebug() << "TransferTask: Could not remove scratch directory" << scratch_->path();
    }
    scratch_.reset();
}
