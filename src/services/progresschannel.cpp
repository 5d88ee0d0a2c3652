#include "progresschannel.h"

#include <QMetaObject>
#include <QMutexLocker>

ProgressChannel::ProgressChannel(QObject *parent)
    : QObject(parent)
{
}

ProgressChannel::~ProgressChannel() = default;

void ProgressChannel::post(const ProgressUpdate &update)
{
    bool scheduleDrain = false;
    {
        QMutexLocker locker(&mutex_);
        queue_.append(update);
        if (!drainScheduled_) {
            drainScheduled_ = true;
            scheduleDrain = true;
        }
    }

    if (scheduleDrain) {
        QMetaObject::invokeMethod(this, "drain", Qt::QueuedConnection);
    }
}

void ProgressChannel::postProgress(double percent, const QString &message)
{
    ProgressUpdate update;
    update.kind = ProgressUpdate::Kind::Progress;
    update.percent = percent;
    update.message = message;
    post(update);
}

void ProgressChannel::postProcessing(const QString &message)
{
    ProgressUpdate update;
    update.kind = ProgressUpdate::Kind::Processing;
    update.percent = 100.0;
    update.message = message;
    post(update);
}

QList<ProgressUpdate> ProgressChannel::takeAll()
{
    QMutexLocker locker(&mutex_);
    QList<ProgressUpdate> updates;
    updates.swap(queue_);
    drainScheduled_ = false;
    return updates;
}

int ProgressChannel::pendingCount() const
{
    QMutexLocker locker(&mutex_);
    return queue_.size();
}

void ProgressChannel::drain()
{
    const QList<ProgressUpdate> updates = takeAll();
    for (const ProgressUpdate &update : updates) {
        if (update.kind == ProgressUpdate::Kind::Processing) {
            emit processingStarted(update.message);
        } else {
            emit progress(update.percent, update.message);
        }
    }
}
