#ifndef PROGRESSCHANNEL_H
#define PROGRESSCHANNEL_H

#include <QList>
#include <QMutex>
#include <QObject>
#include <QString>

/**
 * @brief One progress notification posted by a worker.
 */
struct ProgressUpdate {
    enum class Kind {
        Progress,    ///< Raw transfer progress
        Processing   ///< Transfer done, engine post-processing started
    };

    Kind kind = Kind::Progress;
    double percent = 0.0;
    QString message;
};

/**
 * @brief Carries progress from a worker thread to the thread owning the channel.
 *
 * post() may be called from any thread; it appends to a mutex-protected
 * queue and schedules a drain on the owner's event loop. drain() delivers
 * the queued updates in posting order as signals on the owner thread. The
 * owner calls drain() once more after the worker finished so that every
 * update is delivered before the worker's outcome is handled.
 */
class ProgressChannel : public QObject
{
    Q_OBJECT

public:
    explicit ProgressChannel(QObject *parent = nullptr);
    ~ProgressChannel() override;

    /// Thread-safe
    void post(const ProgressUpdate &update);
    void postProgress(double percent, const QString &message);
    void postProcessing(const QString &message);

    /// Removes and returns everything queued so far (thread-safe)
    [[nodiscard]] QList<ProgressUpdate> takeAll();

    /// Number of updates waiting to be drained (thread-safe)
    [[nodiscard]] int pendingCount() const;

public slots:
    /// Delivers every queued update; must run on the owner thread
    void drain();

signals:
    void progress(double percent, const QString &message);

    /// Emitted instead of progress() for a Processing update, which implies 100 %
    void processingStarted(const QString &message);

private:
    mutable QMutex mutex_;
    QList<ProgressUpdate> queue_;
    bool drainScheduled_ = false;
};

#endif // PROGRESSCHANNEL_H
