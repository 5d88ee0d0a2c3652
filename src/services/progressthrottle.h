#ifndef PROGRESSTHROTTLE_H
#define PROGRESSTHROTTLE_H

#include <QElapsedTimer>
#include <QtGlobal>

/**
 * @brief Decides which raw progress events are worth forwarding.
 *
 * An event passes if it is the first one since construction or reset(),
 * if at least MinIntervalMs elapsed since the last forwarded event, if the
 * percentage moved by at least MinPercentDelta, or if the transfer is
 * complete (known total reached). Not thread-safe; one instance per task.
 */
class ProgressThrottle
{
public:
    static constexpr qint64 MinIntervalMs = 250;
    static constexpr double MinPercentDelta = 0.5;

    ProgressThrottle();

    /// Uses a monotonic clock started at construction
    [[nodiscard]] bool shouldEmit(double percent, qint64 downloaded, qint64 total);

    /// Same decision with an explicit monotonic timestamp in milliseconds
    [[nodiscard]] bool shouldEmitAt(qint64 nowMs, double percent, qint64 downloaded, qint64 total);

    void reset();

private:
    QElapsedTimer clock_;
    bool hasEmitted_ = false;
    qint64 lastEmitMs_ = 0;
    double lastPercent_ = -1.0;
};

#endif // PROGRESSTHROTTLE_H
