#include "progressthrottle.h"

#include <cmath>

ProgressThrottle::ProgressThrottle()
{
    clock_.start();
}

bool ProgressThrottle::shouldEmit(double percent, qint64 downloaded, qint64 total)
{
    return shouldEmitAt(clock_.elapsed(), percent, downloaded, total);
}

bool ProgressThrottle::shouldEmitAt(qint64 nowMs, double percent, qint64 downloaded, qint64 total)
{
    const bool emitNow = !hasEmitted_
        || (nowMs - lastEmitMs_) >= MinIntervalMs
        || std::abs(percent - lastPercent_) >= MinPercentDelta
        || (total > 0 && downloaded >= total);

    if (!emitNow) {
        return false;
    }

    hasEmitted_ = true;
    lastEmitMs_ = nowMs;
    lastPercent_ = percent;
    return true;
}

void ProgressThrottle::reset()
{
    hasEmitted_ = false;
    lastEmitMs_ = 0;
    lastPercent_ = -1.0;
    clock_.restart();
}
