/**
 * @file logging.h
 * @brief Verbose-only logging for engine command lines and queue decisions.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace mediadl {

/// Set from --verbose; off by default so the log file only records outcomes
inline bool verboseLogging = false;

} // namespace mediadl

/// qDebug() stream that is only evaluated when verbose logging is on
#define LOG_VERBOSE() if (mediadl::verboseLogging) qDebug()

#endif // LOGGING_H
