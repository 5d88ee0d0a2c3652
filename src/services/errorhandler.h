/**
 * @file errorhandler.h
 * @brief Grades, logs and counts the failures of queued downloads.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

/**
 * @brief Where in the download pipeline a failure happened.
 */
enum class ErrorCategory {
    Metadata,       ///< Engine could not resolve the URL
    Transfer,       ///< Engine failed during the transfer
    Cancelled,      ///< User cancelled an item
    Placement,      ///< Artifact could not be located or moved
    Filesystem,     ///< Scratch or destination folder problems
    Configuration   ///< Invalid settings or transfer configuration
};

/**
 * @brief How long a failure stays visible to the user.
 */
enum class ErrorSeverity {
    Info,      ///< Short status line
    Warning,   ///< Longer status line
    Critical   ///< Status line kept until the next message
};

/**
 * @brief Single reporting point for download failures.
 *
 * Every failure the QueueController routes into an item's Error or
 * Cancelled state also passes through here. The handler writes one log
 * line per failure (which ends up in the LogFile once installed), turns
 * it into a status message whose timeout depends on the severity, and
 * keeps per-category counters for the end-of-queue summary.
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 * connect(handler, &ErrorHandler::statusMessage, this, &Console::showStatus);
 *
 * handler->handleTransferError(url, "HTTP Error 403: Forbidden");
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    static constexpr int StatusDetailsLength = 160;

    explicit ErrorHandler(QObject *parent = nullptr);
    ~ErrorHandler() override = default;

    /**
     * @brief Reports one failure.
     * @param title Short summary, usually naming the URL.
     * @param details Engine or filesystem message; omitted from the status
     *        line if empty or equal to @p title, shortened there to
     *        StatusDetailsLength characters. The log line keeps it whole.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

    /// @name Pipeline stages
    /// @{
    void handleMetadataError(const QString &url, const QString &error);
    void handleTransferError(const QString &url, const QString &error);
    void handlePlacementError(const QString &url, const QString &error);
    void handleCancelled(const QString &url);

    /// Critical: a broken configuration affects every following item
    void handleConfigurationError(const QString &message);
    /// @}

    /// Failures reported in @p category since construction or resetCounts()
    [[nodiscard]] int count(ErrorCategory category) const;
    [[nodiscard]] int totalCount() const;
    void resetCounts();

    /// Short tag used in log lines ("Metadata", "Config", ...)
    [[nodiscard]] static QString categoryToString(ErrorCategory category);

    /// "INFO", "WARN" or "CRIT"
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);

    /// Status message timeout in milliseconds, 0 for no timeout
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

signals:
    void statusMessage(const QString &message, int timeout);

    /// Emitted after the log line was written
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    static constexpr int CategoryCount = 6;
    int counts_[CategoryCount] = {};
};

Q_DECLARE_METATYPE(ErrorCategory)
Q_DECLARE_METATYPE(ErrorSeverity)

#endif // ERRORHANDLER_H
