#include "errorhandler.h"
#include "utils/formatutils.h"

#include <QDebug>

#include <algorithm>
#include <iterator>
#include <numeric>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    ++counts_[static_cast<int>(category)];

    logError(category, severity, title, details);

    const bool showDetails = !details.isEmpty() && details != title;
    emit statusMessage(showDetails
                           ? QString("%1: %2").arg(title, FormatUtils::truncate(details, StatusDetailsLength))
                           : title,
                       timeoutForSeverity(severity));
}

void ErrorHandler::handleMetadataError(const QString &url, const QString &error)
{
    handleError(ErrorCategory::Metadata,
                ErrorSeverity::Warning,
                tr("Could not read %1").arg(url),
                error);
}

void ErrorHandler::handleTransferError(const QString &url, const QString &error)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                tr("Download failed: %1").arg(url),
                error);
}

void ErrorHandler::handlePlacementError(const QString &url, const QString &error)
{
    handleError(ErrorCategory::Placement,
                ErrorSeverity::Warning,
                tr("Could not save %1").arg(url),
                error);
}

void ErrorHandler::handleCancelled(const QString &url)
{
    handleError(ErrorCategory::Cancelled,
                ErrorSeverity::Info,
                tr("Cancelled: %1").arg(url));
}

void ErrorHandler::handleConfigurationError(const QString &message)
{
    handleError(ErrorCategory::Configuration,
                ErrorSeverity::Critical,
                tr("Configuration Error"),
                message);
}

int ErrorHandler::count(ErrorCategory category) const
{
    return counts_[static_cast<int>(category)];
}

int ErrorHandler::totalCount() const
{
    return std::accumulate(std::begin(counts_), std::end(counts_), 0);
}

void ErrorHandler::resetCounts()
{
    std::fill(std::begin(counts_), std::end(counts_), 0);
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString line = QString("[%1/%2] %3").arg(categoryToString(category),
                                             severityToString(severity), title);
    if (!details.isEmpty() && details != title) {
        line += QStringLiteral(": ") + details;
    }

    if (severity == ErrorSeverity::Critical) {
        qCritical().noquote() << line;
    } else if (severity == ErrorSeverity::Warning) {
        qWarning().noquote() << line;
    } else {
        qInfo().noquote() << line;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Metadata:
        return QStringLiteral("Metadata");
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Cancelled:
        return QStringLiteral("Cancelled");
    case ErrorCategory::Placement:
        return QStringLiteral("Placement");
    case ErrorCategory::Filesystem:
        return QStringLiteral("Filesystem");
    case ErrorCategory::Configuration:
        return QStringLiteral("Config");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
