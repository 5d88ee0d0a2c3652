#include "formatutils.h"

#include <QRegularExpression>

QString FormatUtils::formatSize(qint64 bytes)
{
    if (bytes <= 0) {
        return QStringLiteral("Unknown");
    }

    static const char *units[] = {"B", "KB", "MB", "GB"};
    double value = static_cast<double>(bytes);
    for (const char *unit : units) {
        if (value < 1024.0) {
            return QString("%1 %2").arg(value, 0, 'f', 1).arg(QLatin1String(unit));
        }
        value /= 1024.0;
    }
    return QString("%1 TB").arg(value, 0, 'f', 1);
}

QString FormatUtils::stripAnsi(const QString &text)
{
    static const QRegularExpression ansiRx(QStringLiteral("\x1b\\[[0-9;]*m"));
    QString result = text;
    result.remove(ansiRx);
    return result;
}

QString FormatUtils::truncate(const QString &text, int maxLength)
{
    if (maxLength < 0 || text.size() <= maxLength) {
        return text;
    }
    return text.left(maxLength) + QStringLiteral("...");
}
