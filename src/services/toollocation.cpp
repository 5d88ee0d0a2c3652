#include "toollocation.h"
#include "utils/logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <optional>

namespace {

QMutex cacheMutex;
std::optional<ToolLocation> cachedLocation;
QStringList searchOverride;

} // namespace

ToolLocation FfmpegLocator::location()
{
    QMutexLocker locker(&cacheMutex);
    if (!cachedLocation) {
        cachedLocation = search(searchOverride);

        switch (cachedLocation->kind) {
        case ToolLocation::Kind::Found:
            qInfo() << "FfmpegLocator: Using" << cachedLocation->path;
            break;
        case ToolLocation::Kind::SystemDefault:
            qInfo() << "FfmpegLocator: Available via PATH";
            break;
        case ToolLocation::Kind::NotFound:
            qWarning() << "FfmpegLocator: ffmpeg not found, post-processing may fail";
            break;
        }
    }
    return *cachedLocation;
}

void FfmpegLocator::invalidate()
{
    QMutexLocker locker(&cacheMutex);
    cachedLocation.reset();
}

void FfmpegLocator::setSearchDirectories(const QStringList &directories)
{
    QMutexLocker locker(&cacheMutex);
    searchOverride = directories;
    cachedLocation.reset();
}

QString FfmpegLocator::executableName()
{
#ifdef Q_OS_WIN
    return QStringLiteral("ffmpeg.exe");
#else
    return QStringLiteral("ffmpeg");
#endif
}

ToolLocation FfmpegLocator::search(const QStringList &overrideDirectories)
{
    ToolLocation result;

    if (!overrideDirectories.isEmpty()) {
        for (const QString &dir : overrideDirectories) {
            const QString candidate = findIn(dir);
            if (!candidate.isEmpty()) {
                result.kind = ToolLocation::Kind::Found;
                result.path = candidate;
                return result;
            }
        }
        return result;
    }

    QStringList localDirs;
    if (QCoreApplication::instance()) {
        localDirs << QCoreApplication::applicationDirPath();
    }
    localDirs << QDir::currentPath();

    for (const QString &dir : localDirs) {
        const QString candidate = findIn(dir);
        if (!candidate.isEmpty()) {
            result.kind = ToolLocation::Kind::Found;
            result.path = candidate;
            return result;
        }
    }

    if (!QStandardPaths::findExecutable(QStringLiteral("ffmpeg")).isEmpty()) {
        result.kind = ToolLocation::Kind::SystemDefault;
        return result;
    }

    const QStringList wellKnown = {
        QStringLiteral("/usr/local/bin"),
        QStringLiteral("/opt/homebrew/bin"),
        QStringLiteral("/opt/ffmpeg/bin"),
        QStringLiteral("/snap/bin"),
        QDir::homePath() + QStringLiteral("/.local/bin"),
        QStringLiteral("C:/ffmpeg/bin"),
        qEnvironmentVariable("LOCALAPPDATA") + QStringLiteral("/ffmpeg/bin")
    };
    for (const QString &dir : wellKnown) {
        const QString candidate = findIn(dir);
        if (!candidate.isEmpty()) {
            result.kind = ToolLocation::Kind::Found;
            result.path = candidate;
            return result;
        }
    }

    return result;
}

QString FfmpegLocator::findIn(const QString &directory)
{
    if (directory.isEmpty()) {
        return QString();
    }
    const QFileInfo info(QDir(directory).filePath(executableName()));
    if (info.isFile() && info.isExecutable()) {
        return info.absoluteFilePath();
    }
    LOG_VERBOSE() << "FfmpegLocator: Not in" << directory;
    return QString();
}
