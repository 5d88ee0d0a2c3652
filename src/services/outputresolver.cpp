#include "outputresolver.h"
#include "utils/logging.h"

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QObject>

QString OutputResolver::locateArtifact(const QString &directory, const QString &extension)
{
    QDir dir(directory);
    if (directory.isEmpty() || !dir.exists()) {
        return QString();
    }

    const QString wantedSuffix = QStringLiteral(".") + extension;
    const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoSymLinks,
                                                    QDir::Name);

    QString largestPath;
    qint64 largestSize = -1;
    for (const QFileInfo &entry : entries) {
        if (!extension.isEmpty() && entry.fileName().endsWith(wantedSuffix)) {
            return entry.absoluteFilePath();
        }
        if (entry.size() > largestSize) {
            largestSize = entry.size();
            largestPath = entry.absoluteFilePath();
        }
    }
    return largestPath;
}

QString OutputResolver::sanitizeSuffix(const QString &suffix)
{
    QString safe;
    safe.reserve(suffix.size());
    for (const QChar ch : suffix) {
        if (ch.unicode() < 0x20 || QStringLiteral("<>:\"/\\|?*").contains(ch)) {
            safe.append(QLatin1Char('_'));
        } else {
            safe.append(ch);
        }
    }

    safe = safe.trimmed();
    while (safe.endsWith(QLatin1Char('.')) || safe.endsWith(QLatin1Char(' '))) {
        safe.chop(1);
    }
    return safe;
}

QString OutputResolver::applySuffix(const QString &filePath, const QString &suffix)
{
    if (filePath.isEmpty() || suffix.isEmpty()) {
        return filePath;
    }

    const QFileInfo info(filePath);
    if (!info.isFile()) {
        return filePath;
    }

    const QString safeSuffix = sanitizeSuffix(suffix);
    const QString baseName = info.completeBaseName();
    if (safeSuffix.isEmpty() || baseName.endsWith(safeSuffix)) {
        return filePath;
    }

    QString renamedName = QString("%1 %2").arg(baseName, safeSuffix);
    if (!info.suffix().isEmpty()) {
        renamedName += QStringLiteral(".") + info.suffix();
    }
    const QString renamedPath = info.dir().filePath(renamedName);

    if (QFile::exists(renamedPath) && !QFile::remove(renamedPath)) {
        qWarning() << "OutputResolver: Could not replace" << renamedPath;
        return filePath;
    }
    if (!QFile::rename(filePath, renamedPath)) {
        qWarning() << "OutputResolver: Rename failed" << filePath << "->" << renamedPath;
        return filePath;
    }

    LOG_VERBOSE() << "OutputResolver: Renamed" << info.fileName() << "->" << renamedName;
    return renamedPath;
}

PlacementResult OutputResolver::placeArtifact(const QString &scratchDirectory,
                                              const QString &destination,
                                              const QString &extension,
                                              const QString &suffix)
{
    PlacementResult result;

    if (scratchDirectory.isEmpty() || !QFileInfo(scratchDirectory).isDir()) {
        result.message = QObject::tr("Error: Temporary folder missing.");
        return result;
    }

    const QString artifact = locateArtifact(scratchDirectory, extension);
    if (artifact.isEmpty()) {
        result.message = QObject::tr("Error: File not found.");
        return result;
    }

    if (!QDir().mkpath(destination)) {
        result.message = QObject::tr("Error: Cannot create folder %1").arg(destination);
        return result;
    }

    const QString finalPath = QDir(destination).filePath(QFileInfo(artifact).fileName());
    if (QFile::exists(finalPath) && !QFile::remove(finalPath)) {
        result.message = QObject::tr("Error: Cannot replace %1").arg(finalPath);
        return result;
    }

    // rename() fails across filesystems (scratch on tmpfs), fall back to copy + remove
    if (!QFile::rename(artifact, finalPath)) {
        if (!QFile::copy(artifact, finalPath)) {
            result.message = QObject::tr("Error: Cannot move file to %1").arg(destination);
            return result;
        }
        if (!QFile::remove(artifact)) {
            LOG_VERBOSE() << "OutputResolver: Could not remove scratch copy" << artifact;
        }
    }

    result.success = true;
    result.finalPath = applySuffix(finalPath, suffix);
    result.message = QObject::tr("DONE! File saved.");
    return result;
}

QStringList OutputResolver::applySuffixToRecentFiles(const QString &root,
                                                     const QString &extension,
                                                     const QString &suffix,
                                                     const QDateTime &cutoff)
{
    QStringList renamed;

    QString expected = extension.toLower();
    while (expected.startsWith(QLatin1Char('.'))) {
        expected.remove(0, 1);
    }
    if (suffix.isEmpty() || expected.isEmpty() || !QFileInfo(root).isDir()) {
        return renamed;
    }

    // Collect first so renames do not disturb the iteration
    QStringList candidates;
    QDirIterator it(root, QDir::Files | QDir::NoSymLinks, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        const QFileInfo info = it.fileInfo();
        if (info.suffix().toLower() != expected) {
            continue;
        }
        if (info.lastModified() < cutoff) {
            continue;
        }
        candidates.append(info.absoluteFilePath());
    }

    for (const QString &path : candidates) {
        const QString newPath = applySuffix(path, suffix);
        if (newPath != path) {
            renamed.append(newPath);
        }
    }
    return renamed;
}
