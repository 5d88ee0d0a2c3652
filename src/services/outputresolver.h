/**
 * @file outputresolver.h
 * @brief Locates, moves and renames transfer artifacts.
 */

#ifndef OUTPUTRESOLVER_H
#define OUTPUTRESOLVER_H

#include <QDateTime>
#include <QString>
#include <QStringList>

/**
 * @brief Result of moving an artifact into the destination folder.
 */
struct PlacementResult {
    bool success = false;
    QString message;    ///< "DONE! File saved." or an "Error: ..." message
    QString finalPath;  ///< Absolute path of the placed file on success
};

/**
 * @brief Filesystem helpers run after the engine finished a transfer.
 *
 * All operations are synchronous and run on the transfer worker thread.
 * Files are only ever moved or renamed, never copied.
 */
class OutputResolver
{
public:
    /**
     * @brief Picks the artifact in a scratch directory.
     * @return First regular file whose name ends with ".<extension>", else
     *         the largest regular file, else an empty string.
     */
    [[nodiscard]] static QString locateArtifact(const QString &directory, const QString &extension);

    /**
     * @brief Makes a display suffix safe for use in a file name.
     *
     * Replaces <>:"/\|?* and control characters with '_', trims surrounding
     * whitespace and strips trailing dots and spaces.
     */
    [[nodiscard]] static QString sanitizeSuffix(const QString &suffix);

    /**
     * @brief Renames "base.ext" to "base <suffix>.ext" in the same directory.
     *
     * Nothing happens when the sanitized suffix is empty, the file does not
     * exist or the base name already ends with the suffix. An existing file
     * at the new name is replaced.
     *
     * @return The path of the file after the call.
     */
    static QString applySuffix(const QString &filePath, const QString &suffix);

    /**
     * @brief Moves the artifact from @p scratchDirectory into @p destination.
     *
     * An existing destination file with the same name is replaced. The
     * suffix, if any, is applied after the move.
     */
    static PlacementResult placeArtifact(const QString &scratchDirectory,
                                         const QString &destination,
                                         const QString &extension,
                                         const QString &suffix);

    /**
     * @brief Applies @p suffix to collection files written since @p cutoff.
     *
     * Walks @p root recursively and renames every regular file whose
     * extension matches case-insensitively and whose modification time is
     * not older than @p cutoff. Files changed by something else during that
     * window are renamed too.
     *
     * @return Paths of the renamed files.
     */
    static QStringList applySuffixToRecentFiles(const QString &root,
                                                const QString &extension,
                                                const QString &suffix,
                                                const QDateTime &cutoff);
};

#endif // OUTPUTRESOLVER_H
