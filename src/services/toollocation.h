/**
 * @file toollocation.h
 * @brief Cached lookup of the ffmpeg executable used for post-processing.
 */

#ifndef TOOLLOCATION_H
#define TOOLLOCATION_H

#include <QString>
#include <QStringList>

/**
 * @brief Where a helper executable was found.
 */
struct ToolLocation {
    enum class Kind {
        Found,          ///< Explicit path, pass it to the engine
        SystemDefault,  ///< Reachable via PATH, let the engine find it
        NotFound        ///< Post-processing that needs it will fail
    };

    Kind kind = Kind::NotFound;
    QString path;  ///< Set only for Kind::Found

    [[nodiscard]] bool isAvailable() const { return kind != Kind::NotFound; }
};

/**
 * @brief Process-wide, lazily computed ffmpeg location.
 *
 * The lookup touches the filesystem, so it runs once and the result is
 * reused by every transfer until invalidate() is called. Thread-safe.
 *
 * Search order: the application directory, the working directory, PATH,
 * then a few well-known install locations.
 */
class FfmpegLocator
{
public:
    [[nodiscard]] static ToolLocation location();

    /// Drops the cached result; the next location() call searches again
    static void invalidate();

    /**
     * @brief Restricts the search to @p directories (PATH is not consulted).
     *
     * An empty list restores the default search order. Also invalidates
     * the cache.
     */
    static void setSearchDirectories(const QStringList &directories);

    /// File name of the executable on this platform ("ffmpeg" or "ffmpeg.exe")
    [[nodiscard]] static QString executableName();

private:
    [[nodiscard]] static ToolLocation search(const QStringList &overrideDirectories);
    [[nodiscard]] static QString findIn(const QString &directory);
};

#endif // TOOLLOCATION_H
