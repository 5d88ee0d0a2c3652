#ifndef QUEUEITEM_H
#define QUEUEITEM_H

#include <QMetaType>
#include <QString>
#include <QVariantMap>

/**
 * @brief Keys of the per-item option map captured when a URL is enqueued.
 */
namespace QueueOptions {
inline constexpr const char *Playlist = "playlist";             ///< bool: collection transfer
inline constexpr const char *Subtitle = "subtitle";             ///< "", "__all__", "manual:<lang>", "auto:<lang>"
inline constexpr const char *AudioFormat = "audioFormat";       ///< mp3, m4a, flac, opus, wav
inline constexpr const char *AudioBitrate = "audioBitrate";     ///< kbit/s as string ("320")
inline constexpr const char *VideoFormatId = "videoFormatId";   ///< explicit engine format id
inline constexpr const char *VideoContainer = "videoContainer"; ///< mp4, webm, mkv
inline constexpr const char *VideoMaxHeight = "videoMaxHeight"; ///< int, 0 = no limit
inline constexpr const char *VideoFps = "videoFps";             ///< int, 0 = any
inline constexpr const char *AutoSubtitles = "autoSubtitles";   ///< bool, overrides the settings default

/// Subtitle option value selecting every available language
inline constexpr const char *AllSubtitles = "__all__";
} // namespace QueueOptions

struct QueueItem {
    enum class Status { Pending, Downloading, Finished, Error, Cancelled };
    enum class Mode { Video, Audio };

    quint64 id = 0;      // Stable identity; the positional index may shift
    QString url;
    Status status = Status::Pending;
    QString title;
    Mode mode = Mode::Video;
    QVariantMap options;
    QString errorMessage;
    double progress = 0.0;

    [[nodiscard]] bool isTerminal() const
    {
        return status == Status::Finished || status == Status::Error || status == Status::Cancelled;
    }
};

/// @brief Convert QueueItem::Status to string for logging and display
[[nodiscard]] inline const char *queueStatusToString(QueueItem::Status status)
{
    switch (status) {
        case QueueItem::Status::Pending: return "pending";
        case QueueItem::Status::Downloading: return "downloading";
        case QueueItem::Status::Finished: return "finished";
        case QueueItem::Status::Error: return "error";
        case QueueItem::Status::Cancelled: return "cancelled";
    }
    return "unknown";
}

[[nodiscard]] inline const char *queueModeToString(QueueItem::Mode mode)
{
    return mode == QueueItem::Mode::Audio ? "Audio" : "Video";
}

Q_DECLARE_METATYPE(QueueItem::Status)
Q_DECLARE_METATYPE(QueueItem::Mode)

#endif // QUEUEITEM_H
