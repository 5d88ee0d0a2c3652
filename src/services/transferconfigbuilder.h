/**
 * @file transferconfigbuilder.h
 * @brief Turns a queue item and its metadata into a TransferConfig.
 */

#ifndef TRANSFERCONFIGBUILDER_H
#define TRANSFERCONFIGBUILDER_H

#include <QString>
#include <QStringList>

#include "models/mediaformat.h"
#include "models/queueitem.h"
#include "toollocation.h"
#include "transferconfig.h"

class SettingsManager;

/**
 * @brief Builds one TransferConfig per transfer attempt.
 *
 * The item's option map (captured at enqueue time) wins over the user's
 * defaults from SettingsManager. Nothing is cached between builds, so every
 * item gets a fresh configuration.
 *
 * Audio mode extracts the best audio stream and converts it. Video mode
 * picks a format by id, else by maximum height and frame rate, else the
 * best available; video-only formats are merged with a container-matched
 * audio stream. Subtitles force an mkv container.
 */
class TransferConfigBuilder
{
public:
    explicit TransferConfigBuilder(const SettingsManager *settings);

    /// Replaces the settings' speed limit (KB/s); negative restores it
    void setRateLimitOverride(int kilobytesPerSecond) { rateLimitOverrideKb_ = kilobytesPerSecond; }

    /**
     * @param scratchDirectory Per-item temporary folder (unused in collection mode).
     * @param destination Folder the finished files end up in.
     */
    [[nodiscard]] TransferConfig build(const QueueItem &item,
                                       const MediaInfo &info,
                                       const QString &scratchDirectory,
                                       const QString &destination,
                                       const ToolLocation &ffmpeg) const;

    /// Output template and paths shared by both modes
    [[nodiscard]] static TransferConfig baseConfig(bool playlistMode,
                                                   const QString &scratchDirectory,
                                                   const QString &destination);

    /// "[mp3 320kbps]", "[flac]" or empty
    [[nodiscard]] static QString audioSuffix(const QString &format, const QString &bitrate);

    /// "[1920x1080 avc1]", "[1920x1080]", "[avc1]" or empty
    [[nodiscard]] static QString videoSuffix(const MediaFormat *format);

    /// Audio stream selector used when merging with a video-only format
    [[nodiscard]] static QString audioSelectorFor(const QString &container);

    /// Audio formats whose container can carry cover art
    [[nodiscard]] static bool supportsThumbnail(const QString &audioFormat);

    /// Audio formats whose container can carry tags
    [[nodiscard]] static bool supportsMetadata(const QString &audioFormat);

    /**
     * @brief Picks a video format by height and frame rate limits.
     * @param formats Formats sorted best first.
     * @param maxHeight 0 for no limit.
     * @param fps 0 for any; otherwise formats with that rounded rate are preferred.
     * @return The chosen format or nullptr if nothing qualifies.
     */
    [[nodiscard]] static const MediaFormat *selectFormat(const QList<MediaFormat> &formats,
                                                         int maxHeight, int fps);

    /**
     * @brief Languages selected by a subtitle option value.
     *
     * "__all__" yields every manual language, plus automatic ones when
     * @p includeAutomatic is set; "manual:xx" and "auto:xx" yield "xx".
     */
    [[nodiscard]] static QStringList subtitleLanguagesFor(const QString &selection,
                                                          const MediaInfo &info,
                                                          bool includeAutomatic);

private:
    void applyAudioOptions(TransferConfig &config, const QueueItem &item) const;
    void applyVideoOptions(TransferConfig &config, const QueueItem &item, const MediaInfo &info) const;
    void applySubtitleOptions(TransferConfig &config, const QueueItem &item, const MediaInfo &info) const;

    const SettingsManager *settings_;
    int rateLimitOverrideKb_ = -1;
};

#endif // TRANSFERCONFIGBUILDER_H
