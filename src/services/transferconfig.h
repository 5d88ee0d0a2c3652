/**
 * @file transferconfig.h
 * @brief Typed configuration for one transfer attempt.
 */

#ifndef TRANSFERCONFIG_H
#define TRANSFERCONFIG_H

#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief A post-processing step the engine runs after the raw transfer.
 */
struct PostProcessor {
    enum class Kind {
        ExtractAudio,    ///< Convert to an audio-only file (codec + quality)
        EmbedThumbnail,  ///< Embed the thumbnail as cover art
        Metadata,        ///< Write title/artist tags, optionally chapters
        EmbedSubtitle    ///< Mux downloaded subtitles into the container
    };

    Kind kind = Kind::Metadata;
    QString preferredCodec;    ///< ExtractAudio only
    QString preferredQuality;  ///< ExtractAudio only, kbit/s ("320")
    bool addChapters = false;  ///< Metadata only

    static PostProcessor extractAudio(const QString &codec, const QString &quality)
    {
        PostProcessor pp;
        pp.kind = Kind::ExtractAudio;
        pp.preferredCodec = codec;
        pp.preferredQuality = quality;
        return pp;
    }

    static PostProcessor of(Kind kind, bool addChapters = false)
    {
        PostProcessor pp;
        pp.kind = kind;
        pp.addChapters = addChapters;
        return pp;
    }

    bool operator==(const PostProcessor &other) const
    {
        return kind == other.kind
            && preferredCodec == other.preferredCodec
            && preferredQuality == other.preferredQuality
            && addChapters == other.addChapters;
    }
};

/**
 * @brief Subtitle download and embedding settings.
 */
struct SubtitleOptions {
    bool enabled = false;
    QStringList languages;
    bool includeAutomatic = false;
    QString format = QStringLiteral("srt/best");
    QString convertTo = QStringLiteral("srt");
};

/**
 * @brief Engine-level resilience settings applied to every transfer.
 */
struct ResilienceOptions {
    int retries = 10;
    int fragmentRetries = 10;
    int socketTimeoutSeconds = 15;
    int concurrentFragments = 4;
    int fileAccessRetries = 5;
};

/**
 * @brief Everything the engine needs to perform one transfer.
 *
 * Built once per attempt by TransferConfigBuilder and treated as immutable
 * once the transfer starts.
 */
struct TransferConfig {
    QString targetExtension;        ///< Extension of the expected artifact ("mp4", "mp3")
    QString mergeOutputFormat;      ///< Container for merged streams, empty if none
    QString formatSelector;         ///< Engine format selector expression
    QList<PostProcessor> postProcessors;
    qint64 rateLimitBytesPerSecond = 0;  ///< 0 = unlimited
    QString outputTemplate;         ///< Engine output path template
    QString homePath;               ///< Directory the engine writes into
    QString destinationDirectory;   ///< Final location of the artifact(s)
    QString fileNameSuffix;         ///< Display suffix appended after placement, may be empty
    bool playlistMode = false;      ///< Collection transfer writing straight to the destination
    bool overwrite = true;
    bool keepVideo = false;
    QString ffmpegLocation;         ///< Explicit ffmpeg path, empty to use the engine default
    SubtitleOptions subtitles;
    ResilienceOptions resilience;

    /**
     * @brief Checks the configuration for inconsistencies.
     * @return Empty string if valid, otherwise a description of the first problem.
     */
    [[nodiscard]] QString validate() const;
};

#endif // TRANSFERCONFIG_H
