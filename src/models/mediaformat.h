/**
 * @file mediaformat.h
 * @brief Normalised view of the engine's metadata record.
 */

#ifndef MEDIAFORMAT_H
#define MEDIAFORMAT_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief One video format offered by the engine, filtered and annotated.
 *
 * Produced fresh by every metadata fetch and never modified afterwards.
 */
struct MediaFormat {
    QString formatId;        ///< Engine format identifier (e.g. "137")
    QString extension;       ///< Container extension reported by the engine
    QString videoCodec;      ///< Codec without version/profile ("avc1.640028" -> "avc1")
    int height = 0;          ///< Frame height in pixels
    int width = 0;           ///< Frame width in pixels, 0 if unknown
    int fpsRounded = 0;      ///< Frame rate rounded to an integer, 0 if unknown
    double bitrate = 0.0;    ///< Total bitrate in kbit/s, 0 if unknown
    bool hasAudio = false;   ///< True if the stream also carries audio
    qint64 sizeBytes = 0;    ///< Exact or approximate size, 0 if unknown
    QString sizeText;        ///< Human-readable size ("Unknown" if unknown)
};

/**
 * @brief Result of a successful metadata fetch.
 */
struct MediaInfo {
    QJsonObject raw;                        ///< Unmodified engine record
    QString title;                          ///< Display title
    QString webpageUrl;                     ///< Canonical page URL
    QList<MediaFormat> formats;             ///< Video formats, best first
    QStringList subtitleLanguages;          ///< Manually authored subtitle languages
    QStringList automaticCaptionLanguages;  ///< Auto-generated caption languages

    [[nodiscard]] const MediaFormat *findFormat(const QString &formatId) const
    {
        for (const MediaFormat &format : formats) {
            if (format.formatId == formatId) {
                return &format;
            }
        }
        return nullptr;
    }
};

#endif // MEDIAFORMAT_H
