#ifndef METADATATASK_H
#define METADATATASK_H

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include "models/mediaformat.h"

class IRetrievalEngine;

/**
 * @brief Outcome of one metadata fetch.
 */
struct MetadataResult {
    bool success = false;
    QString errorMessage;  ///< Engine error text when !success
    MediaInfo info;        ///< Valid only when success
};

/**
 * @brief Fetches and normalises the metadata record of one URL.
 *
 * run() blocks until the engine returns and is meant to be called from a
 * worker thread. The task keeps no state between runs and is not retried
 * on failure.
 */
class MetadataTask
{
public:
    MetadataTask(IRetrievalEngine *engine, const QString &url);

    [[nodiscard]] MetadataResult run() const;

    [[nodiscard]] const QString &url() const { return url_; }

    /**
     * @brief Builds a MediaInfo from a raw engine record.
     *
     * Keeps formats with a video codec other than "none" and a known height,
     * annotates them and sorts them by height, frame rate and bitrate,
     * highest first. Equal keys keep the engine's order.
     */
    [[nodiscard]] static MediaInfo parseRecord(const QJsonObject &record);

    /// Converts one engine format entry, without filtering
    [[nodiscard]] static MediaFormat parseFormat(const QJsonObject &format);

    /**
     * @brief Language identifiers of a "subtitles" or "automatic_captions" map.
     *
     * Only keys with a non-empty track list whose base language is in the
     * LanguageTable are returned, sorted and without duplicates.
     */
    [[nodiscard]] static QStringList collectLanguages(const QJsonObject &tracks);

private:
    IRetrievalEngine *engine_;
    QString url_;
};

#endif // METADATATASK_H
