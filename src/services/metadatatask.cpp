#include "metadatatask.h"
#include "iretrievalengine.h"
#include "utils/formatutils.h"
#include "utils/languagetable.h"
#include "utils/logging.h"

#include <QJsonArray>
#include <QJsonValue>
#include <algorithm>
#include <cmath>

MetadataTask::MetadataTask(IRetrievalEngine *engine, const QString &url)
    : engine_(engine)
    , url_(url)
{
}

MetadataResult MetadataTask::run() const
{
    MetadataResult result;

    if (!engine_) {
        result.errorMessage = QStringLiteral("No retrieval engine configured");
        return result;
    }

    ExtractOptions options;
    options.noPlaylist = true;
    options.flat = false;

    LOG_VERBOSE() << "MetadataTask: Fetching" << url_;

    QString error;
    const std::optional<QJsonObject> record = engine_->extractInfo(url_, options, &error);
    if (!record) {
        qWarning() << "MetadataTask: Failed to fetch media info for" << url_ << ":" << error;
        result.errorMessage = error.isEmpty() ? QStringLiteral("Unknown engine error") : error;
        return result;
    }

    result.info = parseRecord(*record);
    result.success = true;

    LOG_VERBOSE() << "MetadataTask:" << result.info.formats.size() << "formats,"
                  << result.info.subtitleLanguages.size() << "subtitle and"
                  << result.info.automaticCaptionLanguages.size() << "caption languages for" << url_;
    return result;
}

MediaInfo MetadataTask::parseRecord(const QJsonObject &record)
{
    MediaInfo info;
    info.raw = record;
    info.title = record.value("title").toString();
    info.webpageUrl = record.value("webpage_url").toString();
    if (info.webpageUrl.isEmpty()) {
        info.webpageUrl = record.value("original_url").toString();
    }

    const QJsonArray formats = record.value("formats").toArray();
    for (const QJsonValue &value : formats) {
        const QJsonObject format = value.toObject();

        const QJsonValue vcodec = format.value("vcodec");
        if (!vcodec.isString() || vcodec.toString().isEmpty() || vcodec.toString() == "none") {
            continue;
        }
        if (format.value("height").toDouble() <= 0) {
            continue;
        }

        info.formats.append(parseFormat(format));
    }

    std::stable_sort(info.formats.begin(), info.formats.end(),
                     [](const MediaFormat &a, const MediaFormat &b) {
        if (a.height != b.height) {
            return a.height > b.height;
        }
        if (a.fpsRounded != b.fpsRounded) {
            return a.fpsRounded > b.fpsRounded;
        }
        return a.bitrate > b.bitrate;
    });

    info.subtitleLanguages = collectLanguages(record.value("subtitles").toObject());
    info.automaticCaptionLanguages = collectLanguages(record.value("automatic_captions").toObject());
    return info;
}

MediaFormat MetadataTask::parseFormat(const QJsonObject &format)
{
    MediaFormat result;
    result.formatId = format.value("format_id").toString();
    result.extension = format.value("ext").toString();
    result.height = static_cast<int>(format.value("height").toDouble());
    result.width = static_cast<int>(format.value("width").toDouble());

    const double fps = format.value("fps").toDouble();
    result.fpsRounded = fps > 0 ? static_cast<int>(std::lround(fps)) : 0;

    const QString codec = format.value("vcodec").toString(QStringLiteral("unknown"));
    result.videoCodec = codec.section(QLatin1Char('.'), 0, 0);

    result.bitrate = format.value("tbr").toDouble();

    // A missing acodec is treated as "may carry audio"
    result.hasAudio = format.value("acodec").toString() != QLatin1String("none");

    qint64 size = static_cast<qint64>(format.value("filesize").toDouble());
    if (size <= 0) {
        size = static_cast<qint64>(format.value("filesize_approx").toDouble());
    }
    result.sizeBytes = size > 0 ? size : 0;
    result.sizeText = FormatUtils::formatSize(result.sizeBytes);
    return result;
}

QStringList MetadataTask::collectLanguages(const QJsonObject &tracks)
{
    QStringList languages;
    for (auto it = tracks.constBegin(); it != tracks.constEnd(); ++it) {
        if (it.value().toArray().isEmpty()) {
            continue;
        }
        if (!LanguageTable::isSupported(it.key())) {
            continue;
        }
        languages.append(it.key());
    }

    languages.sort();
    languages.removeDuplicates();
    return languages;
}
