#include "transferconfigbuilder.h"
#include "settingsmanager.h"
#include "utils/logging.h"

#include <QDir>

TransferConfigBuilder::TransferConfigBuilder(const SettingsManager *settings)
    : settings_(settings)
{
}

TransferConfig TransferConfigBuilder::build(const QueueItem &item,
                                            const MediaInfo &info,
                                            const QString &scratchDirectory,
                                            const QString &destination,
                                            const ToolLocation &ffmpeg) const
{
    const bool playlistMode = item.options.value(QueueOptions::Playlist).toBool();
    TransferConfig config = baseConfig(playlistMode, scratchDirectory, destination);

    if (ffmpeg.kind == ToolLocation::Kind::Found) {
        config.ffmpegLocation = ffmpeg.path;
    }
    if (rateLimitOverrideKb_ >= 0) {
        config.rateLimitBytesPerSecond = static_cast<qint64>(rateLimitOverrideKb_) * 1024;
    } else if (settings_) {
        config.rateLimitBytesPerSecond = static_cast<qint64>(settings_->speedLimitKb()) * 1024;
    }

    if (item.mode == QueueItem::Mode::Audio) {
        applyAudioOptions(config, item);
    } else {
        applyVideoOptions(config, item, info);
        applySubtitleOptions(config, item, info);
    }

    LOG_VERBOSE() << "TransferConfigBuilder:" << queueModeToString(item.mode)
                  << "selector" << config.formatSelector
                  << "target" << config.targetExtension
                  << "suffix" << config.fileNameSuffix;
    return config;
}

TransferConfig TransferConfigBuilder::baseConfig(bool playlistMode,
                                                 const QString &scratchDirectory,
                                                 const QString &destination)
{
    TransferConfig config;
    config.playlistMode = playlistMode;
    config.destinationDirectory = destination;
    config.overwrite = true;
    config.targetExtension = QStringLiteral("mp4");

    if (playlistMode) {
        config.outputTemplate = QDir(destination).filePath(
            QStringLiteral("%(playlist_title)s/%(playlist_index)03d - %(title)s.%(ext)s"));
        config.homePath = destination;
    } else {
        config.outputTemplate = QDir(scratchDirectory).filePath(QStringLiteral("%(title)s.%(ext)s"));
        config.homePath = scratchDirectory;
    }
    return config;
}

void TransferConfigBuilder::applyAudioOptions(TransferConfig &config, const QueueItem &item) const
{
    QString format = item.options.value(QueueOptions::AudioFormat).toString();
    if (format.isEmpty()) {
        format = settings_ ? settings_->defaultAudioFormat() : QStringLiteral("mp3");
    }
    QString bitrate = item.options.value(QueueOptions::AudioBitrate).toString();
    if (bitrate.isEmpty()) {
        bitrate = settings_ ? settings_->defaultAudioBitrate() : QStringLiteral("320");
    }

    config.targetExtension = format;
    config.formatSelector = QStringLiteral("bestaudio/best");
    config.postProcessors.append(PostProcessor::extractAudio(format, bitrate));
    if (supportsThumbnail(format)) {
        config.postProcessors.append(PostProcessor::of(PostProcessor::Kind::EmbedThumbnail));
    }
    if (supportsMetadata(format)) {
        config.postProcessors.append(PostProcessor::of(PostProcessor::Kind::Metadata));
    }
    config.fileNameSuffix = audioSuffix(format, bitrate);
}

void TransferConfigBuilder::applyVideoOptions(TransferConfig &config,
                                              const QueueItem &item,
                                              const MediaInfo &info) const
{
    const QString formatId = item.options.value(QueueOptions::VideoFormatId).toString();
    const int maxHeight = item.options.value(QueueOptions::VideoMaxHeight).toInt();
    const int fps = item.options.value(QueueOptions::VideoFps).toInt();
    QString container = item.options.value(QueueOptions::VideoContainer).toString().toLower();
    if (container.isEmpty()) {
        container = QStringLiteral("mp4");
    }

    const MediaFormat *selected = nullptr;
    QString selectedId;
    if (!formatId.isEmpty()) {
        selected = info.findFormat(formatId);
        selectedId = formatId;
    } else if (maxHeight > 0 || fps > 0) {
        selected = selectFormat(info.formats, maxHeight, fps);
        if (selected) {
            selectedId = selected->formatId;
        }
    }

    if (selectedId.isEmpty()) {
        config.targetExtension = QStringLiteral("mp4");
        config.formatSelector = QStringLiteral("bestvideo+bestaudio/best");
        config.mergeOutputFormat = QStringLiteral("mp4");
        return;
    }

    config.targetExtension = container;
    if (selected && selected->hasAudio) {
        config.formatSelector = selectedId;
    } else {
        config.formatSelector = QString("%1+%2").arg(selectedId, audioSelectorFor(container));
        config.mergeOutputFormat = container;
    }
    config.fileNameSuffix = videoSuffix(selected);
}

void TransferConfigBuilder::applySubtitleOptions(TransferConfig &config,
                                                 const QueueItem &item,
                                                 const MediaInfo &info) const
{
    const QString selection = item.options.value(QueueOptions::Subtitle).toString();
    if (selection.isEmpty()) {
        return;
    }

    bool includeAutomatic = settings_ && settings_->includeAutoSubtitles();
    if (item.options.contains(QueueOptions::AutoSubtitles)) {
        includeAutomatic = item.options.value(QueueOptions::AutoSubtitles).toBool();
    }
    if (selection.startsWith(QLatin1String("auto:"))) {
        includeAutomatic = true;
    }

    const QStringList languages = subtitleLanguagesFor(selection, info, includeAutomatic);
    if (languages.isEmpty()) {
        qInfo() << "TransferConfigBuilder: No subtitles available for" << item.url;
        return;
    }

    config.mergeOutputFormat = QStringLiteral("mkv");
    config.targetExtension = QStringLiteral("mkv");
    config.keepVideo = true;
    config.subtitles.enabled = true;
    config.subtitles.languages = languages;
    config.subtitles.includeAutomatic = includeAutomatic;

    config.postProcessors.append(PostProcessor::of(PostProcessor::Kind::Metadata, true));
    config.postProcessors.append(PostProcessor::of(PostProcessor::Kind::EmbedThumbnail));
    config.postProcessors.append(PostProcessor::of(PostProcessor::Kind::EmbedSubtitle));
}

QString TransferConfigBuilder::audioSuffix(const QString &format, const QString &bitrate)
{
    QStringList parts;
    if (!format.isEmpty()) {
        parts << format.toLower();
    }
    if (!bitrate.isEmpty()) {
        parts << QString("%1kbps").arg(bitrate);
    }
    if (parts.isEmpty()) {
        return QString();
    }
    return QString("[%1]").arg(parts.join(QLatin1Char(' ')));
}

QString TransferConfigBuilder::videoSuffix(const MediaFormat *format)
{
    if (!format) {
        return QString();
    }

    QString resolution;
    if (format->width > 0 && format->height > 0) {
        resolution = QString("%1x%2").arg(format->width).arg(format->height);
    }

    QString codec = format->videoCodec.section(QLatin1Char('.'), 0, 0);
    if (codec == QLatin1String("none")) {
        codec.clear();
    }

    if (!resolution.isEmpty() && !codec.isEmpty()) {
        return QString("[%1 %2]").arg(resolution, codec);
    }
    if (!resolution.isEmpty()) {
        return QString("[%1]").arg(resolution);
    }
    if (!codec.isEmpty()) {
        return QString("[%1]").arg(codec);
    }
    return QString();
}

QString TransferConfigBuilder::audioSelectorFor(const QString &container)
{
    if (container == QLatin1String("mp4")) {
        return QStringLiteral("bestaudio[ext=m4a]/bestaudio/best");
    }
    if (container == QLatin1String("webm")) {
        return QStringLiteral("bestaudio[ext=webm]/bestaudio/best");
    }
    return QStringLiteral("bestaudio/best");
}

bool TransferConfigBuilder::supportsThumbnail(const QString &audioFormat)
{
    return audioFormat == QLatin1String("mp3")
        || audioFormat == QLatin1String("m4a")
        || audioFormat == QLatin1String("flac");
}

bool TransferConfigBuilder::supportsMetadata(const QString &audioFormat)
{
    return supportsThumbnail(audioFormat)
        || audioFormat == QLatin1String("opus")
        || audioFormat == QLatin1String("wav");
}

const MediaFormat *TransferConfigBuilder::selectFormat(const QList<MediaFormat> &formats,
                                                       int maxHeight, int fps)
{
    const MediaFormat *heightMatch = nullptr;
    for (const MediaFormat &format : formats) {
        if (maxHeight > 0 && format.height > maxHeight) {
            continue;
        }
        if (fps <= 0 || format.fpsRounded == fps) {
            return &format;
        }
        if (!heightMatch) {
            heightMatch = &format;
        }
    }
    return heightMatch;
}

QStringList TransferConfigBuilder::subtitleLanguagesFor(const QString &selection,
                                                        const MediaInfo &info,
                                                        bool includeAutomatic)
{
    if (selection.isEmpty()) {
        return QStringList();
    }

    if (selection == QLatin1String(QueueOptions::AllSubtitles)) {
        QStringList languages = info.subtitleLanguages;
        if (includeAutomatic) {
            languages += info.automaticCaptionLanguages;
        }
        languages.sort();
        languages.removeDuplicates();
        return languages;
    }

    const int colon = selection.indexOf(QLatin1Char(':'));
    if (selection.startsWith(QLatin1String("manual:")) || selection.startsWith(QLatin1String("auto:"))) {
        const QString language = selection.mid(colon + 1).trimmed();
        return language.isEmpty() ? QStringList() : QStringList{language};
    }
    return QStringList{selection};
}
