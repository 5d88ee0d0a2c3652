#include "ytdlpengine.h"
#include "utils/logging.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcess>

namespace {

qint64 parseByteCount(const QString &field)
{
    bool ok = false;
    const double value = field.trimmed().toDouble(&ok);
    if (!ok || value < 0) {
        return 0;
    }
    return static_cast<qint64>(value);
}

QString parseText(const QString &field)
{
    const QString text = field.trimmed();
    if (text == QLatin1String("NA") || text == QLatin1String("None")) {
        return QString();
    }
    return text;
}

} // namespace

YtDlpEngine::YtDlpEngine(const QString &program)
    : program_(program)
{
}

YtDlpEngine::~YtDlpEngine() = default;

std::optional<QJsonObject> YtDlpEngine::extractInfo(const QString &url,
                                                    const ExtractOptions &options,
                                                    QString *errorMessage)
{
    QProcess process;
    process.start(program_, buildInfoArguments(url, options));
    if (!process.waitForStarted(StartTimeoutMs)) {
        if (errorMessage) {
            *errorMessage = QString("Failed to start %1: %2").arg(program_, process.errorString());
        }
        return std::nullopt;
    }

    // The engine enforces its own socket timeout, so wait without a limit
    process.waitForFinished(-1);

    const QByteArray output = process.readAllStandardOutput();
    const QString standardError = QString::fromUtf8(process.readAllStandardError());

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        if (errorMessage) {
            *errorMessage = errorFromOutput(standardError, process.exitCode());
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(output, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QString("Invalid metadata from %1: %2").arg(program_, parseError.errorString());
        }
        return std::nullopt;
    }

    return doc.object();
}

EngineResult YtDlpEngine::download(const QString &url,
                                   const TransferConfig &config,
                                   const ProgressHook &hook)
{
    const QStringList args = buildArguments(url, config);
    LOG_VERBOSE() << "YtDlpEngine: Running" << program_ << args.join(QLatin1Char(' '));

    QProcess process;
    process.start(program_, args);
    if (!process.waitForStarted(StartTimeoutMs)) {
        return EngineResult::failure(
            QString("Failed to start %1: %2").arg(program_, process.errorString()));
    }

    QByteArray standardError;
    bool aborted = false;

    auto handleLines = [&]() {
        while (!aborted && process.canReadLine()) {
            const QString line = QString::fromUtf8(process.readLine()).trimmed();
            const std::optional<ProgressEvent> event = parseProgressLine(line);
            if (!event) {
                if (!line.isEmpty()) {
                    LOG_VERBOSE() << "YtDlpEngine:" << line;
                }
                continue;
            }
            if (hook && hook(*event) == HookAction::Abort) {
                aborted = true;
            }
        }
    };

    while (!aborted && process.state() != QProcess::NotRunning) {
        process.waitForReadyRead(PollIntervalMs);
        standardError += process.readAllStandardError();
        handleLines();
    }

    if (aborted) {
        qInfo() << "YtDlpEngine: Aborting transfer of" << url;
        process.kill();
        process.waitForFinished(-1);
        return EngineResult::abortedByHook();
    }

    process.waitForFinished(-1);
    standardError += process.readAllStandardError();
    handleLines();
    if (aborted) {
        return EngineResult::abortedByHook();
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return EngineResult::failure(
            errorFromOutput(QString::fromUtf8(standardError), process.exitCode()));
    }
    return EngineResult::ok();
}

QStringList YtDlpEngine::buildInfoArguments(const QString &url, const ExtractOptions &options)
{
    QStringList args;
    args << "-J" << "--no-warnings";
    args << (options.noPlaylist ? "--no-playlist" : "--yes-playlist");
    if (options.flat) {
        args << "--flat-playlist";
    }
    args << "--" << url;
    return args;
}

QStringList YtDlpEngine::buildArguments(const QString &url, const TransferConfig &config)
{
    QStringList args;

    args << "--newline" << "--no-warnings";
    args << "--progress-template"
         << QString("download:%1|%(progress.status)s|%(progress.downloaded_bytes)s"
                    "|%(progress.total_bytes)s|%(progress.total_bytes_estimate)s"
                    "|%(progress._speed_str)s|%(progress._eta_str)s").arg(ProgressTag);
    args << "--progress-template"
         << QString("postprocess:%1|%(progress.status)s|%(progress.postprocessor)s").arg(PostprocessTag);

    // Output location
    args << "-o" << config.outputTemplate;
    if (!config.homePath.isEmpty()) {
        args << "-P" << QString("home:%1").arg(config.homePath);
    }
    if (config.overwrite) {
        args << "--force-overwrites";
    }
    args << (config.playlistMode ? "--yes-playlist" : "--no-playlist");

    // Format selection
    args << "-f" << config.formatSelector;
    if (!config.mergeOutputFormat.isEmpty()) {
        args << "--merge-output-format" << config.mergeOutputFormat;
    }
    if (config.rateLimitBytesPerSecond > 0) {
        args << "--limit-rate" << QString::number(config.rateLimitBytesPerSecond);
    }
    if (!config.ffmpegLocation.isEmpty()) {
        args << "--ffmpeg-location" << config.ffmpegLocation;
    }

    // Post-processing
    for (const PostProcessor &pp : config.postProcessors) {
        switch (pp.kind) {
        case PostProcessor::Kind::ExtractAudio:
            args << "-x" << "--audio-format" << pp.preferredCodec;
            if (!pp.preferredQuality.isEmpty()) {
                args << "--audio-quality" << QString("%1K").arg(pp.preferredQuality);
            }
            break;
        case PostProcessor::Kind::EmbedThumbnail:
            args << "--embed-thumbnail";
            break;
        case PostProcessor::Kind::Metadata:
            args << "--embed-metadata";
            if (pp.addChapters) {
                args << "--embed-chapters";
            }
            break;
        case PostProcessor::Kind::EmbedSubtitle:
            args << "--embed-subs";
            break;
        }
    }

    if (config.subtitles.enabled) {
        args << "--write-subs";
        if (config.subtitles.includeAutomatic) {
            args << "--write-auto-subs";
        }
        args << "--sub-format" << config.subtitles.format;
        args << "--convert-subs" << config.subtitles.convertTo;
        args << "--sub-langs" << config.subtitles.languages.join(QLatin1Char(','));
        args << "--compat-options" << "no-keep-subs";
    }
    if (config.keepVideo) {
        args << "-k";
    }

    // Resilience
    args << "--retries" << QString::number(config.resilience.retries);
    args << "--fragment-retries" << QString::number(config.resilience.fragmentRetries);
    args << "--socket-timeout" << QString::number(config.resilience.socketTimeoutSeconds);
    args << "--concurrent-fragments" << QString::number(config.resilience.concurrentFragments);
    args << "--file-access-retries" << QString::number(config.resilience.fileAccessRetries);

    args << "--" << url;
    return args;
}

std::optional<ProgressEvent> YtDlpEngine::parseProgressLine(const QString &line)
{
    const QStringList fields = line.trimmed().split(QLatin1Char('|'));
    if (fields.isEmpty()) {
        return std::nullopt;
    }

    ProgressEvent event;

    if (fields.first() == QLatin1String(PostprocessTag)) {
        if (fields.size() < 2) {
            return std::nullopt;
        }
        // Any post-processing activity means the raw transfer is over
        event.status = ProgressEvent::Status::Finished;
        return event;
    }

    if (fields.first() != QLatin1String(ProgressTag) || fields.size() < 7) {
        return std::nullopt;
    }

    const QString status = fields.at(1).trimmed();
    if (status == QLatin1String("downloading")) {
        event.status = ProgressEvent::Status::Downloading;
    } else if (status == QLatin1String("finished")) {
        event.status = ProgressEvent::Status::Finished;
    } else if (status == QLatin1String("error")) {
        event.status = ProgressEvent::Status::Error;
    } else {
        return std::nullopt;
    }

    event.downloadedBytes = parseByteCount(fields.at(2));
    event.totalBytes = parseByteCount(fields.at(3));
    event.totalBytesEstimate = parseByteCount(fields.at(4));
    event.speedText = parseText(fields.at(5));
    event.etaText = parseText(fields.at(6));
    return event;
}

QString YtDlpEngine::errorFromOutput(const QString &standardError, int exitCode)
{
    const QStringList lines = standardError.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (auto it = lines.crbegin(); it != lines.crend(); ++it) {
        const QString line = it->trimmed();
        if (line.startsWith(QLatin1String("ERROR:"))) {
            return line.mid(6).trimmed();
        }
    }

    const QString trimmed = standardError.trimmed();
    if (!trimmed.isEmpty()) {
        return trimmed;
    }
    return QString("Engine exited with code %1").arg(exitCode);
}
