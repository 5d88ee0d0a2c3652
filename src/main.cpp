#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QTextStream>
#include "models/queuemanager.h"
#include "services/queuecontroller.h"
#include "services/settingsmanager.h"
#include "services/toollocation.h"
#include "services/ytdlpengine.h"
#include "utils/languagetable.h"
#include "utils/logfile.h"
#include "utils/logging.h"
#include "version.h"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("mediadl");
    app.setApplicationVersion(MEDIADL_VERSION);
    app.setOrganizationName("mediadl");
    app.setOrganizationDomain("example.com");

    // Parse command line arguments
    QCommandLineParser parser;
    parser.setApplicationDescription("Queue-based media downloader driving yt-dlp");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("urls", "Media URLs to download, processed in order.", "<url>...");

    QCommandLineOption verboseOption(
        QStringList() << "V" << "verbose",
        "Enable verbose logging output");
    QCommandLineOption audioOption(
        QStringList() << "a" << "audio",
        "Download audio only");
    QCommandLineOption formatOption(
        QStringList() << "f" << "format",
        "Audio format: mp3, m4a, wav, flac or opus", "format");
    QCommandLineOption bitrateOption(
        QStringList() << "b" << "bitrate",
        "Audio bitrate in kbit/s: 320, 256, 192, 128 or 64", "kbps");
    QCommandLineOption containerOption(
        "container", "Video container: mp4, webm or mkv", "ext", "mp4");
    QCommandLineOption maxHeightOption(
        "max-height", "Highest video resolution to pick, e.g. 1080", "pixels");
    QCommandLineOption fpsOption(
        "fps", "Preferred video frame rate", "fps");
    QCommandLineOption formatIdOption(
        "format-id", "Exact engine format id of the video stream", "id");
    QCommandLineOption playlistOption(
        QStringList() << "p" << "playlist",
        "Download the whole playlist the URL belongs to");
    QCommandLineOption subtitlesOption(
        QStringList() << "s" << "subtitles",
        "Embed subtitles: a language code or 'all'", "lang");
    QCommandLineOption autoSubsOption(
        "auto-subs", "Include auto-generated captions");
    QCommandLineOption outputOption(
        QStringList() << "o" << "output",
        "Destination folder", "dir");
    QCommandLineOption rateLimitOption(
        "rate-limit", "Speed limit in KB/s, 0 for unlimited", "kbps");
    QCommandLineOption settingsOption(
        "settings", "Settings file to use", "ini");
    QCommandLineOption engineOption(
        "engine", "Path of the yt-dlp executable", "path");

    parser.addOptions({verboseOption, audioOption, formatOption, bitrateOption,
                       containerOption, maxHeightOption, fpsOption, formatIdOption,
                       playlistOption, subtitlesOption, autoSubsOption, outputOption,
                       rateLimitOption, settingsOption, engineOption});

    parser.process(app);

    // Set verbose logging flag
    mediadl::verboseLogging = parser.isSet(verboseOption);

    if (!LogFile::instance().install(LogFile::defaultLogPath())) {
        qWarning() << "Could not open log file" << LogFile::defaultLogPath();
    }

    if (mediadl::verboseLogging) {
        qDebug() << "Verbose logging enabled";
    }

    const QStringList urls = parser.positionalArguments();
    if (urls.isEmpty()) {
        parser.showHelp(1);
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    SettingsManager settings(parser.isSet(settingsOption)
                                 ? parser.value(settingsOption)
                                 : SettingsManager::defaultSettingsPath());

    // Option values are checked before anything is queued
    QVariantMap options;
    QueueItem::Mode mode = parser.isSet(audioOption) ? QueueItem::Mode::Audio : settings.defaultMode();

    const QString audioFormat = parser.value(formatOption).toLower();
    if (!audioFormat.isEmpty() && !SettingsManager::allowedAudioFormats().contains(audioFormat)) {
        err << "Unsupported audio format: " << audioFormat << Qt::endl;
        return 2;
    }
    const QString bitrate = parser.value(bitrateOption);
    if (!bitrate.isEmpty() && !SettingsManager::allowedAudioBitrates().contains(bitrate)) {
        err << "Unsupported bitrate: " << bitrate << Qt::endl;
        return 2;
    }
    const QString container = parser.value(containerOption).toLower();
    if (!QStringList({"mp4", "webm", "mkv"}).contains(container)) {
        err << "Unsupported container: " << container << Qt::endl;
        return 2;
    }

    options.insert(QueueOptions::AudioFormat, audioFormat.isEmpty() ? settings.defaultAudioFormat() : audioFormat);
    options.insert(QueueOptions::AudioBitrate, bitrate.isEmpty() ? settings.defaultAudioBitrate() : bitrate);
    options.insert(QueueOptions::VideoContainer, container);
    options.insert(QueueOptions::VideoMaxHeight, parser.value(maxHeightOption).toInt());
    options.insert(QueueOptions::VideoFps, parser.value(fpsOption).toInt());
    options.insert(QueueOptions::VideoFormatId, parser.value(formatIdOption));
    options.insert(QueueOptions::Playlist, parser.isSet(playlistOption));
    if (parser.isSet(autoSubsOption)) {
        options.insert(QueueOptions::AutoSubtitles, true);
    }

    if (parser.isSet(subtitlesOption)) {
        const QString language = parser.value(subtitlesOption);
        if (language.compare("all", Qt::CaseInsensitive) == 0) {
            options.insert(QueueOptions::Subtitle, QString(QueueOptions::AllSubtitles));
        } else if (LanguageTable::isSupported(language)) {
            options.insert(QueueOptions::Subtitle, QString("manual:%1").arg(language));
            LOG_VERBOSE() << "Subtitles:" << LanguageTable::displayName(language);
        } else {
            err << "Unknown subtitle language: " << language << Qt::endl;
            err << "Known codes: " << LanguageTable::supportedCodes().join(", ") << Qt::endl;
            return 2;
        }
    }

    const QString enginePath = parser.isSet(engineOption) ? parser.value(engineOption)
                                                          : settings.enginePath();
    YtDlpEngine engine(enginePath);

    const ToolLocation ffmpeg = FfmpegLocator::location();
    if (!ffmpeg.isAvailable()) {
        err << "Warning: ffmpeg not found, merging and conversion will fail" << Qt::endl;
    }

    QueueManager queue;
    QueueController controller(&queue, &engine, &settings);

    if (parser.isSet(outputOption)) {
        controller.setDestinationFolder(QDir(parser.value(outputOption)).absolutePath());
    }
    if (parser.isSet(rateLimitOption)) {
        controller.setRateLimitOverride(qMax(0, parser.value(rateLimitOption).toInt()));
    }

    for (const QString &url : urls) {
        queue.add(url.trimmed(), mode, options);
    }

    QObject::connect(&controller, &QueueController::itemStarted,
                     [&out, &queue](int index, const QString &url) {
        out << "[" << (index + 1) << "/" << queue.size() << "] " << url << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::progress,
                     [&out](int, double percent, const QString &message) {
        out << QString("  %1% %2").arg(percent, 5, 'f', 1).arg(message) << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::processingStarted,
                     [&out](int, const QString &message) {
        out << "  " << message << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::itemFinished,
                     [&out](int, const QString &message) {
        out << "  " << message << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::itemFailed,
                     [&err](int, const QString &message) {
        err << "  " << message << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::itemCancelled,
                     [&out](int, const QString &message) {
        out << "  " << message << Qt::endl;
    });
    QObject::connect(&controller, &QueueController::queueFinished,
                     [&out, &app](int finished, int failed, int cancelled) {
        out << QString("Queue finished: %1 completed, %2 failed, %3 cancelled.")
                   .arg(finished).arg(failed).arg(cancelled) << Qt::endl;
        app.exit(failed > 0 ? 1 : 0);
    });

    if (!controller.startQueue()) {
        err << "Nothing to download" << Qt::endl;
        return 1;
    }

    const int result = app.exec();
    settings.sync();
    LogFile::instance().uninstall();
    return result;
}
