#include "settingsmanager.h"
#include "utils/logging.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace {

QVariant defaultValue(const QString &key)
{
    if (key == QLatin1String(SettingsManager::KeyDefaultFolder)) {
        return QDir(QDir::homePath()).filePath(QStringLiteral("Downloads"));
    }
    if (key == QLatin1String(SettingsManager::KeyDefaultMode)) {
        return QStringLiteral("Video");
    }
    if (key == QLatin1String(SettingsManager::KeyDefaultAudioFormat)) {
        return QStringLiteral("mp3");
    }
    if (key == QLatin1String(SettingsManager::KeyDefaultAudioBitrate)) {
        return QStringLiteral("320");
    }
    if (key == QLatin1String(SettingsManager::KeySpeedLimit)) {
        return 0;
    }
    if (key == QLatin1String(SettingsManager::KeyIncludeAutoSubs)) {
        return false;
    }
    if (key == QLatin1String(SettingsManager::KeyEnginePath)) {
        return QStringLiteral("yt-dlp");
    }
    return QVariant();
}

} // namespace

SettingsManager::SettingsManager(const QString &filePath, QObject *parent)
    : QObject(parent)
{
    const QString dir = QFileInfo(filePath).absolutePath();
    if (!QDir().mkpath(dir)) {
        qWarning() << "SettingsManager: Cannot create settings folder" << dir;
    }
    settings_ = std::make_unique<QSettings>(filePath, QSettings::IniFormat);
    LOG_VERBOSE() << "SettingsManager: Using" << settings_->fileName();
}

SettingsManager::~SettingsManager()
{
    settings_->sync();
}

QString SettingsManager::defaultSettingsPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir(QDir::homePath()).filePath(QStringLiteral(".mediadl"));
    }
    return QDir(base).filePath(QStringLiteral("settings/settings.ini"));
}

QStringList SettingsManager::allowedAudioFormats()
{
    return {QStringLiteral("mp3"), QStringLiteral("m4a"), QStringLiteral("wav"),
            QStringLiteral("flac"), QStringLiteral("opus")};
}

QStringList SettingsManager::allowedAudioBitrates()
{
    return {QStringLiteral("320"), QStringLiteral("256"), QStringLiteral("192"),
            QStringLiteral("128"), QStringLiteral("64")};
}

QString SettingsManager::defaultFolder() const
{
    const QString folder = value(KeyDefaultFolder).toString();
    return folder.isEmpty() ? defaultValue(KeyDefaultFolder).toString() : folder;
}

void SettingsManager::setDefaultFolder(const QString &path)
{
    setValue(KeyDefaultFolder, path);
}

QueueItem::Mode SettingsManager::defaultMode() const
{
    return value(KeyDefaultMode).toString() == QLatin1String("Audio")
        ? QueueItem::Mode::Audio
        : QueueItem::Mode::Video;
}

void SettingsManager::setDefaultMode(QueueItem::Mode mode)
{
    setValue(KeyDefaultMode, QString::fromLatin1(queueModeToString(mode)));
}

QString SettingsManager::defaultAudioFormat() const
{
    const QString format = value(KeyDefaultAudioFormat).toString();
    return allowedAudioFormats().contains(format) ? format
                                                  : defaultValue(KeyDefaultAudioFormat).toString();
}

bool SettingsManager::setDefaultAudioFormat(const QString &format)
{
    if (!allowedAudioFormats().contains(format)) {
        qWarning() << "SettingsManager: Rejected audio format" << format;
        return false;
    }
    setValue(KeyDefaultAudioFormat, format);
    return true;
}

QString SettingsManager::defaultAudioBitrate() const
{
    const QString bitrate = value(KeyDefaultAudioBitrate).toString();
    return allowedAudioBitrates().contains(bitrate) ? bitrate
                                                    : defaultValue(KeyDefaultAudioBitrate).toString();
}

bool SettingsManager::setDefaultAudioBitrate(const QString &bitrate)
{
    if (!allowedAudioBitrates().contains(bitrate)) {
        qWarning() << "SettingsManager: Rejected audio bitrate" << bitrate;
        return false;
    }
    setValue(KeyDefaultAudioBitrate, bitrate);
    return true;
}

int SettingsManager::speedLimitKb() const
{
    bool ok = false;
    const int limit = value(KeySpeedLimit).toInt(&ok);
    if (!ok || limit < 0) {
        return 0;
    }
    return limit;
}

void SettingsManager::setSpeedLimitKb(int kilobytesPerSecond)
{
    setValue(KeySpeedLimit, qMax(0, kilobytesPerSecond));
}

bool SettingsManager::includeAutoSubtitles() const
{
    return value(KeyIncludeAutoSubs).toBool();
}

void SettingsManager::setIncludeAutoSubtitles(bool enabled)
{
    setValue(KeyIncludeAutoSubs, enabled);
}

QString SettingsManager::enginePath() const
{
    const QString path = value(KeyEnginePath).toString().trimmed();
    return path.isEmpty() ? defaultValue(KeyEnginePath).toString() : path;
}

void SettingsManager::setEnginePath(const QString &path)
{
    setValue(KeyEnginePath, path.trimmed());
}

void SettingsManager::sync()
{
    settings_->sync();
    if (settings_->status() != QSettings::NoError) {
        qWarning() << "SettingsManager: Could not write" << settings_->fileName();
    }
}

QString SettingsManager::fileName() const
{
    return settings_->fileName();
}

QVariant SettingsManager::value(const char *key) const
{
    const QString name = QString::fromLatin1(key);
    return settings_->value(name, defaultValue(name));
}

void SettingsManager::setValue(const char *key, const QVariant &value)
{
    const QString name = QString::fromLatin1(key);
    settings_->setValue(name, value);
    emit settingsChanged(name);
}
