/**
 * @file settingsmanager.h
 * @brief Persistent user preferences backed by an INI file.
 */

#ifndef SETTINGSMANAGER_H
#define SETTINGSMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QStringList>
#include <memory>

#include "models/queueitem.h"

/**
 * @brief Typed access to the user's download preferences.
 *
 * Every getter validates the stored value and falls back to the default
 * when it is missing or not one of the allowed values, so a hand-edited
 * file can never feed garbage into a transfer configuration.
 *
 * @par Example usage:
 * @code
 * SettingsManager settings(SettingsManager::defaultSettingsPath());
 * qint64 limit = settings.speedLimitKb() * 1024;
 * @endcode
 */
class SettingsManager : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *KeyDefaultFolder = "general/default_folder";
    static constexpr const char *KeyDefaultMode = "general/default_mode";
    static constexpr const char *KeyDefaultAudioFormat = "general/default_audio_format";
    static constexpr const char *KeyDefaultAudioBitrate = "general/default_audio_bitrate";
    static constexpr const char *KeySpeedLimit = "downloads/speed_limit";
    static constexpr const char *KeyIncludeAutoSubs = "subtitles/include_auto_generated";
    static constexpr const char *KeyEnginePath = "engine/path";

    /**
     * @brief Opens (or creates) the INI file at @p filePath.
     *
     * The parent directory is created if needed.
     */
    explicit SettingsManager(const QString &filePath, QObject *parent = nullptr);
    ~SettingsManager() override;

    /// <AppDataLocation>/settings/settings.ini
    [[nodiscard]] static QString defaultSettingsPath();

    [[nodiscard]] static QStringList allowedAudioFormats();
    [[nodiscard]] static QStringList allowedAudioBitrates();

    [[nodiscard]] QString defaultFolder() const;
    void setDefaultFolder(const QString &path);

    [[nodiscard]] QueueItem::Mode defaultMode() const;
    void setDefaultMode(QueueItem::Mode mode);

    [[nodiscard]] QString defaultAudioFormat() const;
    bool setDefaultAudioFormat(const QString &format);

    [[nodiscard]] QString defaultAudioBitrate() const;
    bool setDefaultAudioBitrate(const QString &bitrate);

    /// KB/s, 0 means unlimited; negative stored values read as 0
    [[nodiscard]] int speedLimitKb() const;
    void setSpeedLimitKb(int kilobytesPerSecond);

    [[nodiscard]] bool includeAutoSubtitles() const;
    void setIncludeAutoSubtitles(bool enabled);

    /// Engine executable, "yt-dlp" (resolved via PATH) by default
    [[nodiscard]] QString enginePath() const;
    void setEnginePath(const QString &path);

    /// Writes pending changes to disk
    void sync();

    [[nodiscard]] QString fileName() const;

signals:
    void settingsChanged(const QString &key);

private:
    [[nodiscard]] QVariant value(const char *key) const;
    void setValue(const char *key, const QVariant &value);

    std::unique_ptr<QSettings> settings_;
};

#endif // SETTINGSMANAGER_H
