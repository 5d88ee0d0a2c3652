#include <QtTest>
#include <QSettings>
#include <QSignalSpy>
#include <QTemporaryDir>

#include "services/settingsmanager.h"

class TestSettingsManager : public QObject
{
    Q_OBJECT

private:
    QTemporaryDir *tempDir_ = nullptr;

    QString settingsPath() const { return tempDir_->filePath("config/settings.ini"); }

    void writeRaw(const QString &key, const QVariant &value)
    {
        QSettings raw(settingsPath(), QSettings::IniFormat);
        raw.setValue(key, value);
        raw.sync();
    }

private slots:
    void init()
    {
        tempDir_ = new QTemporaryDir();
        QVERIFY(tempDir_->isValid());
    }

    void cleanup()
    {
        delete tempDir_;
        tempDir_ = nullptr;
    }

    void testDefaults()
    {
        SettingsManager settings(settingsPath());

        QCOMPARE(settings.defaultFolder(), QDir(QDir::homePath()).filePath("Downloads"));
        QCOMPARE(settings.defaultMode(), QueueItem::Mode::Video);
        QCOMPARE(settings.defaultAudioFormat(), QString("mp3"));
        QCOMPARE(settings.defaultAudioBitrate(), QString("320"));
        QCOMPARE(settings.speedLimitKb(), 0);
        QVERIFY(!settings.includeAutoSubtitles());
        QCOMPARE(settings.enginePath(), QString("yt-dlp"));
        QVERIFY(QDir(tempDir_->filePath("config")).exists());
    }

    void testValuesPersist()
    {
        {
            SettingsManager settings(settingsPath());
            settings.setDefaultFolder("/data/media");
            settings.setDefaultMode(QueueItem::Mode::Audio);
            QVERIFY(settings.setDefaultAudioFormat("flac"));
            QVERIFY(settings.setDefaultAudioBitrate("192"));
            settings.setSpeedLimitKb(750);
            settings.setIncludeAutoSubtitles(true);
            settings.setEnginePath("  /opt/bin/yt-dlp ");
            settings.sync();
        }

        SettingsManager reopened(settingsPath());
        QCOMPARE(reopened.defaultFolder(), QString("/data/media"));
        QCOMPARE(reopened.defaultMode(), QueueItem::Mode::Audio);
        QCOMPARE(reopened.defaultAudioFormat(), QString("flac"));
        QCOMPARE(reopened.defaultAudioBitrate(), QString("192"));
        QCOMPARE(reopened.speedLimitKb(), 750);
        QVERIFY(reopened.includeAutoSubtitles());
        QCOMPARE(reopened.enginePath(), QString("/opt/bin/yt-dlp"));
    }

    void testSettersRejectInvalidValues()
    {
        SettingsManager settings(settingsPath());
        QSignalSpy changedSpy(&settings, &SettingsManager::settingsChanged);

        QVERIFY(!settings.setDefaultAudioFormat("aac"));
        QVERIFY(!settings.setDefaultAudioBitrate("1000"));
        QCOMPARE(changedSpy.count(), 0);
        QCOMPARE(settings.defaultAudioFormat(), QString("mp3"));

        settings.setSpeedLimitKb(-50);
        QCOMPARE(settings.speedLimitKb(), 0);
        QCOMPARE(changedSpy.count(), 1);
        QCOMPARE(changedSpy.at(0).at(0).toString(), QString(SettingsManager::KeySpeedLimit));
    }

    void testHandEditedGarbageFallsBack()
    {
        writeRaw(SettingsManager::KeyDefaultAudioFormat, "wma");
        writeRaw(SettingsManager::KeyDefaultAudioBitrate, "999");
        writeRaw(SettingsManager::KeySpeedLimit, "fast");
        writeRaw(SettingsManager::KeyDefaultMode, "Karaoke");
        writeRaw(SettingsManager::KeyDefaultFolder, "");

        SettingsManager settings(settingsPath());

        QCOMPARE(settings.defaultAudioFormat(), QString("mp3"));
        QCOMPARE(settings.defaultAudioBitrate(), QString("320"));
        QCOMPARE(settings.speedLimitKb(), 0);
        QCOMPARE(settings.defaultMode(), QueueItem::Mode::Video);
        QCOMPARE(settings.defaultFolder(), QDir(QDir::homePath()).filePath("Downloads"));
    }

    void testNegativeStoredLimit()
    {
        writeRaw(SettingsManager::KeySpeedLimit, -20);

        SettingsManager settings(settingsPath());
        QCOMPARE(settings.speedLimitKb(), 0);
    }

    void testAllowedValues()
    {
        QCOMPARE(SettingsManager::allowedAudioFormats().size(), 5);
        QVERIFY(SettingsManager::allowedAudioFormats().contains("opus"));
        QCOMPARE(SettingsManager::allowedAudioBitrates().first(), QString("320"));
        QVERIFY(SettingsManager::defaultSettingsPath().endsWith("settings/settings.ini"));
    }

    void testFileName()
    {
        SettingsManager settings(settingsPath());
        QCOMPARE(QFileInfo(settings.fileName()).fileName(), QString("settings.ini"));
    }
};

QTEST_MAIN(TestSettingsManager)
#include "test_settingsmanager.moc"
