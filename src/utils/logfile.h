/**
 * @file logfile.h
 * @brief Persistent application log backed by a Qt message handler.
 */

#ifndef LOGFILE_H
#define LOGFILE_H

#include <QFile>
#include <QMutex>
#include <QString>
#include <QTextStream>

/**
 * @brief Appends every Qt log message to a file on disk.
 *
 * Once installed, qDebug()/qInfo()/qWarning()/qCritical() output is written
 * to the log file as "yyyy-MM-dd hh:mm:ss | LEVEL | message". Warnings and
 * above are mirrored to stderr so they remain visible on the console.
 *
 * @par Example usage:
 * @code
 * LogFile::instance().install(LogFile::defaultLogPath());
 * qInfo() << "Download started";
 * @endcode
 */
class LogFile
{
public:
    static LogFile &instance();

    /**
     * @brief Opens @p path for appending and installs the message handler.
     * @return False if the file could not be opened; console logging is kept.
     */
    bool install(const QString &path);

    /**
     * @brief Restores the previous handler and closes the file.
     */
    void uninstall();

    [[nodiscard]] bool isInstalled() const { return installed_; }
    [[nodiscard]] QString path() const { return file_.fileName(); }

    /// Default location: <AppDataLocation>/logs/app.log
    [[nodiscard]] static QString defaultLogPath();

    /// Formats one log line (without trailing newline)
    [[nodiscard]] static QString formatLine(QtMsgType type, const QString &message);

private:
    LogFile() = default;
    ~LogFile();

    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);
    void write(QtMsgType type, const QString &msg);

    QMutex mutex_;
    QFile file_;
    QTextStream stream_;
    QtMessageHandler previousHandler_ = nullptr;
    bool installed_ = false;
};

#endif // LOGFILE_H
