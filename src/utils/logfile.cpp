#include "logfile.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <QStandardPaths>

#include <cstdio>

LogFile &LogFile::instance()
{
    static LogFile inst;
    return inst;
}

LogFile::~LogFile()
{
    uninstall();
}

bool LogFile::install(const QString &path)
{
    QMutexLocker locker(&mutex_);

    if (installed_) {
        return true;
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    file_.setFileName(path);
    if (!file_.open(QIODevice::Append | QIODevice::Text)) {
        return false;
    }

    stream_.setDevice(&file_);
    stream_ << "--- session start ---\n";
    stream_.flush();

    previousHandler_ = qInstallMessageHandler(&LogFile::messageHandler);
    installed_ = true;
    return true;
}

void LogFile::uninstall()
{
    QMutexLocker locker(&mutex_);

    if (!installed_) {
        return;
    }

    qInstallMessageHandler(previousHandler_);
    previousHandler_ = nullptr;
    installed_ = false;

    stream_.flush();
    stream_.setDevice(nullptr);
    file_.close();
}

QString LogFile::defaultLogPath()
{
    QString base = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (base.isEmpty()) {
        base = QDir::homePath() + "/.mediadl";
    }
    return base + "/logs/app.log";
}

QString LogFile::formatLine(QtMsgType type, const QString &message)
{
    const char *level = "DEBUG";
    switch (type) {
    case QtDebugMsg:
        level = "DEBUG";
        break;
    case QtInfoMsg:
        level = "INFO";
        break;
    case QtWarningMsg:
        level = "WARNING";
        break;
    case QtCriticalMsg:
        level = "ERROR";
        break;
    case QtFatalMsg:
        level = "FATAL";
        break;
    }

    return QString("%1 | %2 | %3")
        .arg(QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss"),
             QString::fromLatin1(level),
             message);
}

void LogFile::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context)
    instance().write(type, msg);
}

void LogFile::write(QtMsgType type, const QString &msg)
{
    const QString line = formatLine(type, msg);

    {
        QMutexLocker locker(&mutex_);
        if (stream_.device()) {
            stream_ << line << '\n';
            // Flush eagerly on anything that may precede a crash or exit
            if (type != QtDebugMsg && type != QtInfoMsg) {
                stream_.flush();
            }
        }
    }

    if (type != QtDebugMsg && type != QtInfoMsg) {
        fprintf(stderr, "%s\n", line.toLocal8Bit().constData());
        fflush(stderr);
    }
}
