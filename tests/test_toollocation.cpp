#include <QtTest>
#include <QFile>
#include <QTemporaryDir>

#include "services/toollocation.h"

class TestToolLocation : public QObject
{
    Q_OBJECT

private:
    static bool createExecutable(const QString &path, bool executable = true)
    {
        QFile file(path);
        if (!file.open(QIODevice::WriteOnly)) {
            return false;
        }
        file.write("#!/bin/sh\nexit 0\n");
        file.close();
        QFile::Permissions perms = QFile::ReadOwner | QFile::WriteOwner;
        if (executable) {
            perms |= QFile::ExeOwner;
        }
        return file.setPermissions(perms);
    }

private slots:
    void cleanup()
    {
        FfmpegLocator::setSearchDirectories(QStringList());
    }

    void testFoundInOverrideDirectory()
    {
        QTemporaryDir empty;
        QTemporaryDir tools;
        const QString path = tools.filePath(FfmpegLocator::executableName());
        QVERIFY(createExecutable(path));

        FfmpegLocator::setSearchDirectories({empty.path(), tools.path()});
        const ToolLocation location = FfmpegLocator::location();

        QCOMPARE(location.kind, ToolLocation::Kind::Found);
        QCOMPARE(location.path, QFileInfo(path).absoluteFilePath());
        QVERIFY(location.isAvailable());
    }

    void testNotFoundInOverrideDirectory()
    {
        QTemporaryDir empty;

        FfmpegLocator::setSearchDirectories({empty.path()});
        const ToolLocation location = FfmpegLocator::location();

        QCOMPARE(location.kind, ToolLocation::Kind::NotFound);
        QVERIFY(location.path.isEmpty());
        QVERIFY(!location.isAvailable());
    }

#ifndef Q_OS_WIN
    void testNonExecutableIgnored()
    {
        QTemporaryDir tools;
        QVERIFY(createExecutable(tools.filePath("ffmpeg"), false));

        FfmpegLocator::setSearchDirectories({tools.path()});

        QCOMPARE(FfmpegLocator::location().kind, ToolLocation::Kind::NotFound);
    }
#endif

    void testResultIsCachedUntilInvalidated()
    {
        QTemporaryDir tools;
        FfmpegLocator::setSearchDirectories({tools.path()});
        QCOMPARE(FfmpegLocator::location().kind, ToolLocation::Kind::NotFound);

        QVERIFY(createExecutable(tools.filePath(FfmpegLocator::executableName())));
        QCOMPARE(FfmpegLocator::location().kind, ToolLocation::Kind::NotFound);

        FfmpegLocator::invalidate();
        QCOMPARE(FfmpegLocator::location().kind, ToolLocation::Kind::Found);
    }

    void testConcurrentLookups()
    {
        QTemporaryDir tools;
        QVERIFY(createExecutable(tools.filePath(FfmpegLocator::executableName())));
        FfmpegLocator::setSearchDirectories({tools.path()});

        QList<QThread *> threads;
        QAtomicInt found;
        for (int i = 0; i < 8; ++i) {
            threads << QThread::create([&found]() {
                if (FfmpegLocator::location().kind == ToolLocation::Kind::Found) {
                    found.fetchAndAddRelaxed(1);
                }
            });
        }
        for (QThread *thread : threads) {
            thread->start();
        }
        for (QThread *thread : threads) {
            QVERIFY(thread->wait(5000));
        }
        qDeleteAll(threads);

        QCOMPARE(found.loadRelaxed(), 8);
    }
};

QTEST_MAIN(TestToolLocation)
#include "test_toollocation.moc"
