/**
 * @file mockretrievalengine.h
 * @brief Mock retrieval engine for unit and integration testing.
 *
 * This mock implements IRetrievalEngine and can be injected into the tasks
 * and the controller in place of the yt-dlp binding.
 */

#ifndef MOCKRETRIEVALENGINE_H
#define MOCKRETRIEVALENGINE_H

#include <QByteArray>
#include <QHash>
#include <QJsonArray>
#include <QList>
#include <QMutex>
#include <QStringList>
#include <atomic>
#include <functional>

#include "services/iretrievalengine.h"

/**
 * @brief Mock engine implementing IRetrievalEngine for testing.
 *
 * Behaviour is configured per URL. Calls arrive on worker threads, so all
 * state is guarded by a mutex and the mock never touches an event loop.
 *
 * @par Features:
 * - Configurable metadata records or metadata errors
 * - Scripted progress events passed to the hook
 * - Output files written into the transfer's home folder
 * - Transfer errors
 * - Blocking modes that wait for an abort or a release from the test
 * - Request tracking for test assertions
 *
 * @par Example usage:
 * @code
 * MockRetrievalEngine engine;
 * engine.mockSetInfo(url, record);
 * engine.mockSetOutputFile(url, "clip.mp4", "data");
 *
 * QueueController controller(&queue, &engine, &settings);
 * controller.startQueue();
 *
 * QTRY_COMPARE(engine.mockDownloadCount(), 1);
 * @endcode
 */
class MockRetrievalEngine : public IRetrievalEngine
{
public:
    static constexpr int BlockTimeoutMs = 10000;

    MockRetrievalEngine();
    ~MockRetrievalEngine() override;

    /// @name IRetrievalEngine Implementation
    /// @{
    [[nodiscard]] std::optional<QJsonObject> extractInfo(const QString &url,
                                                        const ExtractOptions &options,
                                                        QString *errorMessage) override;
    [[nodiscard]] EngineResult download(const QString &url,
                                        const TransferConfig &config,
                                        const ProgressHook &hook) override;
    /// @}

    /// @name Mock Configuration
    /// @{
    void mockSetInfo(const QString &url, const QJsonObject &record);
    void mockSetInfoError(const QString &url, const QString &message);
    void mockSetProgressEvents(const QString &url, const QList<ProgressEvent> &events);
    void mockSetOutputFile(const QString &url, const QString &relativePath, const QByteArray &content);
    void mockSetDownloadError(const QString &url, const QString &message);

    /// Keeps calling the hook after the scripted events until it returns Abort
    void mockSetBlockUntilAbort(const QString &url, bool block);

    /// Ignores Abort from the hook and completes the transfer normally
    void mockSetIgnoreAbort(const QString &url, bool ignore);

    /// Makes extractInfo() wait until mockReleaseInfo() is called
    void mockHoldInfo(bool hold);
    void mockReleaseInfo();

    /// Called on the worker thread at the start of every download()
    void mockSetOnDownloadStarted(const std::function<void(const QString &url)> &callback);

    void mockReset();
    /// @}

    /// @name Request Tracking
    /// @{
    [[nodiscard]] QStringList mockGetInfoRequests() const;
    [[nodiscard]] QStringList mockGetDownloadRequests() const;
    [[nodiscard]] QList<ExtractOptions> mockGetExtractOptions() const;
    [[nodiscard]] TransferConfig mockGetLastConfig() const;
    [[nodiscard]] int mockDownloadCount() const;
    [[nodiscard]] bool mockIsDownloadRunning() const { return downloadRunning_.load(); }
    [[nodiscard]] bool mockIsInfoWaiting() const { return infoWaiting_.load(); }
    /// @}

    /// Minimal metadata record with the given title and formats
    [[nodiscard]] static QJsonObject makeRecord(const QString &title,
                                                const QJsonArray &formats = QJsonArray());

    /// Downloading event with the given byte counts
    [[nodiscard]] static ProgressEvent downloading(qint64 downloaded, qint64 total,
                                                   const QString &speed = QString(),
                                                   const QString &eta = QString());
    [[nodiscard]] static ProgressEvent finished();

private:
    struct OutputFile {
        QString relativePath;
        QByteArray content;
    };

    struct UrlBehaviour {
        QJsonObject record;
        bool hasRecord = false;
        QString infoError;
        QList<ProgressEvent> events;
        QList<OutputFile> outputs;
        QString downloadError;
        bool blockUntilAbort = false;
        bool ignoreAbort = false;
    };

    [[nodiscard]] UrlBehaviour behaviourFor(const QString &url) const;

    mutable QMutex mutex_;
    QHash<QString, UrlBehaviour> behaviours_;
    QStringList infoRequests_;
    QStringList downloadRequests_;
    QList<ExtractOptions> extractOptions_;
    TransferConfig lastConfig_;
    std::function<void(const QString &)> onDownloadStarted_;

    std::atomic<bool> holdInfo_{false};
    std::atomic<bool> infoWaiting_{false};
    std::atomic<bool> downloadRunning_{false};
};

#endif // MOCKRETRIEVALENGINE_H
