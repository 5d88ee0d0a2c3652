/**
 * @file iretrievalengine.h
 * @brief Interface to the external media retrieval engine.
 *
 * This interface allows dependency injection of engine bindings, enabling
 * runtime swapping between the yt-dlp process binding and mock
 * implementations for testing.
 */

#ifndef IRETRIEVALENGINE_H
#define IRETRIEVALENGINE_H

#include <QJsonObject>
#include <QString>
#include <functional>
#include <optional>

#include "transferconfig.h"

/**
 * @brief One invocation of the engine's progress hook.
 */
struct ProgressEvent {
    enum class Status {
        Downloading,  ///< Raw transfer in progress
        Finished,     ///< Raw transfer of one stream finished, post-processing follows
        Error         ///< Engine reported a stream-level error
    };

    Status status = Status::Downloading;
    qint64 downloadedBytes = 0;
    qint64 totalBytes = 0;          ///< 0 if unknown
    qint64 totalBytesEstimate = 0;  ///< 0 if unknown
    QString speedText;              ///< Engine-formatted rate, may contain ANSI escapes
    QString etaText;                ///< Engine-formatted remaining time, may be empty

    /// Exact total if known, else the estimate, else 0
    [[nodiscard]] qint64 effectiveTotal() const
    {
        return totalBytes > 0 ? totalBytes : totalBytesEstimate;
    }
};

/**
 * @brief Value returned by a progress hook.
 */
enum class HookAction {
    Continue,  ///< Keep going
    Abort      ///< Unwind the in-flight engine call as soon as possible
};

using ProgressHook = std::function<HookAction(const ProgressEvent &)>;

/**
 * @brief Outcome of an engine transfer call.
 */
struct EngineResult {
    bool success = false;
    bool aborted = false;     ///< True if a hook returned HookAction::Abort
    QString errorMessage;     ///< Engine error text when !success

    static EngineResult ok() { EngineResult r; r.success = true; return r; }
    static EngineResult failure(const QString &message)
    {
        EngineResult r;
        r.errorMessage = message;
        return r;
    }
    static EngineResult abortedByHook()
    {
        EngineResult r;
        r.aborted = true;
        r.errorMessage = QStringLiteral("Cancelled");
        return r;
    }
};

/**
 * @brief Options for a metadata extraction call.
 */
struct ExtractOptions {
    bool noPlaylist = true;   ///< Resolve a single item even if the URL names a collection
    bool flat = false;        ///< Do not resolve nested entries
};

/**
 * @brief Abstract interface to the retrieval engine.
 *
 * Both calls block until the engine returns and are invoked from worker
 * threads, so implementations must be safe to call from any thread. The
 * engine enforces its own socket timeout and retry policy.
 *
 * @par Example usage:
 * @code
 * IRetrievalEngine *engine = new YtDlpEngine("yt-dlp");
 *
 * QString error;
 * auto info = engine->extractInfo(url, ExtractOptions(), &error);
 *
 * EngineResult result = engine->download(url, config, [](const ProgressEvent &e) {
 *     return HookAction::Continue;
 * });
 * @endcode
 */
class IRetrievalEngine
{
public:
    virtual ~IRetrievalEngine() = default;

    /**
     * @brief Fetches the metadata record for @p url without transferring media.
     * @param errorMessage Receives the engine error text on failure (may be null).
     * @return The raw record (formats, subtitles, automatic_captions, title, ...)
     *         or std::nullopt on failure.
     */
    [[nodiscard]] virtual std::optional<QJsonObject> extractInfo(const QString &url,
                                                                const ExtractOptions &options,
                                                                QString *errorMessage) = 0;

    /**
     * @brief Performs the transfer described by @p config.
     * @param hook Called repeatedly with progress; returning Abort unwinds the call.
     */
    [[nodiscard]] virtual EngineResult download(const QString &url,
                                                const TransferConfig &config,
                                                const ProgressHook &hook) = 0;
};

#endif // IRETRIEVALENGINE_H
