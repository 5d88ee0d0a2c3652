/**
 * @file ytdlpengine.h
 * @brief IRetrievalEngine binding that drives the yt-dlp executable.
 */

#ifndef YTDLPENGINE_H
#define YTDLPENGINE_H

#include <QString>
#include <QStringList>
#include <optional>

#include "iretrievalengine.h"

/**
 * @brief Runs yt-dlp as a child process for every call.
 *
 * Each call owns its own QProcess, created on the calling thread and driven
 * with the blocking waitFor* API, so concurrent calls from different worker
 * threads do not share state.
 *
 * Progress is read from stdout, one line per event, in a fixed
 * machine-readable layout requested with --progress-template. Returning
 * HookAction::Abort from the hook kills the process.
 */
class YtDlpEngine : public IRetrievalEngine
{
public:
    static constexpr const char *ProgressTag = "mdl-progress";
    static constexpr const char *PostprocessTag = "mdl-postprocess";
    static constexpr int StartTimeoutMs = 15000;
    static constexpr int PollIntervalMs = 200;

    explicit YtDlpEngine(const QString &program = QStringLiteral("yt-dlp"));
    ~YtDlpEngine() override;

    [[nodiscard]] QString program() const { return program_; }

    [[nodiscard]] std::optional<QJsonObject> extractInfo(const QString &url,
                                                        const ExtractOptions &options,
                                                        QString *errorMessage) override;

    [[nodiscard]] EngineResult download(const QString &url,
                                        const TransferConfig &config,
                                        const ProgressHook &hook) override;

    /// Command line for a metadata call
    [[nodiscard]] static QStringList buildInfoArguments(const QString &url, const ExtractOptions &options);

    /// Command line for a transfer call
    [[nodiscard]] static QStringList buildArguments(const QString &url, const TransferConfig &config);

    /**
     * @brief Parses one stdout line produced by the progress templates.
     * @return std::nullopt for lines that are not progress lines.
     */
    [[nodiscard]] static std::optional<ProgressEvent> parseProgressLine(const QString &line);

    /**
     * @brief Extracts a human-readable failure reason.
     *
     * Prefers the last "ERROR:" line of stderr, then the whole trimmed
     * stderr, then the exit code.
     */
    [[nodiscard]] static QString errorFromOutput(const QString &standardError, int exitCode);

private:
    QString program_;
};

#endif // YTDLPENGINE_H
