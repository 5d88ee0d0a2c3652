#include "transferconfig.h"

#include <QObject>

QString TransferConfig::validate() const
{
    if (formatSelector.trimmed().isEmpty()) {
        return QObject::tr("No format selector");
    }
    if (targetExtension.trimmed().isEmpty()) {
        return QObject::tr("No target extension");
    }
    if (outputTemplate.trimmed().isEmpty()) {
        return QObject::tr("No output template");
    }
    if (destinationDirectory.trimmed().isEmpty()) {
        return QObject::tr("No destination folder");
    }
    if (!playlistMode && homePath.trimmed().isEmpty()) {
        return QObject::tr("No temporary folder for a single-item transfer");
    }
    if (rateLimitBytesPerSecond < 0) {
        return QObject::tr("Negative rate limit");
    }
    if (resilience.retries < 0 || resilience.fragmentRetries < 0
        || resilience.fileAccessRetries < 0) {
        return QObject::tr("Negative retry count");
    }
    if (resilience.socketTimeoutSeconds <= 0) {
        return QObject::tr("Socket timeout must be positive");
    }
    if (resilience.concurrentFragments <= 0) {
        return QObject::tr("Concurrent fragment count must be positive");
    }
    if (subtitles.enabled && subtitles.languages.isEmpty()) {
        return QObject::tr("Subtitles requested without any language");
    }
    for (const PostProcessor &pp : postProcessors) {
        if (pp.kind == PostProcessor::Kind::ExtractAudio && pp.preferredCodec.isEmpty()) {
            return QObject::tr("Audio extraction without a codec");
        }
    }
    return QString();
}
