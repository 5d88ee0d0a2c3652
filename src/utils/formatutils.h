/**
 * @file formatutils.h
 * @brief Human-readable formatting helpers for sizes and engine output.
 */

#ifndef FORMATUTILS_H
#define FORMATUTILS_H

#include <QString>

/**
 * @brief Formatting helpers shared by the tasks and the command line front end.
 */
class FormatUtils
{
public:
    /**
     * @brief Formats a byte count as "12.3 MB".
     *
     * Uses 1024-based units from B up to TB with one decimal place.
     * Returns "Unknown" for zero or negative values.
     */
    [[nodiscard]] static QString formatSize(qint64 bytes);

    /// Removes ANSI colour escape sequences (ESC [ ... m) from engine output
    [[nodiscard]] static QString stripAnsi(const QString &text);

    /**
     * @brief Shortens @p text to @p maxLength characters.
     * @return The text unchanged if short enough, otherwise the prefix followed by "...".
     */
    [[nodiscard]] static QString truncate(const QString &text, int maxLength);
};

#endif // FORMATUTILS_H
