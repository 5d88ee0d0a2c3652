/**
 * @file languagetable.h
 * @brief Static table of subtitle languages the application recognises.
 */

#ifndef LANGUAGETABLE_H
#define LANGUAGETABLE_H

#include <QString>
#include <QStringList>

/**
 * @brief Lookup of ISO 639-1 language codes to English display names.
 *
 * Subtitle track identifiers reported by the engine are often regional or
 * variant codes ("en-US", "pt_BR", "zh-Hans"). Lookups use the base code,
 * i.e. the lower-cased part before the first '-' or '_'.
 */
class LanguageTable
{
public:
    /// Returns the lower-cased base code of a track identifier ("en-US" -> "en")
    [[nodiscard]] static QString baseCode(const QString &languageCode);

    /// True if the base code of @p languageCode is in the table
    [[nodiscard]] static bool isSupported(const QString &languageCode);

    /// English name for the base code, or an empty string if unknown
    [[nodiscard]] static QString languageName(const QString &languageCode);

    /**
     * @brief Display label for a subtitle choice.
     * @return "English (en-US)" for known codes, otherwise the upper-cased code.
     */
    [[nodiscard]] static QString displayName(const QString &languageCode);

    /// All base codes in the table, sorted
    [[nodiscard]] static QStringList supportedCodes();
};

#endif // LANGUAGETABLE_H
