#include "languagetable.h"

#include <QHash>

namespace {

const QHash<QString, QString> &languageNames()
{
    static const QHash<QString, QString> names = {
        {"af", "Afrikaans"},  {"ar", "Arabic"},     {"az", "Azerbaijani"},
        {"be", "Belarusian"}, {"bg", "Bulgarian"},  {"bn", "Bengali"},
        {"bs", "Bosnian"},    {"ca", "Catalan"},    {"cs", "Czech"},
        {"cy", "Welsh"},      {"da", "Danish"},     {"de", "German"},
        {"el", "Greek"},      {"en", "English"},    {"eo", "Esperanto"},
        {"es", "Spanish"},    {"et", "Estonian"},   {"eu", "Basque"},
        {"fa", "Persian"},    {"fi", "Finnish"},    {"fil", "Filipino"},
        {"fr", "French"},     {"ga", "Irish"},      {"gl", "Galician"},
        {"gu", "Gujarati"},   {"he", "Hebrew"},     {"hi", "Hindi"},
        {"hr", "Croatian"},   {"hu", "Hungarian"},  {"hy", "Armenian"},
        {"id", "Indonesian"}, {"is", "Icelandic"},  {"it", "Italian"},
        {"ja", "Japanese"},   {"ka", "Georgian"},   {"kk", "Kazakh"},
        {"km", "Khmer"},      {"kn", "Kannada"},    {"ko", "Korean"},
        {"lt", "Lithuanian"}, {"lv", "Latvian"},    {"mk", "Macedonian"},
        {"ml", "Malayalam"},  {"mn", "Mongolian"},  {"mr", "Marathi"},
        {"ms", "Malay"},      {"my", "Burmese"},    {"nb", "Norwegian Bokmal"},
        {"ne", "Nepali"},     {"nl", "Dutch"},      {"no", "Norwegian"},
        {"pa", "Punjabi"},    {"pl", "Polish"},     {"pt", "Portuguese"},
        {"ro", "Romanian"},   {"ru", "Russian"},    {"si", "Sinhala"},
        {"sk", "Slovak"},     {"sl", "Slovenian"},  {"sq", "Albanian"},
        {"sr", "Serbian"},    {"sv", "Swedish"},    {"sw", "Swahili"},
        {"ta", "Tamil"},      {"te", "Telugu"},     {"th", "Thai"},
        {"tr", "Turkish"},    {"uk", "Ukrainian"},  {"ur", "Urdu"},
        {"uz", "Uzbek"},      {"vi", "Vietnamese"}, {"zh", "Chinese"},
        {"zu", "Zulu"},
    };
    return names;
}

} // namespace

QString LanguageTable::baseCode(const QString &languageCode)
{
    QString code = languageCode.trimmed().toLower();
    const int dash = code.indexOf('-');
    if (dash >= 0) {
        code.truncate(dash);
    }
    const int underscore = code.indexOf('_');
    if (underscore >= 0) {
        code.truncate(underscore);
    }
    return code;
}

bool LanguageTable::isSupported(const QString &languageCode)
{
    return languageNames().contains(baseCode(languageCode));
}

QString LanguageTable::languageName(const QString &languageCode)
{
    return languageNames().value(baseCode(languageCode));
}

QString LanguageTable::displayName(const QString &languageCode)
{
    const QString name = languageName(languageCode);
    if (name.isEmpty()) {
        return languageCode.toUpper();
    }
    return QString("%1 (%2)").arg(name, languageCode);
}

QStringList LanguageTable::supportedCodes()
{
    QStringList codes = languageNames().keys();
    codes.sort();
    return codes;
}
