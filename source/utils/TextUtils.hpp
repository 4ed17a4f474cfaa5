#ifndef QUADRA_UTILS_TEXTUTILS_HPP
#define QUADRA_UTILS_TEXTUTILS_HPP

#include <QString>

// Length in Unicode code points; a surrogate pair counts once.
inline qsizetype codePointCount(const QString &text) {
    qsizetype count = 0;
    for (qsizetype i = 0; i < text.size(); ++i) {
        if (text.at(i).isHighSurrogate() && i + 1 < text.size() &&
            text.at(i + 1).isLowSurrogate()) {
            ++i;
        }
        ++count;
    }
    return count;
}

inline QString boolTo01(bool value) {
    return value ? QStringLiteral("1") : QStringLiteral("0");
}

// "1" or any casing of "true"; everything else is false.
inline bool parseBoolText(const QString &value) {
    return value == QLatin1String("1") ||
           value.compare(QLatin1String("true"), Qt::CaseInsensitive) == 0;
}

#endif // QUADRA_UTILS_TEXTUTILS_HPP
