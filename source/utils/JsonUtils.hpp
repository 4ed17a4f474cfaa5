#ifndef QUADRA_UTILS_JSONUTILS_HPP
#define QUADRA_UTILS_JSONUTILS_HPP

#include <QJsonDocument>
#include <QJsonObject>
#include <optional>

inline QByteArray toCompactJson(const QJsonObject &obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact);
}

inline std::optional<QJsonObject> parseObject(const QByteArray &text,
                                              QString *outError = nullptr) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(text, &parseError);

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (outError) {
            *outError = parseError.error != QJsonParseError::NoError
                            ? parseError.errorString()
                            : QStringLiteral("expected a JSON object");
        }
        return std::nullopt;
    }

    return doc.object();
}

#endif // QUADRA_UTILS_JSONUTILS_HPP
