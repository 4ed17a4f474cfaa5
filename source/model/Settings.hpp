#ifndef QUADRA_MODEL_SETTINGS_HPP
#define QUADRA_MODEL_SETTINGS_HPP

#include <QJsonObject>
#include <QString>

struct Settings {
    bool hideDone = false;
    bool alwaysOnTop = true;
    QString viewMode = QStringLiteral("cards"); // "list" | "cards"
    bool conciseMode = false;
    QString theme; // "light" | "dark", empty when never chosen

    QJsonObject toJson() const {
        return QJsonObject{{"hideDone", hideDone},
                           {"alwaysOnTop", alwaysOnTop},
                           {"viewMode", viewMode},
                           {"conciseMode", conciseMode},
                           {"theme", theme}};
    }
};

inline bool operator==(const Settings &lhs, const Settings &rhs) {
    return lhs.hideDone == rhs.hideDone && lhs.alwaysOnTop == rhs.alwaysOnTop &&
           lhs.viewMode == rhs.viewMode && lhs.conciseMode == rhs.conciseMode &&
           lhs.theme == rhs.theme;
}

#endif // QUADRA_MODEL_SETTINGS_HPP
