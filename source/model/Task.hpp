#ifndef QUADRA_MODEL_TASK_HPP
#define QUADRA_MODEL_TASK_HPP

#include <QJsonObject>
#include <QString>
#include <QVector>
#include <optional>

enum class Status { Todo, Doing, Done };

inline QString toString(Status status) {
    switch (status) {
    case Status::Todo: return QStringLiteral("todo");
    case Status::Doing: return QStringLiteral("doing");
    case Status::Done: return QStringLiteral("done");
    }
    return QStringLiteral("todo");
}

// Exact, case-sensitive match against the closed set.
inline std::optional<Status> parseStatus(const QString &text) {
    if (text == QLatin1String("todo")) {
        return Status::Todo;
    }
    if (text == QLatin1String("doing")) {
        return Status::Doing;
    }
    if (text == QLatin1String("done")) {
        return Status::Done;
    }
    return std::nullopt;
}

inline QVector<Status> allStatuses() {
    return {Status::Todo, Status::Doing, Status::Done};
}

// Display bucket derived from the two priority flags. Never stored.
enum class Quadrant {
    ImportantUrgent,
    ImportantNotUrgent,
    UrgentNotImportant,
    Neither
};

struct Task {
    qint64 id = 0;
    qint64 groupId = 0;
    QString title;
    QString content;
    // Kept as text so an unparsed value coming from a caller can be
    // rejected with a precise message instead of silently defaulting.
    QString status = QStringLiteral("todo");
    bool important = false;
    bool urgent = false;
    qint64 createdAt = 0;
    qint64 updatedAt = 0;

    Quadrant quadrant() const {
        if (important) {
            return urgent ? Quadrant::ImportantUrgent : Quadrant::ImportantNotUrgent;
        }
        return urgent ? Quadrant::UrgentNotImportant : Quadrant::Neither;
    }

    QJsonObject toJson() const {
        return QJsonObject{{"id", id},
                           {"groupId", groupId},
                           {"title", title},
                           {"content", content},
                           {"status", status},
                           {"important", important},
                           {"urgent", urgent},
                           {"createdAt", createdAt},
                           {"updatedAt", updatedAt}};
    }

    static Task fromJson(const QJsonObject &jsonObject) {
        Task task;
        task.id = jsonObject.value("id").toInteger(0);
        task.groupId = jsonObject.value("groupId").toInteger(0);
        task.title = jsonObject.value("title").toString();
        task.content = jsonObject.value("content").toString();
        task.status = jsonObject.value("status").toString(QStringLiteral("todo"));
        task.important = jsonObject.value("important").toBool(false);
        task.urgent = jsonObject.value("urgent").toBool(false);
        task.createdAt = jsonObject.value("createdAt").toInteger(0);
        task.updatedAt = jsonObject.value("updatedAt").toInteger(0);
        return task;
    }
};

#endif // QUADRA_MODEL_TASK_HPP
