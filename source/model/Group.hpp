#ifndef QUADRA_MODEL_GROUP_HPP
#define QUADRA_MODEL_GROUP_HPP

#include <QJsonObject>
#include <QString>

struct Group {
    qint64 id = 0;
    QString name;
    qint64 createdAt = 0; // unix ms
    qint64 updatedAt = 0; // unix ms

    QJsonObject toJson() const {
        return QJsonObject{{"id", id},
                           {"name", name},
                           {"createdAt", createdAt},
                           {"updatedAt", updatedAt}};
    }
};

#endif // QUADRA_MODEL_GROUP_HPP
