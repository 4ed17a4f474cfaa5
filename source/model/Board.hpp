#ifndef QUADRA_MODEL_BOARD_HPP
#define QUADRA_MODEL_BOARD_HPP

#include <QJsonArray>
#include <QJsonObject>
#include <vector>

#include "Group.hpp"
#include "Settings.hpp"
#include "Task.hpp"

// Everything a front end needs to render in one round trip.
struct Board {
    std::vector<Group> groups;
    std::vector<Task> tasks;
    Settings settings;
    QVector<Status> statuses;

    QJsonObject toJson() const {
        QJsonArray groupsArray;
        for (const Group &group : groups) {
            groupsArray.append(group.toJson());
        }

        QJsonArray tasksArray;
        for (const Task &task : tasks) {
            tasksArray.append(task.toJson());
        }

        QJsonArray statusArray;
        for (Status status : statuses) {
            statusArray.append(toString(status));
        }

        return QJsonObject{{"groups", groupsArray},
                           {"tasks", tasksArray},
                           {"settings", settings.toJson()},
                           {"statuses", statusArray}};
    }
};

#endif // QUADRA_MODEL_BOARD_HPP
