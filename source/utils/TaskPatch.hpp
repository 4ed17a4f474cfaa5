#ifndef QUADRA_UTILS_TASKPATCH_HPP
#define QUADRA_UTILS_TASKPATCH_HPP

#include <QJsonObject>

#include "Task.hpp"

// Applies a partial update to a Task.
// Supported keys:
//  - "groupId": number
//  - "title", "content", "status": string
//  - "important", "urgent": bool
// id and timestamps are never taken from a patch.
inline void applyTaskPatch(Task &task, const QJsonObject &obj) {
    if (obj.contains("groupId")) {
        task.groupId = obj.value("groupId").toInteger(task.groupId);
    }

    if (obj.contains("title")) {
        task.title = obj.value("title").toString();
    }

    if (obj.contains("content")) {
        task.content = obj.value("content").toString();
    }

    if (obj.contains("status")) {
        task.status = obj.value("status").toString();
    }

    if (obj.contains("important")) {
        task.important = obj.value("important").toBool(task.important);
    }

    if (obj.contains("urgent")) {
        task.urgent = obj.value("urgent").toBool(task.urgent);
    }
}

#endif // QUADRA_UTILS_TASKPATCH_HPP
