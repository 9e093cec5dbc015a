#pragma once

#include <QDate>
#include <QJsonObject>
#include <QString>
#include <optional>

namespace todo {
namespace data {

enum class Priority
{
    High = 1,
    Medium = 2,
    Low = 3,
};

struct TodoItem
{
    int id = 0;
    QString title;
    QString description;
    QDate dueDate; // invalid when the item has no due date
    Priority priority = Priority::Low;
    bool completed = false;
};

bool operator==(const TodoItem &lhs, const TodoItem &rhs);
bool operator!=(const TodoItem &lhs, const TodoItem &rhs);

QString priorityLabel(Priority priority);
std::optional<Priority> priorityFromInt(int value);

// Accepts YYYY-MM-DD only; returns an invalid QDate otherwise.
QDate parseDueDate(const QString &value);
// Also accepts unpadded month and day (YYYY-M-D), for dates read back from a store.
QDate parseStoredDueDate(const QString &value);
QString formatDueDate(const QDate &date);

QJsonObject toJson(const TodoItem &todo);

// Reads an item written by toJson(). "id" and "title" are required; the other
// fields fall back to their defaults when missing.
std::optional<TodoItem> todoFromJson(const QJsonObject &object);

// Two-line rendering used by the list and view commands.
QString formatTodo(const TodoItem &todo);

} // namespace data
} // namespace todo
