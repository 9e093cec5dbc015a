#include "todo/data/Todo.hpp"

#include <QJsonValue>

namespace todo {
namespace data {

namespace {
constexpr auto DUE_DATE_FORMAT = "yyyy-MM-dd";
// Older stores may hold dates without zero padding, e.g. 2024-1-5.
constexpr auto UNPADDED_DUE_DATE_FORMAT = "yyyy-M-d";

const QChar CompletedGlyph(0x2713);
const QChar PendingGlyph(0x2717);
} // namespace

bool operator==(const TodoItem &lhs, const TodoItem &rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.description == rhs.description
        && lhs.dueDate == rhs.dueDate && lhs.priority == rhs.priority && lhs.completed == rhs.completed;
}

bool operator!=(const TodoItem &lhs, const TodoItem &rhs)
{
    return !(lhs == rhs);
}

QString priorityLabel(Priority priority)
{
    switch (priority) {
    case Priority::High:
        return QStringLiteral("High");
    case Priority::Medium:
        return QStringLiteral("Medium");
    case Priority::Low:
    default:
        return QStringLiteral("Low");
    }
}

std::optional<Priority> priorityFromInt(int value)
{
    switch (value) {
    case 1:
        return Priority::High;
    case 2:
        return Priority::Medium;
    case 3:
        return Priority::Low;
    default:
        return std::nullopt;
    }
}

QDate parseDueDate(const QString &value)
{
    const QString trimmed = value.trimmed();
    if (trimmed.size() != 10) {
        return {};
    }
    return QDate::fromString(trimmed, QLatin1String(DUE_DATE_FORMAT));
}

QDate parseStoredDueDate(const QString &value)
{
    const QDate date = parseDueDate(value);
    if (date.isValid()) {
        return date;
    }
    return QDate::fromString(value.trimmed(), QLatin1String(UNPADDED_DUE_DATE_FORMAT));
}

QString formatDueDate(const QDate &date)
{
    if (!date.isValid()) {
        return {};
    }
    return date.toString(QLatin1String(DUE_DATE_FORMAT));
}

QJsonObject toJson(const TodoItem &todo)
{
    QJsonObject object;
    object.insert(QStringLiteral("id"), todo.id);
    object.insert(QStringLiteral("title"), todo.title);
    object.insert(QStringLiteral("description"), todo.description);
    if (todo.dueDate.isValid()) {
        object.insert(QStringLiteral("due_date"), formatDueDate(todo.dueDate));
    } else {
        object.insert(QStringLiteral("due_date"), QJsonValue(QJsonValue::Null));
    }
    object.insert(QStringLiteral("priority"), static_cast<int>(todo.priority));
    object.insert(QStringLiteral("completed"), todo.completed);
    return object;
}

std::optional<TodoItem> todoFromJson(const QJsonObject &object)
{
    const QJsonValue id = object.value(QStringLiteral("id"));
    const QJsonValue title = object.value(QStringLiteral("title"));
    if (!id.isDouble() || !title.isString()) {
        return std::nullopt;
    }

    TodoItem todo;
    todo.id = id.toInt();
    if (todo.id <= 0) {
        return std::nullopt;
    }
    todo.title = title.toString();
    todo.description = object.value(QStringLiteral("description")).toString();

    const QJsonValue dueDate = object.value(QStringLiteral("due_date"));
    if (dueDate.isString()) {
        todo.dueDate = parseStoredDueDate(dueDate.toString());
    }

    const int priority = object.value(QStringLiteral("priority")).toInt(static_cast<int>(Priority::Low));
    todo.priority = priorityFromInt(priority).value_or(Priority::Low);
    todo.completed = object.value(QStringLiteral("completed")).toBool(false);
    return todo;
}

QString formatTodo(const TodoItem &todo)
{
    QString line = QStringLiteral("%1. [%2] %3")
                       .arg(QString::number(todo.id), QString(todo.completed ? CompletedGlyph : PendingGlyph),
                            todo.title);
    if (todo.dueDate.isValid()) {
        line += QStringLiteral(" | Due: %1").arg(formatDueDate(todo.dueDate));
    }
    line += QStringLiteral(" | Priority: %1").arg(priorityLabel(todo.priority));
    line += QStringLiteral("\n   %1").arg(todo.description);
    return line;
}

} // namespace data
} // namespace todo
