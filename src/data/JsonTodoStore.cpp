#include "todo/data/JsonTodoStore.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include <algorithm>
#include <limits>

#include "todo/core/Logging.hpp"

namespace todo {
namespace data {

namespace {
const QString TodosKey = QStringLiteral("todos");
const QString NextIdKey = QStringLiteral("next_id");

void throwStorageError(const QString &message)
{
    throw StorageError(message.toStdString());
}
} // namespace

JsonTodoStore::JsonTodoStore(QString filePath)
    : m_filePath(std::move(filePath))
{
}

const QString &JsonTodoStore::filePath() const
{
    return m_filePath;
}

TodoSnapshot JsonTodoStore::load()
{
    QFile file(m_filePath);
    if (!file.exists()) {
        qCDebug(lcTodoStore) << "no store at" << m_filePath << "- starting empty";
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qCWarning(lcTodoStore) << "cannot open" << m_filePath << ":" << file.errorString();
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        qCWarning(lcTodoStore) << "discarding malformed store" << m_filePath << ":" << parseError.errorString();
        return {};
    }
    if (!document.isObject()) {
        qCWarning(lcTodoStore) << "discarding store" << m_filePath << ": top level is not an object";
        return {};
    }

    auto snapshot = decode(document.object());
    if (!snapshot) {
        qCWarning(lcTodoStore) << "discarding store" << m_filePath << ": missing or invalid fields";
        return {};
    }
    qCDebug(lcTodoStore) << "loaded" << snapshot->todos.size() << "items, next id" << snapshot->nextId;
    return *snapshot;
}

void JsonTodoStore::save(const TodoSnapshot &snapshot)
{
    if (m_filePath.isEmpty()) {
        throwStorageError(QStringLiteral("no store path configured"));
    }

    QFileInfo info(m_filePath);
    QDir dir = info.dir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        throwStorageError(QStringLiteral("cannot create directory %1").arg(dir.path()));
    }

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        throwStorageError(QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
    }

    const QByteArray payload = QJsonDocument(encode(snapshot)).toJson(QJsonDocument::Indented);
    if (file.write(payload) != payload.size()) {
        file.cancelWriting();
        throwStorageError(QStringLiteral("cannot write %1: %2").arg(m_filePath, file.errorString()));
    }
    if (!file.commit()) {
        throwStorageError(QStringLiteral("cannot commit %1: %2").arg(m_filePath, file.errorString()));
    }
    qCDebug(lcTodoStore) << "saved" << snapshot.todos.size() << "items to" << m_filePath;
}

QJsonObject JsonTodoStore::encode(const TodoSnapshot &snapshot)
{
    QJsonArray todos;
    for (const TodoItem &todo : snapshot.todos) {
        todos.append(toJson(todo));
    }

    QJsonObject root;
    root.insert(TodosKey, todos);
    root.insert(NextIdKey, snapshot.nextId);
    return root;
}

std::optional<TodoSnapshot> JsonTodoStore::decode(const QJsonObject &root)
{
    const QJsonValue todos = root.value(TodosKey);
    const QJsonValue nextId = root.value(NextIdKey);
    if (!todos.isArray() || !nextId.isDouble()) {
        return std::nullopt;
    }

    TodoSnapshot snapshot;
    snapshot.nextId = nextId.toInt();
    // An id or counter at the top of the int range leaves no room for the next id.
    constexpr int MaxId = std::numeric_limits<int>::max();
    if (snapshot.nextId == MaxId) {
        return std::nullopt;
    }
    int highestId = 0;
    const QJsonArray entries = todos.toArray();
    snapshot.todos.reserve(static_cast<size_t>(entries.size()));
    for (const QJsonValue &entry : entries) {
        if (!entry.isObject()) {
            return std::nullopt;
        }
        auto todo = todoFromJson(entry.toObject());
        if (!todo || todo->id == MaxId) {
            return std::nullopt;
        }
        const bool duplicate = std::any_of(snapshot.todos.cbegin(), snapshot.todos.cend(),
                                           [&todo](const TodoItem &other) { return other.id == todo->id; });
        if (duplicate) {
            return std::nullopt;
        }
        highestId = std::max(highestId, todo->id);
        snapshot.todos.push_back(std::move(*todo));
    }

    // next_id must stay ahead of every issued id, even after a hand edit.
    if (snapshot.nextId <= highestId) {
        qCWarning(lcTodoStore) << "next_id" << snapshot.nextId << "is not above stored id" << highestId
                               << "- advancing it";
        snapshot.nextId = highestId + 1;
    }
    if (snapshot.nextId < 1) {
        snapshot.nextId = 1;
    }
    return snapshot;
}

} // namespace data
} // namespace todo
