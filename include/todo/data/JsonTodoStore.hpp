#pragma once

#include <QJsonObject>
#include <QString>
#include <optional>

#include "todo/data/TodoStore.hpp"

namespace todo {
namespace data {

// Whole-file JSON store:
//   { "todos": [ <item>, ... ], "next_id": <int> }
// Writes go through QSaveFile, so a reader sees either the old or the new file.
class JsonTodoStore : public TodoStore
{
public:
    explicit JsonTodoStore(QString filePath);
    ~JsonTodoStore() override = default;

    TodoSnapshot load() override;
    void save(const TodoSnapshot &snapshot) override;

    const QString &filePath() const;

    static QJsonObject encode(const TodoSnapshot &snapshot);
    static std::optional<TodoSnapshot> decode(const QJsonObject &root);

private:
    QString m_filePath;
};

} // namespace data
} // namespace todo
