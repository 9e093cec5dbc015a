#pragma once

#include <QString>
#include <memory>

namespace todo {
namespace data {
class JsonTodoStore;
class TodoList;
}

namespace core {

class AppContext
{
public:
    // Store file used by the command-line tool, relative to the working directory.
    static constexpr auto DefaultStoreFileName = "todo_data.json";

    AppContext();
    explicit AppContext(const QString &storePath);
    ~AppContext();

    data::TodoList &todoList();
    const QString &storePath() const;

    static QString defaultStorePath();

private:
    std::shared_ptr<data::JsonTodoStore> m_store;
    std::unique_ptr<data::TodoList> m_todoList;
};

} // namespace core
} // namespace todo
