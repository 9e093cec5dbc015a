#pragma once

#include <QDate>
#include <QString>
#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "todo/data/Todo.hpp"

namespace todo {
namespace data {

class TodoStore;

// Owns the todo items in insertion order and hands out ids. Every successful
// mutation is written through to the store; lookups never touch it.
class TodoList
{
public:
    explicit TodoList(std::shared_ptr<TodoStore> store);
    ~TodoList();

    TodoItem addTodo(const QString &title, const QString &description = QString(), const QDate &dueDate = QDate(),
                     Priority priority = Priority::Low);
    bool removeTodo(int id);
    bool completeTodo(int id);

    std::optional<TodoItem> findById(int id) const;
    std::vector<TodoItem> fetchTodos(bool includeCompleted = false) const;

    int nextId() const;
    std::size_t size() const;

private:
    void load();
    void save() const;

    std::vector<TodoItem>::iterator findItem(int id);

    std::shared_ptr<TodoStore> m_store;
    std::vector<TodoItem> m_todos;
    int m_nextId = 1;
};

} // namespace data
} // namespace todo
