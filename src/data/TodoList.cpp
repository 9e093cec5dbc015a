#include "todo/data/TodoList.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <stdexcept>

#include "todo/core/Logging.hpp"
#include "todo/data/TodoStore.hpp"

namespace todo {
namespace data {

TodoList::TodoList(std::shared_ptr<TodoStore> store)
    : m_store(std::move(store))
{
    load();
}

TodoList::~TodoList() = default;

TodoItem TodoList::addTodo(const QString &title, const QString &description, const QDate &dueDate, Priority priority)
{
    if (m_nextId == std::numeric_limits<int>::max()) {
        throw std::overflow_error("no todo ids left");
    }

    TodoItem todo;
    todo.id = m_nextId;
    todo.title = title;
    todo.description = description;
    todo.dueDate = dueDate;
    todo.priority = priority;

    m_todos.push_back(todo);
    ++m_nextId;
    qCDebug(lcTodoList) << "added item" << todo.id << todo.title;
    save();
    return todo;
}

bool TodoList::removeTodo(int id)
{
    auto it = findItem(id);
    if (it == m_todos.end()) {
        return false;
    }
    m_todos.erase(it);
    qCDebug(lcTodoList) << "removed item" << id;
    save();
    return true;
}

bool TodoList::completeTodo(int id)
{
    auto it = findItem(id);
    if (it == m_todos.end()) {
        return false;
    }
    it->completed = true;
    qCDebug(lcTodoList) << "completed item" << id;
    save();
    return true;
}

std::optional<TodoItem> TodoList::findById(int id) const
{
    auto it = std::find_if(m_todos.cbegin(), m_todos.cend(), [id](const TodoItem &todo) { return todo.id == id; });
    if (it == m_todos.cend()) {
        return std::nullopt;
    }
    return *it;
}

std::vector<TodoItem> TodoList::fetchTodos(bool includeCompleted) const
{
    if (includeCompleted) {
        return m_todos;
    }
    std::vector<TodoItem> result;
    result.reserve(m_todos.size());
    std::copy_if(m_todos.cbegin(), m_todos.cend(), std::back_inserter(result),
                 [](const TodoItem &todo) { return !todo.completed; });
    return result;
}

int TodoList::nextId() const
{
    return m_nextId;
}

std::size_t TodoList::size() const
{
    return m_todos.size();
}

void TodoList::load()
{
    m_todos.clear();
    m_nextId = 1;
    if (!m_store) {
        return;
    }
    TodoSnapshot snapshot = m_store->load();
    m_todos = std::move(snapshot.todos);
    m_nextId = snapshot.nextId;
}

void TodoList::save() const
{
    if (!m_store) {
        return;
    }
    TodoSnapshot snapshot;
    snapshot.todos = m_todos;
    snapshot.nextId = m_nextId;
    m_store->save(snapshot);
}

std::vector<TodoItem>::iterator TodoList::findItem(int id)
{
    return std::find_if(m_todos.begin(), m_todos.end(), [id](const TodoItem &todo) { return todo.id == id; });
}

} // namespace data
} // namespace todo
