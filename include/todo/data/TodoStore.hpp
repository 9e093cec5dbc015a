#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "todo/data/Todo.hpp"

namespace todo {
namespace data {

struct TodoSnapshot
{
    std::vector<TodoItem> todos;
    int nextId = 1;
};

class StorageError : public std::runtime_error
{
public:
    explicit StorageError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

class TodoStore
{
public:
    virtual ~TodoStore() = default;

    // Never throws; an unreadable store yields an empty snapshot.
    virtual TodoSnapshot load() = 0;
    // Replaces the stored state. Throws StorageError when the write fails.
    virtual void save(const TodoSnapshot &snapshot) = 0;
};

} // namespace data
} // namespace todo
