#pragma once

#include <cstddef>

#include "todo/data/TodoStore.hpp"

namespace todo {
namespace data {

class InMemoryTodoStore : public TodoStore
{
public:
    InMemoryTodoStore();
    explicit InMemoryTodoStore(TodoSnapshot initial);
    ~InMemoryTodoStore() override;

    TodoSnapshot load() override;
    void save(const TodoSnapshot &snapshot) override;

    const TodoSnapshot &snapshot() const;
    std::size_t saveCount() const;

private:
    TodoSnapshot m_snapshot;
    std::size_t m_saveCount = 0;
};

} // namespace data
} // namespace todo
