#include "todo/data/InMemoryTodoStore.hpp"

namespace todo {
namespace data {

InMemoryTodoStore::InMemoryTodoStore() = default;

InMemoryTodoStore::InMemoryTodoStore(TodoSnapshot initial)
    : m_snapshot(std::move(initial))
{
}

InMemoryTodoStore::~InMemoryTodoStore() = default;

TodoSnapshot InMemoryTodoStore::load()
{
    return m_snapshot;
}

void InMemoryTodoStore::save(const TodoSnapshot &snapshot)
{
    m_snapshot = snapshot;
    ++m_saveCount;
}

const TodoSnapshot &InMemoryTodoStore::snapshot() const
{
    return m_snapshot;
}

std::size_t InMemoryTodoStore::saveCount() const
{
    return m_saveCount;
}

} // namespace data
} // namespace todo
