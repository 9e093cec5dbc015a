#include "todo/core/AppContext.hpp"

#include <QDir>

#include "todo/core/Logging.hpp"
#include "todo/data/JsonTodoStore.hpp"
#include "todo/data/TodoList.hpp"

namespace todo {
namespace core {

AppContext::AppContext()
    : AppContext(defaultStorePath())
{
}

AppContext::AppContext(const QString &storePath)
    : m_store(std::make_shared<data::JsonTodoStore>(storePath))
    , m_todoList(std::make_unique<data::TodoList>(m_store))
{
    qCDebug(lcTodoStore) << "using store" << storePath;
}

AppContext::~AppContext() = default;

data::TodoList &AppContext::todoList()
{
    return *m_todoList;
}

const QString &AppContext::storePath() const
{
    return m_store->filePath();
}

QString AppContext::defaultStorePath()
{
    return QDir::current().filePath(QLatin1String(DefaultStoreFileName));
}

} // namespace core
} // namespace todo
