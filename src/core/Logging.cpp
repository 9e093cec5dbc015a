#include "todo/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcTodoStore, "todo.store", QtWarningMsg)
Q_LOGGING_CATEGORY(lcTodoList, "todo.list", QtWarningMsg)
Q_LOGGING_CATEGORY(lcTodoCli, "todo.cli", QtWarningMsg)
