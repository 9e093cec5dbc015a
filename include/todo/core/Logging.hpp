#pragma once

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="todo.*.debug=true".
Q_DECLARE_LOGGING_CATEGORY(lcTodoStore)
Q_DECLARE_LOGGING_CATEGORY(lcTodoList)
Q_DECLARE_LOGGING_CATEGORY(lcTodoCli)
