#pragma once

#include <QString>
#include <QStringList>
#include <functional>
#include <memory>
#include <optional>

class QCommandLineParser;
class QTextStream;

namespace todo {
namespace core {
class AppContext;
}
namespace data {
class TodoList;
}

namespace cli {

// Command-line front end for a TodoList. Every message, errors included,
// is written to the given stream.
class TodoCli
{
public:
    TodoCli(data::TodoList &todoList, QTextStream &out);

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    // Always returns 0; failures are reported as text.
    int run(const QStringList &arguments);

    QString usage() const;

private:
    void runAdd(const QStringList &arguments);
    void runList(const QStringList &arguments);
    void runComplete(const QStringList &arguments);
    void runRemove(const QStringList &arguments);
    void runView(const QStringList &arguments);

    bool parse(QCommandLineParser &parser, const QStringList &arguments);
    std::optional<int> itemId(const QCommandLineParser &parser);
    void printRule();

    data::TodoList &m_todoList;
    QTextStream &m_out;
    QString m_program;
};

// Builds the context (which loads the list) and runs the command. A failure
// while building is reported the same way as a failing command.
int runApplication(const std::function<std::unique_ptr<core::AppContext>()> &makeContext,
                   const QStringList &arguments, QTextStream &out);

} // namespace cli
} // namespace todo
