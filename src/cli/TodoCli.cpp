#include "todo/cli/TodoCli.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QRegularExpression>
#include <QTextStream>
#include <exception>

#include "todo/core/AppContext.hpp"
#include "todo/core/Logging.hpp"
#include "todo/data/Todo.hpp"
#include "todo/data/TodoList.hpp"

namespace todo {
namespace cli {

namespace {
constexpr int RuleWidth = 50;

void prepareParser(QCommandLineParser &parser, const QString &description)
{
    parser.setApplicationDescription(description);
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    parser.addHelpOption();
}

void addIdArgument(QCommandLineParser &parser, const QString &description)
{
    parser.addPositionalArgument(QStringLiteral("id"), description);
}

// "-1" would otherwise be read as an option named "1"; a "--" in front keeps it positional.
QStringList protectNegativeIds(const QStringList &arguments)
{
    static const QRegularExpression negativeNumber(QStringLiteral("^-\\d+$"));
    for (int i = 1; i < arguments.size(); ++i) {
        if (arguments.at(i) == QLatin1String("--")) {
            break;
        }
        if (negativeNumber.match(arguments.at(i)).hasMatch()) {
            QStringList protectedArguments = arguments;
            protectedArguments.insert(i, QStringLiteral("--"));
            return protectedArguments;
        }
    }
    return arguments;
}
} // namespace

int runApplication(const std::function<std::unique_ptr<core::AppContext>()> &makeContext,
                   const QStringList &arguments, QTextStream &out)
{
    std::unique_ptr<core::AppContext> context;
    try {
        context = makeContext();
    } catch (const std::exception &e) {
        qCWarning(lcTodoCli) << "startup failed:" << e.what();
        out << "An error occurred: " << QString::fromLocal8Bit(e.what()) << '\n';
        out.flush();
        return 0;
    }

    TodoCli todoCli(context->todoList(), out);
    return todoCli.run(arguments);
}

TodoCli::TodoCli(data::TodoList &todoList, QTextStream &out)
    : m_todoList(todoList)
    , m_out(out)
    , m_program(QStringLiteral("todo"))
{
}

int TodoCli::run(const QStringList &arguments)
{
    if (!arguments.isEmpty() && !arguments.first().isEmpty()) {
        m_program = arguments.first();
    }

    if (arguments.size() < 2) {
        m_out << "Error: no command given.\n" << usage();
        m_out.flush();
        return 0;
    }

    const QString command = arguments.at(1);
    if (command == QLatin1String("-h") || command == QLatin1String("--help") || command == QLatin1String("help")) {
        m_out << usage();
        m_out.flush();
        return 0;
    }

    QStringList commandArguments = arguments.mid(2);
    commandArguments.prepend(m_program + QLatin1Char(' ') + command);
    qCDebug(lcTodoCli) << "running" << command << arguments.mid(2);

    try {
        if (command == QLatin1String("add")) {
            runAdd(commandArguments);
        } else if (command == QLatin1String("list")) {
            runList(commandArguments);
        } else if (command == QLatin1String("complete")) {
            runComplete(commandArguments);
        } else if (command == QLatin1String("remove")) {
            runRemove(commandArguments);
        } else if (command == QLatin1String("view")) {
            runView(commandArguments);
        } else {
            m_out << "Error: unknown command '" << command << "'.\n" << usage();
        }
    } catch (const std::exception &e) {
        qCWarning(lcTodoCli) << "command" << command << "failed:" << e.what();
        m_out << "An error occurred: " << QString::fromLocal8Bit(e.what()) << '\n';
    }

    m_out.flush();
    return 0;
}

QString TodoCli::usage() const
{
    return QStringLiteral("Usage: %1 <command> [options]\n"
                          "\n"
                          "To-Do List CLI Application\n"
                          "\n"
                          "Commands:\n"
                          "  add <title> [-d TEXT] [-due YYYY-MM-DD] [-p {1,2,3}]  Add a new todo item\n"
                          "  list [-a]                                            List todo items\n"
                          "  complete <id>                                        Mark an item as completed\n"
                          "  remove <id>                                          Remove a todo item\n"
                          "  view <id>                                            View details of a specific todo item\n"
                          "\n"
                          "Run '%1 <command> --help' for the options of a command.\n")
        .arg(m_program);
}

void TodoCli::runAdd(const QStringList &arguments)
{
    QCommandLineParser parser;
    prepareParser(parser, QStringLiteral("Add a new todo item"));
    parser.addPositionalArgument(QStringLiteral("title"), QStringLiteral("Title of the todo item"));
    const QCommandLineOption descriptionOption({ QStringLiteral("d"), QStringLiteral("description") },
                                               QStringLiteral("Description of the todo item"),
                                               QStringLiteral("text"));
    const QCommandLineOption dueDateOption({ QStringLiteral("due"), QStringLiteral("due_date") },
                                           QStringLiteral("Due date (YYYY-MM-DD)"), QStringLiteral("date"));
    const QCommandLineOption priorityOption({ QStringLiteral("p"), QStringLiteral("priority") },
                                            QStringLiteral("Priority (1: High, 2: Medium, 3: Low)"),
                                            QStringLiteral("priority"), QStringLiteral("3"));
    parser.addOption(descriptionOption);
    parser.addOption(dueDateOption);
    parser.addOption(priorityOption);
    if (!parse(parser, arguments)) {
        return;
    }

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        m_out << "Error: add expects exactly one title.\n";
        return;
    }
    const QString title = positional.first();
    if (title.trimmed().isEmpty()) {
        m_out << "Error: Title must not be empty.\n";
        return;
    }

    bool ok = false;
    const auto priority = data::priorityFromInt(parser.value(priorityOption).toInt(&ok));
    if (!ok || !priority) {
        m_out << "Error: Priority must be 1, 2 or 3.\n";
        return;
    }

    QDate dueDate;
    const QString dueDateText = parser.value(dueDateOption);
    if (!dueDateText.isEmpty()) {
        dueDate = data::parseDueDate(dueDateText);
        if (!dueDate.isValid()) {
            m_out << "Error: Invalid date format. Please use YYYY-MM-DD.\n";
            return;
        }
    }

    const auto todo = m_todoList.addTodo(title, parser.value(descriptionOption), dueDate, *priority);
    m_out << QStringLiteral("Added new todo item (ID: %1): %2").arg(QString::number(todo.id), todo.title) << '\n';
}

void TodoCli::runList(const QStringList &arguments)
{
    QCommandLineParser parser;
    prepareParser(parser, QStringLiteral("List todo items"));
    const QCommandLineOption allOption({ QStringLiteral("a"), QStringLiteral("all") },
                                       QStringLiteral("Show all items including completed"));
    parser.addOption(allOption);
    if (!parse(parser, arguments)) {
        return;
    }
    if (!parser.positionalArguments().isEmpty()) {
        m_out << "Error: list takes no arguments.\n";
        return;
    }

    const auto todos = m_todoList.fetchTodos(parser.isSet(allOption));
    if (todos.empty()) {
        m_out << "No todo items found.\n";
        return;
    }

    m_out << "\nTo-Do List:\n";
    printRule();
    for (const auto &todo : todos) {
        m_out << data::formatTodo(todo) << '\n';
    }
    printRule();
}

void TodoCli::runComplete(const QStringList &arguments)
{
    QCommandLineParser parser;
    prepareParser(parser, QStringLiteral("Mark an item as completed"));
    addIdArgument(parser, QStringLiteral("ID of the item to complete"));
    if (!parse(parser, protectNegativeIds(arguments))) {
        return;
    }
    const auto id = itemId(parser);
    if (!id) {
        return;
    }

    if (m_todoList.completeTodo(*id)) {
        m_out << "Marked item " << *id << " as completed.\n";
    } else {
        m_out << "Error: Item with ID " << *id << " not found.\n";
    }
}

void TodoCli::runRemove(const QStringList &arguments)
{
    QCommandLineParser parser;
    prepareParser(parser, QStringLiteral("Remove a todo item"));
    addIdArgument(parser, QStringLiteral("ID of the item to remove"));
    if (!parse(parser, protectNegativeIds(arguments))) {
        return;
    }
    const auto id = itemId(parser);
    if (!id) {
        return;
    }

    if (m_todoList.removeTodo(*id)) {
        m_out << "Removed item with ID " << *id << ".\n";
    } else {
        m_out << "Error: Item with ID " << *id << " not found.\n";
    }
}

void TodoCli::runView(const QStringList &arguments)
{
    QCommandLineParser parser;
    prepareParser(parser, QStringLiteral("View details of a specific todo item"));
    addIdArgument(parser, QStringLiteral("ID of the item to view"));
    if (!parse(parser, protectNegativeIds(arguments))) {
        return;
    }
    const auto id = itemId(parser);
    if (!id) {
        return;
    }

    const auto todo = m_todoList.findById(*id);
    if (!todo) {
        m_out << "Error: Item with ID " << *id << " not found.\n";
        return;
    }
    m_out << "\nTodo Item Details:\n";
    printRule();
    m_out << data::formatTodo(*todo) << '\n';
    printRule();
}

bool TodoCli::parse(QCommandLineParser &parser, const QStringList &arguments)
{
    if (!parser.parse(arguments)) {
        m_out << "Error: " << parser.errorText() << '\n' << usage();
        return false;
    }
    if (parser.isSet(QStringLiteral("help"))) {
        m_out << parser.helpText();
        return false;
    }
    return true;
}

std::optional<int> TodoCli::itemId(const QCommandLineParser &parser)
{
    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        m_out << "Error: expected exactly one item ID.\n";
        return std::nullopt;
    }
    bool ok = false;
    const int id = positional.first().toInt(&ok);
    if (!ok) {
        m_out << "Error: Invalid item ID '" << positional.first() << "'.\n";
        return std::nullopt;
    }
    return id;
}

void TodoCli::printRule()
{
    m_out << QString(RuleWidth, QLatin1Char('=')) << '\n';
}

} // namespace cli
} // namespace todo
