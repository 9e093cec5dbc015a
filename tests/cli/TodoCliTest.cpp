#include <QtTest/QtTest>

#include <QFile>
#include <QLoggingCategory>
#include <QRegularExpression>
#include <QTemporaryDir>
#include <QTextStream>
#include <memory>
#include <stdexcept>

#include "todo/cli/TodoCli.hpp"
#include "todo/core/AppContext.hpp"
#include "todo/data/InMemoryTodoStore.hpp"
#include "todo/data/TodoList.hpp"

using namespace todo;

namespace {

class FailingStore : public data::TodoStore
{
public:
    data::TodoSnapshot load() override { return {}; }
    void save(const data::TodoSnapshot &) override { throw data::StorageError("disk full"); }
};

QString runCli(data::TodoList &list, const QStringList &arguments)
{
    QString output;
    QTextStream stream(&output);
    cli::TodoCli todoCli(list, stream);
    QStringList argv = arguments;
    argv.prepend(QStringLiteral("todo"));
    const int status = todoCli.run(argv);
    if (status != 0) {
        return QStringLiteral("exit status %1").arg(status);
    }
    return output;
}

const QString Rule = QString(50, QLatin1Char('='));

} // namespace

class TodoCliTest : public QObject
{
    Q_OBJECT

private slots:
    void addPrintsIdAndTitle();
    void addWithOptions();
    void addRejectsInvalidDate();
    void addRejectsInvalidPriority();
    void listEmpty();
    void listShowsPendingOrAll();
    void completeAndRemove();
    void viewShowsDetails();
    void invalidIdIsReported();
    void unknownCommandPrintsUsage();
    void storageFailureIsReported();
    void persistsAcrossInvocations();
    void negativeIdIsNotFound();
    void startupFailureIsReported();
    void runApplicationUsesContext();
    void storePathIsLoggedOnStoreCategory();
};

void TodoCliTest::addPrintsIdAndTitle()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    QCOMPARE(runCli(list, { "add", "Buy milk" }), QStringLiteral("Added new todo item (ID: 1): Buy milk\n"));
    QCOMPARE(runCli(list, { "add", "Buy milk" }), QStringLiteral("Added new todo item (ID: 2): Buy milk\n"));
}

void TodoCliTest::addWithOptions()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    runCli(list, { "add", "Report", "-d", "Quarterly numbers", "-due", "2024-09-30", "-p", "1" });
    runCli(list, { "add", "Plan trip", "--description", "Book hotel", "--due_date", "2024-10-01", "--priority", "2" });

    const auto report = list.findById(1);
    QVERIFY(report.has_value());
    QCOMPARE(report->description, QStringLiteral("Quarterly numbers"));
    QCOMPARE(report->dueDate, QDate(2024, 9, 30));
    QCOMPARE(report->priority, data::Priority::High);

    const auto trip = list.findById(2);
    QVERIFY(trip.has_value());
    QCOMPARE(trip->description, QStringLiteral("Book hotel"));
    QCOMPARE(trip->dueDate, QDate(2024, 10, 1));
    QCOMPARE(trip->priority, data::Priority::Medium);
}

void TodoCliTest::addRejectsInvalidDate()
{
    auto store = std::make_shared<data::InMemoryTodoStore>();
    data::TodoList list(store);
    QCOMPARE(runCli(list, { "add", "Report", "--due_date", "30.09.2024" }),
             QStringLiteral("Error: Invalid date format. Please use YYYY-MM-DD.\n"));
    QCOMPARE(list.size(), static_cast<std::size_t>(0));
    QCOMPARE(list.nextId(), 1);
    QCOMPARE(store->saveCount(), static_cast<std::size_t>(0));
}

void TodoCliTest::addRejectsInvalidPriority()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    QCOMPARE(runCli(list, { "add", "Report", "-p", "4" }), QStringLiteral("Error: Priority must be 1, 2 or 3.\n"));
    QCOMPARE(runCli(list, { "add", "Report", "-p", "high" }), QStringLiteral("Error: Priority must be 1, 2 or 3.\n"));
    QCOMPARE(list.size(), static_cast<std::size_t>(0));
}

void TodoCliTest::listEmpty()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    QCOMPARE(runCli(list, { "list" }), QStringLiteral("No todo items found.\n"));

    list.addTodo("Done already");
    list.completeTodo(1);
    QCOMPARE(runCli(list, { "list" }), QStringLiteral("No todo items found.\n"));
}

void TodoCliTest::listShowsPendingOrAll()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    list.addTodo("Buy milk", QString(), QDate(), data::Priority::High);
    list.addTodo("Clean house");
    list.completeTodo(1);

    const QString pending = runCli(list, { "list" });
    QCOMPARE(pending, QStringLiteral("\nTo-Do List:\n") + Rule + QStringLiteral("\n")
                          + data::formatTodo(*list.findById(2)) + QStringLiteral("\n") + Rule + QStringLiteral("\n"));

    const QString all = runCli(list, { "list", "--all" });
    QVERIFY(all.contains(QStringLiteral("1. [")));
    QVERIFY(all.contains(QStringLiteral("2. [")));
    QVERIFY(all.indexOf(QStringLiteral("Buy milk")) < all.indexOf(QStringLiteral("Clean house")));
    QCOMPARE(runCli(list, { "list", "-a" }), all);
}

void TodoCliTest::completeAndRemove()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    list.addTodo("Buy milk");

    QCOMPARE(runCli(list, { "complete", "1" }), QStringLiteral("Marked item 1 as completed.\n"));
    QCOMPARE(runCli(list, { "complete", "5" }), QStringLiteral("Error: Item with ID 5 not found.\n"));
    QCOMPARE(runCli(list, { "remove", "1" }), QStringLiteral("Removed item with ID 1.\n"));
    QCOMPARE(runCli(list, { "remove", "1" }), QStringLiteral("Error: Item with ID 1 not found.\n"));
}

void TodoCliTest::viewShowsDetails()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    list.addTodo("Buy milk", "Semi-skimmed", QDate(2024, 1, 15), data::Priority::Medium);

    const QString expected = QStringLiteral("\nTodo Item Details:\n") + Rule + QStringLiteral("\n1. [") + QChar(0x2717)
        + QStringLiteral("] Buy milk | Due: 2024-01-15 | Priority: Medium\n   Semi-skimmed\n") + Rule
        + QStringLiteral("\n");
    QCOMPARE(runCli(list, { "view", "1" }), expected);
    QCOMPARE(runCli(list, { "view", "3" }), QStringLiteral("Error: Item with ID 3 not found.\n"));
}

void TodoCliTest::invalidIdIsReported()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    QCOMPARE(runCli(list, { "complete", "abc" }), QStringLiteral("Error: Invalid item ID 'abc'.\n"));
    QCOMPARE(runCli(list, { "view" }), QStringLiteral("Error: expected exactly one item ID.\n"));
}

void TodoCliTest::unknownCommandPrintsUsage()
{
    data::TodoList list(std::make_shared<data::InMemoryTodoStore>());
    const QString output = runCli(list, { "frobnicate" });
    QVERIFY(output.startsWith(QStringLiteral("Error: unknown command 'frobnicate'.\n")));
    QVERIFY(output.contains(QStringLiteral("Usage: todo <command>")));

    QVERIFY(runCli(list, {}).startsWith(QStringLiteral("Error: no command given.\n")));
    const QString parseError = runCli(list, { "list", "--bogus" });
    QVERIFY(parseError.startsWith(QStringLiteral("Error: Unknown option 'bogus'.\n")));
    QVERIFY(parseError.contains(QStringLiteral("Usage: todo <command>")));
}

void TodoCliTest::storageFailureIsReported()
{
    data::TodoList list(std::make_shared<FailingStore>());
    QCOMPARE(runCli(list, { "add", "Buy milk" }), QStringLiteral("An error occurred: disk full\n"));
}

void TodoCliTest::persistsAcrossInvocations()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QLatin1String(core::AppContext::DefaultStoreFileName));

    {
        core::AppContext context(path);
        runCli(context.todoList(), { "add", "Buy milk", "-p", "1" });
        runCli(context.todoList(), { "add", "Clean house" });
        runCli(context.todoList(), { "complete", "1" });
    }
    QVERIFY(QFile::exists(path));

    core::AppContext context(path);
    QCOMPARE(context.storePath(), path);
    QCOMPARE(context.todoList().size(), static_cast<std::size_t>(2));
    QVERIFY(context.todoList().findById(1)->completed);
    QCOMPARE(runCli(context.todoList(), { "add", "Water plants" }),
             QStringLiteral("Added new todo item (ID: 3): Water plants\n"));
}

void TodoCliTest::negativeIdIsNotFound()
{
    auto store = std::make_shared<data::InMemoryTodoStore>();
    data::TodoList list(store);
    list.addTodo("Buy milk");

    QCOMPARE(runCli(list, { "complete", "-1" }), QStringLiteral("Error: Item with ID -1 not found.\n"));
    QCOMPARE(runCli(list, { "remove", "-3" }), QStringLiteral("Error: Item with ID -3 not found.\n"));
    QCOMPARE(runCli(list, { "view", "-1" }), QStringLiteral("Error: Item with ID -1 not found.\n"));
    QCOMPARE(runCli(list, { "complete", "--", "-2" }), QStringLiteral("Error: Item with ID -2 not found.\n"));
    QCOMPARE(list.size(), static_cast<std::size_t>(1));
    QCOMPARE(store->saveCount(), static_cast<std::size_t>(1));
}

void TodoCliTest::startupFailureIsReported()
{
    QString output;
    QTextStream stream(&output);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("^startup failed")));
    const int status = cli::runApplication(
        []() -> std::unique_ptr<core::AppContext> { throw std::runtime_error("store unavailable"); },
        { "todo", "list" }, stream);

    QCOMPARE(status, 0);
    QCOMPARE(output, QStringLiteral("An error occurred: store unavailable\n"));
}

void TodoCliTest::runApplicationUsesContext()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todo_data.json"));
    const auto makeContext = [&path] { return std::make_unique<core::AppContext>(path); };

    QString output;
    QTextStream stream(&output);
    QCOMPARE(cli::runApplication(makeContext, { "todo", "add", "Buy milk" }, stream), 0);
    QCOMPARE(output, QStringLiteral("Added new todo item (ID: 1): Buy milk\n"));

    QString viewOutput;
    QTextStream viewStream(&viewOutput);
    QCOMPARE(cli::runApplication(makeContext, { "todo", "view", "1" }, viewStream), 0);
    QVERIFY(viewOutput.contains(QStringLiteral("1. [")));
    QVERIFY(viewOutput.contains(QStringLiteral("Buy milk")));
}

void TodoCliTest::storePathIsLoggedOnStoreCategory()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("todo_data.json"));

    QLoggingCategory::setFilterRules(QStringLiteral("todo.store.debug=true"));
    QTest::ignoreMessage(QtDebugMsg, QRegularExpression(QStringLiteral("^no store at")));
    QTest::ignoreMessage(QtDebugMsg, QRegularExpression(QStringLiteral("^using store")));
    core::AppContext context(path);
    QLoggingCategory::setFilterRules(QString());

    QCOMPARE(context.storePath(), path);
}

QTEST_GUILESS_MAIN(TodoCliTest)
#include "TodoCliTest.moc"
