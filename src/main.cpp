#include <QCoreApplication>
#include <QString>
#include <QTextStream>
#include <cstdio>
#include <memory>

#include "version.h"

#include "todo/cli/TodoCli.hpp"
#include "todo/core/AppContext.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Todo"));
    QCoreApplication::setApplicationName(QStringLiteral("todo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kTodoVersion));

    QCoreApplication app(argc, argv);

    QTextStream out(stdout);
    out.setCodec("UTF-8");

    return todo::cli::runApplication([] { return std::make_unique<todo::core::AppContext>(); },
                                     QCoreApplication::arguments(), out);
}
