/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    cactus - command-line front end of the session status engine

    Usage:
        cactus list [--json]             Poll once and print all sessions
        cactus watch [--cycles N]        Keep polling, reprint after every cycle
        cactus new [name] [--path dir]   Create a session and start the agent in it
        cactus delete <id>               Kill a session
        cactus switch <id>               Point attached tmux clients at a session
        cactus paths [--remove dir]      Show or edit recently used directories
*/

#include "../AgentSession.h"
#include "../CactusSettings.h"
#include "../PollingService.h"
#include "../SessionController.h"
#include "../SessionRegistry.h"
#include "../TerminationWatcher.h"
#include "../TmuxPaneSource.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTextStream>

using namespace Cactus;

namespace
{

QString statusMarker(Status status)
{
    switch (status) {
    case Status::NeedsInput:
        return QStringLiteral("!");
    case Status::Working:
        return QStringLiteral("*");
    case Status::Ready:
        return QStringLiteral("+");
    case Status::Seen:
        return QStringLiteral(" ");
    }
    return QStringLiteral("?");
}

void printTable(const QList<SessionView> &views)
{
    QTextStream out(stdout);

    if (views.isEmpty()) {
        out << i18n("No sessions. Create one with: cactus new <name>") << "\n";
        return;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    for (const SessionView &view : views) {
        out << statusMarker(view.status) << ' ' << view.displayName.leftJustified(20) << ' ' << statusName(view.status).leftJustified(12) << ' '
            << formatTimeAgo(view.lastVisited, now).rightJustified(4) << "  " << view.id;
        if (view.stale) {
            out << "  " << i18n("(stale)");
        }
        out << "\n";
    }
    out.flush();
}

void printJson(const QList<SessionView> &views)
{
    QJsonArray sessions;
    for (const SessionView &view : views) {
        sessions.append(view.toJson());
    }

    QTextStream out(stdout);
    out << QJsonDocument(sessions).toJson(QJsonDocument::Indented);
}

int report(const CommandResult &result)
{
    if (!result.ok()) {
        QTextStream(stderr) << result.message << "\n";
        return 1;
    }
    if (!result.message.isEmpty()) {
        QTextStream(result.warning ? stderr : stdout) << result.message << "\n";
    }
    return 0;
}

QString expandHome(const QString &path)
{
    if (path == QLatin1String("~") || path.startsWith(QLatin1String("~/"))) {
        return QDir::homePath() + path.mid(1);
    }
    return path;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("cactus"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("cactus");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Tracks agent sessions running in tmux and shows which ones need attention"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"), i18n("list, watch, new, delete, switch or paths"));
    parser.addPositionalArgument(QStringLiteral("argument"), i18n("Session name or id"), QStringLiteral("[argument]"));

    QCommandLineOption jsonOption(QStringLiteral("json"), i18n("Print sessions as JSON"));
    QCommandLineOption cyclesOption(QStringLiteral("cycles"), i18n("Stop watching after <n> cycles"), QStringLiteral("n"), QStringLiteral("0"));
    QCommandLineOption pathOption(QStringList() << QStringLiteral("p") << QStringLiteral("path"), i18n("Working directory of the new session"), QStringLiteral("dir"));
    QCommandLineOption removeOption(QStringLiteral("remove"), i18n("Forget a recently used directory"), QStringLiteral("dir"));
    parser.addOption(jsonOption);
    parser.addOption(cyclesOption);
    parser.addOption(pathOption);
    parser.addOption(removeOption);

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0, QStringLiteral("list"));
    const QString argument = args.value(1);

    CactusSettings settings;

    if (command == QLatin1String("paths")) {
        if (parser.isSet(removeOption)) {
            settings.removeRecentPath(parser.value(removeOption));
            settings.save();
        }
        QTextStream out(stdout);
        const QStringList paths = settings.recentPaths();
        for (const QString &path : paths) {
            out << path << "\n";
        }
        return 0;
    }

    if (!TmuxPaneSource::isAvailable()) {
        QTextStream(stderr) << i18n("tmux was not found in PATH") << "\n";
        return 1;
    }

    TmuxPaneSource source(settings.sessionPrefix(), settings.commandTimeoutMs());
    SessionRegistry registry;
    registry.setStaleAfterFailures(settings.staleAfterFailures());

    const PollerConfig pollerConfig = settings.pollerConfig();
    SessionController controller(&source, &registry, settings.controllerConfig());

    if (command == QLatin1String("list")) {
        Poller poller(&source, &registry, pollerConfig);
        if (!poller.runCycle()) {
            QTextStream(stderr) << i18n("Could not list tmux sessions") << "\n";
            return 1;
        }
        if (parser.isSet(jsonOption)) {
            printJson(registry.viewsByAttention());
        } else {
            printTable(registry.viewsByAttention());
        }
        return 0;
    }

    if (command == QLatin1String("watch")) {
        const int maxCycles = parser.value(cyclesOption).toInt();
        int cycles = 0;

        PollingService service(&source, &registry, pollerConfig);
        QObject::connect(&service, &PollingService::cycleCompleted, &app, [&]() {
            QTextStream(stdout) << "\n" << QDateTime::currentDateTime().toString(Qt::ISODate) << "\n";
            printTable(registry.viewsByAttention());
            if (maxCycles > 0 && ++cycles >= maxCycles) {
                QCoreApplication::quit();
            }
        });
        QObject::connect(&app, &QCoreApplication::aboutToQuit, &service, &PollingService::stop);

        TerminationWatcher terminationWatcher;
        QObject::connect(&terminationWatcher, &TerminationWatcher::terminationRequested, &app, &QCoreApplication::quit);
        if (!terminationWatcher.install()) {
            QTextStream(stderr) << i18n("Ctrl+C will not stop the watcher cleanly") << "\n";
        }

        service.start();
        printTable(registry.viewsByAttention());
        return app.exec();
    }

    // Commands below act on existing sessions, so learn about them first
    Poller poller(&source, &registry, pollerConfig);
    poller.runCycle();

    if (command == QLatin1String("new")) {
        const QString name = argument.isEmpty() ? SessionController::generateName() : argument;
        const QString path = parser.isSet(pathOption) ? expandHome(parser.value(pathOption)) : QDir::currentPath();
        const int rc = report(controller.create(name, path));
        settings.save();
        return rc;
    }

    if (argument.isEmpty()) {
        parser.showHelp(1);
    }

    // Accept both the full tmux name and the bare display name
    QString id = argument;
    if (!registry.contains(id) && registry.contains(settings.sessionPrefix() + argument)) {
        id = settings.sessionPrefix() + argument;
    }

    if (command == QLatin1String("delete")) {
        return report(controller.remove(id));
    }
    if (command == QLatin1String("switch")) {
        return report(controller.switchTo(id));
    }

    QTextStream(stderr) << i18n("Unknown command: %1", command) << "\n";
    parser.showHelp(1);
    return 1;
}
