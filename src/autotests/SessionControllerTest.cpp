/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionControllerTest.h"

// Qt
#include <QRegularExpression>
#include <QSignalSpy>
#include <QTest>

// Cactus
#include "../cactus/Poller.h"
#include "../cactus/SessionController.h"
#include "../cactus/SessionRegistry.h"
#include "FakePaneSource.h"

using namespace Cactus;

void SessionControllerTest::testSanitizeName()
{
    QCOMPARE(SessionController::sanitizeName(QStringLiteral("foo")), QStringLiteral("foo"));
    QCOMPARE(SessionController::sanitizeName(QStringLiteral("  v1.2 fix:tests ")), QStringLiteral("v1-2-fix-tests"));
    QVERIFY(SessionController::sanitizeName(QStringLiteral("   ")).isEmpty());
}

void SessionControllerTest::testGenerateName()
{
    const QRegularExpression pattern(QStringLiteral("^[a-z]+-[a-z]+$"));
    for (int i = 0; i < 20; ++i) {
        const QString name = SessionController::generateName();
        QVERIFY2(pattern.match(name).hasMatch(), qPrintable(name));
        QCOMPARE(SessionController::sanitizeName(name), name);
    }
}

void SessionControllerTest::testCreateRegistersImmediately()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    QSignalSpy createdSpy(&controller, &SessionController::sessionCreated);

    const CommandResult result = controller.create(QStringLiteral("foo"), QStringLiteral("/tmp/project"));

    QVERIFY(result.ok());
    QVERIFY(!result.warning);
    QCOMPARE(result.sessionId, QStringLiteral("claude-foo"));
    QCOMPARE(createdSpy.count(), 1);

    // Visible before any poll
    const QList<SessionView> views = registry.views();
    QCOMPARE(views.size(), 1);
    QCOMPARE(views.constFirst().id, QStringLiteral("claude-foo"));
    QCOMPARE(views.constFirst().displayName, QStringLiteral("foo"));
    QCOMPARE(views.constFirst().status, Status::Working);

    QCOMPARE(registry.get(QStringLiteral("claude-foo"))->workingDirectory, QStringLiteral("/tmp/project"));
    QCOMPARE(source.createdSessions(), QStringList{QStringLiteral("claude-foo")});
    QCOMPARE(source.workingDirectory(QStringLiteral("claude-foo")), QStringLiteral("/tmp/project"));
    QCOMPARE(source.sentKeys(QStringLiteral("claude-foo")), QStringList{QStringLiteral("claude")});
}

void SessionControllerTest::testCreateThenPollKeepsLabel()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    Poller poller(&source, &registry);

    QVERIFY(controller.create(QStringLiteral("my task")).ok());
    QVERIFY(poller.runCycle());

    QCOMPARE(registry.count(), 1);
    const auto session = registry.get(QStringLiteral("claude-my-task"));
    QVERIFY(session.has_value());
    QCOMPARE(session->displayName, QStringLiteral("my-task"));
    QCOMPARE(session->status, Status::Working);
}

void SessionControllerTest::testCreateRejectsEmptyName()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);

    const CommandResult result = controller.create(QStringLiteral("  "));
    QCOMPARE(result.error, CommandError::InvalidName);
    QVERIFY(!result.message.isEmpty());
    QVERIFY(source.createdSessions().isEmpty());
    QCOMPARE(registry.count(), 0);
}

void SessionControllerTest::testCreateDuplicateName()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);

    QVERIFY(controller.create(QStringLiteral("foo")).ok());
    const CommandResult result = controller.create(QStringLiteral("foo"));

    QCOMPARE(result.error, CommandError::DuplicateName);
    QCOMPARE(source.createdSessions().size(), 1);
    QCOMPARE(registry.count(), 1);
}

void SessionControllerTest::testCreateExistingTmuxSession()
{
    FakePaneSource source;
    source.addSession(QStringLiteral("claude-foo"));
    SessionRegistry registry;
    SessionController controller(&source, &registry);

    const CommandResult result = controller.create(QStringLiteral("foo"));

    QCOMPARE(result.error, CommandError::AlreadyExists);
    QVERIFY(!registry.contains(QStringLiteral("claude-foo")));
    QCOMPARE(registry.count(), 0);
}

void SessionControllerTest::testCreateFailureLeavesNoEntry()
{
    FakePaneSource source;
    source.setCreateError(SourceError::Timeout);
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    QSignalSpy createdSpy(&controller, &SessionController::sessionCreated);

    const CommandResult result = controller.create(QStringLiteral("foo"));

    QCOMPARE(result.error, CommandError::CreateFailed);
    QCOMPARE(registry.count(), 0);
    QCOMPARE(createdSpy.count(), 0);
}

void SessionControllerTest::testCreateLaunchFailureIsWarning()
{
    FakePaneSource source;
    source.setSendKeysError(SourceError::CommandFailed);
    SessionRegistry registry;
    SessionController controller(&source, &registry);

    const CommandResult result = controller.create(QStringLiteral("foo"));

    QVERIFY(result.ok());
    QVERIFY(result.warning);
    QVERIFY(registry.contains(QStringLiteral("claude-foo")));
}

void SessionControllerTest::testCreateWithoutLaunchCommand()
{
    FakePaneSource source;
    SessionRegistry registry;
    ControllerConfig config;
    config.sessionPrefix = QStringLiteral("agent-");
    config.launchCommand.clear();
    SessionController controller(&source, &registry, config);

    const CommandResult result = controller.create(QStringLiteral("foo"));

    QVERIFY(result.ok());
    QCOMPARE(result.sessionId, QStringLiteral("agent-foo"));
    QVERIFY(source.sentKeys(QStringLiteral("agent-foo")).isEmpty());
}

void SessionControllerTest::testCreateLabelsStatusBar()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);

    QVERIFY(controller.create(QStringLiteral("fix parser")).ok());
    QCOMPARE(source.label(QStringLiteral("claude-fix-parser")), QStringLiteral("fix-parser"));
}

void SessionControllerTest::testCreateRemembersPath()
{
    FakePaneSource source;
    SessionRegistry registry;
    QStringList remembered;
    ControllerConfig config;
    config.rememberPath = [&remembered](const QString &path) {
        remembered.append(path);
    };
    SessionController controller(&source, &registry, config);

    QVERIFY(controller.create(QStringLiteral("foo"), QStringLiteral("/tmp/project")).ok());
    QCOMPARE(remembered, QStringList{QStringLiteral("/tmp/project")});

    // No directory, nothing to remember
    QVERIFY(controller.create(QStringLiteral("bar")).ok());
    QCOMPARE(remembered.size(), 1);

    // Failed creates are not remembered
    source.setCreateError(SourceError::CommandFailed);
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("creating .* failed")));
    QVERIFY(!controller.create(QStringLiteral("baz"), QStringLiteral("/tmp/other")).ok());
    QCOMPARE(remembered.size(), 1);
}

void SessionControllerTest::testRename()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));

    QVERIFY(controller.rename(QStringLiteral("claude-foo"), QStringLiteral("Fix flaky test")).ok());
    QCOMPARE(registry.get(QStringLiteral("claude-foo"))->displayName, QStringLiteral("Fix flaky test"));
    // tmux name untouched
    QCOMPARE(source.listSessions(), QStringList{QStringLiteral("claude-foo")});

    QCOMPARE(controller.rename(QStringLiteral("claude-foo"), QStringLiteral(" ")).error, CommandError::InvalidName);
    QCOMPARE(controller.rename(QStringLiteral("claude-ghost"), QStringLiteral("x")).error, CommandError::NotFound);
}

void SessionControllerTest::testRemoveIsIdempotent()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    QSignalSpy deletedSpy(&controller, &SessionController::sessionDeleted);
    controller.create(QStringLiteral("foo"));

    const CommandResult first = controller.remove(QStringLiteral("claude-foo"));
    QVERIFY(first.ok());
    QVERIFY(!first.warning);
    QCOMPARE(registry.count(), 0);
    QCOMPARE(source.deletedSessions(), QStringList{QStringLiteral("claude-foo")});

    const CommandResult second = controller.remove(QStringLiteral("claude-foo"));
    QVERIFY(second.ok());
    QVERIFY(second.warning);
    QCOMPARE(registry.count(), 0);
    QCOMPARE(deletedSpy.count(), 1);
}

void SessionControllerTest::testRemoveSessionTmuxAlreadyLost()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));

    source.removeSession(QStringLiteral("claude-foo"));
    const CommandResult result = controller.remove(QStringLiteral("claude-foo"));

    QVERIFY(result.ok());
    QVERIFY(result.warning);
    QVERIFY(!registry.contains(QStringLiteral("claude-foo")));
}

void SessionControllerTest::testRemoveMovesClientsAway()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));
    controller.create(QStringLiteral("bar"));

    QVERIFY(controller.remove(QStringLiteral("claude-foo")).ok());

    QCOMPARE(source.switchedTo(), QStringList{QStringLiteral("claude-bar")});
    QCOMPARE(source.deletedSessions(), QStringList{QStringLiteral("claude-foo")});
    QVERIFY(registry.get(QStringLiteral("claude-bar"))->lastVisited.isValid());

    // Already gone: nobody to move
    QVERIFY(controller.remove(QStringLiteral("claude-foo")).ok());
    QCOMPARE(source.switchedTo().size(), 1);
}

void SessionControllerTest::testRemoveLastSessionKeepsClients()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));

    QVERIFY(controller.remove(QStringLiteral("claude-foo")).ok());
    QVERIFY(source.switchedTo().isEmpty());

    // Without an attached client the delete still goes through
    source.setAttachedClients(0);
    controller.create(QStringLiteral("foo"));
    controller.create(QStringLiteral("bar"));
    const CommandResult result = controller.remove(QStringLiteral("claude-foo"));
    QVERIFY(result.ok());
    QVERIFY(!result.warning);
    QVERIFY(source.switchedTo().isEmpty());
    QVERIFY(!registry.contains(QStringLiteral("claude-foo")));
}

void SessionControllerTest::testAcknowledge()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));
    const QString id = QStringLiteral("claude-foo");

    // Not Ready: accepted, nothing changes
    QVERIFY(controller.acknowledge(id).ok());
    QCOMPARE(registry.get(id)->status, Status::Working);

    registry.transition(id, Status::Ready);
    QVERIFY(controller.acknowledge(id).ok());
    QCOMPARE(registry.get(id)->status, Status::Seen);
    QVERIFY(registry.get(id)->acknowledged);

    QCOMPARE(controller.acknowledge(QStringLiteral("claude-ghost")).error, CommandError::NotFound);
}

void SessionControllerTest::testSwitchWithoutClient()
{
    FakePaneSource source;
    source.setAttachedClients(0);
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));
    const QString id = QStringLiteral("claude-foo");
    registry.transition(id, Status::Ready);
    const QDateTime visitedBefore = registry.get(id)->lastVisited;

    const CommandResult result = controller.switchTo(id);

    QCOMPARE(result.error, CommandError::NoClient);
    QVERIFY(result.message.contains(QStringLiteral("tmux attach")));
    QCOMPARE(registry.get(id)->status, Status::Ready);
    QCOMPARE(registry.get(id)->lastVisited, visitedBefore);

    QCOMPARE(controller.switchTo(QStringLiteral("claude-ghost")).error, CommandError::NotFound);
}

void SessionControllerTest::testSwitchMarksVisited()
{
    FakePaneSource source;
    SessionRegistry registry;
    SessionController controller(&source, &registry);
    controller.create(QStringLiteral("foo"));
    const QString id = QStringLiteral("claude-foo");
    registry.transition(id, Status::Ready);
    const QDateTime before = QDateTime::currentDateTimeUtc();

    QVERIFY(controller.switchTo(id).ok());

    QCOMPARE(source.switchedTo(), QStringList{id});
    QCOMPARE(registry.get(id)->status, Status::Seen);
    QVERIFY(registry.get(id)->lastVisited >= before);
}

QTEST_GUILESS_MAIN(SessionControllerTest)

#include "moc_SessionControllerTest.cpp"
