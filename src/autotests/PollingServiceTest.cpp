/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QSignalSpy>
#include <QTest>

#include "FakePaneSource.h"
#include "PollingService.h"
#include "SessionController.h"
#include "SessionRegistry.h"

using namespace Cactus;

static PollerConfig fastConfig()
{
    PollerConfig config;
    config.intervalMs = 20;
    config.classifier.debounceMs = 50;
    return config;
}

class PollingServiceTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testInitialCycleRunsOnStart()
    {
        FakePaneSource source;
        source.addSession(QStringLiteral("claude-alpha"), QStringLiteral("compiling"));
        SessionRegistry registry;
        PollingService service(&source, &registry, fastConfig());

        QVERIFY(service.start());
        // Populated before start() returns
        QVERIFY(registry.contains(QStringLiteral("claude-alpha")));
        QVERIFY(service.initialCycleSucceeded());
        QVERIFY(service.isRunning());

        // Second start is refused
        QVERIFY(!service.start());
        service.stop();
    }

    void testInitialCycleFailureReported()
    {
        FakePaneSource source;
        source.setListError(SourceError::Timeout);
        SessionRegistry registry;
        PollingService service(&source, &registry, fastConfig());

        QVERIFY(service.start());
        QVERIFY(!service.initialCycleSucceeded());
        QCOMPARE(registry.count(), 0);
        service.stop();
    }

    void testCyclesRunInBackground()
    {
        FakePaneSource source;
        source.addSession(QStringLiteral("claude-alpha"), QStringLiteral("compiling"));
        SessionRegistry registry;
        PollingService service(&source, &registry, fastConfig());
        QSignalSpy completedSpy(&service, &PollingService::cycleCompleted);

        QVERIFY(service.start());

        // Quiet pane turns Ready through background cycles
        QTRY_COMPARE_WITH_TIMEOUT(registry.get(QStringLiteral("claude-alpha"))->status, Status::Ready, 5000);
        QVERIFY(completedSpy.count() >= 1);

        service.stop();
    }

    void testStopEndsPolling()
    {
        FakePaneSource source;
        SessionRegistry registry;
        PollingService service(&source, &registry, fastConfig());

        QVERIFY(service.start());
        QTRY_VERIFY_WITH_TIMEOUT(source.listCalls() >= 3, 5000);

        service.stop();
        QVERIFY(!service.isRunning());

        const int calls = source.listCalls();
        QTest::qWait(100);
        QCOMPARE(source.listCalls(), calls);

        // Idempotent, and the service can be restarted
        service.stop();
        QVERIFY(service.start());
        service.stop();
    }

    void testControllerWhilePolling()
    {
        FakePaneSource source;
        SessionRegistry registry;
        SessionController controller(&source, &registry);
        PollingService service(&source, &registry, fastConfig());
        QVERIFY(service.start());

        for (int i = 0; i < 20; ++i) {
            const QString name = QStringLiteral("task%1").arg(i);
            QVERIFY(controller.create(name).ok());
            QVERIFY(registry.contains(QStringLiteral("claude-") + name));
            if (i % 2 == 0) {
                QVERIFY(controller.remove(QStringLiteral("claude-") + name).ok());
            }
            QTest::qWait(5);
        }

        // Deleted sessions never come back from a listing taken before the delete
        QCOMPARE(registry.count(), 10);
        QTest::qWait(100);
        QCOMPARE(registry.count(), 10);
        service.stop();
        for (const SessionView &view : registry.views()) {
            QVERIFY(view.displayName.startsWith(QStringLiteral("task")));
        }
    }
};

QTEST_GUILESS_MAIN(PollingServiceTest)

#include "PollingServiceTest.moc"
