/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POLLER_H
#define POLLER_H

#include "cactuscore_export.h"

#include "StatusClassifier.h"

#include <QDateTime>
#include <QHash>
#include <QObject>
#include <QString>
#include <QTimer>

#include <atomic>

namespace Cactus
{

class PaneSource;
class SessionRegistry;

/**
 * Poller configuration
 */
struct CACTUSCORE_EXPORT PollerConfig {
    int intervalMs = 2000;

    // Consecutive cycles a session must be missing from tmux before it is
    // dropped from the registry
    int missingCyclesBeforeRemoval = 2;

    // Stripped from tmux names to form the display name of discovered sessions
    QString sessionPrefix = QStringLiteral("claude-");

    ClassifierConfig classifier;
};

/**
 * Poller runs the status-detection cycle.
 *
 * Each cycle lists the managed tmux sessions, reconciles the registry
 * against that list, captures every live pane and classifies it. A cycle
 * never throws: a failed listing skips the cycle, a failed capture keeps
 * the session's last status.
 *
 * The Poller is driven either directly through runCycle() or by its own
 * timer after start(). It lives on whatever thread calls start(); see
 * PollingService for running it in the background.
 */
class CACTUSCORE_EXPORT Poller : public QObject
{
    Q_OBJECT

public:
    Poller(PaneSource *source, SessionRegistry *registry, const PollerConfig &config = PollerConfig(), QObject *parent = nullptr);
    ~Poller() override;

    const PollerConfig &config() const;

    /**
     * Run one cycle stamped with the current time.
     * Returns false if the cycle was skipped.
     */
    bool runCycle();

    /**
     * Run one cycle stamped with @p now
     */
    bool runCycle(const QDateTime &now);

    /**
     * Sequence number of the most recent cycle (0 before the first)
     */
    quint64 cycleCount() const;

    /**
     * Consecutive cycles @p id has been missing from tmux
     */
    int missingCycles(const QString &id) const;

    /**
     * Refuse further cycles. Safe to call from any thread.
     */
    void requestStop();

    bool isStopRequested() const;

public Q_SLOTS:
    /**
     * Start periodic polling on the current thread
     */
    void start();

    /**
     * Stop the timer and refuse further cycles. A cycle already running
     * completes normally.
     */
    void stop();

Q_SIGNALS:
    void cycleCompleted(quint64 cycle);
    void cycleSkipped(quint64 cycle, const QString &reason);

private Q_SLOTS:
    void onTimeout();

private:
    void reconcile(const QStringList &external, quint64 cycle, const QDateTime &now);
    void observe(const QString &id, quint64 cycle, const QDateTime &now);
    QString displayNameFor(const QString &id) const;

    PaneSource *m_source;
    SessionRegistry *m_registry;
    PollerConfig m_config;
    StatusClassifier m_classifier;

    QTimer *m_timer = nullptr;
    std::atomic<quint64> m_cycle{0};
    std::atomic<bool> m_stopRequested{false};

    // Pending removals: id -> consecutive cycles missing. Only touched on the
    // poller's thread.
    QHash<QString, int> m_missing;
};

} // namespace Cactus

#endif // POLLER_H
