/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef POLLINGSERVICE_H
#define POLLINGSERVICE_H

#include "cactuscore_export.h"

#include "Poller.h"

#include <QObject>
#include <QPointer>
#include <QThread>

namespace Cactus
{

class PaneSource;
class SessionRegistry;

/**
 * PollingService runs a Poller on its own thread.
 *
 * start() performs one cycle synchronously so the registry reflects tmux
 * before the first render, then hands the Poller to a worker thread where
 * its timer drives further cycles. stop() refuses new cycles, waits for
 * the one in flight and joins the thread.
 */
class CACTUSCORE_EXPORT PollingService : public QObject
{
    Q_OBJECT

public:
    PollingService(PaneSource *source, SessionRegistry *registry, const PollerConfig &config = PollerConfig(), QObject *parent = nullptr);
    ~PollingService() override;

    /**
     * Returns false if already running. The return value does not depend
     * on whether the initial cycle succeeded; a skipped cycle is retried
     * on the next interval.
     */
    bool start();

    void stop();

    bool isRunning() const;

    /**
     * Whether the synchronous startup cycle completed
     */
    bool initialCycleSucceeded() const
    {
        return m_initialCycleOk;
    }

Q_SIGNALS:
    /**
     * Relayed from the worker thread, delivered on this object's thread
     */
    void cycleCompleted(quint64 cycle);
    void cycleSkipped(quint64 cycle, const QString &reason);

private:
    PaneSource *m_source;
    SessionRegistry *m_registry;
    PollerConfig m_config;

    QThread *m_thread = nullptr;
    QPointer<Poller> m_poller;
    bool m_initialCycleOk = false;
};

} // namespace Cactus

#endif // POLLINGSERVICE_H
