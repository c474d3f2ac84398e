/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PollingService.h"

#include <QDebug>
#include <QMetaObject>

namespace Cactus
{

PollingService::PollingService(PaneSource *source, SessionRegistry *registry, const PollerConfig &config, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_registry(registry)
    , m_config(config)
{
}

PollingService::~PollingService()
{
    stop();
}

bool PollingService::start()
{
    if (isRunning()) {
        return false;
    }

    auto *poller = new Poller(m_source, m_registry, m_config);
    m_poller = poller;

    // Populate the registry before anybody renders it
    m_initialCycleOk = poller->runCycle();

    m_thread = new QThread(this);
    m_thread->setObjectName(QStringLiteral("CactusPoller"));
    poller->moveToThread(m_thread);

    connect(m_thread, &QThread::started, poller, &Poller::start);
    connect(m_thread, &QThread::finished, poller, &QObject::deleteLater);
    connect(poller, &Poller::cycleCompleted, this, &PollingService::cycleCompleted);
    connect(poller, &Poller::cycleSkipped, this, &PollingService::cycleSkipped);

    m_thread->start();
    qDebug() << "PollingService: polling every" << m_config.intervalMs << "ms";
    return true;
}

void PollingService::stop()
{
    if (!m_thread) {
        return;
    }

    if (m_poller) {
        m_poller->requestStop();
        // Queued behind a cycle that is still running, so this returns once it is done
        QMetaObject::invokeMethod(m_poller.data(), &Poller::stop, Qt::BlockingQueuedConnection);
    }

    m_thread->quit();
    m_thread->wait();

    delete m_thread;
    m_thread = nullptr;
    qDebug() << "PollingService: stopped";
}

bool PollingService::isRunning() const
{
    return m_thread && m_thread->isRunning();
}

} // namespace Cactus

#include "moc_PollingService.cpp"
