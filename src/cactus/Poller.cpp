/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "Poller.h"
#include "PaneSource.h"
#include "SessionRegistry.h"

#include <QDebug>
#include <QSet>

namespace Cactus
{

Poller::Poller(PaneSource *source, SessionRegistry *registry, const PollerConfig &config, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_registry(registry)
    , m_config(config)
    , m_classifier(config.classifier)
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(m_config.intervalMs);
    connect(m_timer, &QTimer::timeout, this, &Poller::onTimeout);
}

Poller::~Poller()
{
    m_timer->stop();
}

const PollerConfig &Poller::config() const
{
    return m_config;
}

bool Poller::runCycle()
{
    return runCycle(QDateTime::currentDateTimeUtc());
}

bool Poller::runCycle(const QDateTime &now)
{
    if (m_stopRequested.load()) {
        return false;
    }

    const quint64 cycle = ++m_cycle;

    SourceError error = SourceError::None;
    const QStringList external = m_source->listSessions(&error);
    if (error != SourceError::None) {
        qWarning() << "Poller: cycle" << cycle << "skipped, listing sessions failed:" << sourceErrorName(error);
        Q_EMIT cycleSkipped(cycle, sourceErrorName(error));
        return false;
    }

    reconcile(external, cycle, now);

    for (const QString &id : external) {
        observe(id, cycle, now);
    }

    Q_EMIT cycleCompleted(cycle);
    return true;
}

quint64 Poller::cycleCount() const
{
    return m_cycle.load();
}

int Poller::missingCycles(const QString &id) const
{
    return m_missing.value(id, 0);
}

void Poller::requestStop()
{
    m_stopRequested = true;
}

bool Poller::isStopRequested() const
{
    return m_stopRequested.load();
}

void Poller::start()
{
    m_stopRequested = false;
    m_timer->start();
}

void Poller::stop()
{
    m_stopRequested = true;
    m_timer->stop();
}

void Poller::onTimeout()
{
    runCycle();
}

void Poller::reconcile(const QStringList &external, quint64 cycle, const QDateTime &now)
{
    const QSet<QString> alive(external.cbegin(), external.cend());

    // Sessions created outside of us (or before we started)
    for (const QString &id : external) {
        m_missing.remove(id);

        if (m_registry->contains(id)) {
            continue;
        }

        AgentSession session(id, displayNameFor(id), now);
        session.lastCycle = cycle;
        // insert() keeps an entry the controller registered in the meantime
        // and refuses one the controller deleted after our listing
        if (m_registry->insert(session)) {
            qDebug() << "Poller: discovered session" << id;
        }
    }

    // Sessions that vanished from tmux; tolerate one flaky listing
    const QStringList known = m_registry->ids();
    for (const QString &id : known) {
        if (alive.contains(id)) {
            continue;
        }

        const int missing = m_missing.value(id, 0) + 1;
        if (missing >= m_config.missingCyclesBeforeRemoval) {
            m_missing.remove(id);
            if (m_registry->remove(id)) {
                qDebug() << "Poller: session" << id << "gone from tmux, removed";
            }
        } else {
            m_missing.insert(id, missing);
        }
    }

    // Sessions deleted by the user stay out until tmux stops listing them
    m_registry->clearTombstones(external);

    // Forget counters of sessions removed by someone else
    const QSet<QString> knownSet(known.cbegin(), known.cend());
    for (auto it = m_missing.begin(); it != m_missing.end();) {
        if (!knownSet.contains(it.key())) {
            it = m_missing.erase(it);
        } else {
            ++it;
        }
    }
}

void Poller::observe(const QString &id, quint64 cycle, const QDateTime &now)
{
    if (!m_registry->contains(id)) {
        return;
    }

    SourceError error = SourceError::None;
    const QString paneText = m_source->capturePane(id, &error);
    if (error != SourceError::None) {
        // Benign race: the session may be tearing down between list and capture
        qWarning() << "Poller: capture of" << id << "failed in cycle" << cycle << "-" << sourceErrorName(error);
        m_registry->recordCaptureFailure(id, cycle);
        return;
    }

    Observation observation;
    observation.fingerprint = StatusClassifier::fingerprint(paneText);
    observation.observedAt = now;

    m_registry->applyObservation(id, cycle, observation, [this, &paneText](Status previousStatus, bool fingerprintChanged, qint64 quiescentMs) {
        return m_classifier.classify(previousStatus, fingerprintChanged, quiescentMs, paneText);
    });
}

QString Poller::displayNameFor(const QString &id) const
{
    if (!m_config.sessionPrefix.isEmpty() && id.startsWith(m_config.sessionPrefix) && id.size() > m_config.sessionPrefix.size()) {
        return id.mid(m_config.sessionPrefix.size());
    }
    return id;
}

} // namespace Cactus

#include "moc_Poller.cpp"
