/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"

#include <QReadLocker>
#include <QWriteLocker>

#include <algorithm>

namespace Cactus
{

SessionRegistry::SessionRegistry(QObject *parent)
    : QObject(parent)
{
}

SessionRegistry::~SessionRegistry() = default;

void SessionRegistry::upsert(const AgentSession &session)
{
    if (!session.isValid()) {
        return;
    }

    bool added = false;
    {
        QWriteLocker locker(&m_lock);
        m_tombstones.remove(session.id);
        auto it = m_sessions.find(session.id);
        if (it == m_sessions.end()) {
            m_sessions.insert(session.id, session);
            added = true;
        } else {
            const QDateTime created = it->createdAt;
            const QDateTime lastChanged = it->lastChangedAt;
            const quint64 lastCycle = it->lastCycle;
            const QString fingerprint = it->lastOutputFingerprint;
            *it = session;
            it->createdAt = created;
            if (it->lastOutputFingerprint.isEmpty()) {
                it->lastOutputFingerprint = fingerprint;
            }
            if (lastChanged > it->lastChangedAt) {
                it->lastChangedAt = lastChanged;
            }
            it->lastCycle = qMax(lastCycle, it->lastCycle);
        }
    }

    if (added) {
        Q_EMIT sessionAdded(session.id);
    } else {
        Q_EMIT sessionChanged(session.id);
    }
}

bool SessionRegistry::insert(const AgentSession &session)
{
    if (!session.isValid()) {
        return false;
    }

    {
        QWriteLocker locker(&m_lock);
        if (m_sessions.contains(session.id) || m_tombstones.contains(session.id)) {
            return false;
        }
        m_sessions.insert(session.id, session);
    }

    Q_EMIT sessionAdded(session.id);
    return true;
}

bool SessionRegistry::remove(const QString &id)
{
    {
        QWriteLocker locker(&m_lock);
        if (m_sessions.remove(id) == 0) {
            return false;
        }
        m_tombstones.insert(id);
    }

    Q_EMIT sessionRemoved(id);
    return true;
}

bool SessionRegistry::hasTombstone(const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_tombstones.contains(id);
}

void SessionRegistry::clearTombstones(const QStringList &listed)
{
    const QSet<QString> alive(listed.cbegin(), listed.cend());

    QWriteLocker locker(&m_lock);
    for (auto it = m_tombstones.begin(); it != m_tombstones.end();) {
        if (!alive.contains(*it)) {
            it = m_tombstones.erase(it);
        } else {
            ++it;
        }
    }
}

bool SessionRegistry::contains(const QString &id) const
{
    QReadLocker locker(&m_lock);
    return m_sessions.contains(id);
}

std::optional<AgentSession> SessionRegistry::get(const QString &id) const
{
    QReadLocker locker(&m_lock);
    auto it = m_sessions.constFind(id);
    if (it == m_sessions.constEnd()) {
        return std::nullopt;
    }
    return *it;
}

QList<AgentSession> SessionRegistry::list() const
{
    QList<AgentSession> sessions;
    {
        QReadLocker locker(&m_lock);
        sessions = m_sessions.values();
    }

    std::sort(sessions.begin(), sessions.end(), [](const AgentSession &a, const AgentSession &b) {
        if (a.createdAt != b.createdAt) {
            return a.createdAt < b.createdAt;
        }
        return a.id < b.id;
    });

    return sessions;
}

QStringList SessionRegistry::ids() const
{
    QStringList result;
    const QList<AgentSession> sessions = list();
    result.reserve(sessions.size());
    for (const AgentSession &session : sessions) {
        result.append(session.id);
    }
    return result;
}

int SessionRegistry::count() const
{
    QReadLocker locker(&m_lock);
    return m_sessions.size();
}

QList<SessionView> SessionRegistry::views() const
{
    const QList<AgentSession> sessions = list();
    const int staleAfter = staleAfterFailures();

    QList<SessionView> result;
    result.reserve(sessions.size());
    for (const AgentSession &session : sessions) {
        result.append(SessionView::fromSession(session, staleAfter));
    }
    return result;
}

QList<SessionView> SessionRegistry::viewsByAttention() const
{
    QList<SessionView> result = views();

    std::stable_sort(result.begin(), result.end(), [](const SessionView &a, const SessionView &b) {
        const int pa = statusPriority(a.status);
        const int pb = statusPriority(b.status);
        if (pa != pb) {
            return pa < pb;
        }
        return a.lastVisited > b.lastVisited;
    });

    return result;
}

bool SessionRegistry::transition(const QString &id, Status newStatus)
{
    Status oldStatus;
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            return false;
        }
        oldStatus = it->status;
        applyStatus(*it, newStatus);
    }

    Q_EMIT sessionChanged(id);
    if (oldStatus != newStatus) {
        Q_EMIT statusChanged(id, static_cast<int>(newStatus), static_cast<int>(oldStatus));
    }
    return true;
}

bool SessionRegistry::applyObservation(const QString &id, quint64 cycle, const Observation &observation, const ClassifyFunction &classify)
{
    Status oldStatus;
    Status newStatus;
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            return false;
        }
        if (cycle < it->lastCycle) {
            return false;
        }

        it->lastCycle = cycle;
        it->captureFailures = 0;

        const bool changed = observation.fingerprint != it->lastOutputFingerprint;
        qint64 quiescentMs = 0;
        if (changed) {
            it->lastOutputFingerprint = observation.fingerprint;
            if (observation.observedAt > it->lastChangedAt) {
                it->lastChangedAt = observation.observedAt;
            }
            it->acknowledged = false;
        } else {
            quiescentMs = qMax<qint64>(0, it->lastChangedAt.msecsTo(observation.observedAt));
        }

        oldStatus = it->status;
        newStatus = classify ? classify(oldStatus, changed, quiescentMs) : oldStatus;
        applyStatus(*it, newStatus);
    }

    Q_EMIT sessionChanged(id);
    if (oldStatus != newStatus) {
        Q_EMIT statusChanged(id, static_cast<int>(newStatus), static_cast<int>(oldStatus));
    }
    return true;
}

bool SessionRegistry::recordCaptureFailure(const QString &id, quint64 cycle)
{
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end() || cycle < it->lastCycle) {
            return false;
        }
        it->lastCycle = cycle;
        ++it->captureFailures;
    }

    Q_EMIT sessionChanged(id);
    return true;
}

bool SessionRegistry::acknowledge(const QString &id)
{
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end() || it->status != Status::Ready) {
            return false;
        }
        applyStatus(*it, Status::Seen);
    }

    Q_EMIT sessionChanged(id);
    Q_EMIT statusChanged(id, static_cast<int>(Status::Seen), static_cast<int>(Status::Ready));
    return true;
}

bool SessionRegistry::rename(const QString &id, const QString &displayName)
{
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            return false;
        }
        it->displayName = displayName;
    }

    Q_EMIT sessionChanged(id);
    return true;
}

bool SessionRegistry::markVisited(const QString &id, const QDateTime &when)
{
    {
        QWriteLocker locker(&m_lock);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end()) {
            return false;
        }
        it->lastVisited = when;
    }

    Q_EMIT sessionChanged(id);
    return true;
}

void SessionRegistry::setStaleAfterFailures(int failures)
{
    QWriteLocker locker(&m_lock);
    m_staleAfterFailures = failures;
}

int SessionRegistry::staleAfterFailures() const
{
    QReadLocker locker(&m_lock);
    return m_staleAfterFailures;
}

void SessionRegistry::applyStatus(AgentSession &session, Status newStatus)
{
    if (newStatus == Status::Seen) {
        session.acknowledged = true;
    } else if (newStatus == Status::Working) {
        session.acknowledged = false;
    }

    if (session.status == newStatus) {
        return;
    }

    session.previousStatus = session.status;
    session.status = newStatus;
}

} // namespace Cactus

#include "moc_SessionRegistry.cpp"
