/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include "cactuscore_export.h"

#include "AgentSession.h"

#include <QDateTime>
#include <QHash>
#include <QList>
#include <QObject>
#include <QReadWriteLock>
#include <QSet>
#include <QString>
#include <QStringList>

#include <functional>
#include <optional>

namespace Cactus
{

/**
 * One pane capture of a session, as seen by the poller
 */
struct CACTUSCORE_EXPORT Observation {
    QString fingerprint;
    QDateTime observedAt;
};

/**
 * Decides the new status from the stored status and the change signals
 */
using ClassifyFunction = std::function<Status(Status previousStatus, bool fingerprintChanged, qint64 quiescentMs)>;

/**
 * SessionRegistry is the single source of truth for tracked sessions.
 *
 * Readers (the presentation loop, possibly every frame) and writers (the
 * poller thread once per interval, the controller on user action) share
 * it concurrently. Every mutation takes the write lock, so updates are
 * serialized and a reader never sees a half-written session. All reads
 * return copies.
 *
 * Change signals are emitted after the lock is released, from whichever
 * thread performed the change; connect with Qt::QueuedConnection (the
 * default across threads) to receive them on the UI thread.
 */
class CACTUSCORE_EXPORT SessionRegistry : public QObject
{
    Q_OBJECT

public:
    explicit SessionRegistry(QObject *parent = nullptr);
    ~SessionRegistry() override;

    /**
     * Insert or replace the session with the same id.
     * An existing entry keeps the createdAt it was registered with, and
     * lastChangedAt and lastCycle never move backwards. An empty fingerprint
     * keeps the stored one. Clears a tombstone left by remove().
     */
    void upsert(const AgentSession &session);

    /**
     * Insert only if no session with this id exists and the id was not
     * removed since the last listing that still showed it.
     * Returns false if the id is taken or tombstoned.
     */
    bool insert(const AgentSession &session);

    /**
     * Remove a session and leave a tombstone for its id, so a listing
     * taken before the removal cannot bring it back.
     * Returns false if it was already gone.
     */
    bool remove(const QString &id);

    bool hasTombstone(const QString &id) const;

    /**
     * Drop the tombstones of ids missing from @p listed, a successful
     * listing of the external sessions
     */
    void clearTombstones(const QStringList &listed);

    bool contains(const QString &id) const;

    std::optional<AgentSession> get(const QString &id) const;

    /**
     * Point-in-time copy of all sessions ordered by createdAt, then id
     */
    QList<AgentSession> list() const;

    QStringList ids() const;

    int count() const;

    /**
     * Presentation view of list()
     */
    QList<SessionView> views() const;

    /**
     * Views ordered by status priority, most recently visited first
     */
    QList<SessionView> viewsByAttention() const;

    /**
     * Move a session to @p newStatus. The old status becomes
     * previousStatus; entering Seen sets acknowledged, entering Working
     * clears it. Returns false if the session no longer exists.
     */
    bool transition(const QString &id, Status newStatus);

    /**
     * Apply one poll result.
     *
     * Compares the fingerprint with the stored one, computes quiescence
     * and calls @p classify, all under the write lock, so an acknowledge
     * racing with the poller is never overwritten by a stale status.
     * Results from a cycle older than the last applied one are discarded.
     * Returns false if discarded or the session is gone.
     */
    bool applyObservation(const QString &id, quint64 cycle, const Observation &observation, const ClassifyFunction &classify);

    /**
     * Count a failed capture; status is left untouched
     */
    bool recordCaptureFailure(const QString &id, quint64 cycle);

    /**
     * Ready -> Seen. Returns true only if the transition happened.
     */
    bool acknowledge(const QString &id);

    bool rename(const QString &id, const QString &displayName);

    bool markVisited(const QString &id, const QDateTime &when);

    /**
     * Consecutive capture failures after which a session is shown as stale
     */
    void setStaleAfterFailures(int failures);
    int staleAfterFailures() const;

Q_SIGNALS:
    void sessionAdded(const QString &id);
    void sessionRemoved(const QString &id);

    /**
     * Any field of the session changed
     */
    void sessionChanged(const QString &id);

    /**
     * Status values are Cactus::Status cast to int
     */
    void statusChanged(const QString &id, int newStatus, int oldStatus);

private:
    // Caller must hold the write lock
    void applyStatus(AgentSession &session, Status newStatus);

    mutable QReadWriteLock m_lock;
    QHash<QString, AgentSession> m_sessions;
    QSet<QString> m_tombstones;
    int m_staleAfterFailures = 3;
};

} // namespace Cactus

#endif // SESSIONREGISTRY_H
