/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef AGENTSESSION_H
#define AGENTSESSION_H

#include "cactuscore_export.h"

#include <QDateTime>
#include <QJsonObject>
#include <QString>

namespace Cactus
{

/**
 * Attention status of an agent session.
 *
 * The declaration order is also the attention priority used when sorting
 * for display: sessions needing input come first.
 */
enum class Status {
    NeedsInput, // Agent is blocked on a prompt
    Working, // Output is still changing
    Ready, // Output settled, agent finished
    Seen // Ready session the user has looked at
};

/**
 * Lower-case name of a status ("needs-input", "working", ...)
 */
CACTUSCORE_EXPORT QString statusName(Status status);

/**
 * Sort key for attention ordering (1 = most urgent)
 */
CACTUSCORE_EXPORT int statusPriority(Status status);

/**
 * AgentSession is one tracked agent session, keyed by its tmux session name.
 *
 * Instances are plain values. The SessionRegistry owns the authoritative
 * copies; everything else works on snapshots.
 */
class CACTUSCORE_EXPORT AgentSession
{
public:
    AgentSession() = default;
    AgentSession(const QString &sessionId, const QString &name, const QDateTime &created);

    // Identification
    QString id; // tmux session name (e.g., "claude-swift-fox")
    QString displayName; // User-editable label

    // Timestamps
    QDateTime createdAt; // Immutable once registered
    QDateTime lastChangedAt; // Last fingerprint change, never moves backwards
    QDateTime lastVisited; // Last time the user switched to the session

    // Classification
    Status status = Status::Working;
    Status previousStatus = Status::Working;
    QString lastOutputFingerprint;
    bool acknowledged = false;

    QString workingDirectory; // Empty for sessions discovered from tmux

    // Polling bookkeeping
    int captureFailures = 0; // Consecutive failed captures
    quint64 lastCycle = 0; // Poll cycle whose result was applied last

    bool isValid() const
    {
        return !id.isEmpty();
    }

    bool operator==(const AgentSession &other) const
    {
        return id == other.id;
    }
};

/**
 * Read model handed to the presentation layer.
 *
 * Only carries what is needed for rendering; the fingerprint and the
 * previous status stay inside the engine.
 */
struct CACTUSCORE_EXPORT SessionView {
    QString id;
    QString displayName;
    Status status = Status::Working;
    QDateTime createdAt;
    QDateTime lastVisited;
    bool stale = false;

    static SessionView fromSession(const AgentSession &session, int staleAfterFailures);

    QJsonObject toJson() const;
};

/**
 * Compact elapsed-time label: "now", "5m", "3h", "2d", "1w"
 */
CACTUSCORE_EXPORT QString formatTimeAgo(const QDateTime &from, const QDateTime &now);

} // namespace Cactus

#endif // AGENTSESSION_H
