/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PANESOURCE_H
#define PANESOURCE_H

#include "cactuscore_export.h"

#include <QString>
#include <QStringList>

namespace Cactus
{

/**
 * Failure reported by a PaneSource call
 */
enum class SourceError {
    None,
    ListUnavailable, // tmux server unreachable
    CaptureFailed, // Session missing or capture refused
    AlreadyExists, // create on an existing session name
    NotFound, // Operation on an unknown session
    Timeout, // tmux did not answer in time
    NoClient, // No tmux client attached to switch
    CommandFailed // tmux rejected the command for another reason
};

CACTUSCORE_EXPORT QString sourceErrorName(SourceError error);

/**
 * PaneSource is the boundary to the terminal multiplexer.
 *
 * Implementations perform I/O only and apply no policy. Every call must be
 * safe to make concurrently from the poller thread and the UI thread, and
 * must return within a bounded time. Failures are reported through the
 * return value plus the optional @p error out-parameter.
 */
class CACTUSCORE_EXPORT PaneSource
{
public:
    virtual ~PaneSource() = default;

    /**
     * Names of the managed sessions currently alive.
     * On failure returns an empty list and sets ListUnavailable or Timeout.
     */
    virtual QStringList listSessions(SourceError *error = nullptr) const = 0;

    /**
     * Visible text of the session's active pane.
     * On failure returns an empty string and sets CaptureFailed or Timeout.
     */
    virtual QString capturePane(const QString &sessionId, SourceError *error = nullptr) const = 0;

    /**
     * Start a detached session in @p workingDirectory. @p label is shown in
     * the session's status bar.
     */
    virtual bool createSession(const QString &sessionId, const QString &workingDirectory, const QString &label, SourceError *error = nullptr) = 0;

    virtual bool deleteSession(const QString &sessionId, SourceError *error = nullptr) = 0;

    /**
     * Type @p keys into the session followed by Enter
     */
    virtual bool sendKeys(const QString &sessionId, const QString &keys, SourceError *error = nullptr) = 0;

    /**
     * Point every attached client at @p sessionId
     */
    virtual bool switchClients(const QString &sessionId, SourceError *error = nullptr) = 0;
};

} // namespace Cactus

#endif // PANESOURCE_H
