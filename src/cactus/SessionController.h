/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONCONTROLLER_H
#define SESSIONCONTROLLER_H

#include "cactuscore_export.h"

#include <QObject>
#include <QString>

#include <functional>

namespace Cactus
{

class PaneSource;
class SessionRegistry;

/**
 * Failure of a user-initiated command
 */
enum class CommandError {
    None,
    DuplicateName, // Session id already tracked
    AlreadyExists, // tmux already has the session
    NotFound, // Unknown session id
    InvalidName, // Empty after sanitizing
    CreateFailed, // tmux refused to create the session
    NoClient, // No tmux client attached to switch
    SourceFailed // Any other tmux failure
};

/**
 * Outcome of a SessionController command.
 *
 * A successful command may still carry a warning (e.g., deleting a session
 * tmux had already dropped); message is translated and meant for the user.
 */
struct CACTUSCORE_EXPORT CommandResult {
    CommandError error = CommandError::None;
    bool warning = false;
    QString message;
    QString sessionId;

    bool ok() const
    {
        return error == CommandError::None;
    }

    static CommandResult success(const QString &sessionId, const QString &message = QString());
    static CommandResult softWarning(const QString &sessionId, const QString &message);
    static CommandResult failure(CommandError error, const QString &message);
};

/**
 * Controller configuration
 */
struct CACTUSCORE_EXPORT ControllerConfig {
    // tmux session name = prefix + sanitized user name
    QString sessionPrefix = QStringLiteral("claude-");

    // Typed into a new session right after it is created; empty to skip
    QString launchCommand = QStringLiteral("claude");

    // Receives the working directory of every successfully created session
    std::function<void(const QString &path)> rememberPath;
};

/**
 * SessionController executes user-driven lifecycle commands.
 *
 * Each command touches tmux first and the registry second, so a failed
 * tmux call never leaves an orphan registry entry. The controller never
 * sets a status directly; the only status change it can trigger is the
 * Ready -> Seen acknowledgment.
 */
class CACTUSCORE_EXPORT SessionController : public QObject
{
    Q_OBJECT

public:
    SessionController(PaneSource *source, SessionRegistry *registry, const ControllerConfig &config = ControllerConfig(), QObject *parent = nullptr);
    ~SessionController() override;

    const ControllerConfig &config() const;

    /**
     * Create a tmux session for @p name and register it at once with
     * status Working, without waiting for the next poll.
     */
    CommandResult create(const QString &name, const QString &workingDirectory = QString());

    /**
     * Change the display name only; the tmux session keeps its name
     */
    CommandResult rename(const QString &id, const QString &newDisplayName);

    /**
     * Kill the tmux session and drop the registry entry. Attached clients
     * are first switched to the oldest other session, if there is one.
     * Idempotent: a session tmux no longer knows is still removed, with a
     * warning.
     */
    CommandResult remove(const QString &id);

    /**
     * Mark a Ready session as Seen. Ignored for any other status.
     */
    CommandResult acknowledge(const QString &id);

    /**
     * Point attached tmux clients at the session, then mark it visited
     * and acknowledged
     */
    CommandResult switchTo(const QString &id);

    /**
     * Replace characters tmux does not accept in session names
     */
    static QString sanitizeName(const QString &name);

    /**
     * Random "adjective-noun" session name
     */
    static QString generateName();

Q_SIGNALS:
    void sessionCreated(const QString &id);
    void sessionDeleted(const QString &id);

private:
    PaneSource *m_source;
    SessionRegistry *m_registry;
    ControllerConfig m_config;
};

} // namespace Cactus

#endif // SESSIONCONTROLLER_H
