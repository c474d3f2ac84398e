/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#ifndef TMUXPANESOURCE_H
#define TMUXPANESOURCE_H

#include "cactuscore_export.h"

#include "PaneSource.h"

#include <QString>
#include <QStringList>

namespace Cactus
{

/**
 * TmuxPaneSource talks to the tmux server through its command line.
 *
 * Each call spawns its own tmux client process and waits for it with a
 * bounded timeout, so the object carries no mutable state and can be used
 * from the poller thread and the UI thread at the same time.
 *
 * Only sessions whose name starts with the configured prefix are listed.
 */
class CACTUSCORE_EXPORT TmuxPaneSource : public PaneSource
{
public:
    explicit TmuxPaneSource(const QString &sessionPrefix = QStringLiteral("claude-"), int timeoutMs = 1500);
    ~TmuxPaneSource() override;

    /**
     * Check if tmux is available on the system
     */
    static bool isAvailable();

    /**
     * Get tmux version string
     */
    static QString version();

    /**
     * Parse "list-sessions -F #{session_name}" output, keeping only names
     * that start with @p prefix
     */
    static QStringList parseSessionList(const QString &output, const QString &prefix);

    QString sessionPrefix() const
    {
        return m_prefix;
    }

    int timeoutMs() const
    {
        return m_timeoutMs;
    }

    /**
     * tmux binary to run (default: "tmux" from PATH)
     */
    void setProgram(const QString &program);

    QString program() const
    {
        return m_program;
    }

    QStringList listSessions(SourceError *error = nullptr) const override;
    QString capturePane(const QString &sessionId, SourceError *error = nullptr) const override;
    bool createSession(const QString &sessionId, const QString &workingDirectory, const QString &label, SourceError *error = nullptr) override;
    bool deleteSession(const QString &sessionId, SourceError *error = nullptr) override;
    bool sendKeys(const QString &sessionId, const QString &keys, SourceError *error = nullptr) override;
    bool switchClients(const QString &sessionId, SourceError *error = nullptr) override;

private:
    /**
     * Outcome of one tmux invocation
     */
    struct CommandResult {
        bool ok = false;
        bool timedOut = false;
        bool failedToStart = false;
        QString output;
        QString errorOutput;
    };

    /**
     * Execute a tmux command with the configured timeout
     */
    CommandResult executeCommand(const QStringList &args) const;

    // Exact-match targets so "claude-foo" never resolves to "claude-foobar"
    static QString sessionTarget(const QString &sessionId);
    static QString paneTarget(const QString &sessionId);

    QString m_prefix;
    int m_timeoutMs;
    QString m_program;
};

} // namespace Cactus

#endif // TMUXPANESOURCE_H
