/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    Based on Bobcat's SessionManager by İsmail Yılmaz
*/

#include "TmuxPaneSource.h"

#include <QDebug>
#include <QDeadlineTimer>
#include <QProcess>
#include <QStandardPaths>

namespace Cactus
{

namespace
{

void setError(SourceError *error, SourceError value)
{
    if (error) {
        *error = value;
    }
}

// tmux answers these when the server is not running, which simply means
// there are no sessions at all
bool isNoServer(const QString &errorOutput)
{
    return errorOutput.contains(QStringLiteral("no server running")) || errorOutput.contains(QStringLiteral("error connecting to"));
}

bool isMissingSession(const QString &errorOutput)
{
    return errorOutput.contains(QStringLiteral("can't find session")) || errorOutput.contains(QStringLiteral("can't find pane"))
        || errorOutput.contains(QStringLiteral("can't find window")) || isNoServer(errorOutput);
}

} // namespace

TmuxPaneSource::TmuxPaneSource(const QString &sessionPrefix, int timeoutMs)
    : m_prefix(sessionPrefix)
    , m_timeoutMs(timeoutMs)
    , m_program(QStringLiteral("tmux"))
{
}

void TmuxPaneSource::setProgram(const QString &program)
{
    m_program = program;
}

TmuxPaneSource::~TmuxPaneSource() = default;

bool TmuxPaneSource::isAvailable()
{
    const QString tmuxPath = QStandardPaths::findExecutable(QStringLiteral("tmux"));
    return !tmuxPath.isEmpty();
}

QString TmuxPaneSource::version()
{
    QProcess process;
    process.start(QStringLiteral("tmux"), {QStringLiteral("-V")});
    if (!process.waitForFinished(5000)) {
        return QString();
    }
    return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
}

QStringList TmuxPaneSource::parseSessionList(const QString &output, const QString &prefix)
{
    QStringList sessions;

    const QStringList lines = output.split(QLatin1Char('\n'), Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString name = line.trimmed();
        if (name.isEmpty() || !name.startsWith(prefix) || sessions.contains(name)) {
            continue;
        }
        sessions.append(name);
    }

    return sessions;
}

QStringList TmuxPaneSource::listSessions(SourceError *error) const
{
    const CommandResult result = executeCommand({QStringLiteral("list-sessions"), QStringLiteral("-F"), QStringLiteral("#{session_name}")});

    if (result.timedOut) {
        setError(error, SourceError::Timeout);
        return {};
    }

    if (!result.ok) {
        if (!result.failedToStart && isNoServer(result.errorOutput)) {
            setError(error, SourceError::None);
            return {};
        }
        qWarning() << "TmuxPaneSource: list-sessions failed:" << result.errorOutput.trimmed();
        setError(error, SourceError::ListUnavailable);
        return {};
    }

    setError(error, SourceError::None);
    return parseSessionList(result.output, m_prefix);
}

QString TmuxPaneSource::capturePane(const QString &sessionId, SourceError *error) const
{
    const CommandResult result = executeCommand({QStringLiteral("capture-pane"), QStringLiteral("-p"), QStringLiteral("-t"), paneTarget(sessionId)});

    if (result.timedOut) {
        setError(error, SourceError::Timeout);
        return QString();
    }
    if (!result.ok) {
        setError(error, SourceError::CaptureFailed);
        return QString();
    }

    setError(error, SourceError::None);
    return result.output;
}

bool TmuxPaneSource::createSession(const QString &sessionId, const QString &workingDirectory, const QString &label, SourceError *error)
{
    // tmux new-session -d -s <session-name> [-c <dir>]
    QStringList args;
    args << QStringLiteral("new-session") << QStringLiteral("-d") << QStringLiteral("-s") << sessionId;
    if (!workingDirectory.isEmpty()) {
        args << QStringLiteral("-c") << workingDirectory;
    }

    const CommandResult result = executeCommand(args);
    if (result.timedOut) {
        setError(error, SourceError::Timeout);
        return false;
    }
    if (!result.ok) {
        if (result.errorOutput.contains(QStringLiteral("duplicate session"))) {
            setError(error, SourceError::AlreadyExists);
        } else {
            qWarning() << "TmuxPaneSource: new-session failed:" << result.errorOutput.trimmed();
            setError(error, SourceError::CommandFailed);
        }
        return false;
    }

    // Cosmetic; the session is usable even if these fail
    const QList<QStringList> options = {
        {QStringLiteral("mouse"), QStringLiteral("on")},
        {QStringLiteral("status-left"), QStringLiteral(" %1 | ").arg(label.isEmpty() ? sessionId : label)},
        {QStringLiteral("status-right"), QString()},
    };
    for (const QStringList &option : options) {
        const CommandResult set = executeCommand(QStringList{QStringLiteral("set-option"), QStringLiteral("-t"), sessionTarget(sessionId)} + option);
        if (!set.ok) {
            qDebug() << "TmuxPaneSource: could not set" << option.constFirst() << "for" << sessionId;
        }
    }

    setError(error, SourceError::None);
    return true;
}

bool TmuxPaneSource::deleteSession(const QString &sessionId, SourceError *error)
{
    const CommandResult result = executeCommand({QStringLiteral("kill-session"), QStringLiteral("-t"), sessionTarget(sessionId)});

    if (result.timedOut) {
        setError(error, SourceError::Timeout);
        return false;
    }
    if (!result.ok) {
        setError(error, isMissingSession(result.errorOutput) ? SourceError::NotFound : SourceError::CommandFailed);
        return false;
    }

    setError(error, SourceError::None);
    return true;
}

bool TmuxPaneSource::sendKeys(const QString &sessionId, const QString &keys, SourceError *error)
{
    // Literal text first, then a separate Enter key press
    if (!keys.isEmpty()) {
        const CommandResult text = executeCommand({QStringLiteral("send-keys"), QStringLiteral("-t"), paneTarget(sessionId), QStringLiteral("-l"), keys});
        if (text.timedOut) {
            setError(error, SourceError::Timeout);
            return false;
        }
        if (!text.ok) {
            setError(error, isMissingSession(text.errorOutput) ? SourceError::NotFound : SourceError::CommandFailed);
            return false;
        }
    }

    const CommandResult enter = executeCommand({QStringLiteral("send-keys"), QStringLiteral("-t"), paneTarget(sessionId), QStringLiteral("Enter")});
    if (enter.timedOut) {
        setError(error, SourceError::Timeout);
        return false;
    }
    if (!enter.ok) {
        setError(error, isMissingSession(enter.errorOutput) ? SourceError::NotFound : SourceError::CommandFailed);
        return false;
    }

    setError(error, SourceError::None);
    return true;
}

bool TmuxPaneSource::switchClients(const QString &sessionId, SourceError *error)
{
    const CommandResult list = executeCommand({QStringLiteral("list-clients"), QStringLiteral("-F"), QStringLiteral("#{client_tty}")});
    if (list.timedOut) {
        setError(error, SourceError::Timeout);
        return false;
    }

    const QStringList clients = list.ok ? list.output.split(QLatin1Char('\n'), Qt::SkipEmptyParts) : QStringList();
    if (clients.isEmpty()) {
        setError(error, SourceError::NoClient);
        return false;
    }

    bool switched = false;
    bool missing = false;
    for (const QString &client : clients) {
        const CommandResult result =
            executeCommand({QStringLiteral("switch-client"), QStringLiteral("-c"), client.trimmed(), QStringLiteral("-t"), sessionTarget(sessionId)});
        if (result.ok) {
            switched = true;
        } else if (isMissingSession(result.errorOutput)) {
            missing = true;
        }
    }

    if (!switched) {
        setError(error, missing ? SourceError::NotFound : SourceError::CommandFailed);
        return false;
    }

    setError(error, SourceError::None);
    return true;
}

TmuxPaneSource::CommandResult TmuxPaneSource::executeCommand(const QStringList &args) const
{
    CommandResult result;

    // One budget for starting and finishing together
    const QDeadlineTimer deadline(m_timeoutMs);

    QProcess process;
    process.start(m_program, args);

    if (!process.waitForStarted(int(deadline.remainingTime()))) {
        result.failedToStart = true;
        result.errorOutput = process.errorString();
        return result;
    }

    if (!process.waitForFinished(int(qMax<qint64>(1, deadline.remainingTime())))) {
        qWarning() << "TmuxPaneSource: tmux" << args.value(0) << "timed out after" << m_timeoutMs << "ms";
        process.kill();
        process.waitForFinished(100);
        result.timedOut = true;
        return result;
    }

    result.ok = (process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0);
    result.output = QString::fromUtf8(process.readAllStandardOutput());
    result.errorOutput = QString::fromUtf8(process.readAllStandardError());
    return result;
}

QString TmuxPaneSource::sessionTarget(const QString &sessionId)
{
    return QLatin1Char('=') + sessionId;
}

QString TmuxPaneSource::paneTarget(const QString &sessionId)
{
    return QLatin1Char('=') + sessionId + QLatin1Char(':');
}

} // namespace Cactus
