/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionController.h"
#include "PaneSource.h"
#include "SessionRegistry.h"

#include <KLocalizedString>

#include <QDateTime>
#include <QDebug>
#include <QRandomGenerator>

#include <iterator>

namespace Cactus
{

CommandResult CommandResult::success(const QString &sessionId, const QString &message)
{
    CommandResult result;
    result.sessionId = sessionId;
    result.message = message;
    return result;
}

CommandResult CommandResult::softWarning(const QString &sessionId, const QString &message)
{
    CommandResult result = success(sessionId, message);
    result.warning = true;
    return result;
}

CommandResult CommandResult::failure(CommandError error, const QString &message)
{
    CommandResult result;
    result.error = error;
    result.message = message;
    return result;
}

SessionController::SessionController(PaneSource *source, SessionRegistry *registry, const ControllerConfig &config, QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_registry(registry)
    , m_config(config)
{
}

SessionController::~SessionController() = default;

const ControllerConfig &SessionController::config() const
{
    return m_config;
}

CommandResult SessionController::create(const QString &name, const QString &workingDirectory)
{
    const QString cleanName = sanitizeName(name);
    if (cleanName.isEmpty()) {
        return CommandResult::failure(CommandError::InvalidName, i18n("Session name cannot be empty"));
    }

    const QString id = m_config.sessionPrefix + cleanName;
    if (m_registry->contains(id)) {
        return CommandResult::failure(CommandError::DuplicateName, i18n("A session named \"%1\" already exists", cleanName));
    }

    SourceError error = SourceError::None;
    if (!m_source->createSession(id, workingDirectory, cleanName, &error)) {
        if (error == SourceError::AlreadyExists) {
            return CommandResult::failure(CommandError::AlreadyExists, i18n("tmux already has a session named \"%1\"", id));
        }
        qWarning() << "SessionController: creating" << id << "failed:" << sourceErrorName(error);
        return CommandResult::failure(CommandError::CreateFailed, i18n("Could not create tmux session \"%1\" (%2)", id, sourceErrorName(error)));
    }

    AgentSession session(id, cleanName, QDateTime::currentDateTimeUtc());
    session.workingDirectory = workingDirectory;
    // The poller may have discovered it between the two calls; our label wins
    m_registry->upsert(session);

    if (m_config.rememberPath && !workingDirectory.isEmpty()) {
        m_config.rememberPath(workingDirectory);
    }

    Q_EMIT sessionCreated(id);

    if (!m_config.launchCommand.isEmpty() && !m_source->sendKeys(id, m_config.launchCommand, &error)) {
        qWarning() << "SessionController: launching" << m_config.launchCommand << "in" << id << "failed:" << sourceErrorName(error);
        return CommandResult::softWarning(id, i18n("Created %1, but could not start \"%2\" in it", id, m_config.launchCommand));
    }

    qDebug() << "SessionController: created" << id;
    return CommandResult::success(id, i18n("Created %1", id));
}

CommandResult SessionController::rename(const QString &id, const QString &newDisplayName)
{
    const QString name = newDisplayName.trimmed();
    if (name.isEmpty()) {
        return CommandResult::failure(CommandError::InvalidName, i18n("Session name cannot be empty"));
    }

    if (!m_registry->rename(id, name)) {
        return CommandResult::failure(CommandError::NotFound, i18n("No session \"%1\"", id));
    }

    return CommandResult::success(id, i18n("Renamed to %1", name));
}

CommandResult SessionController::remove(const QString &id)
{
    // Killing the session a client is viewing would detach that client, so
    // move attached clients to another session first
    QString fallback;
    const QStringList ids = m_registry->ids();
    for (const QString &other : ids) {
        if (other != id) {
            fallback = other;
            break;
        }
    }

    if (!fallback.isEmpty() && m_registry->contains(id)) {
        SourceError switchError = SourceError::None;
        if (m_source->switchClients(fallback, &switchError)) {
            m_registry->markVisited(fallback, QDateTime::currentDateTimeUtc());
        } else {
            qDebug() << "SessionController: clients stay on" << id << "-" << sourceErrorName(switchError);
        }
    }

    SourceError error = SourceError::None;
    const bool killed = m_source->deleteSession(id, &error);

    // Drop the entry even if tmux already lost the session
    const bool removed = m_registry->remove(id);
    if (removed) {
        Q_EMIT sessionDeleted(id);
    }

    if (!killed) {
        qWarning() << "SessionController: kill-session for" << id << "reported" << sourceErrorName(error);
        return CommandResult::softWarning(id, i18n("tmux session %1 was already gone", id));
    }

    return CommandResult::success(id, i18n("Deleted %1", id));
}

CommandResult SessionController::acknowledge(const QString &id)
{
    if (!m_registry->contains(id)) {
        return CommandResult::failure(CommandError::NotFound, i18n("No session \"%1\"", id));
    }

    // Not Ready (anymore): the user raced a transition, nothing to do
    m_registry->acknowledge(id);
    return CommandResult::success(id);
}

CommandResult SessionController::switchTo(const QString &id)
{
    if (!m_registry->contains(id)) {
        return CommandResult::failure(CommandError::NotFound, i18n("No session \"%1\"", id));
    }

    SourceError error = SourceError::None;
    if (!m_source->switchClients(id, &error)) {
        switch (error) {
        case SourceError::NoClient:
            return CommandResult::failure(CommandError::NoClient, i18n("No tmux client attached. Run: tmux attach -t %1", id));
        case SourceError::NotFound:
            return CommandResult::failure(CommandError::NotFound, i18n("tmux has no session \"%1\"", id));
        default:
            return CommandResult::failure(CommandError::SourceFailed, i18n("Could not switch to %1 (%2)", id, sourceErrorName(error)));
        }
    }

    m_registry->markVisited(id, QDateTime::currentDateTimeUtc());
    m_registry->acknowledge(id);
    return CommandResult::success(id, i18n("Switched to %1", id));
}

QString SessionController::sanitizeName(const QString &name)
{
    // tmux doesn't allow '.' or ':' in session names
    QString result = name.trimmed();
    result.replace(QLatin1Char('.'), QLatin1Char('-'));
    result.replace(QLatin1Char(':'), QLatin1Char('-'));
    result.replace(QLatin1Char(' '), QLatin1Char('-'));
    return result;
}

QString SessionController::generateName()
{
    static const char *const adjectives[] = {"swift", "bright", "quiet", "bold", "cool", "calm", "wild", "deep",
                                             "keen", "wise", "pure", "warm", "fresh", "smooth", "sharp", "clear"};
    static const char *const nouns[] = {"fox", "hawk", "wolf", "bear", "lynx", "eagle", "raven", "otter",
                                        "spark", "wave", "node", "pixel", "cloud", "forge", "vertex", "prism"};

    auto *rng = QRandomGenerator::global();
    const QString adjective = QString::fromLatin1(adjectives[rng->bounded(int(std::size(adjectives)))]);
    const QString noun = QString::fromLatin1(nouns[rng->bounded(int(std::size(nouns)))]);
    return adjective + QLatin1Char('-') + noun;
}

} // namespace Cactus

#include "moc_SessionController.cpp"
