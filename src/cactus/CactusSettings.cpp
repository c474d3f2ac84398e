/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "CactusSettings.h"

#include <KConfigGroup>
#include <QDir>
#include <QFileInfo>

#include <utility>

namespace Cactus
{

CactusSettings::CactusSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    m_config = KSharedConfig::openConfig(configName);
}

CactusSettings::~CactusSettings()
{
    save();
}

int CactusSettings::pollIntervalMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    return qMax(100, group.readEntry("IntervalMs", 2000));
}

void CactusSettings::setPollIntervalMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    group.writeEntry("IntervalMs", ms);
    Q_EMIT settingsChanged();
}

int CactusSettings::debounceMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    return qMax(0, group.readEntry("DebounceMs", 4000));
}

void CactusSettings::setDebounceMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    group.writeEntry("DebounceMs", ms);
    Q_EMIT settingsChanged();
}

int CactusSettings::commandTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    const int configured = group.readEntry("CommandTimeoutMs", 1500);
    // A hung tmux call must never outlast a poll interval
    return qBound(100, configured, qMax(100, pollIntervalMs() - 1));
}

void CactusSettings::setCommandTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    group.writeEntry("CommandTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

int CactusSettings::staleAfterFailures() const
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    return group.readEntry("StaleAfterFailures", 3);
}

void CactusSettings::setStaleAfterFailures(int failures)
{
    KConfigGroup group(m_config, QStringLiteral("Polling"));
    group.writeEntry("StaleAfterFailures", failures);
    Q_EMIT settingsChanged();
}

int CactusSettings::trailingLines() const
{
    KConfigGroup group(m_config, QStringLiteral("Classifier"));
    return qMax(1, group.readEntry("TrailingLines", 8));
}

void CactusSettings::setTrailingLines(int lines)
{
    KConfigGroup group(m_config, QStringLiteral("Classifier"));
    group.writeEntry("TrailingLines", lines);
    Q_EMIT settingsChanged();
}

QStringList CactusSettings::promptPatterns() const
{
    KConfigGroup group(m_config, QStringLiteral("Classifier"));
    if (!group.hasKey("PromptPatterns")) {
        return ClassifierConfig::defaultPromptPatterns();
    }
    return group.readEntry("PromptPatterns", QStringList());
}

void CactusSettings::setPromptPatterns(const QStringList &patterns)
{
    KConfigGroup group(m_config, QStringLiteral("Classifier"));
    group.writeEntry("PromptPatterns", patterns);
    Q_EMIT settingsChanged();
}

QString CactusSettings::sessionPrefix() const
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    return group.readEntry("Prefix", QStringLiteral("claude-"));
}

void CactusSettings::setSessionPrefix(const QString &prefix)
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    group.writeEntry("Prefix", prefix);
    Q_EMIT settingsChanged();
}

QString CactusSettings::launchCommand() const
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    return group.readEntry("LaunchCommand", QStringLiteral("claude"));
}

void CactusSettings::setLaunchCommand(const QString &command)
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    group.writeEntry("LaunchCommand", command);
    Q_EMIT settingsChanged();
}

QStringList CactusSettings::recentPaths() const
{
    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    return group.readEntry("RecentPaths", QStringList());
}

void CactusSettings::addRecentPath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return;
    }

    QStringList paths = recentPaths();
    const QString resolved = resolvePath(trimmed);
    for (const QString &existing : std::as_const(paths)) {
        if (resolvePath(existing) == resolved) {
            return;
        }
    }

    paths.prepend(trimmed);

    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    group.writeEntry("RecentPaths", paths);
    Q_EMIT settingsChanged();
}

void CactusSettings::removeRecentPath(const QString &path)
{
    QStringList paths = recentPaths();
    if (paths.removeAll(path) == 0) {
        return;
    }

    KConfigGroup group(m_config, QStringLiteral("Sessions"));
    if (paths.isEmpty()) {
        group.deleteEntry("RecentPaths");
    } else {
        group.writeEntry("RecentPaths", paths);
    }
    Q_EMIT settingsChanged();
}

PollerConfig CactusSettings::pollerConfig() const
{
    PollerConfig config;
    config.intervalMs = pollIntervalMs();
    config.sessionPrefix = sessionPrefix();
    config.classifier.promptPatterns = promptPatterns();
    config.classifier.trailingLines = trailingLines();
    config.classifier.debounceMs = debounceMs();
    return config;
}

ControllerConfig CactusSettings::controllerConfig()
{
    ControllerConfig config;
    config.sessionPrefix = sessionPrefix();
    config.launchCommand = launchCommand();
    config.rememberPath = [this](const QString &path) {
        addRecentPath(path);
    };
    return config;
}

void CactusSettings::save()
{
    m_config->sync();
}

QString CactusSettings::resolvePath(const QString &path)
{
    QString expanded = path;
    if (expanded == QLatin1String("~") || expanded.startsWith(QLatin1String("~/"))) {
        expanded.replace(0, 1, QDir::homePath());
    }

    QFileInfo info(expanded);
    const QString canonical = info.canonicalFilePath();
    return canonical.isEmpty() ? QDir::cleanPath(info.absoluteFilePath()) : canonical;
}

} // namespace Cactus

#include "moc_CactusSettings.cpp"
