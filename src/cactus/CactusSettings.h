/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CACTUS_SETTINGS_H
#define CACTUS_SETTINGS_H

#include "cactuscore_export.h"

#include "Poller.h"
#include "SessionController.h"

#include <QObject>
#include <QString>
#include <QStringList>

#include <KSharedConfig>

namespace Cactus
{

/**
 * CactusSettings manages application-wide settings.
 *
 * Settings live in ~/.config/cactusrc and include:
 * - Polling interval, debounce window and tmux call timeout
 * - Prompt patterns used to detect sessions waiting for input
 * - tmux session prefix and the command launched in new sessions
 * - Recently used working directories
 */
class CACTUSCORE_EXPORT CactusSettings : public QObject
{
    Q_OBJECT

public:
    explicit CactusSettings(const QString &configName = QStringLiteral("cactusrc"), QObject *parent = nullptr);
    ~CactusSettings() override;

    // ========== Polling ==========

    /**
     * Time between poll cycles (default: 2000 ms)
     */
    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    /**
     * Quiescence before a session counts as Ready (default: 4000 ms)
     */
    int debounceMs() const;
    void setDebounceMs(int ms);

    /**
     * Timeout of a single tmux call. Always kept below the poll interval.
     */
    int commandTimeoutMs() const;
    void setCommandTimeoutMs(int ms);

    /**
     * Consecutive capture failures before a session is flagged stale
     */
    int staleAfterFailures() const;
    void setStaleAfterFailures(int failures);

    // ========== Classifier ==========

    int trailingLines() const;
    void setTrailingLines(int lines);

    /**
     * Regular expressions for input prompts; falls back to the built-in list
     */
    QStringList promptPatterns() const;
    void setPromptPatterns(const QStringList &patterns);

    // ========== Sessions ==========

    QString sessionPrefix() const;
    void setSessionPrefix(const QString &prefix);

    /**
     * Command typed into freshly created sessions (default: "claude")
     */
    QString launchCommand() const;
    void setLaunchCommand(const QString &command);

    /**
     * Recently used working directories, most recent first
     */
    QStringList recentPaths() const;

    /**
     * Put @p path at the front unless it (or an equivalent spelling of it)
     * is already listed
     */
    void addRecentPath(const QString &path);
    void removeRecentPath(const QString &path);

    // ========== Assembled configs ==========

    PollerConfig pollerConfig() const;

    /**
     * Controller config whose rememberPath feeds addRecentPath(); the
     * settings object must outlive the controller
     */
    ControllerConfig controllerConfig();

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    static QString resolvePath(const QString &path);

    KSharedConfig::Ptr m_config;
};

} // namespace Cactus

#endif // CACTUS_SETTINGS_H
