/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef FAKEPANESOURCE_H
#define FAKEPANESOURCE_H

#include "../cactus/PaneSource.h"

#include <QHash>
#include <QMutex>
#include <QStringList>

#include <functional>

namespace Cactus
{

/**
 * Scripted stand-in for tmux.
 *
 * Tests set the sessions and pane contents, inject failures per call kind,
 * and inspect the calls that were made. Safe to use from the poller thread.
 */
class FakePaneSource : public PaneSource
{
public:
    FakePaneSource();
    ~FakePaneSource() override;

    // Scripting
    void setSessions(const QStringList &sessions);
    void addSession(const QString &sessionId, const QString &paneText = QString());
    void removeSession(const QString &sessionId);
    void setPaneText(const QString &sessionId, const QString &paneText);
    void setListError(SourceError error);
    void setCaptureError(const QString &sessionId, SourceError error);
    void setCreateError(SourceError error);
    void setDeleteError(SourceError error);
    void setSendKeysError(SourceError error);
    void setAttachedClients(int clients);
    // Runs after the listing is taken and before it is returned, outside the lock
    void setListHook(std::function<void()> hook);

    // Recording
    int listCalls() const;
    QStringList capturedSessions() const;
    QStringList createdSessions() const;
    QStringList deletedSessions() const;
    QStringList sentKeys(const QString &sessionId) const;
    QStringList switchedTo() const;
    QString workingDirectory(const QString &sessionId) const;
    QString label(const QString &sessionId) const;

    QStringList listSessions(SourceError *error = nullptr) const override;
    QString capturePane(const QString &sessionId, SourceError *error = nullptr) const override;
    bool createSession(const QString &sessionId, const QString &workingDirectory, const QString &label, SourceError *error = nullptr) override;
    bool deleteSession(const QString &sessionId, SourceError *error = nullptr) override;
    bool sendKeys(const QString &sessionId, const QString &keys, SourceError *error = nullptr) override;
    bool switchClients(const QString &sessionId, SourceError *error = nullptr) override;

private:
    static bool fail(SourceError reason, SourceError *error);

    mutable QMutex m_mutex;

    QStringList m_sessions;
    QHash<QString, QString> m_panes;
    QHash<QString, QString> m_workingDirs;
    QHash<QString, QString> m_labels;

    SourceError m_listError = SourceError::None;
    QHash<QString, SourceError> m_captureErrors;
    SourceError m_createError = SourceError::None;
    SourceError m_deleteError = SourceError::None;
    SourceError m_sendKeysError = SourceError::None;
    int m_clients = 1;
    std::function<void()> m_listHook;

    mutable int m_listCalls = 0;
    mutable QStringList m_captured;
    QStringList m_created;
    QStringList m_deleted;
    QHash<QString, QStringList> m_sentKeys;
    QStringList m_switchedTo;
};

}

#endif // FAKEPANESOURCE_H
