/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "FakePaneSource.h"

#include <QMutexLocker>

namespace Cactus
{

FakePaneSource::FakePaneSource() = default;

FakePaneSource::~FakePaneSource() = default;

void FakePaneSource::setSessions(const QStringList &sessions)
{
    QMutexLocker locker(&m_mutex);
    m_sessions = sessions;
}

void FakePaneSource::addSession(const QString &sessionId, const QString &paneText)
{
    QMutexLocker locker(&m_mutex);
    if (!m_sessions.contains(sessionId)) {
        m_sessions.append(sessionId);
    }
    m_panes.insert(sessionId, paneText);
}

void FakePaneSource::removeSession(const QString &sessionId)
{
    QMutexLocker locker(&m_mutex);
    m_sessions.removeAll(sessionId);
    m_panes.remove(sessionId);
}

void FakePaneSource::setPaneText(const QString &sessionId, const QString &paneText)
{
    QMutexLocker locker(&m_mutex);
    m_panes.insert(sessionId, paneText);
}

void FakePaneSource::setListError(SourceError error)
{
    QMutexLocker locker(&m_mutex);
    m_listError = error;
}

void FakePaneSource::setCaptureError(const QString &sessionId, SourceError error)
{
    QMutexLocker locker(&m_mutex);
    if (error == SourceError::None) {
        m_captureErrors.remove(sessionId);
    } else {
        m_captureErrors.insert(sessionId, error);
    }
}

void FakePaneSource::setCreateError(SourceError error)
{
    QMutexLocker locker(&m_mutex);
    m_createError = error;
}

void FakePaneSource::setDeleteError(SourceError error)
{
    QMutexLocker locker(&m_mutex);
    m_deleteError = error;
}

void FakePaneSource::setSendKeysError(SourceError error)
{
    QMutexLocker locker(&m_mutex);
    m_sendKeysError = error;
}

void FakePaneSource::setAttachedClients(int clients)
{
    QMutexLocker locker(&m_mutex);
    m_clients = clients;
}

int FakePaneSource::listCalls() const
{
    QMutexLocker locker(&m_mutex);
    return m_listCalls;
}

QStringList FakePaneSource::capturedSessions() const
{
    QMutexLocker locker(&m_mutex);
    return m_captured;
}

QStringList FakePaneSource::createdSessions() const
{
    QMutexLocker locker(&m_mutex);
    return m_created;
}

QStringList FakePaneSource::deletedSessions() const
{
    QMutexLocker locker(&m_mutex);
    return m_deleted;
}

QStringList FakePaneSource::sentKeys(const QString &sessionId) const
{
    QMutexLocker locker(&m_mutex);
    return m_sentKeys.value(sessionId);
}

QStringList FakePaneSource::switchedTo() const
{
    QMutexLocker locker(&m_mutex);
    return m_switchedTo;
}

QString FakePaneSource::workingDirectory(const QString &sessionId) const
{
    QMutexLocker locker(&m_mutex);
    return m_workingDirs.value(sessionId);
}

QString FakePaneSource::label(const QString &sessionId) const
{
    QMutexLocker locker(&m_mutex);
    return m_labels.value(sessionId);
}

void FakePaneSource::setListHook(std::function<void()> hook)
{
    QMutexLocker locker(&m_mutex);
    m_listHook = std::move(hook);
}

QStringList FakePaneSource::listSessions(SourceError *error) const
{
    QMutexLocker locker(&m_mutex);
    ++m_listCalls;
    if (fail(m_listError, error)) {
        return QStringList();
    }

    const QStringList sessions = m_sessions;
    const std::function<void()> hook = m_listHook;
    locker.unlock();

    if (hook) {
        hook();
    }
    return sessions;
}

QString FakePaneSource::capturePane(const QString &sessionId, SourceError *error) const
{
    QMutexLocker locker(&m_mutex);
    m_captured.append(sessionId);
    if (fail(m_captureErrors.value(sessionId, SourceError::None), error)) {
        return QString();
    }
    if (!m_sessions.contains(sessionId)) {
        fail(SourceError::CaptureFailed, error);
        return QString();
    }
    return m_panes.value(sessionId);
}

bool FakePaneSource::createSession(const QString &sessionId, const QString &workingDirectory, const QString &label, SourceError *error)
{
    QMutexLocker locker(&m_mutex);
    if (fail(m_createError, error)) {
        return false;
    }
    if (m_sessions.contains(sessionId)) {
        return !fail(SourceError::AlreadyExists, error);
    }

    m_sessions.append(sessionId);
    m_panes.insert(sessionId, QString());
    m_workingDirs.insert(sessionId, workingDirectory);
    m_labels.insert(sessionId, label);
    m_created.append(sessionId);
    return true;
}

bool FakePaneSource::deleteSession(const QString &sessionId, SourceError *error)
{
    QMutexLocker locker(&m_mutex);
    if (fail(m_deleteError, error)) {
        return false;
    }
    if (m_sessions.removeAll(sessionId) == 0) {
        return !fail(SourceError::NotFound, error);
    }

    m_panes.remove(sessionId);
    m_deleted.append(sessionId);
    return true;
}

bool FakePaneSource::sendKeys(const QString &sessionId, const QString &keys, SourceError *error)
{
    QMutexLocker locker(&m_mutex);
    if (fail(m_sendKeysError, error)) {
        return false;
    }
    if (!m_sessions.contains(sessionId)) {
        return !fail(SourceError::NotFound, error);
    }

    m_sentKeys[sessionId].append(keys);
    return true;
}

bool FakePaneSource::switchClients(const QString &sessionId, SourceError *error)
{
    QMutexLocker locker(&m_mutex);
    if (!m_sessions.contains(sessionId)) {
        return !fail(SourceError::NotFound, error);
    }
    if (m_clients <= 0) {
        return !fail(SourceError::NoClient, error);
    }

    m_switchedTo.append(sessionId);
    return true;
}

bool FakePaneSource::fail(SourceError reason, SourceError *error)
{
    if (error) {
        *error = reason;
    }
    return reason != SourceError::None;
}

}
