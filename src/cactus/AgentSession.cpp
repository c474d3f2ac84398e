/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "AgentSession.h"

namespace Cactus
{

QString statusName(Status status)
{
    switch (status) {
    case Status::NeedsInput:
        return QStringLiteral("needs-input");
    case Status::Working:
        return QStringLiteral("working");
    case Status::Ready:
        return QStringLiteral("ready");
    case Status::Seen:
        return QStringLiteral("seen");
    }
    return QString();
}

int statusPriority(Status status)
{
    return static_cast<int>(status) + 1;
}

AgentSession::AgentSession(const QString &sessionId, const QString &name, const QDateTime &created)
    : id(sessionId)
    , displayName(name)
    , createdAt(created)
    , lastChangedAt(created)
    , lastVisited(created)
{
}

SessionView SessionView::fromSession(const AgentSession &session, int staleAfterFailures)
{
    SessionView view;
    view.id = session.id;
    view.displayName = session.displayName;
    view.status = session.status;
    view.createdAt = session.createdAt;
    view.lastVisited = session.lastVisited;
    view.stale = staleAfterFailures > 0 && session.captureFailures >= staleAfterFailures;
    return view;
}

QJsonObject SessionView::toJson() const
{
    QJsonObject obj;
    obj[QStringLiteral("id")] = id;
    obj[QStringLiteral("displayName")] = displayName;
    obj[QStringLiteral("status")] = statusName(status);
    obj[QStringLiteral("createdAt")] = createdAt.toString(Qt::ISODate);
    if (lastVisited.isValid()) {
        obj[QStringLiteral("lastVisited")] = lastVisited.toString(Qt::ISODate);
    }
    if (stale) {
        obj[QStringLiteral("stale")] = true;
    }
    return obj;
}

QString formatTimeAgo(const QDateTime &from, const QDateTime &now)
{
    const qint64 totalSeconds = from.secsTo(now);

    if (totalSeconds < 60) {
        return QStringLiteral("now");
    }
    if (totalSeconds < 3600) {
        return QStringLiteral("%1m").arg(totalSeconds / 60);
    }
    if (totalSeconds < 86400) {
        return QStringLiteral("%1h").arg(totalSeconds / 3600);
    }
    if (totalSeconds < 604800) {
        return QStringLiteral("%1d").arg(totalSeconds / 86400);
    }
    return QStringLiteral("%1w").arg(totalSeconds / 604800);
}

} // namespace Cactus
