/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PaneSource.h"

namespace Cactus
{

QString sourceErrorName(SourceError error)
{
    switch (error) {
    case SourceError::None:
        return QStringLiteral("None");
    case SourceError::ListUnavailable:
        return QStringLiteral("ListUnavailable");
    case SourceError::CaptureFailed:
        return QStringLiteral("CaptureFailed");
    case SourceError::AlreadyExists:
        return QStringLiteral("AlreadyExists");
    case SourceError::NotFound:
        return QStringLiteral("NotFound");
    case SourceError::Timeout:
        return QStringLiteral("Timeout");
    case SourceError::NoClient:
        return QStringLiteral("NoClient");
    case SourceError::CommandFailed:
        return QStringLiteral("CommandFailed");
    }
    return QString();
}

} // namespace Cactus
