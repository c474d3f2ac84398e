/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "StatusClassifier.h"

#include <QCryptographicHash>
#include <QDebug>

#include <utility>

namespace Cactus
{

QStringList ClassifierConfig::defaultPromptPatterns()
{
    return {
        // Last line is a question
        QStringLiteral("\\?\\z"),
        // (y/n), [Y/n], (yes/no)
        QStringLiteral("(?i)[\\(\\[]\\s*y(?:es)?\\s*/\\s*n(?:o)?\\s*[\\)\\]]"),
        // Agent confirmation dialogs
        QStringLiteral("(?i)would you like to proceed\\?"),
        QStringLiteral("(?i)\\bdo you want to\\b"),
        QStringLiteral("(?m)^\\s*(?:❯\\s*)?1\\.\\s+Yes\\b"),
        // Selector arrow on an approval choice
        QStringLiteral("(?mi)❯[^\\n]*\\b(?:yes|allow)\\b"),
        // Shell prompt on the last line ("user@host:~/src$", "bash-5.2$"): the agent has exited
        QStringLiteral("(?:^|\\n)(?:\\S*[@:\\-]\\S*)?[$#]\\z"),
    };
}

StatusClassifier::StatusClassifier(const ClassifierConfig &config)
    : m_config(config)
{
    compilePatterns();
}

void StatusClassifier::setConfig(const ClassifierConfig &config)
{
    m_config = config;
    compilePatterns();
}

const ClassifierConfig &StatusClassifier::config() const
{
    return m_config;
}

void StatusClassifier::compilePatterns()
{
    m_patterns.clear();

    for (const QString &pattern : std::as_const(m_config.promptPatterns)) {
        QRegularExpression re(pattern);
        if (!re.isValid()) {
            qWarning() << "StatusClassifier: skipping invalid prompt pattern" << pattern << "-" << re.errorString();
            continue;
        }
        re.optimize();
        m_patterns.append(re);
    }
}

Status StatusClassifier::classify(Status previousStatus, bool fingerprintChanged, qint64 quiescentMs, const QString &paneText) const
{
    const QString normalized = normalize(paneText);

    // Freshly created session, nothing drawn yet
    if (normalized.trimmed().isEmpty()) {
        return Status::Working;
    }

    if (detectInputPrompt(normalized)) {
        return Status::NeedsInput;
    }

    if (fingerprintChanged) {
        return Status::Working;
    }

    switch (previousStatus) {
    case Status::Ready:
    case Status::Seen:
        return previousStatus;
    case Status::Working:
    case Status::NeedsInput:
        break;
    }

    return quiescentMs > m_config.debounceMs ? Status::Ready : Status::Working;
}

bool StatusClassifier::detectInputPrompt(const QString &paneText) const
{
    const QStringList tail = trailingLines(paneText, m_config.trailingLines);
    if (tail.isEmpty()) {
        return false;
    }

    const QString region = tail.join(QLatin1Char('\n'));
    for (const QRegularExpression &re : m_patterns) {
        if (re.match(region).hasMatch()) {
            return true;
        }
    }

    return false;
}

QString StatusClassifier::normalize(const QString &paneText)
{
    QStringList lines = paneText.split(QLatin1Char('\n'));

    for (QString &line : lines) {
        int end = line.size();
        while (end > 0 && line.at(end - 1).isSpace()) {
            --end;
        }
        line.truncate(end);
    }

    while (!lines.isEmpty() && lines.constLast().isEmpty()) {
        lines.removeLast();
    }

    return lines.join(QLatin1Char('\n'));
}

QString StatusClassifier::fingerprint(const QString &paneText)
{
    const QString normalized = normalize(paneText);
    if (normalized.isEmpty()) {
        return QString();
    }
    return QString::fromLatin1(QCryptographicHash::hash(normalized.toUtf8(), QCryptographicHash::Sha1).toHex());
}

QStringList StatusClassifier::trailingLines(const QString &paneText, int count)
{
    const QStringList lines = normalize(paneText).split(QLatin1Char('\n'));

    QStringList tail;
    for (int i = lines.size() - 1; i >= 0 && tail.size() < count; --i) {
        if (lines.at(i).trimmed().isEmpty()) {
            continue;
        }
        tail.prepend(lines.at(i));
    }

    return tail;
}

} // namespace Cactus
