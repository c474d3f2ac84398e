/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATUSCLASSIFIER_H
#define STATUSCLASSIFIER_H

#include "cactuscore_export.h"

#include "AgentSession.h"

#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

namespace Cactus
{

/**
 * Tunables for status classification
 */
struct CACTUSCORE_EXPORT ClassifierConfig {
    // Regular expressions matched against the trailing region of the pane.
    // Any match means the agent is waiting for the user.
    QStringList promptPatterns = defaultPromptPatterns();

    // Number of non-blank lines at the bottom of the pane that make up the
    // trailing region
    int trailingLines = 8;

    // Quiescence required before a Working session is declared Ready
    qint64 debounceMs = 4000;

    static QStringList defaultPromptPatterns();
};

/**
 * StatusClassifier maps one pane observation to a Status.
 *
 * Pure: no I/O, no clock. The poller supplies whether the fingerprint
 * changed and for how long the output has been quiet.
 *
 * Evaluation order, first match wins:
 *   1. NeedsInput - trailing region matches a prompt pattern
 *   2. Working    - output changed since the last poll
 *   3. Ready      - output quiet for longer than the debounce window
 * Seen is never inferred; it is only entered through acknowledgment and
 * kept while the output stays unchanged.
 */
class CACTUSCORE_EXPORT StatusClassifier
{
public:
    explicit StatusClassifier(const ClassifierConfig &config = ClassifierConfig());

    void setConfig(const ClassifierConfig &config);
    const ClassifierConfig &config() const;

    /**
     * Number of prompt patterns that compiled successfully
     */
    int validPatternCount() const
    {
        return m_patterns.size();
    }

    Status classify(Status previousStatus, bool fingerprintChanged, qint64 quiescentMs, const QString &paneText) const;

    /**
     * Whether the bottom of @p paneText looks like a prompt for input
     */
    bool detectInputPrompt(const QString &paneText) const;

    /**
     * Strip trailing whitespace from every line and drop trailing blank
     * lines, so cursor blinks and padding do not register as output.
     */
    static QString normalize(const QString &paneText);

    /**
     * Hex SHA-1 of the normalized text; empty for an empty pane
     */
    static QString fingerprint(const QString &paneText);

    /**
     * Last @p count non-blank lines of the normalized text
     */
    static QStringList trailingLines(const QString &paneText, int count);

private:
    void compilePatterns();

    ClassifierConfig m_config;
    QList<QRegularExpression> m_patterns;
};

} // namespace Cactus

#endif // STATUSCLASSIFIER_H
