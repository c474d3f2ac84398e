/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef STATUSCLASSIFIERTEST_H
#define STATUSCLASSIFIERTEST_H

#include <QObject>

namespace Cactus
{

class StatusClassifierTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    // Normalization and fingerprints
    void testNormalizeStripsTrailingWhitespace();
    void testFingerprintIgnoresTrailingWhitespace();
    void testFingerprintDiffersOnContent();
    void testFingerprintOfEmptyPane();
    void testTrailingLinesSkipsBlankLines();

    // Prompt detection
    void testDetectInputPrompt_data();
    void testDetectInputPrompt();
    void testPromptOutsideTrailingRegionIgnored();
    void testCustomPatterns();
    void testInvalidPatternSkipped();

    // Classification rules
    void testPromptWinsOverEverything();
    void testEmptyPaneIsWorking();
    void testChangedOutputIsWorking();
    void testQuiescentWithinDebounceStaysWorking();
    void testDebounceBoundaryIsStrict();
    void testQuiescentPastDebounceIsReady();
    void testNeedsInputResolvedAndQuiet();
    void testReadyAndSeenAreSticky();
    void testSeenRevertsToWorkingOnChange();
};

}

#endif // STATUSCLASSIFIERTEST_H
