/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef CACTUSSETTINGSTEST_H
#define CACTUSSETTINGSTEST_H

#include <QObject>

namespace Cactus
{

class CactusSettingsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();
    void cleanup();

    void testDefaults();
    void testPollingValues();
    void testCommandTimeoutStaysBelowInterval();
    void testPromptPatterns();
    void testRecentPaths();
    void testAssembledConfigs();
    void testPersistsAcrossInstances();
    void testControllerRecordsRecentPath();
};

}

#endif // CACTUSSETTINGSTEST_H
