/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINATIONWATCHER_H
#define TERMINATIONWATCHER_H

#include "cactuscore_export.h"

#include <QObject>
#include <QTimer>

namespace Cactus
{

/**
 * Turns SIGINT/SIGTERM into a Qt signal on the owning thread.
 *
 * The handler only sets a sig_atomic_t flag; a timer on this object's
 * thread notices it and emits terminationRequested(). Only one watcher
 * may be installed at a time.
 */
class CACTUSCORE_EXPORT TerminationWatcher : public QObject
{
    Q_OBJECT

public:
    explicit TerminationWatcher(int checkIntervalMs = 100, QObject *parent = nullptr);
    ~TerminationWatcher() override;

    /**
     * Installs the handlers for SIGINT and SIGTERM. Returns false if
     * another watcher is already installed.
     */
    bool install();
    void uninstall();

    bool isInstalled() const
    {
        return m_installed;
    }

Q_SIGNALS:
    void terminationRequested(int signalNumber);

private:
    void check();

    QTimer m_timer;
    bool m_installed = false;
};

} // namespace Cactus

#endif // TERMINATIONWATCHER_H
