/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TerminationWatcher.h"

#include <QDebug>

#include <csignal>

namespace Cactus
{

namespace
{

volatile std::sig_atomic_t s_pendingSignal = 0;
bool s_installed = false;

void onTerminate(int signalNumber)
{
    s_pendingSignal = signalNumber;
}

}

TerminationWatcher::TerminationWatcher(int checkIntervalMs, QObject *parent)
    : QObject(parent)
{
    m_timer.setInterval(checkIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &TerminationWatcher::check);
}

TerminationWatcher::~TerminationWatcher()
{
    uninstall();
}

bool TerminationWatcher::install()
{
    if (s_installed) {
        qWarning() << "TerminationWatcher: handlers already installed";
        return false;
    }

    s_pendingSignal = 0;
    std::signal(SIGINT, onTerminate);
    std::signal(SIGTERM, onTerminate);
    s_installed = true;
    m_installed = true;
    m_timer.start();
    return true;
}

void TerminationWatcher::uninstall()
{
    if (!m_installed) {
        return;
    }

    m_timer.stop();
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    s_installed = false;
    m_installed = false;
}

void TerminationWatcher::check()
{
    const int signalNumber = s_pendingSignal;
    if (signalNumber == 0) {
        return;
    }

    s_pendingSignal = 0;
    qDebug() << "TerminationWatcher: received signal" << signalNumber;
    Q_EMIT terminationRequested(signalNumber);
}

} // namespace Cactus

#include "moc_TerminationWatcher.cpp"
