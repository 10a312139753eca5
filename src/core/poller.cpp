// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "poller.h"
#include "constants.h"
#include "logging.h"
#include "tabregistry.h"
#include <algorithm>

namespace TabNest {

Poller::Poller(TabRegistry* registry, QObject* parent)
    : QObject(parent)
    , m_registry(registry)
{
    Q_ASSERT(registry);

    m_timer.setTimerType(Qt::CoarseTimer);
    connect(&m_timer, &QTimer::timeout, this, [this]() {
        trigger(ReconcileTrigger::Automatic);
    });
}

void Poller::setIntervalSeconds(int seconds)
{
    seconds = std::clamp(seconds, Defaults::MinRefreshIntervalSeconds, Defaults::MaxRefreshIntervalSeconds);
    m_timer.setInterval(seconds * 1000);
    qCDebug(lcCore) << "Poll interval set to" << seconds << "s";
}

int Poller::intervalSeconds() const
{
    return m_timer.interval() / 1000;
}

void Poller::start()
{
    m_timer.start();
}

void Poller::stop()
{
    m_timer.stop();
}

void Poller::trigger(ReconcileTrigger trigger)
{
    if (m_registry->isReconciling()) {
        qCDebug(lcCore) << "Pass already running, dropping trigger" << static_cast<int>(trigger);
        return;
    }
    m_registry->reconcile(trigger);
    Q_EMIT passFinished(trigger);
}

} // namespace TabNest
