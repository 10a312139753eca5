// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowpicker.h"
#include "constants.h"
#include "interfaces.h"
#include "logging.h"

namespace TabNest {

WindowPicker::WindowPicker(IWindowSystem* windowSystem, QObject* parent)
    : QObject(parent)
    , m_windowSystem(windowSystem)
{
    Q_ASSERT(windowSystem);

    m_timer.setInterval(Defaults::PickPollIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &WindowPicker::poll);
}

void WindowPicker::start(int timeoutSeconds)
{
    if (isActive()) {
        qCDebug(lcCore) << "Pick already in progress";
        return;
    }

    const std::optional<PointerState> pointer = m_windowSystem->pointerState();
    m_waitingForRelease = pointer && pointer->buttonPressed;
    m_timeoutMs = qint64(timeoutSeconds) * 1000;
    m_elapsed.start();
    m_timer.start();
    qCInfo(lcCore) << "Waiting for a click on the window to pick, timeout" << timeoutSeconds << "s";
}

void WindowPicker::cancel()
{
    if (!isActive()) {
        return;
    }
    finish();
    qCInfo(lcCore) << "Pick cancelled";
    Q_EMIT cancelled();
}

void WindowPicker::poll()
{
    if (m_elapsed.hasExpired(m_timeoutMs)) {
        finish();
        qCInfo(lcCore) << "Pick timed out";
        Q_EMIT timedOut();
        return;
    }

    const std::optional<PointerState> pointer = m_windowSystem->pointerState();
    if (!pointer) {
        qCDebug(lcCore) << "Pointer query failed, retrying";
        return;
    }

    if (m_waitingForRelease) {
        m_waitingForRelease = pointer->buttonPressed;
        return;
    }
    if (!pointer->buttonPressed) {
        return;
    }

    finish();
    Q_EMIT clicked(QPoint(pointer->x, pointer->y));
}

void WindowPicker::finish()
{
    m_timer.stop();
    m_waitingForRelease = false;
}

} // namespace TabNest
