// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include <QElapsedTimer>
#include <QObject>
#include <QPoint>
#include <QTimer>

namespace TabNest {

class IWindowSystem;

/**
 * @brief Waits for the user to click on a window anywhere on the desktop
 *
 * Polls the global pointer button state; grabbing the pointer would break
 * the click on the target window. A press that is already held when the
 * pick starts (the click on our own "pick" button) is ignored until it is
 * released. Emits exactly one of clicked(), cancelled() or timedOut() per
 * start(). Never touches the TabRegistry itself.
 */
class TABNEST_EXPORT WindowPicker : public QObject
{
    Q_OBJECT

public:
    explicit WindowPicker(IWindowSystem* windowSystem, QObject* parent = nullptr);

    /**
     * @brief Begin a pick
     * @param timeoutSeconds Give up after this many seconds
     */
    void start(int timeoutSeconds);

    bool isActive() const
    {
        return m_timer.isActive();
    }

public Q_SLOTS:
    void cancel();

Q_SIGNALS:
    void clicked(const QPoint& point);
    void cancelled();
    void timedOut();

private:
    void poll();
    void finish();

    IWindowSystem* m_windowSystem = nullptr;
    QTimer m_timer;
    QElapsedTimer m_elapsed;
    qint64 m_timeoutMs = 0;
    bool m_waitingForRelease = false;
};

} // namespace TabNest
