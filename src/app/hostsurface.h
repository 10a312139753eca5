// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include <QWidget>

namespace TabNest {

/**
 * @brief Native tab page that a foreign window is reparented into
 *
 * Always backed by its own X11 window (WA_NativeWindow) so winId() is a real
 * parent for the embedded window. While nothing is attached it paints a
 * placeholder; an attached window covers the whole client area.
 */
class HostSurface : public QWidget
{
    Q_OBJECT

public:
    HostSurface(WindowId embedded, QWidget* parent = nullptr);

    WindowId embeddedWindow() const
    {
        return m_embedded;
    }

    void setAttachState(AttachState state);

    /**
     * @brief Client area in device pixels
     */
    QSize nativeSize() const;

Q_SIGNALS:
    void resized(WindowId embedded, const QSize& size);
    void attachRequested(WindowId embedded);

protected:
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    WindowId m_embedded = NoWindow;
    AttachState m_state = AttachState::Detached;
};

} // namespace TabNest
