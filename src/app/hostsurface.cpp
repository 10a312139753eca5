// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hostsurface.h"
#include <KLocalizedString>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>

namespace TabNest {

HostSurface::HostSurface(WindowId embedded, QWidget* parent)
    : QWidget(parent)
    , m_embedded(embedded)
{
    setAttribute(Qt::WA_NativeWindow);
    setAttribute(Qt::WA_DontCreateNativeAncestors);
    setFocusPolicy(Qt::StrongFocus);
}

void HostSurface::setAttachState(AttachState state)
{
    if (m_state != state) {
        m_state = state;
        update();
    }
}

QSize HostSurface::nativeSize() const
{
    const qreal ratio = devicePixelRatioF();
    return QSize(qRound(width() * ratio), qRound(height() * ratio));
}

void HostSurface::paintEvent(QPaintEvent* event)
{
    Q_UNUSED(event)

    if (m_state == AttachState::Attached) {
        return;
    }

    QPainter painter(this);
    painter.fillRect(rect(), palette().window());
    painter.setPen(palette().color(QPalette::PlaceholderText));

    const QString text = m_state == AttachState::ManuallyDetached
        ? i18n("This window was detached.\nDouble-click to attach it again.")
        : i18n("This window is not attached.\nDouble-click to attach it.");
    painter.drawText(rect(), Qt::AlignCenter, text);
}

void HostSurface::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    Q_EMIT resized(m_embedded, nativeSize());
}

void HostSurface::mouseDoubleClickEvent(QMouseEvent* event)
{
    if (event->button() == Qt::LeftButton && m_state != AttachState::Attached) {
        Q_EMIT attachRequested(m_embedded);
        return;
    }
    QWidget::mouseDoubleClickEvent(event);
}

} // namespace TabNest
