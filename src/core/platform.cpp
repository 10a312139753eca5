// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "platform.h"
#include <QGuiApplication>
#include <QString>

namespace TabNest {

namespace Platform {

bool isWaylandSession()
{
    if (!qEnvironmentVariableIsEmpty("WAYLAND_DISPLAY")) {
        return true;
    }

    // Check XDG_SESSION_TYPE (set by the login manager)
    const QString sessionType = qEnvironmentVariable("XDG_SESSION_TYPE");
    return sessionType.compare(QLatin1String("wayland"), Qt::CaseInsensitive) == 0;
}

bool preferXcbPlatform()
{
    if (!isWaylandSession() || !qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM")) {
        return false;
    }
    // Without an X server there is nothing to embed; let Qt pick its default
    if (qEnvironmentVariableIsEmpty("DISPLAY")) {
        return false;
    }
    return qputenv("QT_QPA_PLATFORM", "xcb");
}

bool supportsEmbedding()
{
    if (const auto* app = qGuiApp) {
        return app->platformName() == QLatin1String("xcb");
    }
    return false;
}

QString describe()
{
    const QString session = isWaylandSession() ? QStringLiteral("wayland") : QStringLiteral("x11");
    const QString plugin = qGuiApp ? qGuiApp->platformName() : QStringLiteral("none");
    return QStringLiteral("%1 session, %2 platform").arg(session, plugin);
}

} // namespace Platform

} // namespace TabNest
