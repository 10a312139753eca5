// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include <QString>

namespace TabNest {

/**
 * @brief Session and Qt platform plugin detection
 *
 * Foreign windows can only be reparented through X11. On a Wayland session
 * the application runs under XWayland and embeds X11 clients only.
 */
namespace Platform {

/**
 * @brief Check if the login session is a Wayland session
 * @return true if WAYLAND_DISPLAY or XDG_SESSION_TYPE say so
 */
TABNEST_EXPORT bool isWaylandSession();

/**
 * @brief Select the xcb platform plugin before QApplication is created
 *
 * Leaves an explicit QT_QPA_PLATFORM untouched.
 * @return true if the plugin was switched to xcb
 */
TABNEST_EXPORT bool preferXcbPlatform();

/**
 * @brief Check if the application runs on the xcb platform plugin
 *
 * True on X11 and under XWayland. Only then can foreign top-level windows
 * be enumerated and reparented.
 */
TABNEST_EXPORT bool supportsEmbedding();

/// "x11 session, xcb platform" style summary for log output
TABNEST_EXPORT QString describe();

} // namespace Platform

} // namespace TabNest
