// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include <QLoggingCategory>

/**
 * @file logging.h
 * @brief Centralized logging categories for TabNest
 *
 * Use these categories instead of plain qDebug/qWarning.
 *
 * Usage:
 *   #include "logging.h"
 *   qCDebug(lcRegistry) << "Debug message";
 *   qCWarning(lcNative) << "Warning message";
 *
 * Runtime filtering via environment variable:
 *   QT_LOGGING_RULES="tabnest.*=true"                 # Enable all
 *   QT_LOGGING_RULES="tabnest.*.debug=false"          # Disable debug only
 *   QT_LOGGING_RULES="tabnest.core.registry=true"     # Reconciliation only
 *   QT_LOGGING_RULES="tabnest.platform.x11=true"      # X11 backend only
 *
 * Severity Guidelines:
 *   qCDebug    - Development tracing (per-window probes, poll passes)
 *   qCInfo     - Significant events (attach, detach, tab removed, startup)
 *   qCWarning  - Recoverable errors (stale window, rejected reparent, bad config)
 *   qCCritical - Failures preventing normal operation (no X11 connection)
 */

namespace TabNest {

// Core module - classification, native window mutation, reconciliation
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcCore)
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDirectory)
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcNative)
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcRegistry)
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcProcess)

// Platform backends
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcX11)

// Configuration module - settings loading/saving
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcConfig)

// Application shell and D-Bus control surface
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcApp)
TABNEST_EXPORT Q_DECLARE_LOGGING_CATEGORY(lcDbus)

} // namespace TabNest
