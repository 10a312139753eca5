// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging.h"

namespace TabNest {

// Core module categories
Q_LOGGING_CATEGORY(lcCore, "tabnest.core", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDirectory, "tabnest.core.directory", QtInfoMsg)
Q_LOGGING_CATEGORY(lcNative, "tabnest.core.native", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRegistry, "tabnest.core.registry", QtInfoMsg)
Q_LOGGING_CATEGORY(lcProcess, "tabnest.core.process", QtInfoMsg)

// Platform categories
Q_LOGGING_CATEGORY(lcX11, "tabnest.platform.x11", QtInfoMsg)

// Configuration module categories
Q_LOGGING_CATEGORY(lcConfig, "tabnest.config", QtInfoMsg)

// Application categories
Q_LOGGING_CATEGORY(lcApp, "tabnest.app", QtInfoMsg)
Q_LOGGING_CATEGORY(lcDbus, "tabnest.dbus", QtInfoMsg)

} // namespace TabNest
