// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "interfaces.h"

namespace TabNest {

// Key functions for interface classes to anchor vtables to this translation unit
// This prevents ODR violations when interfaces are used across shared library boundaries

IWindowSystem::~IWindowSystem() = default;

IProcessController::~IProcessController() = default;

IHostSurfaceProvider::~IHostSurfaceProvider() = default;

ISettings::~ISettings() = default;

} // namespace TabNest
