// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QLatin1String>

namespace TabNest {

/**
 * @brief Core module constants
 *
 * Structural constants that are not user-configurable. For user-configurable
 * settings, see ConfigDefaults and tabnest.kcfg.
 */
namespace Defaults {
// Window picker pointer polling interval
constexpr int PickPollIntervalMs = 50;

// Bounds for configurable values (validated in Settings::load)
constexpr int MinRefreshIntervalSeconds = 1;
constexpr int MaxRefreshIntervalSeconds = 60;
constexpr int MinPickTimeoutSeconds = 5;
constexpr int MaxPickTimeoutSeconds = 120;
}

/**
 * @brief JSON keys for the D-Bus tab listing
 */
namespace JsonKeys {
inline constexpr QLatin1String Id{"id"};
inline constexpr QLatin1String Title{"title"};
inline constexpr QLatin1String RawTitle{"rawTitle"};
inline constexpr QLatin1String Category{"category"};
inline constexpr QLatin1String State{"state"};
inline constexpr QLatin1String ProcessId{"pid"};
}

/**
 * @brief D-Bus service, object and interface names
 */
namespace DBus {
// Owned by KDBusService: reversed organization domain + component name
inline constexpr QLatin1String ServiceName{"org.tabnest.tabnest"};
inline constexpr QLatin1String ObjectPath{"/Tabs"};
inline constexpr QLatin1String Interface{"org.tabnest.Tabs"};
}

} // namespace TabNest
