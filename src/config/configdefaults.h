// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnestconfig.h" // Generated from tabnest.kcfg via KConfigXT

#include <QString>
#include <QStringList>

namespace TabNest {

/**
 * @brief Provides static access to default configuration values
 *
 * Wraps the KConfigXT-generated TabNestConfig class. The .kcfg file is the
 * single source of truth for all defaults; this class only exposes them.
 *
 * Usage:
 *   int seconds = ConfigDefaults::refreshInterval(); // 5 (from .kcfg)
 */
class ConfigDefaults
{
public:
    // ═══════════════════════════════════════════════════════════════════════════
    // General
    // ═══════════════════════════════════════════════════════════════════════════

    static bool autoAttach() { return instance().defaultAutoAttachValue(); }
    static bool autoAttachManager() { return instance().defaultAutoAttachManagerValue(); }
    static bool autoAttachExternal() { return instance().defaultAutoAttachExternalValue(); }
    static int refreshInterval() { return instance().defaultRefreshIntervalValue(); }
    static QString applicationPath() { return instance().defaultApplicationPathValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Detection
    // ═══════════════════════════════════════════════════════════════════════════

    static QString applicationName() { return instance().defaultApplicationNameValue(); }
    static QStringList runningMarkers() { return instance().defaultRunningMarkersValue(); }
    static QString managerSignature() { return instance().defaultManagerSignatureValue(); }
    static QString managerLabel() { return instance().defaultManagerLabelValue(); }
    static QStringList companionExecutables() { return instance().defaultCompanionExecutablesValue(); }
    static QStringList serviceExecutables() { return instance().defaultServiceExecutablesValue(); }

    // ═══════════════════════════════════════════════════════════════════════════
    // Picker
    // ═══════════════════════════════════════════════════════════════════════════

    static int pickTimeout() { return instance().defaultPickTimeoutValue(); }

private:
    // Lazily-initialized singleton instance
    static TabNestConfig& instance()
    {
        static TabNestConfig config;
        return config;
    }

    // Non-instantiable
    ConfigDefaults() = delete;
};

} // namespace TabNest
