// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "types.h"
#include <QString>
#include <optional>

namespace TabNest {
namespace Utils {

/**
 * @brief Format a window identity for logs and D-Bus ("0x3a00007")
 */
inline QString windowIdToString(WindowId window)
{
    return QStringLiteral("0x") + QString::number(static_cast<qulonglong>(window), 16);
}

/**
 * @brief Parse a window identity in decimal or 0x-prefixed hex form
 * @return Identity, or std::nullopt for empty/malformed input or NoWindow
 */
inline std::optional<WindowId> parseWindowId(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    bool ok = false;
    const qulonglong value = trimmed.startsWith(QLatin1String("0x"), Qt::CaseInsensitive)
        ? trimmed.mid(2).toULongLong(&ok, 16)
        : trimmed.toULongLong(&ok, 10);
    if (!ok || value == 0) {
        return std::nullopt;
    }
    return static_cast<WindowId>(value);
}

} // namespace Utils
} // namespace TabNest
