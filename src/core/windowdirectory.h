// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QPoint>
#include <QRegularExpression>
#include <optional>

namespace TabNest {

class IWindowSystem;
class IProcessController;

/**
 * @brief Enumerates and classifies candidate windows on the desktop
 *
 * Pure query: nothing here mutates a window. Every enumerate() call
 * re-queries the window system from scratch.
 *
 * Classification (first match wins):
 * 1. "<name> [<running marker>] - <application>" → PrimaryApp, tab title <name>
 * 2. Title contains the manager signature → CompanionManager, fixed label
 * 3. Executable is a companion runtime and the window has no owner → ExternalProcess
 * 4. Anything else is excluded (the pick flows synthesize Picked entries)
 *
 * Hidden windows and windows of our own process are always excluded.
 */
class TABNEST_EXPORT WindowDirectory
{
public:
    WindowDirectory(IWindowSystem* windowSystem, IProcessController* processes,
                    const ClassificationRules& rules = ClassificationRules());

    const ClassificationRules& rules() const
    {
        return m_rules;
    }
    void setRules(const ClassificationRules& rules);

    /**
     * @brief Enumerate and classify visible top-level windows
     *
     * A window whose probe fails mid-scan is skipped and counted; only a
     * failure of the enumeration primitive marks the result as failed.
     */
    EnumerationResult enumerate() const;

    /**
     * @brief Classify a single window from its probed attributes
     * @return Classified window, or std::nullopt if it matches no rule
     */
    std::optional<ClassifiedWindow> classify(WindowId window, const QString& title, qint64 pid,
                                             bool hasOwner) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Pick flows (bypass classification)
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Top-level window under a desktop point, as a Picked entry
     */
    std::optional<ClassifiedWindow> pickWindowAt(const QPoint& point) const;

    /**
     * @brief A specific top-level window as a Picked entry
     */
    std::optional<ClassifiedWindow> pickWindow(WindowId window) const;

    /**
     * @brief Every visible top-level window as Picked entries (process list)
     */
    QList<ClassifiedWindow> pickableWindows() const;

private:
    void rebuildPatterns();
    bool isOwnProcess(qint64 pid) const;

    IWindowSystem* m_windowSystem = nullptr;
    IProcessController* m_processes = nullptr;
    ClassificationRules m_rules;
    QRegularExpression m_runningPattern;
};

} // namespace TabNest
