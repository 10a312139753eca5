// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QPoint>
#include <QSize>
#include <QString>
#include <optional>

namespace TabNest {

class IWindowSystem;

/**
 * @brief The only component allowed to mutate a foreign window
 *
 * Turns a foreign top-level window into a frameless child of a host surface
 * and back. The window system calls involved (style change, reparent,
 * refresh) are separate and not atomic; the owning process may destroy the
 * window between any two of them, so liveness is re-validated before and
 * failures are tolerated after every mutation.
 *
 * Attach does not move or resize the window. The caller sizes it to the
 * host client area right after attaching (see TabRegistry).
 */
class TABNEST_EXPORT NativeWindowController
{
public:
    explicit NativeWindowController(IWindowSystem* windowSystem);

    /**
     * @brief Embed @p window into @p hostSurface
     * @return SavedStyle on success; StaleWindow if the window is (or went)
     *         away, AttachFailed if the window system rejected a call while
     *         the window was still alive (style change rolled back)
     */
    AttachResult attach(WindowId window, WindowId hostSurface);

    /**
     * @brief Restore @p window to its pre-embedding state
     * @return true if the window was restored, false if it no longer exists
     *
     * Restores the frame and child bits recorded in @p saved verbatim and
     * leaves all other bits as currently set. Idempotent.
     */
    bool detach(WindowId window, const SavedStyle& saved);

    /**
     * @brief Resize an embedded window to fill its host (origin 0,0)
     */
    bool resize(WindowId window, const QSize& size);

    bool show(WindowId window);

    // ═══════════════════════════════════════════════════════════════════════════
    // Probes (each re-validates liveness)
    // ═══════════════════════════════════════════════════════════════════════════

    bool isAlive(WindowId window) const;
    std::optional<QString> titleOf(WindowId window) const;
    std::optional<qint64> ownerProcessOf(WindowId window) const;
    WindowId windowUnderPoint(const QPoint& point) const;
    WindowId topLevelAncestorOf(WindowId window) const;

    // ═══════════════════════════════════════════════════════════════════════════
    // Style arithmetic
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Styles applied while embedded: frame stripped, child set
     */
    static WindowStyles embeddedStyle(WindowStyles current);

    /**
     * @brief Styles applied on detach: frame and child bits from @p saved,
     *        everything else from @p current
     */
    static WindowStyles restoredStyle(WindowStyles current, WindowStyles saved);

private:
    IWindowSystem* m_windowSystem = nullptr;
};

} // namespace TabNest
