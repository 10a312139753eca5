// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nativewindowcontroller.h"
#include "interfaces.h"
#include "logging.h"
#include "utils.h"

namespace TabNest {

namespace {
constexpr WindowStyles RestorableStyles = FrameStyles | WindowStyle::Child;
}

NativeWindowController::NativeWindowController(IWindowSystem* windowSystem)
    : m_windowSystem(windowSystem)
{
    Q_ASSERT(windowSystem);
}

WindowStyles NativeWindowController::embeddedStyle(WindowStyles current)
{
    return (current & ~FrameStyles) | WindowStyle::Child;
}

WindowStyles NativeWindowController::restoredStyle(WindowStyles current, WindowStyles saved)
{
    return (current & ~RestorableStyles) | (saved & RestorableStyles);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Attach / Detach
// ═══════════════════════════════════════════════════════════════════════════════

AttachResult NativeWindowController::attach(WindowId window, WindowId hostSurface)
{
    if (window == NoWindow || !m_windowSystem->isWindow(window)) {
        qCWarning(lcNative) << "Cannot attach stale window" << Utils::windowIdToString(window);
        return AttachResult::failure(EmbedError::StaleWindow);
    }
    if (hostSurface == NoWindow) {
        qCWarning(lcNative) << "Cannot attach" << Utils::windowIdToString(window) << "- no host surface";
        return AttachResult::failure(EmbedError::AttachFailed);
    }

    // Snapshot before touching anything
    const std::optional<WindowStyles> style = m_windowSystem->styleBits(window);
    const std::optional<WindowId> parent = m_windowSystem->parentWindow(window);
    if (!style || !parent) {
        qCWarning(lcNative) << "Window" << Utils::windowIdToString(window) << "vanished while saving its style";
        return AttachResult::failure(EmbedError::StaleWindow);
    }
    const SavedStyle saved{*style, *parent};

    if (!m_windowSystem->setStyleBits(window, embeddedStyle(*style))) {
        if (!m_windowSystem->isWindow(window)) {
            return AttachResult::failure(EmbedError::StaleWindow);
        }
        qCWarning(lcNative) << "Style change rejected for" << Utils::windowIdToString(window);
        return AttachResult::failure(EmbedError::AttachFailed);
    }

    if (!m_windowSystem->setParentWindow(window, hostSurface)) {
        if (!m_windowSystem->isWindow(window)) {
            return AttachResult::failure(EmbedError::StaleWindow);
        }
        qCWarning(lcNative) << "Reparent rejected for" << Utils::windowIdToString(window)
                            << "- rolling back style";
        m_windowSystem->setStyleBits(window, *style);
        m_windowSystem->refreshFrame(window);
        return AttachResult::failure(EmbedError::AttachFailed);
    }

    // Failure here only means the window died after reparenting; the caller
    // finds out on its next liveness check.
    if (!m_windowSystem->refreshFrame(window)) {
        qCDebug(lcNative) << "Frame refresh failed for" << Utils::windowIdToString(window);
    }

    qCInfo(lcNative) << "Attached" << Utils::windowIdToString(window) << "to host"
                     << Utils::windowIdToString(hostSurface);
    return AttachResult::success(saved);
}

bool NativeWindowController::detach(WindowId window, const SavedStyle& saved)
{
    if (window == NoWindow || !m_windowSystem->isWindow(window)) {
        qCDebug(lcNative) << "Detach skipped, window already gone:" << Utils::windowIdToString(window);
        return false;
    }

    const std::optional<WindowStyles> current = m_windowSystem->styleBits(window);
    if (!current) {
        return false;
    }

    // The original parent may have been a window-manager frame that was
    // destroyed when the window was reparented away from it.
    WindowId parent = saved.originalParent;
    if (parent != NoWindow && !m_windowSystem->isWindow(parent)) {
        parent = NoWindow;
    }

    bool ok = m_windowSystem->setStyleBits(window, restoredStyle(*current, saved.originalStyleBits));
    ok = m_windowSystem->setParentWindow(window, parent) && ok;
    m_windowSystem->refreshFrame(window);
    ok = m_windowSystem->showWindow(window) && ok;

    if (!ok) {
        if (!m_windowSystem->isWindow(window)) {
            return false;
        }
        qCWarning(lcNative) << "Detach of" << Utils::windowIdToString(window) << "was only partially applied";
    } else {
        qCInfo(lcNative) << "Detached" << Utils::windowIdToString(window);
    }
    return true;
}

bool NativeWindowController::resize(WindowId window, const QSize& size)
{
    if (!size.isValid() || size.isEmpty()) {
        return false;
    }
    if (!m_windowSystem->isWindow(window)) {
        return false;
    }
    return m_windowSystem->moveResize(window, QRect(QPoint(0, 0), size));
}

bool NativeWindowController::show(WindowId window)
{
    if (!m_windowSystem->isWindow(window)) {
        return false;
    }
    return m_windowSystem->showWindow(window);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Probes
// ═══════════════════════════════════════════════════════════════════════════════

bool NativeWindowController::isAlive(WindowId window) const
{
    return window != NoWindow && m_windowSystem->isWindow(window);
}

std::optional<QString> NativeWindowController::titleOf(WindowId window) const
{
    if (!isAlive(window)) {
        return std::nullopt;
    }
    return m_windowSystem->windowTitle(window);
}

std::optional<qint64> NativeWindowController::ownerProcessOf(WindowId window) const
{
    if (!isAlive(window)) {
        return std::nullopt;
    }
    const qint64 pid = m_windowSystem->windowProcessId(window);
    if (pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

WindowId NativeWindowController::windowUnderPoint(const QPoint& point) const
{
    return m_windowSystem->windowAt(point);
}

WindowId NativeWindowController::topLevelAncestorOf(WindowId window) const
{
    if (!isAlive(window)) {
        return NoWindow;
    }
    return m_windowSystem->topLevelAncestor(window);
}

} // namespace TabNest
