// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "../core/interfaces.h"
#include "motifhints.h"
#include <QByteArray>
#include <QHash>
#include <cstdlib>
#include <memory>
#include <xcb/xcb.h>

namespace TabNest {

/**
 * @brief IWindowSystem over an X11 connection (libxcb)
 *
 * Style bits live in two properties:
 * - _MOTIF_WM_HINTS decorations carry the frame bits (see MotifHints)
 * - _TABNEST_EMBEDDED marks a window we turned into a child surface
 *
 * Enumeration reads the window manager's _NET_CLIENT_LIST and falls back to
 * walking the root window's children when no EWMH manager is running.
 * All requests are synchronous; a missing reply means the window is gone.
 */
class TABNEST_EXPORT XcbWindowSystem : public IWindowSystem
{
public:
    XcbWindowSystem(xcb_connection_t* connection, xcb_window_t root);

    /**
     * @brief Backend bound to the running QGuiApplication's X11 connection
     * @return nullptr when the application is not on the xcb platform
     */
    static std::unique_ptr<XcbWindowSystem> fromApplication();

    std::optional<QList<WindowId>> topLevelWindows() const override;
    bool isWindow(WindowId window) const override;
    std::optional<bool> isVisible(WindowId window) const override;
    std::optional<QString> windowTitle(WindowId window) const override;
    qint64 windowProcessId(WindowId window) const override;
    std::optional<bool> hasOwner(WindowId window) const override;

    std::optional<WindowStyles> styleBits(WindowId window) const override;
    bool setStyleBits(WindowId window, WindowStyles styles) override;
    std::optional<WindowId> parentWindow(WindowId window) const override;
    bool setParentWindow(WindowId window, WindowId parent) override;
    bool refreshFrame(WindowId window) override;
    bool moveResize(WindowId window, const QRect& geometry) override;
    bool showWindow(WindowId window) override;

    WindowId windowAt(const QPoint& point) const override;
    WindowId topLevelAncestor(WindowId window) const override;
    std::optional<PointerState> pointerState() const override;

private:
    struct FreeDeleter
    {
        void operator()(void* reply) const
        {
            std::free(reply);
        }
    };
    template<typename T>
    using Reply = std::unique_ptr<T, FreeDeleter>;

    xcb_atom_t atom(const QByteArray& name) const;
    Reply<xcb_get_property_reply_t> property(xcb_window_t window, xcb_atom_t property, xcb_atom_t type,
                                             uint32_t length) const;
    std::optional<QList<xcb_window_t>> children(xcb_window_t window) const;
    xcb_window_t findClient(xcb_window_t frame) const;
    bool hasWmState(xcb_window_t window) const;
    bool checked(xcb_void_cookie_t cookie, const char* request, WindowId window) const;
    /// @return false when the window is gone; @p hints is nullopt when unset
    bool readMotifHints(xcb_window_t window, std::optional<MotifHints>& hints) const;

    xcb_connection_t* m_connection = nullptr;
    xcb_window_t m_root = XCB_WINDOW_NONE;
    QHash<QByteArray, xcb_atom_t> m_atoms;
    QHash<xcb_window_t, std::optional<MotifHints>> m_originalHints; ///< Hints before embedding
};

} // namespace TabNest
