// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "xcbwindowsystem.h"
#include "../core/logging.h"
#include "../core/utils.h"
#include <QGuiApplication>
#include <QQueue>
#include <limits>

namespace TabNest {

namespace {

// Depth limit when searching a frame for its client window
constexpr int MaxClientSearchDepth = 4;

const QByteArray NetClientList = QByteArrayLiteral("_NET_CLIENT_LIST");
const QByteArray NetWmName = QByteArrayLiteral("_NET_WM_NAME");
const QByteArray NetWmPid = QByteArrayLiteral("_NET_WM_PID");
const QByteArray Utf8String = QByteArrayLiteral("UTF8_STRING");
const QByteArray MotifWmHints = QByteArrayLiteral("_MOTIF_WM_HINTS");
const QByteArray WmState = QByteArrayLiteral("WM_STATE");
const QByteArray EmbeddedMarker = QByteArrayLiteral("_TABNEST_EMBEDDED");

} // namespace

XcbWindowSystem::XcbWindowSystem(xcb_connection_t* connection, xcb_window_t root)
    : m_connection(connection)
    , m_root(root)
{
    Q_ASSERT(connection);

    const QByteArray names[] = {NetClientList, NetWmName, NetWmPid, Utf8String, MotifWmHints, WmState, EmbeddedMarker};

    // Send every request before waiting for the first reply
    QList<xcb_intern_atom_cookie_t> cookies;
    for (const QByteArray& name : names) {
        cookies.append(xcb_intern_atom(m_connection, 0, static_cast<uint16_t>(name.size()), name.constData()));
    }
    for (int i = 0; i < cookies.size(); ++i) {
        Reply<xcb_intern_atom_reply_t> reply(xcb_intern_atom_reply(m_connection, cookies.at(i), nullptr));
        if (!reply) {
            qCWarning(lcX11) << "Failed to intern atom" << names[i];
            continue;
        }
        m_atoms.insert(names[i], reply->atom);
    }
}

std::unique_ptr<XcbWindowSystem> XcbWindowSystem::fromApplication()
{
    auto* x11 = qGuiApp ? qGuiApp->nativeInterface<QNativeInterface::QX11Application>() : nullptr;
    if (!x11 || !x11->connection()) {
        qCCritical(lcX11) << "No X11 connection available";
        return nullptr;
    }

    xcb_connection_t* connection = x11->connection();
    const xcb_screen_iterator_t screens = xcb_setup_roots_iterator(xcb_get_setup(connection));
    if (!screens.rem) {
        qCCritical(lcX11) << "X11 connection reports no screens";
        return nullptr;
    }
    return std::make_unique<XcbWindowSystem>(connection, screens.data->root);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

xcb_atom_t XcbWindowSystem::atom(const QByteArray& name) const
{
    return m_atoms.value(name, XCB_ATOM_NONE);
}

XcbWindowSystem::Reply<xcb_get_property_reply_t> XcbWindowSystem::property(xcb_window_t window, xcb_atom_t property,
                                                                            xcb_atom_t type, uint32_t length) const
{
    if (property == XCB_ATOM_NONE) {
        return nullptr;
    }
    const xcb_get_property_cookie_t cookie = xcb_get_property(m_connection, 0, window, property, type, 0, length);
    return Reply<xcb_get_property_reply_t>(xcb_get_property_reply(m_connection, cookie, nullptr));
}

std::optional<QList<xcb_window_t>> XcbWindowSystem::children(xcb_window_t window) const
{
    Reply<xcb_query_tree_reply_t> tree(xcb_query_tree_reply(m_connection, xcb_query_tree(m_connection, window), nullptr));
    if (!tree) {
        return std::nullopt;
    }
    const xcb_window_t* first = xcb_query_tree_children(tree.get());
    const int count = xcb_query_tree_children_length(tree.get());
    return QList<xcb_window_t>(first, first + count);
}

bool XcbWindowSystem::hasWmState(xcb_window_t window) const
{
    const auto reply = property(window, atom(WmState), XCB_GET_PROPERTY_TYPE_ANY, 0);
    return reply && reply->type != XCB_ATOM_NONE;
}

xcb_window_t XcbWindowSystem::findClient(xcb_window_t frame) const
{
    // Breadth-first: reparenting managers nest the client one or two levels down
    QQueue<QPair<xcb_window_t, int>> pending;
    pending.enqueue({frame, 0});
    while (!pending.isEmpty()) {
        const auto [window, depth] = pending.dequeue();
        if (hasWmState(window)) {
            return window;
        }
        if (depth >= MaxClientSearchDepth) {
            continue;
        }
        if (const auto kids = children(window)) {
            for (const xcb_window_t child : *kids) {
                pending.enqueue({child, depth + 1});
            }
        }
    }
    return XCB_WINDOW_NONE;
}

bool XcbWindowSystem::checked(xcb_void_cookie_t cookie, const char* request, WindowId window) const
{
    Reply<xcb_generic_error_t> error(xcb_request_check(m_connection, cookie));
    if (error) {
        qCDebug(lcX11) << request << "failed for" << Utils::windowIdToString(window) << "error code"
                       << error->error_code;
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Enumeration and probes
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<QList<WindowId>> XcbWindowSystem::topLevelWindows() const
{
    const auto clients =
        property(m_root, atom(NetClientList), XCB_ATOM_WINDOW, std::numeric_limits<uint32_t>::max() / 4);
    if (clients && clients->type == XCB_ATOM_WINDOW) {
        const auto* first = static_cast<const xcb_window_t*>(xcb_get_property_value(clients.get()));
        const int count = xcb_get_property_value_length(clients.get()) / static_cast<int>(sizeof(xcb_window_t));
        QList<WindowId> windows;
        windows.reserve(count);
        for (int i = 0; i < count; ++i) {
            windows.append(first[i]);
        }
        return windows;
    }

    qCDebug(lcX11) << "_NET_CLIENT_LIST unavailable, walking the window tree";
    const auto frames = children(m_root);
    if (!frames) {
        qCWarning(lcX11) << "Failed to query the root window tree";
        return std::nullopt;
    }

    QList<WindowId> windows;
    for (const xcb_window_t frame : *frames) {
        const xcb_window_t client = findClient(frame);
        if (client != XCB_WINDOW_NONE) {
            windows.append(client);
        }
    }
    return windows;
}

bool XcbWindowSystem::isWindow(WindowId window) const
{
    if (window == NoWindow) {
        return false;
    }
    const auto cookie = xcb_get_window_attributes(m_connection, static_cast<xcb_window_t>(window));
    Reply<xcb_get_window_attributes_reply_t> attributes(xcb_get_window_attributes_reply(m_connection, cookie, nullptr));
    return attributes != nullptr;
}

std::optional<bool> XcbWindowSystem::isVisible(WindowId window) const
{
    const auto cookie = xcb_get_window_attributes(m_connection, static_cast<xcb_window_t>(window));
    Reply<xcb_get_window_attributes_reply_t> attributes(xcb_get_window_attributes_reply(m_connection, cookie, nullptr));
    if (!attributes) {
        return std::nullopt;
    }
    return attributes->map_state == XCB_MAP_STATE_VIEWABLE;
}

std::optional<QString> XcbWindowSystem::windowTitle(WindowId window) const
{
    const auto xid = static_cast<xcb_window_t>(window);
    constexpr uint32_t maxLength = 1024;

    const auto netName = property(xid, atom(NetWmName), atom(Utf8String), maxLength);
    if (!netName) {
        return std::nullopt;
    }
    if (netName->type != XCB_ATOM_NONE && xcb_get_property_value_length(netName.get()) > 0) {
        return QString::fromUtf8(static_cast<const char*>(xcb_get_property_value(netName.get())),
                                 xcb_get_property_value_length(netName.get()));
    }

    const auto wmName = property(xid, XCB_ATOM_WM_NAME, XCB_GET_PROPERTY_TYPE_ANY, maxLength);
    if (!wmName) {
        return std::nullopt;
    }
    if (wmName->type == XCB_ATOM_NONE) {
        return QString();
    }
    const auto* data = static_cast<const char*>(xcb_get_property_value(wmName.get()));
    const int length = xcb_get_property_value_length(wmName.get());
    return wmName->type == XCB_ATOM_STRING ? QString::fromLatin1(data, length) : QString::fromLocal8Bit(data, length);
}

qint64 XcbWindowSystem::windowProcessId(WindowId window) const
{
    const auto reply = property(static_cast<xcb_window_t>(window), atom(NetWmPid), XCB_ATOM_CARDINAL, 1);
    if (!reply || reply->type != XCB_ATOM_CARDINAL || xcb_get_property_value_length(reply.get()) < 4) {
        return 0;
    }
    return *static_cast<const uint32_t*>(xcb_get_property_value(reply.get()));
}

std::optional<bool> XcbWindowSystem::hasOwner(WindowId window) const
{
    const auto reply = property(static_cast<xcb_window_t>(window), XCB_ATOM_WM_TRANSIENT_FOR, XCB_ATOM_WINDOW, 1);
    if (!reply) {
        return std::nullopt;
    }
    if (reply->type != XCB_ATOM_WINDOW || xcb_get_property_value_length(reply.get()) < 4) {
        return false;
    }
    return *static_cast<const xcb_window_t*>(xcb_get_property_value(reply.get())) != XCB_WINDOW_NONE;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Style and parent mutation
// ═══════════════════════════════════════════════════════════════════════════════

bool XcbWindowSystem::readMotifHints(xcb_window_t window, std::optional<MotifHints>& hints) const
{
    const auto reply = property(window, atom(MotifWmHints), XCB_GET_PROPERTY_TYPE_ANY, MotifHints::Length);
    if (!reply) {
        return false;
    }
    hints.reset();
    if (reply->type != XCB_ATOM_NONE && reply->format == 32) {
        hints = MotifHints::fromData(static_cast<const uint32_t*>(xcb_get_property_value(reply.get())),
                                     xcb_get_property_value_length(reply.get()) / int(sizeof(uint32_t)));
    }
    return true;
}

std::optional<WindowStyles> XcbWindowSystem::styleBits(WindowId window) const
{
    const auto xid = static_cast<xcb_window_t>(window);
    std::optional<MotifHints> hints;
    if (!readMotifHints(xid, hints)) {
        return std::nullopt;
    }
    WindowStyles styles = MotifHints::frameStyles(hints);

    const auto marker = property(xid, atom(EmbeddedMarker), XCB_GET_PROPERTY_TYPE_ANY, 0);
    if (!marker) {
        return std::nullopt;
    }
    if (marker->type != XCB_ATOM_NONE) {
        styles |= WindowStyle::Child;
    }
    return styles;
}

bool XcbWindowSystem::setStyleBits(WindowId window, WindowStyles styles)
{
    const auto xid = static_cast<xcb_window_t>(window);
    const xcb_atom_t hintsAtom = atom(MotifWmHints);
    const xcb_atom_t markerAtom = atom(EmbeddedMarker);
    if (hintsAtom == XCB_ATOM_NONE || markerAtom == XCB_ATOM_NONE) {
        return false;
    }

    std::optional<MotifHints> current;
    if (!readMotifHints(xid, current)) {
        return false;
    }

    // The property as the client left it is written back verbatim (or
    // deleted again) once the window gets its original frame back
    std::optional<MotifHints> target;
    const auto original = m_originalHints.constFind(xid);
    if (styles.testFlag(WindowStyle::Child)) {
        if (original == m_originalHints.cend()) {
            m_originalHints.insert(xid, current);
        }
        target = MotifHints::withFrameStyles(current, styles);
    } else if (original != m_originalHints.cend()) {
        target = MotifHints::restored(*original, current, styles);
        m_originalHints.remove(xid);
    } else {
        target = MotifHints::withFrameStyles(current, styles);
    }

    xcb_void_cookie_t hintsCookie;
    if (target) {
        hintsCookie = xcb_change_property_checked(m_connection, XCB_PROP_MODE_REPLACE, xid, hintsAtom, hintsAtom, 32,
                                                  MotifHints::Length, target->fields.data());
    } else {
        hintsCookie = xcb_delete_property_checked(m_connection, xid, hintsAtom);
    }
    if (!checked(hintsCookie, "Updating _MOTIF_WM_HINTS", window)) {
        return false;
    }

    xcb_void_cookie_t markerCookie;
    if (styles.testFlag(WindowStyle::Child)) {
        const uint32_t value = 1;
        markerCookie =
            xcb_change_property_checked(m_connection, XCB_PROP_MODE_REPLACE, xid, markerAtom, XCB_ATOM_CARDINAL, 32, 1,
                                        &value);
    } else {
        markerCookie = xcb_delete_property_checked(m_connection, xid, markerAtom);
    }
    return checked(markerCookie, "Updating _TABNEST_EMBEDDED", window);
}

std::optional<WindowId> XcbWindowSystem::parentWindow(WindowId window) const
{
    const auto cookie = xcb_query_tree(m_connection, static_cast<xcb_window_t>(window));
    Reply<xcb_query_tree_reply_t> tree(xcb_query_tree_reply(m_connection, cookie, nullptr));
    if (!tree) {
        return std::nullopt;
    }
    return tree->parent == m_root ? NoWindow : WindowId(tree->parent);
}

bool XcbWindowSystem::setParentWindow(WindowId window, WindowId parent)
{
    const auto xid = static_cast<xcb_window_t>(window);
    const xcb_window_t target = parent == NoWindow ? m_root : static_cast<xcb_window_t>(parent);

    // Reparenting a mapped window maps it again at once, at its old size
    const bool embedding = target != m_root;
    if (embedding && !checked(xcb_unmap_window_checked(m_connection, xid), "Unmap", window)) {
        return false;
    }
    if (!checked(xcb_reparent_window_checked(m_connection, xid, target, 0, 0), "Reparent", window)) {
        if (embedding) {
            xcb_map_window(m_connection, xid);
            xcb_flush(m_connection);
        }
        return false;
    }
    return true;
}

bool XcbWindowSystem::refreshFrame(WindowId window)
{
    // Round trip so the window manager and the client see the new hints
    // before the next request touches the window
    xcb_flush(m_connection);
    Reply<xcb_get_input_focus_reply_t> sync(
        xcb_get_input_focus_reply(m_connection, xcb_get_input_focus(m_connection), nullptr));
    return sync != nullptr && isWindow(window);
}

bool XcbWindowSystem::moveResize(WindowId window, const QRect& geometry)
{
    const uint16_t mask =
        XCB_CONFIG_WINDOW_X | XCB_CONFIG_WINDOW_Y | XCB_CONFIG_WINDOW_WIDTH | XCB_CONFIG_WINDOW_HEIGHT;
    const uint32_t values[] = {
        static_cast<uint32_t>(geometry.x()),
        static_cast<uint32_t>(geometry.y()),
        static_cast<uint32_t>(qMax(1, geometry.width())),
        static_cast<uint32_t>(qMax(1, geometry.height())),
    };
    const auto cookie = xcb_configure_window_checked(m_connection, static_cast<xcb_window_t>(window), mask, values);
    return checked(cookie, "Configure", window);
}

bool XcbWindowSystem::showWindow(WindowId window)
{
    const auto cookie = xcb_map_window_checked(m_connection, static_cast<xcb_window_t>(window));
    return checked(cookie, "Map", window);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Hit testing
// ═══════════════════════════════════════════════════════════════════════════════

WindowId XcbWindowSystem::windowAt(const QPoint& point) const
{
    xcb_window_t current = m_root;
    xcb_window_t deepest = XCB_WINDOW_NONE;
    while (true) {
        const auto cookie = xcb_translate_coordinates(m_connection, m_root, current, static_cast<int16_t>(point.x()),
                                                      static_cast<int16_t>(point.y()));
        Reply<xcb_translate_coordinates_reply_t> reply(xcb_translate_coordinates_reply(m_connection, cookie, nullptr));
        if (!reply || reply->child == XCB_WINDOW_NONE) {
            break;
        }
        deepest = reply->child;
        current = reply->child;
    }
    return deepest;
}

WindowId XcbWindowSystem::topLevelAncestor(WindowId window) const
{
    xcb_window_t current = static_cast<xcb_window_t>(window);
    while (current != XCB_WINDOW_NONE && current != m_root) {
        if (hasWmState(current)) {
            return current;
        }
        const auto cookie = xcb_query_tree(m_connection, current);
        Reply<xcb_query_tree_reply_t> tree(xcb_query_tree_reply(m_connection, cookie, nullptr));
        if (!tree) {
            return NoWindow;
        }
        if (tree->parent == m_root) {
            // Reached the window manager frame; the client is somewhere below it
            const xcb_window_t client = findClient(current);
            return client != XCB_WINDOW_NONE ? client : current;
        }
        current = tree->parent;
    }
    return NoWindow;
}

std::optional<PointerState> XcbWindowSystem::pointerState() const
{
    Reply<xcb_query_pointer_reply_t> pointer(
        xcb_query_pointer_reply(m_connection, xcb_query_pointer(m_connection, m_root), nullptr));
    if (!pointer) {
        return std::nullopt;
    }

    constexpr uint16_t buttons = XCB_BUTTON_MASK_1 | XCB_BUTTON_MASK_2 | XCB_BUTTON_MASK_3;
    PointerState state;
    state.x = pointer->root_x;
    state.y = pointer->root_y;
    state.buttonPressed = (pointer->mask & buttons) != 0;
    return state;
}

} // namespace TabNest
