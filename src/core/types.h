// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include <QFlags>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QWindowDefs>

namespace TabNest {

/**
 * @brief Native identity of a top-level window
 *
 * Only valid while the window exists. The numeric value may be recycled by
 * the window system, so every use re-validates liveness before trusting it.
 */
using WindowId = WId;

/// Desktop root / "no parent"
inline constexpr WindowId NoWindow = 0;

/**
 * @brief Semantic category assigned by WindowDirectory
 */
enum class WindowCategory {
    PrimaryApp = 0, ///< Running instance of the managed application (VM console)
    CompanionManager = 1, ///< The application's manager window
    ExternalProcess = 2, ///< Window of a known companion runtime executable
    Picked = 3 ///< Explicitly picked by the user (click or process list)
};

/**
 * @brief Attachment state of an embedded window
 */
enum class AttachState {
    Attached = 0,
    Detached = 1, ///< Placeholder; never attached or lost its attachment
    ManuallyDetached = 2 ///< User detached; auto-attach suppressed
};

/**
 * @brief Why a reconciliation pass runs
 */
enum class ReconcileTrigger {
    Automatic = 0, ///< Poll timer
    ManualRefresh = 1, ///< Refresh action, drag and drop, D-Bus refresh
    AttachAll = 2, ///< Explicit "attach all"
    Pick = 3 ///< Explicitly picked window (forced attach)
};

/**
 * @brief Failure kinds of the embedding core
 *
 * Nothing here is fatal: every failure degrades to a detached or missing tab.
 */
enum class EmbedError {
    None = 0,
    StaleWindow = 1, ///< Identity no longer valid, drop the tracked entry
    AttachFailed = 2, ///< Style/reparent call rejected by the window system
    TerminateFailed = 3, ///< Process termination failed (advisory)
    EnumerationPartialFailure = 4, ///< One window's probe failed mid-scan
    EnumerationFailed = 5 ///< The enumeration primitive itself failed
};

/**
 * @brief Window style bits
 *
 * Platform-neutral view of the frame attributes of a window. Backends map
 * their native representation (Motif hints on X11) onto these bits.
 */
enum class WindowStyle : quint32 {
    NoStyle = 0,
    TitleBar = 0x01,
    Border = 0x02,
    ResizeFrame = 0x04,
    SystemMenu = 0x08,
    MinimizeButton = 0x10,
    MaximizeButton = 0x20,
    Child = 0x40 ///< Window is embedded as a child surface
};
Q_DECLARE_FLAGS(WindowStyles, WindowStyle)
Q_DECLARE_OPERATORS_FOR_FLAGS(WindowStyles)

/// Bits stripped on attach and restored verbatim on detach
inline constexpr WindowStyles FrameStyles = WindowStyles(WindowStyle::TitleBar) | WindowStyle::Border
    | WindowStyle::ResizeFrame | WindowStyle::SystemMenu | WindowStyle::MinimizeButton | WindowStyle::MaximizeButton;

/**
 * @brief Pre-embedding state of a native window
 *
 * Captured exactly once per attach and required unmodified to detach.
 */
struct TABNEST_EXPORT SavedStyle
{
    WindowStyles originalStyleBits; ///< Style bits before attach
    WindowId originalParent = NoWindow; ///< Parent before attach (NoWindow = desktop)

    bool operator==(const SavedStyle& other) const
    {
        return originalStyleBits == other.originalStyleBits && originalParent == other.originalParent;
    }
};

/**
 * @brief A window found by enumeration, with its classification
 *
 * Produced fresh on every enumeration and never persisted across polls.
 */
struct TABNEST_EXPORT ClassifiedWindow
{
    WindowId identity = NoWindow;
    QString rawTitle; ///< Title as reported by the window system
    QString derivedTitle; ///< Title shown on the tab
    WindowCategory category = WindowCategory::Picked;
    qint64 processId = 0; ///< Owning process, 0 if unknown

    bool isValid() const
    {
        return identity != NoWindow;
    }
};

/**
 * @brief Result of NativeWindowController::attach()
 */
struct TABNEST_EXPORT AttachResult
{
    EmbedError error = EmbedError::None;
    SavedStyle savedStyle; ///< Only meaningful when error == None

    bool isOk() const
    {
        return error == EmbedError::None;
    }

    static AttachResult success(const SavedStyle& saved)
    {
        return AttachResult{EmbedError::None, saved};
    }

    static AttachResult failure(EmbedError error)
    {
        return AttachResult{error, SavedStyle{}};
    }
};

/**
 * @brief Result of WindowDirectory::enumerate()
 */
struct TABNEST_EXPORT EnumerationResult
{
    QList<ClassifiedWindow> windows;
    int skippedWindows = 0; ///< Windows whose probes failed mid-scan
    bool failed = false; ///< Enumeration primitive failed, windows is empty
};

/**
 * @brief Pointer position and button state, used by the window picker
 */
struct TABNEST_EXPORT PointerState
{
    int x = 0;
    int y = 0;
    bool buttonPressed = false; ///< Any of the primary/middle/secondary buttons
};

/**
 * @brief Title and process heuristics used by WindowDirectory
 *
 * Defaults match an Oracle VirtualBox installation; all values come from
 * the [Detection] config group.
 */
struct TABNEST_EXPORT ClassificationRules
{
    QString applicationName; ///< Suffix of running-instance titles ("Oracle VirtualBox")
    QStringList runningMarkers; ///< Status markers in brackets, any locale ("Running")
    QString managerSignature; ///< Substring identifying the manager window
    QString managerLabel; ///< Fixed tab title for the manager window
    QStringList companionExecutables; ///< Executable basenames of companion runtimes
};

TABNEST_EXPORT QString categoryName(WindowCategory category);
TABNEST_EXPORT QString attachStateName(AttachState state);
TABNEST_EXPORT QString embedErrorName(EmbedError error);

} // namespace TabNest

Q_DECLARE_METATYPE(TabNest::WindowCategory)
Q_DECLARE_METATYPE(TabNest::AttachState)
Q_DECLARE_METATYPE(TabNest::EmbedError)
Q_DECLARE_METATYPE(TabNest::ReconcileTrigger)
