// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QObject>
#include <QPoint>
#include <QRect>
#include <QSize>
#include <QString>
#include <QStringList>
#include <optional>

namespace TabNest {

// ═══════════════════════════════════════════════════════════════════════════════
// Window System Collaborator
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Low-level window system primitives used by the embedding core
 *
 * Implemented once per target OS (XcbWindowSystem on X11). The core
 * (WindowDirectory, NativeWindowController, TabRegistry) depends only on
 * this contract, never on a concrete platform type.
 *
 * Every call re-queries the window system. The foreign windows are owned by
 * other processes and may disappear between any two calls, so probes return
 * std::nullopt (or false) when the window is gone instead of trusting
 * cached state.
 */
class TABNEST_EXPORT IWindowSystem
{
public:
    virtual ~IWindowSystem();

    // ═══════════════════════════════════════════════════════════════════════════
    // Enumeration and probes
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief List top-level application windows
     * @return Window identities, or std::nullopt if the primitive itself failed
     */
    virtual std::optional<QList<WindowId>> topLevelWindows() const = 0;

    /**
     * @brief Check whether @p window currently exists
     */
    virtual bool isWindow(WindowId window) const = 0;

    /**
     * @brief Check whether @p window is shown on the desktop
     * @return Visibility, or std::nullopt if the window is gone
     */
    virtual std::optional<bool> isVisible(WindowId window) const = 0;

    /**
     * @brief Window title
     * @return Title (possibly empty), or std::nullopt if the window is gone
     */
    virtual std::optional<QString> windowTitle(WindowId window) const = 0;

    /**
     * @brief Process id owning @p window, 0 when unknown or gone
     */
    virtual qint64 windowProcessId(WindowId window) const = 0;

    /**
     * @brief Whether @p window is owned by (transient for) another window
     * @return Ownership, or std::nullopt if the window is gone
     */
    virtual std::optional<bool> hasOwner(WindowId window) const = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Style and parent mutation
    // ═══════════════════════════════════════════════════════════════════════════

    virtual std::optional<WindowStyles> styleBits(WindowId window) const = 0;
    virtual bool setStyleBits(WindowId window, WindowStyles styles) = 0;

    /**
     * @brief Current parent of @p window
     * @return Parent identity (NoWindow for the desktop root), or std::nullopt if gone
     */
    virtual std::optional<WindowId> parentWindow(WindowId window) const = 0;

    /**
     * @brief Reparent @p window under @p parent (NoWindow = desktop root)
     *
     * A window moved under a host surface is left hidden until showWindow(),
     * so it can be sized first.
     */
    virtual bool setParentWindow(WindowId window, WindowId parent) = 0;

    /**
     * @brief Apply pending style changes without moving or resizing
     */
    virtual bool refreshFrame(WindowId window) = 0;

    virtual bool moveResize(WindowId window, const QRect& geometry) = 0;
    virtual bool showWindow(WindowId window) = 0;

    // ═══════════════════════════════════════════════════════════════════════════
    // Hit testing
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Deepest window under a desktop point, NoWindow if none
     */
    virtual WindowId windowAt(const QPoint& point) const = 0;

    /**
     * @brief Top-level application window containing @p window, NoWindow if none
     */
    virtual WindowId topLevelAncestor(WindowId window) const = 0;

    /**
     * @brief Current pointer position and button state
     */
    virtual std::optional<PointerState> pointerState() const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Process Collaborator
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Best-effort process termination and process metadata
 */
class TABNEST_EXPORT IProcessController
{
public:
    virtual ~IProcessController();

    /**
     * @brief Request termination of a process
     * @return false on any failure (already exited, permission, invalid pid)
     *
     * Advisory only: callers proceed with tab cleanup regardless.
     */
    virtual bool terminateByProcessId(qint64 pid) = 0;

    /**
     * @brief Terminate every process whose executable basename is @p name
     * @return Number of processes a termination request was delivered to
     */
    virtual int terminateByExecutableName(const QString& name) = 0;

    /**
     * @brief Executable basename of @p pid, empty if unknown
     */
    virtual QString executableName(qint64 pid) const = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Host Surfaces
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Supplies one native host surface per tab
 *
 * Implemented by the UI (MainWindow creates a tab page per surface).
 */
class TABNEST_EXPORT IHostSurfaceProvider
{
public:
    virtual ~IHostSurfaceProvider();

    /**
     * @brief Create the host surface for a new tab
     * @param window Embedded window the surface will host
     * @param title Initial tab title
     * @return Native identity of the surface, NoWindow on failure
     */
    virtual WindowId createHostSurface(WindowId window, const QString& title) = 0;

    /**
     * @brief Client-area size of a host surface
     */
    virtual QSize hostSurfaceSize(WindowId surface) const = 0;

    virtual void releaseHostSurface(WindowId surface) = 0;
};

// ═══════════════════════════════════════════════════════════════════════════════
// Settings
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Abstract interface for settings management
 *
 * Allows dependency inversion - components depend on this interface
 * rather than the concrete KConfig-backed Settings implementation.
 */
class TABNEST_EXPORT ISettings : public QObject
{
    Q_OBJECT

public:
    explicit ISettings(QObject* parent = nullptr)
        : QObject(parent)
    {
    }
    ~ISettings() override;

    // General
    virtual bool autoAttach() const = 0;
    virtual void setAutoAttach(bool enable) = 0;
    virtual bool autoAttachManager() const = 0;
    virtual void setAutoAttachManager(bool enable) = 0;
    virtual bool autoAttachExternal() const = 0;
    virtual void setAutoAttachExternal(bool enable) = 0;
    virtual int refreshIntervalSeconds() const = 0;
    virtual void setRefreshIntervalSeconds(int seconds) = 0;
    virtual QString applicationPath() const = 0;
    virtual void setApplicationPath(const QString& path) = 0;

    // Detection
    virtual ClassificationRules classificationRules() const = 0;
    virtual void setClassificationRules(const ClassificationRules& rules) = 0;
    virtual QStringList serviceExecutables() const = 0;
    virtual void setServiceExecutables(const QStringList& executables) = 0;

    // Picker
    virtual int pickTimeoutSeconds() const = 0;
    virtual void setPickTimeoutSeconds(int seconds) = 0;

    /**
     * @brief Per-category auto-attach default for newly found windows
     */
    virtual bool categoryAutoAttachEnabled(WindowCategory category) const = 0;

    // Persistence
    virtual void load() = 0;
    virtual void save() = 0;
    virtual void reset() = 0;

Q_SIGNALS:
    void settingsChanged();
    void autoAttachChanged();
    void refreshIntervalChanged();
    void applicationPathChanged();
    void classificationRulesChanged();
    void serviceExecutablesChanged();
    void pickTimeoutChanged();
};

} // namespace TabNest
