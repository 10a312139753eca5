// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QObject>
#include <QPoint>
#include <QSet>
#include <QSize>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace TabNest {

class WindowDirectory;
class NativeWindowController;
class IProcessController;
class IHostSurfaceProvider;
class Tab;

/**
 * @brief Reconciliation engine mapping native windows to tabs
 *
 * Owns every Tab (and through it every EmbeddedWindowHandle) plus the set of
 * manually detached windows. All mutation happens on the UI thread; the only
 * hazard is the foreign windows themselves, which their owning processes may
 * destroy at any time between two of our calls.
 *
 * One reconciliation pass:
 * 1. Garbage collect tracked windows that are dead and absent from the scan
 * 2. Leave tracked windows alone, except that AttachAll re-attaches them
 * 3. Create tabs for new windows, attaching per trigger and policy
 * Garbage collection always runs before additions within a pass.
 *
 * Note: This class does NOT use the singleton pattern. The application
 * controller owns the instance and injects it where needed.
 */
class TABNEST_EXPORT TabRegistry : public QObject
{
    Q_OBJECT

public:
    /// categoryDefaultAutoAttachEnabled(category)
    using AutoAttachPolicy = std::function<bool(WindowCategory)>;

    TabRegistry(WindowDirectory* directory, NativeWindowController* controller, IProcessController* processes,
                IHostSurfaceProvider* hosts, AutoAttachPolicy policy, QObject* parent = nullptr);
    ~TabRegistry() override;

    void setAutoAttachPolicy(AutoAttachPolicy policy);

    // ═══════════════════════════════════════════════════════════════════════════
    // Reconciliation
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Run one pass against a fresh enumeration
     * @return Current tab list
     *
     * A call made while a pass is already running is skipped.
     */
    QList<const Tab*> reconcile(ReconcileTrigger trigger);

    /**
     * @brief Run one pass against an already enumerated window list
     * @param forced Windows in @p found that must be attached regardless of policy
     */
    QList<const Tab*> reconcile(ReconcileTrigger trigger, const QList<ClassifiedWindow>& found,
                                const QSet<WindowId>& forced = {});

    bool isReconciling() const
    {
        return m_reconciling;
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // User Actions
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Explicitly attach a tracked window (clears manual detach)
     */
    bool attach(WindowId window);

    /**
     * @brief User-initiated detach: Attached → ManuallyDetached
     *
     * The window is added to the manually detached set so automatic polls
     * leave it alone until an explicit attach or AttachAll.
     */
    bool detach(WindowId window);

    /**
     * @brief Resolve the top-level window under a desktop point
     */
    std::optional<ClassifiedWindow> pickWindowAt(const QPoint& point) const;

    /**
     * @brief Track (if needed) and force-attach a picked window
     */
    bool addPickedWindow(const ClassifiedWindow& window);

    /**
     * @brief Terminate the window's process and remove its tab
     * @return Whether termination was delivered; the tab is removed either way
     */
    bool closeTab(WindowId window);

    /**
     * @brief Terminate every tab's process and the given service executables
     * @return Number of tab processes a termination was delivered to
     */
    int closeAllTabs(const QStringList& serviceExecutables = {});

    /**
     * @brief Forget a tab without terminating its process (window restored)
     */
    bool removeTab(WindowId window);

    /**
     * @brief Set a user title; polls never overwrite it
     */
    bool renameTab(WindowId window, const QString& title);

    /**
     * @brief Host surface of @p window changed size
     *
     * An attached window is resized synchronously to exactly @p size.
     */
    void hostSurfaceResized(WindowId window, const QSize& size);

    /**
     * @brief Detach every attached window (application shutdown)
     */
    void shutdown();

    // ═══════════════════════════════════════════════════════════════════════════
    // Queries
    // ═══════════════════════════════════════════════════════════════════════════

    QList<const Tab*> tabs() const;
    const Tab* tab(WindowId window) const;
    const Tab* tabForHostSurface(WindowId surface) const;
    int count() const
    {
        return static_cast<int>(m_tabs.size());
    }
    bool isTracked(WindowId window) const;
    bool isManuallyDetached(WindowId window) const;
    QSet<WindowId> manuallyDetachedWindows() const
    {
        return m_manuallyDetached;
    }

Q_SIGNALS:
    void tabAdded(WindowId window);
    void tabRemoved(WindowId window);
    void tabStateChanged(WindowId window, TabNest::AttachState state);
    void tabTitleChanged(WindowId window, const QString& title);
    void attachFailed(WindowId window, TabNest::EmbedError error);
    void enumerationFailed();
    void reconciled();

private:
    Tab* findTab(WindowId window) const;
    Tab* createTab(const ClassifiedWindow& window);
    bool attachTab(Tab* tab);
    void teardownTab(WindowId window);
    bool shouldAutoAttach(WindowCategory category) const;

    WindowDirectory* m_directory = nullptr;
    NativeWindowController* m_controller = nullptr;
    IProcessController* m_processes = nullptr;
    IHostSurfaceProvider* m_hosts = nullptr;
    AutoAttachPolicy m_policy;

    std::vector<std::unique_ptr<Tab>> m_tabs; // in tab order
    QSet<WindowId> m_manuallyDetached;
    bool m_reconciling = false;
};

} // namespace TabNest
