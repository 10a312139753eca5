// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabregistry.h"
#include "interfaces.h"
#include "logging.h"
#include "nativewindowcontroller.h"
#include "tab.h"
#include "utils.h"
#include "windowdirectory.h"
#include <QScopedValueRollback>
#include <algorithm>

namespace TabNest {

TabRegistry::TabRegistry(WindowDirectory* directory, NativeWindowController* controller,
                         IProcessController* processes, IHostSurfaceProvider* hosts, AutoAttachPolicy policy,
                         QObject* parent)
    : QObject(parent)
    , m_directory(directory)
    , m_controller(controller)
    , m_processes(processes)
    , m_hosts(hosts)
    , m_policy(std::move(policy))
{
    Q_ASSERT(directory);
    Q_ASSERT(controller);
    Q_ASSERT(processes);
    Q_ASSERT(hosts);
}

TabRegistry::~TabRegistry()
{
    // Never leave a foreign window parented to a host that is about to go away
    shutdown();
}

void TabRegistry::setAutoAttachPolicy(AutoAttachPolicy policy)
{
    m_policy = std::move(policy);
}

bool TabRegistry::shouldAutoAttach(WindowCategory category) const
{
    return m_policy ? m_policy(category) : false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Reconciliation
// ═══════════════════════════════════════════════════════════════════════════════

QList<const Tab*> TabRegistry::reconcile(ReconcileTrigger trigger)
{
    if (m_reconciling) {
        qCDebug(lcRegistry) << "Reconciliation already in progress, skipping";
        return tabs();
    }

    const EnumerationResult result = m_directory->enumerate();
    if (result.failed) {
        Q_EMIT enumerationFailed();
    } else if (result.skippedWindows > 0) {
        qCDebug(lcRegistry) << embedErrorName(EmbedError::EnumerationPartialFailure) << "-"
                            << result.skippedWindows << "windows skipped this pass";
    }
    return reconcile(trigger, result.windows);
}

QList<const Tab*> TabRegistry::reconcile(ReconcileTrigger trigger, const QList<ClassifiedWindow>& found,
                                         const QSet<WindowId>& forced)
{
    if (m_reconciling) {
        qCDebug(lcRegistry) << "Reconciliation already in progress, skipping";
        return tabs();
    }
    QScopedValueRollback<bool> guard(m_reconciling, true);

    QSet<WindowId> foundIds;
    for (const ClassifiedWindow& window : found) {
        foundIds.insert(window.identity);
    }

    // 1. Garbage collect before any addition, so a window cannot be torn
    //    down and recreated from stale data in the same pass
    QList<WindowId> gone;
    for (const auto& tab : m_tabs) {
        const WindowId window = tab->identity();
        if (!foundIds.contains(window) && !m_controller->isAlive(window)) {
            gone.append(window);
        }
    }
    for (const WindowId window : std::as_const(gone)) {
        qCInfo(lcRegistry) << "Window" << Utils::windowIdToString(window) << "is gone, removing its tab";
        teardownTab(window);
    }
    // Released windows keep their suppression until they die; ids get reused
    for (auto it = m_manuallyDetached.begin(); it != m_manuallyDetached.end();) {
        if (!foundIds.contains(*it) && !findTab(*it) && !m_controller->isAlive(*it)) {
            it = m_manuallyDetached.erase(it);
        } else {
            ++it;
        }
    }

    for (const ClassifiedWindow& window : found) {
        if (!window.isValid()) {
            continue;
        }
        const bool isForced = forced.contains(window.identity);

        // 2. Tracked windows keep their state and (possibly user-set) title
        if (Tab* tab = findTab(window.identity)) {
            if ((trigger == ReconcileTrigger::AttachAll || isForced) && !tab->handle().isAttached()) {
                attachTab(tab);
            }
            continue;
        }

        // 3. New window
        const bool manual = m_manuallyDetached.contains(window.identity);
        const bool attachNow = isForced || trigger == ReconcileTrigger::AttachAll
            || (shouldAutoAttach(window.category) && !manual);

        Tab* tab = createTab(window);
        if (!tab) {
            continue;
        }
        if (attachNow) {
            attachTab(tab);
        } else if (manual) {
            tab->handle().setDetached(true);
            Q_EMIT tabStateChanged(window.identity, AttachState::ManuallyDetached);
        }
    }

    Q_EMIT reconciled();
    return tabs();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tab Lifecycle
// ═══════════════════════════════════════════════════════════════════════════════

Tab* TabRegistry::findTab(WindowId window) const
{
    auto it = std::find_if(m_tabs.begin(), m_tabs.end(), [window](const std::unique_ptr<Tab>& tab) {
        return tab->identity() == window;
    });
    return it != m_tabs.end() ? it->get() : nullptr;
}

Tab* TabRegistry::createTab(const ClassifiedWindow& window)
{
    if (!m_controller->isAlive(window.identity)) {
        qCDebug(lcRegistry) << "Skipping" << Utils::windowIdToString(window.identity) << "- already gone";
        return nullptr;
    }
    const WindowId host = m_hosts->createHostSurface(window.identity, window.derivedTitle);
    if (host == NoWindow) {
        qCWarning(lcRegistry) << "No host surface for" << Utils::windowIdToString(window.identity);
        return nullptr;
    }

    m_tabs.push_back(std::make_unique<Tab>(window, host));
    Tab* tab = m_tabs.back().get();

    qCInfo(lcRegistry) << "New tab" << window.derivedTitle << "for" << Utils::windowIdToString(window.identity)
                       << "category:" << categoryName(window.category);
    Q_EMIT tabAdded(window.identity);
    return tab;
}

bool TabRegistry::attachTab(Tab* tab)
{
    EmbeddedWindowHandle& handle = tab->handle();
    if (handle.isAttached()) {
        return true;
    }

    const WindowId window = handle.identity();
    const AttachResult result = m_controller->attach(window, tab->hostSurface());

    if (result.error == EmbedError::StaleWindow) {
        qCInfo(lcRegistry) << "Window" << Utils::windowIdToString(window) << "went away before attaching";
        teardownTab(window);
        return false;
    }
    if (!result.isOk()) {
        qCWarning(lcRegistry) << "Attach failed for" << Utils::windowIdToString(window) << "-"
                              << embedErrorName(result.error);
        Q_EMIT attachFailed(window, result.error);
        return false;
    }

    handle.setAttached(result.savedStyle);
    m_manuallyDetached.remove(window);

    m_controller->resize(window, m_hosts->hostSurfaceSize(tab->hostSurface()));
    m_controller->show(window);

    Q_EMIT tabStateChanged(window, AttachState::Attached);
    return true;
}

void TabRegistry::teardownTab(WindowId window)
{
    auto it = std::find_if(m_tabs.begin(), m_tabs.end(), [window](const std::unique_ptr<Tab>& tab) {
        return tab->identity() == window;
    });
    if (it == m_tabs.end()) {
        return;
    }

    std::unique_ptr<Tab> tab = std::move(*it);
    m_tabs.erase(it);

    // Restore first: the host surface is destroyed right after
    if (const std::optional<SavedStyle> saved = tab->handle().setDetached(false)) {
        m_controller->detach(window, *saved);
    }
    m_manuallyDetached.remove(window);

    Q_EMIT tabRemoved(window);
    m_hosts->releaseHostSurface(tab->hostSurface());
}

// ═══════════════════════════════════════════════════════════════════════════════
// User Actions
// ═══════════════════════════════════════════════════════════════════════════════

bool TabRegistry::attach(WindowId window)
{
    Tab* tab = findTab(window);
    if (!tab) {
        qCDebug(lcRegistry) << "Cannot attach untracked window" << Utils::windowIdToString(window);
        return false;
    }
    return attachTab(tab);
}

bool TabRegistry::detach(WindowId window)
{
    Tab* tab = findTab(window);
    if (!tab) {
        return false;
    }

    EmbeddedWindowHandle& handle = tab->handle();
    if (handle.isManuallyDetached()) {
        return true;
    }

    const std::optional<SavedStyle> saved = handle.setDetached(true);
    m_manuallyDetached.insert(window);
    if (saved && !m_controller->detach(window, *saved)) {
        // Already gone; the next pass garbage collects the tab
        qCDebug(lcRegistry) << "Detached window" << Utils::windowIdToString(window) << "no longer exists";
    }

    qCInfo(lcRegistry) << "User detached" << Utils::windowIdToString(window);
    Q_EMIT tabStateChanged(window, AttachState::ManuallyDetached);
    return true;
}

std::optional<ClassifiedWindow> TabRegistry::pickWindowAt(const QPoint& point) const
{
    return m_directory->pickWindowAt(point);
}

bool TabRegistry::addPickedWindow(const ClassifiedWindow& window)
{
    if (!window.isValid() || m_reconciling) {
        return false;
    }
    reconcile(ReconcileTrigger::Pick, {window}, {window.identity});

    const Tab* tab = findTab(window.identity);
    return tab && tab->handle().isAttached();
}

bool TabRegistry::closeTab(WindowId window)
{
    if (!findTab(window)) {
        return false;
    }

    bool terminated = false;
    if (const std::optional<qint64> pid = m_controller->ownerProcessOf(window)) {
        terminated = m_processes->terminateByProcessId(*pid);
    }
    if (!terminated) {
        qCInfo(lcRegistry) << embedErrorName(EmbedError::TerminateFailed) << "for"
                           << Utils::windowIdToString(window) << "- removing the tab anyway";
    }

    teardownTab(window);
    return terminated;
}

int TabRegistry::closeAllTabs(const QStringList& serviceExecutables)
{
    int terminated = 0;
    QList<WindowId> windows;
    for (const auto& tab : m_tabs) {
        windows.append(tab->identity());
    }

    for (const WindowId window : std::as_const(windows)) {
        if (const std::optional<qint64> pid = m_controller->ownerProcessOf(window)) {
            if (m_processes->terminateByProcessId(*pid)) {
                ++terminated;
            }
        }
    }
    for (const QString& service : serviceExecutables) {
        m_processes->terminateByExecutableName(service);
    }
    for (const WindowId window : std::as_const(windows)) {
        teardownTab(window);
    }

    qCInfo(lcRegistry) << "Closed all tabs," << terminated << "of" << windows.size() << "processes terminated";
    return terminated;
}

bool TabRegistry::removeTab(WindowId window)
{
    if (!findTab(window)) {
        return false;
    }
    teardownTab(window);

    // A released window stays on the desktop until the user attaches it again
    m_manuallyDetached.insert(window);
    qCInfo(lcRegistry) << "Released" << Utils::windowIdToString(window);
    return true;
}

bool TabRegistry::renameTab(WindowId window, const QString& title)
{
    Tab* tab = findTab(window);
    const QString trimmed = title.trimmed();
    if (!tab || trimmed.isEmpty()) {
        return false;
    }
    if (tab->title() == trimmed) {
        return true;
    }

    tab->handle().setDisplayTitle(trimmed);
    Q_EMIT tabTitleChanged(window, trimmed);
    return true;
}

void TabRegistry::hostSurfaceResized(WindowId window, const QSize& size)
{
    const Tab* tab = findTab(window);
    if (!tab || !tab->handle().isAttached()) {
        return;
    }
    m_controller->resize(window, size);
}

void TabRegistry::shutdown()
{
    int restored = 0;
    for (const auto& tab : m_tabs) {
        if (const std::optional<SavedStyle> saved = tab->handle().setDetached(false)) {
            if (m_controller->detach(tab->identity(), *saved)) {
                ++restored;
            }
        }
    }
    if (restored > 0) {
        qCInfo(lcRegistry) << "Restored" << restored << "embedded windows on shutdown";
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Queries
// ═══════════════════════════════════════════════════════════════════════════════

QList<const Tab*> TabRegistry::tabs() const
{
    QList<const Tab*> result;
    result.reserve(static_cast<qsizetype>(m_tabs.size()));
    for (const auto& tab : m_tabs) {
        result.append(tab.get());
    }
    return result;
}

const Tab* TabRegistry::tab(WindowId window) const
{
    return findTab(window);
}

const Tab* TabRegistry::tabForHostSurface(WindowId surface) const
{
    for (const auto& tab : m_tabs) {
        if (tab->hostSurface() == surface) {
            return tab.get();
        }
    }
    return nullptr;
}

bool TabRegistry::isTracked(WindowId window) const
{
    return findTab(window) != nullptr;
}

bool TabRegistry::isManuallyDetached(WindowId window) const
{
    return m_manuallyDetached.contains(window);
}

} // namespace TabNest
