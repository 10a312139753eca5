// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "core/nativewindowcontroller.h"
#include "core/tab.h"
#include "core/tabregistry.h"
#include "core/utils.h"
#include "core/windowdirectory.h"
#include "fakewindowsystem.h"

using namespace TabNest;

namespace {

ClassificationRules testRules()
{
    ClassificationRules rules;
    rules.applicationName = QStringLiteral("Suite");
    rules.runningMarkers = {QStringLiteral("Running")};
    rules.managerSignature = QStringLiteral("Suite Manager");
    rules.managerLabel = QStringLiteral("Manager");
    rules.companionExecutables = {QStringLiteral("SuiteVM")};
    return rules;
}

/**
 * Registry wired to in-memory fakes. Auto-attach defaults follow the
 * shipped configuration: primary and external on, manager and picked off.
 */
struct Fixture
{
    FakeWindowSystem ws;
    FakeProcessController processes;
    FakeHostSurfaceProvider hosts;
    NativeWindowController controller{&ws};
    WindowDirectory directory{&ws, &processes, testRules()};

    bool primaryAuto = true;
    bool managerAuto = false;
    bool externalAuto = true;

    TabRegistry registry{&directory, &controller, &processes, &hosts, [this](WindowCategory category) {
                             switch (category) {
                             case WindowCategory::PrimaryApp:
                                 return primaryAuto;
                             case WindowCategory::CompanionManager:
                                 return managerAuto;
                             case WindowCategory::ExternalProcess:
                                 return externalAuto;
                             case WindowCategory::Picked:
                                 break;
                             }
                             return false;
                         }};

    bool invariantHolds() const
    {
        const QList<const Tab*> tabs = registry.tabs();
        for (const Tab* tab : tabs) {
            if (tab->handle().isAttached() != tab->handle().savedStyle().has_value()) {
                return false;
            }
        }
        return true;
    }
};

} // namespace

class TestTabRegistry : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<TabNest::AttachState>();
        qRegisterMetaType<TabNest::EmbedError>();
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Automatic reconciliation
    // ═══════════════════════════════════════════════════════════════════════════

    void testReconcile_autoAttachesPrimaryWindow()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        QSignalSpy addedSpy(&f.registry, &TabRegistry::tabAdded);

        const QList<const Tab*> tabs = f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(tabs.size(), 1);
        QCOMPARE(addedSpy.count(), 1);
        QCOMPARE(tabs.first()->title(), QStringLiteral("VM-A"));
        QCOMPARE(tabs.first()->attachState(), AttachState::Attached);
        QCOMPARE(f.ws.windows[vm].parent, tabs.first()->hostSurface());
        QCOMPARE(f.hosts.titles.value(tabs.first()->hostSurface()), QStringLiteral("VM-A"));
        QVERIFY(f.invariantHolds());
    }

    void testReconcile_attachSizesToHostOnce()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(f.ws.moveResizeCalls.size(), 1);
        QCOMPARE(f.ws.moveResizeCalls.first().first, vm);
        QCOMPARE(f.ws.moveResizeCalls.first().second, QRect(0, 0, 800, 600));
        QVERIFY(f.ws.windows[vm].shown);
        QCOMPARE(f.ws.windows[vm].geometryWhenShown, QRect(0, 0, 800, 600));
    }

    void testReconcile_policyOffCreatesPlaceholder()
    {
        Fixture f;
        const WindowId manager = f.ws.addWindow(QStringLiteral("Suite Manager"));

        f.registry.reconcile(ReconcileTrigger::Automatic);

        const Tab* tab = f.registry.tab(manager);
        QVERIFY(tab);
        QCOMPARE(tab->attachState(), AttachState::Detached);
        QCOMPARE(tab->title(), QStringLiteral("Manager"));
        QVERIFY(f.ws.windows[manager].styles == FrameStyles);
        QVERIFY(f.invariantHolds());

        QVERIFY(f.registry.attach(manager));
        QCOMPARE(f.registry.tab(manager)->attachState(), AttachState::Attached);
    }

    void testReconcile_secondPassIsStable()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QSignalSpy addedSpy(&f.registry, &TabRegistry::tabAdded);
        QSignalSpy stateSpy(&f.registry, &TabRegistry::tabStateChanged);

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(f.registry.count(), 1);
        QCOMPARE(addedSpy.count(), 0);
        QCOMPARE(stateSpy.count(), 0);
        QCOMPARE(f.ws.moveResizeCalls.size(), 1);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Garbage collection
    // ═══════════════════════════════════════════════════════════════════════════

    void testReconcile_removesDeadWindowBeforeAdding()
    {
        Fixture f;
        const WindowId first = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        const WindowId host = f.registry.tab(first)->hostSurface();

        QStringList events;
        connect(&f.registry, &TabRegistry::tabAdded, this, [&events](WindowId window) {
            events.append(QStringLiteral("added ") + Utils::windowIdToString(window));
        });
        connect(&f.registry, &TabRegistry::tabRemoved, this, [&events](WindowId window) {
            events.append(QStringLiteral("removed ") + Utils::windowIdToString(window));
        });

        f.ws.destroy(first);
        const WindowId second = f.ws.addWindow(QStringLiteral("VM-B [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(events,
                 QStringList({QStringLiteral("removed ") + Utils::windowIdToString(first),
                              QStringLiteral("added ") + Utils::windowIdToString(second)}));
        QVERIFY(!f.registry.isTracked(first));
        QVERIFY(f.hosts.released.contains(host));
    }

    void testReconcile_keepsLiveWindowNoLongerClassified()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        f.ws.windows[vm].title = QStringLiteral("VM-A [Paused] - Suite");
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(f.registry.isTracked(vm));
        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::Attached);
    }

    void testReconcile_enumerationFailureKeepsLiveTabs()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QSignalSpy failedSpy(&f.registry, &TabRegistry::enumerationFailed);

        f.ws.failEnumeration = true;
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(failedSpy.count(), 1);
        QVERIFY(f.registry.isTracked(vm));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Manual detach and attach all
    // ═══════════════════════════════════════════════════════════════════════════

    void testDetach_suppressesAutoAttach()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(f.registry.detach(vm));
        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::ManuallyDetached);
        QVERIFY(f.registry.isManuallyDetached(vm));
        QVERIFY(f.ws.windows[vm].styles == FrameStyles);
        QCOMPARE(f.ws.windows[vm].parent, NoWindow);

        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.reconcile(ReconcileTrigger::ManualRefresh);

        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::ManuallyDetached);
        QCOMPARE(f.ws.windows[vm].parent, NoWindow);
        QVERIFY(f.invariantHolds());
    }

    void testAttachAll_overridesManualDetach()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        const WindowId manager = f.ws.addWindow(QStringLiteral("Suite Manager"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.detach(vm);

        f.registry.reconcile(ReconcileTrigger::AttachAll);

        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::Attached);
        QCOMPARE(f.registry.tab(manager)->attachState(), AttachState::Attached);
        QVERIFY(!f.registry.isManuallyDetached(vm));
        QVERIFY(f.invariantHolds());
    }

    void testAttach_clearsManualDetach()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.detach(vm);

        QVERIFY(f.registry.attach(vm));
        QVERIFY(!f.registry.isManuallyDetached(vm));
        QVERIFY(!f.registry.attach(0x7300001));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Attach failures
    // ═══════════════════════════════════════════════════════════════════════════

    void testAttach_rejectedKeepsPlaceholder()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.ws.rejectReparent.insert(vm);
        QSignalSpy failedSpy(&f.registry, &TabRegistry::attachFailed);

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(f.registry.isTracked(vm));
        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::Detached);
        QCOMPARE(failedSpy.count(), 1);
        QCOMPARE(failedSpy.first().at(1).value<EmbedError>(), EmbedError::AttachFailed);
        QVERIFY(f.ws.windows[vm].styles == FrameStyles);
        QVERIFY(f.invariantHolds());
    }

    void testAttach_destroyedMidAttachRemovesTab()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.ws.dieOnSetStyle.insert(vm);
        QSignalSpy removedSpy(&f.registry, &TabRegistry::tabRemoved);

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(!f.registry.isTracked(vm));
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(f.hosts.released.size(), 1);
    }

    void testReconcile_staleDeadWindowGetsNoTab()
    {
        Fixture f;
        const WindowId manager = f.ws.addWindow(QStringLiteral("Suite Manager"));
        const QList<ClassifiedWindow> found = f.directory.enumerate().windows;
        QCOMPARE(found.size(), 1);
        f.ws.destroy(manager);
        QSignalSpy addedSpy(&f.registry, &TabRegistry::tabAdded);

        f.registry.reconcile(ReconcileTrigger::Automatic, found);

        QCOMPARE(f.registry.count(), 0);
        QCOMPARE(addedSpy.count(), 0);
        QVERIFY(f.hosts.created.isEmpty());
    }

    void testReconcile_noHostSurfaceNoTab()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.hosts.failCreate = true;

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(f.registry.count(), 0);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Pick
    // ═══════════════════════════════════════════════════════════════════════════

    void testAddPickedWindow_forcesAttach()
    {
        Fixture f;
        const WindowId editor = f.ws.addWindow(QStringLiteral("Text Editor"));
        const auto picked = f.directory.pickWindow(editor);
        QVERIFY(picked.has_value());

        QVERIFY(f.registry.addPickedWindow(*picked));

        const Tab* tab = f.registry.tab(editor);
        QVERIFY(tab);
        QCOMPARE(tab->handle().category(), WindowCategory::Picked);
        QCOMPARE(tab->attachState(), AttachState::Attached);
    }

    void testAddPickedWindow_reattachesTrackedWindow()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.detach(vm);

        QVERIFY(f.registry.addPickedWindow(*f.directory.pickWindow(vm)));
        QCOMPARE(f.registry.count(), 1);
        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::Attached);
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Resize and rename
    // ═══════════════════════════════════════════════════════════════════════════

    void testHostSurfaceResized_singleResize()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.ws.moveResizeCalls.clear();

        f.registry.hostSurfaceResized(vm, QSize(1024, 768));

        QCOMPARE(f.ws.moveResizeCalls.size(), 1);
        QCOMPARE(f.ws.windows[vm].geometry, QRect(0, 0, 1024, 768));
    }

    void testHostSurfaceResized_ignoredWhenDetached()
    {
        Fixture f;
        const WindowId manager = f.ws.addWindow(QStringLiteral("Suite Manager"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        f.registry.hostSurfaceResized(manager, QSize(1024, 768));

        QVERIFY(f.ws.moveResizeCalls.isEmpty());
    }

    void testRenameTab_survivesPolls()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QSignalSpy titleSpy(&f.registry, &TabRegistry::tabTitleChanged);

        QVERIFY(f.registry.renameTab(vm, QStringLiteral("  Build server ")));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(f.registry.tab(vm)->title(), QStringLiteral("Build server"));
        QCOMPARE(titleSpy.count(), 1);
    }

    void testRenameTab_rejectsBlankTitle()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(!f.registry.renameTab(vm, QStringLiteral("   ")));
        QVERIFY(!f.registry.renameTab(0x7300001, QStringLiteral("Other")));
        QCOMPARE(f.registry.tab(vm)->title(), QStringLiteral("VM-A"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Close and remove
    // ═══════════════════════════════════════════════════════════════════════════

    void testCloseTab_terminatesOwner()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"), 1200);
        f.processes.running.insert(1200);
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(f.registry.closeTab(vm));

        QCOMPARE(f.processes.terminated, QList<qint64>({1200}));
        QVERIFY(!f.registry.isTracked(vm));
    }

    void testCloseTab_failedTerminationStillRemovesTab()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"), 1200);
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QSignalSpy removedSpy(&f.registry, &TabRegistry::tabRemoved);

        QVERIFY(!f.registry.closeTab(vm));

        QVERIFY(!f.registry.isTracked(vm));
        QCOMPARE(removedSpy.count(), 1);
        QCOMPARE(f.hosts.released.size(), 1);
        // The surviving window is handed back to the desktop
        QVERIFY(f.ws.windows[vm].styles == FrameStyles);
        QCOMPARE(f.ws.windows[vm].parent, NoWindow);
    }

    void testCloseAllTabs_countsAndStopsServices()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"), 1200);
        f.ws.addWindow(QStringLiteral("VM-B [Running] - Suite"), 1300);
        f.ws.addWindow(QStringLiteral("Suite Manager"), 1400);
        f.processes.running = {1200, 1300, 9000};
        f.processes.executables.insert(9000, QStringLiteral("SuiteSVC"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QCOMPARE(f.registry.count(), 3);

        const int terminated = f.registry.closeAllTabs({QStringLiteral("SuiteSVC")});

        QCOMPARE(terminated, 2);
        QCOMPARE(f.registry.count(), 0);
        QCOMPARE(f.processes.terminatedNames, QStringList({QStringLiteral("SuiteSVC")}));
        QVERIFY(f.processes.running.isEmpty());
        QCOMPARE(f.hosts.released.size(), 3);
    }

    void testRemoveTab_releasesWithoutTerminating()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"), 1200);
        f.processes.running.insert(1200);
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(f.registry.removeTab(vm));

        QVERIFY(f.processes.terminated.isEmpty());
        QCOMPARE(f.ws.windows[vm].parent, NoWindow);
        QVERIFY(!f.registry.removeTab(vm));
    }

    void testRemoveTab_releasedWindowNotReattachedByPolling()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        QVERIFY(f.registry.removeTab(vm));
        QVERIFY(f.registry.isManuallyDetached(vm));

        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QCOMPARE(f.ws.windows[vm].parent, NoWindow);
        QVERIFY(f.ws.windows[vm].styles == FrameStyles);
        QCOMPARE(f.registry.tab(vm)->attachState(), AttachState::ManuallyDetached);
        QVERIFY(f.invariantHolds());

        QVERIFY(f.registry.attach(vm));
        QCOMPARE(f.ws.windows[vm].parent, f.registry.tab(vm)->hostSurface());
        QVERIFY(!f.registry.isManuallyDetached(vm));
    }

    void testRemoveTab_suppressionDroppedWhenWindowDies()
    {
        Fixture f;
        const WindowId vm = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);
        f.registry.removeTab(vm);

        f.ws.destroy(vm);
        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(!f.registry.isManuallyDetached(vm));
        QVERIFY(!f.registry.isTracked(vm));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Shutdown and re-entrancy
    // ═══════════════════════════════════════════════════════════════════════════

    void testShutdown_restoresEveryWindow()
    {
        Fixture f;
        const WindowStyles original = WindowStyles(WindowStyle::TitleBar) | WindowStyle::Border;
        const WindowId first = f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"), 4242, original);
        const WindowId second = f.ws.addWindow(QStringLiteral("VM-B [Running] - Suite"));
        f.registry.reconcile(ReconcileTrigger::Automatic);

        f.registry.shutdown();

        QVERIFY(f.ws.windows[first].styles == original);
        QVERIFY(f.ws.windows[second].styles == FrameStyles);
        QCOMPARE(f.ws.windows[first].parent, NoWindow);
        QCOMPARE(f.ws.windows[second].parent, NoWindow);
        QVERIFY(f.invariantHolds());
    }

    void testReconcile_reentrantCallIgnored()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        bool sawGuard = false;
        connect(&f.registry, &TabRegistry::tabAdded, this, [&f, &sawGuard]() {
            sawGuard = f.registry.isReconciling();
            f.registry.reconcile(ReconcileTrigger::Automatic);
        });

        f.registry.reconcile(ReconcileTrigger::Automatic);

        QVERIFY(sawGuard);
        QCOMPARE(f.registry.count(), 1);
        QVERIFY(!f.registry.isReconciling());
    }
};

QTEST_GUILESS_MAIN(TestTabRegistry)
#include "test_tab_registry.moc"
