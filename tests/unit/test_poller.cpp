// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "core/constants.h"
#include "core/nativewindowcontroller.h"
#include "core/poller.h"
#include "core/tabregistry.h"
#include "core/windowdirectory.h"
#include "fakewindowsystem.h"

using namespace TabNest;

namespace {

struct Fixture
{
    Fixture()
    {
        ClassificationRules rules;
        rules.applicationName = QStringLiteral("Suite");
        rules.runningMarkers = {QStringLiteral("Running")};
        directory.setRules(rules);
    }

    FakeWindowSystem ws;
    FakeProcessController processes;
    FakeHostSurfaceProvider hosts;
    NativeWindowController controller{&ws};
    WindowDirectory directory{&ws, &processes};
    TabRegistry registry{&directory, &controller, &processes, &hosts, [](WindowCategory) {
                             return true;
                         }};
    Poller poller{&registry};
};

} // namespace

class TestPoller : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        qRegisterMetaType<TabNest::ReconcileTrigger>();
    }

    void testTrigger_runsReconciliation()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        QSignalSpy passSpy(&f.poller, &Poller::passFinished);

        f.poller.refresh();

        QCOMPARE(f.registry.count(), 1);
        QCOMPARE(passSpy.count(), 1);
        QCOMPARE(passSpy.first().at(0).value<ReconcileTrigger>(), ReconcileTrigger::ManualRefresh);
    }

    void testAttachAll_passesTrigger()
    {
        Fixture f;
        QSignalSpy passSpy(&f.poller, &Poller::passFinished);

        f.poller.attachAll();

        QCOMPARE(passSpy.count(), 1);
        QCOMPARE(passSpy.first().at(0).value<ReconcileTrigger>(), ReconcileTrigger::AttachAll);
    }

    void testTrigger_droppedWhilePassRuns()
    {
        Fixture f;
        f.ws.addWindow(QStringLiteral("VM-A [Running] - Suite"));
        connect(&f.registry, &TabRegistry::tabAdded, this, [&f]() {
            f.poller.refresh();
        });
        QSignalSpy passSpy(&f.poller, &Poller::passFinished);

        f.poller.refresh();

        QCOMPARE(passSpy.count(), 1);
        QCOMPARE(f.registry.count(), 1);
    }

    void testInterval_clamped()
    {
        Fixture f;

        f.poller.setIntervalSeconds(0);
        QCOMPARE(f.poller.intervalSeconds(), Defaults::MinRefreshIntervalSeconds);

        f.poller.setIntervalSeconds(3600);
        QCOMPARE(f.poller.intervalSeconds(), Defaults::MaxRefreshIntervalSeconds);

        f.poller.setIntervalSeconds(7);
        QCOMPARE(f.poller.intervalSeconds(), 7);
    }

    void testTimer_firesAutomaticPass()
    {
        Fixture f;
        f.poller.setIntervalSeconds(1);
        QSignalSpy passSpy(&f.poller, &Poller::passFinished);

        f.poller.start();
        QVERIFY(f.poller.isActive());
        QVERIFY(passSpy.wait(3000));
        QCOMPARE(passSpy.first().at(0).value<ReconcileTrigger>(), ReconcileTrigger::Automatic);

        f.poller.stop();
        QVERIFY(!f.poller.isActive());
    }
};

QTEST_GUILESS_MAIN(TestPoller)
#include "test_poller.moc"
