// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QTest>

#include "core/windowpicker.h"
#include "fakewindowsystem.h"

using namespace TabNest;

namespace {
PointerState pointer(int x, int y, bool pressed)
{
    PointerState state;
    state.x = x;
    state.y = y;
    state.buttonPressed = pressed;
    return state;
}
}

class TestWindowPicker : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testClick_emitsPointerPosition()
    {
        FakeWindowSystem ws;
        ws.pointerStates = {pointer(0, 0, false), pointer(5, 5, false), pointer(320, 240, true)};
        WindowPicker picker(&ws);
        QSignalSpy clickedSpy(&picker, &WindowPicker::clicked);

        picker.start(30);

        QVERIFY(clickedSpy.wait(2000));
        QCOMPARE(clickedSpy.first().at(0).toPoint(), QPoint(320, 240));
        QVERIFY(!picker.isActive());
    }

    void testClick_waitsForInitialRelease()
    {
        FakeWindowSystem ws;
        // Button still held from the click that started picking
        ws.pointerStates = {pointer(10, 10, true), pointer(10, 10, true), pointer(10, 10, false),
                            pointer(77, 88, true)};
        WindowPicker picker(&ws);
        QSignalSpy clickedSpy(&picker, &WindowPicker::clicked);

        picker.start(30);

        QVERIFY(clickedSpy.wait(2000));
        QCOMPARE(clickedSpy.count(), 1);
        QCOMPARE(clickedSpy.first().at(0).toPoint(), QPoint(77, 88));
    }

    void testPointerFailure_retries()
    {
        FakeWindowSystem ws;
        ws.pointerStates = {pointer(0, 0, false), std::nullopt, pointer(3, 4, true)};
        WindowPicker picker(&ws);
        QSignalSpy clickedSpy(&picker, &WindowPicker::clicked);

        picker.start(30);

        QVERIFY(clickedSpy.wait(2000));
        QCOMPARE(clickedSpy.first().at(0).toPoint(), QPoint(3, 4));
    }

    void testCancel_stopsWithoutClick()
    {
        FakeWindowSystem ws;
        WindowPicker picker(&ws);
        QSignalSpy clickedSpy(&picker, &WindowPicker::clicked);
        QSignalSpy cancelledSpy(&picker, &WindowPicker::cancelled);

        picker.start(30);
        QVERIFY(picker.isActive());
        picker.cancel();

        QVERIFY(!picker.isActive());
        QCOMPARE(cancelledSpy.count(), 1);
        QTest::qWait(150);
        QCOMPARE(clickedSpy.count(), 0);

        picker.cancel();
        QCOMPARE(cancelledSpy.count(), 1);
    }

    void testTimeout_emitsTimedOut()
    {
        FakeWindowSystem ws;
        WindowPicker picker(&ws);
        QSignalSpy clickedSpy(&picker, &WindowPicker::clicked);
        QSignalSpy timedOutSpy(&picker, &WindowPicker::timedOut);

        picker.start(0);

        QVERIFY(timedOutSpy.wait(2000));
        QVERIFY(!picker.isActive());
        QCOMPARE(clickedSpy.count(), 0);
    }
};

QTEST_GUILESS_MAIN(TestWindowPicker)
#include "test_window_picker.moc"
