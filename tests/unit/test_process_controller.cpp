// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QCoreApplication>
#include <QProcess>
#include <QTest>

#include "core/processcontroller.h"

using namespace TabNest;

class TestProcessController : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testTerminate_runningChild()
    {
        QProcess child;
        child.start(QStringLiteral("sleep"), {QStringLiteral("30")});
        QVERIFY(child.waitForStarted());

        ProcessController controller;
        QCOMPARE(controller.executableName(child.processId()), QStringLiteral("sleep"));
        QVERIFY(controller.terminateByProcessId(child.processId()));
        QVERIFY(child.waitForFinished(5000));
        QCOMPARE(child.exitStatus(), QProcess::CrashExit);
    }

    void testTerminate_exitedProcessFails()
    {
        QProcess child;
        child.start(QStringLiteral("true"), QStringList());
        QVERIFY(child.waitForStarted());
        const qint64 pid = child.processId();
        QVERIFY(child.waitForFinished(5000));

        ProcessController controller;
        QVERIFY(!controller.terminateByProcessId(pid));
    }

    void testTerminate_invalidPids()
    {
        ProcessController controller;
        QVERIFY(!controller.terminateByProcessId(0));
        QVERIFY(!controller.terminateByProcessId(-5));
        QVERIFY(!controller.terminateByProcessId(QCoreApplication::applicationPid()));
    }

    void testExecutableName_unknownPid()
    {
        ProcessController controller;
        QVERIFY(controller.executableName(0).isEmpty());
        QVERIFY(controller.executableName(-1).isEmpty());
    }

    void testTerminateByName_emptyNameIsNoop()
    {
        ProcessController controller;
        QCOMPARE(controller.terminateByExecutableName(QString()), 0);
        QCOMPARE(controller.terminateByExecutableName(QStringLiteral("tabnest-no-such-executable")), 0);
    }
};

QTEST_GUILESS_MAIN(TestProcessController)
#include "test_process_controller.moc"
