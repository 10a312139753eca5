// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <KConfigGroup>
#include <KSharedConfig>
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

#include "config/settings.h"
#include "core/constants.h"

using namespace TabNest;

namespace {
KSharedConfigPtr testConfig()
{
    return KSharedConfig::openConfig(QStringLiteral("tabnestrc"));
}
}

class TestSettings : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        auto config = testConfig();
        for (const QString& group : config->groupList()) {
            config->deleteGroup(group);
        }
        QVERIFY(config->sync());
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Defaults
    // ═══════════════════════════════════════════════════════════════════════════

    void testDefaults_emptyConfig()
    {
        Settings settings;

        QVERIFY(settings.autoAttach());
        QVERIFY(!settings.autoAttachManager());
        QVERIFY(settings.autoAttachExternal());
        QCOMPARE(settings.refreshIntervalSeconds(), 5);
        QCOMPARE(settings.pickTimeoutSeconds(), 30);
        QCOMPARE(settings.applicationPath(), QStringLiteral("VirtualBox"));

        const ClassificationRules rules = settings.classificationRules();
        QCOMPARE(rules.applicationName, QStringLiteral("Oracle VirtualBox"));
        QVERIFY(rules.runningMarkers.contains(QStringLiteral("Running")));
        QCOMPARE(rules.managerLabel, QStringLiteral("VB Manager"));
        QCOMPARE(rules.companionExecutables, QStringList({QStringLiteral("VirtualBoxVM")}));
        QCOMPARE(settings.serviceExecutables(), QStringList({QStringLiteral("VBoxSVC")}));
    }

    void testCategoryAutoAttach_followsFlags()
    {
        Settings settings;
        settings.setAutoAttachManager(true);
        settings.setAutoAttachExternal(false);

        QVERIFY(settings.categoryAutoAttachEnabled(WindowCategory::PrimaryApp));
        QVERIFY(settings.categoryAutoAttachEnabled(WindowCategory::CompanionManager));
        QVERIFY(!settings.categoryAutoAttachEnabled(WindowCategory::ExternalProcess));
        QVERIFY(!settings.categoryAutoAttachEnabled(WindowCategory::Picked));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Validation
    // ═══════════════════════════════════════════════════════════════════════════

    void testLoad_outOfRangeFallsBackToDefault()
    {
        auto config = testConfig();
        config->group(QStringLiteral("General")).writeEntry(QStringLiteral("RefreshInterval"), 0);
        config->group(QStringLiteral("Picker")).writeEntry(QStringLiteral("PickTimeout"), 9999);
        QVERIFY(config->sync());

        Settings settings;

        QCOMPARE(settings.refreshIntervalSeconds(), 5);
        QCOMPARE(settings.pickTimeoutSeconds(), 30);
    }

    void testLoad_blankDetectionValuesFallBack()
    {
        auto config = testConfig();
        KConfigGroup detection = config->group(QStringLiteral("Detection"));
        detection.writeEntry(QStringLiteral("ApplicationName"), QStringLiteral("   "));
        detection.writeEntry(QStringLiteral("RunningMarkers"), QStringList({QStringLiteral(" "), QString()}));
        QVERIFY(config->sync());

        Settings settings;

        QCOMPARE(settings.classificationRules().applicationName, QStringLiteral("Oracle VirtualBox"));
        QVERIFY(!settings.classificationRules().runningMarkers.isEmpty());
    }

    void testSetter_clampsInterval()
    {
        Settings settings;

        settings.setRefreshIntervalSeconds(-3);
        QCOMPARE(settings.refreshIntervalSeconds(), Defaults::MinRefreshIntervalSeconds);
        settings.setRefreshIntervalSeconds(1000);
        QCOMPARE(settings.refreshIntervalSeconds(), Defaults::MaxRefreshIntervalSeconds);
    }

    void testSetServiceExecutables_cleansList()
    {
        Settings settings;
        settings.setServiceExecutables(
            {QStringLiteral(" svc "), QString(), QStringLiteral("svc"), QStringLiteral("daemon")});
        QCOMPARE(settings.serviceExecutables(), QStringList({QStringLiteral("svc"), QStringLiteral("daemon")}));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Signals
    // ═══════════════════════════════════════════════════════════════════════════

    void testSetter_emitsOnlyOnChange()
    {
        Settings settings;
        QSignalSpy autoSpy(&settings, &ISettings::autoAttachChanged);
        QSignalSpy changedSpy(&settings, &ISettings::settingsChanged);

        settings.setAutoAttach(true);
        QCOMPARE(autoSpy.count(), 0);

        settings.setAutoAttach(false);
        QCOMPARE(autoSpy.count(), 1);
        QCOMPARE(changedSpy.count(), 1);
    }

    void testSetClassificationRules_emits()
    {
        Settings settings;
        QSignalSpy rulesSpy(&settings, &ISettings::classificationRulesChanged);

        ClassificationRules rules = settings.classificationRules();
        settings.setClassificationRules(rules);
        QCOMPARE(rulesSpy.count(), 0);

        rules.managerLabel = QStringLiteral("Console");
        settings.setClassificationRules(rules);
        QCOMPARE(rulesSpy.count(), 1);
        QCOMPARE(settings.classificationRules().managerLabel, QStringLiteral("Console"));
    }

    // ═══════════════════════════════════════════════════════════════════════════
    // Persistence
    // ═══════════════════════════════════════════════════════════════════════════

    void testSaveLoad_persistsValues()
    {
        {
            Settings settings;
            settings.setAutoAttach(false);
            settings.setRefreshIntervalSeconds(12);
            settings.setApplicationPath(QStringLiteral("/opt/suite/bin/suite"));
            settings.setServiceExecutables({QStringLiteral("suited")});
            settings.save();
        }

        Settings reloaded;
        QVERIFY(!reloaded.autoAttach());
        QCOMPARE(reloaded.refreshIntervalSeconds(), 12);
        QCOMPARE(reloaded.applicationPath(), QStringLiteral("/opt/suite/bin/suite"));
        QCOMPARE(reloaded.serviceExecutables(), QStringList({QStringLiteral("suited")}));
    }

    void testReset_restoresDefaults()
    {
        Settings settings;
        settings.setRefreshIntervalSeconds(40);
        settings.save();
        QSignalSpy intervalSpy(&settings, &ISettings::refreshIntervalChanged);

        settings.reset();

        QCOMPARE(settings.refreshIntervalSeconds(), 5);
        QCOMPARE(intervalSpy.count(), 1);
    }
};

QTEST_GUILESS_MAIN(TestSettings)
#include "test_settings.moc"
