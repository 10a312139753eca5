// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "settings.h"
#include "configdefaults.h"
#include "../core/logging.h"
#include <KConfig>
#include <KConfigGroup>
#include <KSharedConfig>

namespace TabNest {

// ═══════════════════════════════════════════════════════════════════════════════
// Macros for setter patterns
// ═══════════════════════════════════════════════════════════════════════════════

// Simple setter: if changed, update member, emit specific signal, emit settingsChanged
#define SETTINGS_SETTER(Type, name, member, signal) \
    void Settings::set##name(Type value) \
    { \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

// Clamped int setter: clamp value, then apply if changed
#define SETTINGS_SETTER_CLAMPED(name, member, signal, minVal, maxVal) \
    void Settings::set##name(int value) \
    { \
        value = qBound(minVal, value, maxVal); \
        if (member != value) { \
            member = value; \
            Q_EMIT signal(); \
            Q_EMIT settingsChanged(); \
        } \
    }

namespace {
const QString ConfigFile = QStringLiteral("tabnestrc");
const QString GeneralGroup = QStringLiteral("General");
const QString DetectionGroup = QStringLiteral("Detection");
const QString PickerGroup = QStringLiteral("Picker");

QStringList cleanList(const QStringList& values)
{
    QStringList result;
    for (const QString& value : values) {
        const QString trimmed = value.trimmed();
        if (!trimmed.isEmpty() && !result.contains(trimmed)) {
            result.append(trimmed);
        }
    }
    return result;
}

bool sameRules(const ClassificationRules& a, const ClassificationRules& b)
{
    return a.applicationName == b.applicationName && a.runningMarkers == b.runningMarkers
        && a.managerSignature == b.managerSignature && a.managerLabel == b.managerLabel
        && a.companionExecutables == b.companionExecutables;
}
} // anonymous namespace

Settings::Settings(QObject* parent)
    : ISettings(parent)
{
    load();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helper Methods
// ═══════════════════════════════════════════════════════════════════════════════

int Settings::readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                               const char* settingName)
{
    int value = group.readEntry(QLatin1String(key), defaultValue);
    if (value < min || value > max) {
        qCWarning(lcConfig) << "Invalid" << settingName << ":" << value << "using default (must be" << min << "-"
                            << max << ")";
        value = defaultValue;
    }
    return value;
}

QStringList Settings::readCleanList(const KConfigGroup& group, const char* key, const QStringList& defaultValue)
{
    return cleanList(group.readEntry(QLatin1String(key), defaultValue));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Setters
// ═══════════════════════════════════════════════════════════════════════════════

SETTINGS_SETTER(bool, AutoAttach, m_autoAttach, autoAttachChanged)
SETTINGS_SETTER(bool, AutoAttachManager, m_autoAttachManager, autoAttachChanged)
SETTINGS_SETTER(bool, AutoAttachExternal, m_autoAttachExternal, autoAttachChanged)
SETTINGS_SETTER_CLAMPED(RefreshIntervalSeconds, m_refreshIntervalSeconds, refreshIntervalChanged,
                        Defaults::MinRefreshIntervalSeconds, Defaults::MaxRefreshIntervalSeconds)
SETTINGS_SETTER(const QString&, ApplicationPath, m_applicationPath, applicationPathChanged)
SETTINGS_SETTER_CLAMPED(PickTimeoutSeconds, m_pickTimeoutSeconds, pickTimeoutChanged, Defaults::MinPickTimeoutSeconds,
                        Defaults::MaxPickTimeoutSeconds)

void Settings::setServiceExecutables(const QStringList& executables)
{
    const QStringList cleaned = cleanList(executables);
    if (m_serviceExecutables != cleaned) {
        m_serviceExecutables = cleaned;
        Q_EMIT serviceExecutablesChanged();
        Q_EMIT settingsChanged();
    }
}

void Settings::setClassificationRules(const ClassificationRules& rules)
{
    ClassificationRules cleaned = rules;
    cleaned.applicationName = rules.applicationName.trimmed();
    cleaned.runningMarkers = cleanList(rules.runningMarkers);
    cleaned.companionExecutables = cleanList(rules.companionExecutables);
    if (!sameRules(m_rules, cleaned)) {
        m_rules = cleaned;
        Q_EMIT classificationRulesChanged();
        Q_EMIT settingsChanged();
    }
}

bool Settings::categoryAutoAttachEnabled(WindowCategory category) const
{
    switch (category) {
    case WindowCategory::PrimaryApp:
        return m_autoAttach;
    case WindowCategory::CompanionManager:
        return m_autoAttachManager;
    case WindowCategory::ExternalProcess:
        return m_autoAttachExternal;
    case WindowCategory::Picked:
        return false;
    }
    return false;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Persistence
// ═══════════════════════════════════════════════════════════════════════════════

void Settings::load()
{
    auto config = KSharedConfig::openConfig(ConfigFile);

    // KSharedConfig caches in memory; pick up edits made by hand since the last load
    config->reparseConfiguration();

    const KConfigGroup general = config->group(GeneralGroup);
    const KConfigGroup detection = config->group(DetectionGroup);
    const KConfigGroup picker = config->group(PickerGroup);

    m_autoAttach = general.readEntry(QLatin1String("AutoAttach"), ConfigDefaults::autoAttach());
    m_autoAttachManager = general.readEntry(QLatin1String("AutoAttachManager"), ConfigDefaults::autoAttachManager());
    m_autoAttachExternal =
        general.readEntry(QLatin1String("AutoAttachExternal"), ConfigDefaults::autoAttachExternal());
    m_refreshIntervalSeconds =
        readValidatedInt(general, "RefreshInterval", ConfigDefaults::refreshInterval(),
                         Defaults::MinRefreshIntervalSeconds, Defaults::MaxRefreshIntervalSeconds, "refresh interval");
    m_applicationPath = general.readEntry(QLatin1String("ApplicationPath"), ConfigDefaults::applicationPath()).trimmed();
    if (m_applicationPath.isEmpty()) {
        m_applicationPath = ConfigDefaults::applicationPath();
    }

    m_rules.applicationName =
        detection.readEntry(QLatin1String("ApplicationName"), ConfigDefaults::applicationName()).trimmed();
    if (m_rules.applicationName.isEmpty()) {
        qCWarning(lcConfig) << "Empty application name, using default";
        m_rules.applicationName = ConfigDefaults::applicationName();
    }
    m_rules.runningMarkers = readCleanList(detection, "RunningMarkers", ConfigDefaults::runningMarkers());
    if (m_rules.runningMarkers.isEmpty()) {
        qCWarning(lcConfig) << "No running markers configured, using defaults";
        m_rules.runningMarkers = ConfigDefaults::runningMarkers();
    }
    m_rules.managerSignature = detection.readEntry(QLatin1String("ManagerSignature"), ConfigDefaults::managerSignature());
    m_rules.managerLabel = detection.readEntry(QLatin1String("ManagerLabel"), ConfigDefaults::managerLabel());
    m_rules.companionExecutables =
        readCleanList(detection, "CompanionExecutables", ConfigDefaults::companionExecutables());
    m_serviceExecutables = readCleanList(detection, "ServiceExecutables", ConfigDefaults::serviceExecutables());

    m_pickTimeoutSeconds =
        readValidatedInt(picker, "PickTimeout", ConfigDefaults::pickTimeout(), Defaults::MinPickTimeoutSeconds,
                         Defaults::MaxPickTimeoutSeconds, "pick timeout");

    qCDebug(lcConfig) << "Loaded settings: autoAttach" << m_autoAttach << "manager" << m_autoAttachManager
                      << "external" << m_autoAttachExternal << "interval" << m_refreshIntervalSeconds << "s";

    Q_EMIT settingsChanged();
}

void Settings::save()
{
    auto config = KSharedConfig::openConfig(ConfigFile);
    KConfigGroup general = config->group(GeneralGroup);
    KConfigGroup detection = config->group(DetectionGroup);
    KConfigGroup picker = config->group(PickerGroup);

    general.writeEntry(QLatin1String("AutoAttach"), m_autoAttach);
    general.writeEntry(QLatin1String("AutoAttachManager"), m_autoAttachManager);
    general.writeEntry(QLatin1String("AutoAttachExternal"), m_autoAttachExternal);
    general.writeEntry(QLatin1String("RefreshInterval"), m_refreshIntervalSeconds);
    general.writeEntry(QLatin1String("ApplicationPath"), m_applicationPath);

    detection.writeEntry(QLatin1String("ApplicationName"), m_rules.applicationName);
    detection.writeEntry(QLatin1String("RunningMarkers"), m_rules.runningMarkers);
    detection.writeEntry(QLatin1String("ManagerSignature"), m_rules.managerSignature);
    detection.writeEntry(QLatin1String("ManagerLabel"), m_rules.managerLabel);
    detection.writeEntry(QLatin1String("CompanionExecutables"), m_rules.companionExecutables);
    detection.writeEntry(QLatin1String("ServiceExecutables"), m_serviceExecutables);

    picker.writeEntry(QLatin1String("PickTimeout"), m_pickTimeoutSeconds);

    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFile;
    }
}

void Settings::reset()
{
    // Drop every group; load() falls back to ConfigDefaults for missing keys
    auto config = KSharedConfig::openConfig(ConfigFile);
    for (const QString& group : {GeneralGroup, DetectionGroup, PickerGroup}) {
        config->deleteGroup(group);
    }
    if (!config->sync()) {
        qCWarning(lcConfig) << "Failed to write" << ConfigFile;
    }

    load();

    Q_EMIT autoAttachChanged();
    Q_EMIT refreshIntervalChanged();
    Q_EMIT applicationPathChanged();
    Q_EMIT classificationRulesChanged();
    Q_EMIT serviceExecutablesChanged();
    Q_EMIT pickTimeoutChanged();
}

} // namespace TabNest
