// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include "../core/constants.h"
#include <KConfigGroup>

namespace TabNest {

/**
 * @brief Persistent settings for TabNest
 *
 * Implements the ISettings interface on top of KConfig (tabnestrc).
 * Defaults come from tabnest.kcfg through ConfigDefaults; out-of-range
 * values found on load are replaced by the default with a warning.
 *
 * Note: This class does NOT use the singleton pattern. Create instances
 * where needed and pass via dependency injection.
 */
class TABNEST_EXPORT Settings : public ISettings
{
    Q_OBJECT

    Q_PROPERTY(bool autoAttach READ autoAttach WRITE setAutoAttach NOTIFY autoAttachChanged)
    Q_PROPERTY(bool autoAttachManager READ autoAttachManager WRITE setAutoAttachManager NOTIFY autoAttachChanged)
    Q_PROPERTY(bool autoAttachExternal READ autoAttachExternal WRITE setAutoAttachExternal NOTIFY autoAttachChanged)
    Q_PROPERTY(int refreshIntervalSeconds READ refreshIntervalSeconds WRITE setRefreshIntervalSeconds NOTIFY
                   refreshIntervalChanged)
    Q_PROPERTY(QString applicationPath READ applicationPath WRITE setApplicationPath NOTIFY applicationPathChanged)
    Q_PROPERTY(QStringList serviceExecutables READ serviceExecutables WRITE setServiceExecutables NOTIFY
                   serviceExecutablesChanged)
    Q_PROPERTY(int pickTimeoutSeconds READ pickTimeoutSeconds WRITE setPickTimeoutSeconds NOTIFY pickTimeoutChanged)

public:
    explicit Settings(QObject* parent = nullptr);
    ~Settings() override = default;

    // General
    bool autoAttach() const override
    {
        return m_autoAttach;
    }
    void setAutoAttach(bool enable) override;
    bool autoAttachManager() const override
    {
        return m_autoAttachManager;
    }
    void setAutoAttachManager(bool enable) override;
    bool autoAttachExternal() const override
    {
        return m_autoAttachExternal;
    }
    void setAutoAttachExternal(bool enable) override;
    int refreshIntervalSeconds() const override
    {
        return m_refreshIntervalSeconds;
    }
    void setRefreshIntervalSeconds(int seconds) override;
    QString applicationPath() const override
    {
        return m_applicationPath;
    }
    void setApplicationPath(const QString& path) override;

    // Detection
    ClassificationRules classificationRules() const override
    {
        return m_rules;
    }
    void setClassificationRules(const ClassificationRules& rules) override;
    QStringList serviceExecutables() const override
    {
        return m_serviceExecutables;
    }
    void setServiceExecutables(const QStringList& executables) override;

    // Picker
    int pickTimeoutSeconds() const override
    {
        return m_pickTimeoutSeconds;
    }
    void setPickTimeoutSeconds(int seconds) override;

    bool categoryAutoAttachEnabled(WindowCategory category) const override;

    // Persistence
    void load() override;
    void save() override;
    void reset() override;

private:
    static int readValidatedInt(const KConfigGroup& group, const char* key, int defaultValue, int min, int max,
                                const char* settingName);
    static QStringList readCleanList(const KConfigGroup& group, const char* key, const QStringList& defaultValue);

    // General
    bool m_autoAttach = true;
    bool m_autoAttachManager = false;
    bool m_autoAttachExternal = true;
    int m_refreshIntervalSeconds = 5;
    QString m_applicationPath;

    // Detection
    ClassificationRules m_rules;
    QStringList m_serviceExecutables;

    // Picker
    int m_pickTimeoutSeconds = 30;
};

} // namespace TabNest
