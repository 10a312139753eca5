// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "../core/types.h"
#include <QDBusAbstractAdaptor>
#include <QObject>
#include <QString>
#include <optional>

namespace TabNest {

class TabRegistry;
class Poller;

/**
 * @brief D-Bus adaptor controlling the tab container
 *
 * Provides D-Bus interface: org.tabnest.Tabs at /Tabs
 * Window identities travel as strings ("0x3a00007" or decimal).
 *
 * NOTE: Interface name must match the DBus::Interface constant.
 */
class TABNEST_EXPORT TabsAdaptor : public QDBusAbstractAdaptor
{
    Q_OBJECT
    Q_CLASSINFO("D-Bus Interface", "org.tabnest.Tabs")

public:
    TabsAdaptor(TabRegistry* registry, Poller* poller, QObject* parent);
    ~TabsAdaptor() override = default;

public Q_SLOTS:
    // Reconciliation
    void refresh();
    void attachAll();

    // Per-tab actions
    bool attach(const QString& windowId);
    bool detach(const QString& windowId);
    bool closeTab(const QString& windowId);
    bool renameTab(const QString& windowId, const QString& title);

    // Queries
    QString getTabs();
    int getTabCount();

Q_SIGNALS:
    void tabsChanged();

private:
    std::optional<WindowId> parseId(const QString& windowId, const char* operation) const;

    TabRegistry* m_registry = nullptr;
    Poller* m_poller = nullptr;
};

} // namespace TabNest
