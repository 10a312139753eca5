// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tabsadaptor.h"
#include "../core/logging.h"
#include "../core/poller.h"
#include "../core/tab.h"
#include "../core/tabregistry.h"
#include "../core/utils.h"
#include <QJsonArray>
#include <QJsonDocument>

namespace TabNest {

TabsAdaptor::TabsAdaptor(TabRegistry* registry, Poller* poller, QObject* parent)
    : QDBusAbstractAdaptor(parent)
    , m_registry(registry)
    , m_poller(poller)
{
    Q_ASSERT(registry);
    Q_ASSERT(poller);

    // Coalesce all registry notifications into one signal for D-Bus clients
    connect(m_registry, &TabRegistry::tabAdded, this, &TabsAdaptor::tabsChanged);
    connect(m_registry, &TabRegistry::tabRemoved, this, &TabsAdaptor::tabsChanged);
    connect(m_registry, &TabRegistry::tabStateChanged, this, &TabsAdaptor::tabsChanged);
    connect(m_registry, &TabRegistry::tabTitleChanged, this, &TabsAdaptor::tabsChanged);
}

std::optional<WindowId> TabsAdaptor::parseId(const QString& windowId, const char* operation) const
{
    const std::optional<WindowId> window = Utils::parseWindowId(windowId);
    if (!window) {
        qCWarning(lcDbus) << operation << "- invalid window id:" << windowId;
        return std::nullopt;
    }
    if (!m_registry->isTracked(*window)) {
        qCWarning(lcDbus) << operation << "- no tab for window" << windowId;
        return std::nullopt;
    }
    return window;
}

void TabsAdaptor::refresh()
{
    qCDebug(lcDbus) << "refresh requested";
    m_poller->refresh();
}

void TabsAdaptor::attachAll()
{
    qCDebug(lcDbus) << "attachAll requested";
    m_poller->attachAll();
}

bool TabsAdaptor::attach(const QString& windowId)
{
    const auto window = parseId(windowId, "attach");
    return window && m_registry->attach(*window);
}

bool TabsAdaptor::detach(const QString& windowId)
{
    const auto window = parseId(windowId, "detach");
    return window && m_registry->detach(*window);
}

bool TabsAdaptor::closeTab(const QString& windowId)
{
    const auto window = parseId(windowId, "closeTab");
    return window && m_registry->closeTab(*window);
}

bool TabsAdaptor::renameTab(const QString& windowId, const QString& title)
{
    const auto window = parseId(windowId, "renameTab");
    return window && m_registry->renameTab(*window, title);
}

QString TabsAdaptor::getTabs()
{
    QJsonArray tabs;
    for (const Tab* tab : m_registry->tabs()) {
        tabs.append(tab->toJson());
    }
    return QString::fromUtf8(QJsonDocument(tabs).toJson(QJsonDocument::Compact));
}

int TabsAdaptor::getTabCount()
{
    return m_registry->count();
}

} // namespace TabNest
