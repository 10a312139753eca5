// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "appcontroller.h"
#include "mainwindow.h"
#include "../config/settings.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/nativewindowcontroller.h"
#include "../core/platform.h"
#include "../core/poller.h"
#include "../core/processcontroller.h"
#include "../core/tabregistry.h"
#include "../core/windowdirectory.h"
#include "../core/windowpicker.h"
#include "../dbus/tabsadaptor.h"
#include "../platform/xcbwindowsystem.h"
#include <QDBusConnection>
#include <QDBusError>

namespace TabNest {

AppController::AppController(QObject* parent)
    : QObject(parent)
    , m_settings(std::make_unique<Settings>())
    , m_processes(std::make_unique<ProcessController>())
{
}

AppController::~AppController()
{
    stop();

    // The registry restores windows through the controller and releases
    // surfaces of the main window; both must outlive it
    m_registry.reset();
}

bool AppController::init()
{
    if (!Platform::supportsEmbedding()) {
        qCCritical(lcApp) << "Window embedding needs the xcb platform, running on" << Platform::describe();
        return false;
    }

    m_windowSystem = XcbWindowSystem::fromApplication();
    if (!m_windowSystem) {
        return false;
    }

    m_directory =
        std::make_unique<WindowDirectory>(m_windowSystem.get(), m_processes.get(), m_settings->classificationRules());
    m_controller = std::make_unique<NativeWindowController>(m_windowSystem.get());
    m_mainWindow = std::make_unique<MainWindow>(m_settings.get());

    Settings* settings = m_settings.get();
    m_registry = std::make_unique<TabRegistry>(
        m_directory.get(), m_controller.get(), m_processes.get(), m_mainWindow.get(),
        [settings](WindowCategory category) {
            return settings->categoryAutoAttachEnabled(category);
        });

    m_poller = new Poller(m_registry.get(), this);
    m_poller->setIntervalSeconds(m_settings->refreshIntervalSeconds());
    m_picker = new WindowPicker(m_windowSystem.get(), this);

    m_mainWindow->setServices(m_registry.get(), m_poller, m_picker, m_directory.get(), m_processes.get());

    // Live-apply settings
    connect(m_settings.get(), &ISettings::refreshIntervalChanged, this, [this]() {
        m_poller->setIntervalSeconds(m_settings->refreshIntervalSeconds());
    });
    connect(m_settings.get(), &ISettings::classificationRulesChanged, this, [this]() {
        m_directory->setRules(m_settings->classificationRules());
    });
    connect(m_settings.get(), &ISettings::autoAttachChanged, this, [this]() {
        m_poller->refresh();
    });

    m_tabsAdaptor = new TabsAdaptor(m_registry.get(), m_poller, this);
    if (!registerDBus()) {
        // Not fatal: the container works without remote control
        qCWarning(lcApp) << "Continuing without the D-Bus control interface";
    }

    qCInfo(lcApp) << "Initialized on" << Platform::describe();
    return true;
}

bool AppController::registerDBus()
{
    auto bus = QDBusConnection::sessionBus();
    if (!bus.isConnected()) {
        qCWarning(lcDbus) << "Cannot connect to the session D-Bus";
        return false;
    }
    if (!bus.registerObject(QString(DBus::ObjectPath), this)) {
        qCWarning(lcDbus) << "Failed to register D-Bus object:" << DBus::ObjectPath
                          << "Error:" << bus.lastError().message();
        return false;
    }
    qCInfo(lcDbus) << "D-Bus object registered service=" << DBus::ServiceName << "path=" << DBus::ObjectPath;
    return true;
}

void AppController::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    m_mainWindow->show();
    m_poller->trigger(ReconcileTrigger::Automatic);
    m_poller->start();
}

void AppController::stop()
{
    if (!m_running) {
        return;
    }

    m_picker->cancel();
    m_poller->stop();
    m_registry->shutdown();
    m_settings->save();

    QDBusConnection::sessionBus().unregisterObject(QString(DBus::ObjectPath));

    m_running = false;
}

void AppController::activate()
{
    qCDebug(lcApp) << "Activated by another launch, refreshing";
    if (m_mainWindow) {
        m_mainWindow->show();
        m_mainWindow->raise();
        m_mainWindow->activateWindow();
    }
    if (m_poller) {
        m_poller->refresh();
    }
}

} // namespace TabNest
