// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <QObject>
#include <memory>

namespace TabNest {

class MainWindow;
class NativeWindowController;
class Poller;
class ProcessController;
class Settings;
class TabRegistry;
class TabsAdaptor;
class WindowDirectory;
class WindowPicker;
class XcbWindowSystem;

/**
 * @brief Owns and wires every TabNest component
 *
 * Construction order follows the dependencies: settings, platform backend,
 * core services, main window (the host surface provider), registry, then
 * the poll driver and the D-Bus surface.
 *
 * Note: This class does NOT use the singleton pattern. main() owns the
 * only instance.
 */
class AppController : public QObject
{
    Q_OBJECT

public:
    explicit AppController(QObject* parent = nullptr);
    ~AppController() override;

    bool init();
    void start();
    void stop();

    TabRegistry* registry() const
    {
        return m_registry.get();
    }
    Poller* poller() const
    {
        return m_poller;
    }

public Q_SLOTS:
    /**
     * @brief A second launch was redirected to this instance
     */
    void activate();

private:
    bool registerDBus();

    std::unique_ptr<Settings> m_settings;
    std::unique_ptr<XcbWindowSystem> m_windowSystem;
    std::unique_ptr<ProcessController> m_processes;
    std::unique_ptr<WindowDirectory> m_directory;
    std::unique_ptr<NativeWindowController> m_controller;
    std::unique_ptr<MainWindow> m_mainWindow;
    std::unique_ptr<TabRegistry> m_registry;

    // QObject children of this controller
    Poller* m_poller = nullptr;
    WindowPicker* m_picker = nullptr;
    TabsAdaptor* m_tabsAdaptor = nullptr;

    bool m_running = false;
};

} // namespace TabNest
