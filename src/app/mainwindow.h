// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/interfaces.h"
#include <QHash>
#include <QMainWindow>

class QAction;
class QTabWidget;

namespace TabNest {

class HostSurface;
class Poller;
class TabRegistry;
class WindowDirectory;
class WindowPicker;

/**
 * @brief Tabbed container window
 *
 * Provides one HostSurface per tab to the TabRegistry and turns user input
 * (toolbar, tab context menu, middle click, drag and drop) into registry
 * operations. Holds no tab state of its own beyond the surface widgets.
 */
class MainWindow : public QMainWindow, public IHostSurfaceProvider
{
    Q_OBJECT

public:
    explicit MainWindow(ISettings* settings, QWidget* parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Wire the window to the embedding core
     *
     * Called once by AppController after the registry exists (the registry
     * itself needs this window as its host surface provider).
     */
    void setServices(TabRegistry* registry, Poller* poller, WindowPicker* picker, WindowDirectory* directory,
                     const IProcessController* processes);

    // IHostSurfaceProvider
    WindowId createHostSurface(WindowId window, const QString& title) override;
    QSize hostSurfaceSize(WindowId surface) const override;
    void releaseHostSurface(WindowId surface) override;

protected:
    void closeEvent(QCloseEvent* event) override;
    void dragEnterEvent(QDragEnterEvent* event) override;
    void dropEvent(QDropEvent* event) override;
    bool eventFilter(QObject* watched, QEvent* event) override;

private Q_SLOTS:
    void onTabStateChanged(WindowId window, TabNest::AttachState state);
    void onTabTitleChanged(WindowId window, const QString& title);
    void onAttachFailed(WindowId window, TabNest::EmbedError error);
    void onWindowClicked(const QPoint& point);
    void showTabContextMenu(const QPoint& pos);

private:
    void setupActions();
    void setupMenus();
    void updateActions();
    void updateStatus();

    HostSurface* surfaceAt(int index) const;
    HostSurface* surfaceFor(WindowId window) const;
    WindowId currentWindow() const;

    void renameWindow(WindowId window);
    void closeWindow(WindowId window);
    void closeAll();
    void startPick();
    void pickFromList();
    void openApplication();
    void editRefreshInterval();
    void editApplicationPath();

    ISettings* m_settings = nullptr;
    TabRegistry* m_registry = nullptr;
    Poller* m_poller = nullptr;
    WindowPicker* m_picker = nullptr;
    WindowDirectory* m_directory = nullptr;
    const IProcessController* m_processes = nullptr;

    QTabWidget* m_tabs = nullptr;
    QHash<WindowId, HostSurface*> m_surfaces; // keyed by surface native id

    QAction* m_refreshAction = nullptr;
    QAction* m_attachAllAction = nullptr;
    QAction* m_attachAction = nullptr;
    QAction* m_detachAction = nullptr;
    QAction* m_renameAction = nullptr;
    QAction* m_releaseAction = nullptr;
    QAction* m_closeWindowAction = nullptr;
    QAction* m_closeAllAction = nullptr;
    QAction* m_pickAction = nullptr;
    QAction* m_pickListAction = nullptr;
    QAction* m_cancelPickAction = nullptr;
    QAction* m_openApplicationAction = nullptr;
    QAction* m_autoAttachAction = nullptr;
    QAction* m_autoAttachManagerAction = nullptr;
    QAction* m_autoAttachExternalAction = nullptr;
    QAction* m_refreshIntervalAction = nullptr;
    QAction* m_applicationPathAction = nullptr;
    QAction* m_quitAction = nullptr;
};

} // namespace TabNest
