// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "mainwindow.h"
#include "hostsurface.h"
#include "windowlistdialog.h"
#include "../core/constants.h"
#include "../core/logging.h"
#include "../core/poller.h"
#include "../core/tab.h"
#include "../core/tabregistry.h"
#include "../core/utils.h"
#include "../core/windowdirectory.h"
#include "../core/windowpicker.h"
#include <KLocalizedString>
#include <QAction>
#include <QApplication>
#include <QCloseEvent>
#include <QDragEnterEvent>
#include <QDropEvent>
#include <QIcon>
#include <QInputDialog>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QMouseEvent>
#include <QProcess>
#include <QShortcut>
#include <QStatusBar>
#include <QTabBar>
#include <QTabWidget>
#include <QTimer>
#include <QToolBar>

namespace TabNest {

namespace {
constexpr int StatusMessageMs = 5000;
// Give a freshly launched application time to map its first window
constexpr int LaunchRefreshDelayMs = 3000;
}

MainWindow::MainWindow(ISettings* settings, QWidget* parent)
    : QMainWindow(parent)
    , m_settings(settings)
{
    Q_ASSERT(settings);

    setWindowTitle(i18n("TabNest"));
    setAcceptDrops(true);
    resize(1024, 768);

    m_tabs = new QTabWidget(this);
    m_tabs->setDocumentMode(true);
    m_tabs->setMovable(true);
    m_tabs->setTabsClosable(true);
    m_tabs->tabBar()->setContextMenuPolicy(Qt::CustomContextMenu);
    m_tabs->tabBar()->installEventFilter(this);
    setCentralWidget(m_tabs);

    setupActions();
    setupMenus();

    connect(m_tabs, &QTabWidget::currentChanged, this, &MainWindow::updateActions);
    connect(m_tabs, &QTabWidget::tabCloseRequested, this, [this](int index) {
        if (const HostSurface* surface = surfaceAt(index)) {
            closeWindow(surface->embeddedWindow());
        }
    });
    connect(m_tabs->tabBar(), &QWidget::customContextMenuRequested, this, &MainWindow::showTabContextMenu);

    updateActions();
    updateStatus();
}

MainWindow::~MainWindow() = default;

void MainWindow::setServices(TabRegistry* registry, Poller* poller, WindowPicker* picker, WindowDirectory* directory,
                             const IProcessController* processes)
{
    m_registry = registry;
    m_poller = poller;
    m_picker = picker;
    m_directory = directory;
    m_processes = processes;

    connect(m_registry, &TabRegistry::tabAdded, this, &MainWindow::updateStatus);
    connect(m_registry, &TabRegistry::tabRemoved, this, &MainWindow::updateStatus);
    connect(m_registry, &TabRegistry::tabStateChanged, this, &MainWindow::onTabStateChanged);
    connect(m_registry, &TabRegistry::tabTitleChanged, this, &MainWindow::onTabTitleChanged);
    connect(m_registry, &TabRegistry::attachFailed, this, &MainWindow::onAttachFailed);
    connect(m_registry, &TabRegistry::enumerationFailed, this, [this]() {
        statusBar()->showMessage(i18n("Could not list the desktop windows"), StatusMessageMs);
    });

    connect(m_picker, &WindowPicker::clicked, this, &MainWindow::onWindowClicked);
    connect(m_picker, &WindowPicker::cancelled, this, [this]() {
        statusBar()->showMessage(i18n("Window picking cancelled"), StatusMessageMs);
        updateActions();
    });
    connect(m_picker, &WindowPicker::timedOut, this, [this]() {
        statusBar()->showMessage(i18n("No window was clicked in time"), StatusMessageMs);
        updateActions();
    });

    updateActions();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Actions and menus
// ═══════════════════════════════════════════════════════════════════════════════

void MainWindow::setupActions()
{
    auto makeAction = [this](const QString& icon, const QString& text, auto slot) {
        auto* action = new QAction(QIcon::fromTheme(icon), text, this);
        connect(action, &QAction::triggered, this, slot);
        return action;
    };

    m_refreshAction = makeAction(QStringLiteral("view-refresh"), i18n("Refresh"), [this]() {
        m_poller->refresh();
    });
    m_refreshAction->setShortcut(QKeySequence::Refresh);

    m_attachAllAction = makeAction(QStringLiteral("window-duplicate"), i18n("Attach All"), [this]() {
        m_poller->attachAll();
    });

    m_attachAction = makeAction(QStringLiteral("window-pin"), i18n("Attach"), [this]() {
        m_registry->attach(currentWindow());
    });
    m_detachAction = makeAction(QStringLiteral("window-unpin"), i18n("Detach"), [this]() {
        m_registry->detach(currentWindow());
    });
    m_renameAction = makeAction(QStringLiteral("edit-rename"), i18n("Rename Tab…"), [this]() {
        renameWindow(currentWindow());
    });
    m_renameAction->setShortcut(Qt::Key_F2);
    m_releaseAction = makeAction(QStringLiteral("tab-detach"), i18n("Release Window"), [this]() {
        m_registry->removeTab(currentWindow());
    });
    m_closeWindowAction = makeAction(QStringLiteral("window-close"), i18n("Close Window"), [this]() {
        closeWindow(currentWindow());
    });
    m_closeAllAction = makeAction(QStringLiteral("edit-clear-all"), i18n("Close All…"), [this]() {
        closeAll();
    });

    m_pickAction = makeAction(QStringLiteral("crosshairs"), i18n("Pick Window by Click"), [this]() {
        startPick();
    });
    m_pickListAction = makeAction(QStringLiteral("view-list-details"), i18n("Pick Window from List…"), [this]() {
        pickFromList();
    });
    m_cancelPickAction = makeAction(QStringLiteral("dialog-cancel"), i18n("Cancel Picking"), [this]() {
        m_picker->cancel();
    });
    m_openApplicationAction = makeAction(QStringLiteral("system-run"), i18n("Open Application"), [this]() {
        openApplication();
    });

    m_autoAttachAction = makeAction(QString(), i18n("Attach Running Instances Automatically"), [this](bool checked) {
        m_settings->setAutoAttach(checked);
        m_settings->save();
    });
    m_autoAttachManagerAction = makeAction(QString(), i18n("Attach Manager Window Automatically"), [this](bool checked) {
        m_settings->setAutoAttachManager(checked);
        m_settings->save();
    });
    m_autoAttachExternalAction =
        makeAction(QString(), i18n("Attach Companion Windows Automatically"), [this](bool checked) {
            m_settings->setAutoAttachExternal(checked);
            m_settings->save();
        });
    for (QAction* action : {m_autoAttachAction, m_autoAttachManagerAction, m_autoAttachExternalAction}) {
        action->setCheckable(true);
    }
    m_autoAttachAction->setChecked(m_settings->autoAttach());
    m_autoAttachManagerAction->setChecked(m_settings->autoAttachManager());
    m_autoAttachExternalAction->setChecked(m_settings->autoAttachExternal());
    connect(m_settings, &ISettings::autoAttachChanged, this, [this]() {
        m_autoAttachAction->setChecked(m_settings->autoAttach());
        m_autoAttachManagerAction->setChecked(m_settings->autoAttachManager());
        m_autoAttachExternalAction->setChecked(m_settings->autoAttachExternal());
    });

    m_refreshIntervalAction = makeAction(QStringLiteral("chronometer"), i18n("Refresh Interval…"), [this]() {
        editRefreshInterval();
    });
    m_applicationPathAction = makeAction(QStringLiteral("document-open"), i18n("Application Path…"), [this]() {
        editApplicationPath();
    });
    m_quitAction = makeAction(QStringLiteral("application-exit"), i18n("Quit"), [this]() {
        close();
    });
    m_quitAction->setShortcut(QKeySequence::Quit);

    auto* escape = new QShortcut(QKeySequence(Qt::Key_Escape), this);
    connect(escape, &QShortcut::activated, this, [this]() {
        if (m_picker && m_picker->isActive()) {
            m_picker->cancel();
        }
    });
}

void MainWindow::setupMenus()
{
    QMenu* fileMenu = menuBar()->addMenu(i18n("&File"));
    fileMenu->addAction(m_openApplicationAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_closeAllAction);
    fileMenu->addSeparator();
    fileMenu->addAction(m_quitAction);

    QMenu* windowMenu = menuBar()->addMenu(i18n("&Window"));
    windowMenu->addAction(m_refreshAction);
    windowMenu->addAction(m_attachAllAction);
    windowMenu->addSeparator();
    windowMenu->addAction(m_attachAction);
    windowMenu->addAction(m_detachAction);
    windowMenu->addAction(m_renameAction);
    windowMenu->addAction(m_releaseAction);
    windowMenu->addAction(m_closeWindowAction);
    windowMenu->addSeparator();
    windowMenu->addAction(m_pickAction);
    windowMenu->addAction(m_pickListAction);
    windowMenu->addAction(m_cancelPickAction);

    QMenu* settingsMenu = menuBar()->addMenu(i18n("&Settings"));
    settingsMenu->addAction(m_autoAttachAction);
    settingsMenu->addAction(m_autoAttachManagerAction);
    settingsMenu->addAction(m_autoAttachExternalAction);
    settingsMenu->addSeparator();
    settingsMenu->addAction(m_refreshIntervalAction);
    settingsMenu->addAction(m_applicationPathAction);

    QToolBar* toolBar = addToolBar(i18n("Main Toolbar"));
    toolBar->setObjectName(QStringLiteral("mainToolBar"));
    toolBar->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    toolBar->addAction(m_refreshAction);
    toolBar->addAction(m_attachAllAction);
    toolBar->addSeparator();
    toolBar->addAction(m_detachAction);
    toolBar->addAction(m_closeWindowAction);
    toolBar->addSeparator();
    toolBar->addAction(m_pickAction);
    toolBar->addAction(m_pickListAction);
    toolBar->addSeparator();
    toolBar->addAction(m_openApplicationAction);
    toolBar->addAction(m_closeAllAction);
}

void MainWindow::updateActions()
{
    const bool ready = m_registry != nullptr;
    const Tab* tab = ready ? m_registry->tab(currentWindow()) : nullptr;
    const bool picking = m_picker && m_picker->isActive();

    m_refreshAction->setEnabled(ready);
    m_attachAllAction->setEnabled(ready);
    m_attachAction->setEnabled(tab && !tab->handle().isAttached());
    m_detachAction->setEnabled(tab && tab->handle().isAttached());
    m_renameAction->setEnabled(tab != nullptr);
    m_releaseAction->setEnabled(tab != nullptr);
    m_closeWindowAction->setEnabled(tab != nullptr);
    m_closeAllAction->setEnabled(ready && m_registry->count() > 0);
    m_pickAction->setEnabled(ready && !picking);
    m_pickListAction->setEnabled(ready && !picking);
    m_cancelPickAction->setEnabled(picking);
}

void MainWindow::updateStatus()
{
    const int count = m_registry ? m_registry->count() : 0;
    statusBar()->showMessage(i18np("%1 window", "%1 windows", count));
    updateActions();
}

// ═══════════════════════════════════════════════════════════════════════════════
// IHostSurfaceProvider
// ═══════════════════════════════════════════════════════════════════════════════

WindowId MainWindow::createHostSurface(WindowId window, const QString& title)
{
    auto* surface = new HostSurface(window, m_tabs);
    const WindowId id = surface->winId();
    if (id == NoWindow) {
        qCWarning(lcApp) << "Failed to create a native host surface";
        delete surface;
        return NoWindow;
    }

    connect(surface, &HostSurface::resized, this, [this](WindowId embedded, const QSize& size) {
        if (m_registry) {
            m_registry->hostSurfaceResized(embedded, size);
        }
    });
    connect(surface, &HostSurface::attachRequested, this, [this](WindowId embedded) {
        m_registry->attach(embedded);
    });

    m_surfaces.insert(id, surface);
    const int index = m_tabs->addTab(surface, title);
    m_tabs->setTabToolTip(index, attachStateName(AttachState::Detached));
    return id;
}

QSize MainWindow::hostSurfaceSize(WindowId surfaceId) const
{
    const HostSurface* surface = m_surfaces.value(surfaceId);
    if (!surface) {
        return QSize();
    }

    // A page that was never shown has no layout yet; all pages share the
    // geometry of the visible one
    const QWidget* current = m_tabs->currentWidget();
    if (current && current != surface && !surface->isVisible()) {
        const qreal ratio = current->devicePixelRatioF();
        return QSize(qRound(current->width() * ratio), qRound(current->height() * ratio));
    }
    return surface->nativeSize();
}

void MainWindow::releaseHostSurface(WindowId surfaceId)
{
    HostSurface* surface = m_surfaces.take(surfaceId);
    if (!surface) {
        return;
    }
    const int index = m_tabs->indexOf(surface);
    if (index >= 0) {
        m_tabs->removeTab(index);
    }
    surface->deleteLater();
    updateActions();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Registry notifications
// ═══════════════════════════════════════════════════════════════════════════════

void MainWindow::onTabStateChanged(WindowId window, AttachState state)
{
    HostSurface* surface = surfaceFor(window);
    if (!surface) {
        return;
    }
    surface->setAttachState(state);
    m_tabs->setTabToolTip(m_tabs->indexOf(surface), attachStateName(state));
    updateActions();
}

void MainWindow::onTabTitleChanged(WindowId window, const QString& title)
{
    if (HostSurface* surface = surfaceFor(window)) {
        m_tabs->setTabText(m_tabs->indexOf(surface), title);
    }
}

void MainWindow::onAttachFailed(WindowId window, EmbedError error)
{
    const Tab* tab = m_registry->tab(window);
    const QString title = tab ? tab->title() : Utils::windowIdToString(window);
    qCDebug(lcApp) << "Attach failed for" << title << embedErrorName(error);
    statusBar()->showMessage(i18n("Could not attach \"%1\"", title), StatusMessageMs);
}

void MainWindow::onWindowClicked(const QPoint& point)
{
    updateActions();

    const std::optional<ClassifiedWindow> picked = m_registry->pickWindowAt(point);
    if (!picked) {
        statusBar()->showMessage(i18n("There is no window that can be attached at that point"), StatusMessageMs);
        return;
    }
    if (m_registry->addPickedWindow(*picked)) {
        statusBar()->showMessage(i18n("Attached \"%1\"", picked->derivedTitle), StatusMessageMs);
        if (HostSurface* surface = surfaceFor(picked->identity)) {
            m_tabs->setCurrentWidget(surface);
        }
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Tab bar interaction
// ═══════════════════════════════════════════════════════════════════════════════

void MainWindow::showTabContextMenu(const QPoint& pos)
{
    const int index = m_tabs->tabBar()->tabAt(pos);
    const HostSurface* surface = surfaceAt(index);
    if (!surface || !m_registry) {
        return;
    }
    const WindowId window = surface->embeddedWindow();
    const Tab* tab = m_registry->tab(window);
    if (!tab) {
        return;
    }

    QMenu menu(this);
    menu.addAction(QIcon::fromTheme(QStringLiteral("edit-rename")), i18n("Rename…"), this, [this, window]() {
        renameWindow(window);
    });
    menu.addSeparator();
    QAction* attach = menu.addAction(QIcon::fromTheme(QStringLiteral("window-pin")), i18n("Attach"), this,
                                     [this, window]() {
                                         m_registry->attach(window);
                                     });
    attach->setEnabled(!tab->handle().isAttached());
    QAction* detach = menu.addAction(QIcon::fromTheme(QStringLiteral("window-unpin")), i18n("Detach"), this,
                                     [this, window]() {
                                         m_registry->detach(window);
                                     });
    detach->setEnabled(tab->handle().isAttached());
    menu.addAction(QIcon::fromTheme(QStringLiteral("tab-detach")), i18n("Release Window"), this, [this, window]() {
        m_registry->removeTab(window);
    });
    menu.addSeparator();
    menu.addAction(QIcon::fromTheme(QStringLiteral("window-close")), i18n("Close Window"), this, [this, window]() {
        closeWindow(window);
    });

    menu.exec(m_tabs->tabBar()->mapToGlobal(pos));
}

bool MainWindow::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_tabs->tabBar() && event->type() == QEvent::MouseButtonRelease) {
        auto* mouseEvent = static_cast<QMouseEvent*>(event);
        if (mouseEvent->button() == Qt::MiddleButton) {
            if (const HostSurface* surface = surfaceAt(m_tabs->tabBar()->tabAt(mouseEvent->position().toPoint()))) {
                closeWindow(surface->embeddedWindow());
                return true;
            }
        }
    }
    return QMainWindow::eventFilter(watched, event);
}

void MainWindow::dragEnterEvent(QDragEnterEvent* event)
{
    event->acceptProposedAction();
}

void MainWindow::dropEvent(QDropEvent* event)
{
    event->acceptProposedAction();
    if (m_poller) {
        m_poller->refresh();
    }
}

void MainWindow::closeEvent(QCloseEvent* event)
{
    // Hand every embedded window back to the desktop while the host
    // surfaces still exist
    if (m_picker) {
        m_picker->cancel();
    }
    if (m_poller) {
        m_poller->stop();
    }
    if (m_registry) {
        m_registry->shutdown();
    }
    QMainWindow::closeEvent(event);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Helpers
// ═══════════════════════════════════════════════════════════════════════════════

HostSurface* MainWindow::surfaceAt(int index) const
{
    return index >= 0 ? qobject_cast<HostSurface*>(m_tabs->widget(index)) : nullptr;
}

HostSurface* MainWindow::surfaceFor(WindowId window) const
{
    for (HostSurface* surface : m_surfaces) {
        if (surface->embeddedWindow() == window) {
            return surface;
        }
    }
    return nullptr;
}

WindowId MainWindow::currentWindow() const
{
    const HostSurface* surface = surfaceAt(m_tabs->currentIndex());
    return surface ? surface->embeddedWindow() : NoWindow;
}

void MainWindow::renameWindow(WindowId window)
{
    const Tab* tab = m_registry->tab(window);
    if (!tab) {
        return;
    }
    bool ok = false;
    const QString title = QInputDialog::getText(this, i18n("Rename Tab"), i18n("Tab title:"), QLineEdit::Normal,
                                                tab->title(), &ok);
    if (ok) {
        m_registry->renameTab(window, title);
    }
}

void MainWindow::closeWindow(WindowId window)
{
    const Tab* tab = m_registry->tab(window);
    if (!tab) {
        return;
    }
    const QString title = tab->title();
    if (!m_registry->closeTab(window)) {
        statusBar()->showMessage(i18n("Could not terminate \"%1\"; the tab was removed", title), StatusMessageMs);
    }
}

void MainWindow::closeAll()
{
    const int count = m_registry->count();
    if (count == 0) {
        return;
    }
    const auto answer = QMessageBox::question(
        this, i18n("Close All"),
        i18np("Terminate the process of %1 window and the background services?",
              "Terminate the processes of %1 windows and the background services?", count));
    if (answer != QMessageBox::Yes) {
        return;
    }

    const int terminated = m_registry->closeAllTabs(m_settings->serviceExecutables());
    statusBar()->showMessage(i18np("Terminated %1 process", "Terminated %1 processes", terminated),
                             StatusMessageMs);
}

void MainWindow::startPick()
{
    m_picker->start(m_settings->pickTimeoutSeconds());
    statusBar()->showMessage(i18n("Click on the window to attach (Escape cancels)"));
    updateActions();
}

void MainWindow::pickFromList()
{
    WindowListDialog dialog(m_directory->pickableWindows(), m_processes, this);
    if (dialog.exec() != QDialog::Accepted) {
        return;
    }
    const std::optional<ClassifiedWindow> picked = dialog.selectedWindow();
    if (!picked) {
        return;
    }
    // Re-resolve: the window may have gone while the dialog was open
    const std::optional<ClassifiedWindow> current = m_directory->pickWindow(picked->identity);
    if (!current) {
        statusBar()->showMessage(i18n("\"%1\" no longer exists", picked->derivedTitle), StatusMessageMs);
        return;
    }
    if (m_registry->addPickedWindow(*current)) {
        if (HostSurface* surface = surfaceFor(current->identity)) {
            m_tabs->setCurrentWidget(surface);
        }
    }
}

void MainWindow::openApplication()
{
    QStringList arguments = QProcess::splitCommand(m_settings->applicationPath());
    if (arguments.isEmpty()) {
        return;
    }
    const QString program = arguments.takeFirst();
    if (!QProcess::startDetached(program, arguments)) {
        qCWarning(lcApp) << "Failed to start" << program;
        QMessageBox::warning(this, i18n("Open Application"), i18n("Could not start \"%1\".", program));
        return;
    }
    qCInfo(lcApp) << "Started" << program;
    QTimer::singleShot(LaunchRefreshDelayMs, m_poller, &Poller::refresh);
}

void MainWindow::editRefreshInterval()
{
    bool ok = false;
    const int seconds = QInputDialog::getInt(this, i18n("Refresh Interval"), i18n("Seconds between window scans:"),
                                             m_settings->refreshIntervalSeconds(), Defaults::MinRefreshIntervalSeconds,
                                             Defaults::MaxRefreshIntervalSeconds, 1, &ok);
    if (ok) {
        m_settings->setRefreshIntervalSeconds(seconds);
        m_settings->save();
    }
}

void MainWindow::editApplicationPath()
{
    bool ok = false;
    const QString path = QInputDialog::getText(this, i18n("Application Path"), i18n("Program to start:"),
                                               QLineEdit::Normal, m_settings->applicationPath(), &ok);
    if (ok && !path.trimmed().isEmpty()) {
        m_settings->setApplicationPath(path.trimmed());
        m_settings->save();
    }
}

} // namespace TabNest
