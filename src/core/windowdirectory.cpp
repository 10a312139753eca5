// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowdirectory.h"
#include "interfaces.h"
#include "logging.h"
#include "utils.h"
#include <QCoreApplication>

namespace TabNest {

WindowDirectory::WindowDirectory(IWindowSystem* windowSystem, IProcessController* processes,
                                 const ClassificationRules& rules)
    : m_windowSystem(windowSystem)
    , m_processes(processes)
    , m_rules(rules)
{
    Q_ASSERT(windowSystem);
    Q_ASSERT(processes);
    rebuildPatterns();
}

void WindowDirectory::setRules(const ClassificationRules& rules)
{
    m_rules = rules;
    rebuildPatterns();
}

void WindowDirectory::rebuildPatterns()
{
    QStringList markers;
    for (const QString& marker : std::as_const(m_rules.runningMarkers)) {
        if (!marker.trimmed().isEmpty()) {
            markers.append(QRegularExpression::escape(marker.trimmed()));
        }
    }

    const QString application = m_rules.applicationName.trimmed();
    if (markers.isEmpty() || application.isEmpty()) {
        qCDebug(lcDirectory) << "Running-instance rule disabled (no markers or application name)";
        m_runningPattern = QRegularExpression();
        return;
    }

    // "<name> [<marker>] - <application>", anything after the application
    // name (e.g. a secondary display index) is ignored
    const QString pattern = QStringLiteral("^(.*\\S)\\s+\\[(?:%1)\\]\\s+-\\s+%2")
                                .arg(markers.join(QLatin1Char('|')), QRegularExpression::escape(application));
    m_runningPattern = QRegularExpression(pattern, QRegularExpression::CaseInsensitiveOption
                                                       | QRegularExpression::UseUnicodePropertiesOption);
    if (!m_runningPattern.isValid()) {
        qCWarning(lcDirectory) << "Invalid running-instance pattern:" << m_runningPattern.errorString();
    }
}

bool WindowDirectory::isOwnProcess(qint64 pid) const
{
    return pid > 0 && pid == QCoreApplication::applicationPid();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Classification
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<ClassifiedWindow> WindowDirectory::classify(WindowId window, const QString& title, qint64 pid,
                                                          bool hasOwner) const
{
    ClassifiedWindow result;
    result.identity = window;
    result.rawTitle = title;
    result.processId = pid;

    if (!title.isEmpty() && m_runningPattern.isValid() && !m_runningPattern.pattern().isEmpty()) {
        const QRegularExpressionMatch match = m_runningPattern.match(title);
        if (match.hasMatch()) {
            result.category = WindowCategory::PrimaryApp;
            result.derivedTitle = match.captured(1).trimmed();
            return result;
        }
    }

    if (!title.isEmpty() && !m_rules.managerSignature.isEmpty() && title.contains(m_rules.managerSignature)) {
        result.category = WindowCategory::CompanionManager;
        result.derivedTitle = m_rules.managerLabel.isEmpty() ? title : m_rules.managerLabel;
        return result;
    }

    if (!hasOwner && pid > 0 && !m_rules.companionExecutables.isEmpty()) {
        const QString executable = m_processes->executableName(pid);
        if (!executable.isEmpty() && m_rules.companionExecutables.contains(executable)) {
            result.category = WindowCategory::ExternalProcess;
            result.derivedTitle = title.isEmpty() ? executable : title;
            return result;
        }
    }

    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Enumeration
// ═══════════════════════════════════════════════════════════════════════════════

EnumerationResult WindowDirectory::enumerate() const
{
    EnumerationResult result;

    const std::optional<QList<WindowId>> windows = m_windowSystem->topLevelWindows();
    if (!windows) {
        qCWarning(lcDirectory) << "Window enumeration failed, treating as no windows this cycle";
        result.failed = true;
        return result;
    }

    for (const WindowId window : *windows) {
        // Each probe may fail if the window is destroyed mid-scan
        const std::optional<bool> visible = m_windowSystem->isVisible(window);
        if (!visible) {
            ++result.skippedWindows;
            continue;
        }
        if (!*visible) {
            continue;
        }

        const std::optional<QString> title = m_windowSystem->windowTitle(window);
        const std::optional<bool> owned = m_windowSystem->hasOwner(window);
        if (!title || !owned) {
            ++result.skippedWindows;
            continue;
        }

        const qint64 pid = m_windowSystem->windowProcessId(window);
        if (isOwnProcess(pid)) {
            continue;
        }

        if (auto classified = classify(window, *title, pid, *owned)) {
            result.windows.append(*classified);
        }
    }

    if (result.skippedWindows > 0) {
        qCDebug(lcDirectory) << "Skipped" << result.skippedWindows << "windows destroyed during the scan";
    }
    return result;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Pick Flows
// ═══════════════════════════════════════════════════════════════════════════════

std::optional<ClassifiedWindow> WindowDirectory::pickWindow(WindowId window) const
{
    if (window == NoWindow || !m_windowSystem->isWindow(window)) {
        return std::nullopt;
    }

    const std::optional<QString> title = m_windowSystem->windowTitle(window);
    if (!title) {
        return std::nullopt;
    }

    const qint64 pid = m_windowSystem->windowProcessId(window);
    if (isOwnProcess(pid)) {
        qCInfo(lcDirectory) << "Refusing to pick one of our own windows:" << Utils::windowIdToString(window);
        return std::nullopt;
    }

    ClassifiedWindow picked;
    picked.identity = window;
    picked.rawTitle = *title;
    picked.category = WindowCategory::Picked;
    picked.processId = pid;
    picked.derivedTitle = *title;
    if (picked.derivedTitle.isEmpty() && pid > 0) {
        picked.derivedTitle = m_processes->executableName(pid);
    }
    if (picked.derivedTitle.isEmpty()) {
        picked.derivedTitle = Utils::windowIdToString(window);
    }
    return picked;
}

std::optional<ClassifiedWindow> WindowDirectory::pickWindowAt(const QPoint& point) const
{
    const WindowId hit = m_windowSystem->windowAt(point);
    if (hit == NoWindow) {
        qCDebug(lcDirectory) << "No window under" << point;
        return std::nullopt;
    }

    const WindowId topLevel = m_windowSystem->topLevelAncestor(hit);
    if (topLevel == NoWindow) {
        qCDebug(lcDirectory) << "No top-level window owns" << Utils::windowIdToString(hit);
        return std::nullopt;
    }
    return pickWindow(topLevel);
}

QList<ClassifiedWindow> WindowDirectory::pickableWindows() const
{
    QList<ClassifiedWindow> result;

    const std::optional<QList<WindowId>> windows = m_windowSystem->topLevelWindows();
    if (!windows) {
        qCWarning(lcDirectory) << "Window enumeration failed while listing pickable windows";
        return result;
    }

    for (const WindowId window : *windows) {
        const std::optional<bool> visible = m_windowSystem->isVisible(window);
        if (!visible || !*visible) {
            continue;
        }
        if (auto picked = pickWindow(window)) {
            result.append(*picked);
        }
    }
    return result;
}

} // namespace TabNest
