// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "../core/types.h"
#include <QDialog>
#include <optional>

class QListWidget;

namespace TabNest {

class IProcessController;

/**
 * @brief Lets the user pick a window from a list of visible top-level windows
 */
class WindowListDialog : public QDialog
{
    Q_OBJECT

public:
    WindowListDialog(const QList<ClassifiedWindow>& windows, const IProcessController* processes,
                     QWidget* parent = nullptr);

    std::optional<ClassifiedWindow> selectedWindow() const;

private:
    QList<ClassifiedWindow> m_windows;
    QListWidget* m_list = nullptr;
};

} // namespace TabNest
