// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "windowlistdialog.h"
#include "../core/interfaces.h"
#include <KLocalizedString>
#include <QDialogButtonBox>
#include <QLabel>
#include <QListWidget>
#include <QPushButton>
#include <QVBoxLayout>

namespace TabNest {

WindowListDialog::WindowListDialog(const QList<ClassifiedWindow>& windows, const IProcessController* processes,
                                   QWidget* parent)
    : QDialog(parent)
    , m_windows(windows)
{
    setWindowTitle(i18n("Attach Window"));
    resize(520, 420);

    auto* layout = new QVBoxLayout(this);
    layout->addWidget(new QLabel(i18n("Select the window to attach:"), this));

    m_list = new QListWidget(this);
    for (int i = 0; i < m_windows.size(); ++i) {
        const ClassifiedWindow& window = m_windows.at(i);
        const QString executable = processes ? processes->executableName(window.processId) : QString();
        const QString text = executable.isEmpty()
            ? window.derivedTitle
            : i18nc("window title, executable name, process id", "%1 - %2 (%3)", window.derivedTitle, executable,
                    window.processId);
        auto* item = new QListWidgetItem(text, m_list);
        item->setData(Qt::UserRole, i);
    }
    layout->addWidget(m_list);

    auto* buttons = new QDialogButtonBox(QDialogButtonBox::Ok | QDialogButtonBox::Cancel, this);
    buttons->button(QDialogButtonBox::Ok)->setText(i18n("Attach"));
    buttons->button(QDialogButtonBox::Ok)->setEnabled(false);
    layout->addWidget(buttons);

    connect(buttons, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(m_list, &QListWidget::itemSelectionChanged, this, [this, buttons]() {
        buttons->button(QDialogButtonBox::Ok)->setEnabled(m_list->currentItem() != nullptr);
    });
    connect(m_list, &QListWidget::itemDoubleClicked, this, &QDialog::accept);
}

std::optional<ClassifiedWindow> WindowListDialog::selectedWindow() const
{
    const QListWidgetItem* item = m_list->currentItem();
    if (!item) {
        return std::nullopt;
    }
    return m_windows.value(item->data(Qt::UserRole).toInt());
}

} // namespace TabNest
