// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QObject>
#include <QTimer>

namespace TabNest {

class TabRegistry;

/**
 * @brief Drives TabRegistry reconciliation
 *
 * The periodic timer issues Automatic passes; user actions, D-Bus calls and
 * drag-and-drop go through trigger(). Both end up in the single
 * TabRegistry::reconcile() entry point, which skips re-entrant calls.
 */
class TABNEST_EXPORT Poller : public QObject
{
    Q_OBJECT

public:
    explicit Poller(TabRegistry* registry, QObject* parent = nullptr);

    void setIntervalSeconds(int seconds);
    int intervalSeconds() const;

    void start();
    void stop();
    bool isActive() const
    {
        return m_timer.isActive();
    }

public Q_SLOTS:
    /**
     * @brief Run one reconciliation pass now
     */
    void trigger(TabNest::ReconcileTrigger trigger);

    void refresh()
    {
        trigger(ReconcileTrigger::ManualRefresh);
    }
    void attachAll()
    {
        trigger(ReconcileTrigger::AttachAll);
    }

Q_SIGNALS:
    void passFinished(TabNest::ReconcileTrigger trigger);

private:
    TabRegistry* m_registry = nullptr;
    QTimer m_timer;
};

} // namespace TabNest
