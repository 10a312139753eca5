// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "interfaces.h"

namespace TabNest {

/**
 * @brief Linux process controller (pidfd + procfs)
 *
 * Termination opens a pidfd for the process, sends SIGKILL through it and
 * closes the descriptor. Going through the pidfd guarantees the signal
 * reaches the process that was opened, not a later process that recycled
 * the pid.
 */
class TABNEST_EXPORT ProcessController : public IProcessController
{
public:
    ProcessController() = default;
    ~ProcessController() override = default;

    bool terminateByProcessId(qint64 pid) override;
    int terminateByExecutableName(const QString& name) override;
    QString executableName(qint64 pid) const override;
};

} // namespace TabNest
