// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "processcontroller.h"
#include "logging.h"
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/syscall.h>
#include <unistd.h>

namespace TabNest {

namespace {

/// Owns a pidfd for the lifetime of one termination request
class PidFd
{
public:
    explicit PidFd(qint64 pid)
        : m_fd(static_cast<int>(::syscall(SYS_pidfd_open, static_cast<pid_t>(pid), 0)))
    {
    }
    ~PidFd()
    {
        if (m_fd >= 0) {
            ::close(m_fd);
        }
    }
    PidFd(const PidFd&) = delete;
    PidFd& operator=(const PidFd&) = delete;

    bool isValid() const
    {
        return m_fd >= 0;
    }
    int fd() const
    {
        return m_fd;
    }

private:
    int m_fd = -1;
};

} // namespace

bool ProcessController::terminateByProcessId(qint64 pid)
{
    if (pid <= 0) {
        qCWarning(lcProcess) << "Cannot terminate invalid pid" << pid;
        return false;
    }
    if (pid == QCoreApplication::applicationPid()) {
        qCWarning(lcProcess) << "Refusing to terminate our own process";
        return false;
    }

    PidFd handle(pid);
    if (!handle.isValid()) {
        // ESRCH: already exited, EPERM: not ours to kill
        qCInfo(lcProcess) << "Cannot open process" << pid << "for termination:" << std::strerror(errno);
        return false;
    }

    if (::syscall(SYS_pidfd_send_signal, handle.fd(), SIGKILL, nullptr, 0) != 0) {
        qCInfo(lcProcess) << "Termination of process" << pid << "failed:" << std::strerror(errno);
        return false;
    }

    qCInfo(lcProcess) << "Terminated process" << pid;
    return true;
}

int ProcessController::terminateByExecutableName(const QString& name)
{
    if (name.isEmpty()) {
        return 0;
    }

    int terminated = 0;
    const QStringList entries = QDir(QStringLiteral("/proc")).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        bool isPid = false;
        const qint64 pid = entry.toLongLong(&isPid);
        if (!isPid || pid == QCoreApplication::applicationPid()) {
            continue;
        }
        if (executableName(pid) == name && terminateByProcessId(pid)) {
            ++terminated;
        }
    }

    qCInfo(lcProcess) << "Terminated" << terminated << "processes named" << name;
    return terminated;
}

QString ProcessController::executableName(qint64 pid) const
{
    if (pid <= 0) {
        return QString();
    }

    // The exe link is unreadable for other users' processes; comm is not,
    // but it is truncated to 15 characters.
    QString exe = QFileInfo(QStringLiteral("/proc/%1/exe").arg(pid)).symLinkTarget();
    if (!exe.isEmpty()) {
        // Binary replaced by an upgrade while running
        if (exe.endsWith(QLatin1String(" (deleted)"))) {
            exe.chop(10);
        }
        return QFileInfo(exe).fileName();
    }

    QFile comm(QStringLiteral("/proc/%1/comm").arg(pid));
    if (!comm.open(QIODevice::ReadOnly)) {
        return QString();
    }
    return QString::fromLocal8Bit(comm.readAll()).trimmed();
}

} // namespace TabNest
