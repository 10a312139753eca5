// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "types.h"

namespace TabNest {

QString categoryName(WindowCategory category)
{
    switch (category) {
    case WindowCategory::PrimaryApp:
        return QStringLiteral("primary");
    case WindowCategory::CompanionManager:
        return QStringLiteral("manager");
    case WindowCategory::ExternalProcess:
        return QStringLiteral("external");
    case WindowCategory::Picked:
        return QStringLiteral("picked");
    }
    return QString();
}

QString attachStateName(AttachState state)
{
    switch (state) {
    case AttachState::Attached:
        return QStringLiteral("attached");
    case AttachState::Detached:
        return QStringLiteral("detached");
    case AttachState::ManuallyDetached:
        return QStringLiteral("manually-detached");
    }
    return QString();
}

QString embedErrorName(EmbedError error)
{
    switch (error) {
    case EmbedError::None:
        return QStringLiteral("none");
    case EmbedError::StaleWindow:
        return QStringLiteral("stale-window");
    case EmbedError::AttachFailed:
        return QStringLiteral("attach-failed");
    case EmbedError::TerminateFailed:
        return QStringLiteral("terminate-failed");
    case EmbedError::EnumerationPartialFailure:
        return QStringLiteral("enumeration-partial-failure");
    case EmbedError::EnumerationFailed:
        return QStringLiteral("enumeration-failed");
    }
    return QString();
}

} // namespace TabNest
