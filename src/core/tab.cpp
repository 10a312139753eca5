// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "tab.h"
#include "constants.h"
#include "utils.h"

namespace TabNest {

Tab::Tab(const ClassifiedWindow& window, WindowId hostSurface)
    : m_handle(window.identity, window.category, window.derivedTitle)
    , m_hostSurface(hostSurface)
    , m_rawTitle(window.rawTitle)
    , m_processId(window.processId)
{
}

QJsonObject Tab::toJson() const
{
    return QJsonObject{{JsonKeys::Id, Utils::windowIdToString(identity())},
                       {JsonKeys::Title, title()},
                       {JsonKeys::RawTitle, m_rawTitle},
                       {JsonKeys::Category, categoryName(m_handle.category())},
                       {JsonKeys::State, attachStateName(attachState())},
                       {JsonKeys::ProcessId, m_processId}};
}

} // namespace TabNest
