// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "embeddedwindowhandle.h"

namespace TabNest {

EmbeddedWindowHandle::EmbeddedWindowHandle(WindowId identity, WindowCategory category, const QString& displayTitle)
    : m_identity(identity)
    , m_category(category)
    , m_displayTitle(displayTitle)
{
}

void EmbeddedWindowHandle::setDisplayTitle(const QString& title)
{
    m_displayTitle = title;
}

void EmbeddedWindowHandle::setAttached(const SavedStyle& saved)
{
    // Re-attaching an attached window would overwrite the pre-embedding
    // snapshot with the embedded style; keep the first one.
    if (m_attachState == AttachState::Attached) {
        return;
    }
    m_savedStyle = saved;
    m_attachState = AttachState::Attached;
}

std::optional<SavedStyle> EmbeddedWindowHandle::setDetached(bool manual)
{
    std::optional<SavedStyle> saved;
    saved.swap(m_savedStyle);
    m_attachState = manual ? AttachState::ManuallyDetached : AttachState::Detached;
    return saved;
}

} // namespace TabNest
