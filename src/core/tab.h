// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "embeddedwindowhandle.h"
#include <QJsonObject>

namespace TabNest {

/**
 * @brief One tab of the container: an embedded window and its host surface
 *
 * Owns its EmbeddedWindowHandle exclusively. Created and destroyed only by
 * TabRegistry; the UI reads tabs through const pointers.
 */
class TABNEST_EXPORT Tab
{
public:
    Tab(const ClassifiedWindow& window, WindowId hostSurface);

    Tab(const Tab&) = delete;
    Tab& operator=(const Tab&) = delete;

    WindowId identity() const
    {
        return m_handle.identity();
    }
    WindowId hostSurface() const
    {
        return m_hostSurface;
    }

    const EmbeddedWindowHandle& handle() const
    {
        return m_handle;
    }
    EmbeddedWindowHandle& handle()
    {
        return m_handle;
    }

    QString title() const
    {
        return m_handle.displayTitle();
    }
    QString rawTitle() const
    {
        return m_rawTitle;
    }
    qint64 processId() const
    {
        return m_processId;
    }
    AttachState attachState() const
    {
        return m_handle.attachState();
    }

    QJsonObject toJson() const;

private:
    EmbeddedWindowHandle m_handle;
    WindowId m_hostSurface = NoWindow;
    QString m_rawTitle;
    qint64 m_processId = 0;
};

} // namespace TabNest
