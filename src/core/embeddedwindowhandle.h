// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "types.h"
#include <QString>
#include <optional>

namespace TabNest {

/**
 * @brief Attachment state of one embedded window
 *
 * Value object owned by the Tab it backs. Invariant:
 * attachState() == Attached ⇔ savedStyle() has a value.
 * The only way into Attached is setAttached() with the SavedStyle
 * returned by NativeWindowController::attach(); leaving Attached hands the
 * SavedStyle back so it can be used for the restore.
 */
class TABNEST_EXPORT EmbeddedWindowHandle
{
public:
    EmbeddedWindowHandle(WindowId identity, WindowCategory category, const QString& displayTitle);

    WindowId identity() const
    {
        return m_identity;
    }
    WindowCategory category() const
    {
        return m_category;
    }

    QString displayTitle() const
    {
        return m_displayTitle;
    }
    void setDisplayTitle(const QString& title);

    AttachState attachState() const
    {
        return m_attachState;
    }
    bool isAttached() const
    {
        return m_attachState == AttachState::Attached;
    }
    bool isManuallyDetached() const
    {
        return m_attachState == AttachState::ManuallyDetached;
    }

    const std::optional<SavedStyle>& savedStyle() const
    {
        return m_savedStyle;
    }

    /**
     * @brief Enter Attached with the style captured by the attach
     */
    void setAttached(const SavedStyle& saved);

    /**
     * @brief Leave Attached (or change the kind of detached state)
     * @param manual true for a user-initiated detach
     * @return The SavedStyle held while attached, std::nullopt if not attached
     */
    std::optional<SavedStyle> setDetached(bool manual);

private:
    WindowId m_identity = NoWindow;
    WindowCategory m_category = WindowCategory::Picked;
    QString m_displayTitle;
    AttachState m_attachState = AttachState::Detached;
    std::optional<SavedStyle> m_savedStyle;
};

} // namespace TabNest
