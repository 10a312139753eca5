// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "tabnest_export.h"
#include "../core/types.h"
#include <array>
#include <cstdint>
#include <optional>

namespace TabNest {

/**
 * @brief Contents of a _MOTIF_WM_HINTS property (five CARD32 fields)
 *
 * Decoding follows the Motif convention the window managers implement:
 * no property, or no decorations flag, means a full frame. With
 * DecorAll set the remaining decoration bits name what to remove.
 */
struct TABNEST_EXPORT MotifHints
{
    static constexpr int Length = 5;
    static constexpr int FlagsField = 0;
    static constexpr int DecorationsField = 2;

    static constexpr uint32_t HintsDecorations = 1u << 1;

    static constexpr uint32_t DecorAll = 1u << 0;
    static constexpr uint32_t DecorBorder = 1u << 1;
    static constexpr uint32_t DecorResizeH = 1u << 2;
    static constexpr uint32_t DecorTitle = 1u << 3;
    static constexpr uint32_t DecorMenu = 1u << 4;
    static constexpr uint32_t DecorMinimize = 1u << 5;
    static constexpr uint32_t DecorMaximize = 1u << 6;

    std::array<uint32_t, Length> fields{};

    uint32_t flags() const
    {
        return fields[FlagsField];
    }
    uint32_t decorations() const
    {
        return fields[DecorationsField];
    }

    bool operator==(const MotifHints& other) const = default;

    /**
     * @brief Parse raw property data
     * @return nullopt when the property is shorter than five fields
     */
    static std::optional<MotifHints> fromData(const uint32_t* data, int fieldCount);

    /// Frame bits these hints give a window (never includes Child)
    static WindowStyles frameStyles(const std::optional<MotifHints>& hints);

    /**
     * @brief Hints that give a window exactly the frame bits in @p styles
     *
     * Fields other than flags and decorations are carried over from
     * @p current unchanged.
     */
    static MotifHints withFrameStyles(const std::optional<MotifHints>& current, WindowStyles styles);

    /**
     * @brief Hints to write when a window goes back to @p styles
     *
     * When @p styles matches what @p original decoded to, @p original is
     * returned verbatim, and nullopt means the property should be deleted.
     */
    static std::optional<MotifHints> restored(const std::optional<MotifHints>& original,
                                              const std::optional<MotifHints>& current, WindowStyles styles);
};

} // namespace TabNest
