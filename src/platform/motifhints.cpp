// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include "motifhints.h"
#include <algorithm>

namespace TabNest {

namespace {

struct DecorationMapping
{
    WindowStyle style;
    uint32_t decoration;
};

constexpr DecorationMapping DecorationMap[] = {
    {WindowStyle::TitleBar, MotifHints::DecorTitle},          {WindowStyle::Border, MotifHints::DecorBorder},
    {WindowStyle::ResizeFrame, MotifHints::DecorResizeH},     {WindowStyle::SystemMenu, MotifHints::DecorMenu},
    {WindowStyle::MinimizeButton, MotifHints::DecorMinimize}, {WindowStyle::MaximizeButton, MotifHints::DecorMaximize},
};

} // namespace

std::optional<MotifHints> MotifHints::fromData(const uint32_t* data, int fieldCount)
{
    if (!data || fieldCount < Length) {
        return std::nullopt;
    }
    MotifHints hints;
    std::copy_n(data, Length, hints.fields.begin());
    return hints;
}

WindowStyles MotifHints::frameStyles(const std::optional<MotifHints>& hints)
{
    if (!hints || !(hints->flags() & HintsDecorations)) {
        return FrameStyles;
    }

    const uint32_t decorations = hints->decorations();
    WindowStyles listed = WindowStyle::NoStyle;
    for (const DecorationMapping& mapping : DecorationMap) {
        if (decorations & mapping.decoration) {
            listed |= mapping.style;
        }
    }
    return (decorations & DecorAll) ? (FrameStyles & ~listed) : listed;
}

MotifHints MotifHints::withFrameStyles(const std::optional<MotifHints>& current, WindowStyles styles)
{
    MotifHints hints = current.value_or(MotifHints{});

    uint32_t decorations = 0;
    for (const DecorationMapping& mapping : DecorationMap) {
        if (styles.testFlag(mapping.style)) {
            decorations |= mapping.decoration;
        }
    }
    hints.fields[FlagsField] |= HintsDecorations;
    hints.fields[DecorationsField] = decorations;
    return hints;
}

std::optional<MotifHints> MotifHints::restored(const std::optional<MotifHints>& original,
                                               const std::optional<MotifHints>& current, WindowStyles styles)
{
    if (frameStyles(original) == (styles & FrameStyles)) {
        return original;
    }
    return withFrameStyles(current, styles);
}

} // namespace TabNest
