#pragma once

#include "Aries/Public/Types.h"
#include <optional>

namespace Aries::Editor::Interaction
{
    enum class ResizeHandle
    {
        n,
        s,
        e,
        w,
        ne,
        nw,
        se,
        sw
    };

    juce::String resizeHandleName(ResizeHandle handle);
    std::optional<ResizeHandle> resizeHandleFromName(const juce::String& name);

    struct ResizeRequest
    {
        juce::Rectangle<float> startBounds;
        juce::Point<float> pointerDelta;   // world units since the gesture began
        ResizeHandle handle = ResizeHandle::se;
        ItemKind kind = ItemKind::widget;
        float gridSize = kDefaultGridSize;
    };

    class ResizeEngine
    {
    public:
        static juce::Point<float> minimumSize(ItemKind kind) noexcept;

        // Every edge is grid-rounded, minimums included. When the minimum clamps, the edge opposite the
        // handle stays on its snapped position.
        static juce::Rectangle<float> compute(const ResizeRequest& request);
    };
}
