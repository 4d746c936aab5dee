#pragma once

#include "Aries/Public/Types.h"
#include <vector>

namespace Aries::Core::Geometry
{
    struct PushItem
    {
        ItemId id;
        juce::Rectangle<float> bounds;
    };

    struct PushOutcome
    {
        ItemId id;
        juce::Rectangle<float> bounds;
        bool pushed = false;
    };

    struct NestAutoSizeSettings
    {
        float minWidth = 400.0f;
        float minHeight = 300.0f;
        float padding = 20.0f;
    };

    struct ItemSize
    {
        float width = 0.0f;
        float height = 0.0f;
    };

    ItemId generateUniqueId(const juce::String& prefix);

    float snapToGrid(float value, float gridSize) noexcept;
    juce::Point<float> snapToGrid(juce::Point<float> point, float gridSize) noexcept;
    juce::Rectangle<float> snapPosition(juce::Rectangle<float> bounds, float gridSize) noexcept;
    float roundUpToGrid(float value, float gridSize) noexcept;

    // Strict overlap: rectangles that only share an edge do not collide.
    bool collides(const juce::Rectangle<float>& a, const juce::Rectangle<float>& b) noexcept;

    // Returns one outcome per entry of `others`, sorted by id. `pushed` is set only for entries whose
    // position changed. Entries with the mover's id are passed through untouched.
    std::vector<PushOutcome> resolvePush(const PushItem& moving,
                                         const std::vector<PushItem>& others,
                                         float gridSize);

    juce::Point<float> findNonCollidingPosition(const juce::Rectangle<float>& candidate,
                                                const std::vector<juce::Rectangle<float>>& existing,
                                                float gridSize,
                                                int maxRings = 50);

    // children are in the nest's local (content) space.
    ItemSize nestAutoSize(const std::vector<juce::Rectangle<float>>& children,
                          float gridSize,
                          const NestAutoSizeSettings& settings = {});

    juce::String defaultContentForType(const juce::String& type);
}
