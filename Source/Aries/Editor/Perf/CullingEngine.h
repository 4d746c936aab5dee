#pragma once

#include "Aries/Core/GridQueries.h"
#include "Aries/Editor/Perf/HitTestGrid.h"
#include <vector>

namespace Aries::Editor::Perf
{
    struct CullingSettings
    {
        float bufferPx = 300.0f;
        int minItemsForVirtualization = 80;
        int maxRenderCount = 150;
        float hashCellSize = 256.0f;
    };

    struct CullingResult
    {
        std::vector<ItemId> visibleMainItems;
        std::vector<ItemId> visibleNests;
        std::vector<ItemId> visibleNestedItems;

        int totalItems = 0;
        int renderedItems = 0;
        int culledItems = 0;
        double cullingPercentage = 0.0;
        bool virtualizationActive = false;

        bool isVisible(const ItemId& id) const;
    };

    class CullingEngine
    {
    public:
        void setSettings(const CullingSettings& nextSettings) noexcept;
        const CullingSettings& settings() const noexcept;

        // World-space area shown by a container of `containerSize` screen pixels, grown by the buffer.
        juce::Rectangle<float> visibleWorldArea(const Viewport& viewport, Core::Geometry::ItemSize containerSize) const noexcept;

        // Items listed in alwaysVisibleIds (the dragged or resized item) are never culled.
        CullingResult compute(const GridModel& model,
                              const Viewport& viewport,
                              Core::Geometry::ItemSize containerSize,
                              const std::vector<ItemId>& alwaysVisibleIds = {});

    private:
        CullingSettings cullingSettings;
        HitTestGrid topLevelIndex;
    };
}
