#include "Aries/Editor/Perf/CullingEngine.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace Aries::Editor::Perf
{
    bool CullingResult::isVisible(const ItemId& id) const
    {
        for (const auto* list : { &visibleMainItems, &visibleNests, &visibleNestedItems })
        {
            if (std::find(list->begin(), list->end(), id) != list->end())
                return true;
        }

        return false;
    }

    void CullingEngine::setSettings(const CullingSettings& nextSettings) noexcept
    {
        cullingSettings = nextSettings;
        cullingSettings.bufferPx = std::max(0.0f, cullingSettings.bufferPx);
        cullingSettings.minItemsForVirtualization = std::max(0, cullingSettings.minItemsForVirtualization);
        cullingSettings.maxRenderCount = std::max(1, cullingSettings.maxRenderCount);
        topLevelIndex.setCellSize(cullingSettings.hashCellSize);
    }

    const CullingSettings& CullingEngine::settings() const noexcept
    {
        return cullingSettings;
    }

    juce::Rectangle<float> CullingEngine::visibleWorldArea(const Viewport& viewport,
                                                           Core::Geometry::ItemSize containerSize) const noexcept
    {
        const auto zoom = clampZoom(viewport.zoom);
        const auto buffer = cullingSettings.bufferPx / zoom;

        return juce::Rectangle<float>(-viewport.x - buffer,
                                      -viewport.y - buffer,
                                      std::max(0.0f, containerSize.width) / zoom + buffer * 2.0f,
                                      std::max(0.0f, containerSize.height) / zoom + buffer * 2.0f);
    }

    CullingResult CullingEngine::compute(const GridModel& model,
                                         const Viewport& viewport,
                                         Core::Geometry::ItemSize containerSize,
                                         const std::vector<ItemId>& alwaysVisibleIds)
    {
        CullingResult result;
        result.totalItems = Core::GridQueries::itemCount(model);

        const std::set<ItemId> pinned(alwaysVisibleIds.begin(), alwaysVisibleIds.end());
        const auto renderEverything = result.totalItems < cullingSettings.minItemsForVirtualization;

        std::set<ItemId> visibleTopLevel;
        if (renderEverything)
        {
            for (const auto& widget : model.mainItems)
                visibleTopLevel.insert(widget.id);
            for (const auto& nest : model.nestContainers)
            {
                if (!nest.parentNestId.has_value())
                    visibleTopLevel.insert(nest.id);
            }
        }
        else
        {
            std::vector<HitTestItem> topLevel;
            topLevel.reserve(model.mainItems.size() + model.nestContainers.size());
            for (const auto& widget : model.mainItems)
                topLevel.push_back({ widget.id, widget.bounds });
            for (const auto& nest : model.nestContainers)
            {
                if (!nest.parentNestId.has_value())
                    topLevel.push_back({ nest.id, nest.bounds });
            }

            topLevelIndex.rebuild(topLevel);

            const auto area = visibleWorldArea(viewport, containerSize);
            auto hits = topLevelIndex.query(area);

            // Bounds-touching items are not inside the area.
            hits.erase(std::remove_if(hits.begin(),
                                      hits.end(),
                                      [&](const ItemId& id)
                                      {
                                          const auto bounds = Core::GridQueries::localBoundsOf(model, id);
                                          return !bounds.has_value() || !Core::Geometry::collides(*bounds, area);
                                      }),
                       hits.end());

            if (static_cast<int>(hits.size()) > cullingSettings.maxRenderCount)
            {
                const auto centre = area.getCentre();
                std::stable_sort(hits.begin(),
                                 hits.end(),
                                 [&](const ItemId& lhs, const ItemId& rhs)
                                 {
                                     const auto lhsBounds = Core::GridQueries::localBoundsOf(model, lhs).value_or(juce::Rectangle<float>());
                                     const auto rhsBounds = Core::GridQueries::localBoundsOf(model, rhs).value_or(juce::Rectangle<float>());
                                     return lhsBounds.getCentre().getDistanceFrom(centre) < rhsBounds.getCentre().getDistanceFrom(centre);
                                 });
                hits.resize(static_cast<size_t>(cullingSettings.maxRenderCount));
            }

            visibleTopLevel.insert(hits.begin(), hits.end());
        }

        for (const auto& widget : model.mainItems)
        {
            if (visibleTopLevel.count(widget.id) > 0 || pinned.count(widget.id) > 0)
                result.visibleMainItems.push_back(widget.id);
        }

        // A nest is shown when it is visible itself (top level) or its parent is shown.
        std::set<ItemId> visibleNestIds;
        const auto nestVisible = [&](const NestModel& nest)
        {
            if (pinned.count(nest.id) > 0)
                return true;
            if (!nest.parentNestId.has_value())
                return visibleTopLevel.count(nest.id) > 0;
            return visibleNestIds.count(*nest.parentNestId) > 0;
        };

        // Parents are resolved before children; depth is bounded by the nest count.
        for (size_t pass = 0; pass <= model.nestContainers.size(); ++pass)
        {
            const auto before = visibleNestIds.size();
            for (const auto& nest : model.nestContainers)
            {
                if (visibleNestIds.count(nest.id) == 0 && nestVisible(nest))
                    visibleNestIds.insert(nest.id);
            }

            if (visibleNestIds.size() == before)
                break;
        }

        for (const auto& nest : model.nestContainers)
        {
            if (visibleNestIds.count(nest.id) > 0)
                result.visibleNests.push_back(nest.id);
        }

        for (const auto& widget : model.nestedItems)
        {
            const auto parentVisible = widget.nestId.has_value() && visibleNestIds.count(*widget.nestId) > 0;
            if (parentVisible || pinned.count(widget.id) > 0)
                result.visibleNestedItems.push_back(widget.id);
        }

        result.renderedItems = static_cast<int>(result.visibleMainItems.size()
                                                + result.visibleNests.size()
                                                + result.visibleNestedItems.size());
        result.culledItems = result.totalItems - result.renderedItems;
        result.virtualizationActive = result.culledItems > 0;
        result.cullingPercentage = result.totalItems > 0
                                     ? (static_cast<double>(result.culledItems) / static_cast<double>(result.totalItems)) * 100.0
                                     : 0.0;
        return result;
    }
}
