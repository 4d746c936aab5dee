#pragma once

#include "Aries/Core/Geometry.h"
#include "Aries/Public/Types.h"
#include <algorithm>
#include <optional>
#include <set>
#include <vector>

namespace Aries::Core::GridQueries
{
    inline const WidgetModel* findWidget(const GridModel& model, const ItemId& id) noexcept
    {
        for (const auto* list : { &model.mainItems, &model.nestedItems })
        {
            const auto it = std::find_if(list->begin(),
                                         list->end(),
                                         [&id](const WidgetModel& widget)
                                         {
                                             return widget.id == id;
                                         });
            if (it != list->end())
                return &(*it);
        }

        return nullptr;
    }

    inline WidgetModel* findWidget(GridModel& model, const ItemId& id) noexcept
    {
        return const_cast<WidgetModel*>(findWidget(static_cast<const GridModel&>(model), id));
    }

    inline const NestModel* findNest(const GridModel& model, const ItemId& id) noexcept
    {
        const auto it = std::find_if(model.nestContainers.begin(),
                                     model.nestContainers.end(),
                                     [&id](const NestModel& nest)
                                     {
                                         return nest.id == id;
                                     });
        return it != model.nestContainers.end() ? &(*it) : nullptr;
    }

    inline NestModel* findNest(GridModel& model, const ItemId& id) noexcept
    {
        return const_cast<NestModel*>(findNest(static_cast<const GridModel&>(model), id));
    }

    inline std::optional<ItemKind> kindOf(const GridModel& model, const ItemId& id) noexcept
    {
        if (findWidget(model, id) != nullptr)
            return ItemKind::widget;
        if (findNest(model, id) != nullptr)
            return ItemKind::nest;
        return std::nullopt;
    }

    inline bool containsId(const GridModel& model, const ItemId& id) noexcept
    {
        return kindOf(model, id).has_value();
    }

    inline std::optional<ContainerRef> containerOf(const GridModel& model, const ItemId& id)
    {
        if (const auto* widget = findWidget(model, id))
            return widget->container();
        if (const auto* nest = findNest(model, id))
            return nest->container();
        return std::nullopt;
    }

    inline std::optional<juce::Rectangle<float>> localBoundsOf(const GridModel& model, const ItemId& id)
    {
        if (const auto* widget = findWidget(model, id))
            return widget->bounds;
        if (const auto* nest = findNest(model, id))
            return nest->bounds;
        return std::nullopt;
    }

    // World-space origin of a container's content area. Nested origins include the header offset.
    // Returns nullopt on a missing or cyclic parent chain.
    inline std::optional<juce::Point<float>> containerOrigin(const GridModel& model, const ContainerRef& container)
    {
        juce::Point<float> origin;
        auto current = container;
        std::set<juce::String> visited;

        while (!current.isMain())
        {
            if (!visited.insert(current.nestId).second)
                return std::nullopt;

            const auto* nest = findNest(model, current.nestId);
            if (nest == nullptr)
                return std::nullopt;

            origin += nest->bounds.getPosition() + juce::Point<float>(0.0f, kNestHeaderHeight);
            current = nest->container();
        }

        return origin;
    }

    inline std::optional<juce::Rectangle<float>> absoluteBoundsOf(const GridModel& model, const ItemId& id)
    {
        const auto local = localBoundsOf(model, id);
        const auto container = containerOf(model, id);
        if (!local.has_value() || !container.has_value())
            return std::nullopt;

        const auto origin = containerOrigin(model, *container);
        if (!origin.has_value())
            return std::nullopt;

        return local->translated(origin->x, origin->y);
    }

    inline bool containerExists(const GridModel& model, const ContainerRef& container) noexcept
    {
        return container.isMain() || findNest(model, container.nestId) != nullptr;
    }

    // True when `ancestorId` is `nestId` itself or any nest above it.
    inline bool isNestAncestorOrSelf(const GridModel& model, const ItemId& ancestorId, const ItemId& nestId)
    {
        std::set<juce::String> visited;
        std::optional<ItemId> current = nestId;

        while (current.has_value())
        {
            if (*current == ancestorId)
                return true;
            if (!visited.insert(*current).second)
                return true;

            const auto* nest = findNest(model, *current);
            if (nest == nullptr)
                return false;

            current = nest->parentNestId;
        }

        return false;
    }

    inline std::vector<ItemId> descendantNestIds(const GridModel& model, const ItemId& nestId)
    {
        std::vector<ItemId> result;
        for (const auto& nest : model.nestContainers)
        {
            if (nest.id != nestId && isNestAncestorOrSelf(model, nestId, nest.id))
                result.push_back(nest.id);
        }

        return result;
    }

    struct ContainerChild
    {
        ItemId id;
        ItemKind kind = ItemKind::widget;
        juce::Rectangle<float> bounds;
    };

    inline std::vector<ContainerChild> childrenOf(const GridModel& model, const ContainerRef& container)
    {
        std::vector<ContainerChild> children;

        const auto& widgets = container.isMain() ? model.mainItems : model.nestedItems;
        for (const auto& widget : widgets)
        {
            if (widget.container() == container)
                children.push_back({ widget.id, ItemKind::widget, widget.bounds });
        }

        for (const auto& nest : model.nestContainers)
        {
            if (nest.container() == container)
                children.push_back({ nest.id, ItemKind::nest, nest.bounds });
        }

        return children;
    }

    inline std::vector<Geometry::PushItem> siblingsOf(const GridModel& model,
                                                      const ContainerRef& container,
                                                      const ItemId& excludeId)
    {
        std::vector<Geometry::PushItem> siblings;
        for (const auto& child : childrenOf(model, container))
        {
            if (child.id != excludeId)
                siblings.push_back({ child.id, child.bounds });
        }

        return siblings;
    }

    // Deepest nest whose absolute bounds contain `point`, skipping `excludeId` and its subtree.
    inline std::optional<ItemId> deepestNestAt(const GridModel& model,
                                               juce::Point<float> point,
                                               const std::optional<ItemId>& excludeId = std::nullopt)
    {
        std::optional<ItemId> best;
        auto bestDepth = -1;

        for (const auto& nest : model.nestContainers)
        {
            if (excludeId.has_value() && isNestAncestorOrSelf(model, *excludeId, nest.id))
                continue;

            const auto bounds = absoluteBoundsOf(model, nest.id);
            if (!bounds.has_value() || !bounds->contains(point))
                continue;

            auto depth = 0;
            for (auto parent = nest.parentNestId; parent.has_value() && depth <= static_cast<int>(model.nestContainers.size()); ++depth)
            {
                const auto* parentNest = findNest(model, *parent);
                parent = parentNest != nullptr ? parentNest->parentNestId : std::nullopt;
            }

            if (depth > bestDepth)
            {
                bestDepth = depth;
                best = nest.id;
            }
        }

        return best;
    }

    inline int widgetCount(const GridModel& model) noexcept
    {
        return static_cast<int>(model.mainItems.size() + model.nestedItems.size());
    }

    inline int itemCount(const GridModel& model) noexcept
    {
        return widgetCount(model) + static_cast<int>(model.nestContainers.size());
    }
}
