#pragma once

#include "Aries/Public/GridResult.h"
#include "Aries/Public/Types.h"
#include <algorithm>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>

namespace Aries
{
    // -----------------------------------------------------------------------------
    //  Grid Actions (Public contract)
    //
    //  Rules:
    //  - Every mutation of the grid goes through one of these actions.
    //  - Actions are payload-only. The store stamps timestamps and ids.
    //  - validateAction() does cheap shape checks. The reducer validates against
    //    the current model (existence, containers, cycles).
    // -----------------------------------------------------------------------------

    enum class MutationPhase
    {
        transient,   // mid-gesture frame, never recorded
        settled
    };

    enum class ChildPolicy
    {
        promote,
        cascade
    };

    enum class ReplaceOrigin
    {
        import,
        history,
        profile,
        load
    };

    struct AddWidgetAction
    {
        WidgetModel widget;                   // id may be empty, the store allocates one
    };

    struct AddNestAction
    {
        NestModel nest;
    };

    struct UpdateItemAction
    {
        ItemId id;
        std::optional<juce::Rectangle<float>> bounds;
        std::optional<juce::String> title;
        std::optional<juce::String> content;
        PropertyBag configPatch;
    };

    struct SetItemsBoundsAction
    {
        struct Item
        {
            ItemId id;
            juce::Rectangle<float> bounds;
        };

        std::vector<Item> items;
    };

    struct RemoveItemAction
    {
        ItemId id;
        ChildPolicy childPolicy = ChildPolicy::promote;
    };

    struct MoveBetweenContainersAction
    {
        ItemId id;
        ContainerRef from;
        ContainerRef to;
        std::optional<juce::Rectangle<float>> localBounds;   // absent: keep the absolute position
    };

    struct ApplyLiveValueAction
    {
        juce::String streamKey;
        juce::var value;
    };

    struct ReplaceStateAction
    {
        GridModel model;
        ReplaceOrigin origin = ReplaceOrigin::import;
    };

    using Action = std::variant<
        AddWidgetAction,
        AddNestAction,
        UpdateItemAction,
        SetItemsBoundsAction,
        RemoveItemAction,
        MoveBetweenContainersAction,
        ApplyLiveValueAction,
        ReplaceStateAction>;

    static_assert(std::variant_size_v<Action> == 8,
                  "Action variant must contain exactly eight grid actions");

    enum class ActionKind
    {
        addWidget,
        addNest,
        updateItem,
        setItemsBounds,
        removeItem,
        moveBetweenContainers,
        applyLiveValue,
        replaceState
    };

    inline ActionKind getActionKind(const Action& action) noexcept
    {
        return std::visit([](const auto& a) -> ActionKind
        {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, AddWidgetAction>)             return ActionKind::addWidget;
            if constexpr (std::is_same_v<T, AddNestAction>)               return ActionKind::addNest;
            if constexpr (std::is_same_v<T, UpdateItemAction>)            return ActionKind::updateItem;
            if constexpr (std::is_same_v<T, SetItemsBoundsAction>)        return ActionKind::setItemsBounds;
            if constexpr (std::is_same_v<T, RemoveItemAction>)            return ActionKind::removeItem;
            if constexpr (std::is_same_v<T, MoveBetweenContainersAction>) return ActionKind::moveBetweenContainers;
            if constexpr (std::is_same_v<T, ApplyLiveValueAction>)        return ActionKind::applyLiveValue;
            return ActionKind::replaceState;
        }, action);
    }

    inline juce::String actionKindName(ActionKind kind)
    {
        switch (kind)
        {
            case ActionKind::addWidget: return "addWidget";
            case ActionKind::addNest: return "addNest";
            case ActionKind::updateItem: return "updateItem";
            case ActionKind::setItemsBounds: return "setItemsBounds";
            case ActionKind::removeItem: return "removeItem";
            case ActionKind::moveBetweenContainers: return "moveBetweenContainers";
            case ActionKind::applyLiveValue: return "applyLiveValue";
            case ActionKind::replaceState: return "replaceState";
        }

        return "unknown";
    }

    // Shape validation only. Bad bounds are geometry errors, everything else is an argument error.
    inline GridResult validateAction(const Action& action)
    {
        const auto validateBounds = [](const juce::Rectangle<float>& bounds, const char* what) -> GridResult
        {
            if (!isFiniteBounds(bounds))
                return GridResult::fail(GridError::geometry, juce::String(what) + " bounds must be finite");
            if (bounds.getWidth() <= 0.0f || bounds.getHeight() <= 0.0f)
                return GridResult::fail(GridError::geometry, juce::String(what) + " bounds width/height must be > 0");

            return GridResult::ok();
        };

        return std::visit([&](const auto& a) -> GridResult
        {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, AddWidgetAction>)
            {
                if (a.widget.type.trim().isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "AddWidgetAction requires a widget type");
                if (a.widget.nestId.has_value() && a.widget.nestId->isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "AddWidgetAction nestId must not be empty when present");

                auto boundsOk = validateBounds(a.widget.bounds, "AddWidgetAction");
                if (boundsOk.failed())
                    return boundsOk;

                return GridResult::fromResult(validatePropertyBag(a.widget.config), GridError::invalidArgument);
            }
            else if constexpr (std::is_same_v<T, AddNestAction>)
            {
                if (a.nest.parentNestId.has_value() && a.nest.parentNestId->isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "AddNestAction parentNestId must not be empty when present");

                return validateBounds(a.nest.bounds, "AddNestAction");
            }
            else if constexpr (std::is_same_v<T, UpdateItemAction>)
            {
                if (a.id.isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "UpdateItemAction requires an id");

                if (!a.bounds.has_value() && !a.title.has_value() && !a.content.has_value() && a.configPatch.size() == 0)
                    return GridResult::fail(GridError::invalidArgument, "UpdateItemAction requires at least one field");

                if (a.bounds.has_value())
                {
                    auto boundsOk = validateBounds(*a.bounds, "UpdateItemAction");
                    if (boundsOk.failed())
                        return boundsOk;
                }

                return GridResult::fromResult(validatePropertyBag(a.configPatch), GridError::invalidArgument);
            }
            else if constexpr (std::is_same_v<T, SetItemsBoundsAction>)
            {
                if (a.items.empty())
                    return GridResult::fail(GridError::invalidArgument, "SetItemsBoundsAction requires non-empty items");

                std::vector<ItemId> ids;
                ids.reserve(a.items.size());

                for (const auto& item : a.items)
                {
                    if (item.id.isEmpty())
                        return GridResult::fail(GridError::invalidArgument, "SetItemsBoundsAction item.id must not be empty");

                    auto boundsOk = validateBounds(item.bounds, "SetItemsBoundsAction");
                    if (boundsOk.failed())
                        return boundsOk;

                    ids.push_back(item.id);
                }

                std::sort(ids.begin(), ids.end());
                if (std::adjacent_find(ids.begin(), ids.end()) != ids.end())
                    return GridResult::fail(GridError::invalidArgument, "SetItemsBoundsAction ids must not contain duplicates");

                return GridResult::ok();
            }
            else if constexpr (std::is_same_v<T, RemoveItemAction>)
            {
                if (a.id.isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "RemoveItemAction requires an id");

                return GridResult::ok();
            }
            else if constexpr (std::is_same_v<T, MoveBetweenContainersAction>)
            {
                if (a.id.isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "MoveBetweenContainersAction requires an id");
                if (!a.to.isMain() && a.to.nestId.isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "MoveBetweenContainersAction target nest id must not be empty");

                if (a.localBounds.has_value())
                    return validateBounds(*a.localBounds, "MoveBetweenContainersAction");

                return GridResult::ok();
            }
            else if constexpr (std::is_same_v<T, ApplyLiveValueAction>)
            {
                if (a.streamKey.trim().isEmpty())
                    return GridResult::fail(GridError::invalidArgument, "ApplyLiveValueAction requires a stream key");
                if (!isAllowedConfigValue(a.value))
                    return GridResult::fail(GridError::invalidArgument, "ApplyLiveValueAction value must be bool/int/int64/double/string");

                return GridResult::ok();
            }
            else // ReplaceStateAction
            {
                if (!std::isfinite(a.model.gridSize) || a.model.gridSize <= 0.0f)
                    return GridResult::fail(GridError::invalidArgument, "ReplaceStateAction gridSize must be > 0");

                return GridResult::ok();
            }
        }, action);
    }
} // namespace Aries
