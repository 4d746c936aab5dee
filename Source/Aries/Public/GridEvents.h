#pragma once

#include "Aries/Public/Action.h"
#include <optional>
#include <vector>

namespace Aries
{
    enum class GridEventType
    {
        itemCreated,
        itemUpdated,
        itemRemoved,
        itemTransferred,
        stateReplaced,
        liveValueApplied,
        viewportChanged
    };

    inline juce::String gridEventTypeName(GridEventType type)
    {
        switch (type)
        {
            case GridEventType::itemCreated: return "itemCreated";
            case GridEventType::itemUpdated: return "itemUpdated";
            case GridEventType::itemRemoved: return "itemRemoved";
            case GridEventType::itemTransferred: return "itemTransferred";
            case GridEventType::stateReplaced: return "stateReplaced";
            case GridEventType::liveValueApplied: return "liveValueApplied";
            case GridEventType::viewportChanged: return "viewportChanged";
        }

        return "unknown";
    }

    struct GridEvent
    {
        GridEventType type = GridEventType::itemUpdated;
        MutationPhase phase = MutationPhase::settled;
        std::vector<ItemId> ids;
        int widgetCount = 0;
        std::optional<ReplaceOrigin> replaceOrigin;
        std::optional<ContainerRef> targetContainer;

        bool isSettled() const noexcept { return phase == MutationPhase::settled; }
    };
}
