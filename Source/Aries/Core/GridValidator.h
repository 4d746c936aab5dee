#pragma once

#include "Aries/Public/GridResult.h"
#include "Aries/Public/Types.h"
#include <algorithm>
#include <cmath>
#include <map>
#include <set>
#include <vector>

namespace Aries::Core::GridValidator
{
    inline juce::Result validateSchemaVersion(const SchemaVersion& version)
    {
        const auto current = currentSchemaVersion();
        if (version.major != current.major)
            return juce::Result::fail("schema.major mismatch");

        if (compareSchemaVersion(version, current) > 0)
            return juce::Result::fail("schema is newer than runtime");

        return juce::Result::ok();
    }

    inline GridResult validateItemBounds(const juce::Rectangle<float>& bounds, const juce::String& what)
    {
        if (!isFiniteBounds(bounds))
            return GridResult::fail(GridError::geometry, what + " bounds must be finite");
        if (bounds.getWidth() <= 0.0f || bounds.getHeight() <= 0.0f)
            return GridResult::fail(GridError::geometry, what + " bounds width/height must be > 0");

        return GridResult::ok();
    }

    // Walks every parentNestId chain; a chain that revisits a nest is a cycle.
    inline GridResult validateNestTree(const std::vector<NestModel>& nests)
    {
        std::map<juce::String, const NestModel*> nestById;
        for (const auto& nest : nests)
            nestById.emplace(nest.id, &nest);

        for (const auto& nest : nests)
        {
            std::set<juce::String> chain;
            const NestModel* current = &nest;

            while (current != nullptr)
            {
                if (!chain.insert(current->id).second)
                    return GridResult::fail(GridError::cycle, "nest container cycle detected at " + nest.id);

                if (!current->parentNestId.has_value())
                    break;

                const auto parentIt = nestById.find(*current->parentNestId);
                if (parentIt == nestById.end())
                    return GridResult::fail(GridError::invalidArgument,
                                            "nest " + current->id + " references missing parent " + *current->parentNestId);

                current = parentIt->second;
            }
        }

        return GridResult::ok();
    }

    inline GridResult validateGrid(const GridModel& model)
    {
        const auto schemaCheck = validateSchemaVersion(model.schemaVersion);
        if (schemaCheck.failed())
            return GridResult::fromResult(schemaCheck, GridError::invalidArgument);

        if (!std::isfinite(model.gridSize) || model.gridSize <= 0.0f)
            return GridResult::fail(GridError::invalidArgument, "gridSize must be > 0");

        std::set<juce::String> ids;
        const auto claimId = [&ids](const ItemId& id) -> GridResult
        {
            if (id.trim().isEmpty())
                return GridResult::fail(GridError::invalidArgument, "item id must not be empty");
            if (!ids.insert(id).second)
                return GridResult::fail(GridError::invalidArgument, "duplicate item id: " + id);

            return GridResult::ok();
        };

        std::set<juce::String> nestIds;
        for (const auto& nest : model.nestContainers)
        {
            auto idCheck = claimId(nest.id);
            if (idCheck.failed())
                return idCheck;

            auto boundsCheck = validateItemBounds(nest.bounds, "nest " + nest.id);
            if (boundsCheck.failed())
                return boundsCheck;

            if (nest.parentNestId.has_value() && *nest.parentNestId == nest.id)
                return GridResult::fail(GridError::cycle, "nest " + nest.id + " is its own parent");

            nestIds.insert(nest.id);
        }

        const auto validateWidget = [&](const WidgetModel& widget, bool expectNested) -> GridResult
        {
            auto idCheck = claimId(widget.id);
            if (idCheck.failed())
                return idCheck;

            auto boundsCheck = validateItemBounds(widget.bounds, "widget " + widget.id);
            if (boundsCheck.failed())
                return boundsCheck;

            if (expectNested != widget.nestId.has_value())
                return GridResult::fail(GridError::invalidArgument,
                                        "widget " + widget.id + (expectNested ? " in nestedItems has no nestId"
                                                                              : " in mainItems has a nestId"));

            if (widget.nestId.has_value() && nestIds.count(*widget.nestId) == 0)
                return GridResult::fail(GridError::invalidArgument,
                                        "widget " + widget.id + " references missing nest " + *widget.nestId);

            const auto configCheck = validatePropertyBag(widget.config);
            if (configCheck.failed())
                return GridResult::fail(GridError::invalidArgument,
                                        "invalid config for widget " + widget.id + ": " + configCheck.getErrorMessage());

            return GridResult::ok();
        };

        for (const auto& widget : model.mainItems)
        {
            auto check = validateWidget(widget, false);
            if (check.failed())
                return check;
        }

        for (const auto& widget : model.nestedItems)
        {
            auto check = validateWidget(widget, true);
            if (check.failed())
                return check;
        }

        return validateNestTree(model.nestContainers);
    }
}
