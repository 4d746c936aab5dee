#pragma once

#include "Aries/Core/Geometry.h"
#include "Aries/Core/GridQueries.h"
#include "Aries/Core/GridValidator.h"
#include "Aries/Public/Action.h"
#include "Aries/Public/GridResult.h"
#include <algorithm>
#include <set>
#include <vector>

namespace Aries::Core::Reducer
{
    struct ReduceOutcome
    {
        std::vector<ItemId> createdIds;
        std::vector<ItemId> changedIds;
        std::vector<ItemId> removedIds;
    };

    namespace detail
    {
        inline juce::String idPrefixFor(const WidgetModel& widget)
        {
            return widget.ariesModType.isNotEmpty() ? "arieswidget" : "widget";
        }

        inline ItemId allocateId(const GridModel& model, const juce::String& prefix)
        {
            auto id = Geometry::generateUniqueId(prefix);
            while (GridQueries::containsId(model, id))
                id = Geometry::generateUniqueId(prefix);
            return id;
        }

        inline void eraseWidget(GridModel& model, const ItemId& id)
        {
            for (auto* list : { &model.mainItems, &model.nestedItems })
            {
                list->erase(std::remove_if(list->begin(),
                                           list->end(),
                                           [&id](const WidgetModel& widget)
                                           {
                                               return widget.id == id;
                                           }),
                            list->end());
            }
        }

        // Keeps the mainItems / nestedItems split consistent with each widget's nestId.
        inline void rebucketWidgets(GridModel& model)
        {
            std::vector<WidgetModel> main;
            std::vector<WidgetModel> nested;
            main.reserve(model.mainItems.size() + model.nestedItems.size());

            for (auto* list : { &model.mainItems, &model.nestedItems })
            {
                for (auto& widget : *list)
                {
                    if (widget.nestId.has_value())
                        nested.push_back(std::move(widget));
                    else
                        main.push_back(std::move(widget));
                }
            }

            model.mainItems = std::move(main);
            model.nestedItems = std::move(nested);
        }

        inline GridResult removeNest(GridModel& model,
                                     const NestModel& nest,
                                     ChildPolicy policy,
                                     juce::Time now,
                                     ReduceOutcome& outcome)
        {
            if (policy == ChildPolicy::cascade)
            {
                std::set<juce::String> doomed { nest.id };
                for (const auto& descendant : GridQueries::descendantNestIds(model, nest.id))
                    doomed.insert(descendant);

                for (auto& widget : model.nestedItems)
                {
                    if (widget.nestId.has_value() && doomed.count(*widget.nestId) > 0)
                        outcome.removedIds.push_back(widget.id);
                }

                model.nestedItems.erase(std::remove_if(model.nestedItems.begin(),
                                                       model.nestedItems.end(),
                                                       [&doomed](const WidgetModel& widget)
                                                       {
                                                           return widget.nestId.has_value() && doomed.count(*widget.nestId) > 0;
                                                       }),
                                        model.nestedItems.end());

                for (const auto& nestId : doomed)
                {
                    if (nestId != nest.id)
                        outcome.removedIds.push_back(nestId);
                }

                model.nestContainers.erase(std::remove_if(model.nestContainers.begin(),
                                                          model.nestContainers.end(),
                                                          [&doomed](const NestModel& candidate)
                                                          {
                                                              return doomed.count(candidate.id) > 0;
                                                          }),
                                           model.nestContainers.end());

                outcome.removedIds.push_back(nest.id);
                return GridResult::ok();
            }

            // Promote: direct children move to the nest's own container with unchanged absolute position.
            const auto offset = nest.bounds.getPosition() + juce::Point<float>(0.0f, kNestHeaderHeight);
            const auto parent = nest.parentNestId;

            for (auto& widget : model.nestedItems)
            {
                if (widget.nestId != nest.id)
                    continue;

                widget.bounds = widget.bounds.translated(offset.x, offset.y);
                widget.nestId = parent;
                widget.updatedAt = now;
                outcome.changedIds.push_back(widget.id);
            }

            for (auto& child : model.nestContainers)
            {
                if (child.parentNestId != nest.id)
                    continue;

                child.bounds = child.bounds.translated(offset.x, offset.y);
                child.parentNestId = parent;
                child.updatedAt = now;
                outcome.changedIds.push_back(child.id);
            }

            const auto removedId = nest.id;
            model.nestContainers.erase(std::remove_if(model.nestContainers.begin(),
                                                      model.nestContainers.end(),
                                                      [&removedId](const NestModel& candidate)
                                                      {
                                                          return candidate.id == removedId;
                                                      }),
                                       model.nestContainers.end());

            rebucketWidgets(model);
            outcome.removedIds.push_back(removedId);
            return GridResult::ok();
        }

        inline GridResult moveBetweenContainers(GridModel& model,
                                                const MoveBetweenContainersAction& action,
                                                juce::Time now,
                                                ReduceOutcome& outcome)
        {
            const auto actual = GridQueries::containerOf(model, action.id);
            if (!actual.has_value())
                return GridResult::fail(GridError::notFound, "item not found: " + action.id);
            if (*actual != action.from)
                return GridResult::fail(GridError::invalidArgument, "item " + action.id + " is not in the given source container");
            if (!GridQueries::containerExists(model, action.to))
                return GridResult::fail(GridError::notFound, "target nest not found: " + action.to.nestId);

            const auto kind = GridQueries::kindOf(model, action.id);
            if (kind == ItemKind::nest && !action.to.isMain()
                && GridQueries::isNestAncestorOrSelf(model, action.id, action.to.nestId))
            {
                return GridResult::fail(GridError::cycle,
                                        "moving nest " + action.id + " into " + action.to.nestId + " would create a cycle");
            }

            juce::Rectangle<float> localBounds;
            if (action.localBounds.has_value())
            {
                localBounds = *action.localBounds;
            }
            else
            {
                const auto absolute = GridQueries::absoluteBoundsOf(model, action.id);
                const auto origin = GridQueries::containerOrigin(model, action.to);
                if (!absolute.has_value() || !origin.has_value())
                    return GridResult::fail(GridError::notFound, "container chain is broken for " + action.id);

                localBounds = absolute->translated(-origin->x, -origin->y);
            }

            const std::optional<ItemId> newParent = action.to.isMain() ? std::nullopt : std::optional<ItemId>(action.to.nestId);

            if (auto* widget = GridQueries::findWidget(model, action.id))
            {
                widget->bounds = localBounds;
                widget->nestId = newParent;
                widget->updatedAt = now;
                rebucketWidgets(model);
            }
            else if (auto* nest = GridQueries::findNest(model, action.id))
            {
                nest->bounds = localBounds;
                nest->parentNestId = newParent;
                nest->updatedAt = now;
            }

            outcome.changedIds.push_back(action.id);
            return GridResult::ok();
        }
    }

    inline GridResult apply(GridModel& model,
                            const Action& action,
                            juce::Time now,
                            ReduceOutcome* outcomeOut = nullptr)
    {
        const auto validation = validateAction(action);
        if (validation.failed())
            return validation;

        ReduceOutcome localOutcome;
        auto& outcome = outcomeOut != nullptr ? *outcomeOut : localOutcome;

        return std::visit([&model, &outcome, now](const auto& typedAction) -> GridResult
                          {
                              using T = std::decay_t<decltype(typedAction)>;

                              if constexpr (std::is_same_v<T, AddWidgetAction>)
                              {
                                  auto widget = typedAction.widget;
                                  if (widget.id.isEmpty())
                                      widget.id = detail::allocateId(model, detail::idPrefixFor(widget));
                                  else if (GridQueries::containsId(model, widget.id))
                                      return GridResult::fail(GridError::invalidArgument, "item id already exists: " + widget.id);

                                  if (widget.nestId.has_value() && GridQueries::findNest(model, *widget.nestId) == nullptr)
                                      return GridResult::fail(GridError::notFound, "target nest not found: " + *widget.nestId);

                                  widget.createdAt = now;
                                  widget.updatedAt = now;
                                  outcome.createdIds.push_back(widget.id);

                                  if (widget.nestId.has_value())
                                      model.nestedItems.push_back(std::move(widget));
                                  else
                                      model.mainItems.push_back(std::move(widget));

                                  return GridResult::ok();
                              }
                              else if constexpr (std::is_same_v<T, AddNestAction>)
                              {
                                  auto nest = typedAction.nest;
                                  if (nest.id.isEmpty())
                                      nest.id = detail::allocateId(model, "nest");
                                  else if (GridQueries::containsId(model, nest.id))
                                      return GridResult::fail(GridError::invalidArgument, "item id already exists: " + nest.id);

                                  if (nest.parentNestId.has_value() && GridQueries::findNest(model, *nest.parentNestId) == nullptr)
                                      return GridResult::fail(GridError::notFound, "parent nest not found: " + *nest.parentNestId);

                                  nest.createdAt = now;
                                  nest.updatedAt = now;
                                  outcome.createdIds.push_back(nest.id);
                                  model.nestContainers.push_back(std::move(nest));
                                  return GridResult::ok();
                              }
                              else if constexpr (std::is_same_v<T, UpdateItemAction>)
                              {
                                  if (auto* widget = GridQueries::findWidget(model, typedAction.id))
                                  {
                                      if (typedAction.bounds.has_value())
                                          widget->bounds = *typedAction.bounds;
                                      if (typedAction.title.has_value())
                                          widget->title = *typedAction.title;
                                      if (typedAction.content.has_value())
                                          widget->content = *typedAction.content;
                                      for (int i = 0; i < typedAction.configPatch.size(); ++i)
                                          widget->config.set(typedAction.configPatch.getName(i), typedAction.configPatch.getValueAt(i));

                                      widget->updatedAt = now;
                                  }
                                  else if (auto* nest = GridQueries::findNest(model, typedAction.id))
                                  {
                                      if (typedAction.content.has_value() || typedAction.configPatch.size() > 0)
                                          return GridResult::fail(GridError::invalidArgument, "nest containers carry no content or config");

                                      if (typedAction.bounds.has_value())
                                          nest->bounds = *typedAction.bounds;
                                      if (typedAction.title.has_value())
                                          nest->title = *typedAction.title;

                                      nest->updatedAt = now;
                                  }
                                  else
                                  {
                                      return GridResult::fail(GridError::notFound, "item not found: " + typedAction.id);
                                  }

                                  outcome.changedIds.push_back(typedAction.id);
                                  return GridResult::ok();
                              }
                              else if constexpr (std::is_same_v<T, SetItemsBoundsAction>)
                              {
                                  for (const auto& item : typedAction.items)
                                  {
                                      if (!GridQueries::containsId(model, item.id))
                                          return GridResult::fail(GridError::notFound, "item not found: " + item.id);
                                  }

                                  for (const auto& item : typedAction.items)
                                  {
                                      if (auto* widget = GridQueries::findWidget(model, item.id))
                                      {
                                          widget->bounds = item.bounds;
                                          widget->updatedAt = now;
                                      }
                                      else if (auto* nest = GridQueries::findNest(model, item.id))
                                      {
                                          nest->bounds = item.bounds;
                                          nest->updatedAt = now;
                                      }

                                      outcome.changedIds.push_back(item.id);
                                  }

                                  return GridResult::ok();
                              }
                              else if constexpr (std::is_same_v<T, RemoveItemAction>)
                              {
                                  if (GridQueries::findWidget(model, typedAction.id) != nullptr)
                                  {
                                      detail::eraseWidget(model, typedAction.id);
                                      outcome.removedIds.push_back(typedAction.id);
                                      return GridResult::ok();
                                  }

                                  const auto* nest = GridQueries::findNest(model, typedAction.id);
                                  if (nest == nullptr)
                                      return GridResult::fail(GridError::notFound, "item not found: " + typedAction.id);

                                  const auto nestCopy = *nest;
                                  return detail::removeNest(model, nestCopy, typedAction.childPolicy, now, outcome);
                              }
                              else if constexpr (std::is_same_v<T, MoveBetweenContainersAction>)
                              {
                                  return detail::moveBetweenContainers(model, typedAction, now, outcome);
                              }
                              else if constexpr (std::is_same_v<T, ApplyLiveValueAction>)
                              {
                                  const auto streamKey = typedAction.streamKey.trim();
                                  for (auto* list : { &model.mainItems, &model.nestedItems })
                                  {
                                      for (auto& widget : *list)
                                      {
                                          const auto* streamId = widget.config.getVarPointer("streamId");
                                          if (streamId == nullptr || streamId->toString() != streamKey)
                                              continue;

                                          widget.config.set("data", typedAction.value);
                                          widget.updatedAt = now;
                                          outcome.changedIds.push_back(widget.id);
                                      }
                                  }

                                  return GridResult::ok();
                              }
                              else // ReplaceStateAction
                              {
                                  const auto check = GridValidator::validateGrid(typedAction.model);
                                  if (check.failed())
                                      return check;

                                  model = typedAction.model;
                                  detail::rebucketWidgets(model);
                                  return GridResult::ok();
                              }
                          },
                          action);
    }
}
