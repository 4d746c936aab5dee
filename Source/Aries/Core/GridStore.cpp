#include "Aries/Core/GridStore.h"

namespace Aries::Core
{
    namespace
    {
        GridEventType eventTypeFor(ActionKind kind) noexcept
        {
            switch (kind)
            {
                case ActionKind::addWidget:
                case ActionKind::addNest:
                    return GridEventType::itemCreated;
                case ActionKind::removeItem:
                    return GridEventType::itemRemoved;
                case ActionKind::moveBetweenContainers:
                    return GridEventType::itemTransferred;
                case ActionKind::applyLiveValue:
                    return GridEventType::liveValueApplied;
                case ActionKind::replaceState:
                    return GridEventType::stateReplaced;
                case ActionKind::updateItem:
                case ActionKind::setItemsBounds:
                    break;
            }

            return GridEventType::itemUpdated;
        }
    }

    GridStore::GridStore()
        : GridStore(GridModel {})
    {
    }

    GridStore::GridStore(GridModel initialModel)
        : modelState(std::make_shared<const GridModel>(std::move(initialModel))),
          clock([] { return juce::Time::getCurrentTime(); })
    {
    }

    void GridStore::setClock(Clock newClock)
    {
        if (newClock != nullptr)
            clock = std::move(newClock);
    }

    juce::Time GridStore::now() const
    {
        return clock();
    }

    std::shared_ptr<const GridModel> GridStore::snapshot() const noexcept
    {
        return modelState;
    }

    const GridModel& GridStore::model() const noexcept
    {
        return *modelState;
    }

    const Viewport& GridStore::viewport() const noexcept
    {
        return viewportState;
    }

    int GridStore::widgetCount() const noexcept
    {
        return GridQueries::widgetCount(*modelState);
    }

    GridResult GridStore::dispatch(const Action& action,
                                   MutationPhase phase,
                                   std::vector<ItemId>* createdIdsOut)
    {
        auto next = std::make_shared<GridModel>(*modelState);
        Reducer::ReduceOutcome outcome;

        const auto result = Reducer::apply(*next, action, clock(), &outcome);
        if (result.failed())
            return result;

        const auto kind = getActionKind(action);
        if (kind == ActionKind::applyLiveValue && outcome.changedIds.empty())
            return result;

        modelState = std::move(next);

        if (createdIdsOut != nullptr)
            *createdIdsOut = outcome.createdIds;

        GridEvent event;
        event.type = eventTypeFor(kind);
        event.phase = phase;
        event.widgetCount = widgetCount();

        if (const auto* replace = std::get_if<ReplaceStateAction>(&action))
            event.replaceOrigin = replace->origin;
        if (const auto* move = std::get_if<MoveBetweenContainersAction>(&action))
            event.targetContainer = move->to;

        event.ids = outcome.createdIds;
        event.ids.insert(event.ids.end(), outcome.changedIds.begin(), outcome.changedIds.end());
        event.ids.insert(event.ids.end(), outcome.removedIds.begin(), outcome.removedIds.end());

        publish(event);
        return result;
    }

    GridResult GridStore::addItem(const WidgetModel& widget, MutationPhase phase, ItemId* createdIdOut)
    {
        std::vector<ItemId> created;
        const auto result = dispatch(AddWidgetAction { widget }, phase, &created);
        if (result.wasOk() && createdIdOut != nullptr && !created.empty())
            *createdIdOut = created.front();
        return result;
    }

    GridResult GridStore::addItem(const NestModel& nest, MutationPhase phase, ItemId* createdIdOut)
    {
        std::vector<ItemId> created;
        const auto result = dispatch(AddNestAction { nest }, phase, &created);
        if (result.wasOk() && createdIdOut != nullptr && !created.empty())
            *createdIdOut = created.front();
        return result;
    }

    GridResult GridStore::updateItem(const UpdateItemAction& partial, MutationPhase phase)
    {
        return dispatch(partial, phase);
    }

    GridResult GridStore::removeItem(const ItemId& id, ChildPolicy policy)
    {
        return dispatch(RemoveItemAction { id, policy });
    }

    GridResult GridStore::moveItemBetweenContainers(const ItemId& id,
                                                    const ContainerRef& from,
                                                    const ContainerRef& to,
                                                    std::optional<juce::Rectangle<float>> localBounds,
                                                    MutationPhase phase)
    {
        MoveBetweenContainersAction action;
        action.id = id;
        action.from = from;
        action.to = to;
        action.localBounds = localBounds;
        return dispatch(action, phase);
    }

    void GridStore::setViewport(const Viewport& next, MutationPhase phase)
    {
        Viewport clamped = next;
        clamped.zoom = clampZoom(next.zoom);
        if (!std::isfinite(clamped.x) || !std::isfinite(clamped.y))
            return;
        if (clamped == viewportState)
            return;

        viewportState = clamped;

        GridEvent event;
        event.type = GridEventType::viewportChanged;
        event.phase = phase;
        event.widgetCount = widgetCount();
        publish(event);
    }

    GridResult GridStore::replaceState(const GridModel& next,
                                       ReplaceOrigin origin,
                                       std::optional<Viewport> nextViewport)
    {
        if (nextViewport.has_value())
        {
            if (!std::isfinite(nextViewport->x) || !std::isfinite(nextViewport->y))
                return GridResult::fail(GridError::invalidArgument, "viewport must be finite");
        }

        ReplaceStateAction action;
        action.model = next;
        action.origin = origin;

        auto candidate = std::make_shared<GridModel>(*modelState);
        const auto result = Reducer::apply(*candidate, action, clock());
        if (result.failed())
            return result;

        modelState = std::move(candidate);
        if (nextViewport.has_value())
        {
            viewportState = *nextViewport;
            viewportState.zoom = clampZoom(nextViewport->zoom);
        }

        GridEvent event;
        event.type = GridEventType::stateReplaced;
        event.phase = MutationPhase::settled;
        event.widgetCount = widgetCount();
        event.replaceOrigin = origin;
        publish(event);
        return result;
    }

    void GridStore::addListener(Listener* listener)
    {
        listeners.add(listener);
    }

    void GridStore::removeListener(Listener* listener)
    {
        listeners.remove(listener);
    }

    void GridStore::publish(const GridEvent& event)
    {
        listeners.call([&event](Listener& listener)
                       {
                           listener.gridChanged(event);
                       });
    }
}
