#include "Aries/Editor/Interaction/InteractionController.h"

#include "Aries/Core/Geometry.h"
#include "Aries/Core/GridQueries.h"

#include <algorithm>

namespace Aries::Editor::Interaction
{
    namespace
    {
        constexpr auto kLogCategory = "Interaction";

        ContainerRef containerFor(const std::optional<ItemId>& nestId)
        {
            return nestId.has_value() ? ContainerRef::nest(*nestId) : ContainerRef::main();
        }

        juce::String describeContainer(const ContainerRef& container)
        {
            return container.isMain() ? juce::String("main") : "nest " + container.nestId;
        }

        void appendPushes(SetItemsBoundsAction& batch,
                          const std::vector<Core::Geometry::PushOutcome>& outcomes,
                          std::set<ItemId>& pushedOut)
        {
            for (const auto& outcome : outcomes)
            {
                if (!outcome.pushed)
                    continue;

                batch.items.push_back({ outcome.id, outcome.bounds });
                pushedOut.insert(outcome.id);
            }
        }
    }

    juce::String gestureStateName(GestureState state)
    {
        switch (state)
        {
            case GestureState::idle: return "idle";
            case GestureState::dragging: return "dragging";
            case GestureState::resizing: return "resizing";
            case GestureState::panning: return "panning";
        }

        return "idle";
    }

    InteractionController::InteractionController(Core::GridStore& storeIn,
                                                 ViewportController& viewportIn,
                                                 Runtime::EngineDiagnostics& diagnosticsIn)
        : store(storeIn),
          viewport(viewportIn),
          diagnostics(diagnosticsIn)
    {
    }

    void InteractionController::setSettings(const InteractionSettings& nextSettings) noexcept
    {
        interactionSettings = nextSettings;
        interactionSettings.throttleMs = std::max(0, interactionSettings.throttleMs);
    }

    const InteractionSettings& InteractionController::settings() const noexcept
    {
        return interactionSettings;
    }

    bool InteractionController::isPanTrigger(const PointerEvent& pointer) noexcept
    {
        return pointer.button == PointerButton::middle
            || (pointer.button == PointerButton::primary && pointer.ctrl);
    }

    GridResult InteractionController::beginDrag(const ItemId& id, ItemKind kind, const PointerEvent& pointer)
    {
        if (gestureState != GestureState::idle)
            return GridResult::fail(GridError::invalidArgument, "another gesture is active");

        const auto& model = store.model();
        const auto actualKind = Core::GridQueries::kindOf(model, id);
        const auto absolute = Core::GridQueries::absoluteBoundsOf(model, id);
        const auto container = Core::GridQueries::containerOf(model, id);
        if (!actualKind.has_value() || !absolute.has_value() || !container.has_value())
        {
            diagnostics.trace(kLogCategory, "Drag ignored, item not found: " + id);
            return GridResult::fail(GridError::gestureAbort, "item not found: " + id);
        }

        if (*actualKind != kind)
            return GridResult::fail(GridError::invalidArgument, "item kind mismatch for " + id);

        resetGesture();

        drag.isDragging = true;
        drag.draggedId = id;
        drag.draggedType = kind;
        drag.sourceContainer = *container;
        drag.startAbsolutePosition = absolute->getPosition();
        drag.pointerOffset = toWorld(pointer.position) - absolute->getPosition();

        rememberStartBounds(id);
        gestureState = GestureState::dragging;
        lastProcessedMs = pointer.timeMs;

        diagnostics.trace(kLogCategory, "Drag started: " + id + " from " + describeContainer(*container));
        return GridResult::ok();
    }

    GridResult InteractionController::beginResize(const ItemId& id,
                                                  ItemKind kind,
                                                  ResizeHandle handle,
                                                  const PointerEvent& pointer)
    {
        if (gestureState != GestureState::idle)
            return GridResult::fail(GridError::invalidArgument, "another gesture is active");

        const auto& model = store.model();
        const auto actualKind = Core::GridQueries::kindOf(model, id);
        const auto local = Core::GridQueries::localBoundsOf(model, id);
        if (!actualKind.has_value() || !local.has_value())
        {
            diagnostics.trace(kLogCategory, "Resize ignored, item not found: " + id);
            return GridResult::fail(GridError::gestureAbort, "item not found: " + id);
        }

        if (*actualKind != kind)
            return GridResult::fail(GridError::invalidArgument, "item kind mismatch for " + id);

        resetGesture();

        resize.isResizing = true;
        resize.resizedId = id;
        resize.resizedType = kind;
        resize.handle = handle;
        resize.startPointer = toWorld(pointer.position);
        resize.startSize = { local->getWidth(), local->getHeight() };
        resize.startPosition = local->getPosition();

        rememberStartBounds(id);
        gestureState = GestureState::resizing;
        lastProcessedMs = pointer.timeMs;

        diagnostics.trace(kLogCategory, "Resize started: " + id + " handle " + resizeHandleName(handle));
        return GridResult::ok();
    }

    GridResult InteractionController::beginPan(const PointerEvent& pointer)
    {
        if (gestureState != GestureState::idle)
            return GridResult::fail(GridError::invalidArgument, "another gesture is active");
        if (!isPanTrigger(pointer))
            return GridResult::fail(GridError::invalidArgument, "pan needs the middle button or ctrl+primary");

        resetGesture();
        gestureState = GestureState::panning;
        lastPanPoint = pointer.position;
        lastProcessedMs = pointer.timeMs;
        return GridResult::ok();
    }

    void InteractionController::updatePointer(const PointerEvent& pointer)
    {
        if (gestureState == GestureState::idle)
            return;

        if (lastProcessedMs.has_value() && pointer.timeMs - *lastProcessedMs < interactionSettings.throttleMs)
        {
            pendingMove = pointer;
            return;
        }

        processMove(pointer);
    }

    void InteractionController::tick(juce::int64 nowMs)
    {
        if (!pendingMove.has_value() || gestureState == GestureState::idle)
            return;

        if (!lastProcessedMs.has_value() || nowMs - *lastProcessedMs >= interactionSettings.throttleMs)
            processMove(*pendingMove);
    }

    GridResult InteractionController::endGesture()
    {
        if (gestureState == GestureState::idle)
            return GridResult::ok();

        if (pendingMove.has_value())
        {
            processMove(*pendingMove);
            if (gestureState == GestureState::idle)
                return GridResult::fail(GridError::gestureAbort, "gesture aborted");
        }

        switch (gestureState)
        {
            case GestureState::dragging: return finishDrag();
            case GestureState::resizing: return finishResize();
            case GestureState::panning:
            case GestureState::idle:
                break;
        }

        resetGesture();
        return GridResult::ok();
    }

    void InteractionController::focusLost()
    {
        const auto result = endGesture();
        if (result.failed())
            diagnostics.trace(kLogCategory, "Gesture ended on focus loss: " + result.getErrorMessage());
    }

    GridResult InteractionController::dropFromPalette(const juce::String& payloadJson,
                                                      const PointerEvent& pointer,
                                                      const std::optional<ItemId>& targetNestId,
                                                      ItemId* createdIdOut)
    {
        if (gestureState != GestureState::idle)
            return GridResult::fail(GridError::invalidArgument, "another gesture is active");

        juce::var payload;
        const auto parsed = juce::JSON::parse(payloadJson, payload);
        if (parsed.failed() || payload.getDynamicObject() == nullptr)
            return GridResult::fail(GridError::parse, "drop payload is not a JSON object");

        const auto type = payload.getProperty("type", {}).toString().trim();
        if (type.isEmpty())
            return GridResult::fail(GridError::invalidArgument, "drop payload has no type");

        const auto defaultSize = payload.getProperty("defaultSize", {});
        const auto widthVar = defaultSize.getProperty("w", {});
        const auto heightVar = defaultSize.getProperty("h", {});
        if (!isNumericVar(widthVar) || !isNumericVar(heightVar))
            return GridResult::fail(GridError::geometry, "drop payload defaultSize needs numeric w and h");

        const auto width = static_cast<float>(static_cast<double>(widthVar));
        const auto height = static_cast<float>(static_cast<double>(heightVar));
        if (!isValidItemBounds({ 0.0f, 0.0f, width, height }))
            return GridResult::fail(GridError::geometry, "drop payload defaultSize must be positive");

        const auto& model = store.model();
        const auto container = containerFor(targetNestId);
        if (!Core::GridQueries::containerExists(model, container))
            return GridResult::fail(GridError::notFound, "drop target not found: " + container.nestId);

        const auto origin = Core::GridQueries::containerOrigin(model, container);
        if (!origin.has_value())
            return GridResult::fail(GridError::cycle, "drop target has a broken parent chain");

        const auto world = toWorld(pointer.position);
        const auto grid = model.gridSize;
        const juce::Rectangle<float> bounds(Core::Geometry::snapToGrid(world.x - origin->x - width * 0.5f, grid),
                                            Core::Geometry::snapToGrid(world.y - origin->y - height * 0.5f, grid),
                                            width,
                                            height);

        SetItemsBoundsAction pushes;
        std::set<ItemId> displaced;
        appendPushes(pushes,
                     Core::Geometry::resolvePush({ {}, bounds }, Core::GridQueries::siblingsOf(model, container, {}), grid),
                     displaced);

        SetItemsBoundsAction revert;
        for (const auto& item : pushes.items)
        {
            if (const auto previous = Core::GridQueries::localBoundsOf(model, item.id))
                revert.items.push_back({ item.id, *previous });
        }

        if (!pushes.items.empty())
        {
            const auto pushResult = store.dispatch(pushes, MutationPhase::transient);
            if (pushResult.failed())
                return pushResult;
        }

        WidgetModel widget;
        widget.type = type;
        widget.title = payload.getProperty("title", {}).toString().trim();
        if (widget.title.isEmpty())
            widget.title = "New Widget";
        widget.content = Core::Geometry::defaultContentForType(type);
        widget.ariesModType = payload.getProperty("ariesModType", {}).toString().trim();
        widget.bounds = bounds;
        widget.nestId = targetNestId;

        ItemId createdId;
        const auto added = store.addItem(widget, MutationPhase::settled, &createdId);
        if (added.failed())
        {
            if (!revert.items.empty())
            {
                const auto reverted = store.dispatch(revert, MutationPhase::transient);
                if (reverted.failed())
                    diagnostics.error(kLogCategory, "Reverting drop pushes failed: " + reverted.getErrorMessage());
            }

            diagnostics.warning(kLogCategory, "Drop rejected: " + added.getErrorMessage());
            return added;
        }

        if (createdIdOut != nullptr)
            *createdIdOut = createdId;

        diagnostics.info(kLogCategory,
                         "Dropped " + type + " widget " + createdId + " into " + describeContainer(container)
                             + " at " + juce::String(bounds.getX()) + "," + juce::String(bounds.getY())
                             + (displaced.empty() ? juce::String() : ", pushed " + juce::String(static_cast<int>(displaced.size()))));
        return added;
    }

    std::vector<ItemId> InteractionController::alwaysVisibleIds() const
    {
        std::vector<ItemId> ids;
        if (drag.isDragging)
            ids.push_back(drag.draggedId);
        if (resize.isResizing)
            ids.push_back(resize.resizedId);
        return ids;
    }

    void InteractionController::processMove(const PointerEvent& pointer)
    {
        pendingMove.reset();
        lastProcessedMs = pointer.timeMs;

        switch (gestureState)
        {
            case GestureState::dragging: processDragMove(pointer); break;
            case GestureState::resizing: processResizeMove(pointer); break;
            case GestureState::panning: processPanMove(pointer); break;
            case GestureState::idle: break;
        }
    }

    void InteractionController::processDragMove(const PointerEvent& pointer)
    {
        const auto& model = store.model();
        const auto& id = drag.draggedId;

        const auto local = Core::GridQueries::localBoundsOf(model, id);
        const auto origin = Core::GridQueries::containerOrigin(model, drag.sourceContainer);
        if (!local.has_value() || !origin.has_value())
        {
            abortGesture("drag context lost for " + id);
            return;
        }

        // Smooth candidate; rounding happens at commit.
        const auto absoluteTopLeft = toWorld(pointer.position) - drag.pointerOffset;
        const auto candidate = local->withPosition(absoluteTopLeft - *origin);
        const auto absoluteCentre = absoluteTopLeft + juce::Point<float>(local->getWidth() * 0.5f, local->getHeight() * 0.5f);

        const auto exclude = drag.draggedType == ItemKind::nest ? std::optional<ItemId>(id) : std::nullopt;
        const auto hover = Core::GridQueries::deepestNestAt(model, absoluteCentre, exclude);
        const auto hoverContainer = containerFor(hover);

        SetItemsBoundsAction batch;
        batch.items.push_back({ id, candidate });

        if (hoverContainer == drag.sourceContainer)
        {
            dragOverNest.reset();

            const auto outcomes = Core::Geometry::resolvePush({ id, candidate },
                                                              Core::GridQueries::siblingsOf(model, drag.sourceContainer, id),
                                                              model.gridSize);
            for (const auto& outcome : outcomes)
            {
                if (outcome.pushed)
                    rememberStartBounds(outcome.id);
            }

            appendPushes(batch, outcomes, pushed);
        }
        else
        {
            dragOverNest = hover;
        }

        const auto result = store.dispatch(batch, MutationPhase::transient);
        if (result.failed())
            abortGesture(result.getErrorMessage());
    }

    void InteractionController::processResizeMove(const PointerEvent& pointer)
    {
        const auto& model = store.model();
        const auto& id = resize.resizedId;
        const auto container = Core::GridQueries::containerOf(model, id);
        if (!container.has_value() || !Core::GridQueries::containerExists(model, *container))
        {
            abortGesture("resize context lost for " + id);
            return;
        }

        ResizeRequest request;
        request.startBounds = { resize.startPosition.x, resize.startPosition.y, resize.startSize.x, resize.startSize.y };
        request.pointerDelta = toWorld(pointer.position) - resize.startPointer;
        request.handle = resize.handle;
        request.kind = resize.resizedType;
        request.gridSize = model.gridSize;

        const auto next = ResizeEngine::compute(request);

        SetItemsBoundsAction batch;
        batch.items.push_back({ id, next });

        const auto outcomes = Core::Geometry::resolvePush({ id, next },
                                                          Core::GridQueries::siblingsOf(model, *container, id),
                                                          model.gridSize);
        for (const auto& outcome : outcomes)
        {
            if (outcome.pushed)
                rememberStartBounds(outcome.id);
        }

        appendPushes(batch, outcomes, pushed);

        const auto result = store.dispatch(batch, MutationPhase::transient);
        if (result.failed())
            abortGesture(result.getErrorMessage());
    }

    void InteractionController::processPanMove(const PointerEvent& pointer)
    {
        const auto delta = pointer.position - lastPanPoint;
        lastPanPoint = pointer.position;

        if (delta.x != 0.0f || delta.y != 0.0f)
            viewport.panBy(delta);
    }

    GridResult InteractionController::finishDrag()
    {
        const auto id = drag.draggedId;
        const auto source = drag.sourceContainer;

        const auto absolute = Core::GridQueries::absoluteBoundsOf(store.model(), id);
        if (!absolute.has_value())
            return abortGesture("dragged item vanished: " + id);

        const auto exclude = drag.draggedType == ItemKind::nest ? std::optional<ItemId>(id) : std::nullopt;
        const auto target = containerFor(Core::GridQueries::deepestNestAt(store.model(), absolute->getCentre(), exclude));

        auto finalContainer = source;
        if (target != source)
        {
            const auto transfer = store.moveItemBetweenContainers(id, source, target, std::nullopt, MutationPhase::transient);
            if (transfer.wasOk())
            {
                finalContainer = target;
                diagnostics.info(kLogCategory,
                                 "Transferred " + id + " from " + describeContainer(source) + " to " + describeContainer(target));
            }
            else
            {
                diagnostics.warning(kLogCategory,
                                    "Transfer of " + id + " rejected (" + juce::String(transfer.errorName()) + "): "
                                        + transfer.getErrorMessage());
            }
        }

        const auto& model = store.model();
        const auto local = Core::GridQueries::localBoundsOf(model, id);
        if (!local.has_value())
            return abortGesture("dragged item vanished: " + id);

        const auto snapped = Core::Geometry::snapPosition(*local, model.gridSize);

        SetItemsBoundsAction batch;
        batch.items.push_back({ id, snapped });

        if (finalContainer == source)
        {
            appendPushes(batch,
                         Core::Geometry::resolvePush({ id, snapped },
                                                     Core::GridQueries::siblingsOf(model, finalContainer, id),
                                                     model.gridSize),
                         pushed);
        }
        else if (interactionSettings.autoGrowNests && !finalContainer.isMain())
        {
            std::vector<juce::Rectangle<float>> children;
            for (const auto& child : Core::GridQueries::childrenOf(model, finalContainer))
                children.push_back(child.id == id ? snapped : child.bounds);

            if (const auto* nest = Core::GridQueries::findNest(model, finalContainer.nestId))
            {
                const auto wanted = Core::Geometry::nestAutoSize(children, model.gridSize, interactionSettings.nestAutoSize);
                const auto grown = nest->bounds.withSize(std::max(nest->bounds.getWidth(), wanted.width),
                                                         std::max(nest->bounds.getHeight(), wanted.height));
                if (grown != nest->bounds)
                    batch.items.push_back({ nest->id, grown });
            }
        }

        // Items pushed in earlier frames belong to this commit as well.
        for (const auto& pushedId : pushed)
        {
            const auto alreadyListed = std::any_of(batch.items.begin(),
                                                   batch.items.end(),
                                                   [&pushedId](const SetItemsBoundsAction::Item& item)
                                                   {
                                                       return item.id == pushedId;
                                                   });
            if (alreadyListed)
                continue;

            if (const auto bounds = Core::GridQueries::localBoundsOf(model, pushedId))
                batch.items.push_back({ pushedId, *bounds });
        }

        const auto result = store.dispatch(batch, MutationPhase::settled);
        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Drag commit failed: " + result.getErrorMessage());
            return abortGesture(result.getErrorMessage());
        }

        diagnostics.trace(kLogCategory,
                          "Drag committed: " + id + " at " + juce::String(snapped.getX()) + "," + juce::String(snapped.getY())
                              + " in " + describeContainer(finalContainer));
        resetGesture();
        return result;
    }

    GridResult InteractionController::finishResize()
    {
        const auto id = resize.resizedId;
        const auto& model = store.model();
        const auto local = Core::GridQueries::localBoundsOf(model, id);
        if (!local.has_value())
            return abortGesture("resized item vanished: " + id);

        SetItemsBoundsAction batch;
        batch.items.push_back({ id, *local });
        for (const auto& pushedId : pushed)
        {
            if (const auto bounds = Core::GridQueries::localBoundsOf(model, pushedId))
                batch.items.push_back({ pushedId, *bounds });
        }

        const auto result = store.dispatch(batch, MutationPhase::settled);
        if (result.failed())
        {
            diagnostics.error(kLogCategory, "Resize commit failed: " + result.getErrorMessage());
            return abortGesture(result.getErrorMessage());
        }

        diagnostics.trace(kLogCategory,
                          "Resize committed: " + id + " to " + juce::String(local->getWidth()) + "x" + juce::String(local->getHeight()));
        resetGesture();
        return result;
    }

    GridResult InteractionController::abortGesture(const juce::String& reason)
    {
        const auto& model = store.model();

        SetItemsBoundsAction revert;
        for (const auto& [id, bounds] : startBounds)
        {
            if (!Core::GridQueries::containsId(model, id))
                continue;

            // A transferred item lives in another coordinate space now.
            if (drag.isDragging && id == drag.draggedId
                && Core::GridQueries::containerOf(model, id) != std::optional<ContainerRef>(drag.sourceContainer))
                continue;

            revert.items.push_back({ id, bounds });
        }

        if (!revert.items.empty())
        {
            const auto reverted = store.dispatch(revert, MutationPhase::transient);
            if (reverted.failed())
                diagnostics.trace(kLogCategory, "Gesture revert failed: " + reverted.getErrorMessage());
        }

        diagnostics.trace(kLogCategory, "Gesture aborted: " + reason);
        resetGesture();
        return GridResult::fail(GridError::gestureAbort, reason);
    }

    void InteractionController::rememberStartBounds(const ItemId& id)
    {
        if (startBounds.count(id) > 0)
            return;

        if (const auto bounds = Core::GridQueries::localBoundsOf(store.model(), id))
            startBounds.emplace(id, *bounds);
    }

    void InteractionController::resetGesture()
    {
        gestureState = GestureState::idle;
        drag = {};
        resize = {};
        pushed.clear();
        dragOverNest.reset();
        startBounds.clear();
        pendingMove.reset();
        lastProcessedMs.reset();
    }

    juce::Point<float> InteractionController::toWorld(juce::Point<float> screen) const noexcept
    {
        return ViewportController::screenToWorld(store.viewport(), screen);
    }
}
