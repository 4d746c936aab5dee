#include "SmokeSupport.h"

namespace AriesSmoke
{
    namespace
    {
        using Aries::GridError;
        using Aries::Editor::Interaction::GestureState;
        using Aries::Editor::Interaction::PointerButton;
        using Aries::Editor::Interaction::ResizeHandle;

        bool isOnGrid(const juce::Rectangle<float>& bounds, float grid)
        {
            const auto onGrid = [grid](float value)
            {
                return nearlyEqual(std::fmod(std::fabs(value), grid), 0.0f);
            };

            return onGrid(bounds.getX()) && onGrid(bounds.getY());
        }

        juce::Result testPaletteDropPushesNeighbour()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            if (handle.store().addItem(makeWidget("a", { 100.0f, 100.0f, 200.0f, 150.0f })).failed())
                return juce::Result::fail("seed failed");

            Aries::ItemId dropped;
            const auto result = handle.interaction().dropFromPalette(R"({"type":"sensor","title":"T","defaultSize":{"w":40,"h":40}})",
                                                                     pointerAt(150.0f, 120.0f),
                                                                     std::nullopt,
                                                                     &dropped);
            if (result.failed())
                return failWith("drop failed", result);

            const auto& model = handle.model();
            const auto* widget = Aries::Core::GridQueries::findWidget(model, dropped);
            if (widget == nullptr || !sameRect(widget->bounds, { 140.0f, 100.0f, 40.0f, 40.0f }))
                return juce::Result::fail("dropped widget should land at (140,100)");
            if (widget->title != "T" || widget->type != "sensor" || widget->content.isEmpty())
                return juce::Result::fail("dropped widget fields mismatch");

            const auto pushed = boundsOf(model, "a");
            if (!pushed.has_value() || !sameRect(*pushed, { 100.0f, 140.0f, 200.0f, 150.0f }))
                return juce::Result::fail("neighbour should be pushed down to y=140, got "
                                          + (pushed.has_value() ? describe(*pushed) : juce::String("nothing")));

            if (handle.undo().failed())
                return juce::Result::fail("undo failed");

            const auto restored = boundsOf(handle.model(), "a");
            if (handle.widgetCount() != 1 || !restored.has_value() || !sameRect(*restored, { 100.0f, 100.0f, 200.0f, 150.0f }))
                return juce::Result::fail("one undo should revert the drop and its push");

            return juce::Result::ok();
        }

        juce::Result testPaletteDropRejectsBadPayloads()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            auto& interaction = handle.interaction();
            const auto pointer = pointerAt(100.0f, 100.0f);

            if (interaction.dropFromPalette("not json", pointer).error != GridError::parse)
                return juce::Result::fail("malformed payload must be a ParseError");
            if (interaction.dropFromPalette(R"({"defaultSize":{"w":40,"h":40}})", pointer).error != GridError::invalidArgument)
                return juce::Result::fail("payload without type must be rejected");
            if (interaction.dropFromPalette(R"({"type":"gauge"})", pointer).error != GridError::geometry)
                return juce::Result::fail("payload without size must be a geometry error");
            if (interaction.dropFromPalette(R"({"type":"gauge","defaultSize":{"w":0,"h":40}})", pointer).error != GridError::geometry)
                return juce::Result::fail("zero width payload must be a geometry error");
            if (interaction.dropFromPalette(R"({"type":"gauge","defaultSize":{"w":40,"h":40}})", pointer, juce::String("ghost")).error
                != GridError::notFound)
            {
                return juce::Result::fail("unknown target nest must be NotFound");
            }

            if (handle.widgetCount() != 0)
                return juce::Result::fail("rejected drops must not create widgets");

            return juce::Result::ok();
        }

        juce::Result testDragPushesAndSnapsOnRelease()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            auto& store = handle.store();
            if (store.addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed()
                || store.addItem(makeWidget("b", { 300.0f, 0.0f, 200.0f, 150.0f })).failed())
            {
                return juce::Result::fail("seed failed");
            }

            const auto historyBefore = handle.history().size();
            auto& interaction = handle.interaction();

            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f, 0)).failed())
                return juce::Result::fail("beginDrag failed");
            if (interaction.beginDrag("b", Aries::ItemKind::widget, pointerAt(310.0f, 10.0f, 0)).error != GridError::invalidArgument)
                return juce::Result::fail("a second gesture must be rejected");

            interaction.updatePointer(pointerAt(147.0f, 13.0f, 16));

            const auto mid = boundsOf(handle.model(), "a");
            if (!mid.has_value() || !sameRect(*mid, { 137.0f, 3.0f, 200.0f, 150.0f }))
                return juce::Result::fail("mid-drag position should follow the pointer unsnapped");
            if (interaction.pushedIds().count("b") == 0)
                return juce::Result::fail("neighbour should be pushed during the drag");
            if (handle.history().size() != historyBefore)
                return juce::Result::fail("mid-drag frames must not enter history");

            const auto committed = interaction.endGesture();
            if (committed.failed())
                return failWith("endGesture failed", committed);

            const auto a = boundsOf(handle.model(), "a");
            const auto b = boundsOf(handle.model(), "b");
            if (!a.has_value() || !b.has_value())
                return juce::Result::fail("items vanished");
            if (!sameRect(*a, { 140.0f, 0.0f, 200.0f, 150.0f }) || !isOnGrid(*a, 20.0f))
                return juce::Result::fail("dragged item should snap to (140,0), got " + describe(*a));
            if (!isOnGrid(*b, 20.0f) || Aries::Core::Geometry::collides(*a, *b))
                return juce::Result::fail("pushed neighbour must be on grid and clear, got " + describe(*b));
            if (interaction.state() != GestureState::idle)
                return juce::Result::fail("gesture should be idle after release");
            if (handle.history().size() != historyBefore + 1)
                return juce::Result::fail("the whole drag should be one history entry");

            if (handle.undo().failed() || !sameRect(*boundsOf(handle.model(), "b"), { 300.0f, 0.0f, 200.0f, 150.0f }))
                return juce::Result::fail("undo should restore the pushed neighbour");

            return juce::Result::ok();
        }

        juce::Result testDragTransfersIntoNest()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            auto& store = handle.store();
            if (store.addItem(makeNest("nest-a", { 300.0f, 300.0f, 400.0f, 300.0f })).failed()
                || store.addItem(makeWidget("w", { 0.0f, 0.0f, 120.0f, 80.0f })).failed())
            {
                return juce::Result::fail("seed failed");
            }

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("w", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f, 0)).failed())
                return juce::Result::fail("beginDrag failed");

            interaction.updatePointer(pointerAt(413.0f, 406.0f, 16));
            if (interaction.dragOverNestId() != std::optional<Aries::ItemId>("nest-a"))
                return juce::Result::fail("hovering the nest should be reported");

            const auto result = interaction.endGesture();
            if (result.failed())
                return failWith("endGesture failed", result);

            const auto* widget = Aries::Core::GridQueries::findWidget(handle.model(), "w");
            if (widget == nullptr || widget->nestId != std::optional<Aries::ItemId>("nest-a"))
                return juce::Result::fail("widget should now belong to the nest");

            // Absolute (403,396) minus the content origin (300,340), then snapped.
            if (!sameRect(widget->bounds, { 100.0f, 60.0f, 120.0f, 80.0f }))
                return juce::Result::fail("nested local bounds mismatch: " + describe(widget->bounds));

            if (handle.model().mainItems.size() != 0 || handle.model().nestedItems.size() != 1)
                return juce::Result::fail("widget lists were not rebucketed");

            return juce::Result::ok();
        }

        juce::Result testThrottledMoveIsProcessedOnRelease()
        {
            Aries::GridHandle handle;
            ManualClock clock;
            clock.attach(handle);

            if (handle.store().addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed())
                return juce::Result::fail("seed failed");

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f, 100)).failed())
                return juce::Result::fail("beginDrag failed");

            interaction.updatePointer(pointerAt(70.0f, 50.0f, 103));
            if (!interaction.hasPendingMove())
                return juce::Result::fail("a move inside the throttle window should be held");
            if (!sameRect(*boundsOf(handle.model(), "a"), { 0.0f, 0.0f, 200.0f, 150.0f }))
                return juce::Result::fail("a held move must not reach the store yet");

            interaction.updatePointer(pointerAt(90.0f, 50.0f, 105));
            const auto result = interaction.endGesture();
            if (result.failed())
                return failWith("endGesture failed", result);

            if (!sameRect(*boundsOf(handle.model(), "a"), { 80.0f, 40.0f, 200.0f, 150.0f }))
                return juce::Result::fail("release should apply the latest held move, got "
                                          + describe(*boundsOf(handle.model(), "a")));

            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(90.0f, 50.0f, 200)).failed())
                return juce::Result::fail("second beginDrag failed");
            interaction.updatePointer(pointerAt(130.0f, 50.0f, 202));
            interaction.tick(210);
            if (interaction.hasPendingMove())
                return juce::Result::fail("tick should flush the held move once the window passed");
            if (!nearlyEqual(boundsOf(handle.model(), "a")->getX(), 120.0f))
                return juce::Result::fail("tick did not apply the held move");

            return interaction.endGesture().toResult();
        }

        juce::Result testMissingItemAbortsGesture()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);
            auto& interaction = handle.interaction();

            if (interaction.beginDrag("ghost", Aries::ItemKind::widget, pointerAt(0.0f, 0.0f)).error != GridError::gestureAbort)
                return juce::Result::fail("dragging a missing item must abort");
            if (interaction.beginResize("ghost", Aries::ItemKind::widget, ResizeHandle::se, pointerAt(0.0f, 0.0f)).error
                != GridError::gestureAbort)
            {
                return juce::Result::fail("resizing a missing item must abort");
            }

            if (handle.store().addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed())
                return juce::Result::fail("seed failed");
            if (interaction.beginDrag("a", Aries::ItemKind::nest, pointerAt(10.0f, 10.0f)).error != GridError::invalidArgument)
                return juce::Result::fail("kind mismatch must be rejected");
            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f)).failed())
                return juce::Result::fail("beginDrag failed");

            if (handle.removeItem("a").failed())
                return juce::Result::fail("remove failed");

            interaction.updatePointer(pointerAt(60.0f, 60.0f, 50));
            if (interaction.state() != GestureState::idle)
                return juce::Result::fail("losing the dragged item should end the gesture");
            if (interaction.endGesture().failed())
                return juce::Result::fail("ending an idle gesture is a no-op");
            if (handle.widgetCount() != 0)
                return juce::Result::fail("abort must not resurrect the removed item");

            return juce::Result::ok();
        }

        juce::Result testResizePushesAndCommits()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            auto& store = handle.store();
            if (store.addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed()
                || store.addItem(makeWidget("b", { 260.0f, 0.0f, 200.0f, 150.0f })).failed())
            {
                return juce::Result::fail("seed failed");
            }

            auto& interaction = handle.interaction();
            if (interaction.beginResize("a", Aries::ItemKind::widget, ResizeHandle::se, pointerAt(200.0f, 150.0f)).failed())
                return juce::Result::fail("beginResize failed");

            const auto pinned = interaction.alwaysVisibleIds();
            if (pinned.size() != 1 || pinned.front() != "a")
                return juce::Result::fail("the resized item should be pinned for culling");

            interaction.updatePointer(pointerAt(283.0f, 90.0f, 16));
            const auto result = interaction.endGesture();
            if (result.failed())
                return failWith("endGesture failed", result);

            const auto a = boundsOf(handle.model(), "a");
            const auto b = boundsOf(handle.model(), "b");
            if (!a.has_value() || !sameRect(*a, { 0.0f, 0.0f, 280.0f, 100.0f }))
                return juce::Result::fail("resized bounds mismatch");
            if (!b.has_value() || !sameRect(*b, { 280.0f, 0.0f, 200.0f, 150.0f }))
                return juce::Result::fail("neighbour should be pushed to x=280, got "
                                          + (b.has_value() ? describe(*b) : juce::String("nothing")));

            return juce::Result::ok();
        }

        juce::Result testTransferGrowsTargetNest()
        {
            for (const auto autoGrow : { true, false })
            {
                auto settings = immediateSettings();
                settings.interaction.autoGrowNests = autoGrow;

                Aries::GridHandle handle(nullptr, settings);
                ManualClock clock;
                clock.attach(handle);

                auto& store = handle.store();
                if (store.addItem(makeNest("nest-a", { 0.0f, 0.0f, 400.0f, 300.0f })).failed()
                    || store.addItem(makeWidget("w", { 600.0f, 0.0f, 200.0f, 150.0f })).failed())
                {
                    return juce::Result::fail("seed failed");
                }

                auto& interaction = handle.interaction();
                if (interaction.beginDrag("w", Aries::ItemKind::widget, pointerAt(610.0f, 10.0f, 0)).failed())
                    return juce::Result::fail("beginDrag failed");

                interaction.updatePointer(pointerAt(290.0f, 190.0f, 16));
                const auto result = interaction.endGesture();
                if (result.failed())
                    return failWith("endGesture failed", result);

                const auto* widget = Aries::Core::GridQueries::findWidget(handle.model(), "w");
                if (widget == nullptr || widget->nestId != std::optional<Aries::ItemId>("nest-a"))
                    return juce::Result::fail("widget should have moved into the nest");
                if (!sameRect(widget->bounds, { 280.0f, 140.0f, 200.0f, 150.0f }))
                    return juce::Result::fail("transferred bounds mismatch: " + describe(widget->bounds));

                // Content reaches (480,290); padding and header give 500x360.
                const auto expected = autoGrow ? juce::Rectangle<float>(0.0f, 0.0f, 500.0f, 360.0f)
                                               : juce::Rectangle<float>(0.0f, 0.0f, 400.0f, 300.0f);
                const auto nest = boundsOf(handle.model(), "nest-a");
                if (!nest.has_value() || !sameRect(*nest, expected))
                    return juce::Result::fail(juce::String(autoGrow ? "grown" : "fixed") + " nest bounds mismatch: "
                                              + (nest.has_value() ? describe(*nest) : juce::String("nothing")));
            }

            return juce::Result::ok();
        }

        juce::Result testNestDragNestsAndPromotes()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            auto& store = handle.store();
            if (store.addItem(makeNest("outer", { 0.0f, 0.0f, 600.0f, 500.0f })).failed()
                || store.addItem(makeNest("inner", { 800.0f, 0.0f, 400.0f, 300.0f })).failed()
                || store.addItem(makeWidget("child", { 20.0f, 20.0f, 120.0f, 80.0f }, Aries::ItemId("inner"))).failed())
            {
                return juce::Result::fail("seed failed");
            }

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("inner", Aries::ItemKind::nest, pointerAt(810.0f, 10.0f, 0)).failed())
                return juce::Result::fail("beginDrag on a nest failed");

            interaction.updatePointer(pointerAt(110.0f, 110.0f, 16));
            if (interaction.dragOverNestId() != std::optional<Aries::ItemId>("outer"))
                return juce::Result::fail("the outer nest should be reported as the hover target");

            auto result = interaction.endGesture();
            if (result.failed())
                return failWith("endGesture failed", result);

            const auto* inner = Aries::Core::GridQueries::findNest(handle.model(), "inner");
            if (inner == nullptr || inner->parentNestId != std::optional<Aries::ItemId>("outer"))
                return juce::Result::fail("inner nest should now live inside outer");
            if (!sameRect(inner->bounds, { 100.0f, 60.0f, 400.0f, 300.0f }))
                return juce::Result::fail("nested nest bounds mismatch: " + describe(inner->bounds));

            const auto child = Aries::Core::GridQueries::absoluteBoundsOf(handle.model(), "child");
            if (!child.has_value() || !sameRect(*child, { 120.0f, 160.0f, 120.0f, 80.0f }))
                return juce::Result::fail("children should travel with their nest");

            if (!sameRect(*boundsOf(handle.model(), "outer"), { 0.0f, 0.0f, 600.0f, 500.0f }))
                return juce::Result::fail("outer nest already fits its new child");

            if (interaction.beginDrag("inner", Aries::ItemKind::nest, pointerAt(110.0f, 110.0f, 100)).failed())
                return juce::Result::fail("second beginDrag failed");

            interaction.updatePointer(pointerAt(1010.0f, 10.0f, 116));
            result = interaction.endGesture();
            if (result.failed())
                return failWith("promoting endGesture failed", result);

            inner = Aries::Core::GridQueries::findNest(handle.model(), "inner");
            if (inner == nullptr || inner->parentNestId.has_value())
                return juce::Result::fail("dropping over the main grid should promote the nest");
            if (!sameRect(inner->bounds, { 1000.0f, 0.0f, 400.0f, 300.0f }))
                return juce::Result::fail("promoted nest bounds mismatch: " + describe(inner->bounds));

            return juce::Result::ok();
        }

        juce::Result testFocusLossEndsGesture()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            if (handle.store().addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed())
                return juce::Result::fail("seed failed");

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f, 0)).failed())
                return juce::Result::fail("beginDrag failed");

            interaction.updatePointer(pointerAt(73.0f, 47.0f, 16));
            interaction.focusLost();

            if (interaction.state() != GestureState::idle || interaction.dragState().isDragging)
                return juce::Result::fail("focus loss should return the gesture to idle");
            if (!sameRect(*boundsOf(handle.model(), "a"), { 60.0f, 40.0f, 200.0f, 150.0f }))
                return juce::Result::fail("focus loss should commit the snapped position, got "
                                          + describe(*boundsOf(handle.model(), "a")));
            if (!handle.canUndo())
                return juce::Result::fail("the committed drag should be undoable");

            auto press = pointerAt(0.0f, 0.0f, 50);
            press.button = PointerButton::middle;
            if (interaction.beginPan(press).failed())
                return juce::Result::fail("beginPan failed");

            interaction.focusLost();
            if (interaction.state() != GestureState::idle)
                return juce::Result::fail("focus loss should end a pan too");

            return juce::Result::ok();
        }

        juce::Result testPanGesture()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            auto& interaction = handle.interaction();

            auto start = pointerAt(100.0f, 100.0f);
            if (interaction.beginPan(start).error != GridError::invalidArgument)
                return juce::Result::fail("plain primary press must not pan");

            start.button = PointerButton::middle;
            if (interaction.beginPan(start).failed())
                return juce::Result::fail("middle button should pan");

            interaction.updatePointer(pointerAt(150.0f, 120.0f, 16));
            if (interaction.endGesture().failed())
                return juce::Result::fail("endGesture failed");

            if (handle.viewport() != Aries::Viewport { 50.0f, 20.0f, 1.0f })
                return juce::Result::fail("pan should move the viewport by the pointer delta");
            if (handle.canUndo())
                return juce::Result::fail("panning must not enter history");

            auto ctrlPress = pointerAt(0.0f, 0.0f);
            ctrlPress.ctrl = true;
            if (!Aries::Editor::Interaction::InteractionController::isPanTrigger(ctrlPress))
                return juce::Result::fail("ctrl+primary should pan");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> interactionTests()
    {
        return {
            { "Palette drop pushes neighbour", testPaletteDropPushesNeighbour },
            { "Palette drop rejects bad payloads", testPaletteDropRejectsBadPayloads },
            { "Drag pushes and snaps on release", testDragPushesAndSnapsOnRelease },
            { "Drag transfers into nest", testDragTransfersIntoNest },
            { "Throttled move is processed on release", testThrottledMoveIsProcessedOnRelease },
            { "Missing item aborts gesture", testMissingItemAbortsGesture },
            { "Resize pushes and commits", testResizePushesAndCommits },
            { "Transfer grows target nest", testTransferGrowsTargetNest },
            { "Nest drag nests and promotes", testNestDragNestsAndPromotes },
            { "Focus loss ends gesture", testFocusLossEndsGesture },
            { "Pan gesture", testPanGesture }
        };
    }
}
