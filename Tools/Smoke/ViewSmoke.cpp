#include "SmokeSupport.h"

namespace AriesSmoke
{
    namespace
    {
        using Aries::Editor::Interaction::GridCommand;
        using Aries::Editor::Interaction::KeyChord;
        using Aries::Editor::Interaction::ViewportController;
        using Aries::Editor::Interaction::WheelEvent;
        using Aries::Editor::Interaction::WheelKind;
        using Aries::Editor::Perf::CullingEngine;
        using Aries::Editor::Perf::CullingSettings;

        Aries::GridModel makeCullingScene()
        {
            Aries::GridModel model;
            model.mainItems.push_back(makeWidget("a", { 0.0f, 0.0f, 100.0f, 100.0f }));
            model.mainItems.push_back(makeWidget("b", { 2000.0f, 2000.0f, 100.0f, 100.0f }));
            model.mainItems.push_back(makeWidget("edge", { 800.0f, 0.0f, 100.0f, 100.0f }));
            model.nestContainers.push_back(makeNest("near", { 0.0f, 200.0f, 400.0f, 300.0f }));
            model.nestContainers.push_back(makeNest("far", { 5000.0f, 0.0f, 400.0f, 300.0f }));
            model.nestedItems.push_back(makeWidget("near-child", { 20.0f, 20.0f, 100.0f, 80.0f }, juce::String("near")));
            model.nestedItems.push_back(makeWidget("far-child", { 20.0f, 20.0f, 100.0f, 80.0f }, juce::String("far")));
            return model;
        }

        CullingSettings strictCulling()
        {
            CullingSettings settings;
            settings.bufferPx = 0.0f;
            settings.minItemsForVirtualization = 0;
            return settings;
        }

        juce::Result testSmallGridsRenderEverything()
        {
            CullingEngine culling;
            const auto result = culling.compute(makeCullingScene(), Aries::Viewport {}, { 800.0f, 600.0f });

            if (result.totalItems != 7 || result.renderedItems != 7 || result.culledItems != 0)
                return juce::Result::fail("below the threshold everything should render");
            if (result.virtualizationActive)
                return juce::Result::fail("virtualization should be inactive");

            return juce::Result::ok();
        }

        juce::Result testCullingFollowsViewport()
        {
            CullingEngine culling;
            culling.setSettings(strictCulling());

            const auto result = culling.compute(makeCullingScene(), Aries::Viewport {}, { 800.0f, 600.0f });

            for (const auto* id : { "a", "near", "near-child" })
            {
                if (!result.isVisible(id))
                    return juce::Result::fail(juce::String(id) + " should be visible");
            }

            for (const auto* id : { "b", "edge", "far", "far-child" })
            {
                if (result.isVisible(id))
                    return juce::Result::fail(juce::String(id) + " should be culled");
            }

            if (result.renderedItems != 3 || result.culledItems != 4 || !result.virtualizationActive)
                return juce::Result::fail("culling counters mismatch");
            if (std::abs(result.cullingPercentage - 400.0 / 7.0) > 1.0e-6)
                return juce::Result::fail("culling percentage mismatch");

            // Panning to the far nest brings its child along.
            const auto moved = culling.compute(makeCullingScene(), Aries::Viewport { -5000.0f, 0.0f, 1.0f }, { 800.0f, 600.0f });
            if (!moved.isVisible("far") || !moved.isVisible("far-child") || moved.isVisible("a"))
                return juce::Result::fail("visible set should follow the viewport");

            return juce::Result::ok();
        }

        juce::Result testVisibleAreaAndRenderCap()
        {
            CullingEngine culling;
            auto settings = strictCulling();
            settings.bufferPx = 300.0f;
            culling.setSettings(settings);

            const auto area = culling.visibleWorldArea({ -100.0f, 0.0f, 2.0f }, { 800.0f, 600.0f });
            if (!sameRect(area, { -50.0f, -150.0f, 700.0f, 600.0f }))
                return juce::Result::fail("visible area mismatch: " + describe(area));

            settings.bufferPx = 0.0f;
            settings.maxRenderCount = 1;
            culling.setSettings(settings);

            const auto capped = culling.compute(makeCullingScene(), Aries::Viewport {}, { 800.0f, 600.0f });
            if (!capped.isVisible("near") || capped.isVisible("a"))
                return juce::Result::fail("render cap should keep the item nearest the centre");
            if (!capped.isVisible("near-child"))
                return juce::Result::fail("children of a kept nest should stay visible");

            const auto pinned = culling.compute(makeCullingScene(), Aries::Viewport {}, { 800.0f, 600.0f }, { "b", "far-child" });
            if (!pinned.isVisible("b") || !pinned.isVisible("far-child"))
                return juce::Result::fail("pinned ids must never be culled");

            return juce::Result::ok();
        }

        juce::Result testDraggedItemIsNeverCulled()
        {
            auto settings = immediateSettings();
            settings.culling = strictCulling();

            Aries::GridHandle handle(nullptr, settings);
            ManualClock clock;
            clock.attach(handle);

            if (handle.store().addItem(makeWidget("a", { 0.0f, 0.0f, 200.0f, 150.0f })).failed()
                || handle.store().addItem(makeWidget("b", { 300.0f, 0.0f, 200.0f, 150.0f })).failed())
            {
                return juce::Result::fail("seed failed");
            }

            auto& interaction = handle.interaction();
            if (interaction.beginDrag("a", Aries::ItemKind::widget, pointerAt(10.0f, 10.0f)).failed())
                return juce::Result::fail("beginDrag failed");

            interaction.updatePointer(pointerAt(5010.0f, 5010.0f, 16));

            const auto during = handle.computeVisibility({ 800.0f, 600.0f });
            if (!during.isVisible("a") || !during.isVisible("b"))
                return juce::Result::fail("the dragged item must stay visible while off-screen");

            if (interaction.endGesture().failed())
                return juce::Result::fail("endGesture failed");

            const auto after = handle.computeVisibility({ 800.0f, 600.0f });
            if (after.isVisible("a"))
                return juce::Result::fail("after release the off-screen item should be culled");

            return juce::Result::ok();
        }

        juce::Result testSpatialIndexHandlesHugeBounds()
        {
            Aries::Editor::Perf::HitTestGrid index;
            index.rebuild({ { "banner", { -10.0f, 0.0f, 4.0e6f, 100.0f } },
                            { "small", { 300.0f, 300.0f, 50.0f, 50.0f } },
                            { "remote", { 9.0e5f, 9.0e5f, 50.0f, 50.0f } } });

            if (index.query({ 3.5e6f, 10.0f, 800.0f, 600.0f }) != std::vector<Aries::ItemId> { "banner" })
                return juce::Result::fail("an item wider than the hash limit must still be found at its far end");

            if (index.query({ 0.0f, 0.0f, 800.0f, 600.0f }) != std::vector<Aries::ItemId> { "banner", "small" })
                return juce::Result::fail("viewport query should return hits in insertion order");

            const auto everything = index.query({ -1.0e6f, -1.0e6f, 4.0e6f, 4.0e6f });
            if (everything.size() != 3)
                return juce::Result::fail("a very large query area should still find every item");

            return juce::Result::ok();
        }

        juce::Result testCoordinateConversion()
        {
            const Aries::Viewport viewport { 10.0f, -20.0f, 2.0f };

            const auto screen = ViewportController::worldToScreen(viewport, { 5.0f, 5.0f });
            if (!nearlyEqual(screen.x, 30.0f) || !nearlyEqual(screen.y, -30.0f))
                return juce::Result::fail("worldToScreen mismatch");

            const auto world = ViewportController::screenToWorld(viewport, screen);
            if (!nearlyEqual(world.x, 5.0f) || !nearlyEqual(world.y, 5.0f))
                return juce::Result::fail("screenToWorld should invert worldToScreen");

            return juce::Result::ok();
        }

        juce::Result testWheelClassification()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            auto& controller = handle.viewportController();

            if (controller.handleWheel({ { 400.0f, 300.0f }, 0.0f, 20.0f, true, 0 }) != WheelKind::wheelZoom)
                return juce::Result::fail("the first ctrl event is never classified as trackpad");
            controller.reset();

            const juce::Point<float> cursor { 400.0f, 300.0f };
            const auto anchor = controller.screenToWorld(cursor);

            if (controller.handleWheel({ cursor, 0.0f, 3.0f, true, 1000 }) != WheelKind::pinchZoom)
                return juce::Result::fail("small ctrl delta should be a pinch");
            if (!nearlyEqual(handle.viewport().zoom, 1.0f - 3.0f * 0.005f))
                return juce::Result::fail("pinch zoom mismatch");

            const auto afterPinch = controller.screenToWorld(cursor);
            if (!nearlyEqual(afterPinch.x, anchor.x, 1.0e-2f) || !nearlyEqual(afterPinch.y, anchor.y, 1.0e-2f))
                return juce::Result::fail("zoom must keep the point under the cursor fixed");

            const auto pinchZoom = handle.viewport().zoom;
            if (controller.handleWheel({ cursor, 0.0f, 20.0f, true, 1050 }) != WheelKind::trackpadZoom)
                return juce::Result::fail("rapid medium delta should be a trackpad zoom");
            if (!nearlyEqual(handle.viewport().zoom, pinchZoom * (1.0f - 20.0f * 0.002f)))
                return juce::Result::fail("trackpad zoom mismatch");

            const auto trackpadZoom = handle.viewport().zoom;
            if (controller.handleWheel({ cursor, 0.0f, -120.0f, true, 2000 }) != WheelKind::wheelZoom)
                return juce::Result::fail("large delta should be a wheel step");
            if (!nearlyEqual(handle.viewport().zoom, trackpadZoom * 1.08f))
                return juce::Result::fail("wheel zoom mismatch");

            controller.setViewport({ 0.0f, 0.0f, 2.0f });
            if (controller.handleWheel({ cursor, 10.0f, 100.0f, false, 3000 }) != WheelKind::pan)
                return juce::Result::fail("wheel without ctrl should pan");
            if (handle.viewport() != Aries::Viewport { -5.0f, -50.0f, 2.0f })
                return juce::Result::fail("pan should scale by zoom");

            controller.zoomAt(cursor, 100.0f);
            if (!nearlyEqual(handle.viewport().zoom, Aries::kMaxZoom))
                return juce::Result::fail("zoom must clamp to the maximum");

            controller.zoomAt(cursor, 0.0001f);
            if (!nearlyEqual(handle.viewport().zoom, Aries::kMinZoom))
                return juce::Result::fail("zoom must clamp to the minimum");

            return juce::Result::ok();
        }

        juce::Result testShortcutChords()
        {
            Aries::Editor::Interaction::ShortcutMap shortcuts;

            const auto redo = KeyChord::fromDescription("ctrl+shift+z");
            if (!redo.has_value() || shortcuts.commandFor(*redo) != GridCommand::redo)
                return juce::Result::fail("Ctrl+Shift+Z should redo");
            if (redo->toDescription() != "Ctrl+Shift+Z")
                return juce::Result::fail("description mismatch: " + redo->toDescription());

            const auto plus = KeyChord::fromDescription("ctrl++");
            if (!plus.has_value() || shortcuts.commandFor(*plus) != GridCommand::zoomIn)
                return juce::Result::fail("Ctrl++ should zoom in");

            if (shortcuts.commandFor(KeyChord::make('z', true)) != GridCommand::undo
                || shortcuts.commandFor(KeyChord::make('Y', true)) != GridCommand::redo
                || shortcuts.commandFor(KeyChord::make('-', true)) != GridCommand::zoomOut
                || shortcuts.commandFor(KeyChord::make('0', true)) != GridCommand::resetView)
            {
                return juce::Result::fail("default bindings mismatch");
            }

            if (shortcuts.commandFor(KeyChord::make('z', false)).has_value())
                return juce::Result::fail("plain Z must not be bound");
            if (KeyChord::fromDescription("hyper+z").has_value() || KeyChord::fromDescription("").has_value())
                return juce::Result::fail("unknown modifiers and empty text must not parse");

            shortcuts.bind(KeyChord::make('z', true), GridCommand::save);
            if (shortcuts.commandFor(KeyChord::make('Z', true)) != GridCommand::save)
                return juce::Result::fail("rebinding should replace the command");
            if (!shortcuts.unbind(KeyChord::make('z', true)) || shortcuts.unbind(KeyChord::make('z', true)))
                return juce::Result::fail("unbind should remove exactly once");
            if (shortcuts.chordsFor(GridCommand::redo).size() != 2)
                return juce::Result::fail("redo should keep two chords");

            shortcuts.resetToDefaults();
            if (shortcuts.commandFor(KeyChord::make('z', true)) != GridCommand::undo)
                return juce::Result::fail("reset should restore defaults");

            return juce::Result::ok();
        }

        juce::Result testShortcutsDriveCommands()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);
            handle.setRandomSeed(7);

            if (handle.handleShortcut(KeyChord::make('w', true, true)).failed() || handle.widgetCount() != 1)
                return juce::Result::fail("Ctrl+Shift+W should add a widget");

            const auto& widget = handle.model().mainItems.front();
            if (widget.title != "New Widget" || !nearlyEqual(widget.bounds.getWidth(), 200.0f)
                || !nearlyEqual(std::fmod(widget.bounds.getX(), 20.0f), 0.0f))
            {
                return juce::Result::fail("new widget defaults mismatch");
            }

            if (handle.handleShortcut(KeyChord::make('n', true, true)).failed() || handle.model().nestContainers.size() != 1)
                return juce::Result::fail("Ctrl+Shift+N should add a nest");
            if (Aries::Core::Geometry::collides(handle.model().nestContainers.front().bounds, handle.model().mainItems.front().bounds))
                return juce::Result::fail("new items should not be placed on top of each other");

            juce::String json;
            if (handle.handleShortcut(KeyChord::make('e', true), &json).failed() || json.isEmpty())
                return juce::Result::fail("Ctrl+E should export");

            if (handle.handleShortcut(KeyChord::make('z', true)).failed() || handle.model().nestContainers.size() != 0)
                return juce::Result::fail("Ctrl+Z should undo the nest");

            if (handle.handleShortcut(KeyChord::make('i', true), &json).failed() || handle.model().nestContainers.size() != 1)
                return juce::Result::fail("Ctrl+I should import the exported layout");
            if (handle.handleShortcut(KeyChord::make('i', true)).error != Aries::GridError::invalidArgument)
                return juce::Result::fail("import without a document must be rejected");

            if (handle.handleShortcut(KeyChord::make('=', true)).failed() || !nearlyEqual(handle.viewport().zoom, 1.25f))
                return juce::Result::fail("Ctrl+= should zoom in");
            if (handle.handleShortcut(KeyChord::make('0', true)).failed() || handle.viewport() != Aries::Viewport {})
                return juce::Result::fail("Ctrl+0 should reset the view");

            if (handle.handleShortcut(KeyChord::make('q', true)).error != Aries::GridError::notFound)
                return juce::Result::fail("unbound chords must be NotFound");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> viewTests()
    {
        return {
            { "Small grids render everything", testSmallGridsRenderEverything },
            { "Culling follows viewport", testCullingFollowsViewport },
            { "Visible area and render cap", testVisibleAreaAndRenderCap },
            { "Dragged item is never culled", testDraggedItemIsNeverCulled },
            { "Spatial index handles huge bounds", testSpatialIndexHandlesHugeBounds },
            { "Coordinate conversion", testCoordinateConversion },
            { "Wheel classification", testWheelClassification },
            { "Shortcut chords", testShortcutChords },
            { "Shortcuts drive commands", testShortcutsDriveCommands }
        };
    }
}
