#include "SmokeSupport.h"

namespace AriesSmoke
{
    namespace
    {
        Aries::GridResult moveTo(Aries::GridHandle& handle, const Aries::ItemId& id, float x, float y,
                                 Aries::MutationPhase phase = Aries::MutationPhase::settled)
        {
            const auto current = boundsOf(handle.model(), id);
            if (!current.has_value())
                return Aries::GridResult::fail(Aries::GridError::notFound, id);

            Aries::SetItemsBoundsAction action;
            action.items.push_back({ id, current->withPosition(x, y) });
            return handle.store().dispatch(action, phase);
        }

        juce::Result testUndoRedoRoundTrip()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");
            if (moveTo(handle, id, 100.0f, 0.0f).failed())
                return juce::Result::fail("move failed");

            if (handle.undo().failed() || !nearlyEqual(boundsOf(handle.model(), id)->getX(), 0.0f))
                return juce::Result::fail("first undo should restore x=0");
            if (handle.undo().failed() || handle.widgetCount() != 0)
                return juce::Result::fail("second undo should remove the widget");
            if (handle.canUndo())
                return juce::Result::fail("history should be at its start");
            if (handle.undo().failed())
                return juce::Result::fail("undo at the boundary is a no-op, not an error");

            if (handle.redo().failed() || handle.redo().failed())
                return juce::Result::fail("redo failed");
            const auto redone = boundsOf(handle.model(), id);
            if (!redone.has_value() || !nearlyEqual(redone->getX(), 100.0f))
                return juce::Result::fail("redo should reach x=100");
            if (handle.canRedo())
                return juce::Result::fail("redo tail should be exhausted");

            if (handle.undo().failed() || moveTo(handle, id, 0.0f, 200.0f).failed())
                return juce::Result::fail("branching edit failed");
            if (handle.canRedo())
                return juce::Result::fail("a new edit after undo must drop the redo tail");

            return juce::Result::ok();
        }

        juce::Result testDebounceCoalescesBursts()
        {
            Aries::GridHandle handle;
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");

            for (int step = 1; step <= 3; ++step)
            {
                clock.now += 10;
                if (moveTo(handle, id, static_cast<float>(step) * 20.0f, 0.0f).failed())
                    return juce::Result::fail("move failed at step " + juce::String(step));
            }

            if (handle.history().size() != 1 || !handle.history().hasPending())
                return juce::Result::fail("burst should be held as a single pending entry");

            handle.tick(clock.now + 50);
            if (handle.history().size() != 1)
                return juce::Result::fail("pending entry flushed before the debounce elapsed");

            handle.tick(clock.now + 100);
            if (handle.history().size() != 2 || handle.history().hasPending())
                return juce::Result::fail("pending entry should flush after the debounce");

            if (handle.undo().failed() || handle.widgetCount() != 0)
                return juce::Result::fail("a single undo should revert the whole burst");

            return juce::Result::ok();
        }

        juce::Result testUndoFlushesPendingEntry()
        {
            Aries::GridHandle handle;
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");
            if (!handle.canUndo())
                return juce::Result::fail("a pending change must already be undoable");

            if (handle.undo().failed() || handle.widgetCount() != 0)
                return juce::Result::fail("undo should flush and revert the pending change");
            if (!handle.canRedo())
                return juce::Result::fail("the flushed change should be redoable");

            return juce::Result::ok();
        }

        juce::Result testCapacityEvictsOldest()
        {
            auto settings = immediateSettings();
            settings.historyCapacity = 3;

            Aries::GridHandle handle(nullptr, settings);
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");

            for (int step = 1; step <= 5; ++step)
            {
                if (moveTo(handle, id, static_cast<float>(step) * 20.0f, 0.0f).failed())
                    return juce::Result::fail("move failed");
            }

            if (handle.history().size() != 3)
                return juce::Result::fail("history should hold 3 entries, holds "
                                          + juce::String(static_cast<int>(handle.history().size())));

            while (handle.canUndo())
            {
                if (handle.undo().failed())
                    return juce::Result::fail("undo failed");
            }

            const auto oldest = boundsOf(handle.model(), id);
            if (!oldest.has_value() || !nearlyEqual(oldest->getX(), 60.0f))
                return juce::Result::fail("oldest retained state should be x=60");

            return juce::Result::ok();
        }

        juce::Result testTransientFramesStayOutOfHistory()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");

            const auto sizeBefore = handle.history().size();
            for (int frame = 1; frame <= 10; ++frame)
            {
                if (moveTo(handle, id, static_cast<float>(frame) * 3.0f, 0.0f, Aries::MutationPhase::transient).failed())
                    return juce::Result::fail("transient frame failed");
            }

            if (handle.history().size() != sizeBefore)
                return juce::Result::fail("transient frames must not be recorded");

            if (moveTo(handle, id, 40.0f, 0.0f).failed() || handle.history().size() != sizeBefore + 1)
                return juce::Result::fail("settled commit should add exactly one entry");

            return juce::Result::ok();
        }

        juce::Result testUndoIsBlockedDuringGesture()
        {
            Aries::GridHandle handle(nullptr, immediateSettings());
            ManualClock clock;
            clock.attach(handle);

            Aries::NewWidgetOptions options;
            options.position = juce::Point<float>(0.0f, 0.0f);

            Aries::ItemId id;
            if (handle.addWidget(options, &id).failed())
                return juce::Result::fail("addWidget failed");

            if (handle.interaction().beginDrag(id, Aries::ItemKind::widget, pointerAt(10.0f, 10.0f)).failed())
                return juce::Result::fail("beginDrag failed");

            if (handle.undo().error != Aries::GridError::invalidArgument)
                return juce::Result::fail("undo must be rejected while dragging");
            if (handle.widgetCount() != 1)
                return juce::Result::fail("rejected undo changed the model");

            if (handle.interaction().endGesture().failed())
                return juce::Result::fail("endGesture failed");
            if (handle.undo().failed())
                return juce::Result::fail("undo should work once the gesture ended");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> historyTests()
    {
        return {
            { "Undo/redo round trip", testUndoRedoRoundTrip },
            { "Debounce coalesces bursts", testDebounceCoalescesBursts },
            { "Undo flushes the pending entry", testUndoFlushesPendingEntry },
            { "Capacity evicts the oldest entry", testCapacityEvictsOldest },
            { "Transient frames stay out of history", testTransientFramesStayOutOfHistory },
            { "Undo is blocked during a gesture", testUndoIsBlockedDuringGesture }
        };
    }
}
