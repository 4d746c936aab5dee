#include "SmokeSupport.h"

#include "Aries/Core/Geometry.h"
#include "Aries/Editor/Interaction/ResizeEngine.h"

namespace AriesSmoke
{
    namespace
    {
        using namespace Aries::Core::Geometry;

        const PushOutcome* findOutcome(const std::vector<PushOutcome>& outcomes, const Aries::ItemId& id)
        {
            for (const auto& outcome : outcomes)
            {
                if (outcome.id == id)
                    return &outcome;
            }

            return nullptr;
        }

        juce::Result testCollisionIsStrict()
        {
            const juce::Rectangle<float> base(0.0f, 0.0f, 100.0f, 100.0f);

            if (collides(base, { 100.0f, 0.0f, 50.0f, 50.0f }))
                return juce::Result::fail("shared vertical edge must not collide");
            if (collides(base, { 0.0f, 100.0f, 50.0f, 50.0f }))
                return juce::Result::fail("shared horizontal edge must not collide");
            if (collides(base, { 100.0f, 100.0f, 10.0f, 10.0f }))
                return juce::Result::fail("shared corner must not collide");
            if (!collides(base, { 99.0f, 99.0f, 10.0f, 10.0f }))
                return juce::Result::fail("one pixel overlap must collide");
            if (!collides(base, { 10.0f, 10.0f, 20.0f, 20.0f }))
                return juce::Result::fail("contained rectangle must collide");
            if (collides(base, { -300.0f, -300.0f, 20.0f, 20.0f }))
                return juce::Result::fail("disjoint rectangles must not collide");

            return juce::Result::ok();
        }

        juce::Result testSnapRounding()
        {
            if (!nearlyEqual(snapToGrid(130.0f, 20.0f), 140.0f))
                return juce::Result::fail("130 should snap to 140");
            if (!nearlyEqual(snapToGrid(129.0f, 20.0f), 120.0f))
                return juce::Result::fail("129 should snap to 120");
            if (!nearlyEqual(snapToGrid(-25.0f, 20.0f), -20.0f))
                return juce::Result::fail("-25 should snap to -20");
            if (!nearlyEqual(snapToGrid(37.0f, 0.0f), 37.0f))
                return juce::Result::fail("zero grid must leave values untouched");
            if (!nearlyEqual(roundUpToGrid(401.0f, 20.0f), 420.0f))
                return juce::Result::fail("roundUpToGrid should ceil");

            return juce::Result::ok();
        }

        juce::Result testPushPicksSmallerOverlapAxis()
        {
            const PushItem mover { "m", { 0.0f, 0.0f, 100.0f, 100.0f } };

            // 20px horizontal overlap against 100px vertical overlap: pushed right.
            auto outcomes = resolvePush(mover, { { "a", { 80.0f, 0.0f, 100.0f, 100.0f } } }, 20.0f);
            const auto* right = findOutcome(outcomes, "a");
            if (right == nullptr || !right->pushed || !sameRect(right->bounds, { 100.0f, 0.0f, 100.0f, 100.0f }))
                return juce::Result::fail("expected push right to x=100");

            // Equal overlaps: vertical wins, direction away from the mover's centre.
            outcomes = resolvePush(mover, { { "b", { 60.0f, 60.0f, 100.0f, 100.0f } } }, 20.0f);
            const auto* down = findOutcome(outcomes, "b");
            if (down == nullptr || !down->pushed || !sameRect(down->bounds, { 60.0f, 100.0f, 100.0f, 100.0f }))
                return juce::Result::fail("tie should push down, got " + (down != nullptr ? describe(down->bounds) : juce::String("nothing")));

            outcomes = resolvePush(mover, { { "c", { -60.0f, 0.0f, 100.0f, 100.0f } } }, 20.0f);
            const auto* left = findOutcome(outcomes, "c");
            if (left == nullptr || !left->pushed || !sameRect(left->bounds, { -100.0f, 0.0f, 100.0f, 100.0f }))
                return juce::Result::fail("expected push left to x=-100");

            return juce::Result::ok();
        }

        juce::Result testPushChainAndIdempotence()
        {
            const PushItem mover { "m", { 0.0f, 0.0f, 100.0f, 100.0f } };
            const std::vector<PushItem> others {
                { "b", { 150.0f, 0.0f, 100.0f, 100.0f } },
                { "a", { 60.0f, 0.0f, 100.0f, 100.0f } },
                { "far", { 1000.0f, 1000.0f, 50.0f, 50.0f } },
                { "m", { 0.0f, 0.0f, 100.0f, 100.0f } }
            };

            const auto first = resolvePush(mover, others, 20.0f);
            if (first.size() != others.size())
                return juce::Result::fail("resolvePush must return one outcome per input");
            if (first.front().id != "a")
                return juce::Result::fail("outcomes must be ordered by id");

            const auto* a = findOutcome(first, "a");
            const auto* b = findOutcome(first, "b");
            const auto* far = findOutcome(first, "far");
            const auto* self = findOutcome(first, "m");
            if (a == nullptr || !a->pushed || !sameRect(a->bounds, { 100.0f, 0.0f, 100.0f, 100.0f }))
                return juce::Result::fail("primary push mismatch");
            if (b == nullptr || !b->pushed || !sameRect(b->bounds, { 200.0f, 0.0f, 100.0f, 100.0f }))
                return juce::Result::fail("chain push mismatch: " + (b != nullptr ? describe(b->bounds) : juce::String("missing")));
            if (far == nullptr || far->pushed)
                return juce::Result::fail("non-colliding item must not be pushed");
            if (self == nullptr || self->pushed)
                return juce::Result::fail("the mover itself must pass through untouched");

            std::vector<PushItem> settled;
            for (const auto& outcome : first)
                settled.push_back({ outcome.id, outcome.bounds });

            const auto second = resolvePush(mover, settled, 20.0f);
            for (const auto& outcome : second)
            {
                if (outcome.pushed)
                    return juce::Result::fail("second pass pushed " + outcome.id);

                const auto* previous = findOutcome(first, outcome.id);
                if (previous == nullptr || outcome.bounds != previous->bounds)
                    return juce::Result::fail("second pass changed " + outcome.id);
            }

            for (const auto& outcome : first)
            {
                if (outcome.id != "m" && collides(mover.bounds, outcome.bounds))
                    return juce::Result::fail("item still overlaps the mover: " + outcome.id);
            }

            return juce::Result::ok();
        }

        juce::Result testFindNonCollidingPosition()
        {
            const std::vector<juce::Rectangle<float>> existing { { 0.0f, 0.0f, 200.0f, 150.0f } };

            const auto free = findNonCollidingPosition({ 400.0f, 0.0f, 200.0f, 150.0f }, existing, 20.0f);
            if (!nearlyEqual(free.x, 400.0f) || !nearlyEqual(free.y, 0.0f))
                return juce::Result::fail("free candidate must be returned unchanged");

            const auto moved = findNonCollidingPosition({ 0.0f, 0.0f, 200.0f, 150.0f }, existing, 20.0f);
            const juce::Rectangle<float> placed(moved.x, moved.y, 200.0f, 150.0f);
            if (collides(placed, existing.front()))
                return juce::Result::fail("relocated candidate still collides");
            if (!nearlyEqual(std::fmod(std::fabs(moved.x), 20.0f), 0.0f) || !nearlyEqual(std::fmod(std::fabs(moved.y), 20.0f), 0.0f))
                return juce::Result::fail("relocated candidate is off-grid");

            return juce::Result::ok();
        }

        juce::Result testNestAutoSize()
        {
            const auto empty = nestAutoSize({}, 20.0f);
            if (!nearlyEqual(empty.width, 400.0f) || !nearlyEqual(empty.height, 300.0f))
                return juce::Result::fail("empty nest should get the minimum size");

            const auto small = nestAutoSize({ { 0.0f, 0.0f, 100.0f, 100.0f } }, 20.0f);
            if (!nearlyEqual(small.width, 400.0f) || !nearlyEqual(small.height, 300.0f))
                return juce::Result::fail("small content should not shrink below the minimum");

            const auto large = nestAutoSize({ { 0.0f, 0.0f, 500.0f, 400.0f }, { 10.0f, 10.0f, 20.0f, 20.0f } }, 20.0f);
            if (!nearlyEqual(large.width, 520.0f) || !nearlyEqual(large.height, 460.0f))
                return juce::Result::fail("auto size expected 520x460, got "
                                          + juce::String(large.width) + "x" + juce::String(large.height));

            return juce::Result::ok();
        }

        juce::Result testResizeEngineSnapsAndClamps()
        {
            using Aries::Editor::Interaction::ResizeEngine;
            using Aries::Editor::Interaction::ResizeHandle;
            using Aries::Editor::Interaction::ResizeRequest;

            ResizeRequest request;
            request.startBounds = { 0.0f, 0.0f, 200.0f, 150.0f };
            request.pointerDelta = { 33.0f, -100.0f };
            request.handle = ResizeHandle::se;

            const auto southEast = ResizeEngine::compute(request);
            if (!sameRect(southEast, { 0.0f, 0.0f, 240.0f, 80.0f }))
                return juce::Result::fail("se resize mismatch: " + describe(southEast));

            request.startBounds = { 100.0f, 100.0f, 200.0f, 150.0f };
            request.pointerDelta = { 150.0f, 10.0f };
            request.handle = ResizeHandle::nw;

            const auto northWest = ResizeEngine::compute(request);
            if (!sameRect(northWest, { 180.0f, 120.0f, 120.0f, 140.0f }))
                return juce::Result::fail("nw resize mismatch: " + describe(northWest));
            if (!nearlyEqual(northWest.getRight(), 300.0f))
                return juce::Result::fail("clamped west edge must keep the east edge fixed");

            request.kind = Aries::ItemKind::nest;
            request.startBounds = { 0.0f, 0.0f, 400.0f, 300.0f };
            request.pointerDelta = { -390.0f, -290.0f };
            request.handle = ResizeHandle::se;

            const auto nest = ResizeEngine::compute(request);
            if (!sameRect(nest, { 0.0f, 0.0f, 200.0f, 160.0f }))
                return juce::Result::fail("nest minimum should round up to the grid: " + describe(nest));

            request.kind = Aries::ItemKind::widget;
            request.startBounds = { 0.0f, 0.0f, 130.0f, 80.0f };
            request.pointerDelta = { 100.0f, 0.0f };
            request.handle = ResizeHandle::w;

            const auto west = ResizeEngine::compute(request);
            if (!sameRect(west, { 20.0f, 0.0f, 120.0f, 80.0f }))
                return juce::Result::fail("off-grid west clamp mismatch: " + describe(west));

            request.startBounds = { 10.0f, 30.0f, 130.0f, 90.0f };
            request.pointerDelta = { 0.0f, -20.0f };
            request.handle = ResizeHandle::n;

            const auto north = ResizeEngine::compute(request);
            for (const auto edge : { north.getX(), north.getY(), north.getRight(), north.getBottom() })
            {
                if (!nearlyEqual(edge, Aries::Core::Geometry::snapToGrid(edge, 20.0f)))
                    return juce::Result::fail("every resized edge should sit on the grid: " + describe(north));
            }

            if (Aries::Editor::Interaction::resizeHandleFromName("NE") != ResizeHandle::ne)
                return juce::Result::fail("handle name lookup failed");

            return juce::Result::ok();
        }

        juce::Result testUniqueIdFormat()
        {
            const auto id = generateUniqueId("widget");
            auto parts = juce::StringArray::fromTokens(id, "-", {});
            if (parts.size() != 3 || parts[0] != "widget")
                return juce::Result::fail("unexpected id layout: " + id);
            if (parts[2].length() != 9 || !parts[2].containsOnly("0123456789abcdefghijklmnopqrstuvwxyz"))
                return juce::Result::fail("unexpected id suffix: " + id);
            if (generateUniqueId("widget") == id)
                return juce::Result::fail("ids should not repeat");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> geometryTests()
    {
        return {
            { "Collision is strict", testCollisionIsStrict },
            { "Snap rounding", testSnapRounding },
            { "Push picks the smaller overlap axis", testPushPicksSmallerOverlapAxis },
            { "Push chain and idempotence", testPushChainAndIdempotence },
            { "Find non-colliding position", testFindNonCollidingPosition },
            { "Nest auto size", testNestAutoSize },
            { "Resize engine snaps and clamps", testResizeEngineSnapsAndClamps },
            { "Unique id format", testUniqueIdFormat }
        };
    }
}
