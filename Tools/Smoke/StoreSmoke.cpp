#include "SmokeSupport.h"

#include "Aries/Core/GridStore.h"
#include "Aries/Core/GridValidator.h"

#include <limits>

namespace AriesSmoke
{
    namespace
    {
        using Aries::ContainerRef;
        using Aries::GridError;
        using Aries::MutationPhase;

        class EventRecorder : public Aries::Core::GridStore::Listener
        {
        public:
            void gridChanged(const Aries::GridEvent& event) override
            {
                events.push_back(event);
            }

            std::vector<Aries::GridEvent> events;
        };

        juce::Result seedNestScene(Aries::Core::GridStore& store)
        {
            auto result = store.addItem(makeNest("nest-a", { 300.0f, 300.0f, 400.0f, 300.0f }));
            if (result.wasOk())
                result = store.addItem(makeWidget("w-main", { 0.0f, 0.0f, 200.0f, 150.0f }));
            if (result.wasOk())
                result = store.addItem(makeWidget("w-inner", { 20.0f, 20.0f, 120.0f, 80.0f }, juce::String("nest-a")));
            return result.toResult();
        }

        juce::Result testReducerGuards()
        {
            Aries::Core::GridStore store;
            const auto seeded = seedNestScene(store);
            if (seeded.failed())
                return seeded;

            const auto before = store.snapshot();

            auto untyped = makeWidget({}, { 0.0f, 0.0f, 100.0f, 100.0f });
            untyped.type = {};
            if (store.addItem(untyped).error != GridError::invalidArgument)
                return juce::Result::fail("widget without type must be rejected");

            if (store.addItem(makeWidget("w-main", { 500.0f, 0.0f, 100.0f, 100.0f })).error != GridError::invalidArgument)
                return juce::Result::fail("duplicate id must be rejected");

            if (store.addItem(makeWidget({}, { 0.0f, 0.0f, 100.0f, 100.0f }, juce::String("missing"))).error != GridError::notFound)
                return juce::Result::fail("missing target nest must be NotFound");

            if (store.addItem(makeWidget({}, { 0.0f, 0.0f, 0.0f, 100.0f })).error != GridError::geometry)
                return juce::Result::fail("zero width must be a geometry error");

            Aries::SetItemsBoundsAction partialBatch;
            partialBatch.items.push_back({ "w-main", { 40.0f, 40.0f, 200.0f, 150.0f } });
            partialBatch.items.push_back({ "ghost", { 0.0f, 0.0f, 10.0f, 10.0f } });
            if (store.dispatch(partialBatch).error != GridError::notFound)
                return juce::Result::fail("batch with an unknown id must be NotFound");

            auto badConfig = makeWidget({}, { 0.0f, 0.0f, 100.0f, 100.0f });
            badConfig.config.set("bounds", juce::var(juce::Array<juce::var> { 1, 2 }));
            if (store.addItem(badConfig).error != GridError::invalidArgument)
                return juce::Result::fail("a bad config value is an argument error whatever its key");

            Aries::UpdateItemAction infinite;
            infinite.id = "w-main";
            infinite.bounds = juce::Rectangle<float>(0.0f, 0.0f, std::numeric_limits<float>::infinity(), 10.0f);
            if (store.updateItem(infinite).error != GridError::geometry)
                return juce::Result::fail("non-finite bounds must be a geometry error");

            Aries::UpdateItemAction emptyUpdate;
            emptyUpdate.id = "w-main";
            if (store.updateItem(emptyUpdate).error != GridError::invalidArgument)
                return juce::Result::fail("update without fields must be rejected");

            if (store.snapshot() != before)
                return juce::Result::fail("failed mutations must leave the snapshot untouched");

            return juce::Result::ok();
        }

        juce::Result testAllocatedIdPrefixes()
        {
            Aries::Core::GridStore store;

            Aries::ItemId plain;
            Aries::ItemId modded;
            Aries::ItemId nest;

            auto moddedWidget = makeWidget({}, { 0.0f, 0.0f, 120.0f, 80.0f });
            moddedWidget.ariesModType = "meter";

            if (store.addItem(makeWidget({}, { 0.0f, 0.0f, 120.0f, 80.0f })).failed())
                return juce::Result::fail("plain widget add failed");
            if (store.addItem(makeWidget({}, { 200.0f, 0.0f, 120.0f, 80.0f }), MutationPhase::settled, &plain).failed()
                || store.addItem(moddedWidget, MutationPhase::settled, &modded).failed()
                || store.addItem(makeNest({}, { 0.0f, 400.0f, 400.0f, 300.0f }), MutationPhase::settled, &nest).failed())
            {
                return juce::Result::fail("add with allocated ids failed");
            }

            if (!plain.startsWith("widget-") || !modded.startsWith("arieswidget-") || !nest.startsWith("nest-"))
                return juce::Result::fail("unexpected id prefixes: " + plain + ", " + modded + ", " + nest);
            if (store.widgetCount() != 3)
                return juce::Result::fail("widget count mismatch");

            return juce::Result::ok();
        }

        juce::Result testMoveBetweenContainersKeepsAbsolutePosition()
        {
            Aries::Core::GridStore store;
            if (store.addItem(makeNest("nest-a", { 300.0f, 300.0f, 400.0f, 300.0f })).failed()
                || store.addItem(makeWidget("w", { 350.0f, 360.0f, 120.0f, 80.0f })).failed())
            {
                return juce::Result::fail("seed failed");
            }

            if (store.moveItemBetweenContainers("w", ContainerRef::nest("nest-a"), ContainerRef::main()).error != GridError::invalidArgument)
                return juce::Result::fail("wrong source container must be InvalidArgument");
            if (store.moveItemBetweenContainers("w", ContainerRef::main(), ContainerRef::nest("nope")).error != GridError::notFound)
                return juce::Result::fail("missing target must be NotFound");

            const auto moved = store.moveItemBetweenContainers("w", ContainerRef::main(), ContainerRef::nest("nest-a"));
            if (moved.failed())
                return failWith("transfer failed", moved);

            const auto& model = store.model();
            if (!model.mainItems.empty() || model.nestedItems.size() != 1)
                return juce::Result::fail("widget was not rebucketed");

            const auto local = boundsOf(model, "w");
            if (!local.has_value() || !sameRect(*local, { 50.0f, 20.0f, 120.0f, 80.0f }))
                return juce::Result::fail("local bounds should be relative to the nest content origin");

            const auto absolute = Aries::Core::GridQueries::absoluteBoundsOf(model, "w");
            if (!absolute.has_value() || !sameRect(*absolute, { 350.0f, 360.0f, 120.0f, 80.0f }))
                return juce::Result::fail("absolute position changed during transfer");

            const auto back = store.moveItemBetweenContainers("w",
                                                              ContainerRef::nest("nest-a"),
                                                              ContainerRef::main(),
                                                              juce::Rectangle<float>(0.0f, 0.0f, 120.0f, 80.0f));
            if (back.failed() || !sameRect(*boundsOf(store.model(), "w"), { 0.0f, 0.0f, 120.0f, 80.0f }))
                return juce::Result::fail("explicit local bounds were not applied");

            return juce::Result::ok();
        }

        juce::Result testNestCycleIsRejected()
        {
            Aries::Core::GridStore store;
            if (store.addItem(makeNest("outer", { 0.0f, 0.0f, 800.0f, 600.0f })).failed()
                || store.addItem(makeNest("inner", { 20.0f, 20.0f, 400.0f, 300.0f }, juce::String("outer"))).failed())
            {
                return juce::Result::fail("seed failed");
            }

            const auto intoChild = store.moveItemBetweenContainers("outer", ContainerRef::main(), ContainerRef::nest("inner"));
            if (intoChild.error != GridError::cycle)
                return juce::Result::fail("nest into its own child must be a CycleError");

            const auto intoSelf = store.moveItemBetweenContainers("outer", ContainerRef::main(), ContainerRef::nest("outer"));
            if (intoSelf.error != GridError::cycle)
                return juce::Result::fail("nest into itself must be a CycleError");

            auto model = store.model();
            model.nestContainers[0].parentNestId = juce::String("inner");
            if (Aries::Core::GridValidator::validateGrid(model).wasOk())
                return juce::Result::fail("validator must reject a parent cycle");
            if (store.replaceState(model, Aries::ReplaceOrigin::import).wasOk())
                return juce::Result::fail("replaceState must reject a parent cycle");

            return juce::Result::ok();
        }

        juce::Result testRemovePromotesOrCascades()
        {
            Aries::Core::GridStore store;
            if (store.addItem(makeNest("outer", { 300.0f, 300.0f, 800.0f, 600.0f })).failed()
                || store.addItem(makeNest("inner", { 20.0f, 20.0f, 400.0f, 300.0f }, juce::String("outer"))).failed()
                || store.addItem(makeWidget("direct", { 20.0f, 20.0f, 120.0f, 80.0f }, juce::String("outer"))).failed()
                || store.addItem(makeWidget("deep", { 0.0f, 0.0f, 120.0f, 80.0f }, juce::String("inner"))).failed())
            {
                return juce::Result::fail("seed failed");
            }

            const auto initial = store.snapshot();

            const auto promoted = store.removeItem("outer", Aries::ChildPolicy::promote);
            if (promoted.failed())
                return failWith("promote failed", promoted);

            const auto& model = store.model();
            const auto* direct = Aries::Core::GridQueries::findWidget(model, "direct");
            const auto* inner = Aries::Core::GridQueries::findNest(model, "inner");
            if (direct == nullptr || direct->nestId.has_value() || !sameRect(direct->bounds, { 320.0f, 360.0f, 120.0f, 80.0f }))
                return juce::Result::fail("direct widget should move to main at its absolute position");
            if (inner == nullptr || inner->parentNestId.has_value() || !sameRect(inner->bounds, { 320.0f, 360.0f, 400.0f, 300.0f }))
                return juce::Result::fail("child nest should be promoted to main");
            if (Aries::Core::GridQueries::findWidget(model, "deep") == nullptr)
                return juce::Result::fail("grandchild must survive promotion");

            if (store.replaceState(*initial, Aries::ReplaceOrigin::history).failed())
                return juce::Result::fail("restore failed");

            const auto cascaded = store.removeItem("outer", Aries::ChildPolicy::cascade);
            if (cascaded.failed())
                return failWith("cascade failed", cascaded);
            if (Aries::Core::GridQueries::itemCount(store.model()) != 0)
                return juce::Result::fail("cascade should remove the whole subtree");

            if (store.removeItem("outer").error != GridError::notFound)
                return juce::Result::fail("removing a missing id must be NotFound");

            return juce::Result::ok();
        }

        juce::Result testEventsCarryPhase()
        {
            Aries::Core::GridStore store;
            EventRecorder recorder;
            store.addListener(&recorder);

            const auto seeded = seedNestScene(store);
            if (seeded.failed())
            {
                store.removeListener(&recorder);
                return seeded;
            }

            Aries::SetItemsBoundsAction frame;
            frame.items.push_back({ "w-main", { 40.0f, 0.0f, 200.0f, 150.0f } });
            const auto transient = store.dispatch(frame, MutationPhase::transient);
            const auto rejected = store.dispatch(Aries::RemoveItemAction { "ghost" });
            store.setViewport({ 10.0f, 0.0f, 9.0f });
            store.removeListener(&recorder);

            if (transient.failed() || rejected.wasOk())
                return juce::Result::fail("unexpected dispatch results");
            if (recorder.events.size() != 5)
                return juce::Result::fail("expected 5 events, got " + juce::String(static_cast<int>(recorder.events.size())));

            const auto& update = recorder.events[3];
            if (update.type != Aries::GridEventType::itemUpdated || update.isSettled() || update.ids.size() != 1)
                return juce::Result::fail("transient frame event mismatch");

            const auto& viewport = recorder.events[4];
            if (viewport.type != Aries::GridEventType::viewportChanged || !nearlyEqual(store.viewport().zoom, Aries::kMaxZoom))
                return juce::Result::fail("viewport zoom must be clamped");

            return juce::Result::ok();
        }

        juce::Result testValidatorRejectsBrokenModels()
        {
            using Aries::Core::GridValidator::validateGrid;

            Aries::GridModel model;
            model.mainItems.push_back(makeWidget("dup", { 0.0f, 0.0f, 10.0f, 10.0f }));
            if (validateGrid(model).failed())
                return juce::Result::fail("single widget model should be valid");

            model.nestContainers.push_back(makeNest("dup", { 0.0f, 0.0f, 400.0f, 300.0f }));
            if (validateGrid(model).wasOk())
                return juce::Result::fail("duplicate ids must be rejected");

            model.nestContainers.clear();
            model.gridSize = 0.0f;
            if (validateGrid(model).wasOk())
                return juce::Result::fail("zero grid size must be rejected");

            model.gridSize = 20.0f;
            model.mainItems.front().nestId = juce::String("ghost");
            if (validateGrid(model).wasOk())
                return juce::Result::fail("main widget with nestId must be rejected");

            model.mainItems.front().nestId.reset();
            model.mainItems.front().config.set("x", 4);
            if (validateGrid(model).wasOk())
                return juce::Result::fail("geometry keys in config must be rejected");

            model.mainItems.front().config.clear();
            model.schemaVersion.major = 2;
            if (validateGrid(model).wasOk())
                return juce::Result::fail("future schema major must be rejected");

            return juce::Result::ok();
        }
    }

    std::vector<SmokeTest> storeTests()
    {
        return {
            { "Reducer guards", testReducerGuards },
            { "Allocated id prefixes", testAllocatedIdPrefixes },
            { "Move between containers keeps absolute position", testMoveBetweenContainersKeepsAbsolutePosition },
            { "Nest cycle is rejected", testNestCycleIsRejected },
            { "Remove promotes or cascades", testRemovePromotesOrCascades },
            { "Events carry phase", testEventsCarryPhase },
            { "Validator rejects broken models", testValidatorRejectsBrokenModels }
        };
    }
}
