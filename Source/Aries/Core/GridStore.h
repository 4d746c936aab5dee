#pragma once

#include "Aries/Core/Reducer.h"
#include "Aries/Public/GridEvents.h"
#include <functional>
#include <memory>
#include <vector>

namespace Aries::Core
{
    // Single source of truth for the grid. Every mutation is applied to a copy and published as a
    // new immutable snapshot; a failed update leaves the published snapshot untouched.
    class GridStore
    {
    public:
        using Clock = std::function<juce::Time()>;

        class Listener
        {
        public:
            virtual ~Listener() = default;
            virtual void gridChanged(const GridEvent& event) = 0;
        };

        GridStore();
        explicit GridStore(GridModel initialModel);

        GridStore(const GridStore&) = delete;
        GridStore& operator=(const GridStore&) = delete;

        void setClock(Clock newClock);
        juce::Time now() const;

        std::shared_ptr<const GridModel> snapshot() const noexcept;
        const GridModel& model() const noexcept;
        const Viewport& viewport() const noexcept;
        int widgetCount() const noexcept;

        GridResult dispatch(const Action& action,
                            MutationPhase phase = MutationPhase::settled,
                            std::vector<ItemId>* createdIdsOut = nullptr);

        GridResult addItem(const WidgetModel& widget, MutationPhase phase = MutationPhase::settled, ItemId* createdIdOut = nullptr);
        GridResult addItem(const NestModel& nest, MutationPhase phase = MutationPhase::settled, ItemId* createdIdOut = nullptr);
        GridResult updateItem(const UpdateItemAction& partial, MutationPhase phase = MutationPhase::settled);
        GridResult removeItem(const ItemId& id, ChildPolicy policy = ChildPolicy::promote);
        GridResult moveItemBetweenContainers(const ItemId& id,
                                             const ContainerRef& from,
                                             const ContainerRef& to,
                                             std::optional<juce::Rectangle<float>> localBounds = std::nullopt,
                                             MutationPhase phase = MutationPhase::settled);

        void setViewport(const Viewport& next, MutationPhase phase = MutationPhase::settled);

        // Restores a full snapshot (history, profile, import). The viewport is optional.
        GridResult replaceState(const GridModel& next,
                                ReplaceOrigin origin,
                                std::optional<Viewport> nextViewport = std::nullopt);

        void addListener(Listener* listener);
        void removeListener(Listener* listener);

    private:
        void publish(const GridEvent& event);

        std::shared_ptr<const GridModel> modelState;
        Viewport viewportState;
        Clock clock;
        juce::ListenerList<Listener> listeners;
    };
}
