#pragma once

#include "Aries/Core/GridQueries.h"
#include "Aries/Public/GridHandle.h"

#include <cmath>
#include <functional>
#include <utility>
#include <vector>

namespace AriesSmoke
{
    using SmokeTest = std::pair<const char*, std::function<juce::Result()>>;

    inline bool nearlyEqual(float lhs, float rhs, float epsilon = 1.0e-4f)
    {
        return std::fabs(lhs - rhs) <= epsilon;
    }

    inline bool sameRect(const juce::Rectangle<float>& lhs, const juce::Rectangle<float>& rhs)
    {
        return nearlyEqual(lhs.getX(), rhs.getX())
            && nearlyEqual(lhs.getY(), rhs.getY())
            && nearlyEqual(lhs.getWidth(), rhs.getWidth())
            && nearlyEqual(lhs.getHeight(), rhs.getHeight());
    }

    inline juce::String describe(const juce::Rectangle<float>& bounds)
    {
        return "(" + juce::String(bounds.getX()) + "," + juce::String(bounds.getY()) + ","
             + juce::String(bounds.getWidth()) + "," + juce::String(bounds.getHeight()) + ")";
    }

    inline juce::Result failWith(const juce::String& what, const Aries::GridResult& result)
    {
        return juce::Result::fail(what + " (" + result.errorName() + ": " + result.getErrorMessage() + ")");
    }

    inline Aries::WidgetModel makeWidget(const Aries::ItemId& id,
                                         juce::Rectangle<float> bounds,
                                         std::optional<Aries::ItemId> nestId = std::nullopt)
    {
        Aries::WidgetModel widget;
        widget.id = id;
        widget.type = "basic";
        widget.title = id;
        widget.bounds = bounds;
        widget.nestId = std::move(nestId);
        return widget;
    }

    inline Aries::NestModel makeNest(const Aries::ItemId& id,
                                     juce::Rectangle<float> bounds,
                                     std::optional<Aries::ItemId> parentId = std::nullopt)
    {
        Aries::NestModel nest;
        nest.id = id;
        nest.title = id;
        nest.bounds = bounds;
        nest.parentNestId = std::move(parentId);
        return nest;
    }

    inline std::optional<juce::Rectangle<float>> boundsOf(const Aries::GridModel& model, const Aries::ItemId& id)
    {
        return Aries::Core::GridQueries::localBoundsOf(model, id);
    }

    // Debounce and throttle off so every settled change is observable without ticking.
    inline Aries::EngineSettings immediateSettings()
    {
        Aries::EngineSettings settings;
        settings.historyDebounceMs = 0;
        settings.interaction.throttleMs = 0;
        return settings;
    }

    struct ManualClock
    {
        juce::int64 now = 1700000000000;

        void attach(Aries::GridHandle& handle)
        {
            handle.setClock([this] { return now; });
        }
    };

    inline Aries::Editor::Interaction::PointerEvent pointerAt(float x, float y, juce::int64 timeMs = 0)
    {
        Aries::Editor::Interaction::PointerEvent pointer;
        pointer.position = { x, y };
        pointer.timeMs = timeMs;
        return pointer;
    }

    std::vector<SmokeTest> geometryTests();
    std::vector<SmokeTest> storeTests();
    std::vector<SmokeTest> historyTests();
    std::vector<SmokeTest> persistenceTests();
    std::vector<SmokeTest> interactionTests();
    std::vector<SmokeTest> viewTests();
    std::vector<SmokeTest> runtimeTests();
}
