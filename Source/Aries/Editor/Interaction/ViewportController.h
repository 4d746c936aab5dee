#pragma once

#include "Aries/Core/GridStore.h"
#include "Aries/Core/Geometry.h"
#include <optional>

namespace Aries::Editor::Interaction
{
    struct WheelEvent
    {
        juce::Point<float> position;   // container-relative screen pixels
        float deltaX = 0.0f;
        float deltaY = 0.0f;
        bool ctrl = false;
        juce::int64 timeMs = 0;
    };

    enum class WheelKind
    {
        pan,
        pinchZoom,
        trackpadZoom,
        wheelZoom
    };

    // Screen = (world + viewport offset) * zoom. All viewport writes go through the store.
    class ViewportController
    {
    public:
        struct Settings
        {
            float pinchThreshold = 5.0f;
            float trackpadThreshold = 50.0f;
            juce::int64 trackpadIntervalMs = 100;
            float pinchSensitivity = 0.005f;
            float trackpadSensitivity = 0.002f;
            float wheelStep = 0.08f;
            float keyboardZoomFactor = 1.25f;
        };

        explicit ViewportController(Core::GridStore& storeIn);

        void setSettings(const Settings& nextSettings) noexcept { controllerSettings = nextSettings; }
        const Settings& settings() const noexcept { return controllerSettings; }

        void setContainerSize(Core::Geometry::ItemSize size) noexcept;
        Core::Geometry::ItemSize containerSize() const noexcept { return container; }

        static juce::Point<float> screenToWorld(const Viewport& viewport, juce::Point<float> screen) noexcept;
        static juce::Point<float> worldToScreen(const Viewport& viewport, juce::Point<float> world) noexcept;
        juce::Point<float> screenToWorld(juce::Point<float> screen) const noexcept;
        juce::Point<float> worldToScreen(juce::Point<float> world) const noexcept;

        WheelKind handleWheel(const WheelEvent& event);

        void zoomIn();
        void zoomOut();
        // Keeps the world point under `screenPoint` fixed while scaling zoom by `factor`.
        void zoomAt(juce::Point<float> screenPoint, float factor);
        void panBy(juce::Point<float> screenDelta);
        void reset();
        void setViewport(const Viewport& next);

        const Viewport& viewport() const noexcept;

    private:
        void zoomAround(juce::Point<float> screenPoint, float nextZoom);

        Core::GridStore& store;
        Settings controllerSettings;
        Core::Geometry::ItemSize container;
        std::optional<juce::int64> lastWheelMs;
    };
}
