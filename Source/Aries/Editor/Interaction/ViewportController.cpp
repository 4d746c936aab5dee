#include "Aries/Editor/Interaction/ViewportController.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace Aries::Editor::Interaction
{
    ViewportController::ViewportController(Core::GridStore& storeIn)
        : store(storeIn)
    {
    }

    void ViewportController::setContainerSize(Core::Geometry::ItemSize size) noexcept
    {
        container.width = std::isfinite(size.width) ? std::max(0.0f, size.width) : 0.0f;
        container.height = std::isfinite(size.height) ? std::max(0.0f, size.height) : 0.0f;
    }

    juce::Point<float> ViewportController::screenToWorld(const Viewport& viewport, juce::Point<float> screen) noexcept
    {
        const auto zoom = clampZoom(viewport.zoom);
        return { screen.x / zoom - viewport.x, screen.y / zoom - viewport.y };
    }

    juce::Point<float> ViewportController::worldToScreen(const Viewport& viewport, juce::Point<float> world) noexcept
    {
        const auto zoom = clampZoom(viewport.zoom);
        return { (world.x + viewport.x) * zoom, (world.y + viewport.y) * zoom };
    }

    juce::Point<float> ViewportController::screenToWorld(juce::Point<float> screen) const noexcept
    {
        return screenToWorld(store.viewport(), screen);
    }

    juce::Point<float> ViewportController::worldToScreen(juce::Point<float> world) const noexcept
    {
        return worldToScreen(store.viewport(), world);
    }

    WheelKind ViewportController::handleWheel(const WheelEvent& event)
    {
        if (!event.ctrl)
        {
            const auto zoom = store.viewport().zoom;
            auto next = store.viewport();
            next.x -= event.deltaX / zoom;
            next.y -= event.deltaY / zoom;
            store.setViewport(next);
            return WheelKind::pan;
        }

        const auto sincePrevious = lastWheelMs.has_value() ? event.timeMs - *lastWheelMs
                                                           : std::numeric_limits<juce::int64>::max();
        lastWheelMs = event.timeMs;

        const auto magnitude = std::abs(event.deltaY);
        auto kind = WheelKind::wheelZoom;
        auto zoomDelta = event.deltaY > 0.0f ? -controllerSettings.wheelStep : controllerSettings.wheelStep;

        if (magnitude < controllerSettings.pinchThreshold)
        {
            kind = WheelKind::pinchZoom;
            zoomDelta = -event.deltaY * controllerSettings.pinchSensitivity;
        }
        else if (magnitude < controllerSettings.trackpadThreshold && sincePrevious < controllerSettings.trackpadIntervalMs)
        {
            kind = WheelKind::trackpadZoom;
            zoomDelta = -event.deltaY * controllerSettings.trackpadSensitivity;
        }

        zoomAround(event.position, store.viewport().zoom * (1.0f + zoomDelta));
        return kind;
    }

    void ViewportController::zoomIn()
    {
        zoomAt({ container.width * 0.5f, container.height * 0.5f }, controllerSettings.keyboardZoomFactor);
    }

    void ViewportController::zoomOut()
    {
        zoomAt({ container.width * 0.5f, container.height * 0.5f }, 1.0f / controllerSettings.keyboardZoomFactor);
    }

    void ViewportController::zoomAt(juce::Point<float> screenPoint, float factor)
    {
        if (!std::isfinite(factor) || factor <= 0.0f)
            return;

        zoomAround(screenPoint, store.viewport().zoom * factor);
    }

    void ViewportController::panBy(juce::Point<float> screenDelta)
    {
        const auto current = store.viewport();
        store.setViewport({ current.x + screenDelta.x / current.zoom,
                            current.y + screenDelta.y / current.zoom,
                            current.zoom });
    }

    void ViewportController::reset()
    {
        store.setViewport(Viewport {});
    }

    void ViewportController::setViewport(const Viewport& next)
    {
        store.setViewport(next);
    }

    const Viewport& ViewportController::viewport() const noexcept
    {
        return store.viewport();
    }

    void ViewportController::zoomAround(juce::Point<float> screenPoint, float nextZoom)
    {
        const auto current = store.viewport();
        const auto clamped = clampZoom(nextZoom);
        const auto world = screenToWorld(current, screenPoint);

        store.setViewport({ screenPoint.x / clamped - world.x,
                            screenPoint.y / clamped - world.y,
                            clamped });
    }
}
