#pragma once

#include "Aries/Core/GridStore.h"
#include "Aries/Editor/Interaction/ResizeEngine.h"
#include "Aries/Editor/Interaction/ViewportController.h"
#include "Aries/Runtime/EngineDiagnostics.h"
#include <map>
#include <optional>
#include <set>
#include <vector>

namespace Aries::Editor::Interaction
{
    enum class PointerButton
    {
        primary,
        middle,
        secondary
    };

    struct PointerEvent
    {
        juce::Point<float> position;   // container-relative screen pixels
        PointerButton button = PointerButton::primary;
        bool ctrl = false;
        bool shift = false;
        juce::int64 timeMs = 0;
    };

    enum class GestureState
    {
        idle,
        dragging,
        resizing,
        panning
    };

    juce::String gestureStateName(GestureState state);

    struct DragState
    {
        bool isDragging = false;
        ItemId draggedId;
        ItemKind draggedType = ItemKind::widget;
        ContainerRef sourceContainer;
        juce::Point<float> pointerOffset;        // world units, pointer minus item origin
        juce::Point<float> startAbsolutePosition;
    };

    struct ResizeState
    {
        bool isResizing = false;
        ItemId resizedId;
        ItemKind resizedType = ItemKind::widget;
        ResizeHandle handle = ResizeHandle::se;
        juce::Point<float> startPointer;         // world units
        juce::Point<float> startSize;
        juce::Point<float> startPosition;        // container-local
    };

    struct InteractionSettings
    {
        int throttleMs = 8;
        bool autoGrowNests = true;
        Core::Geometry::NestAutoSizeSettings nestAutoSize;
    };

    // Owns every pointer gesture. Mid-gesture frames reach the store as transient mutations and the
    // gesture end commits one settled mutation. Only one gesture is active at a time.
    class InteractionController
    {
    public:
        InteractionController(Core::GridStore& storeIn,
                              ViewportController& viewportIn,
                              Runtime::EngineDiagnostics& diagnosticsIn);

        void setSettings(const InteractionSettings& nextSettings) noexcept;
        const InteractionSettings& settings() const noexcept;

        static bool isPanTrigger(const PointerEvent& pointer) noexcept;

        GridResult beginDrag(const ItemId& id, ItemKind kind, const PointerEvent& pointer);
        GridResult beginResize(const ItemId& id, ItemKind kind, ResizeHandle handle, const PointerEvent& pointer);
        GridResult beginPan(const PointerEvent& pointer);

        // Moves arriving within throttleMs of the last processed move are held, not dropped.
        void updatePointer(const PointerEvent& pointer);
        void tick(juce::int64 nowMs);
        GridResult endGesture();
        void focusLost();

        GridResult dropFromPalette(const juce::String& payloadJson,
                                   const PointerEvent& pointer,
                                   const std::optional<ItemId>& targetNestId = std::nullopt,
                                   ItemId* createdIdOut = nullptr);

        GestureState state() const noexcept { return gestureState; }
        const DragState& dragState() const noexcept { return drag; }
        const ResizeState& resizeState() const noexcept { return resize; }
        const std::set<ItemId>& pushedIds() const noexcept { return pushed; }
        const std::optional<ItemId>& dragOverNestId() const noexcept { return dragOverNest; }
        bool hasPendingMove() const noexcept { return pendingMove.has_value(); }

        // Ids the culling pass must keep regardless of geometry.
        std::vector<ItemId> alwaysVisibleIds() const;

    private:
        void processMove(const PointerEvent& pointer);
        void processDragMove(const PointerEvent& pointer);
        void processResizeMove(const PointerEvent& pointer);
        void processPanMove(const PointerEvent& pointer);

        GridResult finishDrag();
        GridResult finishResize();

        // Silent abort: reverts transient frames of items that still exist and returns to idle.
        GridResult abortGesture(const juce::String& reason);
        void rememberStartBounds(const ItemId& id);
        void resetGesture();

        juce::Point<float> toWorld(juce::Point<float> screen) const noexcept;

        Core::GridStore& store;
        ViewportController& viewport;
        Runtime::EngineDiagnostics& diagnostics;
        InteractionSettings interactionSettings;

        GestureState gestureState = GestureState::idle;
        DragState drag;
        ResizeState resize;
        juce::Point<float> lastPanPoint;

        std::set<ItemId> pushed;
        std::optional<ItemId> dragOverNest;
        std::map<ItemId, juce::Rectangle<float>> startBounds;

        std::optional<PointerEvent> pendingMove;
        std::optional<juce::int64> lastProcessedMs;
    };
}
