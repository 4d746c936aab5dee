#include "Aries/Editor/Interaction/ResizeEngine.h"

#include "Aries/Core/Geometry.h"

namespace Aries::Editor::Interaction
{
    namespace
    {
        struct HandleAxes
        {
            bool west = false;
            bool east = false;
            bool north = false;
            bool south = false;
        };

        HandleAxes axesFor(ResizeHandle handle) noexcept
        {
            switch (handle)
            {
                case ResizeHandle::n: return { false, false, true, false };
                case ResizeHandle::s: return { false, false, false, true };
                case ResizeHandle::e: return { false, true, false, false };
                case ResizeHandle::w: return { true, false, false, false };
                case ResizeHandle::ne: return { false, true, true, false };
                case ResizeHandle::nw: return { true, false, true, false };
                case ResizeHandle::se: return { false, true, false, true };
                case ResizeHandle::sw: return { true, false, false, true };
            }

            return {};
        }
    }

    juce::String resizeHandleName(ResizeHandle handle)
    {
        switch (handle)
        {
            case ResizeHandle::n: return "n";
            case ResizeHandle::s: return "s";
            case ResizeHandle::e: return "e";
            case ResizeHandle::w: return "w";
            case ResizeHandle::ne: return "ne";
            case ResizeHandle::nw: return "nw";
            case ResizeHandle::se: return "se";
            case ResizeHandle::sw: return "sw";
        }

        return "se";
    }

    std::optional<ResizeHandle> resizeHandleFromName(const juce::String& name)
    {
        const auto key = name.trim().toLowerCase();
        for (const auto handle : { ResizeHandle::n, ResizeHandle::s, ResizeHandle::e, ResizeHandle::w,
                                   ResizeHandle::ne, ResizeHandle::nw, ResizeHandle::se, ResizeHandle::sw })
        {
            if (resizeHandleName(handle) == key)
                return handle;
        }

        return std::nullopt;
    }

    juce::Point<float> ResizeEngine::minimumSize(ItemKind kind) noexcept
    {
        return kind == ItemKind::nest ? juce::Point<float>(kMinNestWidth, kMinNestHeight)
                                      : juce::Point<float>(kMinWidgetWidth, kMinWidgetHeight);
    }

    juce::Rectangle<float> ResizeEngine::compute(const ResizeRequest& request)
    {
        using Core::Geometry::roundUpToGrid;
        using Core::Geometry::snapToGrid;

        const auto axes = axesFor(request.handle);
        const auto grid = request.gridSize;
        const auto start = request.startBounds;
        const auto minimumWidth = roundUpToGrid(minimumSize(request.kind).x, grid);
        const auto minimumHeight = roundUpToGrid(minimumSize(request.kind).y, grid);
        const auto right = snapToGrid(start.getRight(), grid);
        const auto bottom = snapToGrid(start.getBottom(), grid);

        auto x = snapToGrid(start.getX(), grid);
        auto y = snapToGrid(start.getY(), grid);
        auto width = snapToGrid(start.getWidth(), grid);
        auto height = snapToGrid(start.getHeight(), grid);

        if (axes.east)
            width = snapToGrid(start.getWidth() + request.pointerDelta.x, grid);
        if (axes.south)
            height = snapToGrid(start.getHeight() + request.pointerDelta.y, grid);

        if (axes.west)
        {
            x = snapToGrid(start.getX() + request.pointerDelta.x, grid);
            width = right - x;
        }

        if (axes.north)
        {
            y = snapToGrid(start.getY() + request.pointerDelta.y, grid);
            height = bottom - y;
        }

        if (width < minimumWidth)
        {
            width = minimumWidth;
            if (axes.west)
                x = right - width;
        }

        if (height < minimumHeight)
        {
            height = minimumHeight;
            if (axes.north)
                y = bottom - height;
        }

        return { x, y, width, height };
    }
}
