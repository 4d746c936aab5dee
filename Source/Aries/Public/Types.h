#pragma once

#include <juce_core/juce_core.h>
#include <juce_graphics/juce_graphics.h>
#include <cmath>
#include <optional>
#include <vector>

namespace Aries
{
    using ItemId = juce::String;
    using PropertyBag = juce::NamedValueSet;

    constexpr float kDefaultGridSize = 20.0f;
    constexpr float kNestHeaderHeight = 40.0f;
    constexpr float kMinZoom = 0.1f;
    constexpr float kMaxZoom = 3.0f;

    constexpr float kMinWidgetWidth = 120.0f;
    constexpr float kMinWidgetHeight = 80.0f;
    constexpr float kMinNestWidth = 200.0f;
    constexpr float kMinNestHeight = 150.0f;

    enum class ItemKind
    {
        widget,
        nest
    };

    enum class ContainerKind
    {
        main,
        nest
    };

    struct ContainerRef
    {
        ContainerKind kind = ContainerKind::main;
        ItemId nestId;

        static ContainerRef main() { return {}; }
        static ContainerRef nest(const ItemId& id) { return { ContainerKind::nest, id }; }

        bool isMain() const noexcept { return kind == ContainerKind::main; }

        bool operator==(const ContainerRef& other) const noexcept
        {
            if (kind != other.kind)
                return false;
            return kind == ContainerKind::main || nestId == other.nestId;
        }

        bool operator!=(const ContainerRef& other) const noexcept { return !(*this == other); }
    };

    struct Viewport
    {
        float x = 0.0f;
        float y = 0.0f;
        float zoom = 1.0f;

        bool operator==(const Viewport& other) const noexcept
        {
            return x == other.x && y == other.y && zoom == other.zoom;
        }

        bool operator!=(const Viewport& other) const noexcept { return !(*this == other); }
    };

    inline float clampZoom(float zoom) noexcept
    {
        if (!std::isfinite(zoom))
            return 1.0f;
        return juce::jlimit(kMinZoom, kMaxZoom, zoom);
    }

    // (x, y) is the top-left corner in the owning container's local space.
    // Nested coordinates are relative to the nest origin shifted down by the header.
    struct WidgetModel
    {
        ItemId id;
        juce::String type;
        juce::String title;
        juce::String content;
        PropertyBag config;
        juce::Rectangle<float> bounds;
        std::optional<ItemId> nestId;
        juce::String ariesModType;
        juce::Time createdAt;
        juce::Time updatedAt;

        ContainerRef container() const
        {
            return nestId.has_value() ? ContainerRef::nest(*nestId) : ContainerRef::main();
        }
    };

    struct NestModel
    {
        ItemId id;
        juce::String title;
        juce::Rectangle<float> bounds;
        std::optional<ItemId> parentNestId;
        juce::Time createdAt;
        juce::Time updatedAt;

        ContainerRef container() const
        {
            return parentNestId.has_value() ? ContainerRef::nest(*parentNestId) : ContainerRef::main();
        }
    };

    struct SchemaVersion
    {
        int major = 1;
        int minor = 0;
    };

    inline SchemaVersion currentSchemaVersion() noexcept
    {
        return {};
    }

    inline int compareSchemaVersion(const SchemaVersion& lhs, const SchemaVersion& rhs) noexcept
    {
        if (lhs.major != rhs.major)
            return lhs.major < rhs.major ? -1 : 1;
        if (lhs.minor != rhs.minor)
            return lhs.minor < rhs.minor ? -1 : 1;
        return 0;
    }

    struct GridModel
    {
        SchemaVersion schemaVersion = currentSchemaVersion();
        std::vector<WidgetModel> mainItems;
        std::vector<NestModel> nestContainers;
        std::vector<WidgetModel> nestedItems;
        float gridSize = kDefaultGridSize;
    };

    inline bool operator==(const WidgetModel& lhs, const WidgetModel& rhs)
    {
        return lhs.id == rhs.id
            && lhs.type == rhs.type
            && lhs.title == rhs.title
            && lhs.content == rhs.content
            && lhs.config == rhs.config
            && lhs.bounds == rhs.bounds
            && lhs.nestId == rhs.nestId
            && lhs.ariesModType == rhs.ariesModType
            && lhs.createdAt == rhs.createdAt
            && lhs.updatedAt == rhs.updatedAt;
    }

    inline bool operator!=(const WidgetModel& lhs, const WidgetModel& rhs) { return !(lhs == rhs); }

    inline bool operator==(const NestModel& lhs, const NestModel& rhs)
    {
        return lhs.id == rhs.id
            && lhs.title == rhs.title
            && lhs.bounds == rhs.bounds
            && lhs.parentNestId == rhs.parentNestId
            && lhs.createdAt == rhs.createdAt
            && lhs.updatedAt == rhs.updatedAt;
    }

    inline bool operator!=(const NestModel& lhs, const NestModel& rhs) { return !(lhs == rhs); }

    inline bool operator==(const GridModel& lhs, const GridModel& rhs)
    {
        return lhs.mainItems == rhs.mainItems
            && lhs.nestContainers == rhs.nestContainers
            && lhs.nestedItems == rhs.nestedItems
            && lhs.gridSize == rhs.gridSize;
    }

    inline bool operator!=(const GridModel& lhs, const GridModel& rhs) { return !(lhs == rhs); }

    inline bool isFiniteBounds(const juce::Rectangle<float>& bounds) noexcept
    {
        return std::isfinite(bounds.getX())
            && std::isfinite(bounds.getY())
            && std::isfinite(bounds.getWidth())
            && std::isfinite(bounds.getHeight());
    }

    inline bool isValidItemBounds(const juce::Rectangle<float>& bounds) noexcept
    {
        return isFiniteBounds(bounds) && bounds.getWidth() > 0.0f && bounds.getHeight() > 0.0f;
    }

    inline bool isNumericVar(const juce::var& value) noexcept
    {
        return value.isInt() || value.isInt64() || value.isDouble();
    }

    inline bool isAllowedConfigValue(const juce::var& value) noexcept
    {
        if (value.isVoid() || value.isUndefined())
            return false;
        if (value.isDouble())
            return std::isfinite(static_cast<double>(value));

        return value.isBool() || value.isInt() || value.isInt64() || value.isString();
    }

    inline juce::Result validatePropertyBag(const PropertyBag& bag)
    {
        for (int i = 0; i < bag.size(); ++i)
        {
            const auto name = bag.getName(i).toString();

            // Geometry is first-class item state and must not live in config.
            if (name == "x" || name == "y" || name == "w" || name == "h")
                return juce::Result::fail("config key '" + name + "' is reserved");

            if (!isAllowedConfigValue(bag.getValueAt(i)))
                return juce::Result::fail("Unsupported config value type at key: " + name);
        }

        return juce::Result::ok();
    }
}
