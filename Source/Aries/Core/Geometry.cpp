#include "Aries/Core/Geometry.h"

#include <algorithm>
#include <cmath>
#include <set>

namespace Aries::Core::Geometry
{
    namespace
    {
        struct Displacement
        {
            float dx = 0.0f;
            float dy = 0.0f;
        };

        bool isUsableGrid(float gridSize) noexcept
        {
            return std::isfinite(gridSize) && gridSize > 0.0f;
        }

        // Smaller overlap axis wins, ties go vertical. Direction is away from the pusher's centre,
        // ties push right/down.
        Displacement computeDisplacement(const juce::Rectangle<float>& pusher,
                                         const juce::Rectangle<float>& target) noexcept
        {
            const auto overlapX = std::min(pusher.getRight(), target.getRight()) - std::max(pusher.getX(), target.getX());
            const auto overlapY = std::min(pusher.getBottom(), target.getBottom()) - std::max(pusher.getY(), target.getY());

            Displacement displacement;
            if (overlapX < overlapY)
            {
                const auto direction = target.getCentreX() >= pusher.getCentreX() ? 1.0f : -1.0f;
                displacement.dx = direction * overlapX;
            }
            else
            {
                const auto direction = target.getCentreY() >= pusher.getCentreY() ? 1.0f : -1.0f;
                displacement.dy = direction * overlapY;
            }

            return displacement;
        }

        juce::Rectangle<float> pushAway(const juce::Rectangle<float>& pusher,
                                        const juce::Rectangle<float>& target,
                                        float gridSize) noexcept
        {
            const auto displacement = computeDisplacement(pusher, target);
            auto moved = target.translated(displacement.dx, displacement.dy);

            if (!isUsableGrid(gridSize))
                return moved;

            moved.setPosition(snapToGrid(moved.getX(), gridSize), snapToGrid(moved.getY(), gridSize));

            // Rounding may land back inside the pusher; step along the push axis until clear.
            const auto stepX = displacement.dx > 0.0f ? gridSize : (displacement.dx < 0.0f ? -gridSize : 0.0f);
            const auto stepY = displacement.dx != 0.0f ? 0.0f : (displacement.dy >= 0.0f ? gridSize : -gridSize);
            for (int guard = 0; guard < 4 && collides(pusher, moved); ++guard)
                moved.translate(stepX, stepY);

            return moved;
        }

        bool idLess(const PushOutcome& lhs, const PushOutcome& rhs)
        {
            return lhs.id.compare(rhs.id) < 0;
        }
    }

    ItemId generateUniqueId(const juce::String& prefix)
    {
        static const char* const alphabet = "0123456789abcdefghijklmnopqrstuvwxyz";

        auto& random = juce::Random::getSystemRandom();
        juce::String suffix;
        suffix.preallocateBytes(9);
        for (int i = 0; i < 9; ++i)
            suffix << juce::String::charToString(static_cast<juce::juce_wchar>(alphabet[random.nextInt(36)]));

        return prefix + "-" + juce::String(juce::Time::currentTimeMillis()) + "-" + suffix;
    }

    float snapToGrid(float value, float gridSize) noexcept
    {
        if (!isUsableGrid(gridSize))
            return value;
        return std::round(value / gridSize) * gridSize;
    }

    juce::Point<float> snapToGrid(juce::Point<float> point, float gridSize) noexcept
    {
        return { snapToGrid(point.x, gridSize), snapToGrid(point.y, gridSize) };
    }

    juce::Rectangle<float> snapPosition(juce::Rectangle<float> bounds, float gridSize) noexcept
    {
        return bounds.withPosition(snapToGrid(bounds.getPosition(), gridSize));
    }

    float roundUpToGrid(float value, float gridSize) noexcept
    {
        if (!isUsableGrid(gridSize))
            return value;
        return std::ceil(value / gridSize) * gridSize;
    }

    bool collides(const juce::Rectangle<float>& a, const juce::Rectangle<float>& b) noexcept
    {
        return a.getX() < b.getRight()
            && b.getX() < a.getRight()
            && a.getY() < b.getBottom()
            && b.getY() < a.getBottom();
    }

    std::vector<PushOutcome> resolvePush(const PushItem& moving,
                                         const std::vector<PushItem>& others,
                                         float gridSize)
    {
        std::vector<PushOutcome> outcomes;
        outcomes.reserve(others.size());
        for (const auto& other : others)
            outcomes.push_back({ other.id, other.bounds, false });

        std::stable_sort(outcomes.begin(), outcomes.end(), idLess);

        std::set<juce::String> handled;
        for (auto& primary : outcomes)
        {
            if (primary.id == moving.id || handled.count(primary.id) > 0)
                continue;
            if (!collides(moving.bounds, primary.bounds))
                continue;

            primary.bounds = pushAway(moving.bounds, primary.bounds, gridSize);
            primary.pushed = true;
            handled.insert(primary.id);

            // One level of chain reaction: the displaced item pushes untouched siblings it now hits.
            const auto pusherBounds = primary.bounds;
            const auto pusherId = primary.id;
            for (auto& secondary : outcomes)
            {
                if (secondary.id == moving.id || secondary.id == pusherId || handled.count(secondary.id) > 0)
                    continue;
                if (!collides(pusherBounds, secondary.bounds))
                    continue;

                secondary.bounds = pushAway(pusherBounds, secondary.bounds, gridSize);
                secondary.pushed = true;
                handled.insert(secondary.id);
            }
        }

        for (auto& outcome : outcomes)
        {
            if (!outcome.pushed)
                continue;

            const auto original = std::find_if(others.begin(),
                                               others.end(),
                                               [&outcome](const PushItem& item)
                                               {
                                                   return item.id == outcome.id;
                                               });
            if (original != others.end() && original->bounds == outcome.bounds)
                outcome.pushed = false;
        }

        return outcomes;
    }

    juce::Point<float> findNonCollidingPosition(const juce::Rectangle<float>& candidate,
                                                const std::vector<juce::Rectangle<float>>& existing,
                                                float gridSize,
                                                int maxRings)
    {
        const auto isFree = [&existing](const juce::Rectangle<float>& bounds)
        {
            return std::none_of(existing.begin(),
                                existing.end(),
                                [&bounds](const juce::Rectangle<float>& other)
                                {
                                    return collides(bounds, other);
                                });
        };

        if (isFree(candidate) || !isUsableGrid(gridSize))
            return candidate.getPosition();

        struct Offset
        {
            int dx = 0;
            int dy = 0;
        };

        std::vector<Offset> ring;
        for (int radius = 1; radius <= std::max(0, maxRings); ++radius)
        {
            ring.clear();
            for (int dy = -radius; dy <= radius; ++dy)
            {
                for (int dx = -radius; dx <= radius; ++dx)
                {
                    if (std::max(std::abs(dx), std::abs(dy)) == radius)
                        ring.push_back({ dx, dy });
                }
            }

            // Nearest cells of the ring first; ties prefer right/down.
            std::stable_sort(ring.begin(),
                             ring.end(),
                             [](const Offset& lhs, const Offset& rhs)
                             {
                                 const auto lhsDistance = lhs.dx * lhs.dx + lhs.dy * lhs.dy;
                                 const auto rhsDistance = rhs.dx * rhs.dx + rhs.dy * rhs.dy;
                                 if (lhsDistance != rhsDistance)
                                     return lhsDistance < rhsDistance;
                                 if (lhs.dy != rhs.dy)
                                     return lhs.dy > rhs.dy;
                                 return lhs.dx > rhs.dx;
                             });

            for (const auto& offset : ring)
            {
                const auto probe = candidate.translated(static_cast<float>(offset.dx) * gridSize,
                                                        static_cast<float>(offset.dy) * gridSize);
                if (isFree(probe))
                    return probe.getPosition();
            }
        }

        return candidate.getPosition();
    }

    ItemSize nestAutoSize(const std::vector<juce::Rectangle<float>>& children,
                          float gridSize,
                          const NestAutoSizeSettings& settings)
    {
        ItemSize size { settings.minWidth, settings.minHeight };
        if (children.empty())
            return size;

        auto maxRight = 0.0f;
        auto maxBottom = 0.0f;
        for (const auto& child : children)
        {
            maxRight = std::max(maxRight, child.getRight());
            maxBottom = std::max(maxBottom, child.getBottom());
        }

        size.width = std::max(settings.minWidth, roundUpToGrid(maxRight + settings.padding, gridSize));
        size.height = std::max(settings.minHeight,
                               roundUpToGrid(maxBottom + settings.padding + kNestHeaderHeight, gridSize));
        return size;
    }

    juce::String defaultContentForType(const juce::String& type)
    {
        if (type == "sensor") return juce::String::fromUTF8("23.5\xc2\xb0" "C");
        if (type == "chart" || type == "line-chart") return "Chart Data";
        if (type == "pie-chart") return "Pie Chart";
        if (type == "trend-chart") return "Trend Data";
        if (type == "status") return "Online";
        if (type == "gauge") return "75%";
        if (type == "monitor") return "CPU: 45%";
        if (type == "power") return "120W";
        if (type == "network-status") return "Connected";
        if (type == "bandwidth") return "1.2 Mbps";
        if (type == "data-table") return "Data Table";
        return "No Data";
    }
}
