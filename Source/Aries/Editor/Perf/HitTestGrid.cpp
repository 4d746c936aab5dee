#include "Aries/Editor/Perf/HitTestGrid.h"

#include <algorithm>
#include <cmath>

namespace Aries::Editor::Perf
{
    void HitTestGrid::setCellSize(float size) noexcept
    {
        if (std::isfinite(size) && size > 1.0f)
            gridCellSize = size;
    }

    float HitTestGrid::cellSize() const noexcept
    {
        return gridCellSize;
    }

    void HitTestGrid::rebuild(const std::vector<HitTestItem>& items)
    {
        allItems.clear();
        oversizedItems.clear();
        cellToItems.clear();

        for (const auto& item : items)
        {
            if (item.id.isEmpty() || !isFiniteBounds(item.bounds))
                continue;

            const auto index = allItems.size();
            allItems.push_back(item);

            if (cellSpan(item.bounds) > kMaxCellsPerItem)
            {
                oversizedItems.push_back(index);
                continue;
            }

            for (const auto key : cellsForBounds(item.bounds))
                cellToItems[key].push_back(index);
        }
    }

    std::vector<ItemId> HitTestGrid::query(juce::Rectangle<float> area) const
    {
        std::vector<ItemId> hits;
        if (!isFiniteBounds(area))
            return hits;

        // A zoomed-out viewport can cover more cells than there are items.
        if (cellSpan(area) > kMaxCellsPerItem)
        {
            for (const auto& item : allItems)
            {
                if (item.bounds.intersects(area))
                    hits.push_back(item.id);
            }

            return hits;
        }

        for (const auto index : queryCandidates(cellsForBounds(area)))
        {
            if (allItems[index].bounds.intersects(area))
                hits.push_back(allItems[index].id);
        }

        return hits;
    }

    std::int64_t HitTestGrid::makeCellKey(int x, int y) noexcept
    {
        return (static_cast<std::int64_t>(x) << 32) | (static_cast<std::uint32_t>(y));
    }

    double HitTestGrid::cellSpan(juce::Rectangle<float> bounds) const noexcept
    {
        const auto columns = std::floor(static_cast<double>(bounds.getRight()) / gridCellSize)
                           - std::floor(static_cast<double>(bounds.getX()) / gridCellSize) + 1.0;
        const auto rows = std::floor(static_cast<double>(bounds.getBottom()) / gridCellSize)
                        - std::floor(static_cast<double>(bounds.getY()) / gridCellSize) + 1.0;
        return columns * rows;
    }

    // Callers keep the span under kMaxCellsPerItem.
    std::vector<std::int64_t> HitTestGrid::cellsForBounds(juce::Rectangle<float> bounds) const
    {
        std::vector<std::int64_t> keys;

        const auto toCell = [this](float value)
        {
            return static_cast<int>(juce::jlimit(-1.0e9f, 1.0e9f, std::floor(value / gridCellSize)));
        };

        const int left = toCell(bounds.getX());
        const int top = toCell(bounds.getY());
        const int right = toCell(bounds.getRight());
        const int bottom = toCell(bounds.getBottom());

        keys.reserve(static_cast<size_t>((right - left + 1) * (bottom - top + 1)));
        for (int y = top; y <= bottom; ++y)
        {
            for (int x = left; x <= right; ++x)
                keys.push_back(makeCellKey(x, y));
        }

        return keys;
    }

    std::vector<size_t> HitTestGrid::queryCandidates(const std::vector<std::int64_t>& cellKeys) const
    {
        std::vector<size_t> indices(oversizedItems);
        for (const auto key : cellKeys)
        {
            const auto it = cellToItems.find(key);
            if (it == cellToItems.end())
                continue;

            indices.insert(indices.end(), it->second.begin(), it->second.end());
        }

        std::sort(indices.begin(), indices.end());
        indices.erase(std::unique(indices.begin(), indices.end()), indices.end());
        return indices;
    }
}
