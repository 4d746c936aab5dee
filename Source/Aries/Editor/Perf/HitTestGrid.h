#pragma once

#include "Aries/Public/Types.h"
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace Aries::Editor::Perf
{
    struct HitTestItem
    {
        ItemId id;
        juce::Rectangle<float> bounds;
    };

    // Uniform spatial hash over item bounds. Queries return ids in insertion order. Items spanning more
    // than kMaxCellsPerItem cells skip the hash and are tested on every query.
    class HitTestGrid
    {
    public:
        void setCellSize(float size) noexcept;
        float cellSize() const noexcept;

        void rebuild(const std::vector<HitTestItem>& items);

        std::vector<ItemId> query(juce::Rectangle<float> area) const;

        size_t size() const noexcept { return allItems.size(); }

    private:
        static constexpr double kMaxCellsPerItem = 4096.0;

        static std::int64_t makeCellKey(int x, int y) noexcept;
        double cellSpan(juce::Rectangle<float> bounds) const noexcept;
        std::vector<std::int64_t> cellsForBounds(juce::Rectangle<float> bounds) const;
        std::vector<size_t> queryCandidates(const std::vector<std::int64_t>& cellKeys) const;

        float gridCellSize = 256.0f;
        std::vector<HitTestItem> allItems;
        std::vector<size_t> oversizedItems;
        std::unordered_map<std::int64_t, std::vector<size_t>> cellToItems;
    };
}
