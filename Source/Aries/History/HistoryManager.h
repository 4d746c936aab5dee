#pragma once

#include "Aries/Public/Types.h"
#include <deque>
#include <memory>
#include <optional>

namespace Aries::History
{
    struct HistoryEntry
    {
        std::shared_ptr<const GridModel> state;
        Viewport viewport;
    };

    // Linear undo over settled snapshots. Entries are debounced, pushing truncates the redo tail and
    // the oldest entry is evicted once capacity is exceeded.
    class HistoryManager
    {
    public:
        explicit HistoryManager(size_t capacity = 50, int debounceMs = 100);

        void reset(HistoryEntry entry);

        void noteSettledChange(std::shared_ptr<const GridModel> state, const Viewport& viewport, juce::int64 nowMs);
        bool tick(juce::int64 nowMs);
        bool flushPending();
        bool hasPending() const noexcept;

        std::optional<HistoryEntry> undo();
        std::optional<HistoryEntry> redo();
        bool canUndo() const noexcept;
        bool canRedo() const noexcept;

        size_t size() const noexcept;
        int index() const noexcept;
        const HistoryEntry* current() const noexcept;

        void setCapacity(size_t newCapacity);
        size_t capacity() const noexcept;
        void setDebounceMs(int newDebounceMs) noexcept;
        int debounceMs() const noexcept;

    private:
        void push(HistoryEntry entry);
        void trimToCapacity();

        std::deque<HistoryEntry> entries;
        int currentIndex = -1;
        std::optional<HistoryEntry> pending;
        juce::int64 pendingSinceMs = 0;
        size_t maxEntries = 50;
        int debounceIntervalMs = 100;
    };
}
