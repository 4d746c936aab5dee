#include "Aries/History/HistoryManager.h"

#include <algorithm>

namespace Aries::History
{
    HistoryManager::HistoryManager(size_t capacity, int debounceMs)
        : maxEntries(std::max<size_t>(1, capacity)),
          debounceIntervalMs(std::max(0, debounceMs))
    {
    }

    void HistoryManager::reset(HistoryEntry entry)
    {
        entries.clear();
        pending.reset();
        entries.push_back(std::move(entry));
        currentIndex = 0;
    }

    void HistoryManager::noteSettledChange(std::shared_ptr<const GridModel> state,
                                           const Viewport& viewport,
                                           juce::int64 nowMs)
    {
        if (state == nullptr)
            return;

        pending = HistoryEntry { std::move(state), viewport };
        pendingSinceMs = nowMs;

        if (debounceIntervalMs == 0)
            flushPending();
    }

    bool HistoryManager::tick(juce::int64 nowMs)
    {
        if (!pending.has_value())
            return false;
        if (nowMs - pendingSinceMs < debounceIntervalMs)
            return false;

        return flushPending();
    }

    bool HistoryManager::flushPending()
    {
        if (!pending.has_value())
            return false;

        auto entry = std::move(*pending);
        pending.reset();
        push(std::move(entry));
        return true;
    }

    bool HistoryManager::hasPending() const noexcept
    {
        return pending.has_value();
    }

    std::optional<HistoryEntry> HistoryManager::undo()
    {
        flushPending();
        if (!canUndo())
            return std::nullopt;

        --currentIndex;
        return entries[static_cast<size_t>(currentIndex)];
    }

    std::optional<HistoryEntry> HistoryManager::redo()
    {
        flushPending();
        if (!canRedo())
            return std::nullopt;

        ++currentIndex;
        return entries[static_cast<size_t>(currentIndex)];
    }

    bool HistoryManager::canUndo() const noexcept
    {
        return currentIndex > 0 || (pending.has_value() && currentIndex >= 0);
    }

    bool HistoryManager::canRedo() const noexcept
    {
        return !pending.has_value() && currentIndex + 1 < static_cast<int>(entries.size());
    }

    size_t HistoryManager::size() const noexcept
    {
        return entries.size();
    }

    int HistoryManager::index() const noexcept
    {
        return currentIndex;
    }

    const HistoryEntry* HistoryManager::current() const noexcept
    {
        if (currentIndex < 0 || currentIndex >= static_cast<int>(entries.size()))
            return nullptr;
        return &entries[static_cast<size_t>(currentIndex)];
    }

    void HistoryManager::setCapacity(size_t newCapacity)
    {
        maxEntries = std::max<size_t>(1, newCapacity);
        trimToCapacity();
    }

    size_t HistoryManager::capacity() const noexcept
    {
        return maxEntries;
    }

    void HistoryManager::setDebounceMs(int newDebounceMs) noexcept
    {
        debounceIntervalMs = std::max(0, newDebounceMs);
    }

    int HistoryManager::debounceMs() const noexcept
    {
        return debounceIntervalMs;
    }

    void HistoryManager::push(HistoryEntry entry)
    {
        if (const auto* head = current(); head != nullptr
            && head->state == entry.state
            && head->viewport == entry.viewport)
        {
            return;
        }

        if (currentIndex + 1 < static_cast<int>(entries.size()))
            entries.erase(entries.begin() + (currentIndex + 1), entries.end());

        entries.push_back(std::move(entry));
        currentIndex = static_cast<int>(entries.size()) - 1;
        trimToCapacity();
    }

    void HistoryManager::trimToCapacity()
    {
        while (entries.size() > maxEntries)
        {
            entries.pop_front();
            currentIndex = std::max(0, currentIndex - 1);
        }
    }
}
