#pragma once
#include "memory_types.hpp"
#include <algorithm>
#include <cstddef>
#include <deque>
#include <limits>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

// Decides which resident page leaves when every frame is occupied.
template <typename PageType>
class PageReplacementPolicy {
public:
    using Frames = std::vector<std::optional<PageType>>;

    // Returns the slot index to overwrite. `position` is the index of the
    // faulting reference inside `references`.
    virtual size_t select_victim(const Frames& frames,
                                 const std::vector<PageType>& references,
                                 size_t position) = 0;
    // Called on a hit.
    virtual void on_access(const PageType& page) = 0;
    // Called after a faulting page is placed into a frame.
    virtual void on_load(const PageType& page) = 0;
    virtual ~PageReplacementPolicy() = default;
};


template <typename PageType>
class LRUReplacement : public PageReplacementPolicy<PageType> {
    std::deque<PageType> usage_queue; // resident pages; front = least recently used
public:
    using typename PageReplacementPolicy<PageType>::Frames;

    size_t select_victim(const Frames& frames,
                         const std::vector<PageType>&,
                         size_t) override {
        if (usage_queue.empty())
            throw std::logic_error("LRU victim requested with no tracked pages");
        PageType victim = usage_queue.front();
        for (size_t i = 0; i < frames.size(); ++i) {
            if (frames[i] && *frames[i] == victim) {
                usage_queue.pop_front();
                return i;
            }
        }
        throw std::logic_error("least recently used page is not resident");
    }

    void on_access(const PageType& page) override {
        usage_queue.erase(
            std::remove(usage_queue.begin(), usage_queue.end(), page),
            usage_queue.end()
        );
        usage_queue.push_back(page);
    }

    void on_load(const PageType& page) override {
        on_access(page);
    }

    const std::deque<PageType>& recency() const { return usage_queue; }
};


// Belady's optimal policy. Needs the whole reference string, so it only
// works offline.
template <typename PageType>
class OptimalReplacement : public PageReplacementPolicy<PageType> {
public:
    using typename PageReplacementPolicy<PageType>::Frames;

    static constexpr size_t NEVER = std::numeric_limits<size_t>::max();

    // Distance from `position` to the next use of `page`, NEVER if none.
    static size_t next_use(const PageType& page,
                           const std::vector<PageType>& references,
                           size_t position) {
        for (size_t j = position + 1; j < references.size(); ++j) {
            if (references[j] == page)
                return j - position - 1;
        }
        return NEVER;
    }

    size_t select_victim(const Frames& frames,
                         const std::vector<PageType>& references,
                         size_t position) override {
        size_t victim = 0;
        size_t farthest = 0;
        bool found = false;
        // Strict comparison keeps the lowest slot among equal distances.
        for (size_t i = 0; i < frames.size(); ++i) {
            if (!frames[i])
                continue;
            size_t distance = next_use(*frames[i], references, position);
            if (!found || distance > farthest) {
                victim = i;
                farthest = distance;
                found = true;
            }
        }
        return victim;
    }

    void on_access(const PageType&) override {}
    void on_load(const PageType&) override {}
};


template <typename PageType>
std::unique_ptr<PageReplacementPolicy<PageType>> make_replacement_policy(ReplacementPolicy policy) {
    if (policy == ReplacementPolicy::OPTIMAL)
        return std::make_unique<OptimalReplacement<PageType>>();
    return std::make_unique<LRUReplacement<PageType>>();
}
