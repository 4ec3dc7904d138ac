#include "../../include/paging/page_replacement.hpp"
#include "../../include/memory_manager/page_replacement_policy.hpp"
#include "../../include/util.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

PageReplacementResult run_page_replacement(const std::vector<PageReference>& references,
                                           uint32_t num_frames,
                                           ReplacementPolicy policy) {
    if (num_frames < 1) {
        throw std::invalid_argument("num_frames must be at least 1");
    }

    auto replacement = make_replacement_policy<PageReference>(policy);
    FrameSet frames(num_frames);
    PageReplacementResult result;
    result.trace.reserve(references.size());

    for (size_t i = 0; i < references.size(); ++i) {
        const PageReference page = references[i];
        auto resident = std::find(frames.begin(), frames.end(), FrameSlot{page});

        StepRecord step;
        step.reference = page;

        if (resident != frames.end()) {
            replacement->on_access(page);
        } else {
            step.fault = true;
            result.fault_count++;

            size_t slot;
            auto empty = std::find(frames.begin(), frames.end(), std::nullopt);
            if (empty != frames.end()) {
                slot = static_cast<size_t>(empty - frames.begin());
            } else {
                slot = replacement->select_victim(frames, references, i);
                DEBUG_PRINT(DEBUG_PAGING, "step %zu: evict page %d from frame %zu",
                            i, *frames[slot], slot);
            }

            frames[slot] = page;
            replacement->on_load(page);
        }

        step.frames = frames;
        result.trace.push_back(std::move(step));
    }

    DEBUG_PRINT(DEBUG_PAGING, "%s: %u faults over %zu references",
                policy_to_string(policy).c_str(), result.fault_count, references.size());
    return result;
}

std::vector<PolicyComparison> compare_policies(const std::vector<PageReference>& references,
                                               uint32_t max_frames) {
    std::vector<PolicyComparison> rows;
    max_frames = std::min(max_frames, max_useful_frames(references));
    rows.reserve(max_frames);
    for (uint32_t n = 1; n <= max_frames; ++n) {
        PolicyComparison row;
        row.num_frames = n;
        row.lru_faults = run_page_replacement(references, n, LRU).fault_count;
        row.optimal_faults = run_page_replacement(references, n, OPTIMAL).fault_count;
        rows.push_back(row);
    }
    return rows;
}

uint32_t max_useful_frames(const std::vector<PageReference>& references) {
    const size_t limit = std::max<size_t>(1, references.size());
    return static_cast<uint32_t>(std::min<size_t>(limit, std::numeric_limits<uint32_t>::max() - 1));
}

std::string policy_to_string(ReplacementPolicy policy) {
    switch (policy) {
        case LRU: return "LRU";
        case OPTIMAL: return "Optimal";
    }
    return "Unknown";
}

std::optional<ReplacementPolicy> parse_policy(const std::string& name) {
    const std::string v = to_lower(trim(name));
    if (v == "lru") return LRU;
    if (v == "optimal" || v == "opt") return OPTIMAL;
    return std::nullopt;
}
