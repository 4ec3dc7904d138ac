#include "../../include/paging/fragmentation.hpp"
#include "../../include/util.hpp"
#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

std::optional<size_t> find_first_fit(const std::vector<MemoryUnit>& memory, size_t block_size) {
    if (block_size == 0 || block_size > memory.size())
        return std::nullopt;

    size_t run = 0;
    for (size_t i = 0; i < memory.size(); ++i) {
        run = memory[i] ? 0 : run + 1;
        if (run == block_size)
            return i + 1 - block_size;
    }
    return std::nullopt;
}

FragmentationResult run_fragmentation(size_t total_memory,
                                      size_t block_size,
                                      uint32_t num_allocs,
                                      uint32_t num_deallocs,
                                      std::mt19937& rng) {
    if (block_size == 0) {
        throw std::invalid_argument("block_size must be at least 1");
    }

    FragmentationResult result;
    result.memory.assign(total_memory, std::nullopt);
    AllocationId next_id = 1;

    for (uint32_t n = 0; n < num_allocs; ++n) {
        auto start = find_first_fit(result.memory, block_size);
        if (!start) {
            DEBUG_PRINT(DEBUG_FRAGMENTATION, "no contiguous free space after %u allocations", n);
            break;
        }

        Allocation alloc{next_id++, *start, *start + block_size - 1};
        std::fill(result.memory.begin() + alloc.start,
                  result.memory.begin() + alloc.end + 1,
                  MemoryUnit{alloc.id});
        result.allocations.emplace(alloc.id, alloc);
        DEBUG_PRINT(DEBUG_FRAGMENTATION, "alloc %u -> [%zu, %zu]", alloc.id, alloc.start, alloc.end);
    }

    std::vector<AllocationId> ids;
    ids.reserve(result.allocations.size());
    for (const auto& [id, alloc] : result.allocations)
        ids.push_back(id);

    const size_t count = std::min<size_t>(num_deallocs, ids.size());
    std::vector<AllocationId> victims;
    std::sample(ids.begin(), ids.end(), std::back_inserter(victims), count, rng);

    for (AllocationId id : victims) {
        const Allocation& alloc = result.allocations.at(id);
        std::fill(result.memory.begin() + alloc.start,
                  result.memory.begin() + alloc.end + 1,
                  std::nullopt);
        result.deallocated_ids.insert(id);
        DEBUG_PRINT(DEBUG_FRAGMENTATION, "free %u [%zu, %zu]", id, alloc.start, alloc.end);
    }

    return result;
}

FragmentationStats analyze_fragmentation(const std::vector<MemoryUnit>& memory) {
    FragmentationStats stats;
    stats.total_units = memory.size();

    std::set<AllocationId> live;
    size_t run = 0;
    for (const auto& unit : memory) {
        if (unit) {
            stats.used_units++;
            live.insert(*unit);
            run = 0;
            continue;
        }
        stats.free_units++;
        if (run == 0) stats.free_holes++;
        run++;
        stats.largest_free_run = std::max(stats.largest_free_run, run);
    }

    stats.live_allocations = live.size();
    if (stats.free_units > 0) {
        stats.external_fragmentation =
            1.0 - static_cast<double>(stats.largest_free_run) / stats.free_units;
    }
    return stats;
}
