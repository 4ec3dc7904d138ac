#pragma once
#include <optional>
#include <random>
#include <vector>
#include "../memory_manager/memory_types.hpp"

// First-fit allocation of `num_allocs` blocks of `block_size` units, stopping
// at the first request that finds no contiguous free run, followed by freeing
// min(num_deallocs, allocations made) blocks picked uniformly at random.
// Throws std::invalid_argument if block_size is 0.
FragmentationResult run_fragmentation(size_t total_memory,
                                      size_t block_size,
                                      uint32_t num_allocs,
                                      uint32_t num_deallocs,
                                      std::mt19937& rng);

// Lowest start index of `block_size` consecutive free units.
std::optional<size_t> find_first_fit(const std::vector<MemoryUnit>& memory, size_t block_size);

FragmentationStats analyze_fragmentation(const std::vector<MemoryUnit>& memory);
