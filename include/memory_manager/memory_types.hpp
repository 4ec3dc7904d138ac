#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

using PageReference = int32_t;

// A frame slot holds a resident page or nothing.
using FrameSlot = std::optional<PageReference>;
using FrameSet = std::vector<FrameSlot>;

enum ReplacementPolicy {
  LRU,
  OPTIMAL
};

// One row of the page replacement trace; frames is the state after the reference.
struct StepRecord {
  PageReference reference = 0;
  bool fault = false;
  FrameSet frames;
};

struct PageReplacementResult {
  uint32_t fault_count = 0;
  std::vector<StepRecord> trace;

  size_t hit_count() const { return trace.size() - fault_count; }
  double hit_ratio() const {
    return trace.empty() ? 0.0 : static_cast<double>(hit_count()) / trace.size();
  }
};

// Fault counts of both policies for one frame count.
struct PolicyComparison {
  uint32_t num_frames = 0;
  uint32_t lru_faults = 0;
  uint32_t optimal_faults = 0;
};

using AllocationId = uint32_t;

// A memory unit is free (nullopt) or owned by an allocation.
using MemoryUnit = std::optional<AllocationId>;

struct Allocation {
  AllocationId id = 0;
  size_t start = 0;
  size_t end = 0; // inclusive

  size_t size() const { return end - start + 1; }
};

struct FragmentationResult {
  std::vector<MemoryUnit> memory;
  std::map<AllocationId, Allocation> allocations; // every allocation ever made
  std::set<AllocationId> deallocated_ids;

  bool is_live(AllocationId id) const {
    return allocations.count(id) && !deallocated_ids.count(id);
  }
};

struct FragmentationStats {
  size_t total_units = 0;
  size_t used_units = 0;
  size_t free_units = 0;
  size_t free_holes = 0;
  size_t largest_free_run = 0;
  size_t live_allocations = 0;
  double external_fragmentation = 0.0;
};
