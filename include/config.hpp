#pragma once
#include <cstdint>
#include <random>
#include <string>
#include "memory_manager/memory_types.hpp"

// Hard limits; larger values are rejected instead of warned about.
constexpr uint32_t MAX_NUM_FRAMES = 1024;
constexpr uint32_t MAX_TOTAL_MEMORY = 1u << 20;

struct Config {
  // Page replacement
  uint32_t num_frames = 3;
  std::string reference_sequence = "1,2,3,2,4,1,5,2,1,2,3,4,5";
  ReplacementPolicy policy = LRU; // "lru" or "optimal"

  // Fragmentation
  uint32_t total_memory = 200; // units
  uint32_t block_size = 20;    // units per allocation
  uint32_t num_allocs = 8;
  uint32_t num_deallocs = 3;
  uint32_t seed = 0;           // 0 = seed from std::random_device

  // Rendering
  uint32_t layout_width = 50;  // memory units per row
};

// Applies one `key value` pair. Returns false for unknown keys or bad values.
bool apply_config_entry(Config &cfg, const std::string &key, const std::string &value);

// Reports values outside the ranges the simulator is meant to be used with.
void warn_config_ranges(const Config &cfg);

Config load_config(const std::string &path);

// Fresh generator for one fragmentation run: seeded from `seed`, or from
// std::random_device when the seed is 0.
std::mt19937 make_simulation_rng(const Config &cfg);

std::string config_to_string(const Config &cfg);
