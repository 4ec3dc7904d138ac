#include "config.hpp"
#include "paging/page_replacement.hpp"
#include "util.hpp"
#include <fstream>
#include <sstream>
#include <string>
#include <iostream>

bool apply_config_entry(Config &cfg, const std::string &raw_key, const std::string &raw_value) {
  const std::string key = to_lower(trim(raw_key));
  const std::string value = trim(raw_value);

  if (key == "reference-sequence") {
    if (!parse_reference_sequence(value)) return false;
    cfg.reference_sequence = value;
    return true;
  }

  if (key == "policy") {
    auto policy = parse_policy(value);
    if (!policy) return false;
    cfg.policy = *policy;
    return true;
  }

  auto number = parse_uint32(value);
  if (!number) return false;

  if (key == "num-frames") {
    if (*number > MAX_NUM_FRAMES) return false;
    cfg.num_frames = *number;
  }
  else if (key == "total-memory") {
    if (*number > MAX_TOTAL_MEMORY) return false;
    cfg.total_memory = *number;
  }
  else if (key == "block-size") cfg.block_size = *number;
  else if (key == "num-allocs") cfg.num_allocs = *number;
  else if (key == "num-deallocs") cfg.num_deallocs = *number;
  else if (key == "seed") cfg.seed = *number;
  else if (key == "layout-width") cfg.layout_width = *number;
  else return false;

  return true;
}

void warn_config_ranges(const Config &cfg) {
  auto check = [](const char *key, uint32_t v, uint32_t lo, uint32_t hi) {
    if (v < lo || v > hi)
      std::cerr << "[Config] Warning: " << key << " (" << v << ") is outside "
                << lo << "-" << hi << ".\n";
  };

  check("num-frames", cfg.num_frames, 1, 10);
  check("total-memory", cfg.total_memory, 50, 500);
  check("block-size", cfg.block_size, 5, 50);
  check("num-allocs", cfg.num_allocs, 1, 20);
  check("num-deallocs", cfg.num_deallocs, 0, 10);

  if (cfg.block_size > cfg.total_memory) {
    std::cerr << "[Config] Warning: block-size (" << cfg.block_size
              << ") exceeds total-memory (" << cfg.total_memory
              << "), no allocation can succeed.\n";
  }
}

Config load_config(const std::string &path) {

  Config cfg{};
  std::ifstream in(path);

  if (!in) {
    // keep defaults if file missing
    return cfg;
  }

  std::string line;

  while (std::getline(in, line))
  {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;

    std::istringstream iss(line);
    std::string key, value;
    iss >> key;
    std::getline(iss, value);

    if (!apply_config_entry(cfg, key, value)) {
      std::cerr << "[Config] Ignoring entry '" << line << "'.\n";
    }
  }

  warn_config_ranges(cfg);
  return cfg;
}

std::mt19937 make_simulation_rng(const Config &cfg) {
  if (cfg.seed == 0) return std::mt19937(std::random_device{}());
  return std::mt19937(cfg.seed);
}

std::string config_to_string(const Config &cfg) {
  std::ostringstream oss;
  oss << "num-frames " << cfg.num_frames << "\n"
      << "reference-sequence " << cfg.reference_sequence << "\n"
      << "policy " << policy_to_string(cfg.policy) << "\n"
      << "total-memory " << cfg.total_memory << "\n"
      << "block-size " << cfg.block_size << "\n"
      << "num-allocs " << cfg.num_allocs << "\n"
      << "num-deallocs " << cfg.num_deallocs << "\n"
      << "seed " << cfg.seed << "\n"
      << "layout-width " << cfg.layout_width << "\n";
  return oss.str();
}
