#pragma once
#include <optional>
#include <string>
#include <vector>
#include "../memory_manager/memory_types.hpp"

// Replays `references` against `num_frames` frames and records the frame
// state after every reference. Throws std::invalid_argument if num_frames is 0.
PageReplacementResult run_page_replacement(const std::vector<PageReference>& references,
                                           uint32_t num_frames,
                                           ReplacementPolicy policy);

// Fault counts of LRU and Optimal for every frame count in [1, max_frames].
// max_frames is capped at max(1, references.size()); more frames than
// references cannot change either count.
std::vector<PolicyComparison> compare_policies(const std::vector<PageReference>& references,
                                               uint32_t max_frames);

uint32_t max_useful_frames(const std::vector<PageReference>& references);

std::string policy_to_string(ReplacementPolicy policy);
std::optional<ReplacementPolicy> parse_policy(const std::string& name);
