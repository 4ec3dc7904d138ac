#pragma once
#include "memory_manager/memory_types.hpp"
#include <string>
#include <vector>

// Step-by-step frame table. Fault rows are marked "Yes".
std::string build_frame_history_report(const PageReplacementResult &result);

// Memory strip (`width` units per row), legend, allocation list and
// fragmentation figures.
std::string build_memory_layout_report(const FragmentationResult &result, size_t width);

std::string build_policy_comparison_report(const std::vector<PolicyComparison> &rows);
