#include "view/reporter.hpp"
#include "paging/fragmentation.hpp"
#include <iomanip>
#include <sstream>
#include <string>

static const std::string FREE_SYMBOL = ".";
static const std::string ALLOCATION_SYMBOLS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";

static char symbol_for(AllocationId id) {
  return ALLOCATION_SYMBOLS[(id - 1) % ALLOCATION_SYMBOLS.size()];
}

std::string build_frame_history_report(const PageReplacementResult &result) {
  std::ostringstream oss;
  if (result.trace.empty()) {
    oss << "No references.\n";
    return oss.str();
  }

  const size_t num_frames = result.trace.front().frames.size();
  const int cell = 9;

  std::ostringstream header;
  header << "| " << std::left << std::setw(5) << "Step"
         << "| " << std::setw(cell) << "Reference"
         << " | " << std::setw(6) << "Fault";
  for (size_t j = 0; j < num_frames; ++j)
    header << "| " << std::setw(cell) << ("Frame " + std::to_string(j + 1));
  header << "|";

  const std::string rule(header.str().size(), '-');
  oss << rule << "\n" << header.str() << "\n" << rule << "\n";

  for (size_t i = 0; i < result.trace.size(); ++i) {
    const StepRecord &step = result.trace[i];
    oss << "| " << std::left << std::setw(5) << (i + 1)
        << "| " << std::setw(cell) << step.reference
        << " | " << std::setw(6) << (step.fault ? "Yes" : "");
    for (const auto &slot : step.frames)
      oss << "| " << std::setw(cell) << (slot ? std::to_string(*slot) : "");
    oss << "|\n";
  }
  oss << rule << "\n";

  oss << "Total page faults: " << result.fault_count << "\n"
      << "Hit ratio: " << std::fixed << std::setprecision(2)
      << result.hit_ratio() * 100.0 << "%\n";
  return oss.str();
}

std::string build_memory_layout_report(const FragmentationResult &result, size_t width) {
  std::ostringstream oss;
  if (width == 0) width = 50;

  for (size_t i = 0; i < result.memory.size(); i += width) {
    oss << std::right << std::setw(5) << i << " ";
    for (size_t j = i; j < result.memory.size() && j < i + width; ++j) {
      const MemoryUnit &unit = result.memory[j];
      if (unit) oss << symbol_for(*unit);
      else oss << FREE_SYMBOL;
    }
    oss << "\n";
  }

  oss << "\nLegend: '" << FREE_SYMBOL << "' free";
  for (const auto &[id, alloc] : result.allocations) {
    if (result.is_live(id))
      oss << ", '" << symbol_for(id) << "' #" << id;
  }
  oss << "\n\n";

  oss << "Allocations:\n";
  for (const auto &[id, alloc] : result.allocations) {
    oss << "  #" << std::left << std::setw(4) << id
        << "[" << alloc.start << "-" << alloc.end << "] "
        << (result.deallocated_ids.count(id) ? "freed" : "live") << "\n";
  }
  if (result.allocations.empty())
    oss << "  (none)\n";

  FragmentationStats stats = analyze_fragmentation(result.memory);
  oss << "\nUsed: " << stats.used_units << " / " << stats.total_units << " units\n"
      << "Free: " << stats.free_units << " units in " << stats.free_holes << " hole(s)\n"
      << "Largest free run: " << stats.largest_free_run << " units\n"
      << "External fragmentation: " << std::fixed << std::setprecision(2)
      << stats.external_fragmentation * 100.0 << "%\n";
  return oss.str();
}

std::string build_policy_comparison_report(const std::vector<PolicyComparison> &rows) {
  std::ostringstream oss;
  oss << "---------------------------------\n";
  oss << "| Frames | LRU faults | Optimal |\n";
  oss << "---------------------------------\n";
  for (const auto &row : rows) {
    oss << "| " << std::left << std::setw(7) << row.num_frames
        << "| " << std::setw(11) << row.lru_faults
        << "| " << std::setw(8) << row.optimal_faults << "|\n";
  }
  oss << "---------------------------------\n";
  return oss.str();
}
