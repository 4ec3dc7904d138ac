#include "view/cli.hpp"
#include "config.hpp"
#include "paging/fragmentation.hpp"
#include "paging/page_replacement.hpp"
#include "util.hpp"
#include "view/reporter.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

static void print_banner() {
  std::cout
    << "=============================================\n"
    << "         VIRTUAL MEMORY SIMULATOR\n"
    << "=============================================\n"
    << "  Page replacement: LRU and Optimal\n"
    << "  Memory fragmentation: first-fit allocation\n"
    << "---------------------------------------------\n"
    << "Type 'initialize' to load config.txt, 'help' for commands.\n\n";
}

static void print_help() {
  std::cout
    << "initialize                      load config.txt\n"
    << "config                          show current parameters\n"
    << "set <key> <value>               change one parameter\n"
    << "page-replacement [lru|optimal]  run the page replacement simulation\n"
    << "compare [max-frames]            fault counts of both policies per frame count\n"
    << "fragmentation                   run the memory fragmentation simulation\n"
    << "exit                            quit\n";
}

static void prompt() { std::cout << "vmsim> " << std::flush; }

// CLI class implementation

CLI::CLI() = default;

// helper member funcs

bool CLI::require_init() const {
  if (!initialized_) {
    std::cout << "Please run initialize first.\n";
    return false;
  }
  return true;
}

void CLI::initialize_system() {
  cfg_ = load_config("config.txt");
  initialized_ = true;
  std::cout << "Initialization complete.\n";
}

void CLI::handle_set_command(const std::vector<std::string> &args) {
  if (args.size() < 3) {
    std::cout << "Usage: set <key> <value>\n";
    return;
  }

  // reference sequences may contain spaces after commas
  std::string value;
  for (size_t i = 2; i < args.size(); ++i) {
    if (i > 2) value += " ";
    value += args[i];
  }

  if (!apply_config_entry(cfg_, args[1], value)) {
    std::cout << "Invalid value for '" << args[1] << "'.\n";
    return;
  }
  warn_config_ranges(cfg_);
  std::cout << args[1] << " = " << value << "\n";
}

void CLI::run_page_replacement_command(const std::vector<std::string> &args) {
  ReplacementPolicy policy = cfg_.policy;
  if (args.size() >= 2) {
    auto parsed = parse_policy(args[1]);
    if (!parsed) {
      std::cout << "Unknown policy. Use lru|optimal\n";
      return;
    }
    policy = *parsed;
  }

  auto refs = parse_reference_sequence(cfg_.reference_sequence);
  if (!refs) {
    std::cout << "Invalid input for page reference sequence. "
                 "Please enter integers separated by commas.\n";
    return;
  }
  if (cfg_.num_frames < 1) {
    std::cout << "Number of frames must be at least 1.\n";
    return;
  }

  PageReplacementResult result = run_page_replacement(*refs, cfg_.num_frames, policy);
  std::cout << "Simulation complete! Policy: " << policy_to_string(policy)
            << ", frames: " << cfg_.num_frames
            << ", total page faults: " << result.fault_count << "\n\n"
            << build_frame_history_report(result);
}

void CLI::run_compare_command(const std::vector<std::string> &args) {
  uint32_t max_frames = cfg_.num_frames;
  if (args.size() >= 2) {
    auto parsed = parse_uint32(args[1]);
    if (!parsed || *parsed < 1) {
      std::cout << "Usage: compare [max-frames >= 1]\n";
      return;
    }
    max_frames = *parsed;
  }

  auto refs = parse_reference_sequence(cfg_.reference_sequence);
  if (!refs) {
    std::cout << "Invalid input for page reference sequence. "
                 "Please enter integers separated by commas.\n";
    return;
  }

  const uint32_t limit = max_useful_frames(*refs);
  if (args.size() >= 2 && max_frames > limit) {
    std::cout << "max-frames must be at most " << limit
              << " for a sequence of " << refs->size() << " references.\n";
    return;
  }

  std::cout << "Sequence: " << join_references(*refs) << "\n"
            << build_policy_comparison_report(compare_policies(*refs, max_frames));
}

void CLI::run_fragmentation_command() {
  if (cfg_.block_size < 1) {
    std::cout << "Block size must be at least 1.\n";
    return;
  }

  // a fixed seed reproduces the same layout on every run
  std::mt19937 rng = make_simulation_rng(cfg_);
  FragmentationResult result = run_fragmentation(cfg_.total_memory, cfg_.block_size,
                                                 cfg_.num_allocs, cfg_.num_deallocs, rng);
  std::cout << "Memory fragmentation simulation complete! "
            << result.allocations.size() << " of " << cfg_.num_allocs
            << " allocations made, " << result.deallocated_ids.size() << " freed.\n";
  if (result.allocations.size() < cfg_.num_allocs)
    std::cout << "No contiguous free space for the remaining requests.\n";
  std::cout << "\n" << build_memory_layout_report(result, cfg_.layout_width);
}

void CLI::handle_command(const std::vector<std::string> &args) {
  const std::string cmd = to_lower(args[0]);

  if (cmd == "help") {
    print_help();
  }
  else if (cmd == "initialize") {
    initialize_system();
  }
  else if (cmd == "config") {
    if (require_init()) std::cout << config_to_string(cfg_);
  }
  else if (cmd == "set") {
    if (require_init()) handle_set_command(args);
  }
  else if (cmd == "page-replacement") {
    if (require_init()) run_page_replacement_command(args);
  }
  else if (cmd == "compare") {
    if (require_init()) run_compare_command(args);
  }
  else if (cmd == "fragmentation") {
    if (require_init()) run_fragmentation_command();
  }
  else {
    std::cout << "Unknown command. Type 'help' for a list.\n";
  }
}

int CLI::run() {
  print_banner();
  prompt();

  std::string line;

  while (std::getline(std::cin, line)) {
    const auto args = split_whitespace(line);
    if (args.empty()) { prompt(); continue; }

    if (to_lower(args[0]) == "exit") {
      std::cout << "Goodbye.\n";
      break;
    }

    try {
      handle_command(args);
    } catch (const std::exception &e) {
      std::cerr << "[CLI] " << e.what() << "\n";
    }
    prompt();
  }
  return 0;
}
