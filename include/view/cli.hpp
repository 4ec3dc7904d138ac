#pragma once
#include "config.hpp"
#include <string>
#include <vector>

class CLI {
public:
  CLI();
  int run(); // main loop; returns exit code
private:
  void handle_command(const std::vector<std::string> &args);
  Config cfg_;
  bool initialized_{false};

  bool require_init() const;
  void initialize_system();
  void handle_set_command(const std::vector<std::string> &args);
  void run_page_replacement_command(const std::vector<std::string> &args);
  void run_compare_command(const std::vector<std::string> &args);
  void run_fragmentation_command();
};
