#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <cstdio>
#include "memory_manager/memory_types.hpp"

std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split_whitespace(const std::string &line);

// Parses "1, 2,3" into {1, 2, 3}. Any empty or non-integer token rejects
// the whole sequence.
std::optional<std::vector<PageReference>> parse_reference_sequence(const std::string &text);
std::string join_references(const std::vector<PageReference> &refs);

std::optional<uint32_t> parse_uint32(const std::string &text);


//#define DEBUG 
#define DEBUG_PAGING false
#define DEBUG_FRAGMENTATION false

#ifdef DEBUG
    #warning "Debug-printing is active"
    #define DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else 
    #define DEBUG_PRINT(condition, msg, ...) 
#endif
