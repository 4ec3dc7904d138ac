#include "util.hpp"

#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

std::string trim(std::string s) {
  auto notspace = [](unsigned char ch){ return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), notspace));
  s.erase(std::find_if(s.rbegin(), s.rend(), notspace).base(), s.end());
  return s;
}

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return s;
}

std::vector<std::string> split_whitespace(const std::string &line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string tok;
  while (iss >> tok) out.push_back(tok);
  return out;
}

static std::optional<int64_t> parse_int(const std::string &token) {
  if (token.empty()) return std::nullopt;
  size_t consumed = 0;
  int64_t value = 0;
  try {
    value = std::stoll(token, &consumed);
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
  // reject trailing garbage such as "3x"
  if (consumed != token.size()) return std::nullopt;
  return value;
}

std::optional<std::vector<PageReference>> parse_reference_sequence(const std::string &text) {
  std::vector<PageReference> refs;
  std::stringstream ss(text);
  std::string segment;

  // getline drops a trailing empty field, catch it here
  if (!text.empty() && text.back() == ',') return std::nullopt;

  while (std::getline(ss, segment, ',')) {
    auto value = parse_int(trim(segment));
    if (!value ||
        *value < std::numeric_limits<PageReference>::min() ||
        *value > std::numeric_limits<PageReference>::max())
      return std::nullopt;
    refs.push_back(static_cast<PageReference>(*value));
  }

  if (refs.empty()) return std::nullopt;
  return refs;
}

std::string join_references(const std::vector<PageReference> &refs) {
  std::ostringstream oss;
  for (size_t i = 0; i < refs.size(); ++i) {
    if (i) oss << ",";
    oss << refs[i];
  }
  return oss.str();
}

std::optional<uint32_t> parse_uint32(const std::string &text) {
  auto value = parse_int(trim(text));
  if (!value || *value < 0 || *value > std::numeric_limits<uint32_t>::max())
    return std::nullopt;
  return static_cast<uint32_t>(*value);
}
