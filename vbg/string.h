#pragma once

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace vbg {

inline std::vector<std::string> split(const std::string& sep,
                                      const std::string& joined) {
  std::vector<std::string> result;
  size_t pos = 0;
  while (true) {
    size_t next_pos = joined.find(sep, pos);
    if (next_pos == std::string::npos) {
      result.push_back(joined.substr(pos));
      return result;
    }
    result.push_back(joined.substr(pos, next_pos - pos));
    pos = next_pos + sep.size();
  }
}

// Like split but drops empty pieces, so "" yields no elements.
inline std::vector<std::string> split_nonempty(const std::string& sep,
                                               const std::string& joined) {
  std::vector<std::string> result;
  for (std::string& piece : split(sep, joined))
    if (!piece.empty()) result.push_back(std::move(piece));
  return result;
}

template <typename Container>
inline std::string join(const std::string& sep, const Container& container) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& element : container) {
    if (!first) oss << sep;
    oss << element;
    first = false;
  }
  return oss.str();
}

constexpr bool startswith(std::string_view subject, std::string_view prefix) {
  if (prefix.size() > subject.size()) return false;

  return subject.substr(0, prefix.size()) == prefix;
}

constexpr bool endswith(std::string_view subject, std::string_view suffix) {
  if (suffix.size() > subject.size()) return false;

  return subject.substr(subject.size() - suffix.size()) == suffix;
}

inline std::string trim(std::string_view sv) {
  size_t first = 0;
  while (first < sv.size() && std::isspace((unsigned char)sv[first])) first++;
  size_t last = sv.size();
  while (last > first && std::isspace((unsigned char)sv[last - 1])) last--;
  return std::string(sv.substr(first, last - first));
}

// Collapses every run of whitespace to a single space.
inline std::string squeeze(std::string_view sv) {
  std::string result;
  bool space = false;
  for (char c : trim(sv)) {
    if (std::isspace((unsigned char)c)) {
      space = true;
      continue;
    }
    if (space) result += ' ';
    space = false;
    result += c;
  }
  return result;
}

}  // namespace vbg
