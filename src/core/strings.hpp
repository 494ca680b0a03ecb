#pragma once

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quarry::detail {

inline std::vector<std::string> split(std::string_view s, std::string_view sep) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (true) {
    auto next = s.find(sep, pos);
    if (next == std::string_view::npos) {
      out.emplace_back(s.substr(pos));
      return out;
    }
    out.emplace_back(s.substr(pos, next - pos));
    pos = next + sep.size();
  }
}

inline std::string join(const std::vector<std::string>& parts, std::string_view sep,
                        std::size_t first = 0, std::size_t last = std::string::npos) {
  std::string out;
  last = std::min(last, parts.size());
  for (std::size_t i = first; i < last; ++i) {
    if (i != first) out += sep;
    out += parts[i];
  }
  return out;
}

inline bool is_digits(std::string_view s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Array index segment; empty when not all digits or too large for size_t.
inline std::optional<std::size_t> parse_index(std::string_view s) {
  if (!is_digits(s)) return std::nullopt;
  std::size_t idx = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), idx);
  if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
  return idx;
}

// "a.b" is an ancestor of "a.b.c" but not of "a.bc".
inline bool is_ancestor_path(std::string_view ancestor, std::string_view path) {
  return path.size() > ancestor.size() && path.compare(0, ancestor.size(), ancestor) == 0 &&
         path[ancestor.size()] == '.';
}

} // namespace quarry::detail
