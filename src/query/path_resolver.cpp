#include "quarry/query/path_resolver.hpp"

#include <algorithm>
#include <utility>

#include "core/strings.hpp"

namespace quarry {

auto resolved_path::dotted() const -> std::string { return detail::join(segments, "."); }

auto resolve_path(const schema* s, const std::vector<std::string>& path, resolve_mode mode)
    -> std::expected<resolved_path, core::error> {
  std::vector<std::pair<std::size_t, std::string>> indices;
  std::vector<std::string> names;
  for (std::size_t i = 0; i < path.size(); ++i) {
    const auto& seg = path[i];
    if (detail::is_digits(seg) || (mode == resolve_mode::update && seg == "S")) {
      indices.emplace_back(i, seg == "S" ? std::string("$") : seg);
    } else {
      names.push_back(seg);
    }
  }
  if (names.empty()) {
    return core::fail(core::error_code::invalid_query,
                      "Field path \"" + detail::join(path, "__") + "\" names no field", "query.resolve");
  }

  resolved_path out;
  std::vector<const field*> metas;
  std::vector<bool> is_index;
  if (s == nullptr) {
    out.segments = std::move(names);
    metas.assign(out.segments.size(), nullptr);
  } else {
    auto steps = s->lookup(names);
    if (!steps) return std::unexpected(steps.error());
    for (const auto& step : *steps) {
      out.segments.push_back(step.storage_name);
      metas.push_back(step.meta);
      if (step.meta != nullptr) out.terminal = step.meta;
    }
  }
  is_index.assign(out.segments.size(), false);

  for (const auto& [pos, token] : indices) {
    const auto at = std::min(pos, out.segments.size());
    out.segments.insert(out.segments.begin() + static_cast<std::ptrdiff_t>(at), token);
    metas.insert(metas.begin() + static_cast<std::ptrdiff_t>(at), nullptr);
    is_index.insert(is_index.begin() + static_cast<std::ptrdiff_t>(at), true);
  }

  if (s != nullptr) {
    for (std::size_t i = 0; i < out.segments.size(); ++i) {
      if (!is_index[i]) continue;
      if (i == 0) {
        return core::fail(core::error_code::invalid_query,
                          "Field path cannot start with an index", "query.resolve");
      }
      const auto* prev = metas[i - 1];
      if (prev != nullptr && prev->kind() != field_kind::list && prev->kind() != field_kind::dict) {
        return core::fail(core::error_code::invalid_query,
                          "Cannot index into non-list field \"" + prev->name() + "\"", "query.resolve");
      }
    }
  }
  return out;
}

} // namespace quarry
