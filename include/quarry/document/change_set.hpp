#pragma once

/** \file change_set.hpp
 *  \brief Per-instance set of dirty storage paths.
 *
 * Paths are dot-joined storage names with numeric segments for list indices.
 * Marking is idempotent, and the coarsest path wins: marking "a" voids any
 * recorded "a.b", and marking "a.b" while "a" is recorded is a no-op.
 */

#include <set>
#include <string>
#include <vector>

namespace quarry {

class change_set {
public:
  void mark(const std::string& path);
  auto contains(const std::string& path) const -> bool { return paths_.count(path) != 0; }
  /** \brief True when `path` or one of its ancestors is recorded. */
  auto covers(const std::string& path) const -> bool;
  auto paths() const -> std::vector<std::string> { return {paths_.begin(), paths_.end()}; }
  auto empty() const noexcept -> bool { return paths_.empty(); }
  auto size() const noexcept -> std::size_t { return paths_.size(); }
  void clear() noexcept { paths_.clear(); }

private:
  std::set<std::string> paths_;
};

} // namespace quarry
