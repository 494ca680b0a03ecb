#include "quarry/document/change_set.hpp"

#include "core/strings.hpp"

namespace quarry {

auto change_set::covers(const std::string& path) const -> bool {
  if (paths_.count(path) != 0) return true;
  for (auto pos = path.find('.'); pos != std::string::npos; pos = path.find('.', pos + 1)) {
    if (paths_.count(path.substr(0, pos)) != 0) return true;
  }
  return false;
}

void change_set::mark(const std::string& path) {
  if (covers(path)) return;
  // Finer paths recorded under the new one are superseded.
  for (auto it = paths_.lower_bound(path); it != paths_.end() && it->compare(0, path.size(), path) == 0;) {
    if (detail::is_ancestor_path(path, *it)) {
      it = paths_.erase(it);
    } else {
      ++it;
    }
  }
  paths_.insert(path);
}

} // namespace quarry
