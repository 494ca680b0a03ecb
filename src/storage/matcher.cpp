#include "quarry/storage/matcher.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "core/strings.hpp"

namespace quarry::storage {

namespace {

auto unsupported(const std::string& op) -> std::unexpected<core::error> {
  return core::fail(core::error_code::unsupported, "Operator " + op + " is not supported in memory",
                    "storage.match");
}

auto malformed(const std::string& op, const std::string& why) -> std::unexpected<core::error> {
  return core::fail(core::error_code::operation_failed, op + " " + why, "storage.match");
}

// Values reachable through `path`, expanding arrays of sub-documents the way
// the server does. An empty result means the path is missing everywhere.
void collect(const wire_value& cur, const std::vector<std::string>& path, std::size_t i,
             std::vector<const wire_value*>& out) {
  if (i == path.size()) {
    out.push_back(&cur);
    return;
  }
  const auto& seg = path[i];
  if (cur.is_object()) {
    if (auto it = cur.find(seg); it != cur.end()) collect(*it, path, i + 1, out);
    return;
  }
  if (cur.is_array()) {
    if (auto idx = detail::parse_index(seg); idx && *idx < cur.size()) collect(cur[*idx], path, i + 1, out);
    for (const auto& e : cur) {
      if (e.is_object()) collect(e, path, i, out);
    }
  }
}

// Integral value of a number, truncating doubles; empty when it does not fit in int64.
auto to_int64(const wire_value& v) -> std::optional<std::int64_t> {
  if (v.is_number_integer()) return v.get<std::int64_t>();
  if (v.is_number_unsigned()) {
    const auto u = v.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) return std::nullopt;
    return static_cast<std::int64_t>(u);
  }
  if (!v.is_number_float()) return std::nullopt;
  const double d = v.get<double>();
  if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) return std::nullopt;
  return static_cast<std::int64_t>(d);
}

auto is_operator_doc(const wire_value& v) -> bool {
  if (!v.is_object() || v.empty()) return false;
  for (auto it = v.begin(); it != v.end(); ++it) {
    if (it.key().empty() || it.key()[0] != '$') return false;
  }
  return true;
}

// A candidate equals `target` directly or, when it is an array, through one of its elements.
auto equals_any(const std::vector<const wire_value*>& cands, const wire_value& target) -> bool {
  if (target.is_null() && cands.empty()) return true;
  for (const auto* c : cands) {
    if (*c == target) return true;
    if (c->is_array()) {
      for (const auto& e : *c) {
        if (e == target) return true;
      }
    }
  }
  return false;
}

auto type_rank(const wire_value& v) -> int {
  switch (v.type()) {
    case wire_value::value_t::null: return 1;
    case wire_value::value_t::number_integer:
    case wire_value::value_t::number_unsigned:
    case wire_value::value_t::number_float: return 2;
    case wire_value::value_t::string: return 3;
    case wire_value::value_t::object: return 4;
    case wire_value::value_t::array: return 5;
    case wire_value::value_t::boolean: return 6;
    default: return 0;
  }
}

auto comparable(const wire_value& a, const wire_value& b) -> bool {
  return (a.is_number() && b.is_number()) || (a.is_string() && b.is_string());
}

template <typename Pred>
auto any_scalar(const std::vector<const wire_value*>& cands, Pred pred) -> bool {
  for (const auto* c : cands) {
    if (pred(*c)) return true;
    if (c->is_array()) {
      for (const auto& e : *c) {
        if (pred(e)) return true;
      }
    }
  }
  return false;
}

auto regex_match(const std::vector<const wire_value*>& cands, const std::string& pattern,
                 const std::string& options) -> std::expected<bool, core::error> {
  auto flags = std::regex::ECMAScript;
  if (options.find('i') != std::string::npos) flags |= std::regex::icase;
  std::regex re;
  try {
    re = std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    return malformed("$regex", std::string("is invalid: ") + e.what());
  }
  return any_scalar(cands, [&](const wire_value& v) {
    return v.is_string() && std::regex_search(v.get_ref<const std::string&>(), re);
  });
}

auto eval_ops(const wire_value& ops, const std::vector<const wire_value*>& cands)
    -> std::expected<bool, core::error>;

auto match_path(const wire_value& doc, const std::string& key, const wire_value& cond)
    -> std::expected<bool, core::error> {
  std::vector<const wire_value*> cands;
  collect(doc, detail::split(key, "."), 0, cands);
  if (is_operator_doc(cond)) return eval_ops(cond, cands);
  return equals_any(cands, cond);
}

auto eval_ops(const wire_value& ops, const std::vector<const wire_value*>& cands)
    -> std::expected<bool, core::error> {
  for (auto it = ops.begin(); it != ops.end(); ++it) {
    const auto& op = it.key();
    const auto& arg = it.value();
    bool ok = false;
    if (op == "$eq") {
      ok = equals_any(cands, arg);
    } else if (op == "$ne") {
      ok = !equals_any(cands, arg);
    } else if (op == "$gt" || op == "$gte" || op == "$lt" || op == "$lte") {
      ok = any_scalar(cands, [&](const wire_value& v) {
        if (!comparable(v, arg)) return false;
        const int c = compare_values(v, arg);
        if (op == "$gt") return c > 0;
        if (op == "$gte") return c >= 0;
        if (op == "$lt") return c < 0;
        return c <= 0;
      });
    } else if (op == "$in" || op == "$nin") {
      if (!arg.is_array()) return malformed(op, "needs an array");
      bool found = false;
      for (const auto& e : arg) {
        if (equals_any(cands, e)) {
          found = true;
          break;
        }
      }
      ok = (op == "$in") ? found : !found;
    } else if (op == "$all") {
      if (!arg.is_array()) return malformed(op, "needs an array");
      ok = !arg.empty();
      for (const auto& e : arg) ok = ok && equals_any(cands, e);
    } else if (op == "$size") {
      if (!arg.is_number_integer() && !arg.is_number_unsigned()) return malformed(op, "needs a number");
      const auto n = to_int64(arg);
      if (!n) return malformed(op, "needs a number that fits in a 64-bit integer");
      ok = false;
      for (const auto* c : cands) {
        if (c->is_array() && static_cast<std::int64_t>(c->size()) == *n) ok = true;
      }
    } else if (op == "$exists") {
      const bool want = arg.is_boolean() ? arg.get<bool>() : !(arg.is_number() && arg.get<double>() == 0.0);
      ok = (!cands.empty()) == want;
    } else if (op == "$not") {
      std::expected<bool, core::error> inner;
      if (is_operator_doc(arg)) {
        inner = eval_ops(arg, cands);
      } else if (arg.is_string()) {
        inner = regex_match(cands, arg.get<std::string>(), "");
      } else {
        return malformed(op, "needs an operator document or a regex");
      }
      if (!inner) return inner;
      ok = !*inner;
    } else if (op == "$regex") {
      if (!arg.is_string()) return malformed(op, "needs a string");
      std::string options;
      if (auto o = ops.find("$options"); o != ops.end() && o->is_string()) options = o->get<std::string>();
      auto r = regex_match(cands, arg.get<std::string>(), options);
      if (!r) return r;
      ok = *r;
    } else if (op == "$options") {
      ok = true;
    } else if (op == "$elemMatch") {
      if (!arg.is_object()) return malformed(op, "needs a document");
      for (const auto* c : cands) {
        if (!c->is_array()) continue;
        for (const auto& e : *c) {
          std::expected<bool, core::error> r;
          if (is_operator_doc(arg)) {
            r = eval_ops(arg, {&e});
          } else if (e.is_object()) {
            r = matches(arg, e);
          } else {
            r = false;
          }
          if (!r) return r;
          if (*r) {
            ok = true;
            break;
          }
        }
        if (ok) break;
      }
    } else if (op == "$mod") {
      if (!arg.is_array() || arg.size() != 2 || !arg[0].is_number() || !arg[1].is_number()) {
        return malformed(op, "needs [divisor, remainder]");
      }
      const auto divisor = to_int64(arg[0]);
      const auto remainder = to_int64(arg[1]);
      if (!divisor || !remainder) return malformed(op, "arguments must fit in a 64-bit integer");
      if (*divisor == 0) return malformed(op, "divisor cannot be 0");
      ok = any_scalar(cands, [&](const wire_value& v) {
        const auto n = to_int64(v);
        if (!n) return false;
        // x % -1 is always 0; computing INT64_MIN % -1 overflows.
        const auto r = *divisor == -1 ? std::int64_t{0} : *n % *divisor;
        return r == *remainder;
      });
    } else {
      return unsupported(op);
    }
    if (!ok) return false;
  }
  return true;
}

} // namespace

auto compare_values(const wire_value& a, const wire_value& b) -> int {
  const int ra = type_rank(a);
  const int rb = type_rank(b);
  if (ra != rb) return ra < rb ? -1 : 1;
  if (a.is_number()) {
    const double x = a.get<double>();
    const double y = b.get<double>();
    return x < y ? -1 : (x > y ? 1 : 0);
  }
  if (a.is_string()) return a.get_ref<const std::string&>().compare(b.get_ref<const std::string&>());
  if (a.is_boolean()) return static_cast<int>(a.get<bool>()) - static_cast<int>(b.get<bool>());
  if (a == b) return 0;
  return a.dump() < b.dump() ? -1 : 1;
}

auto value_at(const wire_value& doc, std::string_view path) -> const wire_value* {
  const wire_value* cur = &doc;
  for (const auto& seg : detail::split(path, ".")) {
    if (cur->is_object()) {
      auto it = cur->find(seg);
      if (it == cur->end()) return nullptr;
      cur = &*it;
    } else if (cur->is_array() && detail::is_digits(seg)) {
      const auto idx = detail::parse_index(seg);
      if (!idx || *idx >= cur->size()) return nullptr;
      cur = &(*cur)[*idx];
    } else {
      return nullptr;
    }
  }
  return cur;
}

auto matches(const query_doc& query, const wire_value& doc) -> std::expected<bool, core::error> {
  if (query.is_null()) return true;
  if (!query.is_object()) return malformed("query", "must be a document");
  for (auto it = query.begin(); it != query.end(); ++it) {
    const auto& key = it.key();
    const auto& cond = it.value();
    if (key == "$and" || key == "$or" || key == "$nor") {
      if (!cond.is_array() || cond.empty()) return malformed(key, "needs a non-empty array");
      bool any = false;
      bool all = true;
      for (const auto& sub : cond) {
        auto r = matches(sub, doc);
        if (!r) return r;
        any = any || *r;
        all = all && *r;
      }
      const bool ok = key == "$and" ? all : (key == "$or" ? any : !any);
      if (!ok) return false;
      continue;
    }
    if (!key.empty() && key[0] == '$') return unsupported(key);
    auto r = match_path(doc, key, cond);
    if (!r) return r;
    if (!*r) return false;
  }
  return true;
}

} // namespace quarry::storage
