#include "quarry/expr.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "core/strings.hpp"

namespace quarry {

namespace {

struct query_op_entry { std::string_view token; query_op op; op_class cls; };

constexpr std::array<query_op_entry, 34> k_query_ops{{
    {"ne", query_op::ne, op_class::comparison},
    {"gt", query_op::gt, op_class::comparison},
    {"gte", query_op::gte, op_class::comparison},
    {"lt", query_op::lt, op_class::comparison},
    {"lte", query_op::lte, op_class::comparison},
    {"in", query_op::in, op_class::comparison},
    {"nin", query_op::nin, op_class::comparison},
    {"mod", query_op::mod, op_class::comparison},
    {"all", query_op::all, op_class::comparison},
    {"size", query_op::size, op_class::comparison},
    {"exists", query_op::exists, op_class::comparison},
    {"not", query_op::not_, op_class::comparison},
    {"within_distance", query_op::within_distance, op_class::geo},
    {"within_spherical_distance", query_op::within_spherical_distance, op_class::geo},
    {"within_box", query_op::within_box, op_class::geo},
    {"within_polygon", query_op::within_polygon, op_class::geo},
    {"near", query_op::near, op_class::geo},
    {"near_sphere", query_op::near_sphere, op_class::geo},
    {"max_distance", query_op::max_distance, op_class::geo},
    {"geo_within", query_op::geo_within, op_class::geo},
    {"geo_within_box", query_op::geo_within_box, op_class::geo},
    {"geo_within_polygon", query_op::geo_within_polygon, op_class::geo},
    {"geo_within_center", query_op::geo_within_center, op_class::geo},
    {"geo_within_sphere", query_op::geo_within_sphere, op_class::geo},
    {"geo_intersects", query_op::geo_intersects, op_class::geo},
    {"contains", query_op::contains, op_class::string},
    {"icontains", query_op::icontains, op_class::string},
    {"startswith", query_op::startswith, op_class::string},
    {"istartswith", query_op::istartswith, op_class::string},
    {"endswith", query_op::endswith, op_class::string},
    {"iendswith", query_op::iendswith, op_class::string},
    {"exact", query_op::exact, op_class::string},
    {"iexact", query_op::iexact, op_class::string},
    {"match", query_op::match, op_class::custom},
}};

struct update_op_entry { std::string_view token; update_op op; std::string_view canonical; };

constexpr std::array<update_op_entry, 10> k_update_ops{{
    {"set", update_op::set, "set"},
    {"unset", update_op::unset, "unset"},
    {"inc", update_op::inc, "inc"},
    {"dec", update_op::dec, "inc"},
    {"pop", update_op::pop, "pop"},
    {"push", update_op::push, "push"},
    {"pull", update_op::pull, "pull"},
    {"pull_all", update_op::pull_all, "pullAll"},
    {"add_to_set", update_op::add_to_set, "addToSet"},
    {"set_on_insert", update_op::set_on_insert, "setOnInsert"},
}};

const query_op_entry* find_query_op(query_op op) {
  for (const auto& e : k_query_ops) {
    if (e.op == op) return &e;
  }
  return nullptr;
}

const update_op_entry& find_update_op(update_op op) {
  return k_update_ops[static_cast<std::size_t>(op)];
}

} // namespace

auto parse_query_op(std::string_view token) -> std::optional<query_op> {
  if (token.empty()) return std::nullopt;
  for (const auto& e : k_query_ops) {
    if (e.token == token) return e.op;
  }
  return std::nullopt;
}

auto op_token(query_op op) -> std::string_view {
  const auto* e = find_query_op(op);
  return e ? e->token : std::string_view{};
}

auto classify(query_op op) -> op_class {
  const auto* e = find_query_op(op);
  return e ? e->cls : op_class::custom;
}

auto is_comparison(std::string_view token) -> bool {
  auto op = parse_query_op(token);
  return op && classify(*op) == op_class::comparison;
}

auto parse_update_op(std::string_view token) -> std::optional<update_op> {
  for (const auto& e : k_update_ops) {
    if (e.token == token) return e.op;
  }
  return std::nullopt;
}

auto op_token(update_op op) -> std::string_view { return find_update_op(op).token; }

auto canonical_name(update_op op) -> std::string_view { return find_update_op(op).canonical; }

auto query_term::raw_document(wire_value doc) -> query_term {
  query_term t;
  t.value = std::move(doc);
  t.raw = true;
  return t;
}

auto query_term::sort_key() const -> std::string {
  if (raw) return "__raw__";
  std::string key = detail::join(path, "__");
  if (negate) key += "__not";
  if (op) {
    key += "__";
    key += op_token(*op);
  }
  return key;
}

auto update_term::raw_document(wire_value doc) -> update_term {
  update_term t;
  t.value = std::move(doc);
  t.raw = true;
  return t;
}

auto parse_query_key(std::string_view key, wire_value value)
    -> std::expected<query_term, core::error> {
  if (key == "__raw__") {
    if (!value.is_object()) {
      return core::fail(core::error_code::invalid_query, "__raw__ expects a document", "query.parse");
    }
    return query_term::raw_document(std::move(value));
  }
  query_term t;
  t.path = detail::split(key, "__");
  t.value = std::move(value);

  // Index segments are skipped when looking for the operator and the
  // negation marker; they stay in place for the resolver.
  auto last_name = [&t]() -> std::vector<std::string>::iterator {
    for (auto it = t.path.end(); it != t.path.begin();) {
      --it;
      if (!detail::is_digits(*it)) return it;
    }
    return t.path.end();
  };
  auto names = [&t]() {
    return std::count_if(t.path.begin(), t.path.end(), [](const std::string& s) { return !detail::is_digits(s); });
  };

  if (auto it = last_name(); it != t.path.end() && names() > 1) {
    if (auto op = parse_query_op(*it)) {
      t.op = op;
      t.path.erase(it);
    }
  }
  if (auto it = last_name(); it != t.path.end() && names() > 1 && *it == "not") {
    t.negate = true;
    t.path.erase(it);
  }
  if (t.path.empty() || std::any_of(t.path.begin(), t.path.end(), [](const std::string& s) { return s.empty(); })) {
    return core::fail(core::error_code::invalid_query,
                      "Malformed filter key \"" + std::string(key) + "\"", "query.parse");
  }
  return t;
}

auto parse_update_key(std::string_view key, wire_value value)
    -> std::expected<update_term, core::error> {
  if (key == "__raw__") {
    if (!value.is_object()) {
      return core::fail(core::error_code::invalid_query, "__raw__ expects a document", "update.parse");
    }
    return update_term::raw_document(std::move(value));
  }
  update_term t;
  t.path = detail::split(key, "__");
  t.value = std::move(value);
  if (!t.path.empty()) {
    if (auto op = parse_update_op(t.path.front())) {
      t.op = op;
      t.path.erase(t.path.begin());
    }
  }
  if (t.path.size() > 1 && is_comparison(t.path.back())) {
    t.match = t.path.back();
    t.path.pop_back();
  }
  if (t.path.empty() || std::any_of(t.path.begin(), t.path.end(), [](const std::string& s) { return s.empty(); })) {
    return core::fail(core::error_code::invalid_query,
                      "Malformed update key \"" + std::string(key) + "\"", "update.parse");
  }
  return t;
}

} // namespace quarry
