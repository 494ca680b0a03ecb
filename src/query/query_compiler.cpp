#include "quarry/query/query_compiler.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include "quarry/core/platform_utils.hpp"
#include "quarry/query/path_resolver.hpp"

namespace quarry {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::fail(core::error_code::invalid_query, std::move(message), "query.compile");
}

auto wrap(std::string_view key, wire_value v) -> wire_value {
  wire_value out = wire_value::object();
  out[std::string(key)] = std::move(v);
  return out;
}

auto geo_operator(const field* f, query_op op, const wire_value& v) -> std::expected<wire_value, core::error> {
  // Without a schema there is no index type to consult; GeoJSON is the default.
  const auto index = f ? f->geo() : geo_index::sphere_2d;
  if (index == geo_index::none) {
    return invalid("Geo method '" + std::string(op_token(op)) + "' has not been implemented for a " +
                   f->name() + " field");
  }
  if (index == geo_index::flat_2d) {
    switch (op) {
      case query_op::within_distance: return wrap("$within", wrap("$center", v));
      case query_op::within_spherical_distance: return wrap("$within", wrap("$centerSphere", v));
      case query_op::within_polygon: return wrap("$within", wrap("$polygon", v));
      case query_op::within_box: return wrap("$within", wrap("$box", v));
      case query_op::near: return wrap("$near", v);
      case query_op::near_sphere: return wrap("$nearSphere", v);
      case query_op::max_distance: return wrap("$maxDistance", v);
      default:
        return invalid("Geo method '" + std::string(op_token(op)) +
                       "' has not been implemented for a GeoPointField");
    }
  }
  switch (op) {
    case query_op::geo_within: {
      auto g = infer_geometry(v);
      if (!g) return g;
      return wrap("$geoWithin", std::move(*g));
    }
    case query_op::geo_within_box: return wrap("$geoWithin", wrap("$box", v));
    case query_op::geo_within_polygon: return wrap("$geoWithin", wrap("$polygon", v));
    case query_op::geo_within_center: return wrap("$geoWithin", wrap("$center", v));
    case query_op::geo_within_sphere: return wrap("$geoWithin", wrap("$centerSphere", v));
    case query_op::geo_intersects: {
      auto g = infer_geometry(v);
      if (!g) return g;
      return wrap("$geoIntersects", std::move(*g));
    }
    case query_op::near: {
      auto g = infer_geometry(v);
      if (!g) return g;
      return wrap("$near", std::move(*g));
    }
    case query_op::max_distance: return wrap("$maxDistance", v);
    default:
      return invalid("Geo method '" + std::string(op_token(op)) + "' has not been implemented for a " +
                     (f ? f->name() : std::string("schema-less")) + " field");
  }
}

auto coerce_singular(query_op op) -> bool {
  switch (op) {
    case query_op::ne: case query_op::gt: case query_op::gte:
    case query_op::lt: case query_op::lte: case query_op::not_:
      return true;
    default:
      return classify(op) == op_class::string;
  }
}

auto coerce_each(query_op op) -> bool {
  return op == query_op::in || op == query_op::nin || op == query_op::all || op == query_op::near;
}

// Move "$maxDistance" behind every other operator of the same key.
void max_distance_last(wire_value& ops) {
  auto it = ops.find("$maxDistance");
  if (it == ops.end()) return;
  wire_value d = *it;
  ops.erase("$maxDistance");
  ops["$maxDistance"] = std::move(d);
}

} // namespace

auto infer_geometry(const wire_value& v) -> std::expected<wire_value, core::error> {
  if (v.is_object()) {
    if (v.contains("$geometry")) return v;
    if (v.contains("type") && v.contains("coordinates")) return wrap("$geometry", v);
    return invalid("Invalid $geometry dictionary should have type and coordinates keys");
  }
  if (v.is_array() && !v.empty()) {
    const char* type = "Point";
    if (v[0].is_array() && !v[0].empty()) {
      type = (v[0][0].is_array() && !v[0][0].empty()) ? "Polygon" : "LineString";
    }
    wire_value g = wire_value::object();
    g["type"] = type;
    g["coordinates"] = v;
    return wrap("$geometry", std::move(g));
  }
  return invalid("Invalid $geometry data. Can be either a dictionary or (nested) lists of coordinate(s)");
}

auto compile_query(const schema* s, std::vector<query_term> terms) -> std::expected<query_doc, core::error> {
  std::stable_sort(terms.begin(), terms.end(),
                   [](const query_term& a, const query_term& b) { return a.sort_key() < b.sort_key(); });

  query_doc out = wire_value::object();
  // Keys holding a bare value that later met an operator; folded into $and at the end.
  std::vector<std::pair<std::string, std::vector<wire_value>>> deferred;

  for (auto& t : terms) {
    if (t.raw) {
      for (auto it = t.value.begin(); it != t.value.end(); ++it) out[it.key()] = it.value();
      continue;
    }

    auto rp = resolve_path(s, t.path, resolve_mode::query);
    if (!rp) return std::unexpected(rp.error());
    const field* f = rp->terminal;
    wire_value v = std::move(t.value);

    if (s != nullptr && f != nullptr) {
      if (!t.op || coerce_singular(*t.op)) {
        auto c = f->prepare_query_value(t.op, v);
        if (!c) return std::unexpected(c.error());
        v = std::move(*c);
      } else if (coerce_each(*t.op) && !v.is_object()) {
        if (!v.is_array()) {
          return invalid("Operator '" + std::string(op_token(*t.op)) + "' requires a list of values");
        }
        wire_value each = wire_value::array();
        for (const auto& e : v) {
          auto c = f->prepare_query_value(t.op, e);
          if (!c) return std::unexpected(c.error());
          each.push_back(std::move(*c));
        }
        v = std::move(each);
      }
    }

    if (t.op) {
      switch (classify(*t.op)) {
        case op_class::geo: {
          auto g = geo_operator(s ? f : nullptr, *t.op, v);
          if (!g) return g;
          v = std::move(*g);
          break;
        }
        case op_class::custom: v = wrap("$elemMatch", std::move(v)); break;
        case op_class::string: break;
        case op_class::comparison: v = wrap("$" + std::string(op_token(*t.op)), std::move(v)); break;
      }
    }
    if (t.negate) v = wrap("$not", std::move(v));

    const auto key = rp->dotted();
    auto existing = out.find(key);
    if (!t.op || existing == out.end()) {
      out[key] = std::move(v);
    } else if (existing->is_object() && v.is_object()) {
      for (auto it = v.begin(); it != v.end(); ++it) (*existing)[it.key()] = it.value();
      max_distance_last(*existing);
    } else {
      auto slot = std::find_if(deferred.begin(), deferred.end(), [&](const auto& d) { return d.first == key; });
      if (slot == deferred.end()) {
        deferred.emplace_back(key, std::vector<wire_value>{});
        slot = deferred.end() - 1;
      }
      slot->second.push_back(std::move(v));
    }
  }

  for (auto& [key, later] : deferred) {
    wire_value prior = out[key];
    out.erase(key);
    if (!out.contains("$and")) out["$and"] = wire_value::array();
    auto& conj = out["$and"];
    if (!conj.is_array()) return invalid("$and must be a list");
    conj.push_back(wrap(key, std::move(prior)));
    for (auto& v : later) conj.push_back(wrap(key, std::move(v)));
  }

  if (core::debug_enabled()) std::cerr << "[QUARRY][query] " << out.dump() << "\n";
  return out;
}

auto compile_query(const schema* s, const keyword_args& filters) -> std::expected<query_doc, core::error> {
  std::vector<query_term> terms;
  terms.reserve(filters.size());
  for (const auto& [key, v] : filters) {
    auto t = parse_query_key(key, v);
    if (!t) return std::unexpected(t.error());
    terms.push_back(std::move(*t));
  }
  return compile_query(s, std::move(terms));
}

} // namespace quarry
