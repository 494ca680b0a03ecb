#include "quarry/query/update_compiler.hpp"

#include <iostream>
#include <string>
#include <utility>

#include "quarry/core/platform_utils.hpp"
#include "quarry/query/path_resolver.hpp"

namespace quarry {

namespace {

auto invalid(std::string message) -> std::unexpected<core::error> {
  return core::fail(core::error_code::invalid_query, std::move(message), "update.compile");
}

auto prepare_each(const field& f, const wire_value& v) -> std::expected<wire_value, core::error> {
  wire_value out = wire_value::array();
  for (const auto& e : v) {
    auto c = f.prepare_query_value(std::nullopt, e);
    if (!c) return std::unexpected(c.error());
    out.push_back(std::move(*c));
  }
  return out;
}

auto negate(const wire_value& v) -> wire_value {
  if (v.is_number_float()) return -v.get<double>();
  return -v.get<std::int64_t>();
}

} // namespace

auto compile_update(const schema* s, const std::vector<update_term>& terms)
    -> std::expected<update_doc, core::error> {
  update_doc out = wire_value::object();

  for (const auto& t : terms) {
    if (t.raw) {
      for (auto it = t.value.begin(); it != t.value.end(); ++it) out[it.key()] = it.value();
      continue;
    }

    wire_value v = t.value;
    const std::string canonical = t.op ? std::string(canonical_name(*t.op)) : std::string();
    if (t.op == update_op::dec) {
      if (!v.is_number()) return invalid("dec requires a numeric value");
      if (v.get<double>() > 0) v = negate(v);
    }

    auto rp = resolve_path(s, t.path, resolve_mode::update);
    if (!rp) return std::unexpected(rp.error());

    if (s != nullptr && rp->terminal != nullptr) {
      const field& f = *rp->terminal;
      std::expected<wire_value, core::error> c = v;
      if (canonical.empty() || canonical == "set" || canonical == "push" || canonical == "pull") {
        if (f.required() || !v.is_null()) c = f.prepare_query_value(std::nullopt, v);
      } else if (canonical == "pullAll") {
        if (!v.is_array()) return invalid("pullAll requires a list of values");
        c = prepare_each(f, v);
      } else if (canonical == "addToSet") {
        if (v.is_array()) {
          c = prepare_each(f, v);
        } else if (f.required() || !v.is_null()) {
          c = f.prepare_query_value(std::nullopt, v);
        }
      }
      if (!c) return std::unexpected(c.error());
      v = std::move(*c);
    }

    if (t.match) {
      wire_value m = wire_value::object();
      m["$" + *t.match] = std::move(v);
      v = std::move(m);
    }

    if (!t.op) return invalid("Updates must supply an operation eg: set__FIELD=value");

    const auto key = rp->dotted();
    wire_value entry = wire_value::object();
    if (canonical.find("pull") != std::string::npos && rp->segments.size() > 1) {
      if (canonical == "pullAll") return invalid("pullAll operations only support a single field depth");
      // Pull takes the nested-document form: {a: {b: value}} rather than "a.b".
      for (auto it = rp->segments.rbegin(); it != rp->segments.rend(); ++it) {
        wire_value level = wire_value::object();
        level[*it] = std::move(v);
        v = std::move(level);
      }
      entry = std::move(v);
    } else if (canonical == "addToSet" && v.is_array()) {
      entry[key] = wire_value{{"$each", std::move(v)}};
    } else {
      entry[key] = std::move(v);
    }

    const auto bucket = "$" + canonical;
    if (!out.contains(bucket)) {
      out[bucket] = std::move(entry);
    } else {
      for (auto it = entry.begin(); it != entry.end(); ++it) out[bucket][it.key()] = it.value();
    }
  }

  if (core::debug_enabled()) std::cerr << "[QUARRY][update] " << out.dump() << "\n";
  return out;
}

auto compile_update(const schema* s, const keyword_args& updates) -> std::expected<update_doc, core::error> {
  std::vector<update_term> terms;
  terms.reserve(updates.size());
  for (const auto& [key, v] : updates) {
    auto t = parse_update_key(key, v);
    if (!t) return std::unexpected(t.error());
    terms.push_back(std::move(*t));
  }
  return compile_update(s, terms);
}

} // namespace quarry
