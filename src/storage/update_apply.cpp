#include "quarry/storage/matcher.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "core/strings.hpp"

namespace quarry::storage {

namespace {

auto update_error(const std::string& message) -> std::unexpected<core::error> {
  return core::fail(core::error_code::operation_failed, message, "storage.update");
}

// Arrays are never padded past this size, matching the server's backfill limit.
constexpr std::size_t max_backfill = 1500000;

// Element `seg` of an array; padded with nulls up to the index when `create`.
// nullptr when the element is missing and `create` is false.
auto element_of(wire_value& arr, const std::string& seg, bool create) -> std::expected<wire_value*, core::error> {
  const auto idx = detail::parse_index(seg);
  if (idx && *idx < arr.size()) return &arr[*idx];
  if (!create) return nullptr;
  if (!idx || *idx >= max_backfill) {
    return update_error("can't backfill array to larger than " + std::to_string(max_backfill) +
                        " elements (index " + seg + ")");
  }
  while (arr.size() <= *idx) arr.push_back(nullptr);
  return &arr[*idx];
}

// Parent container of the last path segment, created on demand when `create`.
// nullptr when the parent is missing and `create` is false.
auto parent_of(wire_value& doc, const std::vector<std::string>& segs, bool create)
    -> std::expected<wire_value*, core::error> {
  wire_value* cur = &doc;
  for (std::size_t i = 0; i + 1 < segs.size(); ++i) {
    const auto& seg = segs[i];
    if (cur->is_array() && detail::is_digits(seg)) {
      auto e = element_of(*cur, seg, create);
      if (!e || *e == nullptr) return e;
      cur = *e;
    } else if (cur->is_object()) {
      if (!cur->contains(seg)) {
        if (!create) return nullptr;
        (*cur)[seg] = wire_value::object();
      }
      cur = &(*cur)[seg];
    } else if (cur->is_null() && create) {
      *cur = wire_value::object();
      cur = &(*cur)[seg];
    } else {
      return nullptr;
    }
    if (cur->is_null() && create) *cur = wire_value::object();
  }
  return cur;
}

auto slot_of(wire_value& doc, const std::string& path, bool create) -> std::expected<wire_value*, core::error> {
  const auto segs = detail::split(path, ".");
  auto parent = parent_of(doc, segs, create);
  if (!parent) return parent;
  if (*parent == nullptr) {
    if (!create) return nullptr;
    return update_error("Cannot create field at \"" + path + "\"");
  }
  const auto& last = segs.back();
  if ((*parent)->is_array()) {
    if (!detail::is_digits(last)) return update_error("Cannot use the part \"" + last + "\" to traverse an array");
    return element_of(**parent, last, create);
  }
  if ((*parent)->is_object()) {
    if (!(*parent)->contains(last)) {
      if (!create) return nullptr;
      (**parent)[last] = nullptr;
    }
    return &(**parent)[last];
  }
  return update_error("Cannot create field \"" + last + "\" in a non-document value");
}

auto erase_path(wire_value& doc, const std::string& path) -> std::expected<void, core::error> {
  const auto segs = detail::split(path, ".");
  auto parent = parent_of(doc, segs, false);
  if (!parent) return std::unexpected(parent.error());
  if (*parent == nullptr) return {};
  if ((*parent)->is_object()) {
    (*parent)->erase(segs.back());
    return {};
  }
  if ((*parent)->is_array()) {
    // Unsetting an element leaves a hole, like the server does.
    auto e = element_of(**parent, segs.back(), false);
    if (!e) return std::unexpected(e.error());
    if (*e != nullptr) **e = nullptr;
  }
  return {};
}

// Replace the positional '$' with the index of the first array element that
// satisfies the filter's conditions on that array.
auto resolve_positional(const wire_value& doc, const std::string& path, const query_doc& filter)
    -> std::expected<std::string, core::error> {
  const auto pos = path.find(".$");
  if (pos == std::string::npos) return path;
  const auto prefix = path.substr(0, pos);
  const auto* arr = value_at(doc, prefix);
  if (arr == nullptr || !arr->is_array()) {
    return update_error("The positional operator did not find the match needed from the query.");
  }

  std::vector<std::pair<std::string, wire_value>> conds;
  if (filter.is_object()) {
    for (auto it = filter.begin(); it != filter.end(); ++it) {
      if (it.key() == prefix) {
        conds.emplace_back("", it.value());
      } else if (it.key().rfind(prefix + ".", 0) == 0) {
        conds.emplace_back(it.key().substr(prefix.size() + 1), it.value());
      }
    }
  }
  if (conds.empty()) return update_error("The positional operator did not find the match needed from the query.");

  for (std::size_t i = 0; i < arr->size(); ++i) {
    const auto& elem = (*arr)[i];
    bool all = true;
    for (const auto& [sub, cond] : conds) {
      // Wrap the element so that the ordinary matcher can evaluate the condition.
      wire_value wrapped = wire_value::object();
      wrapped["e"] = elem;
      auto r = matches(wire_value{{sub.empty() ? std::string("e") : "e." + sub, cond}}, wrapped);
      if (!r) return std::unexpected(r.error());
      all = all && *r;
    }
    if (all) return prefix + "." + std::to_string(i) + path.substr(pos + 2);
  }
  return update_error("The positional operator did not find the match needed from the query.");
}

auto pull_matches(const wire_value& elem, const wire_value& cond) -> std::expected<bool, core::error> {
  if (cond.is_object() && !cond.empty()) {
    const bool ops = cond.begin().key().rfind('$', 0) == 0;
    wire_value wrapped = wire_value::object();
    wrapped["e"] = elem;
    if (ops) return matches(wire_value{{"e", cond}}, wrapped);
    if (!elem.is_object()) return false;
    return matches(cond, elem);
  }
  return elem == cond;
}

auto add_number(const wire_value& a, const wire_value& b, const std::string& path)
    -> std::expected<wire_value, core::error> {
  if ((a.is_number_integer() || a.is_number_unsigned()) && (b.is_number_integer() || b.is_number_unsigned())) {
    const auto x = a.get<std::int64_t>();
    const auto y = b.get<std::int64_t>();
    if ((y > 0 && x > std::numeric_limits<std::int64_t>::max() - y) ||
        (y < 0 && x < std::numeric_limits<std::int64_t>::min() - y)) {
      return update_error("$inc would overflow the 64-bit integer at \"" + path + "\"");
    }
    return wire_value(x + y);
  }
  return wire_value(a.get<double>() + b.get<double>());
}

auto apply_one(wire_value& doc, const std::string& op, const std::string& path, const wire_value& arg,
               bool inserting) -> std::expected<void, core::error> {
  if (op == "$set" || (op == "$setOnInsert" && inserting)) {
    auto s = slot_of(doc, path, true);
    if (!s) return std::unexpected(s.error());
    **s = arg;
    return {};
  }
  if (op == "$setOnInsert") return {};
  if (op == "$unset") return erase_path(doc, path);
  if (op == "$inc") {
    if (!arg.is_number()) return update_error("Cannot increment with non-numeric argument");
    auto s = slot_of(doc, path, true);
    if (!s) return std::unexpected(s.error());
    auto& target = **s;
    if (target.is_null()) {
      target = arg;
    } else if (!target.is_number()) {
      return update_error("Cannot apply $inc to a value of non-numeric type at \"" + path + "\"");
    } else {
      auto sum = add_number(target, arg, path);
      if (!sum) return std::unexpected(sum.error());
      target = std::move(*sum);
    }
    return {};
  }

  const bool push = op == "$push" || op == "$pushAll" || op == "$addToSet";
  auto s = slot_of(doc, path, push);
  if (!s) return std::unexpected(s.error());
  if (*s == nullptr) return {};  // pull/pop on a missing field is a no-op
  auto& target = **s;
  if (target.is_null() && push) target = wire_value::array();
  if (!target.is_array()) return update_error(op + " requires an array at \"" + path + "\"");

  if (push) {
    wire_value items = wire_value::array();
    if (op == "$pushAll") {
      if (!arg.is_array()) return update_error("$pushAll requires an array argument");
      items = arg;
    } else if (arg.is_object() && arg.contains("$each")) {
      items = arg["$each"];
    } else {
      items.push_back(arg);
    }
    for (const auto& item : items) {
      if (op == "$addToSet" && std::find(target.begin(), target.end(), item) != target.end()) continue;
      target.push_back(item);
    }
    return {};
  }
  if (op == "$pull" || op == "$pullAll") {
    if (op == "$pullAll" && !arg.is_array()) return update_error("$pullAll requires an array argument");
    wire_value kept = wire_value::array();
    for (const auto& elem : target) {
      bool drop = false;
      if (op == "$pullAll") {
        drop = std::find(arg.begin(), arg.end(), elem) != arg.end();
      } else {
        auto r = pull_matches(elem, arg);
        if (!r) return std::unexpected(r.error());
        drop = *r;
      }
      if (!drop) kept.push_back(elem);
    }
    target = std::move(kept);
    return {};
  }
  if (op == "$pop") {
    if (target.empty()) return {};
    if (arg.is_number() && arg.get<double>() < 0) {
      target.erase(target.begin());
    } else {
      target.erase(target.end() - 1);
    }
    return {};
  }
  return core::fail(core::error_code::unsupported, "Update operator " + op + " is not supported in memory",
                    "storage.update");
}

} // namespace

auto apply_update(wire_value& doc, const update_doc& update, const query_doc& filter, bool inserting)
    -> std::expected<void, core::error> {
  if (!update.is_object() || update.empty()) return update_error("Update document must not be empty");
  if (update.begin().key().rfind('$', 0) != 0) {
    // Replacement document: keep the identifier.
    wire_value id = doc.contains("_id") ? doc["_id"] : wire_value(nullptr);
    doc = update;
    if (!id.is_null()) doc["_id"] = id;
    return {};
  }
  for (auto op = update.begin(); op != update.end(); ++op) {
    if (!op.value().is_object()) return update_error(op.key() + " requires a document");
    for (auto f = op.value().begin(); f != op.value().end(); ++f) {
      if (f.key() == "_id" && op.key() != "$setOnInsert") {
        return update_error("Performing an update on the path '_id' would modify the immutable field '_id'");
      }
      auto path = resolve_positional(doc, f.key(), filter);
      if (!path) return std::unexpected(path.error());
      if (auto r = apply_one(doc, op.key(), *path, f.value(), inserting); !r) return r;
    }
  }
  return {};
}

} // namespace quarry::storage
