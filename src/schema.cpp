#include "quarry/schema.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstring>
#include <utility>

#include "quarry/document/document.hpp"
#include "quarry/registry.hpp"

namespace quarry {

namespace {

auto escape_regex(std::string_view s) -> std::string {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    if (std::strchr("\\^$.|?*+()[]{}", c) != nullptr && c != '\0') out += '\\';
    out += c;
  }
  return out;
}

auto hydrate_embedded(const wire_value& w, const std::string& fallback_class)
    -> std::expected<value, core::error> {
  const auto& reg = registry::instance();
  const schema* s = nullptr;
  if (auto it = w.find("_cls"); it != w.end() && it->is_string()) {
    s = reg.find_discriminator(it->get<std::string>());
  }
  if (s == nullptr && !fallback_class.empty()) s = reg.find(fallback_class);
  if (s == nullptr) {
    return core::fail(core::error_code::validation_failed,
                      "Unknown embedded document class \"" + fallback_class + "\"", "schema.from_storage");
  }
  auto doc = embedded_document::from_storage(*s, w);
  if (!doc) return std::unexpected(doc.error());
  return value(std::move(*doc));
}

} // namespace

auto collection_name_for(std::string_view class_name) -> std::string {
  std::string out;
  for (std::size_t i = 0; i < class_name.size(); ++i) {
    const auto c = static_cast<unsigned char>(class_name[i]);
    if (std::isupper(c) != 0) {
      if (i != 0) out += '_';
      out += static_cast<char>(std::tolower(c));
    } else {
      out += static_cast<char>(c);
    }
  }
  return out;
}

// ---------------------------------------------------------------------------
// field

field::field(field_kind kind, std::string name, field_options opts)
    : kind_(kind), name_(std::move(name)), opts_(std::move(opts)) {
  db_field_ = opts_.db_field.empty() ? name_ : opts_.db_field;
}

auto field::prepare_query_value(std::optional<query_op> /*op*/, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  return v;
}

auto field::to_storage(const value& v) const -> wire_value { return v.to_wire(); }

auto field::from_storage(const wire_value& w) const -> std::expected<value, core::error> {
  return value::from_wire(w);
}

string_field::string_field(std::string name, field_options opts)
    : field(field_kind::string, std::move(name), std::move(opts)) {}

auto string_field::prepare_query_value(std::optional<query_op> op, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (!op || classify(*op) != op_class::string || !v.is_string()) return v;
  const auto literal = escape_regex(v.get_ref<const std::string&>());
  std::string pattern;
  bool ignore_case = false;
  switch (*op) {
    case query_op::icontains: ignore_case = true; [[fallthrough]];
    case query_op::contains: pattern = literal; break;
    case query_op::istartswith: ignore_case = true; [[fallthrough]];
    case query_op::startswith: pattern = "^" + literal; break;
    case query_op::iendswith: ignore_case = true; [[fallthrough]];
    case query_op::endswith: pattern = literal + "$"; break;
    case query_op::iexact: ignore_case = true; [[fallthrough]];
    case query_op::exact: pattern = "^" + literal + "$"; break;
    default: return v;
  }
  wire_value out = wire_value::object();
  out["$regex"] = pattern;
  if (ignore_case) out["$options"] = "i";
  return out;
}

int_field::int_field(std::string name, field_options opts)
    : field(field_kind::integer, std::move(name), std::move(opts)) {}

auto int_field::prepare_query_value(std::optional<query_op> /*op*/, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (v.is_number_float()) {
    // [-2^63, 2^63) is exactly representable as double bounds.
    const double d = v.get<double>();
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
      return core::fail(core::error_code::validation_failed,
                        "Cannot convert " + v.dump() + " to an integer for field \"" + name() + "\"",
                        "schema.prepare");
    }
    return wire_value(static_cast<std::int64_t>(d));
  }
  if (v.is_boolean()) return wire_value(v.get<bool>() ? 1 : 0);
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    std::int64_t parsed = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
      return core::fail(core::error_code::validation_failed,
                        "Cannot convert \"" + s + "\" to an integer for field \"" + name() + "\"",
                        "schema.prepare");
    }
    return wire_value(parsed);
  }
  return v;
}

float_field::float_field(std::string name, field_options opts)
    : field(field_kind::floating, std::move(name), std::move(opts)) {}

auto float_field::prepare_query_value(std::optional<query_op> /*op*/, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (v.is_number_integer()) return wire_value(static_cast<double>(v.get<std::int64_t>()));
  if (v.is_string()) {
    const auto& s = v.get_ref<const std::string&>();
    double parsed = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), parsed);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
      return core::fail(core::error_code::validation_failed,
                        "Cannot convert \"" + s + "\" to a float for field \"" + name() + "\"",
                        "schema.prepare");
    }
    return wire_value(parsed);
  }
  return v;
}

bool_field::bool_field(std::string name, field_options opts)
    : field(field_kind::boolean, std::move(name), std::move(opts)) {}

object_id_field::object_id_field(std::string name, field_options opts)
    : field(field_kind::object_id, std::move(name), std::move(opts)) {}

dict_field::dict_field(std::string name, field_options opts, std::shared_ptr<field> item)
    : field(field_kind::dict, std::move(name), std::move(opts)), item_(std::move(item)) {}

void dict_field::attach(const std::string& owner_class) {
  if (item_) item_->attach(owner_class);
}

auto dict_field::prepare_query_value(std::optional<query_op> op, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (op && classify(*op) == op_class::string) return string_field(name()).prepare_query_value(op, v);
  if (item_) return item_->prepare_query_value(op, v);
  return v;
}

auto dict_field::from_storage(const wire_value& w) const -> std::expected<value, core::error> {
  if (!item_ || !w.is_object()) return value::from_wire(w);
  value::map out;
  for (auto it = w.begin(); it != w.end(); ++it) {
    auto v = item_->from_storage(it.value());
    if (!v) return std::unexpected(v.error());
    out.emplace(it.key(), std::move(*v));
  }
  return value(std::move(out));
}

list_field::list_field(std::string name, std::shared_ptr<field> item, field_options opts)
    : field(field_kind::list, std::move(name), std::move(opts)), item_(std::move(item)) {}

void list_field::attach(const std::string& owner_class) {
  if (item_) item_->attach(owner_class);
}

auto list_field::prepare_query_value(std::optional<query_op> op, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (!item_) return v;
  if (v.is_array() && !op) {
    wire_value out = wire_value::array();
    for (const auto& e : v) {
      auto c = item_->prepare_query_value(op, e);
      if (!c) return std::unexpected(c.error());
      out.push_back(std::move(*c));
    }
    return out;
  }
  return item_->prepare_query_value(op, v);
}

auto list_field::from_storage(const wire_value& w) const -> std::expected<value, core::error> {
  if (w.is_null()) return value(value::list{});
  if (!w.is_array()) {
    return core::fail(core::error_code::validation_failed,
                      "Field \"" + name() + "\" expects a list", "schema.from_storage");
  }
  value::list out;
  out.reserve(w.size());
  for (const auto& e : w) {
    if (!item_) {
      out.push_back(value::from_wire(e));
      continue;
    }
    auto v = item_->from_storage(e);
    if (!v) return std::unexpected(v.error());
    out.push_back(std::move(*v));
  }
  return value(std::move(out));
}

embedded_field::embedded_field(std::string name, std::string class_name, field_options opts)
    : field(field_kind::embedded, std::move(name), std::move(opts)), class_name_(std::move(class_name)) {}

auto embedded_field::from_storage(const wire_value& w) const -> std::expected<value, core::error> {
  if (w.is_null()) return value{};
  if (!w.is_object()) {
    return core::fail(core::error_code::validation_failed,
                      "Field \"" + name() + "\" expects an embedded document", "schema.from_storage");
  }
  return hydrate_embedded(w, class_name_);
}

reference_field::reference_field(std::string name, std::string target, delete_rule rule, field_options opts)
    : field(field_kind::reference, std::move(name), std::move(opts)), target_(std::move(target)), rule_(rule) {}

void reference_field::attach(const std::string& owner_class) {
  if (target_ == "self") target_ = owner_class;
}

auto reference_field::target_collection() const -> std::string {
  if (const auto* s = registry::instance().find(target_)) return s->collection();
  return collection_name_for(target_);
}

auto reference_field::prepare_query_value(std::optional<query_op> /*op*/, const wire_value& v) const
    -> std::expected<wire_value, core::error> {
  if (v.is_object()) {
    if (auto it = v.find("_id"); it != v.end()) return *it;
  }
  return v;
}

auto reference_field::from_storage(const wire_value& w) const -> std::expected<value, core::error> {
  if (w.is_null()) return value{};
  return value(reference{target_collection(), w});
}

geo_point_field::geo_point_field(std::string name, field_options opts)
    : field(field_kind::geo_point, std::move(name), std::move(opts)) {}

point_field::point_field(std::string name, field_options opts)
    : field(field_kind::point, std::move(name), std::move(opts)) {}

// ---------------------------------------------------------------------------
// schema

schema::schema(std::string class_name, schema_options opts)
    : class_name_(std::move(class_name)), opts_(std::move(opts)) {
  if (const auto* p = opts_.parent) {
    fields_ = p->fields_;
    collection_ = p->collection_;
    discriminator_ = p->discriminator_ + "." + class_name_;
    id_name_ = p->id_name_;
    implicit_id_ = p->implicit_id_;
    opts_.allow_inheritance = true;
    opts_.embedded = p->opts_.embedded;
    return;
  }
  collection_ = opts_.collection.empty() ? collection_name_for(class_name_) : opts_.collection;
  discriminator_ = class_name_;
  if (!opts_.embedded) {
    field_options id_opts;
    id_opts.db_field = "_id";
    id_opts.primary_key = true;
    fields_.push_back(std::make_shared<object_id_field>("id", std::move(id_opts)));
    id_name_ = "id";
    implicit_id_ = true;
  }
}

auto schema::add(std::shared_ptr<field> f) -> schema& {
  f->attach(class_name_);
  if (f->primary_key() && !opts_.embedded) {
    if (implicit_id_) {
      fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                   [this](const auto& x) { return x->name() == id_name_; }),
                    fields_.end());
      implicit_id_ = false;
    }
    f->db_field_ = "_id";
    id_name_ = f->name();
  }
  fields_.push_back(std::move(f));
  return *this;
}

auto schema::find(std::string_view name) const -> const field* {
  if (name == "pk") return id_field();
  for (const auto& f : fields_) {
    if (f->name() == name) return f.get();
  }
  return nullptr;
}

auto schema::find_by_db(std::string_view db_name) const -> const field* {
  for (const auto& f : fields_) {
    if (f->db_field() == db_name) return f.get();
  }
  return nullptr;
}

auto schema::id_field() const -> const field* {
  if (id_name_.empty()) return nullptr;
  for (const auto& f : fields_) {
    if (f->name() == id_name_) return f.get();
  }
  return nullptr;
}

auto schema::lookup(const std::vector<std::string>& parts) const
    -> std::expected<std::vector<lookup_step>, core::error> {
  std::vector<lookup_step> out;
  out.reserve(parts.size());

  // Descent state after each step: a schema to resolve names in, a dict whose
  // keys pass through, an untyped container, or a leaf.
  const schema* current = this;
  const field* dict = nullptr;
  const field* join = nullptr;
  bool untyped = false;

  auto enter = [&](const field* f) -> std::expected<void, core::error> {
    current = nullptr;
    dict = nullptr;
    join = nullptr;
    untyped = false;
    while (f != nullptr && f->kind() == field_kind::list) f = f->item_field();
    if (f == nullptr) {
      untyped = true;
      return {};
    }
    switch (f->kind()) {
      case field_kind::embedded: {
        const auto& cls = static_cast<const embedded_field*>(f)->class_name();
        current = registry::instance().find(cls);
        if (current == nullptr) {
          return core::fail(core::error_code::invalid_query,
                            "Unknown embedded document class \"" + cls + "\"", "schema.lookup");
        }
        return {};
      }
      case field_kind::dict: dict = f; return {};
      case field_kind::reference: join = f; return {};
      default: return {};
    }
  };

  for (std::size_t i = 0; i < parts.size(); ++i) {
    const auto& part = parts[i];
    const field* f = nullptr;
    if (current != nullptr) {
      f = current->find(part);
      if (f == nullptr) {
        return core::fail(core::error_code::invalid_query,
                          "Cannot resolve field \"" + part + "\"", "schema.lookup");
      }
      out.push_back({f->db_field(), f});
    } else if (dict != nullptr) {
      f = dict->item_field();
      out.push_back({part, f});
    } else if (untyped) {
      out.push_back({part, nullptr});
      continue;
    } else if (join != nullptr) {
      std::string joined = parts.front();
      for (std::size_t j = 1; j < parts.size(); ++j) joined += "__" + parts[j];
      return core::fail(core::error_code::invalid_query,
                        "Cannot perform join in mongoDB: " + joined, "schema.lookup");
    } else {
      return core::fail(core::error_code::invalid_query,
                        "Cannot resolve field \"" + part + "\"", "schema.lookup");
    }
    if (auto r = enter(f); !r) return std::unexpected(r.error());
  }
  return out;
}

} // namespace quarry
