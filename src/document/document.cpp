#include "quarry/document/document.hpp"

#include <iostream>
#include <utility>

#include "core/strings.hpp"
#include "quarry/config.hpp"
#include "quarry/core/platform_utils.hpp"
#include "quarry/queryset/query_set.hpp"
#include "quarry/registry.hpp"
#include "quarry/storage/backend.hpp"
#include "storage/classify.hpp"

namespace quarry {

namespace {

// Child of a list (by index) or map (by key); nullptr when absent.
template <typename V>
auto child_of(V& v, const std::string& seg) -> V* {
  if (auto* l = v.as_list()) {
    auto idx = detail::parse_index(seg);
    return (idx && *idx < l->size()) ? &(*l)[*idx] : nullptr;
  }
  if (auto* m = v.as_map()) {
    auto it = m->find(seg);
    return it == m->end() ? nullptr : &it->second;
  }
  return nullptr;
}

auto bad_path(std::string_view path, std::string_view why) -> std::unexpected<core::error> {
  return core::fail(core::error_code::invalid_argument,
                    std::string(why) + " at \"" + std::string(path) + "\"", "document.mutate");
}

} // namespace

// ---------------------------------------------------------------------------
// base_document

base_document::base_document(const schema& s) : schema_(&s) { reset_defaults(); }

base_document::~base_document() = default;

base_document::base_document(const base_document& other)
    : schema_(other.schema_), data_(other.data_), changes_(other.changes_) {
  relink_all();
}

base_document::base_document(base_document&& other) noexcept
    : schema_(other.schema_), data_(std::move(other.data_)), changes_(std::move(other.changes_)) {
  relink_all();
}

base_document& base_document::operator=(const base_document& other) {
  if (this != &other) {
    schema_ = other.schema_;
    data_ = other.data_;
    changes_ = other.changes_;
    relink_all();
  }
  return *this;
}

base_document& base_document::operator=(base_document&& other) noexcept {
  if (this != &other) {
    schema_ = other.schema_;
    data_ = std::move(other.data_);
    changes_ = std::move(other.changes_);
    relink_all();
  }
  return *this;
}

void base_document::reset_defaults() {
  data_.clear();
  for (const auto& f : schema_->fields()) {
    if (f->kind() == field_kind::list) data_[f->name()] = value(value::list{});
    if (f->kind() == field_kind::dict) data_[f->name()] = value(value::map{});
  }
}

void base_document::relink(const field& f) {
  auto it = data_.find(f.name());
  if (it == data_.end()) return;
  auto walk = [this](auto& self, value& v, const std::string& prefix) -> void {
    if (auto* e = v.as_embedded()) {
      base_document* child = e;
      child->parent_ = this;
      child->parent_key_ = prefix;
      return;
    }
    if (auto* l = v.as_list()) {
      for (std::size_t i = 0; i < l->size(); ++i) self(self, (*l)[i], prefix + "." + std::to_string(i));
    } else if (auto* m = v.as_map()) {
      for (auto& [k, child] : *m) self(self, child, prefix + "." + k);
    }
  };
  walk(walk, it->second, f.db_field());
}

void base_document::relink_all() {
  for (const auto& f : schema_->fields()) relink(*f);
}

void base_document::mark_changed(const std::string& path) {
  changes_.mark(path);
  if (parent_ != nullptr) parent_->mark_changed(parent_key_ + "." + path);
}

void base_document::clear_changed_fields() {
  changes_.clear();
  auto walk = [](auto& self, value& v) -> void {
    if (auto* e = v.as_embedded()) {
      e->clear_changed_fields();
    } else if (auto* l = v.as_list()) {
      for (auto& child : *l) self(self, child);
    } else if (auto* m = v.as_map()) {
      for (auto& [k, child] : *m) self(self, child);
    }
  };
  for (auto& [name, v] : data_) walk(walk, v);
}

auto base_document::route(const std::vector<std::string>& segs)
    -> std::expected<std::pair<base_document*, std::vector<std::string>>, core::error> {
  if (segs.empty() || segs.front().empty()) return bad_path("", "Empty path");
  const auto* f = schema_->find(segs.front());
  if (f == nullptr) {
    return core::fail(core::error_code::invalid_argument,
                      "Unknown field \"" + segs.front() + "\" on " + schema_->class_name(),
                      "document.mutate");
  }
  value* cur = &slot(*f);
  for (std::size_t i = 1; i < segs.size(); ++i) {
    if (auto* e = cur->as_embedded()) {
      return e->route(std::vector<std::string>(segs.begin() + static_cast<std::ptrdiff_t>(i), segs.end()));
    }
    if (i + 1 == segs.size()) break;
    cur = child_of(*cur, segs[i]);
    if (cur == nullptr) return bad_path(detail::join(segs, ".", 0, i + 1), "Nothing stored");
  }
  return std::pair<base_document*, std::vector<std::string>>{this, segs};
}

auto base_document::storage_path(const std::vector<std::string>& segs) const -> std::string {
  std::string out = schema_->find(segs.front())->db_field();
  for (std::size_t i = 1; i < segs.size(); ++i) out += "." + segs[i];
  return out;
}

auto base_document::find_storage(const std::vector<std::string>& segs) const -> const value* {
  const base_document* doc = this;
  const value* cur = nullptr;
  for (const auto& seg : segs) {
    if (cur != nullptr) {
      if (const auto* e = cur->as_embedded()) {
        doc = e;
        cur = nullptr;
      }
    }
    if (cur == nullptr) {
      const auto* f = doc->schema_->find_by_db(seg);
      if (f == nullptr) return nullptr;
      auto it = doc->data_.find(f->name());
      if (it == doc->data_.end()) return nullptr;
      cur = &it->second;
      continue;
    }
    cur = child_of(*cur, seg);
    if (cur == nullptr) return nullptr;
  }
  return cur;
}

auto base_document::get(std::string_view path) const -> const value* {
  const base_document* doc = this;
  const value* cur = nullptr;
  for (const auto& seg : detail::split(path, ".")) {
    if (cur != nullptr) {
      if (const auto* e = cur->as_embedded()) {
        doc = e;
        cur = nullptr;
      }
    }
    if (cur == nullptr) {
      const auto* f = doc->schema_->find(seg);
      if (f == nullptr) return nullptr;
      auto it = doc->data_.find(f->name());
      if (it == doc->data_.end()) return nullptr;
      cur = &it->second;
      continue;
    }
    cur = child_of(*cur, seg);
    if (cur == nullptr) return nullptr;
  }
  return cur;
}

auto base_document::embedded(std::string_view path) -> embedded_document* {
  const auto* v = get(path);
  return v ? const_cast<value*>(v)->as_embedded() : nullptr;
}

auto base_document::set(std::string_view path, value v) -> std::expected<void, core::error> {
  auto routed = route(detail::split(path, "."));
  if (!routed) return std::unexpected(routed.error());
  auto& [owner, segs] = *routed;
  if (owner != this) return owner->set(detail::join(segs, "."), std::move(v));

  const auto* f = schema_->find(segs.front());
  if (segs.size() == 1) {
    slot(*f) = std::move(v);
    relink(*f);
    mark_changed(f->db_field());
    return {};
  }
  value* container = &slot(*f);
  for (std::size_t i = 1; i + 1 < segs.size(); ++i) container = child_of(*container, segs[i]);
  const auto& last = segs.back();
  if (auto* l = container->as_list()) {
    auto idx = detail::parse_index(last);
    if (!idx || *idx >= l->size()) return bad_path(path, "List index out of range");
    (*l)[*idx] = std::move(v);
  } else if (auto* m = container->as_map()) {
    (*m)[last] = std::move(v);
  } else {
    return bad_path(path, "Cannot assign below a scalar");
  }
  relink(*f);
  mark_changed(storage_path(segs));
  return {};
}

auto base_document::unset(std::string_view path) -> std::expected<void, core::error> {
  auto routed = route(detail::split(path, "."));
  if (!routed) return std::unexpected(routed.error());
  auto& [owner, segs] = *routed;
  if (owner != this) return owner->unset(detail::join(segs, "."));

  const auto* f = schema_->find(segs.front());
  if (segs.size() == 1) {
    if (f->kind() == field_kind::list) {
      slot(*f) = value(value::list{});
    } else if (f->kind() == field_kind::dict) {
      slot(*f) = value(value::map{});
    } else {
      data_.erase(f->name());
    }
    mark_changed(f->db_field());
    return {};
  }
  value* container = &slot(*f);
  for (std::size_t i = 1; i + 1 < segs.size(); ++i) container = child_of(*container, segs[i]);
  const auto& last = segs.back();
  if (auto* l = container->as_list()) {
    auto idx = detail::parse_index(last);
    if (!idx || *idx >= l->size()) return bad_path(path, "List index out of range");
    l->erase(l->begin() + static_cast<std::ptrdiff_t>(*idx));
    relink(*f);
    // Removing an element shifts the rest: the whole list is dirty.
    mark_changed(storage_path(std::vector<std::string>(segs.begin(), segs.end() - 1)));
    return {};
  }
  if (auto* m = container->as_map()) {
    if (m->erase(last) == 0) return bad_path(path, "No such key");
    relink(*f);
    mark_changed(storage_path(segs));
    return {};
  }
  return bad_path(path, "Cannot unset below a scalar");
}

auto base_document::append(std::string_view path, value v) -> std::expected<void, core::error> {
  auto routed = route(detail::split(path, "."));
  if (!routed) return std::unexpected(routed.error());
  auto& [owner, segs] = *routed;
  if (owner != this) return owner->append(detail::join(segs, "."), std::move(v));

  const auto* f = schema_->find(segs.front());
  value* target = &slot(*f);
  for (std::size_t i = 1; i < segs.size() && target != nullptr; ++i) target = child_of(*target, segs[i]);
  if (target != nullptr && segs.size() == 1 && target->is_null()) *target = value(value::list{});
  auto* l = target ? target->as_list() : nullptr;
  if (l == nullptr) return bad_path(path, "Not a list");
  l->push_back(std::move(v));
  relink(*f);
  mark_changed(storage_path(segs));
  return {};
}

auto base_document::pop(std::string_view path, std::optional<std::size_t> index)
    -> std::expected<value, core::error> {
  auto routed = route(detail::split(path, "."));
  if (!routed) return std::unexpected(routed.error());
  auto& [owner, segs] = *routed;
  if (owner != this) return owner->pop(detail::join(segs, "."), index);

  const auto* f = schema_->find(segs.front());
  value* target = &slot(*f);
  for (std::size_t i = 1; i < segs.size() && target != nullptr; ++i) target = child_of(*target, segs[i]);
  auto* l = target ? target->as_list() : nullptr;
  if (l == nullptr) return bad_path(path, "Not a list");
  if (l->empty()) return bad_path(path, "Pop from empty list");
  const auto idx = index.value_or(l->size() - 1);
  if (idx >= l->size()) return bad_path(path, "List index out of range");
  value out = std::move((*l)[idx]);
  l->erase(l->begin() + static_cast<std::ptrdiff_t>(idx));
  relink(*f);
  mark_changed(storage_path(segs));
  return out;
}

auto base_document::delta() const -> delta_result {
  delta_result out;
  for (const auto& path : changes_.paths()) {
    const auto* v = find_storage(detail::split(path, "."));
    if (v == nullptr || v->is_empty()) {
      out.unsets[path] = 1;
    } else {
      out.sets[path] = v->to_wire();
    }
  }
  return out;
}

auto base_document::to_storage() const -> wire_value {
  wire_value out = wire_value::object();
  const auto* idf = schema_->id_field();
  if (idf != nullptr) {
    if (auto it = data_.find(idf->name()); it != data_.end() && !it->second.is_null()) {
      out["_id"] = idf->to_storage(it->second);
    }
  }
  if (schema_->allow_inheritance()) out["_cls"] = schema_->discriminator();
  for (const auto& f : schema_->fields()) {
    if (f.get() == idf) continue;
    auto it = data_.find(f->name());
    if (it == data_.end() || it->second.is_empty()) continue;
    out[f->db_field()] = f->to_storage(it->second);
  }
  return out;
}

auto base_document::hydrate(const wire_value& w) -> std::expected<void, core::error> {
  if (!w.is_object()) {
    return core::fail(core::error_code::validation_failed, "Stored document is not an object",
                      "document.from_storage");
  }
  reset_defaults();
  for (const auto& f : schema_->fields()) {
    auto it = w.find(f->db_field());
    if (it == w.end()) continue;
    auto v = f->from_storage(*it);
    if (!v) return std::unexpected(v.error());
    data_[f->name()] = std::move(*v);
  }
  relink_all();
  clear_changed_fields();
  return {};
}

// ---------------------------------------------------------------------------
// embedded_document

embedded_document::embedded_document(const schema& s) : base_document(s) {}

auto embedded_document::from_storage(const schema& s, const wire_value& w)
    -> std::expected<std::unique_ptr<embedded_document>, core::error> {
  auto doc = std::make_unique<embedded_document>(s);
  if (auto r = doc->hydrate(w); !r) return std::unexpected(r.error());
  return doc;
}

auto embedded_document::clone() const -> std::unique_ptr<embedded_document> {
  return std::make_unique<embedded_document>(*this);
}

// ---------------------------------------------------------------------------
// document

document::document(const schema& s) : base_document(s) {}

auto document::from_storage(const schema& s, const wire_value& w) -> std::expected<document, core::error> {
  const schema* actual = &s;
  if (auto it = w.find("_cls"); it != w.end() && it->is_string()) {
    if (const auto* sub = registry::instance().find_discriminator(it->get<std::string>())) {
      for (const schema* p = sub; p != nullptr; p = p->parent()) {
        if (p == &s) {
          actual = sub;
          break;
        }
      }
    }
  }
  document doc(*actual);
  if (auto r = doc.hydrate(w); !r) return std::unexpected(r.error());
  doc.created_ = false;
  return doc;
}

auto document::dereference(storage::database& db, const reference& ref) -> std::expected<document, core::error> {
  const auto* s = registry::instance().find_collection(ref.collection);
  if (s == nullptr) {
    return core::fail(core::error_code::invalid_argument,
                      "No document class is registered for collection \"" + ref.collection + "\"",
                      "document.dereference");
  }
  storage::find_options opts;
  opts.limit = 1;
  auto found = db.collection(ref.collection).find(wire_value{{"_id", ref.id}}, opts);
  if (!found) return std::unexpected(found.error());
  if (found->empty()) {
    return core::fail(core::error_code::does_not_exist,
                      s->class_name() + " matching the reference does not exist", "document.dereference");
  }
  return from_storage(*s, found->front());
}

auto document::state() const -> document_state {
  if (created_) return document_state::fresh;
  return changed_paths().empty() ? document_state::clean : document_state::dirty;
}

auto document::id() const -> wire_value {
  const auto* idf = meta().id_field();
  if (idf == nullptr) return nullptr;
  const auto* v = get(idf->name());
  return v ? v->to_wire() : wire_value(nullptr);
}

auto document::delta() const -> delta_result {
  if (created_) return {to_storage(), wire_value::object()};
  return base_document::delta();
}

void document::assign_id(const wire_value& id) {
  const auto* idf = meta().id_field();
  if (idf == nullptr || !this->id().is_null()) return;
  if (auto v = idf->from_storage(id)) slot(*idf) = std::move(*v);
}

void document::mark_persisted() {
  created_ = false;
  clear_changed_fields();
}

auto document::save(storage::database& db, std::optional<storage::write_concern> wc)
    -> std::expected<void, core::error> {
  const auto concern = wc.value_or(config().default_write_concern);
  auto& coll = db.collection(meta().collection());

  if (created_) {
    std::vector<wire_value> docs{to_storage()};
    auto ids = coll.insert(std::move(docs), concern);
    if (!ids) return std::unexpected(storage::classify(ids.error(), storage::write_kind::save));
    if (!ids->empty()) assign_id(ids->front());
    if (core::debug_enabled()) {
      std::cerr << "[QUARRY][document] inserted " << meta().collection() << " " << id().dump() << "\n";
    }
    mark_persisted();
    return {};
  }

  auto d = base_document::delta();
  d.sets.erase("_id");
  if (d.empty()) return {};
  wire_value update = wire_value::object();
  if (!d.sets.empty()) update["$set"] = std::move(d.sets);
  if (!d.unsets.empty()) update["$unset"] = std::move(d.unsets);
  if (core::debug_enabled()) {
    std::cerr << "[QUARRY][document] save " << meta().collection() << " " << update.dump() << "\n";
  }
  auto r = coll.update(wire_value{{"_id", id()}}, update, concern, /*upsert=*/false, /*multi=*/false);
  if (!r) return std::unexpected(storage::classify(r.error(), storage::write_kind::save));
  mark_persisted();
  return {};
}

auto document::reload(storage::database& db) -> std::expected<void, core::error> {
  const auto key = id();
  if (key.is_null()) {
    return core::fail(core::error_code::operation_failed, "Document has not been saved", "document.reload");
  }
  storage::find_options opts;
  opts.limit = 1;
  auto found = db.collection(meta().collection()).find(wire_value{{"_id", key}}, opts);
  if (!found) return std::unexpected(found.error());
  if (found->empty()) {
    return core::fail(core::error_code::operation_failed, "Document has been deleted.", "document.reload");
  }
  if (auto r = hydrate(found->front()); !r) return r;
  created_ = false;
  return {};
}

auto document::remove(storage::database& db, std::optional<storage::write_concern> wc)
    -> std::expected<void, core::error> {
  const auto key = id();
  if (key.is_null()) {
    return core::fail(core::error_code::operation_failed, "Document has not been saved", "document.remove");
  }
  auto qs = query_set(db, meta()).filter({{"pk", key}});
  if (!qs) return std::unexpected(qs.error());
  auto r = qs->remove(wc);
  if (!r) return std::unexpected(r.error());
  return {};
}

auto document::update(storage::database& db, const keyword_args& updates, std::optional<storage::write_concern> wc)
    -> std::expected<storage::update_result, core::error> {
  if (created_) {
    return core::fail(core::error_code::operation_failed, "attempt to update a document not yet saved",
                      "document.update");
  }
  auto qs = query_set(db, meta()).filter({{"pk", id()}});
  if (!qs) return std::unexpected(qs.error());
  return qs->update_one(updates, wc);
}

auto document::to_reference() const -> std::expected<reference, core::error> {
  auto key = id();
  if (key.is_null()) {
    return core::fail(core::error_code::operation_failed,
                      "You can only reference documents once they have been saved to the database",
                      "document.to_reference");
  }
  return reference{meta().collection(), std::move(key)};
}

} // namespace quarry
