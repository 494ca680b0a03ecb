#include "quarry/queryset/query_set.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "core/strings.hpp"
#include "quarry/config.hpp"
#include "quarry/core/platform_utils.hpp"
#include "quarry/query/path_resolver.hpp"
#include "quarry/query/query_compiler.hpp"
#include "quarry/query/update_compiler.hpp"
#include "quarry/registry.hpp"
#include "storage/classify.hpp"

namespace quarry {

namespace {

auto storage_field(const schema& s, const std::string& name) -> std::expected<std::string, core::error> {
  auto rp = resolve_path(&s, detail::split(name, "__"), resolve_mode::query);
  if (!rp) return std::unexpected(rp.error());
  return rp->dotted();
}

} // namespace

query_set::query_set(storage::database& db, const schema& s) : db_(&db), schema_(&s) {
  batch_size_ = config().default_batch_size;
}

auto query_set::backend() const -> storage::collection_backend& { return db_->collection(schema_->collection()); }

auto query_set::concern(const std::optional<storage::write_concern>& wc) const -> storage::write_concern {
  return wc.value_or(config().default_write_concern);
}

auto query_set::filter(const keyword_args& filters) const -> std::expected<query_set, core::error> {
  std::vector<query_term> terms;
  terms.reserve(filters.size());
  for (const auto& [key, v] : filters) {
    auto t = parse_query_key(key, v);
    if (!t) return std::unexpected(t.error());
    terms.push_back(std::move(*t));
  }
  return filter_terms(std::move(terms));
}

auto query_set::filter_terms(std::vector<query_term> terms) const -> std::expected<query_set, core::error> {
  query_set next = *this;
  next.terms_.insert(next.terms_.end(), std::make_move_iterator(terms.begin()), std::make_move_iterator(terms.end()));
  auto compiled = compile_query(schema_, next.terms_);
  if (!compiled) return std::unexpected(compiled.error());
  next.compiled_ = std::move(*compiled);
  return next;
}

auto query_set::order_by(std::vector<std::string> keys) const -> query_set {
  query_set next = *this;
  next.order_ = std::move(keys);
  return next;
}

auto query_set::only(std::vector<std::string> fields) const -> query_set {
  query_set next = *this;
  next.only_ = std::move(fields);
  return next;
}

auto query_set::skip(std::size_t n) const -> query_set {
  query_set next = *this;
  next.skip_ = n;
  return next;
}

auto query_set::limit(std::size_t n) const -> query_set {
  query_set next = *this;
  next.limit_ = n == 0 ? std::nullopt : std::optional<std::size_t>(n);
  return next;
}

auto query_set::slice(std::size_t start, std::size_t stop) const -> query_set {
  query_set next = *this;
  std::size_t window = stop > start ? stop - start : 0;
  if (limit_) window = std::min(window, *limit_ > start ? *limit_ - start : 0);
  next.skip_ = skip_ + start;
  next.limit_ = window;
  next.empty_window_ = empty_window_ || window == 0;
  return next;
}

auto query_set::batch_size(std::size_t n) const -> query_set {
  query_set next = *this;
  next.batch_size_ = n;
  return next;
}

auto query_set::read_preference(std::string pref) const -> query_set {
  query_set next = *this;
  next.read_preference_ = std::move(pref);
  return next;
}

auto query_set::read_concern(wire_value concern) const -> query_set {
  query_set next = *this;
  next.read_concern_ = std::move(concern);
  return next;
}

auto query_set::hint(wire_value index) const -> query_set {
  query_set next = *this;
  next.hint_ = std::move(index);
  return next;
}

auto query_set::timeout(bool enabled) const -> query_set {
  query_set next = *this;
  next.no_cursor_timeout_ = !enabled;
  return next;
}

auto query_set::query() const -> std::expected<query_doc, core::error> {
  if (empty_window_) return wire_value{{"_id", wire_value{{"$in", wire_value::array()}}}};
  query_doc q = compiled_;
  if (schema_->parent() != nullptr) {
    wire_value family = wire_value::array();
    for (const auto& cls : registry::instance().family(*schema_)) family.push_back(cls);
    q["_cls"] = wire_value{{"$in", std::move(family)}};
  }
  return q;
}

auto query_set::options() const -> std::expected<storage::find_options, core::error> {
  storage::find_options opts;
  opts.skip = skip_;
  opts.limit = limit_.value_or(0);
  opts.batch_size = batch_size_;
  opts.read_preference = read_preference_;
  opts.read_concern = read_concern_;
  opts.hint = hint_;
  opts.no_cursor_timeout = no_cursor_timeout_;
  if (!order_.empty()) {
    opts.sort = wire_value::object();
    for (const auto& key : order_) {
      int direction = 1;
      std::string name = key;
      if (!name.empty() && (name[0] == '-' || name[0] == '+')) {
        direction = name[0] == '-' ? -1 : 1;
        name.erase(0, 1);
      }
      auto path = storage_field(*schema_, name);
      if (!path) return std::unexpected(path.error());
      opts.sort[*path] = direction;
    }
  }
  if (!only_.empty()) {
    opts.projection = wire_value::object();
    for (const auto& name : only_) {
      auto path = storage_field(*schema_, name);
      if (!path) return std::unexpected(path.error());
      opts.projection[*path] = 1;
    }
    if (schema_->allow_inheritance()) opts.projection["_cls"] = 1;
  }
  return opts;
}

auto query_set::cursor() const -> document_cursor {
  auto opts = options();
  if (!opts) return document_cursor(*db_, *schema_, std::unexpected(opts.error()), {});
  return document_cursor(*db_, *schema_, query(), std::move(*opts));
}

auto query_set::all() const -> std::expected<std::vector<document>, core::error> {
  std::vector<document> out;
  auto c = cursor();
  while (true) {
    auto next = c.next();
    if (!next) return std::unexpected(next.error());
    if (!*next) break;
    out.push_back(std::move(**next));
  }
  return out;
}

auto query_set::first() const -> std::expected<std::optional<document>, core::error> {
  auto c = limit(1).cursor();
  return c.next();
}

auto query_set::get(const keyword_args& filters) const -> std::expected<document, core::error> {
  auto qs = filter(filters);
  if (!qs) return std::unexpected(qs.error());
  auto found = qs->limit(2).all();
  if (!found) return std::unexpected(found.error());
  if (found->empty()) {
    return core::fail(core::error_code::does_not_exist, schema_->class_name() + " matching query does not exist.",
                      "query_set.get");
  }
  if (found->size() > 1) {
    return core::fail(core::error_code::multiple_objects, "2 or more items returned, instead of 1",
                      "query_set.get");
  }
  return std::move(found->front());
}

auto query_set::count(bool with_limit_and_skip) const -> std::expected<std::size_t, core::error> {
  auto q = query();
  if (!q) return std::unexpected(q.error());
  storage::find_options opts;
  opts.projection = wire_value{{"_id", 1}};
  if (with_limit_and_skip) {
    opts.skip = skip_;
    opts.limit = limit_.value_or(0);
  }
  auto found = backend().find(*q, opts);
  if (!found) return std::unexpected(found.error());
  return found->size();
}

auto query_set::run_update(const keyword_args& updates, const storage::write_concern& wc, bool upsert,
                           bool multi) const -> std::expected<storage::update_result, core::error> {
  if (updates.empty()) {
    return core::fail(core::error_code::operation_failed, "No update parameters, would remove data",
                      "query_set.update");
  }
  auto doc = compile_update(schema_, updates);
  if (!doc) return std::unexpected(doc.error());
  auto q = query();
  if (!q) return std::unexpected(q.error());
  if (core::debug_enabled()) {
    std::cerr << "[QUARRY][query_set] update " << schema_->collection() << " " << q->dump() << " "
              << doc->dump() << (multi ? " multi" : "") << (upsert ? " upsert" : "") << "\n";
  }
  auto r = backend().update(*q, *doc, wc, upsert, multi);
  if (!r) return std::unexpected(storage::classify(r.error(), storage::write_kind::update));
  return *r;
}

auto query_set::update(const keyword_args& updates, std::optional<storage::write_concern> wc, bool upsert) const
    -> std::expected<storage::update_result, core::error> {
  return run_update(updates, concern(wc), upsert, /*multi=*/true);
}

auto query_set::update_one(const keyword_args& updates, std::optional<storage::write_concern> wc,
                           bool upsert) const -> std::expected<storage::update_result, core::error> {
  return run_update(updates, concern(wc), upsert, /*multi=*/false);
}

auto query_set::upsert_one(const keyword_args& updates, std::optional<storage::write_concern> wc) const
    -> std::expected<document, core::error> {
  auto r = run_update(updates, concern(wc), /*upsert=*/true, /*multi=*/false);
  if (!r) return std::unexpected(r.error());
  auto doc = first();
  if (!doc) return std::unexpected(doc.error());
  if (!*doc) {
    return core::fail(core::error_code::does_not_exist, "Upserted " + schema_->class_name() + " not found",
                      "query_set.upsert_one");
  }
  return std::move(**doc);
}

auto query_set::insert(std::vector<document>& docs, std::optional<storage::write_concern> wc) const
    -> std::expected<void, core::error> {
  std::vector<wire_value> raw;
  raw.reserve(docs.size());
  for (const auto& d : docs) {
    if (d.state() != document_state::fresh) {
      return core::fail(core::error_code::operation_failed,
                        "Some documents have ObjectIds, use doc.update() instead", "query_set.insert");
    }
    raw.push_back(d.to_storage());
  }
  if (raw.empty()) return {};
  auto ids = backend().insert(std::move(raw), concern(wc));
  if (!ids) return std::unexpected(storage::classify(ids.error(), storage::write_kind::save));
  for (std::size_t i = 0; i < docs.size() && i < ids->size(); ++i) {
    docs[i].assign_id((*ids)[i]);
    docs[i].mark_persisted();
  }
  return {};
}

auto query_set::remove(std::optional<storage::write_concern> wc) const
    -> std::expected<storage::update_result, core::error> {
  const auto write = concern(wc);
  std::set<std::pair<std::string, std::string>> visited;
  std::vector<removal_step> plan;
  if (auto r = plan_removal(visited, plan); !r) return std::unexpected(r.error());
  if (plan.empty()) {
    if (!write.acknowledged()) return std::nullopt;
    return storage::update_result(0);
  }

  // Every DENY rule over the whole closure is checked before anything is written.
  for (const auto& step : plan) {
    for (const auto& r : registry::instance().delete_rules_for(*step.target)) {
      if (r.rule != delete_rule::deny) continue;
      auto refs = query_set(*db_, *r.owner).filter({{r.ref_field->name() + "__in", step.ids}});
      if (!refs) return std::unexpected(refs.error());
      auto n = refs->count();
      if (!n) return std::unexpected(n.error());
      if (*n > 0) {
        return core::fail(core::error_code::operation_failed,
                          "Could not delete document (" + r.owner->class_name() + "." + r.ref_field->name() +
                              " refers to it)",
                          "query_set.remove");
      }
    }
  }

  // Deepest level first; the first step is this query set's own matches.
  storage::update_result removed;
  for (auto it = plan.rbegin(); it != plan.rend(); ++it) {
    const auto rules = registry::instance().delete_rules_for(*it->target);
    for (const auto& r : rules) {
      if (r.rule != delete_rule::nullify && r.rule != delete_rule::pull) continue;
      const auto& name = r.ref_field->name();
      auto refs = query_set(*db_, *r.owner).filter({{name + "__in", it->ids}});
      if (!refs) return std::unexpected(refs.error());
      auto applied = r.rule == delete_rule::nullify ? refs->update({{"unset__" + name, 1}}, write)
                                                    : refs->update({{"pull_all__" + name, it->ids}}, write);
      if (!applied) return std::unexpected(applied.error());
    }
    if (core::debug_enabled()) {
      std::cerr << "[QUARRY][query_set] remove " << it->target->collection() << " " << it->ids.dump()
                << " rules=" << rules.size() << "\n";
    }
    auto& coll = db_->collection(it->target->collection());
    auto r = coll.remove(wire_value{{"_id", wire_value{{"$in", it->ids}}}}, write);
    if (!r) return std::unexpected(storage::classify(r.error(), storage::write_kind::remove));
    removed = *r;
  }
  return removed;
}

auto query_set::plan_removal(std::set<std::pair<std::string, std::string>>& visited,
                             std::vector<removal_step>& plan) const -> std::expected<void, core::error> {
  auto q = query();
  if (!q) return std::unexpected(q.error());
  storage::find_options opts;
  opts.projection = wire_value{{"_id", 1}};
  opts.skip = skip_;
  opts.limit = limit_.value_or(0);
  auto found = backend().find(*q, opts);
  if (!found) return std::unexpected(found.error());

  // Each document is visited once per operation, even in self-referencing trees.
  wire_value ids = wire_value::array();
  for (const auto& doc : *found) {
    if (!doc.contains("_id")) continue;
    if (visited.emplace(schema_->collection(), doc["_id"].dump()).second) ids.push_back(doc["_id"]);
  }
  if (ids.empty()) return {};
  plan.push_back({schema_, ids});

  for (const auto& r : registry::instance().delete_rules_for(*schema_)) {
    if (r.rule != delete_rule::cascade) continue;
    auto refs = query_set(*db_, *r.owner).filter({{r.ref_field->name() + "__in", ids}});
    if (!refs) return std::unexpected(refs.error());
    if (auto sub = refs->plan_removal(visited, plan); !sub) return sub;
  }
  return {};
}

auto query_set::ensure_indexes() const -> std::expected<void, core::error> {
  for (const auto& f : schema_->fields()) {
    storage::index_options opts;
    wire_value keys = wire_value::object();
    if (f->unique() && !f->primary_key()) {
      keys[f->db_field()] = 1;
      opts.unique = true;
    } else if (f->geo() == geo_index::flat_2d) {
      keys[f->db_field()] = "2d";
    } else if (f->geo() == geo_index::sphere_2d) {
      keys[f->db_field()] = "2dsphere";
    } else {
      continue;
    }
    auto r = backend().ensure_index(keys, opts);
    if (!r) return std::unexpected(r.error());
  }
  return {};
}

auto query_set::drop_collection() const -> std::expected<void, core::error> { return backend().drop(); }

} // namespace quarry
