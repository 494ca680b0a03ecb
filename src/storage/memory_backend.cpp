#include "quarry/storage/memory_backend.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "quarry/core/platform_utils.hpp"
#include "quarry/storage/matcher.hpp"

namespace quarry::storage {

namespace {

auto storage_error(std::string message) -> std::unexpected<core::error> {
  return core::fail(core::error_code::operation_failed, std::move(message), "storage.memory");
}

auto index_name_for(const wire_value& keys) -> std::string {
  std::string out;
  for (auto it = keys.begin(); it != keys.end(); ++it) {
    if (!out.empty()) out += '_';
    out += it.key() + "_" + (it.value().is_string() ? it.value().get<std::string>() : it.value().dump());
  }
  return out;
}

// Key tuple of `doc` for an index; absent fields are null.
auto index_key(const wire_value& doc, const wire_value& keys, bool& all_missing) -> wire_value {
  wire_value out = wire_value::array();
  all_missing = true;
  for (auto it = keys.begin(); it != keys.end(); ++it) {
    const auto* v = value_at(doc, it.key());
    if (v != nullptr) all_missing = false;
    out.push_back(v ? *v : wire_value(nullptr));
  }
  return out;
}

// Projection: {a: 1, ...} keeps a (and _id unless excluded), {a: 0} drops a.
auto project(const wire_value& doc, const wire_value& projection) -> wire_value {
  if (!projection.is_object() || projection.empty()) return doc;
  bool inclusive = false;
  for (auto it = projection.begin(); it != projection.end(); ++it) {
    if (it.key() != "_id" && it.value().is_number() && it.value().get<double>() != 0.0) inclusive = true;
  }
  const bool keep_id = !(projection.contains("_id") && projection["_id"].is_number() &&
                         projection["_id"].get<double>() == 0.0);
  wire_value out = wire_value::object();
  if (inclusive) {
    if (keep_id && doc.contains("_id")) out["_id"] = doc["_id"];
    for (auto it = projection.begin(); it != projection.end(); ++it) {
      if (it.key() == "_id") continue;
      const auto top = it.key().substr(0, it.key().find('.'));
      if (doc.contains(top)) out[top] = doc[top];
    }
    return out;
  }
  out = doc;
  for (auto it = projection.begin(); it != projection.end(); ++it) {
    if (it.key() == "_id" && keep_id) continue;
    out.erase(it.key());
  }
  return out;
}

} // namespace

auto generate_object_id() -> std::string {
  static std::atomic<std::uint64_t> counter{0};
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();
  std::ostringstream os;
  os << std::hex << std::setfill('0') << std::setw(8) << static_cast<std::uint32_t>(seconds) << std::setw(16)
     << counter.fetch_add(1, std::memory_order_relaxed);
  return os.str();
}

memory_collection::memory_collection(std::string name) : name_(std::move(name)) {
  indexes_.push_back({"_id_", wire_value{{"_id", 1}}, true, false});
}

auto memory_collection::index_names() const -> std::vector<std::string> {
  std::vector<std::string> out;
  out.reserve(indexes_.size());
  for (const auto& ix : indexes_) out.push_back(ix.name);
  return out;
}

auto memory_collection::check_unique(const wire_value& doc, std::size_t skip) const
    -> std::expected<void, core::error> {
  for (const auto& ix : indexes_) {
    if (!ix.unique) continue;
    bool missing = false;
    const auto key = index_key(doc, ix.keys, missing);
    if (missing && ix.sparse) continue;
    for (std::size_t i = 0; i < docs_.size(); ++i) {
      if (i == skip) continue;
      bool other_missing = false;
      if (index_key(docs_[i], ix.keys, other_missing) == key && !(other_missing && ix.sparse)) {
        wire_value dup = wire_value::object();
        std::size_t k = 0;
        for (auto it = ix.keys.begin(); it != ix.keys.end(); ++it, ++k) dup[it.key()] = key[k];
        return storage_error("E11000 duplicate key error collection: " + name_ + " index: " + ix.name +
                             " dup key: " + dup.dump());
      }
    }
  }
  return {};
}

auto memory_collection::check_hint(const wire_value& hint) const -> std::expected<void, core::error> {
  if (hint.is_null()) return {};
  for (const auto& ix : indexes_) {
    if ((hint.is_string() && hint.get<std::string>() == ix.name) || (hint.is_object() && hint == ix.keys)) {
      return {};
    }
  }
  return storage_error("error processing query: hint provided does not correspond to an existing index");
}

auto memory_collection::find(const query_doc& query, const find_options& opts)
    -> std::expected<std::vector<wire_value>, core::error> {
  last_opts_ = opts;
  if (auto h = check_hint(opts.hint); !h) return std::unexpected(h.error());

  std::vector<const wire_value*> hits;
  for (const auto& doc : docs_) {
    auto m = matches(query, doc);
    if (!m) return std::unexpected(m.error());
    if (*m) hits.push_back(&doc);
  }
  if (opts.sort.is_object() && !opts.sort.empty()) {
    std::stable_sort(hits.begin(), hits.end(), [&](const wire_value* a, const wire_value* b) {
      for (auto it = opts.sort.begin(); it != opts.sort.end(); ++it) {
        const auto* va = value_at(*a, it.key());
        const auto* vb = value_at(*b, it.key());
        const wire_value null_value = nullptr;
        int c = compare_values(va ? *va : null_value, vb ? *vb : null_value);
        if (it.value().is_number() && it.value().get<double>() < 0) c = -c;
        if (c != 0) return c < 0;
      }
      return false;
    });
  }
  std::vector<wire_value> out;
  for (std::size_t i = opts.skip; i < hits.size(); ++i) {
    if (opts.limit != 0 && out.size() >= opts.limit) break;
    out.push_back(project(*hits[i], opts.projection));
  }
  return out;
}

auto memory_collection::insert(std::vector<wire_value> docs, const write_concern& /*wc*/)
    -> std::expected<std::vector<wire_value>, core::error> {
  std::vector<wire_value> ids;
  ids.reserve(docs.size());
  for (auto& doc : docs) {
    if (!doc.is_object()) return storage_error("Document to insert must be an object");
    if (!doc.contains("_id")) {
      wire_value with_id = wire_value::object();
      with_id["_id"] = generate_object_id();
      for (auto it = doc.begin(); it != doc.end(); ++it) with_id[it.key()] = it.value();
      doc = std::move(with_id);
    }
    if (auto u = check_unique(doc, docs_.size()); !u) return std::unexpected(u.error());
    ids.push_back(doc["_id"]);
    docs_.push_back(std::move(doc));
  }
  if (core::debug_enabled()) std::cerr << "[QUARRY][memory] insert " << name_ << " n=" << ids.size() << "\n";
  return ids;
}

auto memory_collection::update(const query_doc& filter, const update_doc& update, const write_concern& wc,
                               bool upsert, bool multi) -> std::expected<update_result, core::error> {
  std::uint64_t matched = 0;
  for (std::size_t i = 0; i < docs_.size(); ++i) {
    auto m = matches(filter, docs_[i]);
    if (!m) return std::unexpected(m.error());
    if (!*m) continue;
    wire_value next = docs_[i];
    if (auto r = apply_update(next, update, filter, false); !r) return std::unexpected(r.error());
    if (auto u = check_unique(next, i); !u) return std::unexpected(u.error());
    docs_[i] = std::move(next);
    ++matched;
    if (!multi) break;
  }
  if (matched == 0 && upsert) {
    // Seed the new document with the filter's plain equality terms.
    wire_value seed = wire_value::object();
    if (filter.is_object()) {
      for (auto it = filter.begin(); it != filter.end(); ++it) {
        if (it.key().rfind('$', 0) == 0) continue;
        const auto& v = it.value();
        if (v.is_object() && !v.empty() && v.begin().key().rfind('$', 0) == 0) continue;
        wire_value set_one = wire_value::object();
        set_one["$setOnInsert"] = wire_value{{it.key(), v}};
        if (auto r = apply_update(seed, set_one, wire_value::object(), true); !r) return std::unexpected(r.error());
      }
    }
    if (auto r = apply_update(seed, update, filter, true); !r) return std::unexpected(r.error());
    std::vector<wire_value> one;
    one.push_back(std::move(seed));
    auto ids = insert(std::move(one), wc);
    if (!ids) return std::unexpected(ids.error());
  }
  if (!wc.acknowledged()) return std::nullopt;
  return matched;
}

auto memory_collection::remove(const query_doc& filter, const write_concern& wc)
    -> std::expected<update_result, core::error> {
  std::vector<wire_value> kept;
  kept.reserve(docs_.size());
  std::uint64_t removed = 0;
  for (auto& doc : docs_) {
    auto m = matches(filter, doc);
    if (!m) return std::unexpected(m.error());
    if (*m) {
      ++removed;
    } else {
      kept.push_back(std::move(doc));
    }
  }
  docs_ = std::move(kept);
  if (!wc.acknowledged()) return std::nullopt;
  return removed;
}

auto memory_collection::ensure_index(const wire_value& keys, const index_options& opts)
    -> std::expected<std::string, core::error> {
  if (!keys.is_object() || keys.empty()) return storage_error("Index keys must be a non-empty document");
  const auto name = opts.name.empty() ? index_name_for(keys) : opts.name;
  for (const auto& ix : indexes_) {
    if (ix.name == name || ix.keys == keys) return ix.name;
  }
  indexes_.push_back({name, keys, opts.unique, opts.sparse});
  for (std::size_t i = 0; i < docs_.size(); ++i) {
    if (auto u = check_unique(docs_[i], i); !u) {
      indexes_.pop_back();
      return std::unexpected(u.error());
    }
  }
  return name;
}

auto memory_collection::drop() -> std::expected<void, core::error> {
  docs_.clear();
  indexes_.erase(indexes_.begin() + 1, indexes_.end());
  return {};
}

auto memory_database::collection(std::string_view name) -> collection_backend& { return memory(name); }

auto memory_database::memory(std::string_view name) -> memory_collection& {
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    it = collections_.emplace(std::string(name), std::make_unique<memory_collection>(std::string(name))).first;
  }
  return *it->second;
}

} // namespace quarry::storage
