#pragma once

/** \file memory_backend.hpp
 *  \brief In-process storage backend: the collaborator used by tests and tools.
 *
 * Documents are kept in insertion order. Identifiers are generated 24-hex
 * strings. Unique indexes report duplicate-key failures with the server's
 * "E11000 duplicate key error" wording so that callers classify them the same
 * way. Not synchronized.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/storage/backend.hpp"

namespace quarry::storage {

class memory_collection final : public collection_backend {
public:
  explicit memory_collection(std::string name);

  auto find(const query_doc& query, const find_options& opts)
      -> std::expected<std::vector<wire_value>, core::error> override;
  auto insert(std::vector<wire_value> docs, const write_concern& wc)
      -> std::expected<std::vector<wire_value>, core::error> override;
  auto update(const query_doc& filter, const update_doc& update, const write_concern& wc, bool upsert,
              bool multi) -> std::expected<update_result, core::error> override;
  auto remove(const query_doc& filter, const write_concern& wc)
      -> std::expected<update_result, core::error> override;
  auto ensure_index(const wire_value& keys, const index_options& opts)
      -> std::expected<std::string, core::error> override;
  auto drop() -> std::expected<void, core::error> override;

  auto name() const -> const std::string& { return name_; }
  auto size() const noexcept -> std::size_t { return docs_.size(); }
  /** \brief Index names, "_id_" first. */
  auto index_names() const -> std::vector<std::string>;
  /** \brief The find options seen by the most recent find(); lets callers verify pass-through. */
  auto last_find_options() const -> const find_options& { return last_opts_; }

private:
  struct index_spec {
    std::string name;
    wire_value keys;
    bool unique{false};
    bool sparse{false};
  };

  auto check_unique(const wire_value& doc, std::size_t skip) const -> std::expected<void, core::error>;
  auto check_hint(const wire_value& hint) const -> std::expected<void, core::error>;

  std::string name_;
  std::vector<wire_value> docs_;
  std::vector<index_spec> indexes_;
  find_options last_opts_;
};

class memory_database final : public database {
public:
  auto collection(std::string_view name) -> collection_backend& override;
  /** \brief Typed access for inspection; creates the collection if needed. */
  auto memory(std::string_view name) -> memory_collection&;

private:
  std::map<std::string, std::unique_ptr<memory_collection>, std::less<>> collections_;
};

/** \brief New 24-hex identifier, unique within the process. */
auto generate_object_id() -> std::string;

} // namespace quarry::storage
