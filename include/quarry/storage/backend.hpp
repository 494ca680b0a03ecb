#pragma once

/** \file backend.hpp
 *  \brief Storage collaborator consumed by query sets and documents.
 *
 * Every call is synchronous; failures come back as core::error with the
 * driver-supplied message and code operation_failed. Callers classify them
 * (duplicate key vs. generic) at their own boundary. Implementations do not
 * retry.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/error.hpp"
#include "quarry/storage/options.hpp"
#include "quarry/wire.hpp"

namespace quarry::storage {

class collection_backend {
public:
  virtual ~collection_backend() = default;

  /** \brief Raw documents matching `query`, shaped by `opts`. */
  virtual auto find(const query_doc& query, const find_options& opts)
      -> std::expected<std::vector<wire_value>, core::error> = 0;

  /** \brief Insert documents in order; returns their identifiers. Stops at the first failure. */
  virtual auto insert(std::vector<wire_value> docs, const write_concern& wc)
      -> std::expected<std::vector<wire_value>, core::error> = 0;

  /** \brief Apply `update` to the first (or every, when `multi`) match. */
  virtual auto update(const query_doc& filter, const update_doc& update, const write_concern& wc,
                      bool upsert, bool multi) -> std::expected<update_result, core::error> = 0;

  /** \brief Delete every match; returns the deleted count. */
  virtual auto remove(const query_doc& filter, const write_concern& wc)
      -> std::expected<update_result, core::error> = 0;

  /** \brief Create the index if missing; returns its name. */
  virtual auto ensure_index(const wire_value& keys, const index_options& opts)
      -> std::expected<std::string, core::error> = 0;

  virtual auto drop() -> std::expected<void, core::error> = 0;
};

/** \brief Named collections; the returned reference stays valid for the database's lifetime. */
class database {
public:
  virtual ~database() = default;
  virtual auto collection(std::string_view name) -> collection_backend& = 0;
};

} // namespace quarry::storage
