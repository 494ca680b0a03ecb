#pragma once

/** \file query_set.hpp
 *  \brief Immutable query builder bound to a schema and a database.
 *
 * Builder calls return a new query_set. filter() compiles eagerly, so an
 * invalid key fails before any storage call; chained filters are compiled
 * together and therefore merge on shared keys. Execution methods classify
 * storage failures (duplicate key -> not_unique, anything else ->
 * operation_failed).
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "quarry/document/document.hpp"
#include "quarry/error.hpp"
#include "quarry/expr.hpp"
#include "quarry/queryset/cursor.hpp"
#include "quarry/schema.hpp"
#include "quarry/storage/backend.hpp"
#include "quarry/storage/options.hpp"
#include "quarry/wire.hpp"

namespace quarry {

class query_set {
public:
  query_set(storage::database& db, const schema& s);

  auto filter(const keyword_args& filters) const -> std::expected<query_set, core::error>;
  auto filter_terms(std::vector<query_term> terms) const -> std::expected<query_set, core::error>;

  /** \brief Sort keys by logical name; a leading '-' sorts descending. */
  auto order_by(std::vector<std::string> keys) const -> query_set;
  /** \brief Restrict loaded fields (logical names); the id is always loaded. */
  auto only(std::vector<std::string> fields) const -> query_set;
  auto skip(std::size_t n) const -> query_set;
  auto limit(std::size_t n) const -> query_set;
  /** \brief Half-open [start, stop) window on top of the current skip. */
  auto slice(std::size_t start, std::size_t stop) const -> query_set;
  auto batch_size(std::size_t n) const -> query_set;
  auto read_preference(std::string pref) const -> query_set;
  auto read_concern(wire_value concern) const -> query_set;
  auto hint(wire_value index) const -> query_set;
  /** \brief `false` asks the server to keep the cursor open indefinitely. */
  auto timeout(bool enabled) const -> query_set;

  /** \brief Compiled filter, including the "_cls" restriction for subclasses. */
  auto query() const -> std::expected<query_doc, core::error>;
  auto options() const -> std::expected<storage::find_options, core::error>;

  auto cursor() const -> document_cursor;
  auto all() const -> std::expected<std::vector<document>, core::error>;
  auto first() const -> std::expected<std::optional<document>, core::error>;
  /** \brief Exactly one match: does_not_exist / multiple_objects otherwise. */
  auto get(const keyword_args& filters = {}) const -> std::expected<document, core::error>;
  auto count(bool with_limit_and_skip = false) const -> std::expected<std::size_t, core::error>;

  auto update(const keyword_args& updates, std::optional<storage::write_concern> wc = std::nullopt,
              bool upsert = false) const -> std::expected<storage::update_result, core::error>;
  auto update_one(const keyword_args& updates, std::optional<storage::write_concern> wc = std::nullopt,
                  bool upsert = false) const -> std::expected<storage::update_result, core::error>;
  /** \brief Update the first match or insert one built from the filter; returns the stored document. */
  auto upsert_one(const keyword_args& updates, std::optional<storage::write_concern> wc = std::nullopt) const
      -> std::expected<document, core::error>;

  /** \brief Bulk insert fresh documents; their ids are assigned and they become clean. */
  auto insert(std::vector<document>& docs, std::optional<storage::write_concern> wc = std::nullopt) const
      -> std::expected<void, core::error>;
  /** \brief Delete every match after applying the delete rules declared against this class. */
  auto remove(std::optional<storage::write_concern> wc = std::nullopt) const
      -> std::expected<storage::update_result, core::error>;

  /** \brief Create unique indexes for fields declared unique. */
  auto ensure_indexes() const -> std::expected<void, core::error>;
  auto drop_collection() const -> std::expected<void, core::error>;

private:
  auto backend() const -> storage::collection_backend&;
  auto concern(const std::optional<storage::write_concern>& wc) const -> storage::write_concern;
  auto run_update(const keyword_args& updates, const storage::write_concern& wc, bool upsert, bool multi) const
      -> std::expected<storage::update_result, core::error>;
  /** \brief One level of a removal: identifiers of `target` documents matched for deletion. */
  struct removal_step {
    const schema* target;
    wire_value ids;
  };
  /** \brief Append this query set's matches and their CASCADE closure to `plan` without writing. */
  auto plan_removal(std::set<std::pair<std::string, std::string>>& visited, std::vector<removal_step>& plan) const
      -> std::expected<void, core::error>;

  storage::database* db_;
  const schema* schema_;
  std::vector<query_term> terms_;
  query_doc compiled_ = wire_value::object();
  std::vector<std::string> order_;
  std::vector<std::string> only_;
  std::size_t skip_{0};
  std::optional<std::size_t> limit_;
  std::size_t batch_size_{0};
  std::string read_preference_;
  wire_value read_concern_;
  wire_value hint_;
  bool no_cursor_timeout_{false};
  bool empty_window_{false};  /**< slice() selected nothing */
};

} // namespace quarry
