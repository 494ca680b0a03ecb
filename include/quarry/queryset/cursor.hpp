#pragma once

/** \file cursor.hpp
 *  \brief Lazy, single-pass iteration over query results.
 *
 * Nothing is fetched until the first next(). The end is reported once as
 * std::nullopt; calling next() again fails with cursor_exhausted rather than
 * silently re-running the query. Re-derive a fresh cursor from the query set
 * to iterate again.
 */

#include <cstddef>
#include <expected>
#include <optional>
#include <vector>

#include "quarry/document/document.hpp"
#include "quarry/error.hpp"
#include "quarry/storage/backend.hpp"
#include "quarry/wire.hpp"

namespace quarry {

class document_cursor {
public:
  document_cursor(storage::database& db, const schema& s, std::expected<query_doc, core::error> query,
                  storage::find_options opts);

  auto next() -> std::expected<std::optional<document>, core::error>;
  /** \brief True once at least one batch has been fetched. */
  auto materialized() const noexcept -> bool { return rows_.has_value(); }

private:
  storage::database* db_;
  const schema* schema_;
  std::expected<query_doc, core::error> query_;
  storage::find_options opts_;
  std::optional<std::vector<wire_value>> rows_;
  std::size_t pos_{0};
  bool ended_{false};
};

} // namespace quarry
