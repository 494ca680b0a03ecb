#include "quarry/queryset/cursor.hpp"

#include <iostream>
#include <utility>

#include "quarry/core/platform_utils.hpp"

namespace quarry {

document_cursor::document_cursor(storage::database& db, const schema& s,
                                 std::expected<query_doc, core::error> query, storage::find_options opts)
    : db_(&db), schema_(&s), query_(std::move(query)), opts_(std::move(opts)) {}

auto document_cursor::next() -> std::expected<std::optional<document>, core::error> {
  if (ended_) {
    return core::fail(core::error_code::cursor_exhausted,
                      "Cursor has been fully consumed; re-derive it from the query set to iterate again",
                      "query_set.cursor");
  }
  if (!query_) return std::unexpected(query_.error());
  if (!rows_) {
    auto found = db_->collection(schema_->collection()).find(*query_, opts_);
    if (!found) return std::unexpected(found.error());
    rows_ = std::move(*found);
    if (core::debug_enabled()) {
      std::cerr << "[QUARRY][cursor] " << schema_->collection() << " " << query_->dump() << " -> "
                << rows_->size() << " rows\n";
    }
  }
  if (pos_ >= rows_->size()) {
    ended_ = true;
    return std::optional<document>{};
  }
  auto doc = document::from_storage(*schema_, (*rows_)[pos_++]);
  if (!doc) return std::unexpected(doc.error());
  return std::optional<document>{std::move(*doc)};
}

} // namespace quarry
