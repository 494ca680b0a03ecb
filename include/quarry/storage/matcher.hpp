#pragma once

/** \file matcher.hpp
 *  \brief In-memory evaluation of query documents and update documents.
 *
 * Covers the operator subset the compilers emit: equality with array
 * containment and dotted paths, $and/$or/$nor, $eq/$ne/$gt/$gte/$lt/$lte,
 * $in/$nin/$all/$size/$exists/$not/$regex/$options/$elemMatch/$mod. Geo
 * operators are reported as unsupported.
 */

#include <expected>
#include <string_view>

#include "quarry/error.hpp"
#include "quarry/wire.hpp"

namespace quarry::storage {

/** \brief True when `doc` satisfies `query`. */
auto matches(const query_doc& query, const wire_value& doc) -> std::expected<bool, core::error>;

/** \brief Type-ordered comparison used by sorts: <0, 0, >0. */
auto compare_values(const wire_value& a, const wire_value& b) -> int;

/** \brief Value at a dotted path without array expansion; nullptr when absent. */
auto value_at(const wire_value& doc, std::string_view path) -> const wire_value*;

/**
 * \brief Apply an update document in place.
 * \param filter query that selected `doc`; resolves the positional '$'
 * \param inserting true for the document created by an upsert ($setOnInsert applies)
 */
auto apply_update(wire_value& doc, const update_doc& update, const query_doc& filter, bool inserting)
    -> std::expected<void, core::error>;

} // namespace quarry::storage
