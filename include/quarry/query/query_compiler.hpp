#pragma once

/** \file query_compiler.hpp
 *  \brief Filter terms -> nested query document.
 *
 * Terms are processed in sort_key() order so that output is deterministic.
 * Several operators on one storage key merge into one operator document;
 * a bare equality and an operator on the same key cannot, and are combined
 * under a top-level "$and" instead. Errors are reported before anything is
 * sent to storage.
 */

#include <expected>
#include <vector>

#include "quarry/error.hpp"
#include "quarry/expr.hpp"
#include "quarry/schema.hpp"
#include "quarry/wire.hpp"

namespace quarry {

/** \brief Compile typed terms. `s` may be null (schema-less: names pass through, no coercion). */
auto compile_query(const schema* s, std::vector<query_term> terms) -> std::expected<query_doc, core::error>;

/** \brief Compile `field__op=value` keyword pairs. */
auto compile_query(const schema* s, const keyword_args& filters) -> std::expected<query_doc, core::error>;

/**
 * \brief Infer a "$geometry" document from GeoJSON or nested coordinates.
 *
 * Three levels of nesting is a Polygon, two a LineString, one a Point. A
 * document must already carry "$geometry" or both "type" and "coordinates".
 */
auto infer_geometry(const wire_value& v) -> std::expected<wire_value, core::error>;

} // namespace quarry
