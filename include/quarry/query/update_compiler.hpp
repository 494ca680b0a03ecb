#pragma once

/** \file update_compiler.hpp
 *  \brief Update terms -> update document keyed by "$" + canonical operator.
 *
 * Terms keep the caller's order. dec becomes a negative inc, pull on a nested
 * path becomes the nested-document form, addToSet with a list becomes
 * {"$each": list}, and the "S" path segment becomes the positional '$'.
 */

#include <expected>
#include <vector>

#include "quarry/error.hpp"
#include "quarry/expr.hpp"
#include "quarry/schema.hpp"
#include "quarry/wire.hpp"

namespace quarry {

auto compile_update(const schema* s, const std::vector<update_term>& terms)
    -> std::expected<update_doc, core::error>;

/** \brief Compile `op__field=value` keyword pairs. */
auto compile_update(const schema* s, const keyword_args& updates) -> std::expected<update_doc, core::error>;

} // namespace quarry
