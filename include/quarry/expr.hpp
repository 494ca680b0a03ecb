#pragma once

/** \file expr.hpp
 *  \brief Typed expression model for filters and updates.
 *
 * The compilers work on query_term/update_term values. The `field__op=value`
 * keyword form is only a front-end: parse_query_key()/parse_update_key() turn a
 * key into a term, and sort_key() turns a term back into the key it stands for.
 * Ownership: terms are value-semantic and self-contained.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/error.hpp"
#include "quarry/wire.hpp"

namespace quarry {

/** \brief Match operators accepted after a field path. */
enum class query_op : std::uint8_t {
  // comparison
  ne, gt, gte, lt, lte, in, nin, mod, all, size, exists, not_,
  // geo
  within_distance, within_spherical_distance, within_box, within_polygon,
  near, near_sphere, max_distance, geo_within, geo_within_box,
  geo_within_polygon, geo_within_center, geo_within_sphere, geo_intersects,
  // string shortcuts
  contains, icontains, startswith, istartswith, endswith, iendswith, exact, iexact,
  // custom
  match,
};

enum class op_class : std::uint8_t { comparison, geo, string, custom };

/** \brief Leading update operators; dec/pull_all/add_to_set/set_on_insert are aliases. */
enum class update_op : std::uint8_t {
  set, unset, inc, dec, pop, push, pull, pull_all, add_to_set, set_on_insert,
};

auto parse_query_op(std::string_view token) -> std::optional<query_op>;
auto op_token(query_op op) -> std::string_view;
auto classify(query_op op) -> op_class;
auto is_comparison(std::string_view token) -> bool;

auto parse_update_op(std::string_view token) -> std::optional<update_op>;
auto op_token(update_op op) -> std::string_view;
/** \brief Native operator name without the '$' (pull_all -> pullAll, dec -> inc). */
auto canonical_name(update_op op) -> std::string_view;

/** \brief One filter constraint: path, optional operator, negation, raw value. */
struct query_term {
  std::vector<std::string> path;  /**< logical segments; numeric ones index arrays */
  std::optional<query_op> op;     /**< empty = bare equality */
  bool negate{false};
  wire_value value;
  bool raw{false};                /**< value is merged verbatim into the result */

  static auto raw_document(wire_value doc) -> query_term;
  /** \brief The `a__b__not__op` key this term stands for; "__raw__" for raw terms. */
  auto sort_key() const -> std::string;
};

/** \brief One update clause: operator, path, optional match operator, value. */
struct update_term {
  std::optional<update_op> op;     /**< empty only when the caller forgot it */
  std::vector<std::string> path;   /**< "S" segments become the positional '$' */
  std::optional<std::string> match;/**< trailing comparison token, e.g. "lt" */
  wire_value value;
  bool raw{false};

  static auto raw_document(wire_value doc) -> update_term;
};

/** \brief Split a `field__sub__op` key into a query term. */
auto parse_query_key(std::string_view key, wire_value value)
    -> std::expected<query_term, core::error>;

/** \brief Split an `op__field__sub` key into an update term. */
auto parse_update_key(std::string_view key, wire_value value)
    -> std::expected<update_term, core::error>;

} // namespace quarry
