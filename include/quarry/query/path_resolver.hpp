#pragma once

/** \file path_resolver.hpp
 *  \brief Logical field path -> storage path, with index segments preserved.
 *
 * Numeric segments (and, for updates, the positional marker "S") are set
 * aside before the schema lookup and put back at their original positions
 * afterwards; "S" comes back as '$'. Without a schema, names pass through
 * unchanged.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "quarry/error.hpp"
#include "quarry/schema.hpp"

namespace quarry {

enum class resolve_mode : std::uint8_t { query, update };

struct resolved_path {
  std::vector<std::string> segments;  /**< storage names, indices and '$' in place */
  const field* terminal{nullptr};     /**< last schema field on the chain; null when schema-less */

  auto dotted() const -> std::string;
};

auto resolve_path(const schema* s, const std::vector<std::string>& path, resolve_mode mode)
    -> std::expected<resolved_path, core::error>;

} // namespace quarry
