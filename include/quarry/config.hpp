#pragma once

/** \file config.hpp
 *  \brief Process-wide defaults with QUARRY_* environment overrides.
 *
 * Overrides:
 *   QUARRY_WRITE_CONCERN_W  integer acknowledgment level (0 = unacknowledged)
 *   QUARRY_BATCH_SIZE       default cursor batch size (0 = backend default)
 *   QUARRY_DEBUG            enable [QUARRY][...] diagnostics on stderr
 */

#include <cstddef>
#include <expected>

#include "quarry/error.hpp"
#include "quarry/storage/options.hpp"

namespace quarry {

struct odm_config {
  storage::write_concern default_write_concern{};  /**< used when a call passes none */
  std::size_t default_batch_size{0};               /**< 0 = let the backend decide */
  bool debug{false};
};

/** \brief Build a config from defaults and the environment. */
auto load_config() -> std::expected<odm_config, core::error>;

/** \brief Cached process-wide config; invalid overrides fall back to defaults. */
auto config() -> const odm_config&;

} // namespace quarry
