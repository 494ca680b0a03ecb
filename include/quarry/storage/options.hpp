#pragma once

/** \file options.hpp
 *  \brief Parameters passed through to the storage collaborator.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "quarry/wire.hpp"

namespace quarry::storage {

/** \brief Acknowledgment level requested for a write. */
struct write_concern {
  int w{1};             /**< 0 = fire-and-forget, no result information */
  bool journal{false};

  auto acknowledged() const noexcept -> bool { return w != 0; }
};

/**
 * \brief Result of update/remove: matched document count.
 *
 * Empty when the write concern was unacknowledged; the outcome is unknown,
 * which is different from "zero documents matched".
 */
using update_result = std::optional<std::uint64_t>;

/** \brief Cursor parameters for find(). Zero/empty members mean "not set". */
struct find_options {
  wire_value projection;        /**< {field: 1|0} or null */
  wire_value sort;              /**< ordered {field: 1|-1} or null */
  std::size_t skip{0};
  std::size_t limit{0};         /**< 0 = unbounded */
  std::size_t batch_size{0};
  std::string read_preference;  /**< e.g. "primary", "secondaryPreferred" */
  wire_value read_concern;      /**< e.g. {"level": "majority"} */
  wire_value hint;              /**< index spec or name */
  bool no_cursor_timeout{false};
};

struct index_options {
  bool unique{false};
  bool sparse{false};
  std::string name;             /**< derived from the keys when empty */
};

} // namespace quarry::storage
