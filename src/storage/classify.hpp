#pragma once

#include <string>

#include "quarry/error.hpp"

namespace quarry::storage {

enum class write_kind { save, update, remove };

// Storage failures carry the driver message; a duplicate-key indicator makes
// the failure a uniqueness violation, anything else a generic one.
inline core::error classify(const core::error& e, write_kind kind) {
  if (!core::is_operation_error(e.code)) return e;
  const bool duplicate = e.message.find("E11000") != std::string::npos ||
                         e.message.find("duplicate key") != std::string::npos;
  if (duplicate) {
    return {core::error_code::not_unique, "Tried to save duplicate unique keys (" + e.message + ")", e.component};
  }
  switch (kind) {
    case write_kind::save:
      return {core::error_code::operation_failed, "Could not save document (" + e.message + ")", e.component};
    case write_kind::update:
      return {core::error_code::operation_failed, "Update failed (" + e.message + ")", e.component};
    case write_kind::remove:
      return {core::error_code::operation_failed, "Could not delete document (" + e.message + ")", e.component};
  }
  return e;
}

} // namespace quarry::storage
