#pragma once

/** \file value.hpp
 *  \brief Recursive field value held by documents.
 *
 * Ownership: a value owns its list/map children and any embedded document it
 * holds; copying a value deep-copies embedded documents. References own
 * nothing: they carry the target collection and identifier only, so documents
 * that point at each other never nest.
 */

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "quarry/wire.hpp"

namespace quarry {

class embedded_document;

/** \brief Identifier-only handle to a document in another (or the same) collection. */
struct reference {
  std::string collection;
  wire_value id;
};

class value {
public:
  using list = std::vector<value>;
  using map = std::map<std::string, value>;
  using storage = std::variant<std::monostate, bool, std::int64_t, double, std::string,
                               list, map, std::unique_ptr<embedded_document>, reference>;

  value();
  value(std::nullptr_t);
  value(bool b);
  value(int i);
  value(std::int64_t i);
  value(double d);
  value(const char* s);
  value(std::string s);
  value(list l);
  value(map m);
  value(reference r);
  value(embedded_document&& doc);
  value(std::unique_ptr<embedded_document> doc);

  value(const value& other);
  value(value&& other) noexcept;
  value& operator=(const value& other);
  value& operator=(value&& other) noexcept;
  ~value();

  /** \brief Untyped conversion: objects become maps, arrays become lists. */
  static auto from_wire(const wire_value& w) -> value;
  /** \brief Storage form; embedded documents serialize themselves, references to their id. */
  auto to_wire() const -> wire_value;

  auto is_null() const noexcept -> bool { return std::holds_alternative<std::monostate>(v_); }
  /** \brief Null, empty list or empty map: persisted as an unset. */
  auto is_empty() const noexcept -> bool;

  auto as_list() noexcept -> list* { return std::get_if<list>(&v_); }
  auto as_list() const noexcept -> const list* { return std::get_if<list>(&v_); }
  auto as_map() noexcept -> map* { return std::get_if<map>(&v_); }
  auto as_map() const noexcept -> const map* { return std::get_if<map>(&v_); }
  auto as_embedded() noexcept -> embedded_document*;
  auto as_embedded() const noexcept -> const embedded_document*;
  auto as_reference() const noexcept -> const reference* { return std::get_if<reference>(&v_); }
  auto as_string() const noexcept -> const std::string* { return std::get_if<std::string>(&v_); }
  auto as_int() const noexcept -> const std::int64_t* { return std::get_if<std::int64_t>(&v_); }

  auto raw() const noexcept -> const storage& { return v_; }

private:
  storage v_;
};

} // namespace quarry
