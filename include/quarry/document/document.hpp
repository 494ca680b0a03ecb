#pragma once

/** \file document.hpp
 *  \brief Schema-described documents with explicit mutators and change tracking.
 *
 * Mutations go through set/unset/append/pop so that every change records a
 * dirty path. Paths passed to mutators are dotted logical names
 * ("embedded_field.list_field.2.string_field"); numeric segments index lists,
 * other segments below a dict are keys. Recorded paths and delta keys use
 * storage names.
 *
 * Ownership: a document owns its values; embedded documents inside them are
 * owned through value. The parent link of an embedded document is a
 * non-owning back pointer used only to prefix and forward dirty paths; it is
 * refreshed whenever the owning field changes, and documents are not
 * synchronized.
 */

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quarry/document/change_set.hpp"
#include "quarry/document/value.hpp"
#include "quarry/error.hpp"
#include "quarry/schema.hpp"
#include "quarry/storage/options.hpp"
#include "quarry/wire.hpp"

namespace quarry {

namespace storage { class database; }

class embedded_document;

/** \brief Minimal partial update: `sets` path -> value, `unsets` path -> 1. */
struct delta_result {
  wire_value sets = wire_value::object();
  wire_value unsets = wire_value::object();

  auto empty() const -> bool { return sets.empty() && unsets.empty(); }
};

class base_document {
public:
  virtual ~base_document();

  auto meta() const -> const schema& { return *schema_; }

  /** \brief Value at a logical path, or nullptr when nothing is stored there. */
  auto get(std::string_view path) const -> const value*;
  auto set(std::string_view path, value v) -> std::expected<void, core::error>;
  /** \brief Remove a field (reset to its empty default), a dict key or a list element. */
  auto unset(std::string_view path) -> std::expected<void, core::error>;
  auto append(std::string_view path, value v) -> std::expected<void, core::error>;
  /** \brief Remove and return a list element; the last one when `index` is empty. */
  auto pop(std::string_view path, std::optional<std::size_t> index = std::nullopt)
      -> std::expected<value, core::error>;
  /** \brief Embedded document stored at a logical path, or nullptr. */
  auto embedded(std::string_view path) -> embedded_document*;

  auto changed_paths() const -> std::vector<std::string> { return changes_.paths(); }
  virtual auto delta() const -> delta_result;
  /** \brief Full storage form: "_id", then "_cls" when inheritance is on, then fields. */
  auto to_storage() const -> wire_value;
  /** \brief Forget recorded changes here and in every embedded document. */
  void clear_changed_fields();

protected:
  explicit base_document(const schema& s);
  base_document(const base_document& other);
  base_document(base_document&& other) noexcept;
  base_document& operator=(const base_document& other);
  base_document& operator=(base_document&& other) noexcept;

  /** \brief Replace all field values from a storage document. */
  auto hydrate(const wire_value& w) -> std::expected<void, core::error>;
  void mark_changed(const std::string& path);

  auto slot(const field& f) -> value& { return data_[f.name()]; }
  auto data() const -> const std::map<std::string, value>& { return data_; }

private:
  friend class embedded_document;

  auto route(const std::vector<std::string>& segs)
      -> std::expected<std::pair<base_document*, std::vector<std::string>>, core::error>;
  auto storage_path(const std::vector<std::string>& segs) const -> std::string;
  auto find_storage(const std::vector<std::string>& segs) const -> const value*;
  void reset_defaults();
  void relink(const field& f);
  void relink_all();

  const schema* schema_;
  std::map<std::string, value> data_;  /**< logical field name -> value */
  change_set changes_;
  base_document* parent_{nullptr};     /**< non-owning; set by the owning document */
  std::string parent_key_;             /**< storage path of this document inside parent_ */
};

class embedded_document : public base_document {
public:
  explicit embedded_document(const schema& s);

  static auto from_storage(const schema& s, const wire_value& w)
      -> std::expected<std::unique_ptr<embedded_document>, core::error>;

  auto clone() const -> std::unique_ptr<embedded_document>;
  auto parent() const noexcept -> const base_document* { return parent_; }

private:
  friend class base_document;
};

/** \brief Lifecycle: never persisted, matches storage, or has pending changes. */
enum class document_state : std::uint8_t { fresh, clean, dirty };

class document : public base_document {
public:
  explicit document(const schema& s);

  /** \brief Hydrate from storage; "_cls" selects a registered subclass schema. */
  static auto from_storage(const schema& s, const wire_value& w) -> std::expected<document, core::error>;
  /** \brief Load the document a reference points at. */
  static auto dereference(storage::database& db, const reference& ref)
      -> std::expected<document, core::error>;

  auto state() const -> document_state;
  /** \brief Identifier as stored; null until assigned or persisted. */
  auto id() const -> wire_value;

  /** \brief Full document while fresh, otherwise the change-tracked delta. */
  auto delta() const -> delta_result override;

  /** \brief Insert when fresh, otherwise send $set/$unset for the delta. */
  auto save(storage::database& db, std::optional<storage::write_concern> wc = std::nullopt)
      -> std::expected<void, core::error>;
  auto reload(storage::database& db) -> std::expected<void, core::error>;
  /** \brief Delete through a query set so that delete rules apply. */
  auto remove(storage::database& db, std::optional<storage::write_concern> wc = std::nullopt)
      -> std::expected<void, core::error>;
  /** \brief Atomic update of this document with `op__field` keyword pairs. */
  auto update(storage::database& db, const keyword_args& updates,
              std::optional<storage::write_concern> wc = std::nullopt)
      -> std::expected<storage::update_result, core::error>;
  auto to_reference() const -> std::expected<reference, core::error>;

private:
  friend class query_set;
  void assign_id(const wire_value& id);
  void mark_persisted();

  bool created_{true};
};

} // namespace quarry
