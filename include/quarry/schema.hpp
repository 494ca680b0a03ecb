#pragma once

/** \file schema.hpp
 *  \brief Field and schema collaborators consumed by the resolver, compilers and documents.
 *
 * Field kinds implement only the coercion the compilers need
 * (prepare_query_value) and the storage conversions documents need; value
 * validation beyond that is out of scope.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/document/value.hpp"
#include "quarry/error.hpp"
#include "quarry/expr.hpp"
#include "quarry/wire.hpp"

namespace quarry {

enum class field_kind : std::uint8_t {
  string, integer, floating, boolean, object_id, dict, list, embedded, reference, geo_point, point,
};

/** \brief Index flavour of a geo field; selects the operator table used for geo queries. */
enum class geo_index : std::uint8_t { none, flat_2d, sphere_2d };

/** \brief What happens to referencing documents when their target is deleted. */
enum class delete_rule : std::uint8_t { do_nothing, nullify, cascade, deny, pull };

struct field_options {
  std::string db_field;     /**< storage name; defaults to the logical name */
  bool required{false};
  bool unique{false};
  bool primary_key{false};
};

class field {
public:
  field(field_kind kind, std::string name, field_options opts);
  virtual ~field() = default;

  auto kind() const noexcept -> field_kind { return kind_; }
  auto name() const -> const std::string& { return name_; }
  auto db_field() const -> const std::string& { return db_field_; }
  auto required() const noexcept -> bool { return opts_.required; }
  auto unique() const noexcept -> bool { return opts_.unique; }
  auto primary_key() const noexcept -> bool { return opts_.primary_key; }

  virtual auto geo() const noexcept -> geo_index { return geo_index::none; }
  /** \brief Element field of a list or dict; null for scalars and untyped dicts. */
  virtual auto item_field() const noexcept -> const field* { return nullptr; }
  /** \brief Called when the field joins a schema; resolves "self" reference targets. */
  virtual void attach(const std::string& owner_class) { (void)owner_class; }

  /** \brief Coerce a query/update operand for this field. `op` is empty for plain values. */
  virtual auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error>;
  virtual auto to_storage(const value& v) const -> wire_value;
  virtual auto from_storage(const wire_value& w) const -> std::expected<value, core::error>;

private:
  friend class schema;
  field_kind kind_;
  std::string name_;
  std::string db_field_;
  field_options opts_;
};

class string_field : public field {
public:
  explicit string_field(std::string name, field_options opts = {});
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
};

class int_field : public field {
public:
  explicit int_field(std::string name, field_options opts = {});
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
};

class float_field : public field {
public:
  explicit float_field(std::string name, field_options opts = {});
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
};

class bool_field : public field {
public:
  explicit bool_field(std::string name, field_options opts = {});
};

class object_id_field : public field {
public:
  explicit object_id_field(std::string name, field_options opts = {});
};

/** \brief Free-form mapping; keys below it pass through the resolver unchanged. */
class dict_field : public field {
public:
  explicit dict_field(std::string name, field_options opts = {}, std::shared_ptr<field> item = nullptr);
  auto item_field() const noexcept -> const field* override { return item_.get(); }
  void attach(const std::string& owner_class) override;
  /** \brief String operators on keys below the dict coerce like a string field. */
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
  auto from_storage(const wire_value& w) const -> std::expected<value, core::error> override;

private:
  std::shared_ptr<field> item_;
};

class list_field : public field {
public:
  list_field(std::string name, std::shared_ptr<field> item, field_options opts = {});
  auto item_field() const noexcept -> const field* override { return item_.get(); }
  void attach(const std::string& owner_class) override;
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
  auto from_storage(const wire_value& w) const -> std::expected<value, core::error> override;

private:
  std::shared_ptr<field> item_;
};

class embedded_field : public field {
public:
  embedded_field(std::string name, std::string class_name, field_options opts = {});
  auto class_name() const -> const std::string& { return class_name_; }
  auto from_storage(const wire_value& w) const -> std::expected<value, core::error> override;

private:
  std::string class_name_;
};

class reference_field : public field {
public:
  reference_field(std::string name, std::string target, delete_rule rule = delete_rule::do_nothing,
                  field_options opts = {});
  auto target() const -> const std::string& { return target_; }
  auto rule() const noexcept -> delete_rule { return rule_; }
  /** \brief Collection of the target class (registered, or derived from its name). */
  auto target_collection() const -> std::string;
  void attach(const std::string& owner_class) override;
  auto prepare_query_value(std::optional<query_op> op, const wire_value& v) const
      -> std::expected<wire_value, core::error> override;
  auto from_storage(const wire_value& w) const -> std::expected<value, core::error> override;

private:
  std::string target_;  /**< class name; "self" is rewritten when added to a schema */
  delete_rule rule_;
};

/** \brief Legacy [x, y] pair indexed with a planar 2d index. */
class geo_point_field : public field {
public:
  explicit geo_point_field(std::string name, field_options opts = {});
  auto geo() const noexcept -> geo_index override { return geo_index::flat_2d; }
};

/** \brief GeoJSON Point indexed with 2dsphere. */
class point_field : public field {
public:
  explicit point_field(std::string name, field_options opts = {});
  auto geo() const noexcept -> geo_index override { return geo_index::sphere_2d; }
};

class schema;

struct schema_options {
  std::string collection;          /**< defaults to snake_case(class name) */
  const schema* parent{nullptr};   /**< subclass: inherits fields, collection and "_cls" chain */
  bool allow_inheritance{false};   /**< emit and honour the "_cls" discriminator */
  bool embedded{false};            /**< embedded schemas get no id field */
};

/** \brief One step of a resolved field chain; `meta` is null for pass-through keys. */
struct lookup_step {
  std::string storage_name;
  const field* meta{nullptr};
};

class schema {
public:
  explicit schema(std::string class_name, schema_options opts = {});

  /** \brief Append a field. A primary_key field replaces the implicit "id". */
  auto add(std::shared_ptr<field> f) -> schema&;

  auto class_name() const -> const std::string& { return class_name_; }
  /** \brief Stored "_cls" value: "Parent.Child" for subclasses. */
  auto discriminator() const -> const std::string& { return discriminator_; }
  auto parent() const noexcept -> const schema* { return opts_.parent; }
  auto collection() const -> const std::string& { return collection_; }
  auto allow_inheritance() const noexcept -> bool { return opts_.allow_inheritance; }
  auto embedded() const noexcept -> bool { return opts_.embedded; }
  auto fields() const -> const std::vector<std::shared_ptr<field>>& { return fields_; }

  /** \brief Logical lookup; "pk" aliases the id field. */
  auto find(std::string_view name) const -> const field*;
  auto find_by_db(std::string_view db_name) const -> const field*;
  auto id_field() const -> const field*;

  /**
   * \brief Resolve a chain of logical names to storage names and fields.
   *
   * Embedded and list-of-embedded fields descend into the embedded schema;
   * keys below a dict field pass through. Reference fields cannot be joined.
   */
  auto lookup(const std::vector<std::string>& parts) const
      -> std::expected<std::vector<lookup_step>, core::error>;

private:
  std::string class_name_;
  std::string discriminator_;
  std::string collection_;
  schema_options opts_;
  std::vector<std::shared_ptr<field>> fields_;
  std::string id_name_;
  bool implicit_id_{false};
};

/** \brief BlogPost -> blog_post */
auto collection_name_for(std::string_view class_name) -> std::string;

} // namespace quarry
