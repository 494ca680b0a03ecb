#pragma once

/** \file registry.hpp
 *  \brief Process-wide class registry: class name / discriminator -> schema.
 *
 * Used to hydrate polymorphic embedded values from their "_cls" tag, to resolve
 * embedded and reference targets by class name, and to collect the delete
 * rules declared by reference fields. Not synchronized; register schemas
 * during start-up.
 */

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "quarry/schema.hpp"

namespace quarry {

/** \brief A reference field (or list of references) pointing at a deleted class. */
struct delete_rule_entry {
  const schema* owner{nullptr};
  const field* ref_field{nullptr};  /**< reference_field, or list_field of references */
  delete_rule rule{delete_rule::do_nothing};
  bool list{false};
};

class registry {
public:
  static auto instance() -> registry&;

  /** \brief Register (or replace) a schema under its class name and discriminator. */
  auto add(std::shared_ptr<const schema> s) -> const schema&;
  auto find(std::string_view class_name) const -> const schema*;
  auto find_discriminator(std::string_view cls) const -> const schema*;
  /** \brief Root schema owning a collection (subclasses share it). */
  auto find_collection(std::string_view collection) const -> const schema*;
  /** \brief Every non-trivial rule declared against `s` or one of its ancestors. */
  auto delete_rules_for(const schema& s) const -> std::vector<delete_rule_entry>;
  /** \brief Names of `s` and every registered subclass of it. */
  auto family(const schema& s) const -> std::vector<std::string>;
  void clear();

private:
  registry() = default;
  std::vector<std::shared_ptr<const schema>> order_;
  std::map<std::string, std::shared_ptr<const schema>, std::less<>> by_name_;
  std::map<std::string, std::shared_ptr<const schema>, std::less<>> by_cls_;
};

} // namespace quarry
