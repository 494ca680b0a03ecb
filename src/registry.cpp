#include "quarry/registry.hpp"

#include <algorithm>
#include <set>

namespace quarry {

auto registry::instance() -> registry& {
  static registry r;
  return r;
}

auto registry::add(std::shared_ptr<const schema> s) -> const schema& {
  const auto& name = s->class_name();
  if (auto it = by_name_.find(name); it != by_name_.end()) {
    std::replace(order_.begin(), order_.end(), it->second, s);
    by_cls_.erase(it->second->discriminator());
  } else {
    order_.push_back(s);
  }
  by_name_[name] = s;
  by_cls_[s->discriminator()] = s;
  return *s;
}

auto registry::find(std::string_view class_name) const -> const schema* {
  auto it = by_name_.find(class_name);
  return it == by_name_.end() ? nullptr : it->second.get();
}

auto registry::find_discriminator(std::string_view cls) const -> const schema* {
  auto it = by_cls_.find(cls);
  return it == by_cls_.end() ? nullptr : it->second.get();
}

auto registry::find_collection(std::string_view collection) const -> const schema* {
  for (const auto& s : order_) {
    if (!s->embedded() && s->parent() == nullptr && s->collection() == collection) return s.get();
  }
  return nullptr;
}

auto registry::delete_rules_for(const schema& s) const -> std::vector<delete_rule_entry> {
  std::vector<std::string> targets;
  for (const schema* p = &s; p != nullptr; p = p->parent()) targets.push_back(p->class_name());
  auto targeted = [&](const field* f) -> const reference_field* {
    if (f == nullptr || f->kind() != field_kind::reference) return nullptr;
    const auto* r = static_cast<const reference_field*>(f);
    if (r->rule() == delete_rule::do_nothing) return nullptr;
    return std::find(targets.begin(), targets.end(), r->target()) != targets.end() ? r : nullptr;
  };

  std::vector<delete_rule_entry> out;
  std::set<const field*> seen;  // subclasses share their parent's field objects
  for (const auto& owner : order_) {
    if (owner->embedded()) continue;
    for (const auto& f : owner->fields()) {
      if (seen.count(f.get()) != 0) continue;
      if (const auto* r = targeted(f.get())) {
        seen.insert(f.get());
        out.push_back({owner.get(), f.get(), r->rule(), false});
      } else if (f->kind() == field_kind::list) {
        if (const auto* item = targeted(f->item_field())) {
          seen.insert(f.get());
          out.push_back({owner.get(), f.get(), item->rule(), true});
        }
      }
    }
  }
  return out;
}

auto registry::family(const schema& s) const -> std::vector<std::string> {
  std::vector<std::string> out{s.discriminator()};
  const auto prefix = s.discriminator() + ".";
  for (const auto& other : order_) {
    if (other->discriminator().rfind(prefix, 0) == 0) out.push_back(other->discriminator());
  }
  return out;
}

void registry::clear() {
  order_.clear();
  by_name_.clear();
  by_cls_.clear();
}

} // namespace quarry
