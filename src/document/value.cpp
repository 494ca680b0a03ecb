#include "quarry/document/value.hpp"

#include <type_traits>
#include <utility>

#include "quarry/document/document.hpp"
#include "quarry/registry.hpp"

namespace quarry {

namespace {

auto copy_storage(const value::storage& s) -> value::storage {
  return std::visit(
      [](const auto& x) -> value::storage {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::unique_ptr<embedded_document>>) {
          return x ? x->clone() : nullptr;
        } else {
          return x;
        }
      },
      s);
}

} // namespace

value::value() = default;
value::value(std::nullptr_t) {}
value::value(bool b) : v_(b) {}
value::value(int i) : v_(static_cast<std::int64_t>(i)) {}
value::value(std::int64_t i) : v_(i) {}
value::value(double d) : v_(d) {}
value::value(const char* s) : v_(std::string(s)) {}
value::value(std::string s) : v_(std::move(s)) {}
value::value(list l) : v_(std::move(l)) {}
value::value(map m) : v_(std::move(m)) {}
value::value(reference r) : v_(std::move(r)) {}
value::value(embedded_document&& doc) : v_(std::make_unique<embedded_document>(std::move(doc))) {}
value::value(std::unique_ptr<embedded_document> doc) : v_(std::move(doc)) {}

value::value(const value& other) : v_(copy_storage(other.v_)) {}
value::value(value&& other) noexcept = default;

value& value::operator=(const value& other) {
  if (this != &other) v_ = copy_storage(other.v_);
  return *this;
}

value& value::operator=(value&& other) noexcept = default;
value::~value() = default;

auto value::as_embedded() noexcept -> embedded_document* {
  auto* p = std::get_if<std::unique_ptr<embedded_document>>(&v_);
  return p ? p->get() : nullptr;
}

auto value::as_embedded() const noexcept -> const embedded_document* {
  const auto* p = std::get_if<std::unique_ptr<embedded_document>>(&v_);
  return p ? p->get() : nullptr;
}

auto value::is_empty() const noexcept -> bool {
  if (is_null()) return true;
  if (const auto* l = as_list()) return l->empty();
  if (const auto* m = as_map()) return m->empty();
  return false;
}

auto value::from_wire(const wire_value& w) -> value {
  switch (w.type()) {
    case wire_value::value_t::boolean: return value(w.get<bool>());
    case wire_value::value_t::number_integer: return value(w.get<std::int64_t>());
    case wire_value::value_t::number_unsigned: return value(static_cast<std::int64_t>(w.get<std::uint64_t>()));
    case wire_value::value_t::number_float: return value(w.get<double>());
    case wire_value::value_t::string: return value(w.get<std::string>());
    case wire_value::value_t::array: {
      list out;
      out.reserve(w.size());
      for (const auto& e : w) out.push_back(from_wire(e));
      return value(std::move(out));
    }
    case wire_value::value_t::object: {
      // Tagged sub-documents of registered embedded classes come back typed.
      if (auto it = w.find("_cls"); it != w.end() && it->is_string()) {
        const auto* s = registry::instance().find_discriminator(it->get<std::string>());
        if (s != nullptr && s->embedded()) {
          if (auto doc = embedded_document::from_storage(*s, w)) return value(std::move(*doc));
        }
      }
      map out;
      for (auto it = w.begin(); it != w.end(); ++it) out.emplace(it.key(), from_wire(it.value()));
      return value(std::move(out));
    }
    default: return value{};
  }
}

auto value::to_wire() const -> wire_value {
  return std::visit(
      [](const auto& x) -> wire_value {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return nullptr;
        } else if constexpr (std::is_same_v<T, list>) {
          wire_value out = wire_value::array();
          for (const auto& e : x) out.push_back(e.to_wire());
          return out;
        } else if constexpr (std::is_same_v<T, map>) {
          wire_value out = wire_value::object();
          for (const auto& [k, e] : x) out[k] = e.to_wire();
          return out;
        } else if constexpr (std::is_same_v<T, std::unique_ptr<embedded_document>>) {
          return x ? x->to_storage() : wire_value(nullptr);
        } else if constexpr (std::is_same_v<T, reference>) {
          return x.id;
        } else {
          return wire_value(x);
        }
      },
      v_);
}

} // namespace quarry
