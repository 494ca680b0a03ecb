#include "quarry/config.hpp"

#include <charconv>
#include <optional>
#include <string>

#include "quarry/core/platform_utils.hpp"

namespace quarry {

namespace {

auto parse_count(const char* name, const std::string& text) -> std::expected<std::size_t, core::error> {
  std::size_t out = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
  if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
    return core::fail(core::error_code::config_invalid,
                      std::string(name) + " must be a non-negative integer, got \"" + text + "\"", "config");
  }
  return out;
}

} // namespace

auto load_config() -> std::expected<odm_config, core::error> {
  odm_config cfg;
  if (auto w = core::safe_getenv("QUARRY_WRITE_CONCERN_W")) {
    auto n = parse_count("QUARRY_WRITE_CONCERN_W", *w);
    if (!n) return std::unexpected(n.error());
    cfg.default_write_concern.w = static_cast<int>(*n);
  }
  if (auto b = core::safe_getenv("QUARRY_BATCH_SIZE")) {
    auto n = parse_count("QUARRY_BATCH_SIZE", *b);
    if (!n) return std::unexpected(n.error());
    cfg.default_batch_size = *n;
  }
  cfg.debug = core::env_flag("QUARRY_DEBUG");
  return cfg;
}

auto config() -> const odm_config& {
  static const odm_config cached = load_config().value_or(odm_config{});
  return cached;
}

} // namespace quarry
