#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bursar::common {

/// spdlog level by name, or std::nullopt for a name spdlog does not know.
/// spdlog itself maps unknown names to `off`.
inline std::optional<spdlog::level::level_enum> try_parse_log_level(
    const std::string_view name) {
  const auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

}  // namespace bursar::common
