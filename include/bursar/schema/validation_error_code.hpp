#pragma once

#include <bursar/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace bursar::schema {

enum class validation_error_code : uint32_t {
  unknown_event_type = 1,
  missing_amount = 2,
  invalid_amount = 3,
};

inline constexpr auto kValidationErrorCodeMappings =
    enum_mappings_t<validation_error_code, 3>{
        std::pair<std::string_view, validation_error_code>{
            "unknown_event_type", validation_error_code::unknown_event_type},
        std::pair<std::string_view, validation_error_code>{
            "missing_amount", validation_error_code::missing_amount},
        std::pair<std::string_view, validation_error_code>{
            "invalid_amount", validation_error_code::invalid_amount}};

inline constexpr std::string_view to_string(
    const validation_error_code value) {
  return to_string(value, kValidationErrorCodeMappings, "unknown");
}

}  // namespace bursar::schema
