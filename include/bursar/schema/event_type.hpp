#pragma once

#include <bursar/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: payment event type.
// The five literals accepted in the `type` column of the input.
namespace bursar::schema {

enum class event_type_t : uint8_t {
  deposit = 0,
  withdrawal = 1,
  dispute = 2,
  resolve = 3,
  chargeback = 4
};

inline constexpr auto kEventTypeMappings = enum_mappings_t<event_type_t, 5>{
    std::pair<std::string_view, event_type_t>{"deposit",
                                              event_type_t::deposit},
    std::pair<std::string_view, event_type_t>{"withdrawal",
                                              event_type_t::withdrawal},
    std::pair<std::string_view, event_type_t>{"dispute",
                                              event_type_t::dispute},
    std::pair<std::string_view, event_type_t>{"resolve",
                                              event_type_t::resolve},
    std::pair<std::string_view, event_type_t>{"chargeback",
                                              event_type_t::chargeback}};

template <>
inline std::optional<event_type_t> try_from_string<event_type_t>(
    const std::string_view value) {
  return from_string(value, kEventTypeMappings);
}

inline constexpr std::string_view to_string(const event_type_t value) {
  return to_string(value, kEventTypeMappings, "unknown");
}

}  // namespace bursar::schema
