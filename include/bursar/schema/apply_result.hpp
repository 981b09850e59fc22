#pragma once

#include <bursar/schema/ledger_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace bursar::schema {

template <uint16_t Version>
struct apply_result;

/// Outcome of applying one event to a client. `code == 0` is success,
/// anything else is a `ledger_error_code`.
template <>
struct apply_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;

  bool ok() const { return code == 0; }

  std::optional<ledger_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<ledger_error_code>(code);
  }
};

using apply_result_t = apply_result<1>;

}  // namespace bursar::schema
