#pragma once

#include <bursar/schema/primitives.hpp>
#include <cstdint>

namespace bursar::schema {

template <uint16_t Version>
struct account;

/// Read-out of one client's balances at the end of a run.
template <>
struct account<1> final {
  uint16_t version{1};
  client_id_t client{};
  amount_t available;
  amount_t held;
  amount_t total;
  bool locked{};
};

using account_t = account<1>;

}  // namespace bursar::schema
