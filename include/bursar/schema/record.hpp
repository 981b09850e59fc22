#pragma once

#include <bursar/schema/primitives.hpp>
#include <optional>
#include <string>

namespace bursar::schema {

template <uint16_t Version>
struct record;

/// One untrusted input row. Nothing about it has been checked beyond the
/// numeric ranges of `client` and `tx`.
template <>
struct record<1> final {
  uint16_t version{1};
  std::string type;
  client_id_t client{};
  transaction_id_t tx{};
  std::optional<amount_t> amount;
};

using record_t = record<1>;

}  // namespace bursar::schema
