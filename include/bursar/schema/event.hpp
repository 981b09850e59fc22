#pragma once

#include <bursar/schema/event_type.hpp>
#include <bursar/schema/primitives.hpp>
#include <variant>

namespace bursar::schema {

struct deposit_t final {
  amount_t amount;
};

struct withdrawal_t final {
  amount_t amount;
};

struct dispute_t final {};

struct resolve_t final {};

struct chargeback_t final {};

using event_kind_t =
    std::variant<deposit_t, withdrawal_t, dispute_t, resolve_t, chargeback_t>;

template <uint16_t Version>
struct event;

/// A validated payment event. Only `validation::make_event` produces these;
/// the ledger trusts them without further checks.
template <>
struct event<1> final {
  uint16_t version{1};
  client_id_t client{};
  transaction_id_t tx{};
  event_kind_t kind{};
};

using event_t = event<1>;

event_type_t type_of(const event_kind_t& kind);

}  // namespace bursar::schema
