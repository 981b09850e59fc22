#pragma once

#include <bursar/schema/primitives.hpp>
#include <cstdint>
#include <variant>

// Schema type: stored transaction state.
// Deposit <-> Dispute through dispute/resolve; Withdrawal is terminal.
namespace bursar::schema {

struct deposited_t final {
  amount_t amount;
};

struct disputed_t final {
  amount_t amount;
};

struct withdrawn_t final {
  amount_t amount;
};

using transaction_state_t = std::variant<deposited_t, disputed_t, withdrawn_t>;

/// Stable tag for each alternative, used by the persistent encoding.
enum class transaction_state_kind : uint8_t {
  deposited = 0,
  disputed = 1,
  withdrawn = 2
};

template <uint16_t Version>
struct transaction_record;

template <>
struct transaction_record<1> final {
  uint16_t version{1};
  client_id_t owner{};
  transaction_state_t state{};
};

using transaction_record_t = transaction_record<1>;

transaction_state_kind kind_of(const transaction_state_t& state);
const amount_t& amount_of(const transaction_state_t& state);
transaction_state_t make_transaction_state(transaction_state_kind kind,
                                           amount_t amount);

}  // namespace bursar::schema
