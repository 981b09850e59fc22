#include <bursar/schema/transaction_state.hpp>

#include <utility>

namespace bursar::schema {

transaction_state_kind kind_of(const transaction_state_t& state) {
  return std::visit(
      overloaded{[](const deposited_t&) {
                   return transaction_state_kind::deposited;
                 },
                 [](const disputed_t&) {
                   return transaction_state_kind::disputed;
                 },
                 [](const withdrawn_t&) {
                   return transaction_state_kind::withdrawn;
                 }},
      state);
}

const amount_t& amount_of(const transaction_state_t& state) {
  return std::visit(
      [](const auto& value) -> const amount_t& { return value.amount; },
      state);
}

transaction_state_t make_transaction_state(const transaction_state_kind kind,
                                           amount_t amount) {
  switch (kind) {
    case transaction_state_kind::deposited:
      return deposited_t{.amount = std::move(amount)};
    case transaction_state_kind::disputed:
      return disputed_t{.amount = std::move(amount)};
    case transaction_state_kind::withdrawn:
      break;
  }
  return withdrawn_t{.amount = std::move(amount)};
}

}  // namespace bursar::schema
