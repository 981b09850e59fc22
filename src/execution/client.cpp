#include <bursar/common/critical.hpp>
#include <bursar/execution/client.hpp>
#include <bursar/storage/memory/storage.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <fmt/format.h>
#include <utility>

using namespace bursar::schema;

namespace {

constexpr auto kCodespace = std::string_view{"bursar.ledger"};

apply_result_t success() {
  return apply_result_t{};
}

apply_result_t failure(const ledger_error_code code, std::string log) {
  auto result = apply_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::string{to_string(code)};
  result.codespace = std::string{kCodespace};
  return result;
}

apply_result_t ownership_conflict(const transaction_id_t tx) {
  return failure(ledger_error_code::transaction_not_found,
                 fmt::format("transaction {} does not exist", tx));
}

}  // namespace

namespace bursar::execution {

template <typename Library>
client<Library>::client(const client_id_t id,
                        bursar::storage::store_handle_t<Library> store)
    : id_{id}, store_{std::move(store)} {
  if (!store_) {
    bursar::common::critical("client {} has no transaction store", id);
  }
}

template <typename Library>
apply_result_t client<Library>::apply(const event_t& event) {
  if (locked_) {
    return failure(ledger_error_code::account_frozen, "account is frozen");
  }

  return std::visit(
      overloaded{
          [&](const deposit_t& value) { return deposit(event.tx, value.amount); },
          [&](const withdrawal_t& value) {
            return withdraw(event.tx, value.amount);
          },
          [&](const dispute_t&) { return dispute(event.tx); },
          [&](const resolve_t&) { return resolve(event.tx); },
          [&](const chargeback_t&) { return chargeback(event.tx); }},
      event.kind);
}

template <typename Library>
apply_result_t client<Library>::deposit(const transaction_id_t tx,
                                        const amount_t& amount) {
  if (store_->get(id_, tx).has_value()) {
    return failure(ledger_error_code::duplicate_transaction,
                   fmt::format("transaction {} already exists", tx));
  }
  if (store_->upsert(id_, tx, deposited_t{.amount = amount}) !=
      bursar::storage::upsert_status::ok) {
    return ownership_conflict(tx);
  }
  available_ += amount;
  total_ += amount;
  return success();
}

template <typename Library>
apply_result_t client<Library>::withdraw(const transaction_id_t tx,
                                         const amount_t& amount) {
  if (available_ < amount) {
    return failure(ledger_error_code::insufficient_funds,
                   "insufficient funds for withdrawal");
  }
  if (store_->get(id_, tx).has_value()) {
    return failure(ledger_error_code::duplicate_transaction,
                   fmt::format("transaction {} already exists", tx));
  }
  if (store_->upsert(id_, tx, withdrawn_t{.amount = amount}) !=
      bursar::storage::upsert_status::ok) {
    return ownership_conflict(tx);
  }
  available_ -= amount;
  total_ -= amount;
  return success();
}

template <typename Library>
apply_result_t client<Library>::dispute(const transaction_id_t tx) {
  auto state = store_->get(id_, tx);
  if (!state) {
    return failure(ledger_error_code::transaction_not_found,
                   fmt::format("transaction {} does not exist", tx));
  }

  auto result = std::visit(
      overloaded{
          [&](const deposited_t& deposited) {
            if (deposited.amount > available_) {
              return failure(ledger_error_code::insufficient_funds,
                             "not enough funds to dispute transaction");
            }
            if (store_->upsert(id_, tx,
                               disputed_t{.amount = deposited.amount}) !=
                bursar::storage::upsert_status::ok) {
              return ownership_conflict(tx);
            }
            available_ -= deposited.amount;
            return success();
          },
          [&](const disputed_t&) {
            return failure(ledger_error_code::transaction_already_disputed,
                           "transaction already disputed");
          },
          [&](const withdrawn_t&) {
            return failure(ledger_error_code::transaction_cannot_be_disputed,
                           "cannot dispute a withdrawal");
          }},
      *state);
  return result;
}

template <typename Library>
apply_result_t client<Library>::resolve(const transaction_id_t tx) {
  auto state = store_->get(id_, tx);
  if (!state) {
    return failure(ledger_error_code::transaction_not_found,
                   fmt::format("transaction {} does not exist", tx));
  }
  auto* disputed = std::get_if<disputed_t>(&*state);
  if (disputed == nullptr) {
    return failure(ledger_error_code::transaction_not_disputed,
                   "transaction is not disputed");
  }
  if (store_->upsert(id_, tx, deposited_t{.amount = disputed->amount}) !=
      bursar::storage::upsert_status::ok) {
    return ownership_conflict(tx);
  }
  available_ += disputed->amount;
  return success();
}

template <typename Library>
apply_result_t client<Library>::chargeback(const transaction_id_t tx) {
  auto state = store_->get(id_, tx);
  if (!state) {
    return failure(ledger_error_code::transaction_not_found,
                   fmt::format("transaction {} does not exist", tx));
  }
  auto* disputed = std::get_if<disputed_t>(&*state);
  if (disputed == nullptr) {
    return failure(ledger_error_code::transaction_not_disputed,
                   "transaction is not disputed");
  }
  // The record stays disputed; once frozen nothing can reach it again.
  total_ -= disputed->amount;
  locked_ = true;
  return success();
}

template <typename Library>
account_t client<Library>::account() const {
  return account_t{.client = id_,
                   .available = available_,
                   .held = held(),
                   .total = total_,
                   .locked = locked_};
}

template class client<bursar::storage::memory_store_tag>;
template class client<bursar::storage::rocksdb_store_tag>;

}  // namespace bursar::execution
