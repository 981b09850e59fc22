#pragma once

#include <bursar/schema/account.hpp>
#include <bursar/schema/apply_result.hpp>
#include <bursar/schema/event.hpp>
#include <bursar/schema/primitives.hpp>
#include <bursar/storage/storage.hpp>

namespace bursar::execution {

/// Balances of one client and the state machine that moves them.
///
/// Every client holds a handle to the same transaction store, which arbitrates
/// transaction ownership across clients. Events for one client must be applied
/// in arrival order by a single caller at a time; distinct clients may be
/// driven from different threads.
template <typename Library>
class client final {
 public:
  client(bursar::schema::client_id_t id,
         bursar::storage::store_handle_t<Library> store);

  bursar::schema::client_id_t id() const { return id_; }
  const bursar::schema::amount_t& available() const { return available_; }
  bursar::schema::amount_t held() const { return total_ - available_; }
  const bursar::schema::amount_t& total() const { return total_; }
  bool locked() const { return locked_; }

  /// Apply one event addressed to this client.
  ///
  /// A locked client rejects everything with `account_frozen`. Otherwise the
  /// guards for the event kind are checked before anything is written; a
  /// failed event leaves balances and the store untouched.
  bursar::schema::apply_result_t apply(const bursar::schema::event_t& event);

  bursar::schema::account_t account() const;

 private:
  bursar::schema::apply_result_t deposit(
      bursar::schema::transaction_id_t tx,
      const bursar::schema::amount_t& amount);
  bursar::schema::apply_result_t withdraw(
      bursar::schema::transaction_id_t tx,
      const bursar::schema::amount_t& amount);
  bursar::schema::apply_result_t dispute(bursar::schema::transaction_id_t tx);
  bursar::schema::apply_result_t resolve(bursar::schema::transaction_id_t tx);
  bursar::schema::apply_result_t chargeback(
      bursar::schema::transaction_id_t tx);

  bursar::schema::client_id_t id_{};
  bursar::schema::amount_t available_{};
  bursar::schema::amount_t total_{};
  bool locked_{false};
  bursar::storage::store_handle_t<Library> store_;
};

}  // namespace bursar::execution
