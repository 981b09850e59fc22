#pragma once

#include <bursar/execution/client.hpp>
#include <bursar/schema/account.hpp>
#include <bursar/schema/apply_result.hpp>
#include <bursar/schema/event.hpp>
#include <bursar/storage/storage.hpp>
#include <cstdint>
#include <map>
#include <vector>

namespace bursar::execution {

struct ledger_stats final {
  uint64_t applied{};
  uint64_t rejected{};
};

/// The set of clients seen so far, all bound to one transaction store.
///
/// Clients are created on first reference and never removed. A ledger is
/// driven by one thread; several ledgers may share a store.
template <typename Library>
class ledger final {
 public:
  explicit ledger(bursar::storage::store_handle_t<Library> store);

  /// Route `event` to its client, creating the client if needed. Rejections
  /// are logged and counted; they never stop the ledger.
  bursar::schema::apply_result_t apply(const bursar::schema::event_t& event);

  /// Client by id, or nullptr when the id has never been referenced.
  const client<Library>* find(bursar::schema::client_id_t id) const;

  /// Balances of every client, ordered by client id.
  std::vector<bursar::schema::account_t> accounts() const;

  std::size_t size() const { return clients_.size(); }
  const ledger_stats& stats() const { return stats_; }

 private:
  bursar::storage::store_handle_t<Library> store_;
  std::map<bursar::schema::client_id_t, client<Library>> clients_;
  ledger_stats stats_;
};

}  // namespace bursar::execution
