#include <spdlog/spdlog.h>
#include <bursar/execution/ledger.hpp>
#include <bursar/storage/memory/storage.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <iterator>
#include <utility>

using namespace bursar::schema;

namespace bursar::execution {

template <typename Library>
ledger<Library>::ledger(bursar::storage::store_handle_t<Library> store)
    : store_{std::move(store)} {}

template <typename Library>
apply_result_t ledger<Library>::apply(const event_t& event) {
  auto [it, created] = clients_.try_emplace(event.client, event.client, store_);
  if (created) {
    spdlog::debug("Created client {}", event.client);
  }

  auto result = it->second.apply(event);
  if (result.ok()) {
    ++stats_.applied;
    spdlog::trace("Applied {} for client {} with transaction {}",
                  to_string(type_of(event.kind)), event.client, event.tx);
  } else {
    ++stats_.rejected;
    spdlog::warn("Rejected {} for client {} with transaction {}: {} ({})",
                 to_string(type_of(event.kind)), event.client, event.tx,
                 result.log, result.info);
  }
  return result;
}

template <typename Library>
const client<Library>* ledger<Library>::find(const client_id_t id) const {
  auto found = clients_.find(id);
  if (found == std::end(clients_)) {
    return nullptr;
  }
  return &found->second;
}

template <typename Library>
std::vector<account_t> ledger<Library>::accounts() const {
  auto out = std::vector<account_t>{};
  out.reserve(clients_.size());
  for (const auto& entry : clients_) {
    out.push_back(entry.second.account());
  }
  return out;
}

template class ledger<bursar::storage::memory_store_tag>;
template class ledger<bursar::storage::rocksdb_store_tag>;

}  // namespace bursar::execution
