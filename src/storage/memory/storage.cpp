#include <bursar/storage/memory/storage.hpp>

using namespace bursar::schema;

namespace bursar::storage {

std::optional<transaction_state_t> transaction_store<memory_store_tag>::get(
    const client_id_t client,
    const transaction_id_t tx) const {
  auto lock = std::scoped_lock{mutex};
  auto found = records.find(tx);
  if (found == std::end(records) || found->second.owner != client) {
    return std::nullopt;
  }
  return found->second.state;
}

upsert_status transaction_store<memory_store_tag>::upsert(
    const client_id_t client,
    const transaction_id_t tx,
    const transaction_state_t& state) {
  auto lock = std::scoped_lock{mutex};
  auto [it, inserted] = records.try_emplace(
      tx, transaction_record_t{.owner = client, .state = state});
  if (inserted) {
    return upsert_status::ok;
  }
  if (it->second.owner != client) {
    return upsert_status::ownership_conflict;
  }
  it->second.state = state;
  return upsert_status::ok;
}

std::size_t transaction_store<memory_store_tag>::size() const {
  auto lock = std::scoped_lock{mutex};
  return records.size();
}

template <>
store_handle_t<memory_store_tag> make_store<memory_store_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  return std::make_shared<transaction_store<memory_store_tag>>();
}

}  // namespace bursar::storage
