#pragma once
#include <bursar/storage/storage.hpp>
#include <mutex>
#include <unordered_map>

namespace bursar::storage {

struct memory_store_tag {};

template <>
struct transaction_store<memory_store_tag> final {
  std::optional<bursar::schema::transaction_state_t> get(
      bursar::schema::client_id_t client,
      bursar::schema::transaction_id_t tx) const;

  upsert_status upsert(bursar::schema::client_id_t client,
                       bursar::schema::transaction_id_t tx,
                       const bursar::schema::transaction_state_t& state);

  std::size_t size() const;

  // One coarse lock; every call is a hash lookup so contention stays short.
  mutable std::mutex mutex;
  std::unordered_map<bursar::schema::transaction_id_t,
                     bursar::schema::transaction_record_t>
      records;
};

template <>
store_handle_t<memory_store_tag> make_store<memory_store_tag>(
    const std::string_view& path);

}  // namespace bursar::storage
