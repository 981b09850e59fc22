#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <bursar/schema/encoding/scale/encoder.hpp>
#include <bursar/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

namespace bursar::storage {

namespace detail {

using encoder_t = bursar::schema::encoding::encoder<
    bursar::schema::encoding::scale_encoder_tag>;

// (owner, state kind, amount text)
using encoded_record_t =
    std::tuple<uint16_t, uint8_t, bursar::schema::bytes_t>;

inline constexpr auto kTransactionPrefix = std::string_view{"TX|"};

std::string make_transaction_key(bursar::schema::transaction_id_t tx);

bursar::schema::bytes_t encode_record(
    const bursar::schema::transaction_record_t& record);

std::optional<bursar::schema::transaction_record_t> decode_record(
    const bursar::schema::bytes_view_t& bytes);

}  // namespace detail

struct rocksdb_store_tag {};

/// Scratch RocksDB backing for transaction sets that outgrow memory. The
/// database directory is wiped when the store is opened and again when it is
/// destroyed; nothing carries over between runs.
template <>
struct transaction_store<rocksdb_store_tag> final {
  transaction_store() = default;
  transaction_store(const transaction_store&) = delete;
  transaction_store& operator=(const transaction_store&) = delete;
  ~transaction_store();

  std::optional<bursar::schema::transaction_state_t> get(
      bursar::schema::client_id_t client,
      bursar::schema::transaction_id_t tx) const;

  upsert_status upsert(bursar::schema::client_id_t client,
                       bursar::schema::transaction_id_t tx,
                       const bursar::schema::transaction_state_t& state);

  std::size_t size() const;

  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  std::string path;
  // Serialises the ownership check in `upsert` with its write.
  mutable std::mutex write_mutex;
  std::size_t count{};

 private:
  std::optional<bursar::schema::transaction_record_t> load(
      bursar::schema::transaction_id_t tx) const;
};

template <>
store_handle_t<rocksdb_store_tag> make_store<rocksdb_store_tag>(
    const std::string_view& path);

}  // namespace bursar::storage
