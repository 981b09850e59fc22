#include <spdlog/spdlog.h>
#include <bursar/common/critical.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <iterator>

using namespace bursar::schema;

namespace bursar::storage {

namespace detail {

std::string make_transaction_key(const transaction_id_t tx) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(tx);
  auto key = std::string{kTransactionPrefix};
  key.append(reinterpret_cast<const char*>(encoded.data()), encoded.size());
  return key;
}

bytes_t encode_record(const transaction_record_t& record) {
  auto encoder = encoder_t{};
  return encoder.encode(encoded_record_t{
      record.owner, static_cast<uint8_t>(kind_of(record.state)),
      make_bytes(serialize_amount(amount_of(record.state)))});
}

std::optional<transaction_record_t> decode_record(const bytes_view_t& bytes) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<encoded_record_t>(bytes);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  auto& [owner, kind, amount_text] = decoded.value();
  if (kind > static_cast<uint8_t>(transaction_state_kind::withdrawn)) {
    return std::nullopt;
  }
  auto text = make_string(amount_text);
  if (text.empty()) {
    return std::nullopt;
  }
  return transaction_record_t{
      .owner = owner,
      .state = make_transaction_state(
          static_cast<transaction_state_kind>(kind), amount_t{text.c_str()})};
}

}  // namespace detail

transaction_store<rocksdb_store_tag>::~transaction_store() {
  if (!database) {
    return;
  }
  auto status = database->Close();
  if (!status.ok()) {
    spdlog::warn("Failed to close RocksDB at {}: {}", path, status.ToString());
  }
  database.reset();
  status = ROCKSDB_NAMESPACE::DestroyDB(path, ROCKSDB_NAMESPACE::Options{});
  if (!status.ok()) {
    spdlog::warn("Failed to remove scratch RocksDB at {}: {}", path,
                 status.ToString());
  }
}

std::optional<transaction_record_t> transaction_store<rocksdb_store_tag>::load(
    const transaction_id_t tx) const {
  if (!database) {
    bursar::common::critical("RocksDB store at {} is not open", path);
  }
  auto key = detail::make_transaction_key(tx);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    bursar::common::critical("failed to read transaction {} from RocksDB: {}",
                             tx, status.ToString());
  }
  auto record = detail::decode_record(bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()});
  if (!record) {
    bursar::common::critical("stored record for transaction {} is corrupt", tx);
  }
  return record;
}

std::optional<transaction_state_t> transaction_store<rocksdb_store_tag>::get(
    const client_id_t client,
    const transaction_id_t tx) const {
  auto record = load(tx);
  if (!record || record->owner != client) {
    return std::nullopt;
  }
  return record->state;
}

upsert_status transaction_store<rocksdb_store_tag>::upsert(
    const client_id_t client,
    const transaction_id_t tx,
    const transaction_state_t& state) {
  auto key = detail::make_transaction_key(tx);
  auto lock = std::scoped_lock{write_mutex};

  auto existing = load(tx);
  if (existing && existing->owner != client) {
    return upsert_status::ownership_conflict;
  }

  auto encoded = detail::encode_record(
      transaction_record_t{.owner = client, .state = state});
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, key,
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!status.ok()) {
    bursar::common::critical("failed to write transaction {} to RocksDB: {}",
                             tx, status.ToString());
  }
  if (!existing) {
    ++count;
  }
  return upsert_status::ok;
}

std::size_t transaction_store<rocksdb_store_tag>::size() const {
  auto lock = std::scoped_lock{write_mutex};
  return count;
}

template <>
store_handle_t<rocksdb_store_tag> make_store<rocksdb_store_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  auto destroyed = ROCKSDB_NAMESPACE::DestroyDB(std::string{path}, options);
  if (!destroyed.ok()) {
    bursar::common::critical("failed to clear scratch RocksDB at {}: {}",
                             path, destroyed.ToString());
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    bursar::common::critical("failed to open RocksDB at {}: {}", path,
                             status.ToString());
  }
  spdlog::info("Opened scratch RocksDB transaction store at {}", path);

  auto store = std::make_shared<transaction_store<rocksdb_store_tag>>();
  store->database.reset(database);
  store->path = std::string{path};
  return store;
}

}  // namespace bursar::storage
