#pragma once

#include <bursar/common/critical.hpp>
#include <bursar/schema/event.hpp>
#include <bursar/schema/primitives.hpp>
#include <bursar/schema/record.hpp>
#include <bursar/storage/memory/storage.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <bursar/validation/event_validator.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bursar::testing {

inline constexpr auto kClient = bursar::schema::client_id_t{1337};

inline bursar::schema::amount_t amount(const std::string_view text) {
  auto parsed = bursar::schema::try_make_amount(text);
  if (!parsed) {
    bursar::common::critical("test amount '{}' is not a plain decimal", text);
  }
  return *parsed;
}

inline bursar::schema::event_t make_event(
    const std::string_view type,
    const bursar::schema::client_id_t client,
    const bursar::schema::transaction_id_t tx,
    const std::optional<std::string_view> value = std::nullopt) {
  auto record = bursar::schema::record_t{
      .type = std::string{type}, .client = client, .tx = tx};
  if (value) {
    record.amount = amount(*value);
  }
  auto error = bursar::schema::validation_error_code{};
  auto event = bursar::validation::make_event(record, error);
  if (!event) {
    bursar::common::critical("test event failed validation");
  }
  return *event;
}

inline bursar::schema::event_t make_event(
    const std::string_view type,
    const bursar::schema::transaction_id_t tx,
    const std::optional<std::string_view> value = std::nullopt) {
  return make_event(type, kClient, tx, value);
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(sequence++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Builds a fresh store per backend so suites can run over both.
template <typename Library>
struct store_factory;

template <>
struct store_factory<bursar::storage::memory_store_tag> final {
  static bursar::storage::store_handle_t<bursar::storage::memory_store_tag>
  make() {
    return bursar::storage::make_store<bursar::storage::memory_store_tag>();
  }
};

template <>
struct store_factory<bursar::storage::rocksdb_store_tag> final {
  static bursar::storage::store_handle_t<bursar::storage::rocksdb_store_tag>
  make() {
    return bursar::storage::make_store<bursar::storage::rocksdb_store_tag>(
        make_db_path("bursar_store"));
  }
};

}  // namespace bursar::testing
