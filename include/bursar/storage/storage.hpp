#pragma once
#include <bursar/schema/primitives.hpp>
#include <bursar/schema/transaction_state.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace bursar::storage {

enum class upsert_status : uint8_t {
  ok = 0,
  ownership_conflict = 1,
};

/// Authoritative per-transaction records shared by every client of a run.
///
/// A backend specialises this template for its tag. Every specialisation
/// provides the same capability; `get` and `upsert` on one transaction id are
/// linearizable, and the ownership check inside `upsert` is atomic with the
/// write it guards.
template <typename Library>
struct transaction_store {
  /// Stored state of `tx`, or std::nullopt when `tx` does not exist or is
  /// owned by a client other than `client`.
  std::optional<bursar::schema::transaction_state_t> get(
      bursar::schema::client_id_t client,
      bursar::schema::transaction_id_t tx) const;

  /// Create `tx` bound to `client`, or overwrite its state when `client`
  /// already owns it. Returns `ownership_conflict` without writing when
  /// another client owns `tx`.
  upsert_status upsert(bursar::schema::client_id_t client,
                       bursar::schema::transaction_id_t tx,
                       const bursar::schema::transaction_state_t& state);

  /// Number of transaction ids recorded so far.
  std::size_t size() const;
};

template <typename Library>
using store_handle_t = std::shared_ptr<transaction_store<Library>>;

/// Construct a shared store. `path` is ignored by in-memory backends.
template <typename Library>
store_handle_t<Library> make_store(const std::string_view& path = {});

}  // namespace bursar::storage
