#pragma once

#include <bursar/execution/ledger.hpp>
#include <bursar/schema/account.hpp>
#include <bursar/schema/event.hpp>
#include <bursar/storage/storage.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace bursar::execution {

/// Fans events out to worker threads, each owning a disjoint set of clients.
///
/// Events are routed by `client % workers`, so every client lives on exactly
/// one worker and sees its events in submission order. All workers share one
/// transaction store.
template <typename Library>
class dispatcher final {
 public:
  dispatcher(bursar::storage::store_handle_t<Library> store,
             std::size_t workers,
             std::size_t queue_capacity = 4096);

  dispatcher(const dispatcher&) = delete;
  dispatcher& operator=(const dispatcher&) = delete;
  dispatcher(dispatcher&&) = delete;
  dispatcher& operator=(dispatcher&&) = delete;

  ~dispatcher();

  /// Queue `event` for its client's worker. Blocks while that worker's queue
  /// is full.
  void submit(bursar::schema::event_t event);

  /// Drain every queue, stop the workers, and return all accounts ordered by
  /// client id. Later calls return the same accounts.
  std::vector<bursar::schema::account_t> finish();

  /// Totals across workers, gathered by `finish`.
  const ledger_stats& stats() const { return stats_; }

  std::size_t workers() const { return workers_.size(); }

 private:
  struct worker final {
    explicit worker(bursar::storage::store_handle_t<Library> store)
        : book{std::move(store)} {}

    std::mutex mutex;
    std::condition_variable not_empty;
    std::condition_variable not_full;
    std::deque<bursar::schema::event_t> queue;
    bool closed{false};
    ledger<Library> book;
    std::thread thread;
  };

  void run(worker& self);
  void stop();

  std::size_t queue_capacity_;
  std::vector<std::unique_ptr<worker>> workers_;
  bool finished_{false};
  std::vector<bursar::schema::account_t> accounts_;
  ledger_stats stats_;
};

}  // namespace bursar::execution
