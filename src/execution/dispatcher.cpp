#include <spdlog/spdlog.h>
#include <bursar/common/critical.hpp>
#include <bursar/execution/dispatcher.hpp>
#include <bursar/storage/memory/storage.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <iterator>
#include <utility>

using namespace bursar::schema;

namespace bursar::execution {

template <typename Library>
dispatcher<Library>::dispatcher(bursar::storage::store_handle_t<Library> store,
                                const std::size_t workers,
                                const std::size_t queue_capacity)
    : queue_capacity_{std::max<std::size_t>(queue_capacity, 1)} {
  if (workers == 0) {
    bursar::common::critical("dispatcher requires at least one worker");
  }
  workers_.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    workers_.push_back(std::make_unique<worker>(store));
  }
  for (auto& w : workers_) {
    w->thread = std::thread{[this, self = w.get()] { run(*self); }};
  }
  spdlog::debug("Dispatcher started {} worker(s)", workers_.size());
}

template <typename Library>
dispatcher<Library>::~dispatcher() {
  stop();
}

template <typename Library>
void dispatcher<Library>::submit(event_t event) {
  if (finished_) {
    bursar::common::critical("event submitted after dispatcher finished");
  }
  auto& target = *workers_[event.client % workers_.size()];
  auto lock = std::unique_lock{target.mutex};
  target.not_full.wait(lock,
                       [&] { return target.queue.size() < queue_capacity_; });
  target.queue.push_back(std::move(event));
  lock.unlock();
  target.not_empty.notify_one();
}

template <typename Library>
void dispatcher<Library>::run(worker& self) {
  while (true) {
    auto lock = std::unique_lock{self.mutex};
    self.not_empty.wait(lock, [&] { return self.closed || !self.queue.empty(); });
    if (self.queue.empty()) {
      return;
    }
    auto batch = std::deque<event_t>{};
    batch.swap(self.queue);
    lock.unlock();
    self.not_full.notify_all();

    for (const auto& event : batch) {
      static_cast<void>(self.book.apply(event));
    }
  }
}

template <typename Library>
void dispatcher<Library>::stop() {
  for (auto& w : workers_) {
    {
      auto lock = std::scoped_lock{w->mutex};
      w->closed = true;
    }
    w->not_empty.notify_all();
  }
  for (auto& w : workers_) {
    if (w->thread.joinable()) {
      w->thread.join();
    }
  }
}

template <typename Library>
std::vector<account_t> dispatcher<Library>::finish() {
  if (finished_) {
    return accounts_;
  }
  stop();
  finished_ = true;

  for (const auto& w : workers_) {
    stats_.applied += w->book.stats().applied;
    stats_.rejected += w->book.stats().rejected;
    auto part = w->book.accounts();
    accounts_.insert(std::end(accounts_), std::make_move_iterator(std::begin(part)),
                     std::make_move_iterator(std::end(part)));
  }
  std::sort(std::begin(accounts_), std::end(accounts_),
            [](const account_t& lhs, const account_t& rhs) {
              return lhs.client < rhs.client;
            });
  return accounts_;
}

template class dispatcher<bursar::storage::memory_store_tag>;
template class dispatcher<bursar::storage::rocksdb_store_tag>;

}  // namespace bursar::execution
