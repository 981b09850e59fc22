#pragma once

#include <bursar/io/csv_reader.hpp>
#include <bursar/schema/event.hpp>
#include <cstdint>
#include <functional>

namespace bursar::io {

struct feed_stats final {
  uint64_t rows{};
  uint64_t malformed{};
  uint64_t invalid{};
};

using event_sink_t = std::function<void(bursar::schema::event_t)>;

/// Drain `reader`, handing every valid event to `sink` in input order.
///
/// Malformed rows and records that fail validation are logged at warn with
/// their line number, counted, and skipped.
feed_stats feed_events(csv_reader& reader, const event_sink_t& sink);

}  // namespace bursar::io
