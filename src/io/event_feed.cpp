#include <spdlog/spdlog.h>
#include <bursar/io/event_feed.hpp>
#include <bursar/validation/event_validator.hpp>
#include <utility>
#include <variant>

namespace bursar::io {

feed_stats feed_events(csv_reader& reader, const event_sink_t& sink) {
  auto stats = feed_stats{};
  while (auto next = reader.next()) {
    ++stats.rows;
    if (auto* error = std::get_if<row_error>(&*next)) {
      ++stats.malformed;
      spdlog::warn("Skipping line {}: {}", error->line, error->reason);
      continue;
    }

    const auto& record = std::get<bursar::schema::record_t>(*next);
    auto error = bursar::schema::validation_error_code{};
    auto event = bursar::validation::make_event(record, error);
    if (!event) {
      ++stats.invalid;
      spdlog::warn("Skipping line {} ({} for client {} with transaction {}): {}",
                   reader.line(), record.type, record.client, record.tx,
                   bursar::schema::to_string(error));
      continue;
    }
    sink(std::move(*event));
  }
  return stats;
}

}  // namespace bursar::io
