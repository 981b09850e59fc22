#pragma once

#include <bursar/schema/record.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <variant>

namespace bursar::io {

/// A row that could not be turned into a record.
struct row_error final {
  uint64_t line{};
  std::string reason;
};

using read_result_t = std::variant<bursar::schema::record_t, row_error>;

/// Streams records out of `type,client,tx,amount` CSV.
///
/// Fields are trimmed and may be quoted. A leading header row is skipped,
/// blank lines are ignored, and the amount column may be empty or missing.
class csv_reader final {
 public:
  explicit csv_reader(std::istream& input);

  /// Next record or row error; std::nullopt once input is exhausted.
  std::optional<read_result_t> next();

  /// Line number of the row returned last.
  uint64_t line() const { return line_; }

 private:
  read_result_t parse(const std::string& text) const;

  std::istream& input_;
  uint64_t line_{};
  bool first_row_{true};
};

}  // namespace bursar::io
