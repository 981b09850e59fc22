#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>
#include <bursar/io/csv_reader.hpp>
#include <charconv>
#include <fmt/format.h>
#include <string_view>
#include <system_error>
#include <vector>

using namespace bursar::schema;

namespace {

using tokenizer_t = boost::tokenizer<boost::escaped_list_separator<char>>;

template <typename T>
std::optional<T> parse_id(const std::string_view text) {
  auto value = T{};
  auto [end, error] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (error != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::vector<std::string>> split(const std::string& text,
                                              std::string& error) {
  auto fields = std::vector<std::string>{};
  try {
    auto tokens = tokenizer_t{text};
    for (const auto& token : tokens) {
      fields.push_back(boost::algorithm::trim_copy(token));
    }
  } catch (const boost::escaped_list_error& ex) {
    error = ex.what();
    return std::nullopt;
  }
  return fields;
}

bool is_header(const std::string& text) {
  auto error = std::string{};
  auto fields = split(text, error);
  return fields && !fields->empty() && fields->front() == "type";
}

}  // namespace

namespace bursar::io {

csv_reader::csv_reader(std::istream& input) : input_{input} {}

std::optional<read_result_t> csv_reader::next() {
  auto text = std::string{};
  while (std::getline(input_, text)) {
    ++line_;
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
    if (boost::algorithm::trim_copy(text).empty()) {
      continue;
    }

    if (first_row_) {
      first_row_ = false;
      if (is_header(text)) {
        continue;
      }
    }
    return parse(text);
  }
  return std::nullopt;
}

read_result_t csv_reader::parse(const std::string& text) const {
  auto error = std::string{};
  auto fields = split(text, error);
  if (!fields) {
    return row_error{.line = line_, .reason = error};
  }
  if (fields->size() < 3 || fields->size() > 4) {
    return row_error{
        .line = line_,
        .reason = fmt::format("expected 3 or 4 columns, found {}",
                              fields->size())};
  }

  auto& columns = *fields;
  auto client = parse_id<client_id_t>(columns[1]);
  if (!client) {
    return row_error{.line = line_,
                     .reason = fmt::format("invalid client id '{}'",
                                           columns[1])};
  }
  auto tx = parse_id<transaction_id_t>(columns[2]);
  if (!tx) {
    return row_error{.line = line_,
                     .reason = fmt::format("invalid transaction id '{}'",
                                           columns[2])};
  }

  auto record = record_t{.type = columns[0], .client = *client, .tx = *tx};
  if (columns.size() == 4 && !columns[3].empty()) {
    record.amount = try_make_amount(columns[3]);
    if (!record.amount) {
      return row_error{.line = line_,
                       .reason = fmt::format("invalid amount '{}'",
                                             columns[3])};
    }
  }
  return record;
}

}  // namespace bursar::io
