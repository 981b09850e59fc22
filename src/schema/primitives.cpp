#include <bursar/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <ios>
#include <iterator>

namespace bursar::schema {

namespace {

// cpp_dec_float_50 keeps 50 significant digits; leave headroom so that
// sums of parsed amounts never round.
constexpr auto kMaxAmountDigits = std::size_t{40};

bool is_digit(const char c) {
  return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool is_plain_decimal(std::string_view text) {
  if (!text.empty() && (text.front() == '+' || text.front() == '-')) {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return false;
  }

  auto digits = std::size_t{0};
  auto seen_point = false;
  for (const auto c : text) {
    if (c == '.') {
      if (seen_point) {
        return false;
      }
      seen_point = true;
      continue;
    }
    if (!is_digit(c)) {
      return false;
    }
    ++digits;
  }
  return digits > 0 && digits <= kMaxAmountDigits;
}

}  // namespace

bytes_t make_bytes(const std::string& bytes) {
  return {std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return {std::begin(bytes), std::end(bytes)};
}

std::optional<amount_t> try_make_amount(std::string_view text) {
  if (!is_plain_decimal(text)) {
    return std::nullopt;
  }
  auto normalized = std::string{};
  if (text.front() == '+' || text.front() == '-') {
    if (text.front() == '-') {
      normalized.push_back('-');
    }
    text.remove_prefix(1);
  }
  if (text.front() == '.') {
    normalized.push_back('0');
  }
  normalized.append(text);
  if (normalized.back() == '.') {
    normalized.push_back('0');
  }
  return amount_t{normalized.c_str()};
}

std::string format_amount(const amount_t& amount, const uint32_t precision) {
  if (precision == 0) {
    // str() reads zero digits as "every digit", so round here and drop the
    // fraction of a one-digit rendering.
    const auto rounded = amount_t{boost::multiprecision::round(amount)};
    auto text = format_amount(rounded, 1);
    return text.substr(0, text.find('.'));
  }

  auto text = amount.str(static_cast<std::streamsize>(precision),
                         std::ios_base::fixed);
  // A value that rounds to zero prints without a sign.
  if (!text.empty() && text.front() == '-' &&
      text.find_first_not_of("0.", 1) == std::string::npos) {
    text.erase(0, 1);
  }
  return text;
}

std::string serialize_amount(const amount_t& amount) {
  auto text = amount.str(0, std::ios_base::scientific);
  const auto exponent = text.find_first_of("eE");
  if (exponent == std::string::npos) {
    return text;
  }
  auto mantissa = text.substr(0, exponent);
  if (mantissa.find('.') != std::string::npos) {
    mantissa.erase(mantissa.find_last_not_of('0') + 1);
    if (mantissa.back() == '.') {
      mantissa.pop_back();
    }
  }
  return mantissa + text.substr(exponent);
}

}  // namespace bursar::schema
