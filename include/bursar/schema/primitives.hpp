#pragma once
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bursar::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using client_id_t = uint16_t;
using transaction_id_t = uint32_t;
// Decimal, so sums and differences of input amounts stay exact.
using amount_t = boost::multiprecision::cpp_dec_float_50;

bytes_t make_bytes(const std::string& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);

std::string make_string(const bytes_t& bytes);

/// Parse a plain decimal literal: optional sign, digits, optional fraction.
/// Exponents, NaN and infinity are rejected.
std::optional<amount_t> try_make_amount(std::string_view text);

/// Fixed notation with exactly `precision` fractional digits. A precision of 0
/// prints the value rounded to a whole number.
std::string format_amount(const amount_t& amount, uint32_t precision);

/// Scientific notation keeping every significant digit, with trailing zeros
/// of the mantissa dropped. Parses back to the same value; used for storage.
std::string serialize_amount(const amount_t& amount);

}  // namespace bursar::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
