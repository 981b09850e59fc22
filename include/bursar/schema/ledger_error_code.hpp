#pragma once

#include <bursar/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

namespace bursar::schema {

enum class ledger_error_code : uint32_t {
  account_frozen = 1,
  duplicate_transaction = 2,
  insufficient_funds = 3,
  transaction_not_found = 4,
  transaction_not_disputed = 5,
  transaction_already_disputed = 6,
  transaction_cannot_be_disputed = 7,
};

inline constexpr auto kLedgerErrorCodeMappings = enum_mappings_t<
    ledger_error_code, 7>{
    std::pair<std::string_view, ledger_error_code>{
        "account_frozen", ledger_error_code::account_frozen},
    std::pair<std::string_view, ledger_error_code>{
        "duplicate_transaction", ledger_error_code::duplicate_transaction},
    std::pair<std::string_view, ledger_error_code>{
        "insufficient_funds", ledger_error_code::insufficient_funds},
    std::pair<std::string_view, ledger_error_code>{
        "transaction_not_found", ledger_error_code::transaction_not_found},
    std::pair<std::string_view, ledger_error_code>{
        "transaction_not_disputed",
        ledger_error_code::transaction_not_disputed},
    std::pair<std::string_view, ledger_error_code>{
        "transaction_already_disputed",
        ledger_error_code::transaction_already_disputed},
    std::pair<std::string_view, ledger_error_code>{
        "transaction_cannot_be_disputed",
        ledger_error_code::transaction_cannot_be_disputed}};

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return to_string(value, kLedgerErrorCodeMappings, "unknown");
}

}  // namespace bursar::schema
