#include <bursar/validation/event_validator.hpp>

using namespace bursar::schema;

namespace {

std::optional<amount_t> required_amount(const record_t& record,
                                        validation_error_code& error) {
  if (!record.amount.has_value()) {
    error = validation_error_code::missing_amount;
    return std::nullopt;
  }
  if (*record.amount < 0) {
    error = validation_error_code::invalid_amount;
    return std::nullopt;
  }
  return record.amount;
}

}  // namespace

namespace bursar::validation {

std::optional<event_t> make_event(const record_t& record,
                                  validation_error_code& error) {
  auto type = try_from_string<event_type_t>(record.type);
  if (!type) {
    error = validation_error_code::unknown_event_type;
    return std::nullopt;
  }

  auto event = event_t{.client = record.client, .tx = record.tx};
  switch (*type) {
    case event_type_t::deposit: {
      auto amount = required_amount(record, error);
      if (!amount) {
        return std::nullopt;
      }
      event.kind = deposit_t{.amount = std::move(*amount)};
      break;
    }
    case event_type_t::withdrawal: {
      auto amount = required_amount(record, error);
      if (!amount) {
        return std::nullopt;
      }
      event.kind = withdrawal_t{.amount = std::move(*amount)};
      break;
    }
    case event_type_t::dispute:
      event.kind = dispute_t{};
      break;
    case event_type_t::resolve:
      event.kind = resolve_t{};
      break;
    case event_type_t::chargeback:
      event.kind = chargeback_t{};
      break;
  }
  return event;
}

}  // namespace bursar::validation
