#pragma once

#include <bursar/schema/event.hpp>
#include <bursar/schema/record.hpp>
#include <bursar/schema/validation_error_code.hpp>
#include <optional>

namespace bursar::validation {

/// Build a trusted event from an input record.
///
/// Fails with `unknown_event_type` for any type other than the five exact
/// lowercase literals, with `missing_amount` when a deposit or withdrawal has
/// no amount, and with `invalid_amount` when that amount is negative. Amounts
/// on dispute, resolve and chargeback records are dropped unchecked. On
/// failure `error` is set and std::nullopt is returned.
std::optional<bursar::schema::event_t> make_event(
    const bursar::schema::record_t& record,
    bursar::schema::validation_error_code& error);

}  // namespace bursar::validation
