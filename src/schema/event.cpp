#include <bursar/schema/event.hpp>

namespace bursar::schema {

event_type_t type_of(const event_kind_t& kind) {
  return std::visit(
      overloaded{
          [](const deposit_t&) { return event_type_t::deposit; },
          [](const withdrawal_t&) { return event_type_t::withdrawal; },
          [](const dispute_t&) { return event_type_t::dispute; },
          [](const resolve_t&) { return event_type_t::resolve; },
          [](const chargeback_t&) { return event_type_t::chargeback; }},
      kind);
}

}  // namespace bursar::schema
