#pragma once

#include <bursar/schema/account.hpp>
#include <cstdint>
#include <ostream>
#include <vector>

namespace bursar::io {

inline constexpr auto kDefaultPrecision = uint32_t{4};

/// Write `client,available,held,total,locked` followed by one row per
/// account, in the order given.
void write_report(std::ostream& out,
                  const std::vector<bursar::schema::account_t>& accounts,
                  uint32_t precision = kDefaultPrecision);

}  // namespace bursar::io
