#include <bursar/io/report_writer.hpp>
#include <fmt/format.h>

namespace bursar::io {

void write_report(std::ostream& out,
                  const std::vector<bursar::schema::account_t>& accounts,
                  const uint32_t precision) {
  out << "client,available,held,total,locked\n";
  for (const auto& account : accounts) {
    out << fmt::format("{},{},{},{},{}\n", account.client,
                       bursar::schema::format_amount(account.available,
                                                     precision),
                       bursar::schema::format_amount(account.held, precision),
                       bursar::schema::format_amount(account.total, precision),
                       account.locked);
  }
  out.flush();
}

}  // namespace bursar::io
