#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <bursar/common/log_level.hpp>
#include <bursar/execution/dispatcher.hpp>
#include <bursar/execution/ledger.hpp>
#include <bursar/io/csv_reader.hpp>
#include <bursar/io/event_feed.hpp>
#include <bursar/io/report_writer.hpp>
#include <bursar/storage/memory/storage.hpp>
#include <bursar/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

namespace po = boost::program_options;

struct options final {
  std::string input_path;
  std::string store;
  std::string store_path;
  std::string log_level;
  std::string log_file;
  std::size_t workers{1};
  uint32_t precision{bursar::io::kDefaultPrecision};
};

void configure_logging(const options& opts,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries the report, so diagnostics go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (!opts.log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        opts.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "bursar", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(level);
}

template <typename Library>
int run(const options& opts,
        bursar::storage::store_handle_t<Library> store,
        std::istream& input) {
  auto reader = bursar::io::csv_reader{input};
  auto accounts = std::vector<bursar::schema::account_t>{};
  auto outcome = bursar::execution::ledger_stats{};
  auto read = bursar::io::feed_stats{};

  if (opts.workers <= 1) {
    auto book = bursar::execution::ledger<Library>{store};
    read = bursar::io::feed_events(
        reader, [&](bursar::schema::event_t event) {
          static_cast<void>(book.apply(event));
        });
    accounts = book.accounts();
    outcome = book.stats();
  } else {
    auto pool = bursar::execution::dispatcher<Library>{store, opts.workers};
    read = bursar::io::feed_events(
        reader, [&](bursar::schema::event_t event) {
          pool.submit(std::move(event));
        });
    accounts = pool.finish();
    outcome = pool.stats();
  }

  spdlog::info(
      "Processed {} row(s): {} malformed, {} invalid, {} applied, {} rejected; "
      "{} client(s), {} transaction(s)",
      read.rows, read.malformed, read.invalid, outcome.applied,
      outcome.rejected, accounts.size(), store->size());

  bursar::io::write_report(std::cout, accounts, opts.precision);
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = options{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"bursar"};
  description.add_options()("help,h", "Show the help message")(
      "verbose,v", "Log progress and rejected records to stderr")(
      "log-level", po::value<std::string>(&opts.log_level),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value<std::string>(&opts.log_file),
      "Also write log output to this file")(
      "workers,w", po::value<std::size_t>(&opts.workers)->default_value(1),
      "Worker threads; clients are sharded across them")(
      "store", po::value<std::string>(&opts.store)->default_value("memory"),
      "Transaction store backend: memory or rocksdb")(
      "store-path",
      po::value<std::string>(&opts.store_path)
          ->default_value("bursar-transactions"),
      "Scratch directory for the rocksdb store; wiped on open")(
      "precision",
      po::value<uint32_t>(&opts.precision)
          ->default_value(bursar::io::kDefaultPrecision),
      "Decimal places in the report")(
      "input", po::value<std::string>(&opts.input_path),
      "CSV file of payment events");

  auto positional = po::positional_options_description{};
  positional.add("input", 1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << "Usage: bursar [options] <input.csv>\n"
              << description << std::endl;
    return 0;
  }
  if (opts.log_level.empty()) {
    opts.log_level = vm.contains("verbose") ? "info" : "off";
  }
  const auto level = bursar::common::try_parse_log_level(opts.log_level);
  if (!level) {
    std::cerr << "unknown log level " << opts.log_level << "\n"
              << description << std::endl;
    return 2;
  }
  if (opts.input_path.empty()) {
    std::cerr << "missing input file\n" << description << std::endl;
    return 2;
  }

  configure_logging(opts, *level);

  auto input = std::ifstream{opts.input_path};
  if (!input) {
    spdlog::error("Failed to open input file {}", opts.input_path);
    std::cerr << "failed to open input file " << opts.input_path << std::endl;
    spdlog::shutdown();
    return 1;
  }

  auto status = 0;
  if (opts.store == "memory") {
    status = run(opts,
                 bursar::storage::make_store<bursar::storage::memory_store_tag>(),
                 input);
  } else if (opts.store == "rocksdb") {
    status = run(opts,
                 bursar::storage::make_store<bursar::storage::rocksdb_store_tag>(
                     opts.store_path),
                 input);
  } else {
    spdlog::error("Unknown store backend '{}'", opts.store);
    std::cerr << "unknown store backend " << opts.store << std::endl;
    status = 2;
  }

  spdlog::shutdown();
  return status;
}
