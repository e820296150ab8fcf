#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tally/execution/engine.hpp>
#include <tally/execution/engine_policy.hpp>
#include <tally/execution/state.hpp>
#include <tally/io/account_writer.hpp>
#include <tally/replay/replay.hpp>

#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;

void print_help(const po::options_description& options) {
  std::cerr << "Usage:\n"
            << "  tally [options] <input.csv>\n\n"
            << "Replays deposits, withdrawals, disputes, resolves and "
               "chargebacks and\n"
            << "writes the resulting client accounts to stdout as CSV.\n\n";
  std::cerr << options << '\n';
}

void configure_logging(const std::optional<std::string>& log_file,
                       const spdlog::level::level_enum level) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries the account rows, so diagnostics go to stderr.
  auto sinks = std::vector<spdlog::sink_ptr>{
      std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
  if (log_file) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "tally", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

std::optional<tally::execution::policy_action_t> policy_option(
    const po::variables_map& vm,
    const std::string& name) {
  auto value = vm[name].as<std::string>();
  auto action = tally::execution::try_policy_action_from_string(value);
  if (!action) {
    std::cerr << "--" << name << " must be reject|allow, got '" << value
              << "'\n";
  }
  return action;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto input_path = std::string{};
  auto level_name = std::string{};

  auto options = po::options_description{"tally options"};
  options.add_options()("help,h", "Show the help message")(
      "verbose,v", "Log every applied transaction")(
      "log-level", po::value<std::string>(&level_name)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(), "Also write diagnostics to a file")(
      "config", po::value<std::string>(),
      "INI file with any of these long options")(
      "locked-account-disputes",
      po::value<std::string>()->default_value("reject"),
      "reject|allow dispute, resolve and chargeback on locked accounts")(
      "redispute-after-chargeback",
      po::value<std::string>()->default_value("reject"),
      "reject|allow disputing a charged-back transaction again")(
      "no-headers", po::bool_switch(),
      "Input has no header row; columns are type,client,tx,amount");

  auto hidden = po::options_description{};
  hidden.add_options()("input", po::value<std::string>(&input_path),
                       "input CSV file");

  auto command_line = po::options_description{};
  command_line.add(options).add(hidden);

  auto positional = po::positional_options_description{};
  positional.add("input", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto config_file = std::ifstream{vm["config"].as<std::string>()};
      if (!config_file) {
        std::cerr << "Cannot open config file '"
                  << vm["config"].as<std::string>() << "'\n";
        return kExitUsage;
      }
      po::store(po::parse_config_file(config_file, options), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n';
    print_help(options);
    return kExitUsage;
  }

  if (vm.contains("help")) {
    print_help(options);
    return 0;
  }
  if (input_path.empty()) {
    std::cerr << "Missing input file\n";
    print_help(options);
    return kExitUsage;
  }

  auto level = spdlog::level::from_str(level_name);
  if (level == spdlog::level::off && level_name != "off") {
    std::cerr << "Unknown log level '" << level_name << "'\n";
    return kExitUsage;
  }
  if (vm.contains("verbose") && level > spdlog::level::debug) {
    level = spdlog::level::debug;
  }

  auto locked_account_disputes =
      policy_option(vm, "locked-account-disputes");
  auto redispute_after_chargeback =
      policy_option(vm, "redispute-after-chargeback");
  if (!locked_account_disputes || !redispute_after_chargeback) {
    return kExitUsage;
  }

  auto log_file = std::optional<std::string>{};
  if (vm.contains("log-file")) {
    log_file = vm["log-file"].as<std::string>();
  }
  configure_logging(log_file, level);

  auto policy = tally::execution::engine_policy{
      .locked_account_disputes = *locked_account_disputes,
      .redispute_after_chargeback = *redispute_after_chargeback};
  spdlog::debug("Locked account disputes: {}, redispute after chargeback: {}",
                tally::execution::to_string(policy.locked_account_disputes),
                tally::execution::to_string(policy.redispute_after_chargeback));

  auto input = std::ifstream{input_path};
  if (!input) {
    spdlog::error("Cannot open input file '{}'", input_path);
    spdlog::shutdown();
    return kExitFailure;
  }

  auto engine = tally::execution::engine{policy};
  auto state = tally::execution::state{};
  auto options_for_replay =
      tally::replay::replay_options{.has_headers = !vm["no-headers"].as<bool>()};
  auto result = tally::replay::run(input, engine, state, options_for_replay);
  if (!result.ok()) {
    spdlog::shutdown();
    return kExitFailure;
  }

  if (!tally::io::write_accounts(std::cout, state.accounts)) {
    spdlog::error("Failed to write accounts to stdout");
    spdlog::shutdown();
    return kExitFailure;
  }

  spdlog::shutdown();
  return 0;
}
