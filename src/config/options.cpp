#include <boost/program_options.hpp>
#include <bounty/config/options.hpp>
#include <charconv>
#include <fstream>
#include <sstream>

namespace po = boost::program_options;

namespace bounty::config {

std::optional<std::string> validate(const engine_config& config) {
  if (config.min_stake == 0) {
    return "min-stake must be positive";
  }
  if (config.min_stake > config.max_stake) {
    return "min-stake must not exceed max-stake";
  }
  if (config.fee_basis_points > 10000) {
    return "fee-basis-points must not exceed 10000";
  }
  if (config.acceptance_window == 0 || config.dispute_window == 0 ||
      config.rate_window == 0) {
    return "windows must be non-zero";
  }
  return std::nullopt;
}

std::optional<funding_t> try_parse_funding(const std::string_view value) {
  auto separator = value.find(':');
  if (separator == std::string_view::npos) {
    return std::nullopt;
  }
  auto account = bounty::schema::try_make_hash32(value.substr(0, separator));
  if (!account) {
    return std::nullopt;
  }
  auto amount_text = value.substr(separator + 1);
  auto amount = bounty::schema::amount_t{};
  auto [end, ec] = std::from_chars(
      amount_text.data(), amount_text.data() + amount_text.size(), amount);
  if (ec != std::errc{} || end != amount_text.data() + amount_text.size() ||
      amount_text.empty()) {
    return std::nullopt;
  }
  return funding_t{.account = *account, .amount = amount};
}

parse_result_t parse_options(const int argc, const char* const argv[]) {
  auto result = parse_result_t{};
  auto config = node_config{};
  auto acceptance_window_hours = uint64_t{};
  auto dispute_window_hours = uint64_t{};
  auto rate_window_hours = uint64_t{};
  auto config_path = std::string{};
  auto moderators = std::vector<std::string>{};
  auto funding = std::vector<std::string>{};

  auto description = po::options_description{"Bounty"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI-style configuration file")(
      "min-stake", po::value<uint64_t>(&config.engine.min_stake)
                       ->default_value(config.engine.min_stake),
      "Lowest accepted stake in minor units")(
      "max-stake", po::value<uint64_t>(&config.engine.max_stake)
                       ->default_value(config.engine.max_stake),
      "Highest accepted stake in minor units")(
      "acceptance-window-hours",
      po::value<uint64_t>(&acceptance_window_hours)->default_value(72),
      "Hours an open wager waits for an acceptor")(
      "dispute-window-hours",
      po::value<uint64_t>(&dispute_window_hours)->default_value(24),
      "Hours after the first proof during which a dispute may be opened")(
      "fee-basis-points",
      po::value<uint32_t>(&config.engine.fee_basis_points)
          ->default_value(config.engine.fee_basis_points),
      "Platform fee in basis points")(
      "max-created-per-window",
      po::value<uint32_t>(&config.engine.max_created_per_window)
          ->default_value(config.engine.max_created_per_window),
      "Wagers a creator may create per rate window")(
      "rate-window-hours",
      po::value<uint64_t>(&rate_window_hours)->default_value(24),
      "Length of the creation rate window in hours")(
      "max-active-accepted",
      po::value<uint32_t>(&config.engine.max_active_accepted)
          ->default_value(config.engine.max_active_accepted),
      "Active wagers a user may hold as acceptor")(
      "min-dispute-reason",
      po::value<uint32_t>(&config.engine.min_dispute_reason)
          ->default_value(config.engine.min_dispute_reason),
      "Minimum dispute reason length")(
      "sweep-interval-seconds",
      po::value<uint64_t>(&config.sweep_interval_seconds)
          ->default_value(config.sweep_interval_seconds),
      "Expiry sweeper period")(
      "sweep-batch-size",
      po::value<uint64_t>(&config.sweep_batch_size)
          ->default_value(config.sweep_batch_size),
      "Wagers handled per category per sweep")(
      "db-path,d",
      po::value<std::string>(&config.db_path)->default_value(config.db_path),
      "RocksDB directory")(
      "grpc-port,g",
      po::value<std::string>(&config.grpc_port)
          ->default_value(config.grpc_port),
      "IP:Port for the gRPC server")(
      "moderator,m", po::value<std::vector<std::string>>(&moderators),
      "Moderator account id (hex), repeatable")(
      "fund,f", po::value<std::vector<std::string>>(&funding),
      "Seed wallet balance as hex:amount, repeatable")(
      "log-file",
      po::value<std::string>(&config.log_file)->default_value(config.log_file),
      "Log file path")("verbose,v", "Enable verbose output");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        result.error = "cannot open config file " + path;
        return result;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    result.error = ex.what();
    return result;
  }

  if (vm.contains("help")) {
    auto stream = std::ostringstream{};
    stream << description;
    result.help = stream.str();
    return result;
  }

  config.verbose = vm.contains("verbose");
  config.engine.acceptance_window =
      bounty::common::hours(acceptance_window_hours);
  config.engine.dispute_window = bounty::common::hours(dispute_window_hours);
  config.engine.rate_window = bounty::common::hours(rate_window_hours);

  for (const auto& moderator : moderators) {
    auto account = bounty::schema::try_make_hash32(moderator);
    if (!account) {
      result.error = "invalid moderator id " + moderator;
      return result;
    }
    config.moderators.push_back(*account);
  }
  for (const auto& entry : funding) {
    auto parsed = try_parse_funding(entry);
    if (!parsed) {
      result.error = "invalid fund entry " + entry;
      return result;
    }
    config.funding.push_back(*parsed);
  }

  if (auto error = validate(config.engine)) {
    result.error = *error;
    return result;
  }
  if (config.sweep_interval_seconds == 0 || config.sweep_batch_size == 0) {
    result.error = "sweep interval and batch size must be positive";
    return result;
  }

  result.config = std::move(config);
  return result;
}

}  // namespace bounty::config
