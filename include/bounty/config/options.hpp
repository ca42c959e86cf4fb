#pragma once

#include <bounty/config/engine_config.hpp>
#include <bounty/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bounty::config {

struct funding_t final {
  bounty::schema::account_id_t account{};
  bounty::schema::amount_t amount{};
};

/// Everything `bountyd` needs to start.
struct node_config final {
  engine_config engine;
  uint64_t sweep_interval_seconds{60};
  uint64_t sweep_batch_size{100};
  std::string db_path{"bounty.db"};
  std::string grpc_port{"0.0.0.0:26659"};
  std::string log_file{"bountyd.log"};
  std::vector<bounty::schema::account_id_t> moderators;
  std::vector<funding_t> funding;
  bool verbose{};
};

struct parse_result_t final {
  std::optional<node_config> config;
  // Set when --help was requested; holds the rendered option list.
  std::optional<std::string> help;
  std::string error;
};

/// Parse command line (and the optional `--config` INI file, whose values
/// are overridden by the command line) into a validated node_config.
parse_result_t parse_options(int argc, const char* const argv[]);

/// Parse `hex:amount`.
std::optional<funding_t> try_parse_funding(std::string_view value);

}  // namespace bounty::config
