#include <bastion/access/redemption_lock_ledger.hpp>
#include <bastion/config/service_config.hpp>
#include <bastion/schema/role_id.hpp>

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <fstream>

namespace po = boost::program_options;

using namespace bastion::schema;

namespace bastion::config {

namespace {

po::options_description make_file_options() {
  auto options = po::options_description{"Service"};
  options.add_options()(
      "db-path", po::value<std::string>()->default_value("bastion.db"),
      "RocksDB directory")(
      "redemption-delay", po::value<duration_seconds_t>()->default_value(0),
      "Redemption delay in seconds (at most 604800)")(
      "schedule-expiration",
      po::value<duration_seconds_t>()->default_value(7 * 24 * 60 * 60),
      "Lifetime of a ready scheduled operation, 0 disables expiry")(
      "minimum-setback",
      po::value<duration_seconds_t>()->default_value(5 * 24 * 60 * 60),
      "Minimum setback of grant delay decreases")(
      "authority", po::value<std::string>(),
      "Hex id of the authority target")(
      "initial-admin", po::value<std::string>(),
      "Hex account granted the admin role on first start")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace, debug, info, warn, err, critical or off")(
      "log-file", po::value<std::string>()->default_value("bastiond.log"),
      "Log file path");
  return options;
}

hash32_t parse_hash(const po::variables_map& vm, const char* name) {
  if (!vm.count(name)) {
    return make_zero_hash();
  }
  const auto& value = vm[name].as<std::string>();
  auto parsed = try_make_hash32(value);
  if (!parsed) {
    throw config_error{fmt::format("--{}: expected 64 hex digits, got '{}'",
                                   name, value)};
  }
  return *parsed;
}

role_id_t parse_role(const po::variables_map& vm, const char* name) {
  const auto& value = vm[name].as<std::string>();
  auto role = try_parse_role(value);
  if (!role) {
    throw config_error{fmt::format("--{}: unknown role '{}'", name, value)};
  }
  return *role;
}

}  // namespace

po::options_description make_options_description() {
  auto generic = po::options_description{"Bastion"};
  generic.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI configuration file");

  auto inspection = po::options_description{"Inspection"};
  inspection.add_options()("lock-time", po::value<std::string>(),
                           "Print the redemption lock time of an account")(
      "min-delay", po::value<std::string>(),
      "Print the minimal execution delay of a role")(
      "role-admin", po::value<std::string>(), "Print the admin of a role")(
      "dump-locks", "Print every redemption lock");

  auto all = po::options_description{};
  all.add(generic).add(make_file_options()).add(inspection);
  return all;
}

std::optional<role_id_t> try_parse_role(const std::string& value) {
  if (auto named = try_role_from_string(value)) {
    return named;
  }
  auto role = role_id_t{};
  auto [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), role);
  if (error != std::errc{} || end != value.data() + value.size() ||
      value.empty()) {
    return std::nullopt;
  }
  return role;
}

service_config parse_service_config(const int argc, const char* const argv[]) {
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, make_options_description()),
              vm);
    if (vm.count("config")) {
      const auto& path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        throw config_error{fmt::format("cannot read config file '{}'", path)};
      }
      po::store(po::parse_config_file(file, make_file_options()), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    throw config_error{e.what()};
  }

  auto config = service_config{};
  config.show_help = vm.count("help") > 0;
  config.db_path = vm["db-path"].as<std::string>();
  config.redemption_delay_seconds =
      vm["redemption-delay"].as<duration_seconds_t>();
  config.schedule_expiration_seconds =
      vm["schedule-expiration"].as<duration_seconds_t>();
  config.minimum_setback_seconds =
      vm["minimum-setback"].as<duration_seconds_t>();
  config.authority = parse_hash(vm, "authority");
  config.initial_admin = parse_hash(vm, "initial-admin");
  config.log_file = vm["log-file"].as<std::string>();

  const auto& level = vm["log-level"].as<std::string>();
  config.log_level = spdlog::level::from_str(level);
  if (config.log_level == spdlog::level::off && level != "off") {
    throw config_error{fmt::format("--log-level: unknown level '{}'", level)};
  }

  if (config.redemption_delay_seconds >
      bastion::access::redemption_lock_ledger::kMaxRedemptionDelay) {
    throw config_error{fmt::format(
        "--redemption-delay: {}s exceeds the maximum of {}s",
        config.redemption_delay_seconds,
        bastion::access::redemption_lock_ledger::kMaxRedemptionDelay)};
  }

  if (vm.count("lock-time")) {
    config.lock_time_account = parse_hash(vm, "lock-time");
  }
  if (vm.count("min-delay")) {
    config.min_delay_role = parse_role(vm, "min-delay");
  }
  if (vm.count("role-admin")) {
    config.role_admin_role = parse_role(vm, "role-admin");
  }
  config.dump_locks = vm.count("dump-locks") > 0;
  return config;
}

bastion::access::access_manager_config make_access_manager_config(
    const service_config& config) {
  return bastion::access::access_manager_config{
      .authority = config.authority,
      .initial_admin = config.initial_admin,
      .expiration = config.schedule_expiration_seconds,
      .minimum_setback = config.minimum_setback_seconds};
}

bastion::access::authorization_config make_authorization_config(
    const service_config& config) {
  auto authorization = bastion::access::authorization_config{};
  authorization.authority = config.authority;
  authorization.redemption_delay = config.redemption_delay_seconds;
  return authorization;
}

}  // namespace bastion::config
