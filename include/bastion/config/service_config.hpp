#pragma once

#include <bastion/access/access_manager.hpp>
#include <bastion/access/authorization_core.hpp>
#include <bastion/schema/primitives.hpp>

#include <boost/program_options.hpp>
#include <spdlog/common.h>

#include <optional>
#include <stdexcept>
#include <string>

namespace bastion::config {

/// Invalid option value or unreadable configuration file.
class config_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct service_config final {
  std::string db_path{"bastion.db"};
  bastion::schema::duration_seconds_t redemption_delay_seconds{};
  bastion::schema::duration_seconds_t schedule_expiration_seconds{
      7 * 24 * 60 * 60};
  bastion::schema::duration_seconds_t minimum_setback_seconds{
      5 * 24 * 60 * 60};
  bastion::schema::target_id_t authority{};
  bastion::schema::account_id_t initial_admin{};
  spdlog::level::level_enum log_level{spdlog::level::info};
  std::string log_file{"bastiond.log"};

  // Inspection requests.
  std::optional<bastion::schema::account_id_t> lock_time_account;
  std::optional<bastion::schema::role_id_t> min_delay_role;
  std::optional<bastion::schema::role_id_t> role_admin_role;
  bool dump_locks{false};
  bool show_help{false};
};

boost::program_options::options_description make_options_description();

/// Command line first, then the optional `--config` INI file for options the
/// command line left unset. Throws config_error.
service_config parse_service_config(int argc, const char* const argv[]);

/// Role by name ("atomist") or decimal id.
std::optional<bastion::schema::role_id_t> try_parse_role(
    const std::string& value);

bastion::access::access_manager_config make_access_manager_config(
    const service_config& config);

bastion::access::authorization_config make_authorization_config(
    const service_config& config);

}  // namespace bastion::config
