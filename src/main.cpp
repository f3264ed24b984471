#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <bastion/access/access_error.hpp>
#include <bastion/access/access_manager.hpp>
#include <bastion/access/authorization_core.hpp>
#include <bastion/access/state_store.hpp>
#include <bastion/config/service_config.hpp>
#include <bastion/schema/key/access_keys.hpp>
#include <bastion/schema/role_id.hpp>
#include <iostream>
#include <string>

using namespace bastion::schema;

namespace {

void setup_logging(const bastion::config::service_config& config) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      config.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "bastiond", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(config.log_level);
}

void dump_locks(const bastion::access::state_store& store) {
  auto rows = store.list_committed(key::kRedemptionLocksNamespace);
  for (const auto& [account, value] : rows) {
    auto unlock = store.encoder().decode<timestamp_seconds_t>(
        bytes_view_t{value.data(), value.size()});
    std::cout << "lock 0x" << to_hex(make_bytes_view(account)) << " "
              << unlock << std::endl;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config = bastion::config::service_config{};
  try {
    config = bastion::config::parse_service_config(argc, argv);
  } catch (const bastion::config::config_error& e) {
    std::cerr << "bastiond: " << e.what() << std::endl;
    return 1;
  }

  if (config.show_help) {
    std::cout << bastion::config::make_options_description() << std::endl;
    return 0;
  }

  setup_logging(config);

  auto storage =
      bastion::storage::make_storage<bastion::storage::rocksdb_storage_tag>(
          config.db_path);
  auto store = bastion::access::state_store{storage};
  store.set_event_sink([](const event_t& event) {
    spdlog::debug("event {} ({} attribute(s))", event.type,
                  event.attributes.size());
  });

  try {
    auto manager = bastion::access::access_manager{
        store, bastion::config::make_access_manager_config(config),
        bastion::access::system_time_source()};
    auto core = bastion::access::authorization_core{
        store, manager, manager,
        bastion::config::make_authorization_config(config),
        bastion::access::system_time_source()};

    std::cout << "redemption_delay " << core.redemption_delay_in_seconds()
              << std::endl;
    std::cout << "initialized " << (core.is_initialized() ? "true" : "false")
              << std::endl;

    if (config.lock_time_account) {
      std::cout << "lock_time "
                << core.get_account_lock_time(*config.lock_time_account)
                << std::endl;
    }
    if (config.min_delay_role) {
      std::cout << "min_delay "
                << core.get_minimal_execution_delay_for_role(
                       *config.min_delay_role)
                << std::endl;
    }
    if (config.role_admin_role) {
      auto admin = manager.get_role_admin(*config.role_admin_role);
      std::cout << "role_admin " << admin << " (" << role_name(admin) << ")"
                << std::endl;
    }
    if (config.dump_locks) {
      dump_locks(store);
    }
  } catch (const bastion::access::access_error& e) {
    spdlog::error("{} ({})", e.what(), to_string(e.code()));
    spdlog::shutdown();
    return 1;
  }

  spdlog::shutdown();
  return 0;
}
