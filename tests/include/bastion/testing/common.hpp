#pragma once

#include <bastion/access/time_source.hpp>
#include <bastion/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace bastion::testing {

inline bastion::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = bastion::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline bastion::schema::account_id_t make_account(const uint8_t seed) {
  auto account = bastion::schema::account_id_t{};
  account[0] = seed;
  return account;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Temporary database directory, removed after everything declared after it.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~scoped_db_path() { remove_path(path_); }

  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

/// Deterministic time source; copies of source() follow set() and advance().
class manual_clock final {
 public:
  explicit manual_clock(const bastion::schema::timestamp_seconds_t start = 1000)
      : now_{std::make_shared<bastion::schema::timestamp_seconds_t>(start)} {}

  bastion::schema::timestamp_seconds_t now() const { return *now_; }
  void set(const bastion::schema::timestamp_seconds_t now) { *now_ = now; }
  void advance(const bastion::schema::duration_seconds_t seconds) {
    *now_ += seconds;
  }

  bastion::access::time_source_t source() const {
    return [now = now_] { return *now; };
  }

 private:
  std::shared_ptr<bastion::schema::timestamp_seconds_t> now_;
};

}  // namespace bastion::testing
