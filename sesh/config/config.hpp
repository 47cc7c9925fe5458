#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace sesh::config {
using nlohmann::json;

constexpr std::int64_t DEFAULT_SESSION_TTL_SECS = 600;
constexpr std::int64_t DEFAULT_SWEEP_INTERVAL_SECS = 60;
constexpr const char *DEFAULT_BACKEND = "memory";
constexpr const char *DEFAULT_REDIS_URL = "tcp://127.0.0.1:6379";
constexpr const char *DEFAULT_POSTGRES_CONNINFO =
    "host=127.0.0.1 dbname=sesh";
constexpr const char *DEFAULT_DISK_PATH = "/tmp/sesh";
constexpr const char *DEFAULT_LOG_LEVEL = "info";

enum class backend_e {
  MEMORY,
  REDIS,
  POSTGRES,
  DISK,
  LAYERED,
};

std::optional<backend_e> parse_backend(const std::string &name);
const char *backend_to_string(backend_e backend);

class config_c {
public:
  std::string get_backend() const;
  std::int64_t get_session_ttl_secs() const;

  std::string get_redis_url() const;
  std::string get_redis_key_prefix() const;

  std::string get_postgres_conninfo() const;
  std::string get_postgres_schema() const;
  bool get_postgres_create_schema() const;

  std::string get_disk_path() const;

  std::string get_layered_hot() const;
  std::string get_layered_cold() const;

  std::int64_t get_sweep_interval_secs() const;
  std::string get_log_level() const;

  friend bool load_config(const std::string &path, config_c &config);
  friend bool parse_config(const std::string &text, config_c &config);

private:
  const json *find(const char *section, const char *key) const;
  std::string string_or(const char *section, const char *key,
                        const std::string &fallback) const;
  std::int64_t integer_or(const char *section, const char *key,
                          std::int64_t fallback) const;

  json config_;
};

bool load_config(const std::string &path, config_c &config);
bool parse_config(const std::string &text, config_c &config);

//! \brief Write a config file holding every default value
bool new_config(const std::string &path);

} // namespace sesh::config
