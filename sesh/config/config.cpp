#include "sesh/config/config.hpp"
#include <fstream>

namespace sesh::config {

std::optional<backend_e> parse_backend(const std::string &name) {
  if (name == "memory") {
    return backend_e::MEMORY;
  }
  if (name == "redis") {
    return backend_e::REDIS;
  }
  if (name == "postgres") {
    return backend_e::POSTGRES;
  }
  if (name == "disk") {
    return backend_e::DISK;
  }
  if (name == "layered") {
    return backend_e::LAYERED;
  }
  return std::nullopt;
}

const char *backend_to_string(backend_e backend) {
  switch (backend) {
  case backend_e::MEMORY:
    return "memory";
  case backend_e::REDIS:
    return "redis";
  case backend_e::POSTGRES:
    return "postgres";
  case backend_e::DISK:
    return "disk";
  case backend_e::LAYERED:
    return "layered";
  }
  return "unknown";
}

bool load_config(const std::string &path, config_c &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  try {
    file >> config.config_;
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

bool parse_config(const std::string &text, config_c &config) {
  try {
    config.config_ = json::parse(text);
  } catch (const json::exception &) {
    return false;
  }
  return config.config_.is_object();
}

const json *config_c::find(const char *section, const char *key) const {
  auto it_section = config_.find(section);
  if (it_section == config_.end() || !it_section->is_object()) {
    return nullptr;
  }
  auto it = it_section->find(key);
  if (it == it_section->end()) {
    return nullptr;
  }
  return &(*it);
}

std::string config_c::string_or(const char *section, const char *key,
                                const std::string &fallback) const {
  auto *value = find(section, key);
  if (!value || !value->is_string()) {
    return fallback;
  }
  return value->get<std::string>();
}

std::int64_t config_c::integer_or(const char *section, const char *key,
                                  std::int64_t fallback) const {
  auto *value = find(section, key);
  if (!value || !value->is_number_integer()) {
    return fallback;
  }
  return value->get<std::int64_t>();
}

std::string config_c::get_backend() const {
  auto it = config_.find("backend");
  if (it == config_.end() || !it->is_string()) {
    return DEFAULT_BACKEND;
  }
  return it->get<std::string>();
}

std::int64_t config_c::get_session_ttl_secs() const {
  return integer_or("session", "ttl_secs", DEFAULT_SESSION_TTL_SECS);
}

std::string config_c::get_redis_url() const {
  return string_or("redis", "url", DEFAULT_REDIS_URL);
}

std::string config_c::get_redis_key_prefix() const {
  return string_or("redis", "key_prefix", "");
}

std::string config_c::get_postgres_conninfo() const {
  return string_or("postgres", "conninfo", DEFAULT_POSTGRES_CONNINFO);
}

std::string config_c::get_postgres_schema() const {
  return string_or("postgres", "schema", "");
}

bool config_c::get_postgres_create_schema() const {
  auto *value = find("postgres", "create_schema");
  if (!value || !value->is_boolean()) {
    return false;
  }
  return value->get<bool>();
}

std::string config_c::get_disk_path() const {
  return string_or("disk", "path", DEFAULT_DISK_PATH);
}

std::string config_c::get_layered_hot() const {
  return string_or("layered", "hot", "redis");
}

std::string config_c::get_layered_cold() const {
  return string_or("layered", "cold", "postgres");
}

std::int64_t config_c::get_sweep_interval_secs() const {
  auto interval =
      integer_or("sweep", "interval_secs", DEFAULT_SWEEP_INTERVAL_SECS);
  if (interval < 0) {
    return DEFAULT_SWEEP_INTERVAL_SECS;
  }
  return interval;
}

std::string config_c::get_log_level() const {
  return string_or("log", "level", DEFAULT_LOG_LEVEL);
}

bool new_config(const std::string &path) {
  json config;
  config["backend"] = DEFAULT_BACKEND;
  config["session"]["ttl_secs"] = DEFAULT_SESSION_TTL_SECS;
  config["redis"]["url"] = DEFAULT_REDIS_URL;
  config["redis"]["key_prefix"] = "";
  config["postgres"]["conninfo"] = DEFAULT_POSTGRES_CONNINFO;
  config["postgres"]["schema"] = "";
  config["postgres"]["create_schema"] = true;
  config["disk"]["path"] = DEFAULT_DISK_PATH;
  config["layered"]["hot"] = "redis";
  config["layered"]["cold"] = "postgres";
  config["sweep"]["interval_secs"] = DEFAULT_SWEEP_INTERVAL_SECS;
  config["log"]["level"] = DEFAULT_LOG_LEVEL;

  std::ofstream file(path);
  if (!file.is_open()) {
    return false;
  }
  file << config.dump(4);
  return true;
}

} // namespace sesh::config
