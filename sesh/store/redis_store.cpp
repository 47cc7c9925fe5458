#include "sesh/store/redis_store.hpp"
#include "sesh/store/redis_scripts.hpp"
#include <chrono>
#include <iterator>

namespace sesh::store {

namespace {

std::string ttl_arg(const std::optional<std::int64_t> &ttl) {
  if (!ttl) {
    return "";
  }
  return std::to_string(*ttl);
}

error_s backend_error(const char *op, const sw::redis::Error &e) {
  return error_s{error_e::BACKEND, fmt::format("redis {}: {}", op, e.what())};
}

} // namespace

redis_store_c::redis_store_c(std::shared_ptr<spdlog::logger> logger,
                             sw::redis::Redis &redis, std::string key_prefix)
    : logger_(std::move(logger)), redis_(redis),
      key_prefix_(std::move(key_prefix)) {}

const char *redis_store_c::name() const { return "redis"; }

std::string redis_store_c::key_for(const std::string &id) const {
  return key_prefix_ + id;
}

const std::string &redis_store_c::script_source(script_e script) {
  switch (script) {
  case script_e::SET:
    return redis_scripts::SET;
  case script_e::SET_AND_RENAME:
    return redis_scripts::SET_AND_RENAME;
  case script_e::SET_MANY:
    break;
  }
  return redis_scripts::SET_MANY;
}

std::string redis_store_c::script_sha(script_e script, bool reload) {
  std::lock_guard<std::mutex> lock(sha_mutex_);
  auto it = shas_.find(script);
  if (it != shas_.end() && !reload) {
    return it->second;
  }

  auto sha = redis_.script_load(script_source(script));
  shas_[script] = sha;
  logger_->debug("redis: loaded script {} as {}", static_cast<int>(script),
                 sha);
  return sha;
}

long long redis_store_c::run_script(script_e script,
                                    const std::vector<std::string> &keys,
                                    const std::vector<std::string> &args) {
  auto sha = script_sha(script, false);
  try {
    return redis_.evalsha<long long>(sha, keys.begin(), keys.end(),
                                     args.begin(), args.end());
  } catch (const sw::redis::ReplyError &e) {
    if (std::string(e.what()).rfind("NOSCRIPT", 0) != 0) {
      throw;
    }
  }

  // The server dropped its script cache (restart or SCRIPT FLUSH)
  logger_->warn("redis: script cache lost, reloading");
  sha = script_sha(script, true);
  return redis_.evalsha<long long>(sha, keys.begin(), keys.end(), args.begin(),
                                   args.end());
}

result_c<std::optional<std::string>>
redis_store_c::get(const std::string &id, const std::string &field) {
  try {
    auto value = redis_.hget(key_for(id), field);
    if (!value) {
      return std::optional<std::string>();
    }
    return std::optional<std::string>(*value);
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: get {} on {} failed: {}", field, id, e.what());
    return backend_error("get", e);
  }
}

result_c<std::optional<session_map_c>>
redis_store_c::get_all(const std::string &id) {
  try {
    std::map<std::string, std::string> fields;
    redis_.hgetall(key_for(id), std::inserter(fields, fields.begin()));
    if (fields.empty()) {
      return std::optional<session_map_c>();
    }
    return std::optional<session_map_c>(session_map_c(std::move(fields)));
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: get_all on {} failed: {}", id, e.what());
    return backend_error("get_all", e);
  }
}

result_c<bool> redis_store_c::write_impl(const std::string &id,
                                         const std::string &field,
                                         const std::string &value,
                                         const write_options_s &options,
                                         bool only_if_absent) {
  auto status = validate_id(id);
  if (status.is_error()) {
    return status.error();
  }
  status = validate_field(field);
  if (status.is_error()) {
    return status.error();
  }

  long long written = 0;
  try {
    written = run_script(script_e::SET, {key_for(id)},
                         {field, value, ttl_arg(options.session_ttl),
                          ttl_arg(options.field_ttl),
                          only_if_absent ? "1" : "0"});
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: set {} on {} failed: {}", field, id, e.what());
    return backend_error("set", e);
  }

  logger_->debug("redis: set {} on {}", field, id);
  return written == 1;
}

status_c redis_store_c::set(const std::string &id, const std::string &field,
                            const std::string &value,
                            const write_options_s &options) {
  auto written = write_impl(id, field, value, options, false);
  if (written.is_error()) {
    return written.error();
  }
  return status_c();
}

result_c<bool> redis_store_c::insert(const std::string &id,
                                     const std::string &field,
                                     const std::string &value,
                                     const write_options_s &options) {
  auto status = validate_insert(options);
  if (status.is_error()) {
    return status.error();
  }
  return write_impl(id, field, value, options, true);
}

result_c<bool> redis_store_c::rename_impl(const std::string &old_id,
                                          const std::string &new_id,
                                          const std::vector<std::string> &args) {
  long long applied = 0;
  try {
    applied = run_script(script_e::SET_AND_RENAME,
                         {key_for(old_id), key_for(new_id)}, args);
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: rename {} -> {} failed: {}", old_id, new_id,
                   e.what());
    return backend_error("set_and_rename", e);
  }

  if (applied == 0) {
    logger_->warn("redis: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }

  logger_->debug("redis: renamed {} -> {}", old_id, new_id);
  return applied == 1;
}

status_c redis_store_c::set_and_rename(const std::string &old_id,
                                       const std::string &new_id,
                                       const std::string &field,
                                       const std::string &value,
                                       const write_options_s &options) {
  auto status = validate_rename(old_id, new_id);
  if (status.is_error()) {
    return status;
  }
  status = validate_field(field);
  if (status.is_error()) {
    return status;
  }

  auto moved = rename_impl(old_id, new_id,
                           {field, value, ttl_arg(options.session_ttl),
                            ttl_arg(options.field_ttl), "1"});
  if (moved.is_error()) {
    return moved.error();
  }
  return status_c();
}

result_c<bool> redis_store_c::insert_and_rename(
    const std::string &old_id, const std::string &new_id,
    const std::string &field, const std::string &value,
    const write_options_s &options) {
  auto status = validate_rename(old_id, new_id);
  if (status.is_error()) {
    return status.error();
  }
  status = validate_field(field);
  if (status.is_error()) {
    return status.error();
  }
  status = validate_insert(options);
  if (status.is_error()) {
    return status.error();
  }

  return rename_impl(old_id, new_id,
                     {field, value, ttl_arg(options.session_ttl),
                      ttl_arg(options.field_ttl), "2"});
}

status_c redis_store_c::rename(const std::string &old_id,
                               const std::string &new_id,
                               std::optional<std::int64_t> session_ttl) {
  auto status = validate_rename(old_id, new_id);
  if (status.is_error()) {
    return status;
  }

  auto moved =
      rename_impl(old_id, new_id, {"", "", ttl_arg(session_ttl), "", "0"});
  if (moved.is_error()) {
    return moved.error();
  }
  return status_c();
}

status_c redis_store_c::remove(const std::string &id,
                               const std::string &field) {
  try {
    redis_.hdel(key_for(id), field);
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: remove {} on {} failed: {}", field, id, e.what());
    return backend_error("remove", e);
  }
  return status_c();
}

status_c redis_store_c::del(const std::string &id) {
  try {
    redis_.del(key_for(id));
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: delete {} failed: {}", id, e.what());
    return backend_error("del", e);
  }
  return status_c();
}

status_c redis_store_c::expire(const std::string &id, std::int64_t ttl) {
  if (ttl <= 0) {
    return del(id);
  }

  try {
    redis_.expire(key_for(id), std::chrono::seconds(ttl));
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: expire {} failed: {}", id, e.what());
    return backend_error("expire", e);
  }
  return status_c();
}

status_c redis_store_c::set_many(const std::string &id,
                                 const std::vector<hot_entry_s> &entries,
                                 std::optional<std::int64_t> session_ttl) {
  auto status = validate_id(id);
  if (status.is_error()) {
    return status;
  }
  if (entries.empty()) {
    return status_c();
  }

  std::vector<std::string> args;
  args.reserve(1 + entries.size() * 3);
  args.push_back(ttl_arg(session_ttl));
  for (const auto &entry : entries) {
    args.push_back(entry.field);
    args.push_back(entry.value);
    args.push_back(ttl_arg(entry.field_ttl));
  }

  try {
    run_script(script_e::SET_MANY, {key_for(id)}, args);
  } catch (const sw::redis::Error &e) {
    logger_->error("redis: set_many on {} failed: {}", id, e.what());
    return backend_error("set_many", e);
  }
  return status_c();
}

} // namespace sesh::store
