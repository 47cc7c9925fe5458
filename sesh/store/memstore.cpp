#include "sesh/store/memstore.hpp"
#include <algorithm>

namespace sesh::store {

namespace {

bool is_expired(const std::optional<memstore_c::time_point_t> &expires_at,
                memstore_c::time_point_t now) {
  return expires_at.has_value() && *expires_at <= now;
}

std::optional<std::int64_t>
remaining_secs(const std::optional<memstore_c::time_point_t> &expires_at,
               memstore_c::time_point_t now) {
  if (!expires_at) {
    return std::nullopt;
  }
  return std::chrono::ceil<std::chrono::seconds>(*expires_at - now).count();
}

std::optional<memstore_c::time_point_t>
earliest(const std::optional<memstore_c::time_point_t> &a,
         const std::optional<memstore_c::time_point_t> &b) {
  if (!a) {
    return b;
  }
  if (!b) {
    return a;
  }
  return std::min(*a, *b);
}

} // namespace

memstore_c::memstore_c(std::shared_ptr<spdlog::logger> logger)
    : memstore_c(std::move(logger),
                 []() { return std::chrono::steady_clock::now(); }) {}

memstore_c::memstore_c(std::shared_ptr<spdlog::logger> logger,
                       clock_fn_t clock)
    : logger_(std::move(logger)), clock_(std::move(clock)) {}

const char *memstore_c::name() const { return "memory"; }

memstore_c::record_s *memstore_c::find_live(const std::string &id,
                                            time_point_t now) {
  auto it = data_.find(id);
  if (it == data_.end()) {
    return nullptr;
  }

  if (is_expired(it->second.expires_at, now)) {
    data_.erase(it);
    return nullptr;
  }

  prune(it->second, now);
  if (it->second.fields.empty()) {
    data_.erase(it);
    return nullptr;
  }
  return &it->second;
}

void memstore_c::prune(record_s &record, time_point_t now) {
  for (auto it = record.fields.begin(); it != record.fields.end();) {
    if (is_expired(it->second.expires_at, now)) {
      it = record.fields.erase(it);
    } else {
      ++it;
    }
  }
}

void memstore_c::write_field(record_s &record, const std::string &field,
                             const std::string &value,
                             std::optional<std::int64_t> field_ttl,
                             std::optional<std::int64_t> hot_ttl,
                             time_point_t now) {
  if (field_ttl && *field_ttl == 0) {
    record.fields.erase(field);
    return;
  }

  field_s entry{value, std::nullopt, hot_ttl};
  if (field_ttl && *field_ttl > 0) {
    entry.expires_at = now + std::chrono::seconds(*field_ttl);
  }
  record.fields[field] = std::move(entry);
}

void memstore_c::apply_session_ttl(record_s &record,
                                   std::optional<std::int64_t> session_ttl,
                                   time_point_t now) {
  if (!session_ttl) {
    return;
  }
  if (*session_ttl < 0) {
    record.expires_at.reset();
    return;
  }
  record.expires_at = now + std::chrono::seconds(*session_ttl);
}

result_c<std::optional<std::string>> memstore_c::get(const std::string &id,
                                                     const std::string &field) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto *record = find_live(id, clock_());
  if (!record) {
    return std::optional<std::string>();
  }

  auto it = record->fields.find(field);
  if (it == record->fields.end()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(it->second.value);
}

result_c<std::optional<session_map_c>>
memstore_c::get_all(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto *record = find_live(id, clock_());
  if (!record) {
    return std::optional<session_map_c>();
  }

  std::map<std::string, std::string> fields;
  for (const auto &pair : record->fields) {
    fields[pair.first] = pair.second.value;
  }
  return std::optional<session_map_c>(session_map_c(std::move(fields)));
}

status_c memstore_c::set(const std::string &id, const std::string &field,
                         const std::string &value,
                         const write_options_s &options) {
  auto status = validate_id(id);
  if (status.is_error()) {
    return status;
  }
  status = validate_field(field);
  if (status.is_error()) {
    return status;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  if (options.session_ttl && *options.session_ttl == 0) {
    data_.erase(id);
    return status_c();
  }

  if (!find_live(id, now)) {
    data_[id] = record_s{};
  }

  auto &record = data_[id];
  write_field(record, field, value, options.field_ttl, hot_ttl_meta(options),
              now);
  apply_session_ttl(record, options.session_ttl, now);

  if (record.fields.empty()) {
    data_.erase(id);
  }

  logger_->debug("memory: set {} on {}", field, id);
  return status_c();
}

status_c memstore_c::set_and_rename(const std::string &old_id,
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

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  if (find_live(new_id, now)) {
    logger_->warn("memory: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }

  record_s record;
  if (find_live(old_id, now)) {
    record = std::move(data_[old_id]);
    data_.erase(old_id);
  }

  if (options.session_ttl && *options.session_ttl == 0) {
    return status_c();
  }

  write_field(record, field, value, options.field_ttl, hot_ttl_meta(options),
              now);
  apply_session_ttl(record, options.session_ttl, now);

  if (!record.fields.empty()) {
    data_[new_id] = std::move(record);
  }

  logger_->debug("memory: renamed {} -> {} and set {}", old_id, new_id, field);
  return status_c();
}

result_c<bool> memstore_c::insert(const std::string &id,
                                  const std::string &field,
                                  const std::string &value,
                                  const write_options_s &options) {
  auto status = validate_id(id);
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

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  auto *record = find_live(id, now);
  if (record && record->fields.count(field) > 0) {
    return false;
  }
  if (!record) {
    record = &(data_[id] = record_s{});
  }

  write_field(*record, field, value, options.field_ttl, hot_ttl_meta(options),
              now);
  apply_session_ttl(*record, options.session_ttl, now);

  logger_->debug("memory: inserted {} on {}", field, id);
  return true;
}

result_c<bool> memstore_c::insert_and_rename(const std::string &old_id,
                                             const std::string &new_id,
                                             const std::string &field,
                                             const std::string &value,
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

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  if (find_live(new_id, now)) {
    logger_->warn("memory: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }

  record_s record;
  if (find_live(old_id, now)) {
    record = std::move(data_[old_id]);
    data_.erase(old_id);
  }

  bool written = record.fields.count(field) == 0;
  if (written) {
    write_field(record, field, value, options.field_ttl, hot_ttl_meta(options),
                now);
  }
  apply_session_ttl(record, options.session_ttl, now);
  data_[new_id] = std::move(record);

  logger_->debug("memory: renamed {} -> {}, inserted {}: {}", old_id, new_id,
                 field, written);
  return written;
}

status_c memstore_c::rename(const std::string &old_id,
                            const std::string &new_id,
                            std::optional<std::int64_t> session_ttl) {
  auto status = validate_rename(old_id, new_id);
  if (status.is_error()) {
    return status;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  if (find_live(new_id, now)) {
    logger_->warn("memory: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }

  if (!find_live(old_id, now)) {
    return status_c();
  }

  record_s record = std::move(data_[old_id]);
  data_.erase(old_id);

  if (session_ttl && *session_ttl == 0) {
    return status_c();
  }

  apply_session_ttl(record, session_ttl, now);
  data_[new_id] = std::move(record);
  return status_c();
}

status_c memstore_c::remove(const std::string &id, const std::string &field) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto *record = find_live(id, clock_());
  if (!record) {
    return status_c();
  }

  record->fields.erase(field);
  if (record->fields.empty()) {
    data_.erase(id);
  }
  return status_c();
}

status_c memstore_c::del(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  data_.erase(id);
  return status_c();
}

status_c memstore_c::expire(const std::string &id, std::int64_t ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (ttl <= 0) {
    data_.erase(id);
    return status_c();
  }

  auto now = clock_();
  auto *record = find_live(id, now);
  if (record) {
    record->expires_at = now + std::chrono::seconds(ttl);
  }
  return status_c();
}

status_c memstore_c::set_many(const std::string &id,
                              const std::vector<hot_entry_s> &entries,
                              std::optional<std::int64_t> session_ttl) {
  auto status = validate_id(id);
  if (status.is_error()) {
    return status;
  }
  if (entries.empty()) {
    return status_c();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();

  if (!find_live(id, now)) {
    data_[id] = record_s{};
  }

  auto &record = data_[id];
  for (const auto &entry : entries) {
    write_field(record, entry.field, entry.value, entry.field_ttl, std::nullopt,
                now);
  }
  apply_session_ttl(record, session_ttl, now);

  if (record.fields.empty()) {
    data_.erase(id);
  }
  return status_c();
}

result_c<std::optional<cold_snapshot_s>>
memstore_c::get_all_with_meta(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  auto *record = find_live(id, now);
  if (!record) {
    return std::optional<cold_snapshot_s>();
  }

  cold_snapshot_s snapshot;
  std::map<std::string, std::string> fields;
  for (const auto &pair : record->fields) {
    fields[pair.first] = pair.second.value;
    snapshot.meta[pair.first] = field_meta_s{
        pair.second.hot_ttl,
        remaining_secs(earliest(pair.second.expires_at, record->expires_at),
                       now)};
  }
  snapshot.fields = session_map_c(std::move(fields));
  snapshot.session_remaining = remaining_secs(record->expires_at, now);
  return std::optional<cold_snapshot_s>(std::move(snapshot));
}

result_c<std::size_t> memstore_c::sweep_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = clock_();
  std::size_t reclaimed = 0;

  for (auto it = data_.begin(); it != data_.end();) {
    if (is_expired(it->second.expires_at, now)) {
      it = data_.erase(it);
      ++reclaimed;
      continue;
    }

    prune(it->second, now);
    if (it->second.fields.empty()) {
      it = data_.erase(it);
      ++reclaimed;
      continue;
    }
    ++it;
  }

  if (reclaimed > 0) {
    logger_->debug("memory: reclaimed {} expired sessions", reclaimed);
  }
  return reclaimed;
}

std::size_t memstore_c::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return data_.size();
}

} // namespace sesh::store
