#include "sesh/store/disk_store.hpp"
#include <algorithm>
#include <chrono>
#include <nlohmann/json.hpp>
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/write_batch.h>
#include <set>

namespace sesh::store {

namespace {

const std::string HEADER_PREFIX = "s/";
const std::string FIELD_PREFIX = "f/";

std::string header_key(const std::string &id) { return HEADER_PREFIX + id; }

std::string field_prefix(const std::string &id) {
  return FIELD_PREFIX + id + "/";
}

std::string field_key(const std::string &id, const std::string &field) {
  return field_prefix(id) + field;
}

nlohmann::json optional_to_json(const std::optional<std::int64_t> &v) {
  if (!v) {
    return nullptr;
  }
  return *v;
}

std::optional<std::int64_t> optional_from_json(const nlohmann::json &doc,
                                               const char *key) {
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) {
    return std::nullopt;
  }
  return it->get<std::int64_t>();
}

std::string pack(const nlohmann::json &doc) {
  auto bytes = nlohmann::json::to_msgpack(doc);
  return std::string(bytes.begin(), bytes.end());
}

bool is_expired(const std::optional<std::int64_t> &expires_ms,
                std::int64_t now) {
  return expires_ms.has_value() && *expires_ms <= now;
}

std::optional<std::int64_t>
remaining_secs(const std::optional<std::int64_t> &expires_ms,
               std::int64_t now) {
  if (!expires_ms) {
    return std::nullopt;
  }
  auto diff = *expires_ms - now;
  return (diff + 999) / 1000;
}

std::optional<std::int64_t> earliest(const std::optional<std::int64_t> &a,
                                     const std::optional<std::int64_t> &b) {
  if (!a) {
    return b;
  }
  if (!b) {
    return a;
  }
  return std::min(*a, *b);
}

} // namespace

disk_store_c::disk_store_c(std::shared_ptr<spdlog::logger> logger)
    : disk_store_c(std::move(logger), []() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
      }) {}

disk_store_c::disk_store_c(std::shared_ptr<spdlog::logger> logger,
                           clock_fn_t clock)
    : logger_(std::move(logger)), clock_(std::move(clock)), db_(nullptr),
      is_open_(false) {}

disk_store_c::~disk_store_c() {
  if (is_open_) {
    close();
  }
}

bool disk_store_c::open(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (is_open_) {
    return false;
  }

  rocksdb::Options options;
  options.create_if_missing = true;

  rocksdb::DB *raw_db;
  rocksdb::Status status = rocksdb::DB::Open(options, path, &raw_db);

  if (!status.ok()) {
    logger_->error("disk: failed to open {}: {}", path, status.ToString());
    return false;
  }

  db_.reset(raw_db);
  is_open_ = true;
  logger_->info("disk: opened {}", path);
  return true;
}

bool disk_store_c::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!is_open_) {
    return false;
  }

  db_.reset();
  is_open_ = false;
  return true;
}

bool disk_store_c::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return is_open_;
}

const char *disk_store_c::name() const { return "disk"; }

status_c disk_store_c::check_open() const {
  if (!is_open_) {
    return error_s{error_e::BACKEND, "disk store is not open"};
  }
  return status_c();
}

status_c disk_store_c::check_id(const std::string &id) const {
  auto status = validate_id(id);
  if (status.is_error()) {
    return status;
  }
  if (id.find('/') != std::string::npos) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "disk store session ids may not contain '/'"};
  }
  return status_c();
}

result_c<disk_store_c::record_s> disk_store_c::load(const std::string &id,
                                                    std::int64_t now) {
  record_s record;
  bool session_live = false;

  try {
    std::string raw;
    auto status = db_->Get(rocksdb::ReadOptions(), header_key(id), &raw);
    if (status.ok()) {
      auto doc = nlohmann::json::from_msgpack(raw);
      record.exists = true;
      record.header.expires_ms = optional_from_json(doc, "x");
      record.header.created_ms = doc.at("c").get<std::int64_t>();
      record.header.updated_ms = doc.at("u").get<std::int64_t>();
      record.keys.push_back(header_key(id));
      session_live = !is_expired(record.header.expires_ms, now);
    } else if (!status.IsNotFound()) {
      return error_s{error_e::BACKEND, "disk get: " + status.ToString()};
    }

    auto prefix = field_prefix(id);
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
         it->Next()) {
      auto key = it->key().ToString();
      record.keys.push_back(key);
      if (!session_live) {
        continue;
      }

      auto doc = nlohmann::json::from_msgpack(it->value().ToString());
      field_s field;
      const auto &binary = doc.at("v").get_binary();
      field.value.assign(binary.begin(), binary.end());
      field.expires_ms = optional_from_json(doc, "x");
      field.hot_ttl = optional_from_json(doc, "h");
      if (!is_expired(field.expires_ms, now)) {
        record.fields[key.substr(prefix.size())] = std::move(field);
      }
    }
    if (!it->status().ok()) {
      return error_s{error_e::BACKEND,
                     "disk iterate: " + it->status().ToString()};
    }
  } catch (const nlohmann::json::exception &e) {
    logger_->error("disk: corrupt record for {}: {}", id, e.what());
    return error_s{error_e::ENCODING,
                   "disk record for " + id + " is corrupt: " + e.what()};
  }

  return record;
}

void disk_store_c::erase(rocksdb::WriteBatch &batch, const record_s &record) {
  for (const auto &key : record.keys) {
    batch.Delete(key);
  }
}

void disk_store_c::put(rocksdb::WriteBatch &batch, const std::string &id,
                       const record_s &record) {
  if (record.fields.empty()) {
    return;
  }

  nlohmann::json header = {{"x", optional_to_json(record.header.expires_ms)},
                           {"c", record.header.created_ms},
                           {"u", record.header.updated_ms}};
  batch.Put(header_key(id), pack(header));

  for (const auto &pair : record.fields) {
    nlohmann::json doc = {
        {"v", nlohmann::json::binary(std::vector<std::uint8_t>(
                  pair.second.value.begin(), pair.second.value.end()))},
        {"x", optional_to_json(pair.second.expires_ms)},
        {"h", optional_to_json(pair.second.hot_ttl)}};
    batch.Put(field_key(id, pair.first), pack(doc));
  }
}

status_c disk_store_c::commit(const char *op, rocksdb::WriteBatch &batch) {
  auto status = db_->Write(rocksdb::WriteOptions(), &batch);
  if (!status.ok()) {
    logger_->error("disk: {} failed: {}", op, status.ToString());
    return error_s{error_e::BACKEND,
                   std::string("disk ") + op + ": " + status.ToString()};
  }
  return status_c();
}

void disk_store_c::write_field(record_s &record, const std::string &field,
                               const std::string &value,
                               std::optional<std::int64_t> field_ttl,
                               std::optional<std::int64_t> hot_ttl,
                               std::int64_t now) {
  if (field_ttl && *field_ttl == 0) {
    record.fields.erase(field);
    return;
  }

  field_s entry{value, std::nullopt, hot_ttl};
  if (field_ttl && *field_ttl > 0) {
    entry.expires_ms = now + *field_ttl * 1000;
  }
  record.fields[field] = std::move(entry);
}

void disk_store_c::apply_session_ttl(record_s &record,
                                     std::optional<std::int64_t> session_ttl,
                                     std::int64_t now) {
  if (!session_ttl) {
    return;
  }
  if (*session_ttl == 0) {
    record.fields.clear();
    return;
  }
  if (*session_ttl < 0) {
    record.header.expires_ms.reset();
    return;
  }
  record.header.expires_ms = now + *session_ttl * 1000;
}

result_c<std::optional<std::string>>
disk_store_c::get(const std::string &id, const std::string &field) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  auto loaded = load(id, clock_());
  if (loaded.is_error()) {
    return loaded.error();
  }

  const auto &record = loaded.value();
  auto it = record.fields.find(field);
  if (it == record.fields.end()) {
    return std::optional<std::string>();
  }
  return std::optional<std::string>(it->second.value);
}

result_c<std::optional<session_map_c>>
disk_store_c::get_all(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  auto loaded = load(id, clock_());
  if (loaded.is_error()) {
    return loaded.error();
  }

  const auto &record = loaded.value();
  if (!record.live()) {
    return std::optional<session_map_c>();
  }

  std::map<std::string, std::string> fields;
  for (const auto &pair : record.fields) {
    fields[pair.first] = pair.second.value;
  }
  return std::optional<session_map_c>(session_map_c(std::move(fields)));
}

result_c<bool> disk_store_c::write(const char *op, const std::string &id,
                                   const std::string &field,
                                   const std::string &value,
                                   const write_options_s &options,
                                   bool only_if_absent) {
  auto status = check_id(id);
  if (status.is_error()) {
    return status.error();
  }
  status = validate_field(field);
  if (status.is_error()) {
    return status.error();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  auto now = clock_();
  auto loaded = load(id, now);
  if (loaded.is_error()) {
    return loaded.error();
  }
  if (only_if_absent && loaded.value().fields.count(field) > 0) {
    return false;
  }

  rocksdb::WriteBatch batch;
  erase(batch, loaded.value());

  record_s record = loaded.take();
  if (!record.live()) {
    record = record_s{};
    record.exists = true;
    record.header.created_ms = now;
  }
  record.header.updated_ms = now;

  write_field(record, field, value, options.field_ttl, hot_ttl_meta(options),
              now);
  apply_session_ttl(record, options.session_ttl, now);
  put(batch, id, record);

  status = commit(op, batch);
  if (status.is_error()) {
    return status.error();
  }
  logger_->debug("disk: {} {} on {}", op, field, id);
  return true;
}

status_c disk_store_c::set(const std::string &id, const std::string &field,
                           const std::string &value,
                           const write_options_s &options) {
  auto written = write("set", id, field, value, options, false);
  if (written.is_error()) {
    return written.error();
  }
  return status_c();
}

result_c<bool> disk_store_c::insert(const std::string &id,
                                    const std::string &field,
                                    const std::string &value,
                                    const write_options_s &options) {
  auto status = validate_insert(options);
  if (status.is_error()) {
    return status.error();
  }
  return write("insert", id, field, value, options, true);
}

status_c disk_store_c::check_move(const std::string &old_id,
                                  const std::string &new_id,
                                  const std::string *field) const {
  auto status = check_id(old_id);
  if (status.is_error()) {
    return status;
  }
  status = check_id(new_id);
  if (status.is_error()) {
    return status;
  }
  status = validate_rename(old_id, new_id);
  if (status.is_error() || !field) {
    return status;
  }
  return validate_field(*field);
}

result_c<bool> disk_store_c::move_record(
    const char *op, const std::string &old_id, const std::string &new_id,
    const std::function<bool(record_s &, std::int64_t)> &mutate) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  auto now = clock_();
  auto target = load(new_id, now);
  if (target.is_error()) {
    return target.error();
  }
  if (target.value().live()) {
    logger_->warn("disk: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }

  auto source = load(old_id, now);
  if (source.is_error()) {
    return source.error();
  }

  rocksdb::WriteBatch batch;
  erase(batch, target.value());
  erase(batch, source.value());

  record_s record = source.take();
  if (!record.live()) {
    record = record_s{};
    record.exists = true;
    record.header.created_ms = now;
  }
  record.keys.clear();
  record.header.updated_ms = now;

  bool written = mutate(record, now);
  put(batch, new_id, record);

  status = commit(op, batch);
  if (status.is_error()) {
    return status.error();
  }
  logger_->debug("disk: renamed {} -> {}", old_id, new_id);
  return written;
}

status_c disk_store_c::set_and_rename(const std::string &old_id,
                                      const std::string &new_id,
                                      const std::string &field,
                                      const std::string &value,
                                      const write_options_s &options) {
  auto status = check_move(old_id, new_id, &field);
  if (status.is_error()) {
    return status;
  }

  auto hot_ttl = hot_ttl_meta(options);
  auto moved = move_record("set_and_rename", old_id, new_id,
                           [&](record_s &record, std::int64_t now) {
                             write_field(record, field, value,
                                         options.field_ttl, hot_ttl, now);
                             apply_session_ttl(record, options.session_ttl,
                                               now);
                             return true;
                           });
  if (moved.is_error()) {
    return moved.error();
  }
  return status_c();
}

result_c<bool> disk_store_c::insert_and_rename(const std::string &old_id,
                                               const std::string &new_id,
                                               const std::string &field,
                                               const std::string &value,
                                               const write_options_s &options) {
  auto status = check_move(old_id, new_id, &field);
  if (status.is_error()) {
    return status.error();
  }
  status = validate_insert(options);
  if (status.is_error()) {
    return status.error();
  }

  auto hot_ttl = hot_ttl_meta(options);
  return move_record("insert_and_rename", old_id, new_id,
                     [&](record_s &record, std::int64_t now) {
                       bool absent = record.fields.count(field) == 0;
                       if (absent) {
                         write_field(record, field, value, options.field_ttl,
                                     hot_ttl, now);
                       }
                       apply_session_ttl(record, options.session_ttl, now);
                       return absent;
                     });
}

status_c disk_store_c::rename(const std::string &old_id,
                              const std::string &new_id,
                              std::optional<std::int64_t> session_ttl) {
  auto status = check_move(old_id, new_id, nullptr);
  if (status.is_error()) {
    return status;
  }

  auto moved = move_record("rename", old_id, new_id,
                           [&](record_s &record, std::int64_t now) {
                             apply_session_ttl(record, session_ttl, now);
                             return false;
                           });
  if (moved.is_error()) {
    return moved.error();
  }
  return status_c();
}

status_c disk_store_c::remove(const std::string &id, const std::string &field) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status;
  }

  auto now = clock_();
  auto loaded = load(id, now);
  if (loaded.is_error()) {
    return loaded.error();
  }

  auto &record = loaded.value();
  if (!record.live()) {
    return status_c();
  }

  rocksdb::WriteBatch batch;
  record.fields.erase(field);
  if (record.fields.empty()) {
    erase(batch, record);
  } else {
    batch.Delete(field_key(id, field));
  }
  return commit("remove", batch);
}

status_c disk_store_c::del(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status;
  }

  rocksdb::WriteBatch batch;
  batch.Delete(header_key(id));

  auto prefix = field_prefix(id);
  std::unique_ptr<rocksdb::Iterator> it(
      db_->NewIterator(rocksdb::ReadOptions()));
  for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix);
       it->Next()) {
    batch.Delete(it->key());
  }
  if (!it->status().ok()) {
    return error_s{error_e::BACKEND,
                   "disk iterate: " + it->status().ToString()};
  }
  return commit("delete", batch);
}

status_c disk_store_c::expire(const std::string &id, std::int64_t ttl) {
  if (ttl <= 0) {
    return del(id);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status;
  }

  auto now = clock_();
  auto loaded = load(id, now);
  if (loaded.is_error()) {
    return loaded.error();
  }

  auto &record = loaded.value();
  if (!record.live()) {
    return status_c();
  }

  record.header.expires_ms = now + ttl * 1000;
  record.header.updated_ms = now;

  rocksdb::WriteBatch batch;
  put(batch, id, record);
  return commit("expire", batch);
}

result_c<std::optional<cold_snapshot_s>>
disk_store_c::get_all_with_meta(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  auto now = clock_();
  auto loaded = load(id, now);
  if (loaded.is_error()) {
    return loaded.error();
  }

  const auto &record = loaded.value();
  if (!record.live()) {
    return std::optional<cold_snapshot_s>();
  }

  cold_snapshot_s snapshot;
  std::map<std::string, std::string> fields;
  for (const auto &pair : record.fields) {
    fields[pair.first] = pair.second.value;
    snapshot.meta[pair.first] = field_meta_s{
        pair.second.hot_ttl,
        remaining_secs(
            earliest(pair.second.expires_ms, record.header.expires_ms), now)};
  }
  snapshot.fields = session_map_c(std::move(fields));
  snapshot.session_remaining = remaining_secs(record.header.expires_ms, now);
  return std::optional<cold_snapshot_s>(std::move(snapshot));
}

result_c<std::size_t> disk_store_c::sweep_expired() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = check_open();
  if (status.is_error()) {
    return status.error();
  }

  std::vector<std::string> ids;
  {
    std::unique_ptr<rocksdb::Iterator> it(
        db_->NewIterator(rocksdb::ReadOptions()));
    for (it->Seek(HEADER_PREFIX);
         it->Valid() && it->key().starts_with(HEADER_PREFIX); it->Next()) {
      ids.push_back(it->key().ToString().substr(HEADER_PREFIX.size()));
    }
    if (!it->status().ok()) {
      return error_s{error_e::BACKEND,
                     "disk iterate: " + it->status().ToString()};
    }
  }

  auto now = clock_();
  std::size_t reclaimed = 0;
  rocksdb::WriteBatch batch;

  for (const auto &id : ids) {
    auto loaded = load(id, now);
    if (loaded.is_error()) {
      logger_->warn("disk: sweep skipped {}: {}", id,
                    loaded.error().message);
      continue;
    }

    const auto &record = loaded.value();
    if (!record.live()) {
      erase(batch, record);
      ++reclaimed;
      continue;
    }

    std::set<std::string> live_keys;
    for (const auto &pair : record.fields) {
      live_keys.insert(field_key(id, pair.first));
    }
    for (const auto &key : record.keys) {
      if (key != header_key(id) && live_keys.count(key) == 0) {
        batch.Delete(key);
      }
    }
  }

  status = commit("sweep", batch);
  if (status.is_error()) {
    return status.error();
  }

  if (reclaimed > 0) {
    logger_->debug("disk: reclaimed {} expired sessions", reclaimed);
  }
  return reclaimed;
}

} // namespace sesh::store
