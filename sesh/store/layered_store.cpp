#include "sesh/store/layered_store.hpp"
#include <algorithm>

namespace sesh::store {

namespace {

std::optional<std::int64_t> cap(std::optional<std::int64_t> ttl,
                                std::int64_t limit) {
  if (!ttl || *ttl < 0) {
    return limit;
  }
  if (*ttl == 0) {
    return ttl;
  }
  return std::min(*ttl, limit);
}

std::optional<std::int64_t> min_ttl(std::optional<std::int64_t> a,
                                    std::optional<std::int64_t> b) {
  if (!a) {
    return b;
  }
  if (!b) {
    return a;
  }
  return std::min(*a, *b);
}

write_strategy_e kind_of(const write_options_s &options) {
  if (!options.strategy) {
    return write_strategy_e::WRITE_THROUGH;
  }
  return options.strategy->kind;
}

status_c reject_index_field(const std::string &field) {
  if (field == layered_store_c::INDEX_FIELD) {
    return error_s{error_e::INVALID_ARGUMENT,
                   std::string("field name is reserved: ") +
                       layered_store_c::INDEX_FIELD};
  }
  return status_c();
}

} // namespace

write_options_s hot_write_options(const write_options_s &options) {
  write_options_s hot{options.session_ttl, options.field_ttl, std::nullopt};
  if (kind_of(options) != write_strategy_e::CAPPED_HOT) {
    return hot;
  }

  auto limit = options.strategy->hot_ttl.value_or(0);
  hot.field_ttl = cap(options.field_ttl, limit);
  if (options.session_ttl) {
    hot.session_ttl = cap(options.session_ttl, limit);
  }
  return hot;
}

bool skips_hot(const write_options_s &options) {
  auto meta = hot_ttl_meta(options);
  return meta.has_value() && *meta == 0;
}

layered_store_c::layered_store_c(store_if &hot, hot_layer_if &hot_layer,
                                 store_if &cold, cold_layer_if &cold_layer,
                                 std::shared_ptr<spdlog::logger> logger,
                                 sweepable_if *hot_sweep,
                                 sweepable_if *cold_sweep)
    : hot_(hot), hot_layer_(hot_layer), cold_(cold), cold_layer_(cold_layer),
      logger_(std::move(logger)), hot_sweep_(hot_sweep),
      cold_sweep_(cold_sweep) {}

const char *layered_store_c::name() const { return "layered"; }

std::string layered_store_c::encode_index(const std::set<std::string> &names) {
  std::string encoded;
  for (const auto &name : names) {
    if (!encoded.empty()) {
      encoded.push_back('\0');
    }
    encoded += name;
  }
  return encoded;
}

std::set<std::string>
layered_store_c::decode_index(const std::string &encoded) {
  std::set<std::string> names;
  std::size_t start = 0;
  while (start <= encoded.size()) {
    auto end = encoded.find('\0', start);
    if (end == std::string::npos) {
      end = encoded.size();
    }
    if (end > start) {
      names.insert(encoded.substr(start, end - start));
    }
    start = end + 1;
  }
  return names;
}

void layered_store_c::drop_hot(const std::string &id) {
  auto status = hot_.del(id);
  if (status.is_error()) {
    logger_->warn("layered: failed to drop hot copy of {}: {}", id,
                  status.error().message);
  }
}

status_c layered_store_c::evict(const std::string &id,
                                const std::string &field) {
  // The index goes too, otherwise a hot get_all would miss the field
  auto status = hot_.remove(id, INDEX_FIELD);
  if (status.is_error()) {
    return status;
  }
  return hot_.remove(id, field);
}

status_c layered_store_c::unlist(const std::string &id,
                                 const std::string &field) {
  auto index = hot_.get(id, INDEX_FIELD);
  if (index.is_error()) {
    return index.error();
  }
  if (!index.value() || decode_index(*index.value()).count(field) > 0) {
    return status_c();
  }
  return hot_.remove(id, INDEX_FIELD);
}

void layered_store_c::warm(const std::string &id,
                           const cold_snapshot_s &snapshot) {
  std::vector<hot_entry_s> entries;
  std::optional<std::int64_t> longest;
  bool all_finite = true;
  std::set<std::string> names;

  for (const auto &pair : snapshot.fields.fields()) {
    names.insert(pair.first);

    field_meta_s meta;
    auto it = snapshot.meta.find(pair.first);
    if (it != snapshot.meta.end()) {
      meta = it->second;
    }

    if (meta.hot_ttl && *meta.hot_ttl == 0) {
      continue;
    }

    auto ttl = min_ttl(meta.hot_ttl, meta.remaining);
    if (ttl && *ttl <= 0) {
      continue;
    }

    if (!ttl) {
      all_finite = false;
    } else {
      longest = std::max(longest.value_or(0), *ttl);
    }
    entries.push_back(hot_entry_s{pair.first, pair.second, ttl});
  }

  if (entries.empty()) {
    return;
  }

  std::optional<std::int64_t> session_ttl = snapshot.session_remaining;
  if (session_ttl && *session_ttl <= 0) {
    return;
  }
  if (all_finite && longest) {
    session_ttl = min_ttl(session_ttl, longest);
  }
  if (!session_ttl) {
    session_ttl = -1;
  }

  entries.push_back(hot_entry_s{INDEX_FIELD, encode_index(names), std::nullopt});

  auto status = hot_layer_.set_many(id, entries, session_ttl);
  if (status.is_error()) {
    logger_->warn("layered: failed to warm {}: {}", id,
                  status.error().message);
    return;
  }
  logger_->debug("layered: warmed {} fields of {}", entries.size() - 1, id);
}

result_c<std::optional<cold_snapshot_s>>
layered_store_c::read_cold(const std::string &id) {
  auto snapshot = cold_layer_.get_all_with_meta(id);
  if (snapshot.is_error()) {
    return snapshot.error();
  }

  if (snapshot.value()) {
    warm(id, *snapshot.value());
  }
  return snapshot;
}

result_c<std::optional<std::string>>
layered_store_c::get(const std::string &id, const std::string &field) {
  auto status = reject_index_field(field);
  if (status.is_error()) {
    return status.error();
  }

  auto cached = hot_.get(id, field);
  if (cached.is_error()) {
    logger_->warn("layered: hot get {} on {} failed, reading cold: {}", field,
                  id, cached.error().message);
  } else if (cached.value()) {
    return cached;
  }

  auto snapshot = read_cold(id);
  if (snapshot.is_error()) {
    return snapshot.error();
  }
  if (!snapshot.value()) {
    return std::optional<std::string>();
  }
  return snapshot.value()->fields.raw(field);
}

result_c<std::optional<session_map_c>>
layered_store_c::get_all(const std::string &id) {
  std::map<std::string, std::string> hot_fields;

  auto cached = hot_.get_all(id);
  if (cached.is_error()) {
    logger_->warn("layered: hot get_all on {} failed, reading cold: {}", id,
                  cached.error().message);
  } else if (cached.value()) {
    hot_fields = cached.value()->fields();
    auto index = hot_fields.find(INDEX_FIELD);
    if (index != hot_fields.end()) {
      auto names = decode_index(index->second);
      hot_fields.erase(index);

      bool complete = std::all_of(
          names.begin(), names.end(), [&](const std::string &name) {
            return hot_fields.find(name) != hot_fields.end();
          });
      if (complete) {
        return std::optional<session_map_c>(session_map_c(hot_fields));
      }
    }
  }

  auto snapshot = read_cold(id);
  if (snapshot.is_error()) {
    return snapshot.error();
  }

  // HOT_ONLY fields exist nowhere else, cold wins for everything it has
  std::map<std::string, std::string> merged;
  if (snapshot.value()) {
    merged = snapshot.value()->fields.fields();
  }
  for (auto &pair : hot_fields) {
    merged.emplace(pair.first, std::move(pair.second));
  }

  if (merged.empty()) {
    return std::optional<session_map_c>();
  }
  return std::optional<session_map_c>(session_map_c(std::move(merged)));
}

status_c layered_store_c::write_hot(const std::string &id,
                                    const std::string &field,
                                    const std::string &value,
                                    const write_options_s &options) {
  if (skips_hot(options)) {
    return evict(id, field);
  }

  auto status = hot_.set(id, field, value, hot_write_options(options));
  if (status.is_success()) {
    status = unlist(id, field);
  }
  if (status.is_success()) {
    return status;
  }

  logger_->warn("layered: hot set {} on {} failed, evicting: {}", field, id,
                status.error().message);
  auto evicted = evict(id, field);
  if (evicted.is_error()) {
    logger_->error("layered: eviction of {} on {} failed: {}", field, id,
                   evicted.error().message);
    return status;
  }
  return status_c();
}

void layered_store_c::move_hot(const std::string &old_id,
                               const std::string &new_id,
                               const std::string *field,
                               const std::string &value,
                               const write_options_s &options) {
  auto hot_options = hot_write_options(options);
  status_c status;
  if (!field) {
    status = hot_.rename(old_id, new_id, hot_options.session_ttl);
  } else if (skips_hot(options)) {
    status = hot_.rename(old_id, new_id, hot_options.session_ttl);
    if (status.is_success()) {
      status = evict(new_id, *field);
    }
  } else {
    status = hot_.set_and_rename(old_id, new_id, *field, value, hot_options);
    if (status.is_success()) {
      status = unlist(new_id, *field);
    }
  }

  if (status.is_error()) {
    logger_->warn("layered: hot rename {} -> {} failed, dropping both: {}",
                  old_id, new_id, status.error().message);
    drop_hot(old_id);
    drop_hot(new_id);
  }
}

result_c<bool> layered_store_c::move_hot_only(const std::string &old_id,
                                              const std::string &new_id,
                                              const std::string &field,
                                              const std::string &value,
                                              const write_options_s &options,
                                              bool only_if_absent) {
  auto status = cold_.rename(old_id, new_id, options.session_ttl);
  if (status.is_error()) {
    return status.error();
  }

  auto hot_options = hot_write_options(options);
  if (only_if_absent) {
    auto written =
        hot_.insert_and_rename(old_id, new_id, field, value, hot_options);
    if (written.is_success()) {
      return written;
    }
    status = written.error();
  } else {
    status = hot_.set_and_rename(old_id, new_id, field, value, hot_options);
    if (status.is_success()) {
      return true;
    }
  }

  if (status.error().code == error_e::COLLISION) {
    // A hot only session owns the new id, put the cold record back
    auto undo = cold_.rename(new_id, old_id, std::nullopt);
    if (undo.is_error()) {
      logger_->error("layered: failed to move {} back to {}: {}", new_id,
                     old_id, undo.error().message);
    }
    return status.error();
  }

  // Cold already moved, so the hot copy is rebuilt under the new id
  logger_->warn("layered: hot rename {} -> {} failed, dropping both: {}",
                old_id, new_id, status.error().message);
  drop_hot(old_id);
  drop_hot(new_id);
  if (only_if_absent) {
    return hot_.insert(new_id, field, value, hot_options);
  }
  status = hot_.set(new_id, field, value, hot_options);
  if (status.is_error()) {
    return status.error();
  }
  return true;
}

status_c layered_store_c::set(const std::string &id, const std::string &field,
                              const std::string &value,
                              const write_options_s &options) {
  auto status = reject_index_field(field);
  if (status.is_error()) {
    return status;
  }

  if (kind_of(options) == write_strategy_e::HOT_ONLY) {
    return hot_.set(id, field, value, hot_write_options(options));
  }

  status = cold_.set(id, field, value, options);
  if (status.is_error()) {
    return status;
  }
  return write_hot(id, field, value, options);
}

result_c<bool> layered_store_c::insert(const std::string &id,
                                       const std::string &field,
                                       const std::string &value,
                                       const write_options_s &options) {
  auto status = reject_index_field(field);
  if (status.is_error()) {
    return status.error();
  }

  if (kind_of(options) == write_strategy_e::HOT_ONLY) {
    return hot_.insert(id, field, value, hot_write_options(options));
  }

  auto written = cold_.insert(id, field, value, options);
  if (written.is_error() || !written.value()) {
    return written;
  }

  status = write_hot(id, field, value, options);
  if (status.is_error()) {
    return status.error();
  }
  return true;
}

status_c layered_store_c::set_and_rename(const std::string &old_id,
                                         const std::string &new_id,
                                         const std::string &field,
                                         const std::string &value,
                                         const write_options_s &options) {
  auto status = reject_index_field(field);
  if (status.is_error()) {
    return status;
  }

  if (kind_of(options) == write_strategy_e::HOT_ONLY) {
    auto written =
        move_hot_only(old_id, new_id, field, value, options, false);
    if (written.is_error()) {
      return written.error();
    }
    return status_c();
  }

  status = cold_.set_and_rename(old_id, new_id, field, value, options);
  if (status.is_error()) {
    return status;
  }

  move_hot(old_id, new_id, &field, value, options);
  return status_c();
}

result_c<bool> layered_store_c::insert_and_rename(
    const std::string &old_id, const std::string &new_id,
    const std::string &field, const std::string &value,
    const write_options_s &options) {
  auto status = reject_index_field(field);
  if (status.is_error()) {
    return status.error();
  }

  if (kind_of(options) == write_strategy_e::HOT_ONLY) {
    return move_hot_only(old_id, new_id, field, value, options, true);
  }

  auto written = cold_.insert_and_rename(old_id, new_id, field, value, options);
  if (written.is_error()) {
    return written;
  }

  move_hot(old_id, new_id, written.value() ? &field : nullptr, value,
           options);
  return written;
}

status_c layered_store_c::rename(const std::string &old_id,
                                 const std::string &new_id,
                                 std::optional<std::int64_t> session_ttl) {
  auto status = cold_.rename(old_id, new_id, session_ttl);
  if (status.is_error()) {
    return status;
  }

  move_hot(old_id, new_id, nullptr, "",
           write_options_s{session_ttl, std::nullopt, std::nullopt});
  return status_c();
}

status_c layered_store_c::remove(const std::string &id,
                                 const std::string &field) {
  auto status = cold_.remove(id, field);
  if (status.is_error()) {
    return status;
  }
  return hot_.remove(id, field);
}

status_c layered_store_c::del(const std::string &id) {
  auto status = cold_.del(id);
  if (status.is_error()) {
    return status;
  }
  return hot_.del(id);
}

status_c layered_store_c::expire(const std::string &id, std::int64_t ttl) {
  auto status = cold_.expire(id, ttl);
  if (status.is_error()) {
    return status;
  }

  // Re-warmed on the next read with ttls capped by the new expiry
  return hot_.del(id);
}

result_c<std::size_t> layered_store_c::sweep_expired() {
  std::size_t reclaimed = 0;
  if (hot_sweep_) {
    auto swept = hot_sweep_->sweep_expired();
    if (swept.is_error()) {
      logger_->warn("layered: hot sweep failed: {}", swept.error().message);
    } else {
      reclaimed += swept.value();
    }
  }

  if (cold_sweep_) {
    auto swept = cold_sweep_->sweep_expired();
    if (swept.is_error()) {
      return swept.error();
    }
    reclaimed += swept.value();
  }
  return reclaimed;
}

bool layered_store_c::is_sweepable() const {
  return hot_sweep_ != nullptr || cold_sweep_ != nullptr;
}

} // namespace sesh::store
