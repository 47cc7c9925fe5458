#include "sesh/store/store.hpp"

namespace sesh::store {

const char *error_to_string(error_e code) {
  switch (code) {
  case error_e::ENCODING:
    return "encoding";
  case error_e::COLLISION:
    return "collision";
  case error_e::BACKEND:
    return "backend";
  case error_e::INVALID_ARGUMENT:
    return "invalid argument";
  }
  return "unknown";
}

write_strategy_s write_strategy_s::write_through() {
  return write_strategy_s{write_strategy_e::WRITE_THROUGH, std::nullopt};
}

write_strategy_s write_strategy_s::capped_hot(std::int64_t hot_ttl_secs) {
  return write_strategy_s{write_strategy_e::CAPPED_HOT, hot_ttl_secs};
}

write_strategy_s write_strategy_s::hot_only() {
  return write_strategy_s{write_strategy_e::HOT_ONLY, std::nullopt};
}

write_strategy_s write_strategy_s::cold_only() {
  return write_strategy_s{write_strategy_e::COLD_ONLY, std::nullopt};
}

std::optional<std::int64_t> hot_ttl_meta(const write_options_s &options) {
  if (!options.strategy) {
    return std::nullopt;
  }

  switch (options.strategy->kind) {
  case write_strategy_e::CAPPED_HOT:
    if (!options.strategy->hot_ttl || *options.strategy->hot_ttl <= 0) {
      return 0;
    }
    return options.strategy->hot_ttl;
  case write_strategy_e::COLD_ONLY:
    return 0;
  case write_strategy_e::WRITE_THROUGH:
  case write_strategy_e::HOT_ONLY:
    break;
  }
  return std::nullopt;
}

session_map_c::session_map_c(std::map<std::string, std::string> fields)
    : fields_(std::move(fields)) {}

bool session_map_c::empty() const { return fields_.empty(); }

std::size_t session_map_c::size() const { return fields_.size(); }

bool session_map_c::contains(const std::string &field) const {
  return fields_.find(field) != fields_.end();
}

std::optional<std::string> session_map_c::raw(const std::string &field) const {
  auto it = fields_.find(field);
  if (it == fields_.end()) {
    return std::nullopt;
  }
  return it->second;
}

const std::map<std::string, std::string> &session_map_c::fields() const {
  return fields_;
}

status_c validate_id(const std::string &id) {
  if (id.empty()) {
    return error_s{error_e::INVALID_ARGUMENT, "session id must not be empty"};
  }
  return status_c();
}

status_c validate_field(const std::string &field) {
  if (field.empty()) {
    return error_s{error_e::INVALID_ARGUMENT, "field name must not be empty"};
  }
  return status_c();
}

status_c validate_rename(const std::string &old_id, const std::string &new_id) {
  auto status = validate_id(old_id);
  if (status.is_error()) {
    return status;
  }
  status = validate_id(new_id);
  if (status.is_error()) {
    return status;
  }
  if (old_id == new_id) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "old and new session id must differ"};
  }
  return status_c();
}

status_c validate_insert(const write_options_s &options) {
  if ((options.session_ttl && *options.session_ttl == 0) ||
      (options.field_ttl && *options.field_ttl == 0)) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "insert does not accept a zero ttl"};
  }
  return status_c();
}

} // namespace sesh::store
