#include "sesh/store/pg_store.hpp"
#include "sesh/store/pg_statements.hpp"
#include <cstring>
#include <fmt/format.h>

namespace sesh::store {

namespace {

constexpr const char *SQLSTATE_UNIQUE_VIOLATION = "23505";

std::optional<std::string> bigint_param(const std::optional<std::int64_t> &v) {
  if (!v) {
    return std::nullopt;
  }
  return std::to_string(*v);
}

std::optional<std::string> decode_bytea(const char *text) {
  std::size_t length = 0;
  auto *bytes = PQunescapeBytea(reinterpret_cast<const unsigned char *>(text),
                                &length);
  if (!bytes) {
    return std::nullopt;
  }
  std::string decoded(reinterpret_cast<const char *>(bytes), length);
  PQfreemem(bytes);
  return decoded;
}

std::optional<std::int64_t> bigint_column(PGresult *result, int row, int col) {
  if (PQgetisnull(result, row, col)) {
    return std::nullopt;
  }
  return std::stoll(PQgetvalue(result, row, col));
}

} // namespace

pg_store_c::pg_store_c(std::shared_ptr<spdlog::logger> logger, PGconn *conn,
                       std::string schema)
    : logger_(std::move(logger)), conn_(conn), schema_(std::move(schema)) {
  render_statements();
}

const char *pg_store_c::name() const { return "postgres"; }

std::string pg_store_c::quote_identifier(const std::string &name) const {
  char *quoted = PQescapeIdentifier(conn_, name.c_str(), name.size());
  if (!quoted) {
    // Only fails on invalid encoding, fall back to plain double quoting
    return "\"" + name + "\"";
  }
  std::string result(quoted);
  PQfreemem(quoted);
  return result;
}

void pg_store_c::render_statements() {
  std::string prefix;
  if (!schema_.empty()) {
    prefix = quote_identifier(schema_) + ".";
  }
  auto sessions = prefix + "sesh_sessions";
  auto kv = prefix + "sesh_session_kv";

  auto render = [&](const char *tmpl) {
    return fmt::format(fmt::runtime(tmpl), fmt::arg("sessions", sessions),
                       fmt::arg("kv", kv));
  };

  statements_.init_schema = render(pg_statements::INIT_SCHEMA);
  if (!schema_.empty()) {
    statements_.init_schema =
        fmt::format("create schema if not exists {};\n{}",
                    quote_identifier(schema_), statements_.init_schema);
  }
  statements_.set = render(pg_statements::SET);
  statements_.set_and_rename = render(pg_statements::SET_AND_RENAME);
  statements_.insert = render(pg_statements::INSERT);
  statements_.insert_and_rename = render(pg_statements::INSERT_AND_RENAME);
  statements_.rename = render(pg_statements::RENAME);
  statements_.rename_delete = render(pg_statements::RENAME_DELETE);
  statements_.rename_remove = render(pg_statements::RENAME_REMOVE);
  statements_.set_remove = render(pg_statements::SET_REMOVE);
  statements_.get = render(pg_statements::GET);
  statements_.get_all = render(pg_statements::GET_ALL);
  statements_.get_all_with_meta = render(pg_statements::GET_ALL_WITH_META);
  statements_.remove = render(pg_statements::REMOVE);
  statements_.del = render(pg_statements::DELETE);
  statements_.expire = render(pg_statements::EXPIRE);
  statements_.sweep = render(pg_statements::SWEEP);
}

result_c<pg_store_c::pg_result_t>
pg_store_c::exec(const char *op, const std::string &sql,
                 const std::vector<param_s> &params) {
  std::vector<const char *> values;
  std::vector<int> lengths;
  std::vector<int> formats;
  values.reserve(params.size());
  lengths.reserve(params.size());
  formats.reserve(params.size());

  for (const auto &param : params) {
    if (param.value) {
      values.push_back(param.value->data());
      lengths.push_back(static_cast<int>(param.value->size()));
    } else {
      values.push_back(nullptr);
      lengths.push_back(0);
    }
    formats.push_back(param.binary ? 1 : 0);
  }

  std::lock_guard<std::mutex> lock(conn_mutex_);
  pg_result_t result(PQexecParams(conn_, sql.c_str(),
                                  static_cast<int>(params.size()), nullptr,
                                  values.data(), lengths.data(),
                                  formats.data(), 0));
  if (!result) {
    logger_->error("postgres: {} failed: {}", op, PQerrorMessage(conn_));
    return error_s{error_e::BACKEND,
                   fmt::format("postgres {}: {}", op, PQerrorMessage(conn_))};
  }

  auto status = PQresultStatus(result.get());
  if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK) {
    return result;
  }

  const char *sqlstate = PQresultErrorField(result.get(), PG_DIAG_SQLSTATE);
  if (sqlstate && std::strcmp(sqlstate, SQLSTATE_UNIQUE_VIOLATION) == 0) {
    return error_s{error_e::COLLISION,
                   fmt::format("postgres {}: session id already in use", op)};
  }

  std::string message = PQresultErrorMessage(result.get());
  logger_->error("postgres: {} failed: {}", op, message);
  return error_s{error_e::BACKEND, fmt::format("postgres {}: {}", op, message)};
}

status_c pg_store_c::check_taken(const pg_result_t &result,
                                 const std::string &old_id,
                                 const std::string &new_id) {
  if (PQntuples(result.get()) > 0 &&
      std::strcmp(PQgetvalue(result.get(), 0, 0), "t") == 0) {
    logger_->warn("postgres: rename {} -> {} aborted, target exists", old_id,
                  new_id);
    return error_s{error_e::COLLISION, "session id already in use: " + new_id};
  }
  return status_c();
}

status_c pg_store_c::report(const char *op,
                            const result_c<pg_result_t> &result,
                            const std::string &old_id,
                            const std::string &new_id) {
  if (result.is_success()) {
    logger_->debug("postgres: {} {} -> {}", op, old_id, new_id);
    return status_c();
  }
  if (result.error().code == error_e::COLLISION) {
    logger_->warn("postgres: rename {} -> {} aborted, target exists", old_id,
                  new_id);
  }
  return result.error();
}

result_c<bool> pg_store_c::written(const result_c<pg_result_t> &result) {
  if (result.is_error()) {
    return result.error();
  }
  return bigint_column(result.value().get(), 0, 0).value_or(0) > 0;
}

status_c pg_store_c::init_schema() {
  std::lock_guard<std::mutex> lock(conn_mutex_);
  pg_result_t result(PQexec(conn_, statements_.init_schema.c_str()));
  if (!result || PQresultStatus(result.get()) != PGRES_COMMAND_OK) {
    std::string message = result ? PQresultErrorMessage(result.get())
                                 : PQerrorMessage(conn_);
    logger_->error("postgres: init_schema failed: {}", message);
    return error_s{error_e::BACKEND,
                   fmt::format("postgres init_schema: {}", message)};
  }
  logger_->info("postgres: schema ready");
  return status_c();
}

result_c<std::optional<std::string>> pg_store_c::get(const std::string &id,
                                                     const std::string &field) {
  auto result = exec("get", statements_.get, {{id}, {field}});
  if (result.is_error()) {
    return result.error();
  }

  auto *rows = result.value().get();
  if (PQntuples(rows) == 0) {
    return std::optional<std::string>();
  }

  auto value = decode_bytea(PQgetvalue(rows, 0, 0));
  if (!value) {
    return error_s{error_e::BACKEND, "postgres get: malformed bytea"};
  }
  return value;
}

result_c<std::optional<session_map_c>>
pg_store_c::get_all(const std::string &id) {
  auto result = exec("get_all", statements_.get_all, {{id}});
  if (result.is_error()) {
    return result.error();
  }

  auto *rows = result.value().get();
  int count = PQntuples(rows);
  if (count == 0) {
    return std::optional<session_map_c>();
  }

  std::map<std::string, std::string> fields;
  for (int row = 0; row < count; row++) {
    auto value = decode_bytea(PQgetvalue(rows, row, 1));
    if (!value) {
      return error_s{error_e::BACKEND, "postgres get_all: malformed bytea"};
    }
    fields[PQgetvalue(rows, row, 0)] = std::move(*value);
  }
  return std::optional<session_map_c>(session_map_c(std::move(fields)));
}

status_c pg_store_c::set(const std::string &id, const std::string &field,
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

  if (options.session_ttl && *options.session_ttl == 0) {
    return del(id);
  }

  if (options.field_ttl && *options.field_ttl == 0) {
    auto result = exec("set", statements_.set_remove,
                       {{id}, {field}, {bigint_param(options.session_ttl)}});
    if (result.is_error()) {
      return result.error();
    }
    return status_c();
  }

  auto result = exec("set", statements_.set,
                     {{id},
                      {field},
                      {value, true},
                      {bigint_param(options.session_ttl)},
                      {bigint_param(options.field_ttl)},
                      {bigint_param(hot_ttl_meta(options))}});
  if (result.is_error()) {
    return result.error();
  }

  logger_->debug("postgres: set {} on {}", field, id);
  return status_c();
}

result_c<bool> pg_store_c::insert(const std::string &id,
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

  return written(exec("insert", statements_.insert,
                      {{id},
                       {field},
                       {value, true},
                       {bigint_param(options.session_ttl)},
                       {bigint_param(options.field_ttl)},
                       {bigint_param(hot_ttl_meta(options))}}));
}

status_c pg_store_c::set_and_rename(const std::string &old_id,
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

  if (options.session_ttl && *options.session_ttl == 0) {
    return rename(old_id, new_id, 0);
  }

  if (options.field_ttl && *options.field_ttl == 0) {
    auto result = exec("set_and_rename", statements_.rename_remove,
                       {{old_id},
                        {new_id},
                        {field},
                        {bigint_param(options.session_ttl)}});
    if (result.is_error()) {
      return report("set_and_rename", result, old_id, new_id);
    }
    return check_taken(result.value(), old_id, new_id);
  }

  return report("set_and_rename",
                exec("set_and_rename", statements_.set_and_rename,
                     {{old_id},
                      {new_id},
                      {field},
                      {value, true},
                      {bigint_param(options.session_ttl)},
                      {bigint_param(options.field_ttl)},
                      {bigint_param(hot_ttl_meta(options))}}),
                old_id, new_id);
}

result_c<bool> pg_store_c::insert_and_rename(const std::string &old_id,
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

  auto result = exec("insert_and_rename", statements_.insert_and_rename,
                     {{old_id},
                      {new_id},
                      {field},
                      {value, true},
                      {bigint_param(options.session_ttl)},
                      {bigint_param(options.field_ttl)},
                      {bigint_param(hot_ttl_meta(options))}});
  if (result.is_error()) {
    return report("insert_and_rename", result, old_id, new_id).error();
  }
  return written(result);
}

status_c pg_store_c::rename(const std::string &old_id,
                            const std::string &new_id,
                            std::optional<std::int64_t> session_ttl) {
  auto status = validate_rename(old_id, new_id);
  if (status.is_error()) {
    return status;
  }

  auto result =
      (session_ttl && *session_ttl == 0)
          ? exec("rename", statements_.rename_delete, {{old_id}, {new_id}})
          : exec("rename", statements_.rename,
                 {{old_id}, {new_id}, {bigint_param(session_ttl)}});
  if (result.is_error()) {
    return report("rename", result, old_id, new_id);
  }
  return check_taken(result.value(), old_id, new_id);
}

status_c pg_store_c::remove(const std::string &id, const std::string &field) {
  auto result = exec("remove", statements_.remove, {{id}, {field}});
  if (result.is_error()) {
    return result.error();
  }
  return status_c();
}

status_c pg_store_c::del(const std::string &id) {
  auto result = exec("delete", statements_.del, {{id}});
  if (result.is_error()) {
    return result.error();
  }
  return status_c();
}

status_c pg_store_c::expire(const std::string &id, std::int64_t ttl) {
  if (ttl <= 0) {
    return del(id);
  }

  auto result =
      exec("expire", statements_.expire, {{id}, {std::to_string(ttl)}});
  if (result.is_error()) {
    return result.error();
  }
  return status_c();
}

result_c<std::optional<cold_snapshot_s>>
pg_store_c::get_all_with_meta(const std::string &id) {
  auto result =
      exec("get_all_with_meta", statements_.get_all_with_meta, {{id}});
  if (result.is_error()) {
    return result.error();
  }

  auto *rows = result.value().get();
  int count = PQntuples(rows);
  if (count == 0) {
    return std::optional<cold_snapshot_s>();
  }

  cold_snapshot_s snapshot;
  std::map<std::string, std::string> fields;
  for (int row = 0; row < count; row++) {
    std::string field = PQgetvalue(rows, row, 0);
    auto value = decode_bytea(PQgetvalue(rows, row, 1));
    if (!value) {
      return error_s{error_e::BACKEND,
                     "postgres get_all_with_meta: malformed bytea"};
    }
    fields[field] = std::move(*value);
    snapshot.meta[field] = field_meta_s{bigint_column(rows, row, 2),
                                        bigint_column(rows, row, 3)};
  }
  snapshot.fields = session_map_c(std::move(fields));
  snapshot.session_remaining = bigint_column(rows, 0, 4);
  return std::optional<cold_snapshot_s>(std::move(snapshot));
}

result_c<std::size_t> pg_store_c::sweep_expired() {
  auto result = exec("sweep", statements_.sweep, {});
  if (result.is_error()) {
    return result.error();
  }

  auto *rows = result.value().get();
  auto sessions = bigint_column(rows, 0, 0).value_or(0);
  auto fields = bigint_column(rows, 0, 1).value_or(0);
  if (sessions > 0 || fields > 0) {
    logger_->debug("postgres: reclaimed {} sessions and {} fields", sessions,
                   fields);
  }
  return static_cast<std::size_t>(sessions);
}

} // namespace sesh::store
