#pragma once

#include "sesh/store/store.hpp"
#include <libpq-fe.h>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace sesh::store {

/*
  Sessions live in two tables: one row per session and one row per field.
  Each store operation is a single statement so it commits or fails as a
  whole. The connection is not owned and is used by one call at a time.
*/
class pg_store_c : public store_if, public cold_layer_if, public sweepable_if {
public:
  pg_store_c(const pg_store_c &) = delete;
  pg_store_c &operator=(const pg_store_c &) = delete;

  //! \param schema optional schema the tables live in, empty for the
  //!        connection's search path
  pg_store_c(std::shared_ptr<spdlog::logger> logger, PGconn *conn,
             std::string schema = "");
  ~pg_store_c() = default;

  //! \brief Create the schema (when named), tables and indexes if missing
  status_c init_schema();

  const char *name() const override;

  result_c<std::optional<std::string>> get(const std::string &id,
                                           const std::string &field) override;
  result_c<std::optional<session_map_c>>
  get_all(const std::string &id) override;
  status_c set(const std::string &id, const std::string &field,
               const std::string &value,
               const write_options_s &options) override;
  status_c set_and_rename(const std::string &old_id,
                          const std::string &new_id, const std::string &field,
                          const std::string &value,
                          const write_options_s &options) override;
  result_c<bool> insert(const std::string &id, const std::string &field,
                        const std::string &value,
                        const write_options_s &options) override;
  result_c<bool> insert_and_rename(const std::string &old_id,
                                   const std::string &new_id,
                                   const std::string &field,
                                   const std::string &value,
                                   const write_options_s &options) override;
  status_c rename(const std::string &old_id, const std::string &new_id,
                  std::optional<std::int64_t> session_ttl) override;
  status_c remove(const std::string &id, const std::string &field) override;
  status_c del(const std::string &id) override;
  status_c expire(const std::string &id, std::int64_t ttl) override;

  result_c<std::optional<cold_snapshot_s>>
  get_all_with_meta(const std::string &id) override;

  result_c<std::size_t> sweep_expired() override;

private:
  struct pg_result_deleter_s {
    void operator()(PGresult *result) const { PQclear(result); }
  };
  using pg_result_t = std::unique_ptr<PGresult, pg_result_deleter_s>;

  struct param_s {
    std::optional<std::string> value;
    bool binary{false};
  };

  struct statements_s {
    std::string init_schema;
    std::string set;
    std::string set_and_rename;
    std::string insert;
    std::string insert_and_rename;
    std::string rename;
    std::string rename_delete;
    std::string rename_remove;
    std::string set_remove;
    std::string get;
    std::string get_all;
    std::string get_all_with_meta;
    std::string remove;
    std::string del;
    std::string expire;
    std::string sweep;
  };

  result_c<pg_result_t> exec(const char *op, const std::string &sql,
                             const std::vector<param_s> &params);
  status_c check_taken(const pg_result_t &result, const std::string &old_id,
                       const std::string &new_id);
  status_c report(const char *op, const result_c<pg_result_t> &result,
                  const std::string &old_id, const std::string &new_id);
  result_c<bool> written(const result_c<pg_result_t> &result);
  std::string quote_identifier(const std::string &name) const;
  void render_statements();

  std::shared_ptr<spdlog::logger> logger_;
  PGconn *conn_{nullptr};
  std::string schema_;
  statements_s statements_;
  std::mutex conn_mutex_;
};

} // namespace sesh::store
