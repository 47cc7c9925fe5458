#pragma once

#include "sesh/store/store.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>

namespace sesh::store {

/*
  In-process store. Every operation is a single critical section over the
  whole map so it gives the same upsert, rename and collision guarantees as
  the networked backends.
*/
class memstore_c : public store_if,
                   public hot_layer_if,
                   public cold_layer_if,
                   public sweepable_if {
public:
  using time_point_t = std::chrono::steady_clock::time_point;
  using clock_fn_t = std::function<time_point_t()>;

  memstore_c(const memstore_c &) = delete;
  memstore_c(memstore_c &&) = delete;
  memstore_c &operator=(const memstore_c &) = delete;
  memstore_c &operator=(memstore_c &&) = delete;

  explicit memstore_c(std::shared_ptr<spdlog::logger> logger);
  memstore_c(std::shared_ptr<spdlog::logger> logger, clock_fn_t clock);
  ~memstore_c() = default;

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

  status_c set_many(const std::string &id,
                    const std::vector<hot_entry_s> &entries,
                    std::optional<std::int64_t> session_ttl) override;

  result_c<std::optional<cold_snapshot_s>>
  get_all_with_meta(const std::string &id) override;

  result_c<std::size_t> sweep_expired() override;

  std::size_t size() const;

private:
  struct field_s {
    std::string value;
    std::optional<time_point_t> expires_at;
    std::optional<std::int64_t> hot_ttl;
  };

  struct record_s {
    std::map<std::string, field_s> fields;
    std::optional<time_point_t> expires_at;
  };

  record_s *find_live(const std::string &id, time_point_t now);
  void write_field(record_s &record, const std::string &field,
                   const std::string &value,
                   std::optional<std::int64_t> field_ttl,
                   std::optional<std::int64_t> hot_ttl, time_point_t now);
  void apply_session_ttl(record_s &record,
                         std::optional<std::int64_t> session_ttl,
                         time_point_t now);
  void prune(record_s &record, time_point_t now);

  std::shared_ptr<spdlog::logger> logger_;
  clock_fn_t clock_;
  mutable std::mutex mutex_;
  std::map<std::string, record_s> data_;
};

} // namespace sesh::store
