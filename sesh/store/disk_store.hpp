#pragma once

#include "sesh/store/store.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace rocksdb {
class DB;
class WriteBatch;
} // namespace rocksdb

namespace sesh::store {

/*
  RocksDB backed store. A session is one header key "s/<id>" plus one key
  per field "f/<id>/<field>", both MessagePack encoded. Expiry uses wall
  clock milliseconds so it survives a restart. Session ids may not contain
  '/'.
*/
class disk_store_c : public store_if, public cold_layer_if, public sweepable_if {
public:
  //! \brief Milliseconds since the unix epoch
  using clock_fn_t = std::function<std::int64_t()>;

  disk_store_c(const disk_store_c &) = delete;
  disk_store_c(disk_store_c &&) = delete;
  disk_store_c &operator=(const disk_store_c &) = delete;
  disk_store_c &operator=(disk_store_c &&) = delete;

  explicit disk_store_c(std::shared_ptr<spdlog::logger> logger);
  disk_store_c(std::shared_ptr<spdlog::logger> logger, clock_fn_t clock);
  ~disk_store_c();

  bool open(const std::string &path);
  bool close();
  bool is_open() const;

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
  struct header_s {
    std::optional<std::int64_t> expires_ms;
    std::int64_t created_ms{0};
    std::int64_t updated_ms{0};
  };

  struct field_s {
    std::string value;
    std::optional<std::int64_t> expires_ms;
    std::optional<std::int64_t> hot_ttl;
  };

  struct record_s {
    bool exists{false};
    header_s header;
    std::map<std::string, field_s> fields; // live fields only
    std::vector<std::string> keys;         // every key stored for the id
    bool live() const { return exists && !fields.empty(); }
  };

  status_c check_open() const;
  status_c check_id(const std::string &id) const;
  result_c<record_s> load(const std::string &id, std::int64_t now);
  void erase(rocksdb::WriteBatch &batch, const record_s &record);
  void put(rocksdb::WriteBatch &batch, const std::string &id,
           const record_s &record);
  status_c commit(const char *op, rocksdb::WriteBatch &batch);

  void write_field(record_s &record, const std::string &field,
                   const std::string &value,
                   std::optional<std::int64_t> field_ttl,
                   std::optional<std::int64_t> hot_ttl, std::int64_t now);
  void apply_session_ttl(record_s &record,
                         std::optional<std::int64_t> session_ttl,
                         std::int64_t now);
  result_c<bool> write(const char *op, const std::string &id,
                       const std::string &field, const std::string &value,
                       const write_options_s &options, bool only_if_absent);
  status_c check_move(const std::string &old_id, const std::string &new_id,
                      const std::string *field) const;

  //! \brief mutate returns whether it wrote a field
  result_c<bool>
  move_record(const char *op, const std::string &old_id,
              const std::string &new_id,
              const std::function<bool(record_s &, std::int64_t)> &mutate);

  std::shared_ptr<spdlog::logger> logger_;
  clock_fn_t clock_;
  std::unique_ptr<rocksdb::DB> db_;
  bool is_open_;
  mutable std::mutex mutex_;
};

} // namespace sesh::store
