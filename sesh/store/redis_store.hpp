#pragma once

#include "sesh/store/store.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <string>
#include <sw/redis++/redis++.h>
#include <vector>

namespace sesh::store {

/*
  One hash per session under key_prefix + id. Session ttl is the key expiry
  and field ttl is the hash field expiry, so this needs Redis 7.4 or newer.
  Every multi step write runs as a server side script.
*/
class redis_store_c : public store_if, public hot_layer_if {
public:
  redis_store_c(const redis_store_c &) = delete;
  redis_store_c &operator=(const redis_store_c &) = delete;

  redis_store_c(std::shared_ptr<spdlog::logger> logger,
                sw::redis::Redis &redis, std::string key_prefix = "");
  ~redis_store_c() = default;

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

  std::string key_for(const std::string &id) const;

private:
  enum class script_e { SET, SET_AND_RENAME, SET_MANY };

  long long run_script(script_e script, const std::vector<std::string> &keys,
                       const std::vector<std::string> &args);
  std::string script_sha(script_e script, bool reload);
  static const std::string &script_source(script_e script);

  result_c<bool> write_impl(const std::string &id, const std::string &field,
                            const std::string &value,
                            const write_options_s &options,
                            bool only_if_absent);
  result_c<bool> rename_impl(const std::string &old_id,
                             const std::string &new_id,
                             const std::vector<std::string> &args);

  std::shared_ptr<spdlog::logger> logger_;
  sw::redis::Redis &redis_;
  std::string key_prefix_;

  std::mutex sha_mutex_;
  std::map<script_e, std::string> shas_;
};

} // namespace sesh::store
