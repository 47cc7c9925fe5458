#pragma once

#include "sesh/store/store.hpp"
#include <memory>
#include <set>
#include <spdlog/spdlog.h>
#include <string>
#include <type_traits>

namespace sesh::store {

/*
  Two stores composed as a cache (hot) in front of a store of record (cold).

  The cold layer is always written first and is the authority for renames.
  Reads go to hot and fall back to cold, warming hot with TTLs that never
  outlive the cold record.

  A warmed hot record carries INDEX_FIELD, the full set of cold field names.
  A hot get_all only counts as a hit while every indexed field is still
  present, so partially cached sessions are read from cold. A write of a field
  the index does not list drops the index.

  HOT_ONLY writes still rename through cold so a rotation never leaves the
  durable record behind or lands on an id cold already holds.
*/
class layered_store_c : public store_if, public sweepable_if {
public:
  static constexpr const char *INDEX_FIELD = "__sesh_fields__";

  layered_store_c(const layered_store_c &) = delete;
  layered_store_c &operator=(const layered_store_c &) = delete;

  //! \param hot_sweep, cold_sweep the layers sweep_expired reaches, nullptr
  //!        for a layer that expires records on its own
  layered_store_c(store_if &hot, hot_layer_if &hot_layer, store_if &cold,
                  cold_layer_if &cold_layer,
                  std::shared_ptr<spdlog::logger> logger,
                  sweepable_if *hot_sweep = nullptr,
                  sweepable_if *cold_sweep = nullptr);

  template <typename Hot, typename Cold>
  layered_store_c(Hot &hot, Cold &cold, std::shared_ptr<spdlog::logger> logger)
      : layered_store_c(static_cast<store_if &>(hot),
                        static_cast<hot_layer_if &>(hot),
                        static_cast<store_if &>(cold),
                        static_cast<cold_layer_if &>(cold), std::move(logger),
                        sweepable_of(hot), sweepable_of(cold)) {}

  ~layered_store_c() = default;

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

  //! \brief Sweep both layers. A hot failure is logged, a cold failure is
  //!        returned. The count covers records reclaimed in either layer.
  result_c<std::size_t> sweep_expired() override;

  bool is_sweepable() const;

  static std::string encode_index(const std::set<std::string> &names);
  static std::set<std::string> decode_index(const std::string &encoded);

private:
  template <typename T> static sweepable_if *sweepable_of(T &store) {
    if constexpr (std::is_base_of_v<sweepable_if, T>) {
      return &store;
    } else {
      return nullptr;
    }
  }

  result_c<std::optional<cold_snapshot_s>> read_cold(const std::string &id);
  void warm(const std::string &id, const cold_snapshot_s &snapshot);
  status_c evict(const std::string &id, const std::string &field);
  status_c unlist(const std::string &id, const std::string &field);
  void drop_hot(const std::string &id);

  status_c write_hot(const std::string &id, const std::string &field,
                     const std::string &value, const write_options_s &options);
  void move_hot(const std::string &old_id, const std::string &new_id,
                const std::string *field, const std::string &value,
                const write_options_s &options);
  result_c<bool> move_hot_only(const std::string &old_id,
                               const std::string &new_id,
                               const std::string &field,
                               const std::string &value,
                               const write_options_s &options,
                               bool only_if_absent);

  store_if &hot_;
  hot_layer_if &hot_layer_;
  store_if &cold_;
  cold_layer_if &cold_layer_;
  std::shared_ptr<spdlog::logger> logger_;
  sweepable_if *hot_sweep_;
  sweepable_if *cold_sweep_;
};

//! \brief The options the hot layer receives for a write, with every ttl
//!        capped by the strategy's hot ttl and the strategy itself removed
write_options_s hot_write_options(const write_options_s &options);

//! \brief True when the strategy keeps the field out of the hot layer
bool skips_hot(const write_options_s &options);

} // namespace sesh::store
