#pragma once

#include "sesh/codec/codec.hpp"
#include "sesh/store/result.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sesh::store {

enum class write_strategy_e {
  WRITE_THROUGH = 0,
  CAPPED_HOT = 1,
  HOT_ONLY = 2,
  COLD_ONLY = 3,
};

//! \brief How a layered store distributes one write across its layers
struct write_strategy_s {
  write_strategy_e kind{write_strategy_e::WRITE_THROUGH};
  std::optional<std::int64_t> hot_ttl;

  static write_strategy_s write_through();
  static write_strategy_s capped_hot(std::int64_t hot_ttl_secs);
  static write_strategy_s hot_only();
  static write_strategy_s cold_only();
};

/*
  session_ttl:  nullopt keeps the current expiry, < 0 persists, 0 deletes
                the session, > 0 expires that many seconds from now
  field_ttl:    nullopt or < 0 leaves the field without its own expiry,
                0 removes the field, > 0 expires that many seconds from now
*/
struct write_options_s {
  std::optional<std::int64_t> session_ttl;
  std::optional<std::int64_t> field_ttl;
  std::optional<write_strategy_s> strategy;
};

//! \brief The hot ttl a cold store persists next to a field so a layered
//!        store can warm it later. nullopt means write-through and 0 means the
//!        field must never be cached.
std::optional<std::int64_t> hot_ttl_meta(const write_options_s &options);

//! \brief Bulk snapshot of a session, decoded lazily one field at a time
class session_map_c {
public:
  session_map_c() = default;
  explicit session_map_c(std::map<std::string, std::string> fields);

  bool empty() const;
  std::size_t size() const;
  bool contains(const std::string &field) const;
  std::optional<std::string> raw(const std::string &field) const;
  const std::map<std::string, std::string> &fields() const;

  template <typename T, typename Codec = codec::msgpack_codec_c>
  result_c<std::optional<T>> get(const std::string &field) const {
    auto it = fields_.find(field);
    if (it == fields_.end()) {
      return std::optional<T>();
    }
    auto decoded = Codec::template decode<T>(it->second);
    if (decoded.is_error()) {
      return decoded.error();
    }
    return std::optional<T>(decoded.take());
  }

private:
  std::map<std::string, std::string> fields_;
};

class store_if {
public:
  virtual ~store_if() = default;

  virtual const char *name() const = 0;

  virtual result_c<std::optional<std::string>>
  get(const std::string &id, const std::string &field) = 0;

  virtual result_c<std::optional<session_map_c>>
  get_all(const std::string &id) = 0;

  //! \brief Upsert a field and (re)apply the session ttl in one atomic step
  virtual status_c set(const std::string &id, const std::string &field,
                       const std::string &value,
                       const write_options_s &options) = 0;

  //! \brief Move the record at old_id to new_id and write the field, all or
  //!        nothing. Fails with COLLISION when new_id is already taken. When
  //!        nothing lives at old_id the record is created at new_id.
  virtual status_c set_and_rename(const std::string &old_id,
                                  const std::string &new_id,
                                  const std::string &field,
                                  const std::string &value,
                                  const write_options_s &options) = 0;

  //! \brief Write the field only when it is not already live. Returns true
  //!        when the field was written. An existing field leaves the whole
  //!        session untouched. Zero ttls are rejected with INVALID_ARGUMENT.
  virtual result_c<bool> insert(const std::string &id,
                                const std::string &field,
                                const std::string &value,
                                const write_options_s &options) = 0;

  //! \brief set_and_rename with the field write of insert. The move and the
  //!        session ttl always apply, the field is only written when the
  //!        moved record does not already hold it.
  virtual result_c<bool> insert_and_rename(const std::string &old_id,
                                           const std::string &new_id,
                                           const std::string &field,
                                           const std::string &value,
                                           const write_options_s &options) = 0;

  //! \brief set_and_rename without a field write
  virtual status_c rename(const std::string &old_id, const std::string &new_id,
                          std::optional<std::int64_t> session_ttl) = 0;

  virtual status_c remove(const std::string &id, const std::string &field) = 0;
  virtual status_c del(const std::string &id) = 0;

  //! \brief Re-arm the session expiry, ttl <= 0 deletes the session
  virtual status_c expire(const std::string &id, std::int64_t ttl) = 0;
};

struct hot_entry_s {
  std::string field;
  std::string value;
  std::optional<std::int64_t> field_ttl;
};

//! \brief A store that can sit in the hot layer of a layered store
class hot_layer_if {
public:
  virtual ~hot_layer_if() = default;
  virtual status_c set_many(const std::string &id,
                            const std::vector<hot_entry_s> &entries,
                            std::optional<std::int64_t> session_ttl) = 0;
};

struct field_meta_s {
  std::optional<std::int64_t> hot_ttl;
  std::optional<std::int64_t> remaining;
};

struct cold_snapshot_s {
  session_map_c fields;
  std::map<std::string, field_meta_s> meta;
  std::optional<std::int64_t> session_remaining;
};

//! \brief A store that can sit in the cold layer of a layered store
class cold_layer_if {
public:
  virtual ~cold_layer_if() = default;
  virtual result_c<std::optional<cold_snapshot_s>>
  get_all_with_meta(const std::string &id) = 0;
};

//! \brief A store that reclaims expired records on demand
class sweepable_if {
public:
  virtual ~sweepable_if() = default;
  virtual result_c<std::size_t> sweep_expired() = 0;
};

status_c validate_id(const std::string &id);
status_c validate_field(const std::string &field);
status_c validate_rename(const std::string &old_id, const std::string &new_id);
status_c validate_insert(const write_options_s &options);

} // namespace sesh::store
