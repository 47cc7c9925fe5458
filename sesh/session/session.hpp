#pragma once

#include "sesh/codec/codec.hpp"
#include "sesh/store/store.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>

namespace sesh::session {

//! \brief Returns a fresh id, nullopt when none can be produced
using id_generator_t = std::function<std::optional<std::string>()>;

constexpr std::int64_t DEFAULT_SESSION_TTL_SECS = 600;

struct options_s {
  std::int64_t session_ttl{DEFAULT_SESSION_TTL_SECS};
  id_generator_t generate_id; // empty selects sesh::id::generate
};

/*
  Per-request view of one session. It is created with the id the client
  presented (if any), routes every call to the store and afterwards tells the
  cookie layer what to send back through id(), pending_id(), is_changed() and
  is_deleted().

  prepare_regenerate() only reserves a new id. The rename happens atomically
  with the next field write, so the session is never readable under both ids.
*/
class session_c {
public:
  session_c(const session_c &) = delete;
  session_c(session_c &&) = delete;
  session_c &operator=(const session_c &) = delete;
  session_c &operator=(session_c &&) = delete;

  session_c(store::store_if &store, std::optional<std::string> id,
            std::shared_ptr<spdlog::logger> logger,
            options_s options = options_s{});
  ~session_c() = default;

  template <typename T, typename Codec = codec::msgpack_codec_c>
  store::result_c<std::optional<T>> get(const std::string &field) {
    auto raw = get_raw(field);
    if (raw.is_error()) {
      return raw.error();
    }
    if (!raw.value()) {
      return std::optional<T>();
    }
    auto decoded = Codec::template decode<T>(*raw.value());
    if (decoded.is_error()) {
      return decoded.error();
    }
    return std::optional<T>(decoded.take());
  }

  template <typename T, typename Codec = codec::msgpack_codec_c>
  store::status_c
  set(const std::string &field, const T &value,
      std::optional<std::int64_t> field_ttl = std::nullopt,
      std::optional<store::write_strategy_s> strategy = std::nullopt) {
    auto encoded = Codec::encode(value);
    if (encoded.is_error()) {
      return encoded.error();
    }
    return set_raw(field, encoded.value(), field_ttl, strategy);
  }

  //! \brief Write the field only when the session does not hold it yet.
  //!        Returns true when it was written. A pending regeneration is
  //!        committed either way.
  template <typename T, typename Codec = codec::msgpack_codec_c>
  store::result_c<bool>
  insert(const std::string &field, const T &value,
         std::optional<std::int64_t> field_ttl = std::nullopt,
         std::optional<store::write_strategy_s> strategy = std::nullopt) {
    auto encoded = Codec::encode(value);
    if (encoded.is_error()) {
      return encoded.error();
    }
    return insert_raw(field, encoded.value(), field_ttl, strategy);
  }

  store::result_c<std::optional<std::string>>
  get_raw(const std::string &field);
  store::result_c<std::optional<store::session_map_c>> get_all();

  store::status_c
  set_raw(const std::string &field, const std::string &value,
          std::optional<std::int64_t> field_ttl = std::nullopt,
          std::optional<store::write_strategy_s> strategy = std::nullopt);

  store::result_c<bool>
  insert_raw(const std::string &field, const std::string &value,
             std::optional<std::int64_t> field_ttl = std::nullopt,
             std::optional<store::write_strategy_s> strategy = std::nullopt);

  store::status_c remove(const std::string &field);

  //! \brief Delete the whole session and unbind, safe to call repeatedly
  store::status_c del();

  //! \brief Re-arm the session expiry and use it for later writes,
  //!        seconds <= 0 deletes the session
  store::status_c expire(std::int64_t seconds);

  //! \brief Change the expiry applied by subsequent writes
  void set_expiration(std::int64_t seconds);
  std::int64_t expiration() const;

  //! \brief Reserve a new id that the next write moves the session to.
  //!        Calling it again replaces the reserved id.
  store::result_c<std::string> prepare_regenerate();

  //! \brief Move the session to a new id right away
  store::result_c<std::string> regenerate();

  std::optional<std::string> id() const;
  std::optional<std::string> pending_id() const;
  bool is_changed() const;
  bool is_deleted() const;

private:
  store::result_c<std::string> next_id();
  store::result_c<bool> write(const std::string &field,
                              const std::string &value,
                              std::optional<std::int64_t> field_ttl,
                              std::optional<store::write_strategy_s> strategy,
                              bool only_if_absent);
  store::result_c<bool> write_at(const std::string &id,
                                 const std::string &field,
                                 const std::string &value,
                                 const store::write_options_s &options,
                                 bool only_if_absent);
  store::result_c<bool> write_renamed(const std::string &old_id,
                                      const std::string &new_id,
                                      const std::string &field,
                                      const std::string &value,
                                      const store::write_options_s &options,
                                      bool only_if_absent);

  store::store_if &store_;
  std::shared_ptr<spdlog::logger> logger_;
  id_generator_t generate_id_;

  mutable std::mutex mutex_;
  std::optional<std::string> id_;
  std::optional<std::string> pending_id_;
  std::int64_t session_ttl_;
  bool changed_;
  bool deleted_;
};

} // namespace sesh::session
