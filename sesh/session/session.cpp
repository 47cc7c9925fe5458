#include "sesh/session/session.hpp"
#include "sesh/id/id.hpp"

namespace sesh::session {

session_c::session_c(store::store_if &store, std::optional<std::string> id,
                     std::shared_ptr<spdlog::logger> logger, options_s options)
    : store_(store), logger_(std::move(logger)),
      generate_id_(std::move(options.generate_id)), id_(std::move(id)),
      session_ttl_(options.session_ttl), changed_(false), deleted_(false) {
  if (!generate_id_) {
    generate_id_ = [] { return id::generate(); };
  }
}

store::result_c<std::string> session_c::next_id() {
  auto fresh = generate_id_();
  if (!fresh) {
    logger_->error("session: unable to generate a session id");
    return store::error_s{store::error_e::BACKEND,
                          "unable to generate a session id"};
  }
  return *fresh;
}

store::result_c<std::optional<std::string>>
session_c::get_raw(const std::string &field) {
  auto bound = id();
  if (!bound) {
    return std::optional<std::string>();
  }
  return store_.get(*bound, field);
}

store::result_c<std::optional<store::session_map_c>> session_c::get_all() {
  auto bound = id();
  if (!bound) {
    return std::optional<store::session_map_c>();
  }
  return store_.get_all(*bound);
}

store::result_c<bool>
session_c::write_at(const std::string &id, const std::string &field,
                    const std::string &value,
                    const store::write_options_s &options,
                    bool only_if_absent) {
  if (only_if_absent) {
    return store_.insert(id, field, value, options);
  }
  auto status = store_.set(id, field, value, options);
  if (status.is_error()) {
    return status.error();
  }
  return true;
}

store::result_c<bool> session_c::write_renamed(
    const std::string &old_id, const std::string &new_id,
    const std::string &field, const std::string &value,
    const store::write_options_s &options, bool only_if_absent) {
  if (only_if_absent) {
    return store_.insert_and_rename(old_id, new_id, field, value, options);
  }
  auto status = store_.set_and_rename(old_id, new_id, field, value, options);
  if (status.is_error()) {
    return status.error();
  }
  return true;
}

store::result_c<bool>
session_c::write(const std::string &field, const std::string &value,
                 std::optional<std::int64_t> field_ttl,
                 std::optional<store::write_strategy_s> strategy,
                 bool only_if_absent) {
  std::optional<std::string> bound;
  std::optional<std::string> pending;
  store::write_options_s options;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bound = id_;
    pending = pending_id_;
    options = store::write_options_s{session_ttl_, field_ttl, strategy};
  }

  if (!bound) {
    std::string fresh;
    if (pending) {
      fresh = *pending;
    } else {
      auto generated = next_id();
      if (generated.is_error()) {
        return generated.error();
      }
      fresh = generated.take();
    }

    auto written = write_at(fresh, field, value, options, only_if_absent);
    if (written.is_error()) {
      return written;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!id_) {
      id_ = fresh;
    }
    if (pending_id_ == pending) {
      pending_id_.reset();
    }
    changed_ = true;
    deleted_ = false;
    return written;
  }

  if (!pending) {
    auto written = write_at(*bound, field, value, options, only_if_absent);
    if (written.is_success() && written.value()) {
      std::lock_guard<std::mutex> lock(mutex_);
      changed_ = true;
    }
    return written;
  }

  auto written =
      write_renamed(*bound, *pending, field, value, options, only_if_absent);
  if (written.is_error()) {
    if (written.error().code == store::error_e::COLLISION) {
      logger_->warn("session: regenerated id already in use, keeping {}",
                    *bound);
      std::lock_guard<std::mutex> lock(mutex_);
      if (pending_id_ == pending) {
        pending_id_.reset();
      }
    }
    return written;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (id_ == bound) {
    id_ = pending;
  }
  if (pending_id_ == pending) {
    pending_id_.reset();
  }
  changed_ = true;
  return written;
}

store::status_c
session_c::set_raw(const std::string &field, const std::string &value,
                   std::optional<std::int64_t> field_ttl,
                   std::optional<store::write_strategy_s> strategy) {
  auto written = write(field, value, field_ttl, strategy, false);
  if (written.is_error()) {
    return written.error();
  }
  return store::status_c();
}

store::result_c<bool>
session_c::insert_raw(const std::string &field, const std::string &value,
                      std::optional<std::int64_t> field_ttl,
                      std::optional<store::write_strategy_s> strategy) {
  return write(field, value, field_ttl, strategy, true);
}

store::status_c session_c::remove(const std::string &field) {
  auto bound = id();
  if (!bound) {
    return store::status_c();
  }
  return store_.remove(*bound, field);
}

store::status_c session_c::del() {
  auto bound = id();
  if (bound) {
    auto status = store_.del(*bound);
    if (status.is_error()) {
      return status;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  id_.reset();
  pending_id_.reset();
  deleted_ = true;
  return store::status_c();
}

store::status_c session_c::expire(std::int64_t seconds) {
  if (seconds <= 0) {
    return del();
  }

  std::optional<std::string> bound;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session_ttl_ = seconds;
    bound = id_;
  }
  if (!bound) {
    return store::status_c();
  }

  auto status = store_.expire(*bound, seconds);
  if (status.is_success()) {
    std::lock_guard<std::mutex> lock(mutex_);
    changed_ = true;
  }
  return status;
}

void session_c::set_expiration(std::int64_t seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_ttl_ = seconds;
}

std::int64_t session_c::expiration() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_ttl_;
}

store::result_c<std::string> session_c::prepare_regenerate() {
  auto reserved = next_id();
  if (reserved.is_error()) {
    return reserved;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  pending_id_ = reserved.value();
  return reserved;
}

store::result_c<std::string> session_c::regenerate() {
  std::optional<std::string> bound;
  std::int64_t ttl = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    bound = id_;
    ttl = session_ttl_;
  }
  if (!bound) {
    return store::error_s{store::error_e::INVALID_ARGUMENT,
                          "cannot regenerate an unbound session"};
  }

  auto generated = next_id();
  if (generated.is_error()) {
    return generated;
  }
  auto fresh = generated.take();
  auto status = store_.rename(*bound, fresh, ttl);
  if (status.is_error()) {
    return status.error();
  }

  logger_->debug("session: regenerated {} -> {}", *bound, fresh);
  std::lock_guard<std::mutex> lock(mutex_);
  id_ = fresh;
  pending_id_.reset();
  changed_ = true;
  return fresh;
}

std::optional<std::string> session_c::id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return id_;
}

std::optional<std::string> session_c::pending_id() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_id_;
}

bool session_c::is_changed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return changed_;
}

bool session_c::is_deleted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deleted_;
}

} // namespace sesh::session
