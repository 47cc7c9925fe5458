#include "sesh/store/factory.hpp"

namespace sesh::store {

backend_c::backend_c(token_s, std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {}

store_if &backend_c::store() { return *store_; }

sweepable_if *backend_c::sweepable() { return sweepable_; }

pg_store_c *backend_c::postgres() { return postgres_.get(); }

result_c<std::unique_ptr<backend_c>>
backend_c::build(const config::config_c &config, clients_s clients,
                 std::shared_ptr<spdlog::logger> logger) {
  auto name = config.get_backend();
  auto kind = config::parse_backend(name);
  if (!kind) {
    return error_s{error_e::INVALID_ARGUMENT, "unknown backend: " + name};
  }

  auto backend = std::make_unique<backend_c>(token_s{}, std::move(logger));

  if (*kind == config::backend_e::LAYERED) {
    auto status = backend->make_layered(config, clients);
    if (status.is_error()) {
      return status.error();
    }
  } else {
    auto store = backend->make(*kind, config, clients);
    if (store.is_error()) {
      return store.error();
    }
    backend->store_ = store.value();
  }

  backend->logger_->info("backend: using {} store", backend->store_->name());
  return backend;
}

result_c<store_if *> backend_c::make(config::backend_e kind,
                                     const config::config_c &config,
                                     clients_s clients) {
  switch (kind) {
  case config::backend_e::MEMORY: {
    auto store = make_memory();
    if (store.is_error()) {
      return store.error();
    }
    sweepable_ = store.value();
    return static_cast<store_if *>(store.value());
  }
  case config::backend_e::REDIS: {
    auto store = make_redis(config, clients);
    if (store.is_error()) {
      return store.error();
    }
    return static_cast<store_if *>(store.value());
  }
  case config::backend_e::POSTGRES: {
    auto store = make_postgres(config, clients);
    if (store.is_error()) {
      return store.error();
    }
    sweepable_ = store.value();
    return static_cast<store_if *>(store.value());
  }
  case config::backend_e::DISK: {
    auto store = make_disk(config);
    if (store.is_error()) {
      return store.error();
    }
    sweepable_ = store.value();
    return static_cast<store_if *>(store.value());
  }
  case config::backend_e::LAYERED:
    break;
  }
  return error_s{error_e::INVALID_ARGUMENT,
                 "a layered store cannot be used as a layer"};
}

result_c<memstore_c *> backend_c::make_memory() {
  memory_ = std::make_unique<memstore_c>(logger_);
  return memory_.get();
}

result_c<redis_store_c *> backend_c::make_redis(const config::config_c &config,
                                                clients_s clients) {
  if (!clients.redis) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "redis backend selected without a redis client"};
  }
  redis_ = std::make_unique<redis_store_c>(logger_, *clients.redis,
                                           config.get_redis_key_prefix());
  return redis_.get();
}

result_c<pg_store_c *> backend_c::make_postgres(const config::config_c &config,
                                                clients_s clients) {
  if (!clients.postgres) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "postgres backend selected without a connection"};
  }
  postgres_ = std::make_unique<pg_store_c>(logger_, clients.postgres,
                                           config.get_postgres_schema());
  if (config.get_postgres_create_schema()) {
    auto status = postgres_->init_schema();
    if (status.is_error()) {
      return status.error();
    }
  }
  return postgres_.get();
}

result_c<disk_store_c *> backend_c::make_disk(const config::config_c &config) {
  disk_ = std::make_unique<disk_store_c>(logger_);
  if (!disk_->open(config.get_disk_path())) {
    return error_s{error_e::BACKEND,
                   "unable to open disk store at " + config.get_disk_path()};
  }
  return disk_.get();
}

status_c backend_c::make_layered(const config::config_c &config,
                                 clients_s clients) {
  auto hot_name = config.get_layered_hot();
  auto cold_name = config.get_layered_cold();
  auto hot_kind = config::parse_backend(hot_name);
  auto cold_kind = config::parse_backend(cold_name);

  if (!hot_kind || !cold_kind || *hot_kind == *cold_kind) {
    return error_s{error_e::INVALID_ARGUMENT,
                   "invalid layered pair: hot=" + hot_name +
                       " cold=" + cold_name};
  }

  store_if *hot = nullptr;
  hot_layer_if *hot_layer = nullptr;
  sweepable_if *hot_sweep = nullptr;
  switch (*hot_kind) {
  case config::backend_e::MEMORY: {
    auto store = make_memory();
    if (store.is_error()) {
      return store.error();
    }
    hot = store.value();
    hot_layer = store.value();
    hot_sweep = store.value();
    break;
  }
  case config::backend_e::REDIS: {
    auto store = make_redis(config, clients);
    if (store.is_error()) {
      return store.error();
    }
    hot = store.value();
    hot_layer = store.value();
    break;
  }
  default:
    return error_s{error_e::INVALID_ARGUMENT,
                   "unsupported hot layer: " + hot_name};
  }

  store_if *cold = nullptr;
  cold_layer_if *cold_layer = nullptr;
  sweepable_if *cold_sweep = nullptr;
  switch (*cold_kind) {
  case config::backend_e::MEMORY: {
    auto store = make_memory();
    if (store.is_error()) {
      return store.error();
    }
    cold = store.value();
    cold_layer = store.value();
    cold_sweep = store.value();
    break;
  }
  case config::backend_e::POSTGRES: {
    auto store = make_postgres(config, clients);
    if (store.is_error()) {
      return store.error();
    }
    cold = store.value();
    cold_layer = store.value();
    cold_sweep = store.value();
    break;
  }
  case config::backend_e::DISK: {
    auto store = make_disk(config);
    if (store.is_error()) {
      return store.error();
    }
    cold = store.value();
    cold_layer = store.value();
    cold_sweep = store.value();
    break;
  }
  default:
    return error_s{error_e::INVALID_ARGUMENT,
                   "unsupported cold layer: " + cold_name};
  }

  layered_ = std::make_unique<layered_store_c>(
      *hot, *hot_layer, *cold, *cold_layer, logger_, hot_sweep, cold_sweep);
  store_ = layered_.get();
  if (layered_->is_sweepable()) {
    sweepable_ = layered_.get();
  }
  return status_c();
}

} // namespace sesh::store
