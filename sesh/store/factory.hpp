#pragma once

#include "sesh/config/config.hpp"
#include "sesh/store/disk_store.hpp"
#include "sesh/store/layered_store.hpp"
#include "sesh/store/memstore.hpp"
#include "sesh/store/pg_store.hpp"
#include "sesh/store/redis_store.hpp"
#include <memory>
#include <spdlog/spdlog.h>

namespace sesh::store {

//! \brief Connections handed to the factory. They are not owned and must
//!        outlive the backend built from them.
struct clients_s {
  sw::redis::Redis *redis{nullptr};
  PGconn *postgres{nullptr};
};

/*
  Owns the stores named by a config and exposes the one sessions should use.
  A layered backend owns both of its layers.
*/
class backend_c {
  struct token_s {
    explicit token_s() = default;
  };

public:
  backend_c(token_s, std::shared_ptr<spdlog::logger> logger);
  backend_c(const backend_c &) = delete;
  backend_c &operator=(const backend_c &) = delete;
  ~backend_c() = default;

  static result_c<std::unique_ptr<backend_c>>
  build(const config::config_c &config, clients_s clients,
        std::shared_ptr<spdlog::logger> logger);

  store_if &store();

  //! \brief What the reaper should sweep, nullptr when the backend expires
  //!        records on its own. A layered backend sweeps both of its layers.
  sweepable_if *sweepable();

  //! \brief The postgres store when one is in use (alone or as cold layer)
  pg_store_c *postgres();

private:
  result_c<store_if *> make(config::backend_e kind, const config::config_c &config,
                            clients_s clients);
  result_c<memstore_c *> make_memory();
  result_c<redis_store_c *> make_redis(const config::config_c &config,
                                       clients_s clients);
  result_c<pg_store_c *> make_postgres(const config::config_c &config,
                                       clients_s clients);
  result_c<disk_store_c *> make_disk(const config::config_c &config);
  status_c make_layered(const config::config_c &config, clients_s clients);

  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<memstore_c> memory_;
  std::unique_ptr<redis_store_c> redis_;
  std::unique_ptr<pg_store_c> postgres_;
  std::unique_ptr<disk_store_c> disk_;
  std::unique_ptr<layered_store_c> layered_;

  store_if *store_{nullptr};
  sweepable_if *sweepable_{nullptr};
};

} // namespace sesh::store
