#include <fmt/core.h>

#include "sesh/config/config.hpp"
#include "sesh/id/id.hpp"
#include "sesh/session/session.hpp"
#include "sesh/store/factory.hpp"
#include "sesh/store/reaper.hpp"
#include <chrono>
#include <libpq-fe.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <sw/redis++/redis++.h>
#include <thread>
#include <vector>

namespace {

struct pg_conn_deleter_s {
  void operator()(PGconn *conn) const { PQfinish(conn); }
};

void print_usage() {
  fmt::print("Usage: sesh <config_file> <command> [args]\n");
  fmt::print("Commands:\n");
  fmt::print("  init-schema\t\t\t\tCreate the postgres tables\n");
  fmt::print("  new-id\t\t\t\tPrint a fresh session id\n");
  fmt::print("  get <id> <field>\t\t\tPrint one field as json\n");
  fmt::print("  get-all <id>\t\t\t\tPrint every field as json\n");
  fmt::print("  set <id> <field> <json> [ttl]\t\tWrite one field\n");
  fmt::print("  insert <id> <field> <json> [ttl]\tWrite one field if absent\n");
  fmt::print("  remove <id> <field>\t\t\tRemove one field\n");
  fmt::print("  delete <id>\t\t\t\tDelete the session\n");
  fmt::print("  expire <id> <secs>\t\t\tRe-arm the session expiry\n");
  fmt::print("  regenerate <id>\t\t\tMove the session to a new id\n");
  fmt::print("  sweep\t\t\t\t\tReclaim expired sessions once\n");
  fmt::print("  reap <secs>\t\t\t\tRun the background sweeper for a while\n");
  fmt::print("Options:\n");
  fmt::print("  --help, -h\t\t\t\tPrint this help message\n");
  fmt::print("  --new-config, -n\t\t\tCreate a new config file\n");
}

bool uses(const sesh::config::config_c &config, const std::string &backend) {
  if (config.get_backend() == backend) {
    return true;
  }
  return config.get_backend() == "layered" &&
         (config.get_layered_hot() == backend ||
          config.get_layered_cold() == backend);
}

bool require_args(const std::vector<std::string> &args, std::size_t count) {
  if (args.size() < count) {
    fmt::print("Missing arguments for {}\n", args[2]);
    print_usage();
    return false;
  }
  return true;
}

int report(const sesh::store::status_c &status) {
  if (status.is_error()) {
    fmt::print("error ({}): {}\n",
               sesh::store::error_to_string(status.error().code),
               status.error().message);
    return 1;
  }
  fmt::print("ok\n");
  return 0;
}

int run(const std::vector<std::string> &args,
        const sesh::config::config_c &config, sesh::store::backend_c &backend,
        std::shared_ptr<spdlog::logger> logger) {
  using json = nlohmann::json;
  namespace store = sesh::store;

  auto &sessions = backend.store();
  sesh::session::options_s options;
  options.session_ttl = config.get_session_ttl_secs();

  const auto &command = args[2];

  if (command == "init-schema") {
    auto *pg = backend.postgres();
    if (!pg) {
      fmt::print("init-schema needs a postgres backend\n");
      return 1;
    }
    return report(pg->init_schema());
  }

  if (command == "new-id") {
    auto fresh = sesh::id::generate();
    if (!fresh) {
      fmt::print("unable to read the system random generator\n");
      return 1;
    }
    fmt::print("{}\n", *fresh);
    return 0;
  }

  if (command == "get") {
    if (!require_args(args, 5)) {
      return 1;
    }
    sesh::session::session_c session(sessions, args[3], logger, options);
    auto value = session.get<json>(args[4]);
    if (value.is_error()) {
      return report(value.error());
    }
    if (!value.value()) {
      fmt::print("(absent)\n");
      return 0;
    }
    fmt::print("{}\n", value.value()->dump());
    return 0;
  }

  if (command == "get-all") {
    if (!require_args(args, 4)) {
      return 1;
    }
    auto record = sessions.get_all(args[3]);
    if (record.is_error()) {
      return report(record.error());
    }
    if (!record.value()) {
      fmt::print("(absent)\n");
      return 0;
    }

    json document = json::object();
    for (const auto &pair : record.value()->fields()) {
      auto value = record.value()->get<json>(pair.first);
      if (value.is_error()) {
        document[pair.first] = "<undecodable>";
        continue;
      }
      document[pair.first] = *value.value();
    }
    fmt::print("{}\n", document.dump(2));
    return 0;
  }

  if (command == "set" || command == "insert") {
    if (!require_args(args, 6)) {
      return 1;
    }
    json value;
    try {
      value = json::parse(args[5]);
    } catch (const json::exception &e) {
      fmt::print("Invalid json value: {}\n", e.what());
      return 1;
    }

    std::optional<std::int64_t> field_ttl;
    if (args.size() > 6) {
      field_ttl = std::stoll(args[6]);
    }

    sesh::session::session_c session(sessions, args[3], logger, options);
    if (command == "set") {
      return report(session.set(args[4], value, field_ttl));
    }

    auto inserted = session.insert(args[4], value, field_ttl);
    if (inserted.is_error()) {
      return report(inserted.error());
    }
    fmt::print("{}\n", inserted.value() ? "inserted" : "already present");
    return 0;
  }

  if (command == "remove") {
    if (!require_args(args, 5)) {
      return 1;
    }
    return report(sessions.remove(args[3], args[4]));
  }

  if (command == "delete") {
    if (!require_args(args, 4)) {
      return 1;
    }
    sesh::session::session_c session(sessions, args[3], logger, options);
    return report(session.del());
  }

  if (command == "expire") {
    if (!require_args(args, 5)) {
      return 1;
    }
    sesh::session::session_c session(sessions, args[3], logger, options);
    return report(session.expire(std::stoll(args[4])));
  }

  if (command == "regenerate") {
    if (!require_args(args, 4)) {
      return 1;
    }
    sesh::session::session_c session(sessions, args[3], logger, options);
    auto fresh = session.regenerate();
    if (fresh.is_error()) {
      return report(fresh.error());
    }
    fmt::print("{}\n", fresh.value());
    return 0;
  }

  if (command == "sweep") {
    auto *target = backend.sweepable();
    if (!target) {
      fmt::print("{} expires sessions on its own\n", sessions.name());
      return 0;
    }
    store::reaper_c reaper(
        logger, std::chrono::seconds(config.get_sweep_interval_secs()),
        *target);
    auto reclaimed = reaper.sweep_now();
    if (reclaimed.is_error()) {
      return report(reclaimed.error());
    }
    fmt::print("reclaimed {} sessions\n", reclaimed.value());
    return 0;
  }

  if (command == "reap") {
    if (!require_args(args, 4)) {
      return 1;
    }
    auto *target = backend.sweepable();
    if (!target) {
      fmt::print("{} expires sessions on its own\n", sessions.name());
      return 0;
    }
    store::reaper_c reaper(
        logger, std::chrono::seconds(config.get_sweep_interval_secs()),
        *target);
    reaper.start();
    std::this_thread::sleep_for(std::chrono::seconds(std::stoll(args[3])));
    reaper.stop();
    fmt::print("reclaimed {} sessions\n", reaper.total_reclaimed());
    return 0;
  }

  fmt::print("Unknown command: {}\n", command);
  print_usage();
  return 1;
}

} // namespace

int main(int argc, char **argv) {

  std::vector<std::string> args(argv, argv + argc);

  if (args.size() == 1) {
    print_usage();
    return 0;
  }

  for (std::size_t i = 1; i < args.size(); i++) {
    if (args[i] == "--help" || args[i] == "-h") {
      print_usage();
      return 0;
    }

    if (args[i] == "--new-config" || args[i] == "-n") {
      if (sesh::config::new_config("config.json")) {
        fmt::print("Created new config file: config.json\n");
        return 0;
      } else {
        fmt::print("Failed to create new config file: config.json\n");
        return 1;
      }
    }
  }

  if (args.size() < 3) {
    print_usage();
    return 1;
  }

  sesh::config::config_c config;
  if (!sesh::config::load_config(args[1], config)) {
    fmt::print("Failed to load config file: {}\n", args[1]);
    return 1;
  }

  auto logger = spdlog::stdout_color_mt("sesh");
  logger->set_level(spdlog::level::from_str(config.get_log_level()));

  std::unique_ptr<sw::redis::Redis> redis;
  std::unique_ptr<PGconn, pg_conn_deleter_s> pg;
  sesh::store::clients_s clients;

  if (uses(config, "redis")) {
    try {
      redis = std::make_unique<sw::redis::Redis>(config.get_redis_url());
    } catch (const sw::redis::Error &e) {
      fmt::print("Failed to connect to redis: {}\n", e.what());
      return 1;
    }
    clients.redis = redis.get();
  }

  if (uses(config, "postgres")) {
    pg.reset(PQconnectdb(config.get_postgres_conninfo().c_str()));
    if (!pg || PQstatus(pg.get()) != CONNECTION_OK) {
      fmt::print("Failed to connect to postgres: {}\n",
                 pg ? PQerrorMessage(pg.get()) : "out of memory");
      return 1;
    }
    clients.postgres = pg.get();
  }

  auto backend = sesh::store::backend_c::build(config, clients, logger);
  if (backend.is_error()) {
    fmt::print("Failed to build {} backend: {}\n", config.get_backend(),
               backend.error().message);
    return 1;
  }

  try {
    return run(args, config, *backend.value(), logger);
  } catch (const std::exception &e) {
    fmt::print("error: {}\n", e.what());
    return 1;
  }
}
