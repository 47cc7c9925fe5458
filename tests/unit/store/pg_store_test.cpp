#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <sesh/store/pg_store.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <vector>

namespace {

auto create_test_logger() {
  auto logger = spdlog::get("pg_store_test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("pg_store_test");
  }
  return logger;
}

struct pg_conn_deleter_s {
  void operator()(PGconn *conn) const { PQfinish(conn); }
};
using pg_conn_t = std::unique_ptr<PGconn, pg_conn_deleter_s>;

const char *test_conninfo() {
  const char *conninfo = std::getenv("SESH_TEST_POSTGRES_CONNINFO");
  if (!conninfo || !*conninfo) {
    return nullptr;
  }
  return conninfo;
}

pg_conn_t connect_test_postgres(const char *conninfo) {
  pg_conn_t conn(PQconnectdb(conninfo));
  if (!conn || PQstatus(conn.get()) != CONNECTION_OK) {
    return nullptr;
  }
  return conn;
}

std::string unique_id(const std::string &base) {
  static std::atomic<int> counter{0};
  return base + "_" + std::to_string(counter.fetch_add(1)) + "_" +
         std::to_string(
             std::chrono::steady_clock::now().time_since_epoch().count());
}

bool has_code(const sesh::store::status_c &status,
              sesh::store::error_e code) {
  return status.is_error() && status.error().code == code;
}

sesh::store::write_options_s ttl(std::optional<std::int64_t> session_ttl,
                                 std::optional<std::int64_t> field_ttl =
                                     std::nullopt) {
  return sesh::store::write_options_s{session_ttl, field_ttl, std::nullopt};
}

} // namespace

using namespace sesh::store;

TEST_CASE("postgres store operations", "[unit][store][postgres]") {
  auto conninfo = test_conninfo();
  if (!conninfo) {
    SKIP("SESH_TEST_POSTGRES_CONNINFO not set");
  }

  auto conn = connect_test_postgres(conninfo);
  REQUIRE(static_cast<bool>(conn));

  pg_store_c store(create_test_logger(), conn.get(), "sesh_test");
  REQUIRE(store.init_schema().is_success());
  // A second bootstrap is a no-op
  REQUIRE(store.init_schema().is_success());

  auto s1 = unique_id("s1");
  auto old_id = unique_id("old");
  auto new_id = unique_id("new");

  SECTION("set get and get_all with binary values") {
    std::string binary("\x00\x01\xff", 3);
    CHECK(store.set(s1, "a", binary, ttl(60)).is_success());
    CHECK(store.set(s1, "b", "2", ttl(60)).is_success());
    CHECK(store.set(s1, "b", "3", ttl(60)).is_success());

    auto got = store.get(s1, "a");
    REQUIRE(got.value().has_value());
    CHECK(*got.value() == binary);

    auto all = store.get_all(s1);
    REQUIRE(all.value().has_value());
    CHECK(all.value()->size() == 2);
    CHECK(*all.value()->raw("b") == "3");
  }

  SECTION("expired fields and sessions read as absent") {
    CHECK(store.set(s1, "a", "1", ttl(1)).is_success());
    CHECK(store.set(s1, "b", "2", ttl(1, 1)).is_success());
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    CHECK_FALSE(store.get(s1, "a").value().has_value());
    CHECK_FALSE(store.get_all(s1).value().has_value());

    // Writing over an expired record starts a fresh one
    CHECK(store.set(s1, "c", "3", ttl(60)).is_success());
    auto all = store.get_all(s1);
    REQUIRE(all.value().has_value());
    CHECK(all.value()->size() == 1);

    auto swept = store.sweep_expired();
    CHECK(swept.is_success());
  }

  SECTION("set_and_rename rewrites existing and adds new fields") {
    CHECK(store.set(old_id, "a", "1", ttl(60)).is_success());
    CHECK(store.set(old_id, "b", "2", ttl(60)).is_success());
    CHECK(store.set_and_rename(old_id, new_id, "a", "10", ttl(60))
              .is_success());
    CHECK_FALSE(store.get_all(old_id).value().has_value());
    CHECK(*store.get(new_id, "a").value() == "10");
    CHECK(*store.get(new_id, "b").value() == "2");

    auto renamed = unique_id("renamed");
    CHECK(store.set_and_rename(new_id, renamed, "c", "3", ttl(60))
              .is_success());
    CHECK(store.get_all(renamed).value()->size() == 3);
    CHECK(store.del(renamed).is_success());
  }

  SECTION("collision aborts the whole statement") {
    CHECK(store.set(old_id, "a", "1", ttl(60)).is_success());
    CHECK(store.set(new_id, "a", "x", ttl(60)).is_success());
    CHECK(has_code(store.set_and_rename(old_id, new_id, "a", "2", ttl(60)),
                   error_e::COLLISION));
    CHECK(*store.get(old_id, "a").value() == "1");
    CHECK(*store.get(new_id, "a").value() == "x");
    CHECK(has_code(store.rename(old_id, new_id, 60), error_e::COLLISION));

    // Zero ttls and a missing source must not touch the taken record
    auto missing = unique_id("missing");
    CHECK(has_code(store.rename(missing, new_id, 60), error_e::COLLISION));
    CHECK(has_code(store.rename(missing, new_id, 0), error_e::COLLISION));
    CHECK(has_code(store.set_and_rename(missing, new_id, "a", "2", ttl(0)),
                   error_e::COLLISION));
    CHECK(has_code(store.set_and_rename(missing, new_id, "a", "2", ttl(60, 0)),
                   error_e::COLLISION));
    CHECK(*store.get(new_id, "a").value() == "x");
  }

  SECTION("insert leaves a live field alone") {
    auto first = store.insert(s1, "a", "1", ttl(60));
    REQUIRE(first.is_success());
    CHECK(first.value());
    auto second = store.insert(s1, "a", "2", ttl(60));
    REQUIRE(second.is_success());
    CHECK_FALSE(second.value());
    CHECK(*store.get(s1, "a").value() == "1");

    // An expired field row is replaced
    CHECK(store.set(s1, "b", "old", ttl(60, 1)).is_success());
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    auto replaced = store.insert(s1, "b", "new", ttl(60));
    REQUIRE(replaced.is_success());
    CHECK(replaced.value());
    CHECK(*store.get(s1, "b").value() == "new");

    auto zero = store.insert(s1, "c", "3", ttl(0));
    CHECK(zero.is_error() && zero.error().code == error_e::INVALID_ARGUMENT);
  }

  SECTION("insert_and_rename moves the record either way") {
    CHECK(store.set(old_id, "a", "1", ttl(60)).is_success());
    auto kept = store.insert_and_rename(old_id, new_id, "a", "2", ttl(60));
    REQUIRE(kept.is_success());
    CHECK_FALSE(kept.value());
    CHECK_FALSE(store.get_all(old_id).value().has_value());
    CHECK(*store.get(new_id, "a").value() == "1");

    auto renamed = unique_id("renamed");
    auto added = store.insert_and_rename(new_id, renamed, "b", "2", ttl(60));
    REQUIRE(added.is_success());
    CHECK(added.value());
    CHECK(store.get_all(renamed).value()->size() == 2);

    CHECK(store.set(old_id, "a", "x", ttl(60)).is_success());
    auto clash = store.insert_and_rename(old_id, renamed, "c", "3", ttl(60));
    CHECK(clash.is_error() && clash.error().code == error_e::COLLISION);
    CHECK_FALSE(store.get(old_id, "c").value().has_value());
    CHECK(store.del(renamed).is_success());
  }

  SECTION("zero ttls run as one statement each") {
    CHECK(store.set(s1, "a", "1", ttl(60)).is_success());
    CHECK(store.set(s1, "b", "2", ttl(60)).is_success());

    // The field goes, the session ttl is re-armed
    CHECK(store.set(s1, "a", "", ttl(120, 0)).is_success());
    CHECK_FALSE(store.get(s1, "a").value().has_value());
    auto snapshot = store.get_all_with_meta(s1);
    REQUIRE(snapshot.value().has_value());
    CHECK(*snapshot.value()->session_remaining > 115);

    // Removing the last field removes the session
    CHECK(store.set(s1, "b", "", ttl(60, 0)).is_success());
    CHECK_FALSE(store.get_all(s1).value().has_value());

    CHECK(store.set(old_id, "a", "1", ttl(60)).is_success());
    CHECK(store.set(old_id, "b", "2", ttl(60)).is_success());
    CHECK(store.set_and_rename(old_id, new_id, "a", "", ttl(600, 0))
              .is_success());
    CHECK_FALSE(store.get_all(old_id).value().has_value());
    auto moved = store.get_all(new_id);
    REQUIRE(moved.value().has_value());
    CHECK(moved.value()->size() == 1);
    CHECK(*moved.value()->raw("b") == "2");

    auto dropped = unique_id("dropped");
    CHECK(store.set_and_rename(new_id, dropped, "b", "", ttl(600, 0))
              .is_success());
    CHECK_FALSE(store.get_all(new_id).value().has_value());
    CHECK_FALSE(store.get_all(dropped).value().has_value());

    CHECK(store.set(old_id, "a", "1", ttl(60)).is_success());
    CHECK(store.rename(old_id, new_id, 0).is_success());
    CHECK_FALSE(store.get_all(old_id).value().has_value());
    CHECK_FALSE(store.get_all(new_id).value().has_value());
  }

  SECTION("remove deletes the session with its last field") {
    CHECK(store.set(s1, "a", "1", ttl(60)).is_success());
    CHECK(store.set(s1, "b", "2", ttl(60)).is_success());
    CHECK(store.remove(s1, "a").is_success());
    CHECK(store.get_all(s1).value()->size() == 1);
    CHECK(store.remove(s1, "b").is_success());
    CHECK_FALSE(store.get_all(s1).value().has_value());
  }

  SECTION("metadata for warming") {
    write_options_s capped{60, 30, write_strategy_s::capped_hot(5)};
    CHECK(store.set(s1, "a", "1", capped).is_success());
    auto snapshot = store.get_all_with_meta(s1);
    REQUIRE(snapshot.value().has_value());
    const auto &meta = snapshot.value()->meta.at("a");
    CHECK(*meta.hot_ttl == 5);
    CHECK(*meta.remaining <= 30);
    CHECK(*meta.remaining > 25);
    CHECK(*snapshot.value()->session_remaining > 55);
  }

  SECTION("expire and delete") {
    CHECK(store.set(s1, "a", "1", ttl(60)).is_success());
    CHECK(store.expire(s1, 120).is_success());
    CHECK(store.get(s1, "a").value().has_value());
    CHECK(store.expire(s1, 0).is_success());
    CHECK_FALSE(store.get(s1, "a").value().has_value());
    CHECK(store.del(s1).is_success());
  }

  for (const auto &id : {s1, old_id, new_id}) {
    CHECK(store.del(id).is_success());
  }
}
