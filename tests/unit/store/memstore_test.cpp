#include <atomic>
#include <chrono>
#include <memory>
#include <sesh/store/memstore.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <vector>

namespace {

auto create_test_logger() {
  auto logger = spdlog::get("memstore_test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("memstore_test");
  }
  return logger;
}

struct manual_clock_s {
  std::chrono::steady_clock::time_point now{std::chrono::steady_clock::now()};
  void advance(int secs) { now += std::chrono::seconds(secs); }
};

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

TEST_CASE("memstore set and get", "[unit][store][memstore]") {
  auto clock = std::make_shared<manual_clock_s>();
  memstore_c ms(create_test_logger(), [clock] { return clock->now; });

  SECTION("absent session reads as empty") {
    auto got = ms.get("nobody", "field");
    REQUIRE(got.is_success());
    CHECK_FALSE(got.value().has_value());

    auto all = ms.get_all("nobody");
    REQUIRE(all.is_success());
    CHECK_FALSE(all.value().has_value());
  }

  SECTION("upsert overwrites a field") {
    CHECK(ms.set("s1", "count", "1", ttl(60)).is_success());
    CHECK(ms.set("s1", "count", "2", ttl(60)).is_success());
    CHECK(ms.set("s1", "name", "bob", ttl(60)).is_success());

    auto got = ms.get("s1", "count");
    REQUIRE(got.value().has_value());
    CHECK(*got.value() == "2");

    auto all = ms.get_all("s1");
    REQUIRE(all.value().has_value());
    CHECK(all.value()->size() == 2);
    CHECK(*all.value()->raw("name") == "bob");
  }

  SECTION("empty id and field are rejected") {
    CHECK(has_code(ms.set("", "f", "v", ttl(60)), error_e::INVALID_ARGUMENT));
    CHECK(has_code(ms.set("s1", "", "v", ttl(60)), error_e::INVALID_ARGUMENT));
    CHECK(has_code(ms.set_and_rename("s1", "s1", "f", "v", ttl(60)),
                   error_e::INVALID_ARGUMENT));
  }
}

TEST_CASE("memstore expiry", "[unit][store][memstore]") {
  auto clock = std::make_shared<manual_clock_s>();
  memstore_c ms(create_test_logger(), [clock] { return clock->now; });

  SECTION("session ttl expires every field") {
    CHECK(ms.set("s1", "a", "1", ttl(10)).is_success());
    clock->advance(9);
    CHECK(ms.get("s1", "a").value().has_value());
    clock->advance(2);
    CHECK_FALSE(ms.get("s1", "a").value().has_value());
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }

  SECTION("field ttl is independent of the session ttl") {
    CHECK(ms.set("s1", "short", "1", ttl(100, 5)).is_success());
    CHECK(ms.set("s1", "long", "2", ttl(100)).is_success());
    clock->advance(6);
    CHECK_FALSE(ms.get("s1", "short").value().has_value());
    CHECK(ms.get("s1", "long").value().has_value());
  }

  SECTION("a session with only expired fields is absent") {
    CHECK(ms.set("s1", "short", "1", ttl(-1, 5)).is_success());
    clock->advance(6);
    CHECK_FALSE(ms.get_all("s1").value().has_value());
    CHECK(ms.size() == 0);
  }

  SECTION("omitted session ttl keeps the current expiry") {
    CHECK(ms.set("s1", "a", "1", ttl(10)).is_success());
    clock->advance(5);
    CHECK(ms.set("s1", "b", "2", ttl(std::nullopt)).is_success());
    clock->advance(6);
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }

  SECTION("negative session ttl persists") {
    CHECK(ms.set("s1", "a", "1", ttl(10)).is_success());
    CHECK(ms.set("s1", "a", "1", ttl(-1)).is_success());
    clock->advance(10000);
    CHECK(ms.get("s1", "a").value().has_value());
  }

  SECTION("zero ttls delete") {
    CHECK(ms.set("s1", "a", "1", ttl(60)).is_success());
    CHECK(ms.set("s1", "b", "2", ttl(60)).is_success());
    CHECK(ms.set("s1", "a", "1", ttl(60, 0)).is_success());
    CHECK_FALSE(ms.get("s1", "a").value().has_value());
    CHECK(ms.get("s1", "b").value().has_value());

    CHECK(ms.set("s1", "c", "3", ttl(0)).is_success());
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }

  SECTION("expire re-arms and deletes") {
    CHECK(ms.set("s1", "a", "1", ttl(10)).is_success());
    CHECK(ms.expire("s1", 100).is_success());
    clock->advance(50);
    CHECK(ms.get("s1", "a").value().has_value());

    CHECK(ms.expire("s1", 0).is_success());
    CHECK_FALSE(ms.get("s1", "a").value().has_value());
  }

  SECTION("sweep reclaims expired sessions") {
    CHECK(ms.set("s1", "a", "1", ttl(10)).is_success());
    CHECK(ms.set("s2", "a", "1", ttl(100)).is_success());
    CHECK(ms.set("s3", "a", "1", ttl(-1, 5)).is_success());
    clock->advance(20);

    auto swept = ms.sweep_expired();
    REQUIRE(swept.is_success());
    CHECK(swept.value() == 2);
    CHECK(ms.size() == 1);
  }
}

TEST_CASE("memstore remove and delete", "[unit][store][memstore]") {
  memstore_c ms(create_test_logger());

  SECTION("removing the last field removes the session") {
    CHECK(ms.set("s1", "a", "1", ttl(60)).is_success());
    CHECK(ms.set("s1", "b", "2", ttl(60)).is_success());
    CHECK(ms.remove("s1", "a").is_success());
    CHECK(ms.size() == 1);
    CHECK(ms.remove("s1", "b").is_success());
    CHECK(ms.size() == 0);
  }

  SECTION("delete is idempotent") {
    CHECK(ms.set("s1", "a", "1", ttl(60)).is_success());
    CHECK(ms.del("s1").is_success());
    CHECK_FALSE(ms.get_all("s1").value().has_value());
    CHECK(ms.del("s1").is_success());
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }
}

TEST_CASE("memstore rename", "[unit][store][memstore]") {
  memstore_c ms(create_test_logger());

  SECTION("set_and_rename moves the record and writes the field") {
    CHECK(ms.set("old", "a", "1", ttl(60)).is_success());
    CHECK(ms.set("old", "b", "2", ttl(60)).is_success());
    CHECK(ms.set_and_rename("old", "new", "b", "3", ttl(60)).is_success());

    CHECK_FALSE(ms.get_all("old").value().has_value());
    auto all = ms.get_all("new");
    REQUIRE(all.value().has_value());
    CHECK(*all.value()->raw("a") == "1");
    CHECK(*all.value()->raw("b") == "3");
  }

  SECTION("set_and_rename creates the record when old is missing") {
    CHECK(ms.set_and_rename("missing", "new", "a", "1", ttl(60)).is_success());
    CHECK(*ms.get("new", "a").value() == "1");
  }

  SECTION("collision leaves both records untouched") {
    CHECK(ms.set("old", "a", "1", ttl(60)).is_success());
    CHECK(ms.set("taken", "a", "other", ttl(60)).is_success());

    CHECK(has_code(ms.set_and_rename("old", "taken", "a", "2", ttl(60)),
                   error_e::COLLISION));
    CHECK(*ms.get("old", "a").value() == "1");
    CHECK(*ms.get("taken", "a").value() == "other");

    CHECK(has_code(ms.rename("old", "taken", 60), error_e::COLLISION));
    CHECK(*ms.get("old", "a").value() == "1");
  }

  SECTION("rename without a field write") {
    CHECK(ms.set("old", "a", "1", ttl(60)).is_success());
    CHECK(ms.rename("old", "new", 60).is_success());
    CHECK_FALSE(ms.get("old", "a").value().has_value());
    CHECK(*ms.get("new", "a").value() == "1");
  }

  SECTION("concurrent renames onto one id, exactly one wins") {
    CHECK(ms.set("left", "who", "left", ttl(60)).is_success());
    CHECK(ms.set("right", "who", "right", ttl(60)).is_success());

    std::atomic<int> wins{0};
    std::atomic<int> collisions{0};
    std::vector<std::thread> threads;
    for (const char *from : {"left", "right"}) {
      threads.emplace_back([&, from] {
        auto status = ms.set_and_rename(from, "target", "n", "1", ttl(60));
        if (status.is_success()) {
          wins++;
        } else if (status.error().code == error_e::COLLISION) {
          collisions++;
        }
      });
    }
    for (auto &t : threads) {
      t.join();
    }

    CHECK(wins.load() == 1);
    CHECK(collisions.load() == 1);

    auto winner = *ms.get("target", "who").value();
    auto loser = winner == "left" ? "right" : "left";
    CHECK(*ms.get(loser, "who").value() == loser);
  }
}

TEST_CASE("memstore insert", "[unit][store][memstore]") {
  auto clock = std::make_shared<manual_clock_s>();
  memstore_c ms(create_test_logger(), [clock] { return clock->now; });

  SECTION("an existing field is left alone") {
    auto first = ms.insert("s1", "a", "1", ttl(60));
    REQUIRE(first.is_success());
    CHECK(first.value());

    clock->advance(50);
    auto second = ms.insert("s1", "a", "2", ttl(60));
    REQUIRE(second.is_success());
    CHECK_FALSE(second.value());
    CHECK(*ms.get("s1", "a").value() == "1");

    // The skipped insert did not extend the session either
    clock->advance(20);
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }

  SECTION("an expired field can be inserted again") {
    CHECK(ms.insert("s1", "a", "1", ttl(60, 10)).value());
    CHECK(ms.set("s1", "b", "2", ttl(60)).is_success());
    clock->advance(11);
    CHECK(ms.insert("s1", "a", "3", ttl(60)).value());
    CHECK(*ms.get("s1", "a").value() == "3");
  }

  SECTION("zero ttls are rejected") {
    auto zero_session = ms.insert("s1", "a", "1", ttl(0));
    CHECK(zero_session.is_error() &&
          zero_session.error().code == error_e::INVALID_ARGUMENT);
    auto zero_field = ms.insert_and_rename("s1", "s2", "a", "1", ttl(60, 0));
    CHECK(zero_field.is_error() &&
          zero_field.error().code == error_e::INVALID_ARGUMENT);
    CHECK_FALSE(ms.get_all("s1").value().has_value());
  }

  SECTION("insert_and_rename moves the record either way") {
    CHECK(ms.set("old", "a", "1", ttl(60)).is_success());

    auto kept = ms.insert_and_rename("old", "mid", "a", "2", ttl(60));
    REQUIRE(kept.is_success());
    CHECK_FALSE(kept.value());
    CHECK_FALSE(ms.get_all("old").value().has_value());
    CHECK(*ms.get("mid", "a").value() == "1");

    auto added = ms.insert_and_rename("mid", "new", "b", "2", ttl(60));
    REQUIRE(added.is_success());
    CHECK(added.value());
    auto all = ms.get_all("new");
    REQUIRE(all.value().has_value());
    CHECK(all.value()->size() == 2);
  }

  SECTION("insert_and_rename onto a live id collides") {
    CHECK(ms.set("old", "a", "1", ttl(60)).is_success());
    CHECK(ms.set("taken", "a", "other", ttl(60)).is_success());
    auto moved = ms.insert_and_rename("old", "taken", "b", "2", ttl(60));
    CHECK(moved.is_error() && moved.error().code == error_e::COLLISION);
    CHECK(*ms.get("old", "a").value() == "1");
    CHECK_FALSE(ms.get("old", "b").value().has_value());
    CHECK_FALSE(ms.get("taken", "b").value().has_value());
  }
}

TEST_CASE("memstore cold layer metadata", "[unit][store][memstore]") {
  auto clock = std::make_shared<manual_clock_s>();
  memstore_c ms(create_test_logger(), [clock] { return clock->now; });

  write_options_s capped{100, std::nullopt, write_strategy_s::capped_hot(10)};
  CHECK(ms.set("s1", "capped", "1", capped).is_success());
  CHECK(ms.set("s1", "plain", "2", ttl(100, 30)).is_success());
  clock->advance(10);

  auto snapshot = ms.get_all_with_meta("s1");
  REQUIRE(snapshot.is_success());
  REQUIRE(snapshot.value().has_value());

  const auto &meta = snapshot.value()->meta;
  CHECK(*meta.at("capped").hot_ttl == 10);
  CHECK(*meta.at("capped").remaining == 90);
  CHECK_FALSE(meta.at("plain").hot_ttl.has_value());
  CHECK(*meta.at("plain").remaining == 20);
  CHECK(*snapshot.value()->session_remaining == 90);
}
