#include <atomic>
#include <sesh/id/id.hpp>
#include <sesh/session/session.hpp>
#include <sesh/store/memstore.hpp>
#include <snitch/snitch.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <thread>
#include <vector>

namespace {

auto create_test_logger() {
  auto logger = spdlog::get("session_test");
  if (!logger) {
    logger = spdlog::stdout_color_mt("session_test");
  }
  return logger;
}

bool has_code(const sesh::store::status_c &status,
              sesh::store::error_e code) {
  return status.is_error() && status.error().code == code;
}

sesh::session::options_s fixed_ids(std::vector<std::string> ids) {
  auto queue = std::make_shared<std::vector<std::string>>(std::move(ids));
  auto next = std::make_shared<std::size_t>(0);
  sesh::session::options_s options;
  options.generate_id = [queue, next] { return queue->at((*next)++); };
  return options;
}

struct profile_s {
  std::string name;
  int visits;
};

void to_json(nlohmann::json &j, const profile_s &p) {
  j = nlohmann::json{{"name", p.name}, {"visits", p.visits}};
}

void from_json(const nlohmann::json &j, profile_s &p) {
  j.at("name").get_to(p.name);
  j.at("visits").get_to(p.visits);
}

} // namespace

using namespace sesh::session;
using sesh::store::error_e;
using sesh::store::memstore_c;

TEST_CASE("session regeneration on the next write", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);
  session_c session(store, std::string("cart"), logger,
                    fixed_ids({"cart2"}));

  REQUIRE(session.set<int>("count", 1).is_success());
  auto count = session.get<int>("count");
  REQUIRE(count.is_success());
  CHECK(*count.value() == 1);

  CHECK(session.prepare_regenerate().value() == "cart2");
  CHECK(*session.pending_id() == "cart2");
  CHECK(*session.id() == "cart");

  REQUIRE(session.set<int>("count", 2).is_success());
  CHECK(*session.id() == "cart2");
  CHECK_FALSE(session.pending_id().has_value());

  session_c moved(store, std::string("cart2"), logger);
  CHECK(*moved.get<int>("count").value() == 2);
  session_c stale(store, std::string("cart"), logger);
  CHECK_FALSE(stale.get<int>("count").value().has_value());
}

TEST_CASE("session regeneration collision", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);

  SECTION("a taken id keeps the existing record") {
    session_c other(store, std::string("taken"), logger);
    REQUIRE(other.set_raw("who", "other").is_success());

    session_c session(store, std::string("mine"), logger,
                      fixed_ids({"taken"}));
    REQUIRE(session.set_raw("who", "me").is_success());
    REQUIRE(session.prepare_regenerate().is_success());

    CHECK(has_code(session.set_raw("who", "me again"), error_e::COLLISION));
    CHECK(*session.id() == "mine");
    CHECK_FALSE(session.pending_id().has_value());
    CHECK(*session.get_raw("who").value() == "me");
    CHECK(*other.get_raw("who").value() == "other");

    // The reservation was dropped so the retry writes in place
    CHECK(session.set_raw("who", "me again").is_success());
    CHECK(*session.get_raw("who").value() == "me again");
  }

  SECTION("concurrent sessions racing for one id") {
    session_c left(store, std::string("left"), logger, fixed_ids({"target"}));
    session_c right(store, std::string("right"), logger,
                    fixed_ids({"target"}));
    REQUIRE(left.set_raw("who", "left").is_success());
    REQUIRE(right.set_raw("who", "right").is_success());
    REQUIRE(left.prepare_regenerate().is_success());
    REQUIRE(right.prepare_regenerate().is_success());

    std::atomic<int> wins{0};
    std::atomic<int> collisions{0};
    std::vector<std::thread> threads;
    for (auto *session : {&left, &right}) {
      threads.emplace_back([&, session] {
        auto status = session->set_raw("n", "1");
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

    auto &loser = *left.id() == "target" ? right : left;
    auto loser_id = *loser.id();
    CHECK(loser_id != "target");
    auto untouched = store.get_all(loser_id);
    REQUIRE(untouched.value().has_value());
    CHECK(untouched.value()->size() == 1);
    CHECK(*untouched.value()->raw("who") == loser_id);
  }
}

TEST_CASE("session binding", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);

  SECTION("an unbound session reads as empty") {
    session_c session(store, std::nullopt, logger);
    CHECK_FALSE(session.get_raw("a").value().has_value());
    CHECK_FALSE(session.get_all().value().has_value());
    CHECK(session.remove("a").is_success());
    CHECK_FALSE(session.id().has_value());
    CHECK_FALSE(session.is_changed());
  }

  SECTION("the first write generates and binds an id") {
    session_c session(store, std::nullopt, logger);
    REQUIRE(session.set_raw("a", "1").is_success());
    REQUIRE(session.id().has_value());
    CHECK(sesh::id::is_valid(*session.id()));
    CHECK(session.is_changed());
    CHECK(*store.get(*session.id(), "a").value() == "1");
  }

  SECTION("a reserved id is used by the first write") {
    session_c session(store, std::nullopt, logger, fixed_ids({"reserved"}));
    CHECK(session.prepare_regenerate().value() == "reserved");
    REQUIRE(session.set_raw("a", "1").is_success());
    CHECK(*session.id() == "reserved");
    CHECK_FALSE(session.pending_id().has_value());
  }

  SECTION("a failing id source is reported, not bound") {
    options_s options;
    options.generate_id = [] { return std::optional<std::string>(); };
    session_c session(store, std::nullopt, logger, options);

    auto reserved = session.prepare_regenerate();
    CHECK(reserved.is_error() &&
          reserved.error().code == error_e::BACKEND);
    CHECK_FALSE(session.pending_id().has_value());

    CHECK(has_code(session.set_raw("a", "1"), error_e::BACKEND));
    CHECK_FALSE(session.id().has_value());
    CHECK_FALSE(session.is_changed());
  }

  SECTION("regenerate needs a bound session") {
    session_c session(store, std::nullopt, logger);
    auto regenerated = session.regenerate();
    CHECK(regenerated.is_error() &&
          regenerated.error().code == error_e::INVALID_ARGUMENT);
  }

  SECTION("regenerate moves the record immediately") {
    session_c session(store, std::string("before"), logger,
                      fixed_ids({"after"}));
    REQUIRE(session.set_raw("a", "1").is_success());
    auto regenerated = session.regenerate();
    REQUIRE(regenerated.is_success());
    CHECK(regenerated.value() == "after");
    CHECK(*session.id() == "after");
    CHECK(*store.get("after", "a").value() == "1");
    CHECK_FALSE(store.get_all("before").value().has_value());
  }
}

TEST_CASE("session deletion and expiry", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);

  SECTION("delete is idempotent") {
    session_c session(store, std::string("s1"), logger);
    REQUIRE(session.set_raw("a", "1").is_success());
    CHECK(session.del().is_success());
    CHECK(session.is_deleted());
    CHECK_FALSE(session.id().has_value());
    CHECK_FALSE(store.get_all("s1").value().has_value());
    CHECK(session.del().is_success());
    CHECK_FALSE(store.get_all("s1").value().has_value());
  }

  SECTION("writing after delete starts a new session") {
    session_c session(store, std::string("s1"), logger, fixed_ids({"s2"}));
    REQUIRE(session.set_raw("a", "1").is_success());
    REQUIRE(session.del().is_success());
    REQUIRE(session.set_raw("b", "2").is_success());
    CHECK(*session.id() == "s2");
    CHECK_FALSE(session.is_deleted());
  }

  SECTION("expire with zero deletes") {
    session_c session(store, std::string("s1"), logger);
    REQUIRE(session.set_raw("a", "1").is_success());
    CHECK(session.expire(0).is_success());
    CHECK(session.is_deleted());
    CHECK_FALSE(store.get_all("s1").value().has_value());
  }

  SECTION("expire updates the ttl used by later writes") {
    session_c session(store, std::string("s1"), logger);
    CHECK(session.expiration() == DEFAULT_SESSION_TTL_SECS);
    REQUIRE(session.set_raw("a", "1").is_success());
    CHECK(session.expire(30).is_success());
    CHECK(session.expiration() == 30);
    session.set_expiration(90);
    CHECK(session.expiration() == 90);
  }

  SECTION("removing the last field removes the session") {
    session_c session(store, std::string("s1"), logger);
    REQUIRE(session.set_raw("a", "1").is_success());
    REQUIRE(session.set_raw("b", "2").is_success());
    CHECK(session.remove("a").is_success());
    CHECK(session.get_all().value()->size() == 1);
    CHECK(session.remove("b").is_success());
    CHECK_FALSE(session.get_all().value().has_value());
  }
}

TEST_CASE("session insert", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);

  SECTION("only the first insert of a field is written") {
    session_c session(store, std::string("s1"), logger);
    auto first = session.insert<int>("visits", 1);
    REQUIRE(first.is_success());
    CHECK(first.value());
    CHECK(session.is_changed());

    auto second = session.insert<int>("visits", 2);
    REQUIRE(second.is_success());
    CHECK_FALSE(second.value());
    CHECK(*session.get<int>("visits").value() == 1);

    REQUIRE(session.set<int>("visits", 3).is_success());
    CHECK(*session.get<int>("visits").value() == 3);
  }

  SECTION("an unbound insert generates and binds an id") {
    session_c session(store, std::nullopt, logger, fixed_ids({"fresh"}));
    auto written = session.insert_raw("a", "1");
    REQUIRE(written.is_success());
    CHECK(written.value());
    CHECK(*session.id() == "fresh");
    CHECK(*store.get("fresh", "a").value() == "1");
  }

  SECTION("a pending id moves even when the field is kept") {
    session_c session(store, std::string("old"), logger, fixed_ids({"new"}));
    REQUIRE(session.set_raw("a", "1").is_success());
    REQUIRE(session.prepare_regenerate().is_success());

    auto written = session.insert_raw("a", "2");
    REQUIRE(written.is_success());
    CHECK_FALSE(written.value());
    CHECK(*session.id() == "new");
    CHECK_FALSE(session.pending_id().has_value());
    CHECK(*store.get("new", "a").value() == "1");
    CHECK_FALSE(store.get_all("old").value().has_value());
  }

  SECTION("a taken pending id drops the reservation") {
    REQUIRE(store.set("taken", "a", "other", {}).is_success());
    session_c session(store, std::string("mine"), logger,
                      fixed_ids({"taken"}));
    REQUIRE(session.set_raw("a", "1").is_success());
    REQUIRE(session.prepare_regenerate().is_success());

    auto written = session.insert_raw("b", "2");
    CHECK(written.is_error() &&
          written.error().code == error_e::COLLISION);
    CHECK(*session.id() == "mine");
    CHECK_FALSE(session.pending_id().has_value());
    CHECK_FALSE(store.get("mine", "b").value().has_value());
  }

  SECTION("a zero field ttl is rejected") {
    session_c session(store, std::string("s1"), logger);
    auto written = session.insert_raw("a", "1", 0);
    CHECK(written.is_error() &&
          written.error().code == error_e::INVALID_ARGUMENT);
  }
}

TEST_CASE("session typed values", "[unit][session]") {
  auto logger = create_test_logger();
  memstore_c store(logger);
  session_c session(store, std::string("s1"), logger);

  REQUIRE(session.set("profile", profile_s{"ada", 3}).is_success());
  REQUIRE(session.set<std::string>("theme", "dark").is_success());

  auto profile = session.get<profile_s>("profile");
  REQUIRE(profile.is_success());
  REQUIRE(profile.value().has_value());
  CHECK(profile.value()->name == "ada");
  CHECK(profile.value()->visits == 3);

  SECTION("a mismatched type is an encoding error") {
    auto wrong = session.get<int>("theme");
    CHECK(wrong.is_error() && wrong.error().code == error_e::ENCODING);
  }

  SECTION("fields decode individually from get_all") {
    auto all = session.get_all();
    REQUIRE(all.value().has_value());
    auto theme = all.value()->get<std::string>("theme");
    CHECK(*theme.value() == "dark");
    CHECK_FALSE(all.value()->get<int>("missing").value().has_value());
  }
}
