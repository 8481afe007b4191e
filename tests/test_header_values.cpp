#include <h2bridge/headers/caching.hpp>
#include <h2bridge/headers/quality.hpp>

#include <cmath>
#include <limits>

#include <moko3/moko3.hpp>

using namespace h2bridge;
using namespace std::chrono_literals;

TEST("age parse") {
  REQUIRE(age::parse("0").get() == 0s);
  REQUIRE(age::parse("3600").get() == 3600s);
  REQUIRE(age::parse(" \t42 ").get() == 42s);

  std::string_view bad = GENERATE(std::string_view(""), std::string_view("-1"), std::string_view("+5"),
                                  std::string_view("1.5"), std::string_view("12a"), std::string_view("1 2"),
                                  std::string_view("99999999999999999999999"));
  bool thrown = false;
  try {
    (void)age::parse(bad);
  } catch (invalid_header_value&) {
    thrown = true;
  }
  REQUIRE(thrown);
}

TEST("age build") {
  REQUIRE(age::from_origin().build() == "0");
  age a(120s);
  REQUIRE(a.build() == "120");
  a.set(7s);
  REQUIRE(a.get() == 7s);

  auto now = std::chrono::steady_clock::now();
  REQUIRE(age::from_date(now + 1h).get() == 0s);
  REQUIRE(age::from_date(now - 90s).get() >= 90s);

  http_headers_t h{{"Age", "1"}, {"age", "2"}};
  set_header(h, age(5s));
  REQUIRE(h == http_headers_t{{"age", "5"}});
}

template <typename F>
static bool throws_invalid_value(F&& f) {
  try {
    f();
  } catch (invalid_header_value&) {
    return true;
  }
  return false;
}

TEST("negative durations rejected") {
  REQUIRE(throws_invalid_value([] { (void)age(-5s); }));
  age a(10s);
  REQUIRE(throws_invalid_value([&] { a.set(-1s); }));
  REQUIRE(a.get() == 10s);

  cache_control cc;
  cc.set_max_age(30s);
  REQUIRE(throws_invalid_value([&] { cc.set_max_age(-30s); }));
  REQUIRE(throws_invalid_value([&] { cc.set_s_maxage(-1s); }));
  REQUIRE(throws_invalid_value([&] { cc.set_stale_while_revalidate(-1s); }));
  REQUIRE(throws_invalid_value([&] { cc.set_stale_if_error(-1s); }));
  REQUIRE(throws_invalid_value([&] { cc.set_max_stale(-1s); }));
  REQUIRE(throws_invalid_value([&] { cc.set_min_fresh(-1s); }));
  REQUIRE(cc.to_string() == "max-age=30");
  // zero is valid
  cc.set_max_age(0s);
  REQUIRE(cc.to_string() == "max-age=0");
  REQUIRE(age(0s).build() == "0");
}

TEST("cache control flags") {
  cache_control cc;
  REQUIRE(cc.has_flag(cache_flag_e::EMPTY));
  cc.set_flag(cache_flag_e::NO_CACHE | cache_flag_e::PRIVATE);
  REQUIRE(!cc.has_flag(cache_flag_e::EMPTY));
  REQUIRE(cc.has_flag(cache_flag_e::NO_CACHE));
  REQUIRE(cc.has_flag(cache_flag_e::NO_CACHE | cache_flag_e::PRIVATE));
  REQUIRE(!cc.has_flag(cache_flag_e::NO_CACHE | cache_flag_e::PUBLIC));
  cc.remove_flag(cache_flag_e::NO_CACHE);
  REQUIRE(cc.flags() == cache_flag_e::PRIVATE);
  cc.remove_flag(cache_flag_e::PRIVATE);
  REQUIRE(cc.has_flag(cache_flag_e::EMPTY));
}

TEST("cache control build") {
  SECTION("flags order") {
    cache_control cc;
    cc.set_flag(cache_flag_e::IMMUTABLE).set_flag(cache_flag_e::PUBLIC).set_flag(cache_flag_e::NO_STORE);
    REQUIRE(cc.build() == std::vector<std::string>{"no-store", "public", "immutable"});
    REQUIRE(cc.to_string() == "no-store, public, immutable");
  }
  SECTION("flags then directive") {
    cache_control cc;
    cc.set_max_age(60s);
    REQUIRE(cc.to_string() == "max-age=60");
    cc.set_max_age(30s).set_flag(cache_flag_e::PRIVATE).set_flag(cache_flag_e::NO_CACHE);
    REQUIRE(cc.to_string() == "no-cache, private, max-age=30");
  }
  SECTION("only highest priority time directive") {
    cache_control cc;
    cc.set_min_fresh(10s).set_stale_if_error(20s).set_s_maxage(30s);
    REQUIRE(cc.build() == std::vector<std::string>{"s-maxage=30"});
    cc.set_max_age(60s).set_flag(cache_flag_e::MUST_REVALIDATE);
    REQUIRE(cc.to_string() == "must-revalidate, max-age=60");
    REQUIRE(cc.min_fresh() == 10s);
  }
  SECTION("empty") {
    cache_control cc;
    REQUIRE(cc.build().empty());
    REQUIRE(cc.to_string().empty());
    http_headers_t h{{"cache-control", "no-cache"}};
    set_header(h, cc);
    REQUIRE(h.empty());
  }
  SECTION("each value is separate header") {
    cache_control cc;
    cc.set_flag(cache_flag_e::NO_CACHE).set_max_stale(5s);
    http_headers_t h;
    set_header(h, cc);
    REQUIRE(h == http_headers_t{{"cache-control", "no-cache"}, {"cache-control", "max-stale=5"}});
  }
}

TEST("quality values") {
  REQUIRE(quality().is_default());
  REQUIRE(quality().to_string().empty());
  REQUIRE(quality::most_preferred().value() == 1000);
  REQUIRE(quality::least_preferred().value() == 1);
  REQUIRE(quality::not_acceptable().to_string() == "q=0");

  REQUIRE(quality::from(1.0)->to_string() == "q=1");
  REQUIRE(quality::from(0.5)->to_string() == "q=0.5");
  REQUIRE(quality::from(0.05)->to_string() == "q=0.05");
  REQUIRE(quality::from(0.125)->to_string() == "q=0.125");
  REQUIRE(quality::from(0.001)->to_string() == "q=0.001");
  REQUIRE(quality::from(0.0) == quality::not_acceptable());
  // rounded to 3 digits
  REQUIRE(quality::from(0.1234)->value() == 123);
  REQUIRE(quality::from(0.9996)->to_string() == "q=1");
}

TEST("quality out of range") {
  double q = GENERATE(-0.1, 1.01, 1.5, std::numeric_limits<double>::quiet_NaN(),
                      std::numeric_limits<double>::infinity());
  REQUIRE(!quality::from(q));
}

REGISTER_TEST_LISTENER(moko3::gtest_listener);
MOKO3_MAIN;
