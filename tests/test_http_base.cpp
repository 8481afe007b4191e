#include <h2bridge/http_base.hpp>
#include <h2bridge/h2_errors.hpp>

#include <string>

#include <kelcoro/job.hpp>
#include <moko3/moko3.hpp>

using namespace h2bridge;

static dd::job collect(streaming_body_t chunks, std::vector<std::string>& out, bool& done) {
  auto b = co_await chunks.begin();
  for (; b != chunks.end(); (void)(co_await (++b)))
    out.emplace_back(as_strview(*b));
  done = true;
}

static std::vector<std::string> all_chunks(response_body& body) {
  std::vector<std::string> out;
  bool done = false;
  collect(body.take_chunks(), out, done);
  REQUIRE(done);
  return out;
}

static streaming_body_t three_chunks() {
  std::string_view parts[] = {"a", "", "bc"};
  for (std::string_view p : parts)
    co_yield as_bytes(p);
}

TEST("parse origin form") {
  uri_t u = parse_uri("/index.html?x=1&y=2");
  REQUIRE(!u.is_absolute());
  REQUIRE(u.path == "/index.html");
  REQUIRE(u.query == "x=1&y=2");
  REQUIRE(u.path_and_query() == "/index.html?x=1&y=2");
  REQUIRE(u.str() == "/index.html?x=1&y=2");

  REQUIRE(parse_uri("*").path == "*");
  REQUIRE(parse_uri("/").path == "/");
}

TEST("parse absolute form") {
  uri_t u = parse_uri("https://example.com:8443/a/b?q");
  REQUIRE(u.is_absolute());
  REQUIRE(u.scheme == "https");
  REQUIRE(u.authority == "example.com:8443");
  REQUIRE(u.path == "/a/b");
  REQUIRE(u.query == "q");
  REQUIRE(std::format("{}", u) == "https://example.com:8443/a/b?q");

  SECTION("empty path") {
    uri_t v = parse_uri("http://example.com");
    REQUIRE(v.path == "/");
    REQUIRE(v.str() == "http://example.com/");
  }
  SECTION("query without path") {
    uri_t v = parse_uri("http://example.com?x");
    REQUIRE(v.path == "/");
    REQUIRE(v.query == "x");
  }
}

TEST("malformed uri") {
  std::string_view bad = GENERATE(std::string_view(""), std::string_view("index.html"),
                                  std::string_view("/with space"), std::string_view("/frag#ment"),
                                  std::string_view("http:/example.com"), std::string_view("1http://host/"),
                                  std::string_view("http:///path"), std::string_view("http://user@host/"),
                                  std::string_view("/\x7f"));
  bool thrown = false;
  try {
    (void)parse_uri(bad);
  } catch (malformed_uri&) {
    thrown = true;
  }
  REQUIRE(thrown);
}

TEST("header helpers") {
  http_headers_t h{{"Content-Type", "text/plain"}, {"x-a", "1"}, {"X-A", "2"}};
  REQUIRE(contains_header(h, "content-type"));
  REQUIRE(find_header(h, "X-a")->value() == "1");
  REQUIRE(!find_header(h, "date"));

  set_header(h, "x-a", "3");
  REQUIRE(h.size() == 2);
  REQUIRE(h[1] == http_header_t{"x-a", "3"});

  set_header(h, "date", "today");
  REQUIRE(h.back() == http_header_t{"date", "today"});

  REQUIRE(remove_header(h, "CONTENT-TYPE") == 1);
  REQUIRE(remove_header(h, "content-type") == 0);
  REQUIRE(h.size() == 2);
  REQUIRE(std::format("{}", h[0]) == "x-a: 3");
}

TEST("method from string") {
  http_method_e m;
  enum_from_string("PATCH", m);
  REQUIRE(m == http_method_e::PATCH);
  enum_from_string("BREW", m);
  REQUIRE(m == http_method_e::UNKNOWN);
  REQUIRE(e2str(http_method_e::HEAD) == "HEAD");
}

TEST("response body size") {
  REQUIRE(response_body().size() == body_size::none());
  REQUIRE(response_body(bytes_t{}).size() == body_size::empty());
  REQUIRE(response_body::from_string("abc").size() == body_size::sized(3));
  REQUIRE(response_body::stream(three_chunks()).size() == body_size::stream());
  REQUIRE(response_body::sized_stream(3, three_chunks()).size() == body_size::sized(3));
  REQUIRE(response_body::sized_stream(0, three_chunks()).size() == body_size::empty());
}

TEST("response body chunks") {
  SECTION("in memory") {
    response_body b = response_body::from_string("hello");
    REQUIRE(as_strview(*b.bytes()) == "hello");
    REQUIRE(all_chunks(b) == std::vector<std::string>{"hello"});
    // body taken
    REQUIRE(b.size() == body_size::none());
    REQUIRE(!b.bytes());
  }
  SECTION("no body") {
    response_body b;
    REQUIRE(all_chunks(b).empty());
  }
  SECTION("stream") {
    response_body b = response_body::stream(three_chunks());
    REQUIRE(!b.bytes());
    REQUIRE(all_chunks(b) == std::vector<std::string>{"a", "", "bc"});
  }
}

REGISTER_TEST_LISTENER(moko3::gtest_listener);
MOKO3_MAIN;
