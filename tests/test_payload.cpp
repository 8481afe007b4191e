#include <h2bridge/payload.hpp>
#include <h2bridge/h2_errors.hpp>

#include <string>
#include <vector>

#include <kelcoro/job.hpp>
#include <moko3/moko3.hpp>
#include <zal/zal.hpp>

using namespace h2bridge;

namespace {

bytes_t bytes_of(std::string_view s) {
  auto b = as_bytes(s);
  return bytes_t(b.begin(), b.end());
}

flow_credit counted_credit(uint32_t n, size_t& released) {
  return flow_credit(n, [&released](uint32_t x) { released += x; });
}

struct reader_state {
  std::vector<std::string> chunks;
  bool done = false;
  std::exception_ptr error;
};

dd::job read_chunks(payload& p, reader_state& st) {
  on_scope_exit {
    st.done = true;
  };
  try {
    for (;;) {
      bytes_t c = co_await p.next_chunk();
      if (c.empty())
        co_return;
      st.chunks.emplace_back(as_strview(c));
    }
  } catch (...) {
    st.error = std::current_exception();
  }
}

dd::job read_everything(payload& p, bytes_t& out, bool& done) {
  out = co_await p.read_all();
  done = true;
}

template <typename E>
bool holds(std::exception_ptr e) {
  if (!e)
    return false;
  try {
    std::rethrow_exception(e);
  } catch (E&) {
    return true;
  } catch (...) {
    return false;
  }
}

}  // namespace

TEST("payload chunks order") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  sender.feed_data(bytes_of("ab"), counted_credit(2, released));
  sender.feed_data(bytes_of("cd"), counted_credit(2, released));
  REQUIRE(body.has_data());
  REQUIRE(!body.last_chunk_received());

  reader_state st;
  read_chunks(body, st);
  // data consumed, reader waits for more
  REQUIRE(!st.done);
  REQUIRE(st.chunks == std::vector<std::string>{"ab", "cd"});
  REQUIRE(released == 4);

  sender.feed_eof(bytes_of("ef"));
  REQUIRE(st.done);
  REQUIRE(!st.error);
  REQUIRE(st.chunks == std::vector<std::string>{"ab", "cd", "ef"});
  REQUIRE(body.last_chunk_received());
  REQUIRE(released == 4);
}

TEST("payload empty chunks not delivered") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  // padding only frame
  sender.feed_data({}, counted_credit(7, released));
  REQUIRE(!body.has_data());
  REQUIRE(released == 0);
  sender.feed_eof({});
  // not consumed credit returned on eof
  REQUIRE(released == 7);
  reader_state st;
  read_chunks(body, st);
  REQUIRE(st.done);
  REQUIRE(st.chunks.empty());
  REQUIRE(!st.error);
}

TEST("payload credit returned by consumer") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  // 'hello' with 3 bytes of padding
  sender.feed_data(bytes_of("hello"), counted_credit(8, released));
  REQUIRE(released == 0);

  reader_state st;
  read_chunks(body, st);
  REQUIRE(st.chunks.size() == 1);
  REQUIRE(released == 5);
  sender.feed_eof({});
  REQUIRE(released == 8);
  REQUIRE(st.done);
}

TEST("payload error wakes reader") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  reader_state st;
  read_chunks(body, st);
  REQUIRE(!st.done);
  sender.set_error(std::make_exception_ptr(connection_closed{}));
  REQUIRE(st.done);
  REQUIRE(holds<connection_closed>(st.error));
  REQUIRE(sender.terminated());
}

TEST("payload error drops buffered") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  sender.feed_data(bytes_of("xyz"), counted_credit(3, released));
  sender.set_error(std::make_exception_ptr(connection_closed{}));
  REQUIRE(released == 3);
  REQUIRE(!body.has_data());

  reader_state st;
  read_chunks(body, st);
  REQUIRE(st.done);
  REQUIRE(st.chunks.empty());
  REQUIRE(holds<connection_closed>(st.error));
}

TEST("payload calls after end ignored") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  sender.feed_eof(bytes_of("end"));
  REQUIRE(sender.terminated());

  sender.feed_data(bytes_of("late"), counted_credit(4, released));
  // credit of ignored chunk still returned
  REQUIRE(released == 4);
  sender.set_error(std::make_exception_ptr(connection_closed{}));
  sender.feed_eof(bytes_of("again"));

  reader_state st;
  read_chunks(body, st);
  REQUIRE(st.done);
  REQUIRE(!st.error);
  REQUIRE(st.chunks == std::vector<std::string>{"end"});
}

TEST("payload dropped consumer") {
  size_t released = 0;
  auto [sender, body] = make_payload_channel(counted_credit(0, released));
  sender.feed_data(bytes_of("abc"), counted_credit(3, released));
  {
    payload dropped = std::move(body);
  }
  REQUIRE(released == 3);
  sender.feed_data(bytes_of("defg"), counted_credit(4, released));
  REQUIRE(released == 7);
  sender.feed_eof(bytes_of("x"));
  REQUIRE(sender.terminated());
}

TEST("payload sender destroyed") {
  auto [sender, body] = make_payload_channel(flow_credit{});
  reader_state st;
  read_chunks(body, st);
  REQUIRE(!st.done);
  {
    payload_sender dropped = std::move(sender);
  }
  REQUIRE(st.done);
  REQUIRE(st.error != nullptr);
  REQUIRE(!holds<connection_closed>(st.error));
}

TEST("payload read all") {
  auto [sender, body] = make_payload_channel(flow_credit{});
  bytes_t result;
  bool done = false;
  read_everything(body, result, done);
  REQUIRE(!done);
  for (std::string_view part : {"hel", "", "lo ", "wor"})
    sender.feed_data(bytes_of(part), flow_credit{});
  REQUIRE(!done);
  sender.feed_eof(bytes_of("ld"));
  REQUIRE(done);
  REQUIRE(as_strview(result) == "hello world");
}

TEST("flow credit merge") {
  size_t released = 0;
  flow_credit a = counted_credit(3, released);
  flow_credit b(5, [](uint32_t) { REQUIRE(false); });
  a.merge(std::move(b));
  REQUIRE(b.size() == 0);
  REQUIRE(a.size() == 8);
  a.consume(10);
  REQUIRE(released == 8);
  REQUIRE(a.size() == 0);
  {
    flow_credit c = counted_credit(2, released);
  }
  REQUIRE(released == 10);
}

REGISTER_TEST_LISTENER(moko3::gtest_listener);
MOKO3_MAIN;
