#pragma once

#include <h2bridge/any_connection.hpp>
#include <h2bridge/service.hpp>
#include <h2bridge/transport.hpp>

#include <coroutine>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/error.hpp>

namespace h2bridge {

// what publish handler sent into stream
struct sent_event {
  enum kind_e { HEADERS, PAYLOAD, RESET };
  kind_e kind;
  int status = 0;
  http_headers_t headers;
  std::string data;
  bool end_stream = false;
  errc_e errc = errc_e::NO_ERROR;

  std::string_view header(std::string_view name) const {
    const http_header_t* h = find_header(headers, name);
    return h ? h->value() : std::string_view{};
  }
};

// records everything sent by handler, returns credit into 'released'
struct fake_stream final : stream_i {
  stream_id_t streamid;
  std::vector<sent_event> events;
  // flow-control credit returned to transport
  size_t released = 0;
  // if true, send_* throw stream_error (stream reset by peer)
  bool gone = false;
  // peer flow-control window for DATA, send_payload suspends while chunk does not fit
  size_t window = std::numeric_limits<size_t>::max();
  std::coroutine_handle<> blocked = nullptr;

  explicit fake_stream(stream_id_t id) noexcept : streamid(id) {
  }

  stream_id_t id() const noexcept override {
    return streamid;
  }

  void send_response(int status, http_headers_t headers, bool end_stream) override {
    if (gone)
      throw stream_error(errc_e::CANCEL, streamid, "stream reset by peer");
    events.push_back(sent_event{
        .kind = sent_event::HEADERS, .status = status, .headers = std::move(headers), .end_stream = end_stream});
  }

  struct window_awaiter {
    fake_stream* s;

    bool await_ready() const noexcept {
      return false;
    }
    void await_suspend(std::coroutine_handle<> h) noexcept {
      s->blocked = h;
    }
    void await_resume() const noexcept {
    }
  };

  dd::task<void> send_payload(std::span<const byte_t> data, bool end_stream) override {
    if (gone)
      throw stream_error(errc_e::CANCEL, streamid, "stream reset by peer");
    while (data.size() > window)
      co_await window_awaiter{this};
    window -= data.size();
    events.push_back(sent_event{
        .kind = sent_event::PAYLOAD, .data = std::string(as_strview(data)), .end_stream = end_stream});
    co_return;
  }

  flow_credit empty_capacity() override {
    return credit(0);
  }

  void reset(errc_e e) noexcept override {
    events.push_back(sent_event{.kind = sent_event::RESET, .errc = e});
  }

  // WINDOW_UPDATE from peer, resumes suspended sender
  void grant(size_t n) {
    window += n;
    if (blocked)
      std::exchange(blocked, nullptr).resume();
  }

  // credit as engine gives it with DATA frame
  flow_credit credit(uint32_t n) {
    return flow_credit(n, [this](uint32_t x) { released += x; });
  }

  // concatenated DATA
  std::string body() const {
    std::string s;
    for (auto& e : events)
      if (e.kind == sent_event::PAYLOAD)
        s += e.data;
    return s;
  }
};

inline std::shared_ptr<fake_stream> make_fake_stream(stream_id_t id) {
  return std::make_shared<fake_stream>(id);
}

inline bytes_t bytes_of(std::string_view s) {
  auto b = as_bytes(s);
  return bytes_t(b.begin(), b.end());
}

inline stream_message headers_event(stream_ptr s, pseudo_headers pseudo, bool end_stream,
                                    http_headers_t headers = {}) {
  return stream_message{std::move(s), headers_message{std::move(pseudo), std::move(headers), end_stream}};
}

inline pseudo_headers get_pseudo(std::string path, std::string method = "GET") {
  return pseudo_headers{
      .method = std::move(method), .path = std::move(path), .scheme = "https", .authority = "example.com"};
}

inline stream_message data_event(std::shared_ptr<fake_stream> s, std::string_view data) {
  flow_credit c = s->credit(uint32_t(data.size()));
  return stream_message{std::move(s), data_message{bytes_of(data), std::move(c)}};
}

inline stream_message eof_event(stream_ptr s, std::string_view last_chunk) {
  return stream_message{std::move(s), eof_message{eof_data{bytes_of(last_chunk)}}};
}

// service from callable, callable must return dd::task<http_response>
struct lambda_service final : http_service_i {
  move_only_fn_soos<dd::task<http_response>(http_request)> fn;

  explicit lambda_service(move_only_fn_soos<dd::task<http_response>(http_request)> f) : fn(std::move(f)) {
  }

  dd::task<http_response> handle_request(http_request r) override {
    return fn(std::move(r));
  }
};

inline http_service_ptr make_service(move_only_fn_soos<dd::task<http_response>(http_request)> fn) {
  return std::make_shared<lambda_service>(std::move(fn));
}

inline dd::task<http_response> hello_handler(http_request) {
  co_return http_response(status::OK, {}, response_body::from_string("hello"));
}

// connection without network, reads wait until shutdown
struct fake_connection final : connection_i {
  boost::asio::io_context& io;
  std::coroutine_handle<> reader = nullptr;
  io_error_code* reader_ec = nullptr;
  bool secure = false;
  bool is_shutdown = false;

  explicit fake_connection(boost::asio::io_context& ctx, bool sec = false) noexcept : io(ctx), secure(sec) {
  }

  void start_read_some(std::coroutine_handle<> h, std::span<byte_t>, size_t& readen, io_error_code& ec) override {
    readen = 0;
    if (is_shutdown) {
      ec = boost::asio::error::operation_aborted;
      boost::asio::post(io, h);
      return;
    }
    reader = h;
    reader_ec = &ec;
  }
  void start_write(std::coroutine_handle<> h, std::span<byte_t const>, io_error_code& ec) override {
    if (is_shutdown)
      ec = boost::asio::error::operation_aborted;
    boost::asio::post(io, h);
  }
  void shutdown() noexcept override {
    is_shutdown = true;
    if (reader) {
      *reader_ec = boost::asio::error::operation_aborted;
      boost::asio::post(io, std::exchange(reader, nullptr));
    }
  }
  bool is_secure() const noexcept override {
    return secure;
  }
};

// engine which runs scenario instead of parsing frames
struct fake_engine final : transport_engine_i {
  using scenario_t =
      move_only_fn_soos<dd::task<void>(connection_i&, control_service_i&, publish_service_i&, transport_options)>;
  scenario_t scenario;

  explicit fake_engine(scenario_t s) : scenario(std::move(s)) {
  }

  dd::task<void> serve(connection_i& con, control_service_i& control, publish_service_i& publish,
                       transport_options opts) override {
    return scenario(con, control, publish, std::move(opts));
  }
};

// waits until connection closed, as engine does when nothing received
inline dd::task<void> read_until_closed(connection_i& con) {
  byte_t buf[16];
  io_error_code ec;
  (void)co_await read_some(con, buf, ec);
  if (ec)
    throw network_exception(ec);
}

}  // namespace h2bridge
