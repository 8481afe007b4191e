#pragma once

#include "h2bridge/any_connection.hpp"
#include "h2bridge/h2_errors.hpp"
#include "h2bridge/http_base.hpp"
#include "h2bridge/payload.hpp"
#include "h2bridge/utils/deadline.hpp"

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <kelcoro/task.hpp>

/*

Interface of HTTP/2 multiplexing engine (frame codec, HPACK, flow-control windows, stream states).
Engine drives connection and delivers two kinds of events:
  * control events (PING, SETTINGS, GOAWAY, connection level errors) to control_service_i
  * stream events (HEADERS, DATA, end of stream) to publish_service_i

*/

namespace h2bridge {

struct pseudo_headers {
  std::optional<std::string> method;
  std::optional<std::string> path;
  std::optional<std::string> scheme;
  std::optional<std::string> authority;
};

// per-stream handle, valid while someone holds it, even after stream closed
struct stream_i {
  [[nodiscard]] virtual stream_id_t id() const noexcept = 0;

  // sends HEADERS
  // throws stream_error if stream closed / reset
  virtual void send_response(int status, http_headers_t headers, bool end_stream) = 0;

  // sends DATA, suspends while peer flow-control window exhausted
  // 'data' must be valid until returned task done
  // throws stream_error if stream closed / reset
  virtual dd::task<void> send_payload(std::span<const byte_t> data, bool end_stream) = 0;

  // zero credit, which returns consumed bytes into stream / connection receive windows
  [[nodiscard]] virtual flow_credit empty_capacity() = 0;

  // sends RST_STREAM, noop if stream already closed
  virtual void reset(errc_e) noexcept = 0;

  virtual ~stream_i() = default;
};

using stream_ptr = std::shared_ptr<stream_i>;

// stream messages

struct headers_message {
  pseudo_headers pseudo;
  http_headers_t headers;
  bool end_stream = false;
};

struct data_message {
  bytes_t chunk;
  // credit for 'chunk' (and padding), must be returned into transport
  flow_credit credit;
};

// DATA with END_STREAM
struct eof_data {
  bytes_t chunk;
};
// trailers HEADERS
struct eof_trailers {
  http_headers_t trailers;
};
// stream reset by peer or closed by connection failure
struct eof_error {
  std::exception_ptr error;
};

struct eof_message {
  std::variant<eof_data, eof_trailers, eof_error> terminal;
};

// events which are not interested for request processing (e.g. PRIORITY)
struct other_message {
  std::string description;
};

struct stream_message {
  stream_ptr stream;
  std::variant<headers_message, data_message, eof_message, other_message> kind;

  [[nodiscard]] stream_id_t id() const noexcept {
    return stream->id();
  }
};

// control messages

struct ping_message {
  uint64_t opaque_data = 0;
};

struct settings_message {
  // identifier, value
  std::vector<std::pair<uint16_t, uint32_t>> settings;
};

// GOAWAY received from peer
struct goaway_message {
  errc_e errc = errc_e::NO_ERROR;
  stream_id_t last_stream_id = 0;
  std::string debug_data;
};

// engine detected connection level protocol violation
struct protocol_error_message {
  errc_e errc = errc_e::PROTOCOL_ERROR;
  std::string reason;
};

// peer disconnected or io failed
struct peer_gone_message {
  std::string reason;
};

struct control_result {
  enum kind_e : uint8_t {
    PING_ACK,      // send PING with ACK flag and same opaque data
    SETTINGS_ACK,  // send SETTINGS with ACK flag
    GOAWAY,        // send GOAWAY with 'errc' and close connection
    DISCONNECT,    // close connection without sending anything
  };
  kind_e kind = DISCONNECT;
  uint64_t ping_data = 0;
  errc_e errc = errc_e::NO_ERROR;

  bool operator==(const control_result&) const = default;
};

std::string_view e2str(control_result::kind_e) noexcept;

struct control_message {
  std::variant<ping_message, settings_message, goaway_message, protocol_error_message, peer_gone_message> kind;

  // default reaction of engine to this message
  [[nodiscard]] control_result ack() const noexcept;
};

// services called by engine

struct control_service_i {
  virtual control_result handle(control_message) = 0;

  virtual ~control_service_i() = default;
};

// must not block, long work must be done in separate tasks
struct publish_service_i {
  virtual void handle(stream_message) = 0;

  virtual ~publish_service_i() = default;
};

struct transport_options {
  // connection dropped if nothing received during this time
  duration_t idle_timeout = std::chrono::seconds(30);
  // time given to in-flight streams to complete after connection closed
  duration_t disconnect_timeout = std::chrono::seconds(3);
  uint32_t max_concurrent_streams = 100;
  uint32_t initial_window_size = 4 * 1024 * 1024;
  uint32_t max_frame_size = 16 * 1024;
};

struct transport_engine_i {
  // drives connection until peer closes it or connection shutdown called
  // throws protocol_error on fatal protocol violation, network_exception on io failure
  virtual dd::task<void> serve(connection_i&, control_service_i&, publish_service_i&, transport_options) = 0;

  virtual ~transport_engine_i() = default;
};

using transport_engine_ptr = std::unique_ptr<transport_engine_i>;

}  // namespace h2bridge
