#pragma once

#include "h2bridge/errors.hpp"

#include <cassert>
#include <cstdint>
#include <exception>
#include <string_view>

#include <format>

namespace h2bridge {

// 0 reserved for connection related
// odd for client
// issued by transport engine, unique while connection alive
using stream_id_t = uint32_t;

enum struct errc_e : uint32_t {
  NO_ERROR = 0x0,
  PROTOCOL_ERROR = 0x1,
  INTERNAL_ERROR = 0x2,
  FLOW_CONTROL_ERROR = 0x3,
  SETTINGS_TIMEOUT = 0x4,
  STREAM_CLOSED = 0x5,
  FRAME_SIZE_ERROR = 0x6,
  REFUSED_STREAM = 0x7,
  CANCEL = 0x8,
  COMPRESSION_ERROR = 0x9,
  CONNECT_ERROR = 0xa,
  ENHANCE_YOUR_CALM = 0xb,
  INADEQUATE_SECURITY = 0xc,
  HTTP_1_1_REQUIRED = 0xd,
};

constexpr std::string_view e2str(errc_e e) noexcept {
  switch (e) {
    case errc_e::NO_ERROR:
      return "NO_ERROR";
    case errc_e::PROTOCOL_ERROR:
      return "PROTOCOL_ERROR";
    case errc_e::INTERNAL_ERROR:
      return "INTERNAL_ERROR";
    case errc_e::FLOW_CONTROL_ERROR:
      return "FLOW_CONTROL_ERROR";
    case errc_e::SETTINGS_TIMEOUT:
      return "SETTINGS_TIMEOUT";
    case errc_e::STREAM_CLOSED:
      return "STREAM_CLOSED";
    case errc_e::FRAME_SIZE_ERROR:
      return "FRAME_SIZE_ERROR";
    case errc_e::REFUSED_STREAM:
      return "REFUSED_STREAM";
    case errc_e::CANCEL:
      return "CANCEL";
    case errc_e::COMPRESSION_ERROR:
      return "COMPRESSION_ERROR";
    case errc_e::CONNECT_ERROR:
      return "CONNECT_ERROR";
    case errc_e::ENHANCE_YOUR_CALM:
      return "ENHANCE_YOUR_CALM";
    case errc_e::INADEQUATE_SECURITY:
      return "INADEQUATE_SECURITY";
    case errc_e::HTTP_1_1_REQUIRED:
      return "HTTP_1_1_REQUIRED";
    default:
      return "UNKNOWN";
  }
}

// causes GOAWAY and connection close
struct protocol_error : std::exception {
  errc_e errc = errc_e::PROTOCOL_ERROR;
  std::string dbginfo;

  protocol_error() = default;
  explicit protocol_error(errc_e merrc) noexcept : errc(merrc) {
  }

  explicit protocol_error(errc_e merrc, std::string mdbginfo)
      : errc(merrc),
        dbginfo(std::format("HTTP/2 protocol error: errc: {}, dbginfo: \"{}\"", e2str(errc), mdbginfo)) {
  }

  char const* what() const noexcept override {
    return dbginfo.c_str();
  }
};

// causes RST_STREAM
struct stream_error : protocol_error {
  stream_id_t streamid;

  // precondition: streamid != 0
  stream_error(errc_e e, stream_id_t id, std::string msg) : protocol_error(e), streamid(id) {
    assert(streamid != 0);
    this->dbginfo =
        std::format("HTTP/2 stream error: errc: {}, dbginfo: \"{}\", streamid: {}", e2str(errc), msg, id);
  }
};

// request cannot be reconstructed from stream headers,
// answered with 400 and connection continues
struct request_error : std::exception {
  std::string msg;

  explicit request_error(std::string m) noexcept : msg(std::move(m)) {
  }

  char const* what() const noexcept override {
    return msg.c_str();
  }
};

// required pseudo header ("method", "path" or "scheme" when authority present) is absent
struct missing_pseudo_header : request_error {
  std::string field;

  explicit missing_pseudo_header(std::string_view f)
      : request_error(std::format("missing pseudo header \"{}\"", f)), field(f) {
  }
};

// path / scheme / authority do not compose into valid uri
struct malformed_uri : request_error {
  explicit malformed_uri(std::string_view uristr)
      : request_error(std::format("malformed uri \"{}\"", uristr)) {
  }
};

// response body producer failed after response headers were sent
struct body_stream_error : std::exception {
  stream_id_t streamid = 0;
  std::string msg;

  body_stream_error(stream_id_t id, std::string_view reason)
      : streamid(id), msg(std::format("response body stream {} failed: {}", id, reason)) {
  }

  char const* what() const noexcept override {
    return msg.c_str();
  }
};

// connection closed while stream was in progress, request body will never be completed
struct connection_closed : std::exception {
  char const* what() const noexcept override {
    return "connection closed";
  }
};

// single connection-scoped error, produced by acceptor stages and dispatcher
struct connection_error : std::exception {
  enum kind_e : uint8_t {
    HANDSHAKE,  // tls handshake or protocol negotiation failure
    PROTOCOL,   // fatal protocol violation reported by transport engine
    NETWORK,    // io error
    TIMEOUT,    // handshake timeout or client inactivity
  };
  kind_e kind;
  std::string msg;

  connection_error(kind_e k, std::string_view reason)
      : kind(k), msg(std::format("connection error ({}): {}", e2str(k), reason)) {
  }

  static constexpr std::string_view e2str(kind_e k) noexcept {
    switch (k) {
      case HANDSHAKE:
        return "handshake";
      case PROTOCOL:
        return "protocol";
      case NETWORK:
        return "network";
      case TIMEOUT:
        return "timeout";
    }
    return "unknown";
  }

  char const* what() const noexcept override {
    return msg.c_str();
  }
};

}  // namespace h2bridge
