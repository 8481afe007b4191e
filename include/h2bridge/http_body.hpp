#pragma once

#include "h2bridge/utils/memory.hpp"

#include <cstdint>
#include <span>
#include <string_view>
#include <variant>

#include <kelcoro/channel.hpp>

namespace h2bridge {

// chunks producer for response body, empty chunks allowed (they will not be sent)
// exception from producer aborts stream
using streaming_body_t = dd::channel<std::span<const byte_t>>;

struct body_size {
  enum kind_e : uint8_t {
    NONE,   // no body at all (e.g. 204 No Content)
    EMPTY,  // body with zero length, 'content-length: 0'
    SIZED,  // length known before first byte sent
    STREAM, // length unknown
  };

  kind_e kind = NONE;
  uint64_t len = 0;

  static constexpr body_size none() noexcept {
    return body_size{NONE, 0};
  }
  static constexpr body_size empty() noexcept {
    return body_size{EMPTY, 0};
  }
  static constexpr body_size sized(uint64_t n) noexcept {
    return body_size{SIZED, n};
  }
  static constexpr body_size stream() noexcept {
    return body_size{STREAM, 0};
  }

  // response with such body ends with headers
  [[nodiscard]] constexpr bool is_eof() const noexcept {
    return kind == NONE || kind == EMPTY;
  }

  bool operator==(const body_size&) const = default;
};

std::string_view e2str(body_size::kind_e) noexcept;

struct response_body {
 private:
  struct sized_stream_t {
    uint64_t len;
    streaming_body_t chunks;
  };
  std::variant<std::monostate, bytes_t, sized_stream_t, streaming_body_t> m_body;

 public:
  // no body
  response_body() = default;
  response_body(bytes_t bytes) noexcept : m_body(std::move(bytes)) {
  }

  response_body(response_body&&) = default;
  response_body& operator=(response_body&&) = default;

  static response_body from_string(std::string_view s) {
    auto b = as_bytes(s);
    return response_body(bytes_t(b.begin(), b.end()));
  }
  // precondition: 'chunks' produces exactly 'len' bytes
  static response_body sized_stream(uint64_t len, streaming_body_t chunks) noexcept {
    response_body b;
    b.m_body = sized_stream_t{len, std::move(chunks)};
    return b;
  }
  static response_body stream(streaming_body_t chunks) noexcept {
    response_body b;
    b.m_body.emplace<streaming_body_t>(std::move(chunks));
    return b;
  }

  [[nodiscard]] body_size size() const noexcept;

  // nullptr if body is not in-memory
  [[nodiscard]] const bytes_t* bytes() const noexcept {
    return std::get_if<bytes_t>(&m_body);
  }

  // makes producer of all body chunks, *this becomes empty
  streaming_body_t take_chunks();
};

}  // namespace h2bridge
