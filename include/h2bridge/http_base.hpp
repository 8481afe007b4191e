#pragma once

#include "h2bridge/http_body.hpp"
#include "h2bridge/payload.hpp"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include <format>

namespace h2bridge {

[[nodiscard]] static constexpr bool is_lowercase(std::string_view s) noexcept {
  auto isuppercasechar = [](char c) { return c >= 'A' && c <= 'Z'; };
  return std::none_of(s.begin(), s.end(), isuppercasechar);
}

// ascii only
[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept;

enum struct http_method_e : uint8_t {
  GET,
  POST,
  PUT,
  DELETE,
  PATCH,
  OPTIONS,
  HEAD,
  CONNECT,
  TRACE,
  UNKNOWN,  // may be extension or smth
};

std::string_view e2str(http_method_e e) noexcept;
void enum_from_string(std::string_view, http_method_e&) noexcept;

namespace status {

constexpr inline int CONTINUE = 100;
constexpr inline int SWITCHING_PROTOCOLS = 101;
constexpr inline int PROCESSING = 102;
constexpr inline int OK = 200;
constexpr inline int NO_CONTENT = 204;
constexpr inline int BAD_REQUEST = 400;
constexpr inline int NOT_FOUND = 404;
constexpr inline int INTERNAL_SERVER_ERROR = 500;

}  // namespace status

struct http_header_t {
  std::string hname;
  std::string hvalue;

  std::string_view name() const noexcept {
    return hname;
  }
  std::string_view value() const noexcept {
    return hvalue;
  }

  bool operator==(const http_header_t&) const = default;
};

using http_headers_t = std::vector<http_header_t>;

// names compared case insensitive
[[nodiscard]] const http_header_t* find_header(const http_headers_t&, std::string_view name) noexcept;
[[nodiscard]] inline bool contains_header(const http_headers_t& h, std::string_view name) noexcept {
  return find_header(h, name) != nullptr;
}
// returns count of removed headers
size_t remove_header(http_headers_t&, std::string_view name);
// replaces all headers with 'name' by one header with 'value', appends if no such header
// precondition: 'name' is lowercase
void set_header(http_headers_t&, std::string_view name, std::string value);

struct uri_t {
  // empty for origin-form ("/path?query")
  std::string scheme;
  // empty for origin-form
  std::string authority;
  // path without query, "/" or "*" at least
  std::string path;
  // without '?'
  std::string query;

  [[nodiscard]] bool is_absolute() const noexcept {
    return !authority.empty();
  }

  // path with query
  [[nodiscard]] std::string path_and_query() const;
  [[nodiscard]] std::string str() const;

  bool operator==(const uri_t&) const = default;
};

// accepts "scheme://authority[/path][?query]" or origin-form "/path[?query]" or "*"
// throws malformed_uri
[[nodiscard]] uri_t parse_uri(std::string_view);

struct http_request {
  http_method_e method = http_method_e::GET;
  // method token as received, filled for extension methods too
  std::string method_name;
  uri_t uri;
  // all names lowercase (HTTP/2)
  http_headers_t headers;
  // empty if request has no body (END_STREAM on headers)
  payload body;
  // true if connection encrypted
  bool secure = false;

  [[nodiscard]] bool has_body() const noexcept {
    return bool(body);
  }
};

struct http_response_head {
  int status = status::OK;
  http_headers_t headers;
};

struct http_response {
  int status = status::OK;
  http_headers_t headers;
  response_body body;

  http_response() = default;
  http_response(int s, http_headers_t h = {}, response_body b = {}) noexcept
      : status(s), headers(std::move(h)), body(std::move(b)) {
  }
};

}  // namespace h2bridge

namespace std {

template <>
struct formatter<::h2bridge::http_header_t> : formatter<std::string_view> {
  auto format(::h2bridge::http_header_t const& hdr, auto& ctx) const -> decltype(ctx.out()) {
    return std::format_to(ctx.out(), "{}: {}", hdr.name(), hdr.value());
  }
};

template <>
struct formatter<::h2bridge::uri_t> : formatter<std::string_view> {
  auto format(::h2bridge::uri_t const& u, auto& ctx) const -> decltype(ctx.out()) {
    return std::format_to(ctx.out(), "{}", u.str());
  }
};

}  // namespace std
