#include "h2bridge/http_base.hpp"

#include "h2bridge/h2_errors.hpp"
#include "h2bridge/utils/macro.hpp"

#include <strswitch/strswitch.hpp>

// windows)))
#undef DELETE

namespace h2bridge {

static constexpr char ascii_tolower(char c) noexcept {
  return (c >= 'A' && c <= 'Z') ? char(c - 'A' + 'a') : c;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
  return a.size() == b.size() &&
         std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) { return ascii_tolower(l) == ascii_tolower(r); });
}

std::string_view e2str(http_method_e e) noexcept {
  using enum http_method_e;
  switch (e) {
    case GET:
      return "GET";
    case POST:
      return "POST";
    case PUT:
      return "PUT";
    case DELETE:
      return "DELETE";
    case PATCH:
      return "PATCH";
    case OPTIONS:
      return "OPTIONS";
    case HEAD:
      return "HEAD";
    case CONNECT:
      return "CONNECT";
    case TRACE:
      return "TRACE";
    case UNKNOWN:
      return "UNKNOWN";
    default:
      unreachable();  // error
  }
}

void enum_from_string(std::string_view str, http_method_e& e) noexcept {
  using enum http_method_e;
  e = ss::string_switch<http_method_e>(str)
          .case_("GET", GET)
          .case_("POST", POST)
          .case_("PUT", PUT)
          .case_("DELETE", DELETE)
          .case_("PATCH", PATCH)
          .case_("HEAD", HEAD)
          .case_("CONNECT", CONNECT)
          .case_("OPTIONS", OPTIONS)
          .case_("TRACE", TRACE)
          .orDefault(UNKNOWN);
}

const http_header_t* find_header(const http_headers_t& headers, std::string_view name) noexcept {
  auto it = std::find_if(headers.begin(), headers.end(),
                         [&](const http_header_t& h) { return iequals(h.name(), name); });
  return it == headers.end() ? nullptr : &*it;
}

size_t remove_header(http_headers_t& headers, std::string_view name) {
  return std::erase_if(headers, [&](const http_header_t& h) { return iequals(h.name(), name); });
}

void set_header(http_headers_t& headers, std::string_view name, std::string value) {
  assert(is_lowercase(name));
  auto it = std::find_if(headers.begin(), headers.end(),
                         [&](const http_header_t& h) { return iequals(h.name(), name); });
  if (it == headers.end()) {
    headers.push_back(http_header_t{std::string(name), std::move(value)});
    return;
  }
  it->hname = name;
  it->hvalue = std::move(value);
  ++it;
  headers.erase(std::remove_if(it, headers.end(), [&](const http_header_t& h) { return iequals(h.name(), name); }),
                headers.end());
}

// uri

std::string uri_t::path_and_query() const {
  if (query.empty())
    return path;
  return std::format("{}?{}", path, query);
}

std::string uri_t::str() const {
  if (!is_absolute())
    return path_and_query();
  return std::format("{}://{}{}", scheme, authority, path_and_query());
}

static constexpr bool is_alpha(char c) noexcept {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static constexpr bool is_digit(char c) noexcept {
  return c >= '0' && c <= '9';
}

// visible ascii without space and controls, fragment forbidden in request target
static constexpr bool is_uri_char(char c) noexcept {
  return c > 0x20 && c < 0x7F && c != '#';
}

static bool valid_scheme(std::string_view s) noexcept {
  if (s.empty() || !is_alpha(s.front()))
    return false;
  return std::all_of(s.begin(), s.end(),
                     [](char c) { return is_alpha(c) || is_digit(c) || c == '+' || c == '-' || c == '.'; });
}

static bool valid_authority(std::string_view a) noexcept {
  if (a.empty())
    return false;
  // userinfo is deprecated for http(s) (RFC 9110 4.2.4)
  return std::all_of(a.begin(), a.end(), [](char c) {
    return is_uri_char(c) && c != '/' && c != '?' && c != '@' && c != '"' && c != '<' && c != '>' && c != '\\' &&
           c != '^' && c != '`' && c != '{' && c != '|' && c != '}';
  });
}

// fills path and query from "/path?query" or "*"
static void parse_path_and_query(std::string_view pq, std::string_view full, uri_t& out) {
  if (!std::all_of(pq.begin(), pq.end(), is_uri_char))
    throw malformed_uri(full);
  if (pq.empty()) {
    out.path = "/";
    return;
  }
  if (pq == "*") {
    out.path = "*";
    return;
  }
  if (pq.front() != '/' && pq.front() != '?')
    throw malformed_uri(full);
  size_t q = pq.find('?');
  if (q == pq.npos) {
    out.path = pq;
    return;
  }
  out.path = pq.substr(0, q);
  if (out.path.empty())
    out.path = "/";
  out.query = pq.substr(q + 1);
}

uri_t parse_uri(std::string_view str) {
  uri_t u;
  if (str.empty())
    throw malformed_uri(str);
  if (str.front() == '/' || str == "*") {
    parse_path_and_query(str, str, u);
    return u;
  }
  size_t schemeend = str.find("://");
  if (schemeend == str.npos)
    throw malformed_uri(str);
  std::string_view scheme = str.substr(0, schemeend);
  std::string_view rest = str.substr(schemeend + 3);
  size_t authend = std::min(rest.find('/'), rest.find('?'));
  std::string_view authority = rest.substr(0, authend);
  if (!valid_scheme(scheme) || !valid_authority(authority))
    throw malformed_uri(str);
  u.scheme = scheme;
  u.authority = authority;
  parse_path_and_query(authend == rest.npos ? std::string_view{} : rest.substr(authend), str, u);
  return u;
}

// body

std::string_view e2str(body_size::kind_e k) noexcept {
  switch (k) {
    case body_size::NONE:
      return "NONE";
    case body_size::EMPTY:
      return "EMPTY";
    case body_size::SIZED:
      return "SIZED";
    case body_size::STREAM:
      return "STREAM";
  }
  return "UNKNOWN";
}

body_size response_body::size() const noexcept {
  struct visitor {
    body_size operator()(std::monostate) const noexcept {
      return body_size::none();
    }
    body_size operator()(const bytes_t& b) const noexcept {
      return b.empty() ? body_size::empty() : body_size::sized(b.size());
    }
    body_size operator()(const sized_stream_t& s) const noexcept {
      return s.len == 0 ? body_size::empty() : body_size::sized(s.len);
    }
    body_size operator()(const streaming_body_t&) const noexcept {
      return body_size::stream();
    }
  };
  return std::visit(visitor{}, m_body);
}

static streaming_body_t no_chunks() {
  co_return;
}

static streaming_body_t bytes_chunks(bytes_t bytes) {
  if (!bytes.empty())
    co_yield std::span<const byte_t>(bytes.data(), bytes.size());
}

streaming_body_t response_body::take_chunks() {
  auto body = std::exchange(m_body, std::monostate{});
  switch (body.index()) {
    case 0:
      return no_chunks();
    case 1:
      return bytes_chunks(std::move(*std::get_if<bytes_t>(&body)));
    case 2:
      return std::move(std::get_if<sized_stream_t>(&body)->chunks);
    case 3:
      return std::move(*std::get_if<streaming_body_t>(&body));
    default:
      unreachable();
  }
}

}  // namespace h2bridge
