#pragma once

#include "h2bridge/http_base.hpp"

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace h2bridge {

// header value cannot be parsed into typed header
struct invalid_header_value : std::exception {
  std::string msg;

  invalid_header_value(std::string_view header, std::string_view value)
      : msg(std::format("invalid \"{}\" header value: \"{}\"", header, value)) {
  }

  char const* what() const noexcept override {
    return msg.c_str();
  }
};

// typed header knows its name and builds one value or list of values
template <typename H>
concept typed_header = requires(const H& h) {
  { H::name() } -> std::convertible_to<std::string_view>;
  requires std::same_as<decltype(h.build()), std::string> ||
               std::same_as<decltype(h.build()), std::vector<std::string>>;
};

// replaces all headers with H::name() by built values, each value is separate header
// if H builds empty list, header is removed
template <typed_header H>
void set_header(http_headers_t& headers, const H& h) {
  remove_header(headers, H::name());
  auto value = h.build();
  if constexpr (std::is_same_v<decltype(value), std::string>) {
    headers.push_back(http_header_t{std::string(H::name()), std::move(value)});
  } else {
    for (std::string& v : value)
      headers.push_back(http_header_t{std::string(H::name()), std::move(v)});
  }
}

}  // namespace h2bridge
