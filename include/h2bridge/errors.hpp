#pragma once

#include <exception>
#include <format>
#include <string>

#include <boost/system/error_code.hpp>

namespace h2bridge {

using io_error_code = boost::system::error_code;

// connection io failed (read, write, tls setup), connection is unusable after it
struct network_exception : std::exception {
  std::string msg;

  template <typename... Args>
  explicit network_exception(std::format_string<Args...> fmt, Args&&... args)
      : msg(std::format(fmt, std::forward<Args>(args)...)) {
  }
  explicit network_exception(const io_error_code& ec) : msg(ec.message()) {
  }

  const char* what() const noexcept override {
    return msg.c_str();
  }
};

// peer did not answer in time (e.g. SETTINGS acknowledgement)
struct timeout_exception : std::exception {
  const char* what() const noexcept override {
    return "timeout";
  }
};

}  // namespace h2bridge
