#pragma once

#include "h2bridge/http_base.hpp"

#include <exception>
#include <memory>
#include <string>

#include <kelcoro/task.hpp>

namespace h2bridge {

// user request processing, shared by all connections of server
struct http_service_i {
  // exception thrown from 'handle_request' converted to response by 'error_response'
  // precondition: returned coro must not wait for server shutdown / terminate (deadlock)
  virtual dd::task<http_response> handle_request(http_request) = 0;

  virtual ~http_service_i() = default;
};

using http_service_ptr = std::shared_ptr<http_service_i>;

// exception which knows its own response
struct response_error : std::exception {
  [[nodiscard]] virtual http_response make_response() const = 0;
};

// response with status and text/plain body
struct http_error : response_error {
  int status;
  std::string msg;

  http_error(int s, std::string m) noexcept : status(s), msg(std::move(m)) {
  }

  char const* what() const noexcept override {
    return msg.c_str();
  }

  http_response make_response() const override;
};

// response for exception from service or request constructing:
//  * response_error makes its response
//  * request_error -> 400
//  * others -> 500
// body is text/plain error message
[[nodiscard]] http_response error_response(const std::exception&);

}  // namespace h2bridge
