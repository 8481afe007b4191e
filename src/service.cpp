#include "h2bridge/service.hpp"

#include "h2bridge/h2_errors.hpp"

namespace h2bridge {

static http_response text_response(int status, std::string_view text) {
  http_response rsp(status);
  rsp.headers.push_back(http_header_t{"content-type", "text/plain; charset=utf-8"});
  rsp.body = response_body::from_string(text);
  return rsp;
}

http_response http_error::make_response() const {
  return text_response(status, msg);
}

http_response error_response(const std::exception& e) {
  if (auto* re = dynamic_cast<const response_error*>(&e))
    return re->make_response();
  if (dynamic_cast<const request_error*>(&e))
    return text_response(status::BAD_REQUEST, e.what());
  return text_response(status::INTERNAL_SERVER_ERROR, e.what());
}

}  // namespace h2bridge
