#include "h2bridge/response_preparer.hpp"

namespace h2bridge {

void prepare_response(date_service& dates, http_response_head& head, body_size& size) {
  bool skip_len = size.kind == body_size::STREAM;

  switch (head.status) {
    case status::NO_CONTENT:
    case status::CONTINUE:
    case status::PROCESSING:
      size = body_size::none();
      // response without content cannot carry content-length
      remove_header(head.headers, "content-length");
      break;
    case status::SWITCHING_PROTOCOLS:
      skip_len = true;
      size = body_size::stream();
      remove_header(head.headers, "content-length");
      break;
    default:
      break;
  }

  switch (size.kind) {
    case body_size::NONE:
    case body_size::STREAM:
      break;
    case body_size::EMPTY:
      set_header(head.headers, "content-length", "0");
      break;
    case body_size::SIZED:
      if (!skip_len)
        set_header(head.headers, "content-length", std::to_string(size.len));
      break;
  }

  // connection-specific, forbidden in HTTP/2
  remove_header(head.headers, "connection");
  remove_header(head.headers, "transfer-encoding");

  if (!contains_header(head.headers, "date"))
    head.headers.push_back(http_header_t{"date", std::string(dates.date())});
}

}  // namespace h2bridge
