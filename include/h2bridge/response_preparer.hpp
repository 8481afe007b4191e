#pragma once

#include "h2bridge/date_service.hpp"
#include "h2bridge/http_base.hpp"

namespace h2bridge {

// makes response head legal for HTTP/2:
//  * status 204 / 100 / 102 never have body, 101 always streamed without content-length
//  * content-length set from 'size' ("0" for empty body), not set for streamed body
//  * connection-specific headers removed
//  * 'date' added if absent
// 'size' may be changed, it must be used to decide how to send body
void prepare_response(date_service&, http_response_head&, body_size&);

}  // namespace h2bridge
