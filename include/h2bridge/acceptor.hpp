#pragma once

#include "h2bridge/any_connection.hpp"
#include "h2bridge/asio/connection.hpp"
#include "h2bridge/asio/ssl_context.hpp"
#include "h2bridge/utils/deadline.hpp"
#include "h2bridge/utils/fn_ref.hpp"

#include <chrono>
#include <vector>

#include <boost/asio/ip/tcp.hpp>
#include <kelcoro/task.hpp>

namespace h2bridge {

// turns accepted socket into negotiated connection
// throws connection_error (HANDSHAKE or TIMEOUT)
using acceptor_stage_t = move_only_fn_soos<dd::task<any_connection_t>(asio::ip::tcp::socket)>;

// post-negotiation stage, may wrap or replace connection
// throws connection_error
using connection_stage_t = move_only_fn_soos<dd::task<any_connection_t>(any_connection_t)>;

// first stage and then all others in order, composed once per server
struct acceptor_pipeline {
  acceptor_stage_t first;
  std::vector<connection_stage_t> then;

  // precondition: first
  // throws connection_error
  dd::task<any_connection_t> accept(asio::ip::tcp::socket);
};

acceptor_stage_t plain_acceptor(tcp_connection_options = {});

struct tls_acceptor_options {
  // socket closed if handshake not finished in time
  duration_t handshake_timeout = std::chrono::seconds(5);
  // reject connections where "h2" not selected by ALPN
  bool require_alpn = true;
};

// precondition: ctx != nullptr
acceptor_stage_t tls_acceptor(ssl_context_ptr ctx, tls_acceptor_options = {}, tcp_connection_options = {});

}  // namespace h2bridge
