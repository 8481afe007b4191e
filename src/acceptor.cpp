#include "h2bridge/acceptor.hpp"

#include "h2bridge/asio/awaiters.hpp"
#include "h2bridge/h2_errors.hpp"
#include "h2bridge/logger.hpp"

#include <cassert>

#include <boost/asio/steady_timer.hpp>

namespace h2bridge {

dd::task<any_connection_t> acceptor_pipeline::accept(asio::ip::tcp::socket sock) {
  assert(first);
  any_connection_t con = co_await first(std::move(sock));
  for (connection_stage_t& stage : then)
    con = co_await stage(std::move(con));
  co_return con;
}

static dd::task<any_connection_t> accept_plain(asio::ip::tcp::socket sock, tcp_connection_options opts) {
  apply_tcp_options(sock, opts);
  H2BRIDGE_LOG_TRACE("start non-tls session");
  co_return any_connection_t(new tcp_connection(std::move(sock)));
}

acceptor_stage_t plain_acceptor(tcp_connection_options opts) {
  return [opts = std::move(opts)](asio::ip::tcp::socket sock) -> dd::task<any_connection_t> {
    return accept_plain(std::move(sock), opts);
  };
}

namespace {

// shared with timer callback, which may be invoked after handshake end
struct handshake_state {
  tls_connection* con = nullptr;
  bool done = false;
  bool timed_out = false;
};

}  // namespace

static dd::task<any_connection_t> accept_tls(asio::ip::tcp::socket sock, ssl_context_ptr sslctx,
                                             tls_acceptor_options opts, tcp_connection_options tcpopts) {
  apply_tcp_options(sock, tcpopts);
  H2BRIDGE_LOG_TRACE("start TLS session");
  std::unique_ptr<tls_connection> con(new tls_connection(std::move(sock), std::move(sslctx)));

  auto state = std::make_shared<handshake_state>();
  state->con = con.get();
  asio::steady_timer timer(con->stream.get_executor());
  timer.expires_after(opts.handshake_timeout);
  timer.async_wait([state](const io_error_code& ec) {
    if (ec || state->done)
      return;
    state->timed_out = true;
    close_tcp_sock(state->con->tcp());
  });

  io_error_code ec;
  co_await net.handshake(con->stream, asio::ssl::stream_base::server, ec);
  state->done = true;
  timer.cancel();

  if (state->timed_out)
    throw connection_error(connection_error::TIMEOUT, "tls handshake timeout");
  if (ec) {
    con->shutdown();
    throw connection_error(connection_error::HANDSHAKE, ec.message());
  }
  if (opts.require_alpn && con->alpn_protocol() != ALPN_H2) {
    con->shutdown();
    throw connection_error(connection_error::HANDSHAKE,
                           std::format("ALPN protocol \"{}\" is not h2", con->alpn_protocol()));
  }
  co_return any_connection_t(std::move(con));
}

acceptor_stage_t tls_acceptor(ssl_context_ptr ctx, tls_acceptor_options opts, tcp_connection_options tcpopts) {
  assert(ctx);
  return [ctx = std::move(ctx), opts, tcpopts = std::move(tcpopts)](
             asio::ip::tcp::socket sock) -> dd::task<any_connection_t> {
    return accept_tls(std::move(sock), ctx, opts, tcpopts);
  };
}

}  // namespace h2bridge
