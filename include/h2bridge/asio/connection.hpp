#pragma once

#include "h2bridge/any_connection.hpp"
#include "h2bridge/asio/ssl_context.hpp"

#include <type_traits>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/write.hpp>

namespace h2bridge {

// ip + port
using internet_address = asio::ip::tcp::endpoint;

// applied to each accepted socket before any stage reads from it
struct tcp_connection_options {
  uint32_t send_buffer_size = 1024 * 1024 * 4;     // 4 MB
  uint32_t receive_buffer_size = 1024 * 1024 * 4;  // 4 MB
  // disables Nagle, frames are sent as soon as written
  bool no_delay = true;
};

// options not accepted by OS are logged, socket stays usable with system defaults
void apply_tcp_options(asio::ip::tcp::socket&, const tcp_connection_options&) noexcept;

// cancels operations and closes socket without TLS close_notify, errors only logged
void close_tcp_sock(asio::ip::tcp::socket&) noexcept;

std::string remote_address_of(const asio::ip::tcp::socket&);
// protocol selected by server during handshake, empty if none
std::string_view alpn_selected(SSL*) noexcept;

// connection over asio stream: tcp socket or tls stream over it
template <typename Stream>
struct stream_connection final : connection_i {
  static constexpr bool secure = !std::is_same_v<Stream, asio::ip::tcp::socket>;

  // declared before stream, tls stream references context
  ssl_context_ptr sslctx;
  Stream stream;

  explicit stream_connection(asio::ip::tcp::socket s) noexcept
    requires(!secure)
      : stream(std::move(s)) {
  }
  // precondition: ctx != nullptr
  stream_connection(asio::ip::tcp::socket s, ssl_context_ptr ctx)
    requires(secure)
      : sslctx(std::move(ctx)), stream(std::move(s), sslctx->ctx) {
  }

  asio::ip::tcp::socket& tcp() noexcept {
    if constexpr (secure)
      return stream.next_layer();
    else
      return stream;
  }
  const asio::ip::tcp::socket& tcp() const noexcept {
    return const_cast<stream_connection&>(*this).tcp();
  }

  void start_read_some(std::coroutine_handle<> h, std::span<byte_t> buf, size_t& readen,
                       io_error_code& ec) override {
    stream.async_read_some(asio::buffer(buf.data(), buf.size()), [&readen, &ec, h](const io_error_code& e, size_t n) {
      if (e) [[unlikely]]
        ec = e;
      readen = n;
      h.resume();
    });
  }
  void start_write(std::coroutine_handle<> h, std::span<byte_t const> buf, io_error_code& ec) override {
    asio::async_write(stream, asio::buffer(buf.data(), buf.size()), [&ec, h](const io_error_code& e, size_t) {
      if (e) [[unlikely]]
        ec = e;
      h.resume();
    });
  }
  void shutdown() noexcept override {
    close_tcp_sock(tcp());
  }
  bool is_secure() const noexcept override {
    return secure;
  }
  std::string_view alpn_protocol() const noexcept override {
    if constexpr (secure)
      return alpn_selected(const_cast<Stream&>(stream).native_handle());
    else
      return {};
  }
  std::string remote_address() const override {
    return remote_address_of(tcp());
  }
};

using tcp_connection = stream_connection<asio::ip::tcp::socket>;
using tls_connection = stream_connection<asio::ssl::stream<asio::ip::tcp::socket>>;

}  // namespace h2bridge
