#include "h2bridge/asio/connection.hpp"

#include "h2bridge/logger.hpp"

#include <openssl/ssl.h>

namespace h2bridge {

template <typename Option>
static void set_buffer_size(asio::ip::tcp::socket& sock, uint32_t requested, std::string_view what) {
  Option opt(int(requested));
  sock.set_option(opt);
  sock.get_option(opt);
  // linux doubles requested value, other systems may clamp it
  if (uint32_t(opt.value()) < requested)
    H2BRIDGE_LOG_DEBUG("tcp {} size is {}, requested {}", what, opt.value(), requested);
}

void apply_tcp_options(asio::ip::tcp::socket& sock, const tcp_connection_options& opts) noexcept {
  try {
    sock.set_option(asio::ip::tcp::no_delay(opts.no_delay));
    set_buffer_size<asio::socket_base::send_buffer_size>(sock, opts.send_buffer_size, "send buffer");
    set_buffer_size<asio::socket_base::receive_buffer_size>(sock, opts.receive_buffer_size, "receive buffer");
  } catch (std::exception& e) {
    H2BRIDGE_LOG_WARN("cannot apply tcp options, err: {}", e.what());
  }
}

void close_tcp_sock(asio::ip::tcp::socket& sock) noexcept {
  if (!sock.is_open())
    return;
  io_error_code ec;
  // every step is tried, socket must be closed even if previous failed
  sock.cancel(ec);
  if (ec)
    H2BRIDGE_LOG_DEBUG("tcp cancel failed: {}", ec.message());
  sock.shutdown(asio::socket_base::shutdown_both, ec);
  if (ec)
    H2BRIDGE_LOG_DEBUG("tcp shutdown failed: {}", ec.message());
  sock.close(ec);
  if (ec)
    H2BRIDGE_LOG_ERROR("tcp close failed: {}", ec.message());
}

std::string remote_address_of(const asio::ip::tcp::socket& sock) {
  io_error_code ec;
  internet_address ep = sock.remote_endpoint(ec);
  if (ec)
    return {};
  return std::format("{}:{}", ep.address().to_string(), ep.port());
}

std::string_view alpn_selected(SSL* ssl) noexcept {
  const unsigned char* proto = nullptr;
  unsigned int len = 0;
  SSL_get0_alpn_selected(ssl, &proto, &len);
  if (!proto)
    return {};
  return std::string_view(reinterpret_cast<const char*>(proto), len);
}

}  // namespace h2bridge
